#include <gtest/gtest.h>
#include "errors.hpp"
#include "generation_client.hpp"
#include "test_utils.hpp"

using namespace test_utils;

namespace {

GenerationFailure failure_of(const AutocommitError& e) {
    const auto* generation = std::get_if<GenerationError>(&e.kind());
    EXPECT_NE(generation, nullptr);
    return generation ? generation->failure : GenerationFailure::ApiError;
}

} // namespace

TEST(GenerationClientTest, CommitMessageIsTrimmedAndUsesSmallTokenBudget) {
    FakeBackend backend;
    backend.replies.push_back("  feat: add foo\n\n");
    GenerationClient client(test_config(), backend);

    EXPECT_EQ(client.generate_commit_message("prompt text"), "feat: add foo");
    ASSERT_EQ(backend.requests.size(), 1u);
    EXPECT_EQ(backend.requests[0].max_tokens, COMMIT_MAX_TOKENS);
    EXPECT_EQ(backend.requests[0].model, "test-model");
    EXPECT_EQ(backend.requests[0].prompt, "prompt text");
    EXPECT_EQ(backend.api_key, "test-key");
}

TEST(GenerationClientTest, EmptyCommitReplyIsUnexpectedShape) {
    FakeBackend backend;
    backend.replies.push_back("   \n");
    GenerationClient client(test_config(), backend);

    try {
        client.generate_commit_message("prompt");
        FAIL() << "expected a GenerationError";
    } catch (const AutocommitError& e) {
        EXPECT_EQ(failure_of(e), GenerationFailure::UnexpectedResponseShape);
    }
}

TEST(GenerationClientTest, PrDraftUsesLargerTokenBudget) {
    FakeBackend backend;
    backend.replies.push_back(R"({"title":"Add login","body":"## Summary\nLogin","needsClarification":false,"clarificationQuestion":null})");
    GenerationClient client(test_config(), backend);

    PrDraft draft = client.generate_pr_draft("prompt");

    EXPECT_EQ(draft.title, "Add login");
    EXPECT_EQ(draft.body, "## Summary\nLogin");
    EXPECT_FALSE(draft.needs_clarification);
    EXPECT_TRUE(draft.clarification_question.empty());
    EXPECT_EQ(backend.requests[0].max_tokens, PR_MAX_TOKENS);
}

TEST(GenerationClientTest, MissingApiKeyFailsBeforeAnyRequest) {
    FakeBackend backend;
    Config config = test_config();
    config.anthropic_api_key.clear();

    try {
        GenerationClient client(config, backend);
        FAIL() << "expected a GenerationError";
    } catch (const AutocommitError& e) {
        EXPECT_EQ(failure_of(e), GenerationFailure::MissingCredential);
    }
    EXPECT_TRUE(backend.requests.empty());
}

TEST(ParsePrDraftTest, AcceptsClarificationRequestWithoutTitleOrBody) {
    PrDraft draft = parse_pr_draft(R"({"needsClarification": true, "clarificationQuestion": ""})");
    EXPECT_TRUE(draft.needs_clarification);
    EXPECT_TRUE(draft.title.empty());
    EXPECT_TRUE(draft.body.empty());
    EXPECT_TRUE(draft.clarification_question.empty());
}

TEST(ParsePrDraftTest, InvalidJsonKeepsRawResponse) {
    const std::string raw = "Here is your PR: {not json";
    try {
        parse_pr_draft(raw);
        FAIL() << "expected a GenerationError";
    } catch (const AutocommitError& e) {
        const auto* generation = std::get_if<GenerationError>(&e.kind());
        ASSERT_NE(generation, nullptr);
        EXPECT_EQ(generation->failure, GenerationFailure::ResponseParseError);
        EXPECT_EQ(generation->raw_response, raw);
    }
}

TEST(ParsePrDraftTest, NonObjectIsRejected) {
    EXPECT_THROW(parse_pr_draft(R"(["title"])"), AutocommitError);
    EXPECT_THROW(parse_pr_draft("\"just a string\""), AutocommitError);
}

TEST(ParsePrDraftTest, WrongFieldTypesAreRejected) {
    EXPECT_THROW(parse_pr_draft(R"({"title": 42})"), AutocommitError);
    EXPECT_THROW(parse_pr_draft(R"({"title": "t", "needsClarification": "yes"})"), AutocommitError);
}

TEST(AnthropicBackendTest, SendWithoutKeyIsMissingCredential) {
    AnthropicBackend backend;
    try {
        backend.send_message({"test-model", "prompt", 256});
        FAIL() << "expected a GenerationError";
    } catch (const AutocommitError& e) {
        EXPECT_EQ(failure_of(e), GenerationFailure::MissingCredential);
    }
}

TEST(AnthropicBackendTest, PayloadCarriesModelTokensAndPrompt) {
    nlohmann::json payload = AnthropicBackend::build_payload({"claude-x", "hello", 256});
    EXPECT_EQ(payload["model"], "claude-x");
    EXPECT_EQ(payload["max_tokens"], 256);
    ASSERT_EQ(payload["messages"].size(), 1u);
    EXPECT_EQ(payload["messages"][0]["role"], "user");
    EXPECT_EQ(payload["messages"][0]["content"], "hello");
}

TEST(AnthropicBackendTest, ExtractsTrimmedTextFromFirstBlock) {
    const std::string response = R"({"content":[{"type":"text","text":"  fix: handle nulls \n"}],"stop_reason":"end_turn"})";
    EXPECT_EQ(AnthropicBackend::extract_text(response), "fix: handle nulls");
}

TEST(AnthropicBackendTest, NonTextFirstBlockIsUnexpectedShape) {
    const std::string response = R"({"content":[{"type":"tool_use","id":"x","name":"y","input":{}}]})";
    try {
        AnthropicBackend::extract_text(response);
        FAIL() << "expected a GenerationError";
    } catch (const AutocommitError& e) {
        EXPECT_EQ(failure_of(e), GenerationFailure::UnexpectedResponseShape);
    }
}

TEST(AnthropicBackendTest, EmptyContentIsUnexpectedShape) {
    try {
        AnthropicBackend::extract_text(R"({"content":[]})");
        FAIL() << "expected a GenerationError";
    } catch (const AutocommitError& e) {
        EXPECT_EQ(failure_of(e), GenerationFailure::UnexpectedResponseShape);
    }
}

TEST(AnthropicBackendTest, ErrorObjectIsApiError) {
    const std::string response = R"({"type":"error","error":{"type":"overloaded_error","message":"Overloaded"}})";
    try {
        AnthropicBackend::extract_text(response);
        FAIL() << "expected a GenerationError";
    } catch (const AutocommitError& e) {
        EXPECT_EQ(failure_of(e), GenerationFailure::ApiError);
        EXPECT_NE(std::string(e.what()).find("Overloaded"), std::string::npos);
    }
}

TEST(AnthropicBackendTest, ParsesModelsList) {
    const std::string response = R"({"data":[
        {"id":"claude-a","display_name":"Claude A","created_at":"2025-01-01T00:00:00Z"},
        {"id":"claude-b"}
    ]})";
    std::vector<Model> models = AnthropicBackend::parse_models_response(response);
    ASSERT_EQ(models.size(), 2u);
    EXPECT_EQ(models[0].id, "claude-a");
    EXPECT_EQ(models[0].name, "Claude A");
    EXPECT_EQ(models[1].name, "claude-b");
    EXPECT_TRUE(models[1].created_at.empty());
}
