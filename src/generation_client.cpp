#include "generation_client.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace {

std::string optional_string(const nlohmann::json& j, const char* key, const std::string& raw) {
    if (!j.contains(key) || j[key].is_null()) {
        return "";
    }
    if (!j[key].is_string()) {
        throw AutocommitError::generation(GenerationFailure::ResponseParseError,
            std::string("Field '") + key + "' is not a string", raw);
    }
    return j[key].get<std::string>();
}

} // namespace

PrDraft parse_pr_draft(const std::string& raw) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(raw);
    } catch (const nlohmann::json::exception& e) {
        throw AutocommitError::generation(GenerationFailure::ResponseParseError,
            "Failed to parse API response as JSON: " + std::string(e.what()), raw);
    }
    if (!j.is_object()) {
        throw AutocommitError::generation(GenerationFailure::ResponseParseError,
            "API response is not a JSON object", raw);
    }

    PrDraft draft;
    draft.title = optional_string(j, "title", raw);
    draft.body = optional_string(j, "body", raw);
    draft.clarification_question = optional_string(j, "clarificationQuestion", raw);
    if (j.contains("needsClarification") && !j["needsClarification"].is_null()) {
        if (!j["needsClarification"].is_boolean()) {
            throw AutocommitError::generation(GenerationFailure::ResponseParseError,
                "Field 'needsClarification' is not a boolean", raw);
        }
        draft.needs_clarification = j["needsClarification"].get<bool>();
    }
    return draft;
}

GenerationClient::GenerationClient(const Config& config, LLMBackend& backend)
    : model_(config.model), backend_(backend) {
    config.require_api_key();
    backend_.set_api_key(config.anthropic_api_key);
}

std::string GenerationClient::generate_commit_message(const std::string& prompt) {
    spdlog::debug("Requesting commit message from {} ({} prompt chars)", model_, prompt.size());
    std::string message = trim(backend_.send_message({model_, prompt, COMMIT_MAX_TOKENS}));
    if (message.empty()) {
        throw AutocommitError::generation(GenerationFailure::UnexpectedResponseShape,
            "The model returned an empty commit message");
    }
    return message;
}

PrDraft GenerationClient::generate_pr_draft(const std::string& prompt) {
    spdlog::debug("Requesting PR draft from {} ({} prompt chars)", model_, prompt.size());
    return parse_pr_draft(backend_.send_message({model_, prompt, PR_MAX_TOKENS}));
}
