#pragma once

#include "config.hpp"
#include "llm_backend.hpp"
#include <string>

const int COMMIT_MAX_TOKENS = 256;
const int PR_MAX_TOKENS = 1024;

struct PrDraft {
    std::string title;
    std::string body;
    bool needs_clarification = false;
    std::string clarification_question;
};

// Parses the engine's JSON reply. Throws ResponseParseError carrying the raw text.
PrDraft parse_pr_draft(const std::string& raw);

// Sends exactly one request to the drafting engine per call.
class GenerationClient {
public:
    // Throws MissingCredential before anything is sent when no API key is configured.
    GenerationClient(const Config& config, LLMBackend& backend);

    std::string generate_commit_message(const std::string& prompt);
    PrDraft generate_pr_draft(const std::string& prompt);

    const std::string& model() const { return model_; }

private:
    std::string model_;
    LLMBackend& backend_;
};
