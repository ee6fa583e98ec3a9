#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct Model {
    std::string id;
    std::string name;
    std::string created_at;
};

struct MessageRequest {
    std::string model;
    std::string prompt;
    int max_tokens = 1024;
};

// The drafting engine: one request in, one text reply out.
class LLMBackend {
public:
    virtual ~LLMBackend() = default;
    virtual void set_api_key(const std::string& key) = 0;
    virtual std::string send_message(const MessageRequest& request) = 0;
    virtual std::vector<Model> get_available_models() = 0;
};

class AnthropicBackend : public LLMBackend {
public:
    void set_api_key(const std::string& key) override;
    std::string send_message(const MessageRequest& request) override;
    std::vector<Model> get_available_models() override;

    static nlohmann::json build_payload(const MessageRequest& request);
    // Returns the trimmed text of the first content block.
    static std::string extract_text(const std::string& response);
    static std::vector<Model> parse_models_response(const std::string& response);

private:
    std::string api_key;
    std::string perform(const std::string& url, const std::string* payload);
};
