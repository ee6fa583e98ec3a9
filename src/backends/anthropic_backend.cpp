#include "llm_backend.hpp"
#include "config.hpp"
#include "curl_request.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

namespace {

const std::string API_BASE_URL = "https://api.anthropic.com/v1";
const std::string ANTHROPIC_VERSION = "2023-06-01";

std::string api_error_message(const std::string& body) {
    try {
        nlohmann::json j = nlohmann::json::parse(body);
        if (j.contains("error") && j["error"].is_object()) {
            return j["error"].value("message", body);
        }
    } catch (const nlohmann::json::exception&) {
    }
    return body;
}

} // namespace

void AnthropicBackend::set_api_key(const std::string& key) {
    api_key = key;
}

nlohmann::json AnthropicBackend::build_payload(const MessageRequest& request) {
    return {
        {"model", request.model},
        {"max_tokens", request.max_tokens},
        {"messages", {{
            {"role", "user"},
            {"content", request.prompt}
        }}}
    };
}

std::string AnthropicBackend::perform(const std::string& url, const std::string* payload) {
    if (api_key.empty()) {
        throw AutocommitError::generation(GenerationFailure::MissingCredential, "API key not set");
    }

    CurlRequest curl(url);
    curl.add_header("x-api-key: " + api_key);
    curl.add_header("anthropic-version: " + ANTHROPIC_VERSION);

    spdlog::debug("Requesting {}", url);
    HttpResponse response = payload ? curl.post_json(*payload) : curl.get();
    if (!response.transport_ok()) {
        throw AutocommitError::generation(GenerationFailure::TransportError,
            "Failed to reach " + url + ": " + std::string(curl_easy_strerror(response.result)));
    }

    spdlog::debug("Response status {} ({} bytes)", response.status, response.body.size());
    if (!response.success()) {
        throw AutocommitError::generation(GenerationFailure::ApiError,
            "API request failed with status " + std::to_string(response.status) + ": " + api_error_message(response.body));
    }
    return response.body;
}

std::string AnthropicBackend::send_message(const MessageRequest& request) {
    // Diffs are not guaranteed to be valid UTF-8.
    std::string payload = build_payload(request).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return extract_text(perform(API_BASE_URL + "/messages", &payload));
}

std::string AnthropicBackend::extract_text(const std::string& response) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(response);
    } catch (const nlohmann::json::exception& e) {
        throw AutocommitError::generation(GenerationFailure::UnexpectedResponseShape,
            "Response is not valid JSON: " + std::string(e.what()), response);
    }

    if (j.contains("error") && j["error"].is_object()) {
        throw AutocommitError::generation(GenerationFailure::ApiError, j["error"].value("message", "Unknown error"));
    }
    if (!j.contains("content") || !j["content"].is_array() || j["content"].empty()) {
        throw AutocommitError::generation(GenerationFailure::UnexpectedResponseShape, "Empty response from API", response);
    }

    const auto& block = j["content"][0];
    if (!block.is_object() || block.value("type", "") != "text" || !block.contains("text") || !block["text"].is_string()) {
        throw AutocommitError::generation(GenerationFailure::UnexpectedResponseShape,
            "Expected a text content block", response);
    }
    return trim(block["text"].get<std::string>());
}

std::vector<Model> AnthropicBackend::parse_models_response(const std::string& response) {
    try {
        nlohmann::json j = nlohmann::json::parse(response);
        std::vector<Model> models;
        for (const auto& item : j.at("data")) {
            Model m;
            m.id = item.at("id").get<std::string>();
            m.name = item.value("display_name", m.id);
            m.created_at = item.value("created_at", "");
            models.push_back(m);
        }
        return models;
    } catch (const nlohmann::json::exception& e) {
        throw AutocommitError::generation(GenerationFailure::UnexpectedResponseShape,
            "Could not parse models list: " + std::string(e.what()), response);
    }
}

std::vector<Model> AnthropicBackend::get_available_models() {
    return parse_models_response(perform(API_BASE_URL + "/models?limit=100", nullptr));
}
