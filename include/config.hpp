#pragma once

#include <map>
#include <string>

extern const std::string DEFAULT_MODEL;

struct Config {
    std::string anthropic_api_key;
    std::string model = DEFAULT_MODEL;
    int max_clarification_rounds = 3;
    bool verbose = false;

    // Global config file, then <repo_root>/.autocommit.conf, then <repo_root>/.env.
    static Config load_from_file(const std::string& path, const std::string& repo_root = "");

    // Applies config-file keys (anthropic_api_key, model, ...).
    void apply_values(const std::map<std::string, std::string>& values);
    // Applies environment-style keys (ANTHROPIC_API_KEY, AUTOCOMMIT_MODEL).
    void apply_environment(const std::map<std::string, std::string>& env);
    void apply_process_environment();

    // Throws a MissingCredential GenerationError when no API key is set.
    void require_api_key() const;

    void save(const std::string& path) const;
};

std::string get_config_path();
std::map<std::string, std::string> parse_config_file(const std::string& path);
std::string trim(const std::string& s);

void configure_app(const std::string& config_path);
