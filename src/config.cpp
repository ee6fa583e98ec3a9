#include "config.hpp"
#include "colors.hpp"
#include "errors.hpp"
#include "llm_backend.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <vector>
#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/dom/elements.hpp>
#include <spdlog/spdlog.h>
#include <sys/ioctl.h>
#include <unistd.h>

const std::string DEFAULT_MODEL = "claude-sonnet-4-20250514";

namespace {

const std::vector<std::string> FALLBACK_MODELS = {
    DEFAULT_MODEL,
    "claude-opus-4-20250514",
    "claude-3-7-sonnet-20250219",
    "claude-3-5-haiku-20241022",
};

std::string strip_quotes(const std::string& value) {
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

} // namespace

std::string trim(const std::string& s) {
    auto start = std::find_if_not(s.begin(), s.end(), [](unsigned char ch) { return std::isspace(ch); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char ch) { return std::isspace(ch); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::map<std::string, std::string> parse_config_file(const std::string& path) {
    std::map<std::string, std::string> values;
    std::ifstream file(path);
    if (!file) return values;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }
        size_t eq = line.find('=');
        if (eq != std::string::npos) {
            std::string key = trim(line.substr(0, eq));
            std::string value = strip_quotes(trim(line.substr(eq + 1)));
            values[key] = value;
        }
    }
    return values;
}

std::string get_config_path() {
    const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
    std::string config_dir;
    if (xdg_config && strlen(xdg_config) > 0) {
        config_dir = xdg_config;
    } else {
        const char* home = std::getenv("HOME");
        if (!home || strlen(home) == 0) {
            throw AutocommitError::user("HOME environment variable not set");
        }
        config_dir = std::string(home) + "/.config";
    }
    return config_dir + "/autocommit/config.txt";
}

void Config::apply_values(const std::map<std::string, std::string>& values) {
    auto it = values.find("anthropic_api_key");
    if (it != values.end() && !it->second.empty()) anthropic_api_key = it->second;
    it = values.find("model");
    if (it != values.end() && !it->second.empty()) model = it->second;
    it = values.find("verbose");
    if (it != values.end()) verbose = (it->second == "true");
    it = values.find("max_clarification_rounds");
    if (it != values.end()) {
        try {
            max_clarification_rounds = std::max(0, std::stoi(it->second));
        } catch (const std::exception&) {
            spdlog::warn("Ignoring invalid max_clarification_rounds value '{}'", it->second);
        }
    }
}

void Config::apply_environment(const std::map<std::string, std::string>& env) {
    auto it = env.find("ANTHROPIC_API_KEY");
    if (it != env.end() && !it->second.empty()) anthropic_api_key = it->second;
    it = env.find("AUTOCOMMIT_MODEL");
    if (it != env.end() && !it->second.empty()) model = it->second;
}

void Config::apply_process_environment() {
    std::map<std::string, std::string> env;
    for (const char* name : {"ANTHROPIC_API_KEY", "AUTOCOMMIT_MODEL"}) {
        const char* value = std::getenv(name);
        if (value && strlen(value) > 0) {
            env[name] = value;
        }
    }
    apply_environment(env);
}

Config Config::load_from_file(const std::string& path, const std::string& repo_root) {
    Config config;
    config.apply_values(parse_config_file(path));

    if (!repo_root.empty()) {
        std::filesystem::path root(repo_root);
        config.apply_values(parse_config_file((root / ".autocommit.conf").string()));
        config.apply_environment(parse_config_file((root / ".env").string()));
    }
    return config;
}

void Config::require_api_key() const {
    if (anthropic_api_key.empty()) {
        throw AutocommitError::generation(GenerationFailure::MissingCredential,
            "ANTHROPIC_API_KEY is required. Set it in your environment, a .env file, or run 'autocommit --configure'.");
    }
}

void Config::save(const std::string& path) const {
    std::filesystem::create_directories(std::filesystem::path(path).parent_path());
    if (std::filesystem::exists(path)) {
        std::filesystem::copy_file(path, path + ".bak", std::filesystem::copy_options::overwrite_existing);
    }
    std::ofstream file(path);
    if (!file) {
        throw AutocommitError::user("Could not write config file " + path);
    }
    file << "# Model ID used for commit messages and PR descriptions\n";
    file << "model=" << model << "\n";
    file << "# Maximum clarification rounds before the latest PR draft is accepted\n";
    file << "max_clarification_rounds=" << max_clarification_rounds << "\n";
    file << "# Print diagnostic logging\n";
    file << "verbose=" << (verbose ? "true" : "false") << "\n";
    if (!anthropic_api_key.empty()) {
        file << "# API key for the Anthropic API\n";
        file << "anthropic_api_key=" << anthropic_api_key << "\n";
    }
}

void configure_app(const std::string& config_path) {
    struct winsize ws;
    int terminal_height = 24;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0) {
        terminal_height = ws.ws_row;
    }

    Config existing = Config::load_from_file(config_path);

    std::cout << Colors::paint(Colors::GREEN, "Enter API Key (leave empty to keep the current one): ");
    std::string api_key;
    std::getline(std::cin, api_key);
    api_key = trim(api_key);
    if (!api_key.empty()) {
        existing.anthropic_api_key = api_key;
    }

    std::vector<std::string> model_ids;
    if (!existing.anthropic_api_key.empty()) {
        try {
            AnthropicBackend llm;
            llm.set_api_key(existing.anthropic_api_key);
            for (const auto& m : llm.get_available_models()) {
                model_ids.push_back(m.id);
            }
        } catch (const AutocommitError& e) {
            spdlog::warn("Could not fetch model list: {}", e.what());
        }
    }
    if (model_ids.empty()) {
        model_ids = FALLBACK_MODELS;
    }

    int model_index = 0;
    auto it = std::find(model_ids.begin(), model_ids.end(), existing.model);
    if (it != model_ids.end()) {
        model_index = static_cast<int>(std::distance(model_ids.begin(), it));
    }

    bool selected = false;
    auto screen = ftxui::ScreenInteractive::TerminalOutput();
    ftxui::MenuOption model_option;
    auto model_menu = ftxui::Menu(&model_ids, &model_index, model_option);

    auto renderer = ftxui::Renderer(model_menu, [&] {
        return ftxui::vbox(
            ftxui::text("Configuration Setup") | ftxui::bold,
            ftxui::text("Select Model") | ftxui::dim,
            ftxui::separator(),
            ftxui::frame(model_menu->Render()) | ftxui::size(ftxui::HEIGHT, ftxui::LESS_THAN, terminal_height - 8),
            ftxui::separator(),
            ftxui::text("Press Enter to select, Esc to cancel")
        ) | ftxui::border;
    });

    auto event_handler = ftxui::CatchEvent(renderer, [&](ftxui::Event event) {
        if (event == ftxui::Event::Return) {
            selected = true;
            screen.ExitLoopClosure()();
            return true;
        }
        if (event == ftxui::Event::Escape) {
            screen.ExitLoopClosure()();
            return true;
        }
        return false;
    });

    model_menu->TakeFocus();
    screen.Loop(event_handler);

    if (!selected) {
        std::cout << "Configuration cancelled." << std::endl;
        return;
    }

    existing.model = model_ids[model_index];
    existing.save(config_path);
    std::cout << "Configuration saved to " << config_path << std::endl;
}
