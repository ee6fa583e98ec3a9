#include <CLI/CLI.hpp>
#include <iostream>
#include <string>
#include <unistd.h>
#include <spdlog/spdlog.h>
#include "config.hpp"
#include "errors.hpp"
#include "flows.hpp"
#include "generation_client.hpp"
#include "git_utils.hpp"
#include "llm_backend.hpp"
#include "logging.hpp"
#include "presenter.hpp"
#include "user_prompt.hpp"

namespace {

void print_models(const Config& config) {
    config.require_api_key();
    AnthropicBackend llm;
    llm.set_api_key(config.anthropic_api_key);
    for (const auto& m : llm.get_available_models()) {
        std::cout << "ID: " << m.id << "\n";
        std::cout << "Name: " << m.name << "\n";
        if (!m.created_at.empty()) {
            std::cout << "Created: " << m.created_at << "\n";
        }
        std::cout << (m.id == config.model ? "(current)\n\n" : "\n");
    }
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"autocommit - Generate commit messages from staged changes using AI"};

    std::string config_path;
    try {
        config_path = get_config_path();
    } catch (const AutocommitError& e) {
        std::cerr << "Warning: " << e.what() << "; global config disabled" << std::endl;
    }

    bool dry_run = false;
    bool yes = false;
    bool list_models = false;
    bool configure = false;
    bool verbose = false;
    std::string model;

    app.set_help_flag("--help", "Print help message");
    app.footer("Configuration file location: " + config_path);
    app.add_flag("--dry-run", dry_run, "Generate the commit message and print it without committing");
    app.add_flag("-y,--yes", yes, "Commit without asking for confirmation");
    app.add_flag("--list-models", list_models, "List models available to the configured API key");
    app.add_flag("--configure", configure, "Configure the API key and model interactively");
    app.add_flag("-v,--verbose", verbose, "Print diagnostic logging");
    app.add_option("-m,--model", model, "Model to use (overrides AUTOCOMMIT_MODEL)");
    app.add_option("--config", config_path, "Path to config file");

    CLI11_PARSE(app, argc, argv);

    init_logging(verbose);

    return run_guarded([&]() {
        if (configure) {
            configure_app(config_path);
            return 0;
        }

        if (list_models) {
            Config config = Config::load_from_file(config_path);
            config.apply_process_environment();
            if (!model.empty()) config.model = model;
            print_models(config);
            return 0;
        }

        GitRepository repo;
        GitUtils git_utils(repo);

        Config config = Config::load_from_file(config_path, git_utils.get_repo_root());
        config.apply_process_environment();
        if (!model.empty()) {
            config.model = model;
        }
        if (config.verbose && !verbose) {
            init_logging(true);
        }
        spdlog::debug("Using model {}", config.model);

        AnthropicBackend backend;
        GenerationClient client(config, backend);

        ConsolePrompt prompt;
        Presenter presenter(std::cout, prompt);

        FlowOptions options;
        options.yes = yes;
        options.dry_run = dry_run;
        options.show_spinner = isatty(STDOUT_FILENO);

        CommitFlow flow(git_utils, client, presenter, options);
        return flow.run();
    }, std::cerr);
}
