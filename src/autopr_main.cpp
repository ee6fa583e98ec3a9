#include <CLI/CLI.hpp>
#include <iostream>
#include <string>
#include <unistd.h>
#include <spdlog/spdlog.h>
#include "config.hpp"
#include "errors.hpp"
#include "flows.hpp"
#include "forge.hpp"
#include "generation_client.hpp"
#include "git_utils.hpp"
#include "llm_backend.hpp"
#include "logging.hpp"
#include "presenter.hpp"
#include "user_prompt.hpp"

int main(int argc, char** argv) {
    CLI::App app{"autopr - Generate PR title and description from branch changes"};

    std::string config_path;
    try {
        config_path = get_config_path();
    } catch (const AutocommitError& e) {
        std::cerr << "Warning: " << e.what() << "; global config disabled" << std::endl;
    }

    bool dry_run = false;
    bool yes = false;
    bool verbose = false;
    int max_rounds = -1;
    std::string model;

    app.set_help_flag("--help", "Print help message");
    app.footer("Configuration file location: " + config_path);
    app.add_flag("-y,--yes", yes, "Skip confirmation prompt and create PR immediately");
    app.add_flag("--dry-run", dry_run, "Generate PR content but don't push or create it");
    app.add_flag("-v,--verbose", verbose, "Print diagnostic logging");
    app.add_option("-m,--model", model, "Model to use (overrides AUTOCOMMIT_MODEL)");
    app.add_option("--max-clarification-rounds", max_rounds, "Clarification rounds before the latest draft is accepted")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--config", config_path, "Path to config file");

    CLI11_PARSE(app, argc, argv);

    init_logging(verbose);

    return run_guarded([&]() {
        GitRepository repo;
        GitUtils git_utils(repo);

        Config config = Config::load_from_file(config_path, git_utils.get_repo_root());
        config.apply_process_environment();
        if (!model.empty()) {
            config.model = model;
        }
        if (max_rounds >= 0) {
            config.max_clarification_rounds = max_rounds;
        }
        if (config.verbose && !verbose) {
            init_logging(true);
        }
        spdlog::debug("Using model {}", config.model);

        AnthropicBackend backend;
        GenerationClient client(config, backend);
        GhForge forge;

        ConsolePrompt prompt;
        Presenter presenter(std::cout, prompt);

        FlowOptions options;
        options.yes = yes;
        options.dry_run = dry_run;
        options.show_spinner = isatty(STDOUT_FILENO);

        PrFlow flow(git_utils, forge, client, presenter, options, config.max_clarification_rounds);
        return flow.run();
    }, std::cerr);
}
