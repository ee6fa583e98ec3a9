#pragma once

#include <string>
#include <vector>

struct CommandResult {
    int exit_code = -1;
    std::string stdout_output;
    std::string stderr_output;

    bool ok() const { return exit_code == 0; }
};

// Runs argv[0] from PATH and waits for it, capturing both output streams.
CommandResult run_command(const std::vector<std::string>& args);

// Shell-style rendering of argv, used in error reports.
std::string format_command(const std::vector<std::string>& args);
