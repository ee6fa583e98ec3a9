#include "forge.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "subprocess.hpp"
#include <spdlog/spdlog.h>
#include <vector>

namespace {

std::string run_gh(const std::vector<std::string>& args) {
    std::vector<std::string> argv = {"gh"};
    argv.insert(argv.end(), args.begin(), args.end());
    CommandResult result = run_command(argv);
    if (!result.ok()) {
        throw AutocommitError::tool("GitHub CLI command failed", format_command(argv), trim(result.stderr_output));
    }
    return trim(result.stdout_output);
}

} // namespace

std::optional<std::string> GhForge::existing_pr_url() {
    try {
        std::string url = run_gh({"pr", "view", "--json", "url", "--jq", ".url"});
        if (url.empty()) {
            return std::nullopt;
        }
        return url;
    } catch (const AutocommitError& e) {
        // gh exits non-zero when the branch has no PR.
        spdlog::debug("No existing PR: {}", e.what());
        return std::nullopt;
    }
}

std::string GhForge::create_pr(const std::string& title, const std::string& body,
                               const std::string& base_branch, const std::string& head_branch) {
    return run_gh({"pr", "create", "--title", title, "--body", body, "--base", base_branch, "--head", head_branch});
}
