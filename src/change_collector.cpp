#include "change_collector.hpp"
#include "config.hpp"
#include "errors.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

const std::vector<std::string> EXCLUDED_LOCK_FILES = {
    "package-lock.json",
    "bun.lock",
    "bun.lockb",
    "yarn.lock",
    "pnpm-lock.yaml",
    "Gemfile.lock",
    "Cargo.lock",
    "poetry.lock",
    "composer.lock",
    "go.sum",
    "Pipfile.lock",
    "npm-shrinkwrap.json",
    "deno.lock",
    "flake.lock",
    "pdm.lock",
    "uv.lock",
};

namespace {

const std::string DEFAULT_BRANCH = "main";

std::string basename_of(const std::string& path) {
    size_t slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

// File list and diff come from the same set of changes so they never disagree.
void fill_from_changes(ChangeSet& set, const std::vector<FileChange>& changes) {
    for (const auto& change : changes) {
        if (is_lock_file(change.path)) {
            spdlog::debug("Excluding lock file {}", change.path);
            continue;
        }
        set.files.push_back(change.path);
        set.diff += change.patch;
    }
}

bool is_tool_error(const AutocommitError& e) {
    return std::holds_alternative<ExternalToolError>(e.kind());
}

} // namespace

bool is_lock_file(const std::string& path) {
    std::string name = basename_of(path);
    return std::find(EXCLUDED_LOCK_FILES.begin(), EXCLUDED_LOCK_FILES.end(), name) != EXCLUDED_LOCK_FILES.end();
}

ChangeCollector::ChangeCollector(VersionControl& vcs) : vcs_(vcs) {}

ChangeSet ChangeCollector::collect_staged() {
    ChangeSet set;
    fill_from_changes(set, vcs_.get_staged_changes());

    if (set.files.empty()) {
        throw AutocommitError::user("No staged changes found. Stage your changes with 'git add' first.");
    }
    if (trim(set.diff).empty()) {
        throw AutocommitError::user("No diff content found in staged changes.");
    }
    return set;
}

ChangeSet ChangeCollector::collect_branch(const std::string& base_branch) {
    ChangeSet set;

    try {
        fill_from_changes(set, vcs_.get_branch_changes(base_branch));
    } catch (const AutocommitError& e) {
        if (!is_tool_error(e)) throw;
        spdlog::warn("Could not compare against {} ({}); using the last {} commits instead",
                     base_branch, e.what(), FALLBACK_DIFF_DEPTH);
        set = ChangeSet();
        set.used_fallback = true;
        fill_from_changes(set, vcs_.get_recent_changes(FALLBACK_DIFF_DEPTH));
    }

    try {
        set.commits = vcs_.get_commit_log(base_branch);
    } catch (const AutocommitError& e) {
        if (!is_tool_error(e)) throw;
        spdlog::warn("Could not read commits since {} ({}); using the last {} commits instead",
                     base_branch, e.what(), FALLBACK_LOG_DEPTH);
        set.used_fallback = true;
        set.commits = vcs_.get_recent_commits(FALLBACK_LOG_DEPTH);
    }
    return set;
}

std::string ChangeCollector::detect_default_branch() {
    try {
        std::optional<std::string> branch = vcs_.get_remote_head_branch();
        if (branch && !branch->empty()) {
            return *branch;
        }
    } catch (const AutocommitError& e) {
        if (!is_tool_error(e)) throw;
        spdlog::debug("Default branch detection failed: {}", e.what());
    }
    spdlog::warn("Could not detect the default branch from origin; assuming '{}'", DEFAULT_BRANCH);
    return DEFAULT_BRANCH;
}
