#pragma once

#include "git_utils.hpp"
#include <string>
#include <vector>

// Dependency lock files, matched by basename.
extern const std::vector<std::string> EXCLUDED_LOCK_FILES;

// Depths used when the base branch cannot be compared against.
const int FALLBACK_DIFF_DEPTH = 5;
const int FALLBACK_LOG_DEPTH = 10;

bool is_lock_file(const std::string& path);

struct ChangeSet {
    std::vector<std::string> files;
    std::string diff;
    std::vector<std::string> commits;
    bool used_fallback = false;
};

class ChangeCollector {
public:
    explicit ChangeCollector(VersionControl& vcs);

    // Staged changes for a commit. Throws UserError when nothing is staged.
    ChangeSet collect_staged();
    // Net changes and commits of the current branch relative to base_branch.
    ChangeSet collect_branch(const std::string& base_branch);
    // origin's advertised HEAD branch, or "main".
    std::string detect_default_branch();

private:
    VersionControl& vcs_;
};
