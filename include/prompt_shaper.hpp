#pragma once

#include "change_collector.hpp"
#include <optional>
#include <string>
#include <vector>

const size_t MAX_DIFF_SIZE = 8000;

// Conventional PR template locations, first existing file wins.
extern const std::vector<std::string> PR_TEMPLATE_PATHS;

struct ShapedDiff {
    std::string content;          // never longer than the budget
    size_t original_length = 0;
    size_t omitted = 0;

    bool truncated() const { return omitted > 0; }
    // Content followed by the truncation marker when anything was cut.
    std::string render() const;
};

ShapedDiff truncate_diff(const std::string& diff, size_t max_size);

std::optional<std::string> load_pr_template(const std::string& repo_root);

class PromptShaper {
public:
    explicit PromptShaper(size_t budget = MAX_DIFF_SIZE);

    size_t budget() const { return budget_; }
    ShapedDiff shape(const std::string& diff) const;

    std::string commit_prompt(const ChangeSet& changes) const;
    std::string pr_prompt(const ChangeSet& changes,
                          const std::optional<std::string>& pr_template,
                          const std::optional<std::string>& additional_context) const;
    std::string pr_update_prompt(const std::string& title, const std::string& body,
                                 const std::string& feedback) const;

private:
    size_t budget_;
};
