#include "prompt_shaper.hpp"
#include "default_prompt.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <spdlog/spdlog.h>

const std::vector<std::string> PR_TEMPLATE_PATHS = {
    ".github/PULL_REQUEST_TEMPLATE.md",
    ".github/pull_request_template.md",
    "PULL_REQUEST_TEMPLATE.md",
    "pull_request_template.md",
};

namespace {

std::string join(const std::vector<std::string>& items, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) result += separator;
        result += items[i];
    }
    return result;
}

} // namespace

std::string ShapedDiff::render() const {
    if (!truncated()) {
        return content;
    }
    return content + "\n\n... (diff truncated, " + std::to_string(omitted) + " characters omitted)";
}

ShapedDiff truncate_diff(const std::string& diff, size_t max_size) {
    ShapedDiff shaped;
    shaped.original_length = diff.size();
    if (diff.size() <= max_size) {
        shaped.content = diff;
        return shaped;
    }
    shaped.content = diff.substr(0, max_size);
    shaped.omitted = diff.size() - max_size;
    return shaped;
}

std::optional<std::string> load_pr_template(const std::string& repo_root) {
    std::filesystem::path root(repo_root.empty() ? "." : repo_root);
    for (const auto& relative : PR_TEMPLATE_PATHS) {
        std::filesystem::path path = root / relative;
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) continue;
        std::ifstream file(path);
        if (!file) continue;
        std::stringstream buffer;
        buffer << file.rdbuf();
        spdlog::debug("Using PR template {}", path.string());
        return buffer.str();
    }
    return std::nullopt;
}

PromptShaper::PromptShaper(size_t budget) : budget_(budget) {}

ShapedDiff PromptShaper::shape(const std::string& diff) const {
    return truncate_diff(diff, budget_);
}

std::string PromptShaper::commit_prompt(const ChangeSet& changes) const {
    return COMMIT_MESSAGE_INSTRUCTIONS + "\n\nDiff:\n" + shape(changes.diff).render();
}

std::string PromptShaper::pr_prompt(const ChangeSet& changes,
                                    const std::optional<std::string>& pr_template,
                                    const std::optional<std::string>& additional_context) const {
    std::string template_instructions = pr_template
        ? PR_TEMPLATE_INSTRUCTIONS + "\n\nTemplate:\n" + *pr_template + "\n\n"
        : PR_DEFAULT_SECTIONS;

    std::string context_info;
    if (additional_context && !additional_context->empty()) {
        context_info = "\nAdditional context from user: " + *additional_context + "\n";
    }

    std::ostringstream prompt;
    prompt << "Generate a GitHub Pull Request title and description based on the following information.\n"
           << context_info << "\n"
           << template_instructions << "\n"
           << "Changed files:\n" << join(changes.files, "\n") << "\n\n"
           << "Commits:\n" << join(changes.commits, "\n") << "\n\n"
           << "Diff (truncated if too long):\n" << shape(changes.diff).render() << "\n\n"
           << PR_JSON_FORMAT;
    return prompt.str();
}

std::string PromptShaper::pr_update_prompt(const std::string& title, const std::string& body,
                                           const std::string& feedback) const {
    std::ostringstream prompt;
    prompt << "Update the following GitHub Pull Request based on the user's feedback.\n\n"
           << "Current PR:\n"
           << "Title: " << title << "\n"
           << "Body:\n" << body << "\n\n"
           << "User feedback: " << feedback << "\n\n"
           << PR_UPDATE_JSON_FORMAT;
    return prompt.str();
}
