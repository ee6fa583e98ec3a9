#pragma once

#include <optional>
#include <string>

// The hosting platform that owns pull requests.
class Forge {
public:
    virtual ~Forge() = default;
    // URL of the open PR for the current branch, if any.
    virtual std::optional<std::string> existing_pr_url() = 0;
    // Returns the URL printed by the forge for the new PR.
    virtual std::string create_pr(const std::string& title, const std::string& body,
                                  const std::string& base_branch, const std::string& head_branch) = 0;
};

// Talks to GitHub through the gh CLI.
class GhForge : public Forge {
public:
    std::optional<std::string> existing_pr_url() override;
    std::string create_pr(const std::string& title, const std::string& body,
                          const std::string& base_branch, const std::string& head_branch) override;
};
