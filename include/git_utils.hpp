#pragma once

#include <git2.h>
#include <optional>
#include <string>
#include <vector>

// One changed path and its patch text.
struct FileChange {
    std::string path;
    std::string patch;
};

struct AheadBehind {
    bool has_upstream = false;
    size_t ahead = 0;
    size_t behind = 0;
};

// Version-control operations the drafting flows depend on. Every failure is
// raised as an ExternalToolError naming the equivalent git command.
class VersionControl {
public:
    virtual ~VersionControl() = default;

    virtual std::string get_repo_root() = 0;
    // Index against HEAD.
    virtual std::vector<FileChange> get_staged_changes() = 0;
    // Merge base of base_ref and HEAD against HEAD (three-dot semantics).
    virtual std::vector<FileChange> get_branch_changes(const std::string& base_ref) = 0;
    // The net change of the last `depth` first-parent commits on HEAD.
    virtual std::vector<FileChange> get_recent_changes(int depth) = 0;
    // Commits in base_ref..HEAD, oldest first, as "subject\nbody".
    virtual std::vector<std::string> get_commit_log(const std::string& base_ref) = 0;
    virtual std::vector<std::string> get_recent_commits(int count) = 0;
    // Empty when HEAD is detached.
    virtual std::optional<std::string> get_current_branch() = 0;
    // Branch advertised by origin's HEAD. Asks the remote, then falls back
    // to the fetched refs/remotes/origin/HEAD.
    virtual std::optional<std::string> get_remote_head_branch() = 0;
    // Whether origin has the branch, falling back to the tracking ref when
    // origin cannot be reached.
    virtual bool remote_branch_exists(const std::string& branch) = 0;
    virtual AheadBehind get_ahead_behind() = 0;
    // Pushes the current branch to origin and sets it as upstream.
    virtual void push_current_branch() = 0;
    // Commits the index; returns the abbreviated hash.
    virtual std::string commit(const std::string& message) = 0;
};

class GitRepository {
public:
    explicit GitRepository(const std::string& path = ".");
    ~GitRepository();

    GitRepository(const GitRepository&) = delete;
    GitRepository& operator=(const GitRepository&) = delete;

    git_repository* get() const { return repo_; }
    std::string get_repo_root() const;

private:
    git_repository* repo_;
};

class GitUtils : public VersionControl {
public:
    explicit GitUtils(GitRepository& repo);

    std::string get_repo_root() override;
    std::vector<FileChange> get_staged_changes() override;
    std::vector<FileChange> get_branch_changes(const std::string& base_ref) override;
    std::vector<FileChange> get_recent_changes(int depth) override;
    std::vector<std::string> get_commit_log(const std::string& base_ref) override;
    std::vector<std::string> get_recent_commits(int count) override;
    std::optional<std::string> get_current_branch() override;
    std::optional<std::string> get_remote_head_branch() override;
    bool remote_branch_exists(const std::string& branch) override;
    AheadBehind get_ahead_behind() override;
    void push_current_branch() override;
    std::string commit(const std::string& message) override;

private:
    GitRepository& repo_;
};
