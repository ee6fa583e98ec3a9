#pragma once

#include <deque>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <git2.h>
#include "config.hpp"
#include "forge.hpp"
#include "git_utils.hpp"
#include "llm_backend.hpp"
#include "user_prompt.hpp"

namespace test_utils {

/**
 * @brief Create a unique temporary directory for a test
 * @return Path to the new directory
 */
std::filesystem::path create_temp_dir();

/**
 * @brief Remove a directory and everything below it
 */
void remove_dir(const std::filesystem::path& dir);

/**
 * @brief Write a file, creating parent directories as needed
 */
void write_file(const std::filesystem::path& path, const std::string& content);

/**
 * @brief Config with a dummy API key so a GenerationClient can be built
 */
Config test_config();

FileChange make_change(const std::string& path, const std::string& patch);

/**
 * @brief In-memory version control with scripted results
 *
 * Branch/log failures are raised as ExternalToolError like the real
 * implementation does.
 */
class FakeVersionControl : public VersionControl {
public:
    std::string repo_root;
    std::vector<FileChange> staged;
    std::vector<FileChange> branch_changes;
    std::vector<FileChange> recent_changes;
    std::vector<std::string> commit_log;
    std::vector<std::string> recent_commits;
    bool fail_branch_diff = false;
    bool fail_commit_log = false;
    std::optional<std::string> current_branch = std::string("feature/login");
    std::optional<std::string> remote_head = std::string("main");
    bool remote_exists = true;
    AheadBehind ahead_behind;

    int push_calls = 0;
    int recent_depth_requested = -1;
    int recent_count_requested = -1;
    std::vector<std::string> committed_messages;

    std::string get_repo_root() override { return repo_root; }
    std::vector<FileChange> get_staged_changes() override { return staged; }
    std::vector<FileChange> get_branch_changes(const std::string& base_ref) override;
    std::vector<FileChange> get_recent_changes(int depth) override;
    std::vector<std::string> get_commit_log(const std::string& base_ref) override;
    std::vector<std::string> get_recent_commits(int count) override;
    std::optional<std::string> get_current_branch() override { return current_branch; }
    std::optional<std::string> get_remote_head_branch() override { return remote_head; }
    bool remote_branch_exists(const std::string&) override { return remote_exists; }
    AheadBehind get_ahead_behind() override { return ahead_behind; }
    void push_current_branch() override { ++push_calls; }
    std::string commit(const std::string& message) override;
};

/**
 * @brief Drafting engine that replays queued replies and records requests
 */
class FakeBackend : public LLMBackend {
public:
    std::deque<std::string> replies;
    std::vector<MessageRequest> requests;
    std::string api_key;

    void set_api_key(const std::string& key) override { api_key = key; }
    std::string send_message(const MessageRequest& request) override;
    std::vector<Model> get_available_models() override { return {}; }
};

/**
 * @brief User prompt that answers from a script and records the questions
 */
class ScriptedPrompt : public UserPrompt {
public:
    std::deque<std::string> answers;
    std::vector<std::string> questions;

    std::string ask(const std::string& question) override;
};

class FakeForge : public Forge {
public:
    struct CreatedPr {
        std::string title;
        std::string body;
        std::string base;
        std::string head;
    };

    std::optional<std::string> existing;
    std::vector<CreatedPr> created;

    std::optional<std::string> existing_pr_url() override { return existing; }
    std::string create_pr(const std::string& title, const std::string& body,
                          const std::string& base_branch, const std::string& head_branch) override;
};

/**
 * @brief Throwaway libgit2 repository in a temp directory
 *
 * Provides just enough plumbing (write, stage, commit, branch) to set up
 * histories for GitUtils tests.
 */
class TestRepo {
public:
    TestRepo();
    ~TestRepo();

    TestRepo(const TestRepo&) = delete;
    TestRepo& operator=(const TestRepo&) = delete;

    const std::filesystem::path& path() const { return dir_; }
    git_repository* get() const { return repo_; }

    void write(const std::string& relative, const std::string& content);
    void stage(const std::string& relative);
    // Commits the index to HEAD and returns the new commit id.
    git_oid commit(const std::string& message);
    git_oid commit_file(const std::string& relative, const std::string& content, const std::string& message);

    // Creates a branch at HEAD and checks it out (HEAD only, no workdir update).
    void create_branch(const std::string& name);
    // Points HEAD at a branch that does not exist yet.
    void switch_to_orphan(const std::string& name);
    void detach_head();
    // Adds refs/remotes/origin/HEAD -> refs/remotes/origin/<branch>.
    void set_remote_head(const std::string& branch);
    // Creates a bare repository holding every local branch, with HEAD on
    // head_branch, and registers it as origin. Nothing is fetched back.
    void create_origin(const std::string& head_branch);
    // Creates refs/remotes/origin/<branch> at HEAD without touching origin.
    void create_tracking_ref(const std::string& branch);

private:
    std::filesystem::path dir_;
    std::filesystem::path origin_dir_;
    git_repository* repo_;
};

} // namespace test_utils
