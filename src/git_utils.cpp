#include "git_utils.hpp"
#include "errors.hpp"
#include <algorithm>
#include <iostream>
#include <memory>
#include <spdlog/spdlog.h>

namespace {

template <typename T, void (*Free)(T*)>
struct GitDeleter {
    void operator()(T* ptr) const {
        if (ptr) Free(ptr);
    }
};

using CommitPtr = std::unique_ptr<git_commit, GitDeleter<git_commit, git_commit_free>>;
using DiffPtr = std::unique_ptr<git_diff, GitDeleter<git_diff, git_diff_free>>;
using IndexPtr = std::unique_ptr<git_index, GitDeleter<git_index, git_index_free>>;
using ObjectPtr = std::unique_ptr<git_object, GitDeleter<git_object, git_object_free>>;
using PatchPtr = std::unique_ptr<git_patch, GitDeleter<git_patch, git_patch_free>>;
using ReferencePtr = std::unique_ptr<git_reference, GitDeleter<git_reference, git_reference_free>>;
using RemotePtr = std::unique_ptr<git_remote, GitDeleter<git_remote, git_remote_free>>;
using RevwalkPtr = std::unique_ptr<git_revwalk, GitDeleter<git_revwalk, git_revwalk_free>>;
using SignaturePtr = std::unique_ptr<git_signature, GitDeleter<git_signature, git_signature_free>>;
using TreePtr = std::unique_ptr<git_tree, GitDeleter<git_tree, git_tree_free>>;

std::string last_error_message() {
    const git_error* err = git_error_last();
    return (err && err->message) ? err->message : "unknown libgit2 error";
}

void check(int error, const std::string& message, const std::string& command) {
    if (error < 0) {
        throw AutocommitError::tool(message, command, last_error_message());
    }
}

std::string strip_prefix(const std::string& value, const std::string& prefix) {
    if (value.rfind(prefix, 0) == 0) {
        return value.substr(prefix.size());
    }
    return value;
}

CommitPtr lookup_commit(git_repository* repo, const std::string& revision, const std::string& command) {
    git_object* obj = nullptr;
    check(git_revparse_single(&obj, repo, revision.c_str()), "Unknown revision '" + revision + "'", command);
    ObjectPtr object(obj);
    git_object* peeled = nullptr;
    check(git_object_peel(&peeled, object.get(), GIT_OBJECT_COMMIT), "'" + revision + "' is not a commit", command);
    return CommitPtr(reinterpret_cast<git_commit*>(peeled));
}

// Local branch first, then the remote-tracking branch of the same name.
CommitPtr lookup_base_commit(git_repository* repo, const std::string& base_ref, const std::string& command) {
    git_object* obj = nullptr;
    if (git_revparse_single(&obj, repo, base_ref.c_str()) == 0) {
        git_object_free(obj);
        return lookup_commit(repo, base_ref, command);
    }
    return lookup_commit(repo, "origin/" + base_ref, command);
}

TreePtr commit_tree(const git_commit* commit, const std::string& command) {
    git_tree* tree = nullptr;
    check(git_commit_tree(&tree, commit), "Could not read commit tree", command);
    return TreePtr(tree);
}

std::vector<FileChange> collect_changes(git_diff* diff, const std::string& command) {
    check(git_diff_find_similar(diff, nullptr), "Could not detect renames", command);

    std::vector<FileChange> changes;
    size_t count = git_diff_num_deltas(diff);
    for (size_t i = 0; i < count; ++i) {
        const git_diff_delta* delta = git_diff_get_delta(diff, i);
        FileChange change;
        change.path = delta->new_file.path ? delta->new_file.path : delta->old_file.path;

        git_patch* raw_patch = nullptr;
        check(git_patch_from_diff(&raw_patch, diff, i), "Could not build patch for " + change.path, command);
        PatchPtr patch(raw_patch);
        if (patch) {
            git_buf buf = {0};
            check(git_patch_to_buf(&buf, patch.get()), "Could not format patch for " + change.path, command);
            change.patch.assign(buf.ptr ? buf.ptr : "", buf.size);
            git_buf_dispose(&buf);
        } else {
            change.patch = "diff --git a/" + change.path + " b/" + change.path + "\nBinary files differ\n";
        }
        changes.push_back(std::move(change));
    }
    return changes;
}

std::string format_commit(git_commit* commit) {
    const char* summary = git_commit_summary(commit);
    const char* body = git_commit_body(commit);
    std::string text = summary ? summary : "";
    text += "\n";
    if (body) {
        text += body;
    }
    return text;
}

struct TransportState {
    int credential_attempts = 0;
    std::string rejection;
};

int credentials_cb(git_credential** out, const char* url, const char* username_from_url,
                   unsigned int allowed_types, void* payload) {
    auto* state = static_cast<TransportState*>(payload);
    if (++state->credential_attempts > 1) {
        git_error_set_str(GIT_ERROR_NET, "authentication failed");
        return GIT_EAUTH;
    }
    spdlog::debug("Credentials requested for {}", url ? url : "remote");
    if (allowed_types & GIT_CREDENTIAL_SSH_KEY) {
        return git_credential_ssh_key_from_agent(out, username_from_url ? username_from_url : "git");
    }
    if (allowed_types & GIT_CREDENTIAL_DEFAULT) {
        return git_credential_default_new(out);
    }
    return GIT_PASSTHROUGH;
}

int push_update_reference_cb(const char* refname, const char* status, void* payload) {
    if (status) {
        auto* state = static_cast<TransportState*>(payload);
        state->rejection = std::string(refname) + ": " + status;
    }
    return 0;
}

// Opens a fetch connection to origin; the state must outlive the connection.
RemotePtr connect_origin(git_repository* repo, TransportState& state, const std::string& command) {
    git_remote* raw_remote = nullptr;
    check(git_remote_lookup(&raw_remote, repo, "origin"), "No 'origin' remote found", command);
    RemotePtr remote(raw_remote);

    git_remote_callbacks callbacks = GIT_REMOTE_CALLBACKS_INIT;
    callbacks.credentials = credentials_cb;
    callbacks.payload = &state;
    check(git_remote_connect(remote.get(), GIT_DIRECTION_FETCH, &callbacks, nullptr, nullptr),
          "Could not connect to origin", command);
    return remote;
}

int push_transfer_progress_cb(unsigned int current, unsigned int total, size_t bytes, void* payload) {
    (void)bytes;
    (void)payload;
    std::cout << "\rTransferring: " << current << "/" << total << std::flush;
    return 0;
}

} // namespace

GitRepository::GitRepository(const std::string& path) : repo_(nullptr) {
    git_libgit2_init();
    int error = git_repository_open_ext(&repo_, path.c_str(), 0, nullptr);
    if (error != 0) {
        git_libgit2_shutdown();
        throw AutocommitError::user("Not a git repository: " + path);
    }
}

GitRepository::~GitRepository() {
    if (repo_) {
        git_repository_free(repo_);
    }
    git_libgit2_shutdown();
}

std::string GitRepository::get_repo_root() const {
    const char* workdir = git_repository_workdir(repo_);
    return workdir ? workdir : "";
}

GitUtils::GitUtils(GitRepository& repo) : repo_(repo) {}

std::string GitUtils::get_repo_root() {
    return repo_.get_repo_root();
}

std::vector<FileChange> GitUtils::get_staged_changes() {
    const std::string command = "git diff --staged";
    git_repository* repo = repo_.get();

    git_index* raw_index = nullptr;
    check(git_repository_index(&raw_index, repo), "Could not read index", command);
    IndexPtr index(raw_index);

    // An unborn HEAD compares against the empty tree.
    TreePtr head_tree;
    if (git_repository_head_unborn(repo) != 1) {
        CommitPtr head = lookup_commit(repo, "HEAD", command);
        head_tree = commit_tree(head.get(), command);
    }

    git_diff_options opts = GIT_DIFF_OPTIONS_INIT;
    git_diff* raw_diff = nullptr;
    check(git_diff_tree_to_index(&raw_diff, repo, head_tree.get(), index.get(), &opts), "Failed to create staged diff", command);
    DiffPtr diff(raw_diff);
    return collect_changes(diff.get(), command);
}

std::vector<FileChange> GitUtils::get_branch_changes(const std::string& base_ref) {
    const std::string command = "git diff " + base_ref + "...HEAD";
    git_repository* repo = repo_.get();

    CommitPtr head = lookup_commit(repo, "HEAD", command);
    CommitPtr base = lookup_base_commit(repo, base_ref, command);

    git_oid merge_base;
    check(git_merge_base(&merge_base, repo, git_commit_id(head.get()), git_commit_id(base.get())),
          "No common ancestor with " + base_ref, command);

    git_commit* raw_base_commit = nullptr;
    check(git_commit_lookup(&raw_base_commit, repo, &merge_base), "Could not read merge base", command);
    CommitPtr merge_base_commit(raw_base_commit);

    TreePtr old_tree = commit_tree(merge_base_commit.get(), command);
    TreePtr new_tree = commit_tree(head.get(), command);

    git_diff_options opts = GIT_DIFF_OPTIONS_INIT;
    git_diff* raw_diff = nullptr;
    check(git_diff_tree_to_tree(&raw_diff, repo, old_tree.get(), new_tree.get(), &opts), "Failed to create branch diff", command);
    DiffPtr diff(raw_diff);
    return collect_changes(diff.get(), command);
}

std::vector<FileChange> GitUtils::get_recent_changes(int depth) {
    const std::string command = "git diff HEAD~" + std::to_string(depth) + " HEAD";
    git_repository* repo = repo_.get();

    CommitPtr head = lookup_commit(repo, "HEAD", command);
    TreePtr new_tree = commit_tree(head.get(), command);

    // Stops at the root commit, in which case the whole history is compared
    // against the empty tree.
    git_commit* copy = nullptr;
    check(git_commit_dup(&copy, head.get()), "Could not read HEAD", command);
    CommitPtr current(copy);
    for (int i = 0; i < depth && current; ++i) {
        if (git_commit_parentcount(current.get()) == 0) {
            current.reset();
            break;
        }
        git_commit* parent = nullptr;
        check(git_commit_parent(&parent, current.get(), 0), "Could not read parent commit", command);
        current.reset(parent);
    }

    TreePtr old_tree;
    if (current) {
        old_tree = commit_tree(current.get(), command);
    }

    git_diff_options opts = GIT_DIFF_OPTIONS_INIT;
    git_diff* raw_diff = nullptr;
    check(git_diff_tree_to_tree(&raw_diff, repo, old_tree.get(), new_tree.get(), &opts), "Failed to create diff", command);
    DiffPtr diff(raw_diff);
    return collect_changes(diff.get(), command);
}

std::vector<std::string> GitUtils::get_commit_log(const std::string& base_ref) {
    const std::string command = "git log " + base_ref + "..HEAD --reverse";
    git_repository* repo = repo_.get();

    CommitPtr base = lookup_base_commit(repo, base_ref, command);

    git_revwalk* raw_walk = nullptr;
    check(git_revwalk_new(&raw_walk, repo), "Could not start revision walk", command);
    RevwalkPtr walk(raw_walk);
    check(git_revwalk_sorting(walk.get(), GIT_SORT_TOPOLOGICAL | GIT_SORT_REVERSE), "Could not sort revision walk", command);
    check(git_revwalk_push_head(walk.get()), "Could not walk HEAD", command);
    check(git_revwalk_hide(walk.get(), git_commit_id(base.get())), "Could not hide " + base_ref, command);

    std::vector<std::string> commits;
    git_oid oid;
    int error = 0;
    while ((error = git_revwalk_next(&oid, walk.get())) == 0) {
        git_commit* raw_commit = nullptr;
        check(git_commit_lookup(&raw_commit, repo, &oid), "Could not read commit", command);
        CommitPtr commit(raw_commit);
        commits.push_back(format_commit(commit.get()));
    }
    if (error != GIT_ITEROVER) {
        check(error, "Revision walk failed", command);
    }
    return commits;
}

std::vector<std::string> GitUtils::get_recent_commits(int count) {
    const std::string command = "git log -" + std::to_string(count) + " --reverse";
    git_repository* repo = repo_.get();

    git_revwalk* raw_walk = nullptr;
    check(git_revwalk_new(&raw_walk, repo), "Could not start revision walk", command);
    RevwalkPtr walk(raw_walk);
    check(git_revwalk_sorting(walk.get(), GIT_SORT_TOPOLOGICAL | GIT_SORT_TIME), "Could not sort revision walk", command);
    check(git_revwalk_push_head(walk.get()), "Could not walk HEAD", command);

    std::vector<std::string> commits;
    git_oid oid;
    int error = 0;
    while (static_cast<int>(commits.size()) < count && (error = git_revwalk_next(&oid, walk.get())) == 0) {
        git_commit* raw_commit = nullptr;
        check(git_commit_lookup(&raw_commit, repo, &oid), "Could not read commit", command);
        CommitPtr commit(raw_commit);
        commits.push_back(format_commit(commit.get()));
    }
    if (error < 0 && error != GIT_ITEROVER) {
        check(error, "Revision walk failed", command);
    }
    std::reverse(commits.begin(), commits.end());
    return commits;
}

std::optional<std::string> GitUtils::get_current_branch() {
    const std::string command = "git branch --show-current";
    git_repository* repo = repo_.get();

    if (git_repository_head_detached(repo) == 1) {
        return std::nullopt;
    }
    if (git_repository_head_unborn(repo) == 1) {
        git_reference* raw_head = nullptr;
        check(git_reference_lookup(&raw_head, repo, "HEAD"), "Could not read HEAD", command);
        ReferencePtr head(raw_head);
        const char* target = git_reference_symbolic_target(head.get());
        if (!target) {
            return std::nullopt;
        }
        return strip_prefix(target, "refs/heads/");
    }

    git_reference* raw_head = nullptr;
    check(git_repository_head(&raw_head, repo), "Could not read HEAD", command);
    ReferencePtr head(raw_head);
    return std::string(git_reference_shorthand(head.get()));
}

std::optional<std::string> GitUtils::get_remote_head_branch() {
    const std::string command = "git remote show origin";
    try {
        TransportState state;
        RemotePtr remote = connect_origin(repo_.get(), state, command);
        git_buf buf = {0};
        check(git_remote_default_branch(&buf, remote.get()), "origin does not advertise a HEAD branch", command);
        std::string branch = strip_prefix(std::string(buf.ptr ? buf.ptr : "", buf.size), "refs/heads/");
        git_buf_dispose(&buf);
        if (!branch.empty()) {
            return branch;
        }
    } catch (const AutocommitError& e) {
        spdlog::debug("Could not ask origin for its HEAD branch: {}", e.what());
    }

    // Last fetched view of origin's HEAD.
    git_reference* raw_ref = nullptr;
    if (git_reference_lookup(&raw_ref, repo_.get(), "refs/remotes/origin/HEAD") != 0) {
        spdlog::debug("refs/remotes/origin/HEAD not found: {}", last_error_message());
        return std::nullopt;
    }
    ReferencePtr ref(raw_ref);
    if (git_reference_type(ref.get()) != GIT_REFERENCE_SYMBOLIC) {
        return std::nullopt;
    }
    std::string branch = strip_prefix(git_reference_symbolic_target(ref.get()), "refs/remotes/origin/");
    if (branch.empty()) {
        return std::nullopt;
    }
    return branch;
}

bool GitUtils::remote_branch_exists(const std::string& branch) {
    const std::string command = "git ls-remote --exit-code --heads origin " + branch;
    try {
        TransportState state;
        RemotePtr remote = connect_origin(repo_.get(), state, command);
        const git_remote_head** heads = nullptr;
        size_t count = 0;
        check(git_remote_ls(&heads, &count, remote.get()), "Could not list origin's refs", command);
        const std::string wanted = "refs/heads/" + branch;
        for (size_t i = 0; i < count; ++i) {
            if (heads[i]->name && wanted == heads[i]->name) {
                return true;
            }
        }
        return false;
    } catch (const AutocommitError& e) {
        spdlog::debug("Could not list origin's branches, using tracking refs: {}", e.what());
    }

    git_reference* raw_ref = nullptr;
    int error = git_branch_lookup(&raw_ref, repo_.get(), ("origin/" + branch).c_str(), GIT_BRANCH_REMOTE);
    ReferencePtr ref(raw_ref);
    return error == 0;
}

AheadBehind GitUtils::get_ahead_behind() {
    const std::string command = "git status -sb";
    git_repository* repo = repo_.get();
    AheadBehind result;

    if (git_repository_head_unborn(repo) == 1 || git_repository_head_detached(repo) == 1) {
        return result;
    }

    git_reference* raw_head = nullptr;
    check(git_repository_head(&raw_head, repo), "Could not read HEAD", command);
    ReferencePtr head(raw_head);

    git_reference* raw_upstream = nullptr;
    if (git_branch_upstream(&raw_upstream, head.get()) != 0) {
        return result;
    }
    ReferencePtr upstream(raw_upstream);

    result.has_upstream = true;
    check(git_graph_ahead_behind(&result.ahead, &result.behind, repo,
                                 git_reference_target(head.get()), git_reference_target(upstream.get())),
          "Could not compare with upstream", command);
    return result;
}

void GitUtils::push_current_branch() {
    git_repository* repo = repo_.get();

    std::optional<std::string> branch = get_current_branch();
    if (!branch) {
        throw AutocommitError::user("Cannot push a detached HEAD. Please checkout a branch first.");
    }
    const std::string command = "git push -u origin " + *branch;

    git_remote* raw_remote = nullptr;
    if (git_remote_lookup(&raw_remote, repo, "origin") != 0) {
        throw AutocommitError::tool("No 'origin' remote found. Add a remote with 'git remote add origin <url>'",
                                    command, last_error_message());
    }
    RemotePtr remote(raw_remote);

    TransportState state;
    git_push_options push_opts = GIT_PUSH_OPTIONS_INIT;
    push_opts.callbacks.credentials = credentials_cb;
    push_opts.callbacks.push_update_reference = push_update_reference_cb;
    push_opts.callbacks.push_transfer_progress = push_transfer_progress_cb;
    push_opts.callbacks.payload = &state;

    std::string refspec = "refs/heads/" + *branch + ":refs/heads/" + *branch;
    char* refspec_ptr = &refspec[0];
    git_strarray refspecs = {&refspec_ptr, 1};

    std::cout << "Pushing branch " << *branch << "..." << std::endl;
    int error = git_remote_push(remote.get(), &refspecs, &push_opts);
    std::cout << std::endl;

    check(error, "Push failed (remote: " + std::string(git_remote_url(remote.get()) ? git_remote_url(remote.get()) : "unknown") + ")", command);
    if (!state.rejection.empty()) {
        throw AutocommitError::tool("Push was rejected", command, state.rejection);
    }

    git_reference* raw_head = nullptr;
    check(git_repository_head(&raw_head, repo), "Could not read HEAD", command);
    ReferencePtr head(raw_head);
    check(git_branch_set_upstream(head.get(), ("origin/" + *branch).c_str()), "Could not set upstream", command);
}

std::string GitUtils::commit(const std::string& message) {
    const std::string command = "git commit -m <message>";
    git_repository* repo = repo_.get();

    git_buf prettified = {0};
    check(git_message_prettify(&prettified, message.c_str(), 0, '#'), "Invalid commit message", command);
    std::string clean_message(prettified.ptr ? prettified.ptr : "", prettified.size);
    git_buf_dispose(&prettified);

    git_index* raw_index = nullptr;
    check(git_repository_index(&raw_index, repo), "Could not read index", command);
    IndexPtr index(raw_index);

    git_oid tree_oid;
    check(git_index_write_tree(&tree_oid, index.get()), "Could not write tree", command);
    git_tree* raw_tree = nullptr;
    check(git_tree_lookup(&raw_tree, repo, &tree_oid), "Could not read tree", command);
    TreePtr tree(raw_tree);

    git_signature* raw_author = nullptr;
    check(git_signature_default(&raw_author, repo),
          "No author identity. Set user.name and user.email in your git config", command);
    SignaturePtr author(raw_author);

    git_oid commit_oid;
    if (git_repository_head_unborn(repo) == 1) {
        check(git_commit_create_v(&commit_oid, repo, "HEAD", author.get(), author.get(), nullptr,
                                  clean_message.c_str(), tree.get(), 0),
              "Git commit failed", command);
    } else {
        CommitPtr parent = lookup_commit(repo, "HEAD", command);
        check(git_commit_create_v(&commit_oid, repo, "HEAD", author.get(), author.get(), nullptr,
                                  clean_message.c_str(), tree.get(), 1, parent.get()),
              "Git commit failed", command);
    }

    char hash_str[8];
    git_oid_tostr(hash_str, sizeof(hash_str), &commit_oid);
    spdlog::debug("Created commit {}", hash_str);
    return hash_str;
}
