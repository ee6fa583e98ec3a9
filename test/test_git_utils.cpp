#include <gtest/gtest.h>
#include <algorithm>
#include "change_collector.hpp"
#include "errors.hpp"
#include "git_utils.hpp"
#include "test_utils.hpp"

using namespace test_utils;

namespace {

std::vector<std::string> paths_of(const std::vector<FileChange>& changes) {
    std::vector<std::string> paths;
    for (const auto& change : changes) {
        paths.push_back(change.path);
    }
    return paths;
}

void create_remote_tracking_ref(git_repository* repo, const std::string& branch, const git_oid& target) {
    git_reference* ref = nullptr;
    ASSERT_EQ(git_reference_create(&ref, repo, ("refs/remotes/origin/" + branch).c_str(), &target, 1, nullptr), 0);
    git_reference_free(ref);
}

} // namespace

class GitUtilsTest : public ::testing::Test {
protected:
    GitUtilsTest() : repo(test_repo.path().string()), git(repo) {}

    TestRepo test_repo;
    GitRepository repo;
    GitUtils git;
};

TEST(GitRepositoryTest, OutsideRepositoryIsAUserError) {
    auto dir = create_temp_dir();
    try {
        GitRepository repo(dir.string());
        FAIL() << "expected a UserError";
    } catch (const AutocommitError& e) {
        EXPECT_TRUE(std::holds_alternative<UserError>(e.kind()));
    }
    remove_dir(dir);
}

TEST_F(GitUtilsTest, StagedChangesOnUnbornHead) {
    test_repo.write("src/a.txt", "foo\n");
    test_repo.stage("src/a.txt");

    auto changes = git.get_staged_changes();

    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].path, "src/a.txt");
    EXPECT_NE(changes[0].patch.find("+foo"), std::string::npos);
}

TEST_F(GitUtilsTest, StagedChangesAgainstHead) {
    test_repo.commit_file("src/a.txt", "foo\n", "chore: initial");
    test_repo.write("src/a.txt", "foo\nbar\n");
    test_repo.write("unstaged.txt", "ignored\n");
    test_repo.stage("src/a.txt");

    auto changes = git.get_staged_changes();

    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].path, "src/a.txt");
    EXPECT_NE(changes[0].patch.find("+bar"), std::string::npos);
    EXPECT_EQ(changes[0].patch.find("+foo"), std::string::npos);
}

TEST_F(GitUtilsTest, NothingStagedYieldsNoChanges) {
    test_repo.commit_file("a.txt", "a\n", "chore: initial");
    EXPECT_TRUE(git.get_staged_changes().empty());
}

TEST_F(GitUtilsTest, CommitCreatesCommitAndReturnsShortHash) {
    test_repo.write("src/a.txt", "foo\n");
    test_repo.stage("src/a.txt");

    std::string hash = git.commit("feat: add foo");

    EXPECT_EQ(hash.size(), 7u);
    git_object* head = nullptr;
    ASSERT_EQ(git_revparse_single(&head, test_repo.get(), "HEAD^{commit}"), 0);
    auto* commit = reinterpret_cast<git_commit*>(head);
    EXPECT_STREQ(git_commit_message(commit), "feat: add foo\n");
    char full[41];
    git_oid_tostr(full, sizeof(full), git_commit_id(commit));
    EXPECT_EQ(std::string(full).substr(0, 7), hash);
    git_object_free(head);

    EXPECT_TRUE(git.get_staged_changes().empty());
}

TEST_F(GitUtilsTest, CommitOnTopOfExistingHistory) {
    test_repo.commit_file("a.txt", "a\n", "chore: initial");
    test_repo.write("b.txt", "b\n");
    test_repo.stage("b.txt");

    git.commit("feat: add b");

    auto commits = git.get_recent_commits(10);
    ASSERT_EQ(commits.size(), 2u);
    EXPECT_EQ(commits[0], "chore: initial\n");
    EXPECT_EQ(commits[1], "feat: add b\n");
}

TEST_F(GitUtilsTest, BranchChangesAndLogSinceMergeBase) {
    test_repo.commit_file("README.md", "readme\n", "chore: initial");
    test_repo.create_branch("base");
    test_repo.create_branch("feature/login");
    test_repo.commit_file("src/login.cpp", "login\n", "feat: add login\n\nAdds the login form.");
    test_repo.commit_file("src/logout.cpp", "logout\n", "feat: add logout");

    auto changes = git.get_branch_changes("base");
    auto log = git.get_commit_log("base");

    EXPECT_EQ(paths_of(changes), (std::vector<std::string>{"src/login.cpp", "src/logout.cpp"}));
    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log[0], "feat: add login\nAdds the login form.");
    EXPECT_EQ(log[1], "feat: add logout\n");
}

TEST_F(GitUtilsTest, BaseResolvesThroughRemoteTrackingBranch) {
    git_oid base = test_repo.commit_file("README.md", "readme\n", "chore: initial");
    create_remote_tracking_ref(test_repo.get(), "trunk", base);
    test_repo.create_branch("feature/x");
    test_repo.commit_file("x.txt", "x\n", "feat: x");

    EXPECT_EQ(paths_of(git.get_branch_changes("trunk")), std::vector<std::string>{"x.txt"});
    EXPECT_EQ(git.get_commit_log("trunk").size(), 1u);
}

TEST_F(GitUtilsTest, UnknownBaseIsAToolError) {
    test_repo.commit_file("a.txt", "a\n", "chore: initial");
    try {
        git.get_branch_changes("does-not-exist");
        FAIL() << "expected an ExternalToolError";
    } catch (const AutocommitError& e) {
        EXPECT_TRUE(std::holds_alternative<ExternalToolError>(e.kind()));
    }
}

TEST_F(GitUtilsTest, RecentChangesWithShortHistoryUseEmptyTree) {
    test_repo.commit_file("a.txt", "a\n", "chore: a");
    test_repo.commit_file("b.txt", "b\n", "chore: b");

    EXPECT_EQ(paths_of(git.get_recent_changes(5)), (std::vector<std::string>{"a.txt", "b.txt"}));
    EXPECT_EQ(paths_of(git.get_recent_changes(1)), std::vector<std::string>{"b.txt"});
}

TEST_F(GitUtilsTest, RecentCommitsAreOldestFirstAndCapped) {
    test_repo.commit_file("a.txt", "a\n", "chore: a");
    test_repo.commit_file("b.txt", "b\n", "chore: b");
    test_repo.commit_file("c.txt", "c\n", "chore: c");

    EXPECT_EQ(git.get_recent_commits(2), (std::vector<std::string>{"chore: b\n", "chore: c\n"}));
}

TEST_F(GitUtilsTest, UnrelatedHistoryFallsBackToRecentCommits) {
    test_repo.commit_file("README.md", "readme\n", "chore: initial");
    test_repo.create_branch("base");
    test_repo.switch_to_orphan("orphan");
    test_repo.commit_file("orphan.txt", "orphan\n", "feat: orphan work");

    ChangeCollector collector(git);
    ChangeSet set = collector.collect_branch("base");

    EXPECT_TRUE(set.used_fallback);
    EXPECT_FALSE(set.files.empty());
    EXPECT_NE(std::find(set.files.begin(), set.files.end(), "orphan.txt"), set.files.end());
}

TEST_F(GitUtilsTest, CurrentBranchAndDetachedHead) {
    test_repo.commit_file("a.txt", "a\n", "chore: initial");
    test_repo.create_branch("feature/login");
    EXPECT_EQ(git.get_current_branch(), std::optional<std::string>("feature/login"));

    test_repo.detach_head();
    EXPECT_FALSE(git.get_current_branch().has_value());
}

TEST_F(GitUtilsTest, CurrentBranchOnUnbornHead) {
    test_repo.switch_to_orphan("fresh");
    EXPECT_EQ(git.get_current_branch(), std::optional<std::string>("fresh"));
}

TEST_F(GitUtilsTest, RemoteHeadFallsBackToFetchedRefWithoutOrigin) {
    EXPECT_FALSE(git.get_remote_head_branch().has_value());

    test_repo.set_remote_head("develop");
    EXPECT_EQ(git.get_remote_head_branch(), std::optional<std::string>("develop"));

    ChangeCollector collector(git);
    EXPECT_EQ(collector.detect_default_branch(), "develop");
}

TEST_F(GitUtilsTest, RemoteBranchExistsFallsBackToTrackingRefsWithoutOrigin) {
    git_oid head = test_repo.commit_file("a.txt", "a\n", "chore: initial");
    EXPECT_FALSE(git.remote_branch_exists("feature/login"));

    create_remote_tracking_ref(test_repo.get(), "feature/login", head);
    EXPECT_TRUE(git.remote_branch_exists("feature/login"));
}

TEST_F(GitUtilsTest, RemoteHeadIsAskedFromOrigin) {
    test_repo.commit_file("README.md", "readme\n", "chore: initial");
    test_repo.create_branch("develop");
    test_repo.commit_file("src/app.cpp", "app\n", "feat: app");
    test_repo.create_origin("develop");
    test_repo.create_branch("feature/login");

    git_reference* cached = nullptr;
    EXPECT_NE(git_reference_lookup(&cached, test_repo.get(), "refs/remotes/origin/HEAD"), 0);
    git_reference_free(cached);

    EXPECT_EQ(git.get_remote_head_branch(), std::optional<std::string>("develop"));
    ChangeCollector collector(git);
    EXPECT_EQ(collector.detect_default_branch(), "develop");
}

TEST_F(GitUtilsTest, RemoteBranchExistsAsksOrigin) {
    test_repo.commit_file("README.md", "readme\n", "chore: initial");
    test_repo.create_branch("develop");
    test_repo.create_origin("develop");

    EXPECT_TRUE(git.remote_branch_exists("develop"));

    test_repo.create_tracking_ref("deleted-on-origin");
    EXPECT_FALSE(git.remote_branch_exists("deleted-on-origin"));
    EXPECT_FALSE(git.remote_branch_exists("feature/never-pushed"));
}

TEST_F(GitUtilsTest, NoUpstreamMeansNothingToCompare) {
    test_repo.commit_file("a.txt", "a\n", "chore: initial");
    AheadBehind status = git.get_ahead_behind();
    EXPECT_FALSE(status.has_upstream);
    EXPECT_EQ(status.ahead, 0u);
}

TEST_F(GitUtilsTest, PushWithoutOriginIsAToolError) {
    test_repo.commit_file("a.txt", "a\n", "chore: initial");
    test_repo.create_branch("feature/login");
    try {
        git.push_current_branch();
        FAIL() << "expected an ExternalToolError";
    } catch (const AutocommitError& e) {
        EXPECT_TRUE(std::holds_alternative<ExternalToolError>(e.kind()));
        EXPECT_NE(std::string(e.what()).find("origin"), std::string::npos);
    }
}

TEST_F(GitUtilsTest, LockFilesAreExcludedFromStagedChangeSet) {
    test_repo.write("src/a.txt", "foo\n");
    test_repo.write("web/package-lock.json", "{}\n");
    test_repo.stage("src/a.txt");
    test_repo.stage("web/package-lock.json");

    ChangeCollector collector(git);
    ChangeSet set = collector.collect_staged();

    EXPECT_EQ(set.files, std::vector<std::string>{"src/a.txt"});
    EXPECT_EQ(set.diff.find("package-lock.json"), std::string::npos);
    EXPECT_NE(set.diff.find("+foo"), std::string::npos);
}
