#include <gtest/gtest.h>
#include "git/GitRepository.h"
#include "git/ChangeSetAccessor.h"
#include "git/HistoryAccessor.h"
#include "core/Errors.h"
#include <filesystem>
#include <fstream>
#include <chrono>

namespace fs = std::filesystem;

class GitRepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        testDir = fs::temp_directory_path() / fs::path("gitprompts_repo_test_" + std::to_string(now));
        fs::create_directories(testDir);

        git_repository* raw = nullptr;
        ASSERT_EQ(git_repository_init(&raw, testDir.u8string().c_str(), 0), 0) << gitptr::lastError();
        repo.reset(raw);
    }

    void TearDown() override {
        repo.reset();
        fs::remove_all(testDir);
    }

    void writeFile(const std::string& rel, const std::string& content) {
        fs::path p = testDir / fs::u8path(rel);
        fs::create_directories(p.parent_path());
        std::ofstream f(p, std::ios::binary);
        f << content;
    }

    void stage(const std::string& rel) {
        gitptr::Index index = openIndex();
        ASSERT_EQ(git_index_add_bypath(index.get(), rel.c_str()), 0) << gitptr::lastError();
        ASSERT_EQ(git_index_write(index.get()), 0);
    }

    void unstageRemoved(const std::string& rel) {
        fs::remove(testDir / fs::u8path(rel));
        gitptr::Index index = openIndex();
        ASSERT_EQ(git_index_remove_bypath(index.get(), rel.c_str()), 0) << gitptr::lastError();
        ASSERT_EQ(git_index_write(index.get()), 0);
    }

    // Commit the current index on top of HEAD; each commit is one minute after the previous one.
    std::string commit(const std::string& message, const std::string& author = "Alice") {
        gitptr::Index index = openIndex();
        git_oid treeId;
        EXPECT_EQ(git_index_write_tree(&treeId, index.get()), 0) << gitptr::lastError();
        git_tree* rawTree = nullptr;
        EXPECT_EQ(git_tree_lookup(&rawTree, repo.get(), &treeId), 0);
        gitptr::Tree tree(rawTree);

        git_signature* sig = nullptr;
        EXPECT_EQ(git_signature_new(&sig, author.c_str(), "dev@example.com", kBaseTime + 60 * commitCount, 0), 0);

        git_oid parentId;
        gitptr::Commit parent;
        if (git_reference_name_to_id(&parentId, repo.get(), "HEAD") == 0) {
            git_commit* rawParent = nullptr;
            EXPECT_EQ(git_commit_lookup(&rawParent, repo.get(), &parentId), 0);
            parent.reset(rawParent);
        }

        git_oid commitId;
        int rc = git_commit_create_v(&commitId, repo.get(), "HEAD", sig, sig, nullptr, message.c_str(),
                                     tree.get(), parent ? 1 : 0, parent.get());
        git_signature_free(sig);
        EXPECT_EQ(rc, 0) << gitptr::lastError();
        ++commitCount;
        return git_oid_tostr_s(&commitId);
    }

    static constexpr git_time_t kBaseTime = 1714566600;  // 2024-05-01T12:30:00Z

    LibGit2Session session;
    fs::path testDir;
    gitptr::Repository repo;
    int commitCount = 0;

private:
    gitptr::Index openIndex() {
        git_index* raw = nullptr;
        EXPECT_EQ(git_repository_index(&raw, repo.get()), 0);
        return gitptr::Index(raw);
    }
};

TEST_F(GitRepositoryTest, RejectsNonRepositoryPath) {
    fs::path plain = fs::temp_directory_path() / ("gitprompts_plain_" + testDir.filename().u8string());
    fs::create_directories(plain);
    EXPECT_THROW(GitRepository(plain.u8string()), RepositoryUnavailable);
    EXPECT_THROW(GitRepository((plain / "missing").u8string()), RepositoryUnavailable);
    fs::remove_all(plain);
}

TEST_F(GitRepositoryTest, DiffBetweenCommits) {
    writeFile("a.txt", "x\n");
    stage("a.txt");
    commit("first");

    writeFile("a.txt", "y\n");
    writeFile("b.txt", "new\n");
    stage("a.txt");
    stage("b.txt");
    commit("second");

    GitRepository git(testDir.u8string());
    auto files = git.diff("HEAD~1", DiffTarget::revision("HEAD"));
    ASSERT_EQ(files.size(), 2u);

    EXPECT_EQ(files[0].oldPath, std::optional<std::string>("a.txt"));
    EXPECT_EQ(files[0].newPath, std::optional<std::string>("a.txt"));
    EXPECT_EQ(files[0].patchText, "@@ -1 +1 @@\n-x\n+y\n");

    EXPECT_FALSE(files[1].oldPath.has_value());
    EXPECT_EQ(files[1].newPath, std::optional<std::string>("b.txt"));
    EXPECT_EQ(files[1].patchText.rfind("@@ ", 0), 0u);
    EXPECT_NE(files[1].patchText.find("+new\n"), std::string::npos);
}

TEST_F(GitRepositoryTest, DeletedFileHasNoNewPath) {
    writeFile("a.txt", "x\n");
    writeFile("gone.txt", "bye\n");
    stage("a.txt");
    stage("gone.txt");
    commit("first");

    unstageRemoved("gone.txt");
    commit("remove");

    GitRepository git(testDir.u8string());
    auto files = git.diff("HEAD~1", DiffTarget::revision("HEAD"));
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].oldPath, std::optional<std::string>("gone.txt"));
    EXPECT_FALSE(files[0].newPath.has_value());
    EXPECT_NE(files[0].patchText.find("-bye\n"), std::string::npos);
}

TEST_F(GitRepositoryTest, RenameKeepsBothPaths) {
    writeFile("old_name.txt", "line one\nline two\nline three\n");
    stage("old_name.txt");
    commit("first");

    unstageRemoved("old_name.txt");
    writeFile("new_name.txt", "line one\nline two\nline three\n");
    stage("new_name.txt");
    commit("rename");

    GitRepository git(testDir.u8string());
    auto files = git.diff("HEAD~1", DiffTarget::revision("HEAD"));
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].oldPath, std::optional<std::string>("old_name.txt"));
    EXPECT_EQ(files[0].newPath, std::optional<std::string>("new_name.txt"));
}

TEST_F(GitRepositoryTest, StagedDiffIgnoresWorkingTree) {
    writeFile("a.txt", "x\n");
    stage("a.txt");
    commit("first");

    writeFile("c.txt", "staged\n");
    stage("c.txt");
    writeFile("a.txt", "unstaged edit\n");

    GitRepository git(testDir.u8string());
    auto files = git.diff("HEAD", DiffTarget::staged());
    ASSERT_EQ(files.size(), 1u);
    EXPECT_FALSE(files[0].oldPath.has_value());
    EXPECT_EQ(files[0].newPath, std::optional<std::string>("c.txt"));
    EXPECT_NE(files[0].patchText.find("+staged\n"), std::string::npos);
}

TEST_F(GitRepositoryTest, StagedChangesFilteredByExclusion) {
    writeFile("a.txt", "x\n");
    stage("a.txt");
    commit("first");

    writeFile("src/main.cpp", "int main() {}\n");
    writeFile("build/out.log", "noise\n");
    stage("src/main.cpp");
    stage("build/out.log");

    GitRepository git(testDir.u8string());
    PathExclusion exclusion({"*.log"});
    ChangeSetAccessor accessor(git, exclusion);
    auto files = accessor.getStagedChanges();
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].newPath, std::optional<std::string>("src/main.cpp"));
}

TEST_F(GitRepositoryTest, LogIsNewestFirst) {
    writeFile("a.txt", "1\n");
    stage("a.txt");
    std::string first = commit("first");
    writeFile("a.txt", "2\n");
    stage("a.txt");
    std::string second = commit("second commit\n\nbody text\n", "Bob");
    writeFile("a.txt", "3\n");
    stage("a.txt");
    std::string third = commit("third\n");

    GitRepository git(testDir.u8string());
    auto commits = git.log(first);
    ASSERT_EQ(commits.size(), 2u);
    EXPECT_EQ(commits[0].id, third);
    EXPECT_EQ(commits[0].message, "third");
    EXPECT_EQ(commits[1].id, second);
    EXPECT_EQ(commits[1].author, "Bob");
    EXPECT_EQ(commits[1].message, "second commit\n\nbody text");
    EXPECT_EQ(commits[1].timestamp, "2024-05-01T12:31:00+00:00");

    EXPECT_EQ(git.log("HEAD~2").size(), 2u);
    EXPECT_EQ(git.log("HEAD~1").size(), 1u);
}

TEST_F(GitRepositoryTest, LogOfHeadIsEmpty) {
    writeFile("a.txt", "1\n");
    stage("a.txt");
    commit("first");

    GitRepository git(testDir.u8string());
    EXPECT_TRUE(git.log("HEAD").empty());
}

TEST_F(GitRepositoryTest, UnknownRevisions) {
    writeFile("a.txt", "1\n");
    stage("a.txt");
    commit("first");

    GitRepository git(testDir.u8string());
    EXPECT_THROW(git.diff("no-such-branch", DiffTarget::revision("HEAD")), RevisionNotFound);
    EXPECT_THROW(git.diff("HEAD", DiffTarget::revision("no-such-branch")), RevisionNotFound);
    EXPECT_THROW(git.resolve("deadbeefdeadbeef"), RevisionNotFound);
    EXPECT_THROW(git.log("no-such-branch"), InvalidRevisionRange);

    // window larger than the whole history
    HistoryAccessor history(git);
    EXPECT_THROW(history.getHistory(HistoryAccessor::windowAncestor(5)), InvalidRevisionRange);
}

TEST_F(GitRepositoryTest, ResolvesBranchAndHead) {
    writeFile("a.txt", "1\n");
    stage("a.txt");
    std::string id = commit("first");

    GitRepository git(testDir.u8string());
    EXPECT_EQ(git.resolve("HEAD"), id);
    EXPECT_EQ(git.resolve(id.substr(0, 10)), id);
}
