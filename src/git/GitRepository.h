#pragma once
#include <memory>
#include <string>
#include <vector>
#include <git2.h>
#include "git/IGitRepository.h"

/**
 * @brief Scoped libgit2 initialisation. Create one before any GitRepository.
 */
class LibGit2Session {
public:
    LibGit2Session();
    ~LibGit2Session();

    LibGit2Session(const LibGit2Session&) = delete;
    LibGit2Session& operator=(const LibGit2Session&) = delete;
};

namespace gitptr {

template <typename T, void (*FreeFn)(T*)>
struct Deleter {
    void operator()(T* p) const {
        if (p) FreeFn(p);
    }
};

using Repository = std::unique_ptr<git_repository, Deleter<git_repository, git_repository_free>>;
using Object = std::unique_ptr<git_object, Deleter<git_object, git_object_free>>;
using Commit = std::unique_ptr<git_commit, Deleter<git_commit, git_commit_free>>;
using Tree = std::unique_ptr<git_tree, Deleter<git_tree, git_tree_free>>;
using Index = std::unique_ptr<git_index, Deleter<git_index, git_index_free>>;
using Diff = std::unique_ptr<git_diff, Deleter<git_diff, git_diff_free>>;
using Patch = std::unique_ptr<git_patch, Deleter<git_patch, git_patch_free>>;
using Revwalk = std::unique_ptr<git_revwalk, Deleter<git_revwalk, git_revwalk_free>>;

// Message of the last libgit2 error on this thread.
std::string lastError();

} // namespace gitptr

/**
 * @brief libgit2-backed repository collaborator.
 *
 * The constructor validates the path once. Every query opens its own
 * git_repository so no libgit2 handle is shared between request threads.
 */
class GitRepository : public IGitRepository {
public:
    /**
     * @param path repository working directory or .git directory
     * @throws RepositoryUnavailable when path is not a git repository
     */
    explicit GitRepository(const std::string& path);

    const std::string& path() const { return path_; }

    std::vector<ChangedFile> diff(const std::string& source, const DiffTarget& target) override;
    std::vector<CommitRecord> log(const std::string& ancestor) override;
    std::string resolve(const std::string& revision) override;

private:
    std::string path_;

    gitptr::Repository open() const;
    gitptr::Commit resolveCommit(git_repository* repo, const std::string& revision) const;
    gitptr::Tree commitTree(git_commit* commit, const std::string& revision) const;

    static std::string patchBody(git_patch* patch, const git_diff_delta* delta);
    static CommitRecord toRecord(git_commit* commit);
};
