#include "git/GitRepository.h"
#include "core/Errors.h"
#include "utils/Logger.h"
#include "utils/TextUtils.h"
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

LibGit2Session::LibGit2Session() {
    if (git_libgit2_init() < 0)
        throw std::runtime_error("Failed to initialize libgit2");
}

LibGit2Session::~LibGit2Session() {
    git_libgit2_shutdown();
}

namespace gitptr {

std::string lastError() {
    const git_error* err = git_error_last();
    if (err && err->message) return err->message;
    return "unknown libgit2 error";
}

} // namespace gitptr

namespace {

bool isLookupFailure(int rc) {
    return rc == GIT_ENOTFOUND || rc == GIT_EAMBIGUOUS || rc == GIT_EINVALIDSPEC ||
           rc == GIT_EPEEL || rc == GIT_EUNBORNBRANCH;
}

int appendPatchLine(const git_diff_delta*, const git_diff_hunk*, const git_diff_line* line, void* payload) {
    auto* out = static_cast<std::string*>(payload);
    switch (line->origin) {
        case GIT_DIFF_LINE_FILE_HDR:
            // "diff --git" / "---" / "+++" headers are not part of the body
            return 0;
        case GIT_DIFF_LINE_CONTEXT:
        case GIT_DIFF_LINE_ADDITION:
        case GIT_DIFF_LINE_DELETION:
            out->push_back(line->origin);
            break;
        default:
            break;
    }
    out->append(line->content, line->content_len);
    return 0;
}

} // namespace

GitRepository::GitRepository(const std::string& path) {
    std::error_code ec;
    fs::path absolute = fs::absolute(fs::u8path(path), ec);
    path_ = ec ? path : absolute.lexically_normal().u8string();

    git_repository* raw = nullptr;
    if (git_repository_open(&raw, path_.c_str()) < 0) {
        throw RepositoryUnavailable(path_ + " is not a valid Git repository: " + gitptr::lastError());
    }
    gitptr::Repository repo(raw);
    Logger::getInstance().debug("Opened repository " + path_);
}

gitptr::Repository GitRepository::open() const {
    git_repository* raw = nullptr;
    if (git_repository_open(&raw, path_.c_str()) < 0) {
        throw RepositoryError("Failed to open repository " + path_ + ": " + gitptr::lastError());
    }
    return gitptr::Repository(raw);
}

gitptr::Commit GitRepository::resolveCommit(git_repository* repo, const std::string& revision) const {
    git_object* obj = nullptr;
    int rc = git_revparse_single(&obj, repo, revision.c_str());
    if (rc < 0) {
        if (isLookupFailure(rc))
            throw RevisionNotFound("Unknown revision '" + revision + "': " + gitptr::lastError());
        throw RepositoryError("Failed to resolve '" + revision + "': " + gitptr::lastError());
    }
    gitptr::Object holder(obj);

    git_object* peeled = nullptr;
    rc = git_object_peel(&peeled, obj, GIT_OBJECT_COMMIT);
    if (rc < 0) {
        if (isLookupFailure(rc))
            throw RevisionNotFound("Revision '" + revision + "' does not name a commit");
        throw RepositoryError("Failed to peel '" + revision + "' to a commit: " + gitptr::lastError());
    }
    return gitptr::Commit(reinterpret_cast<git_commit*>(peeled));
}

gitptr::Tree GitRepository::commitTree(git_commit* commit, const std::string& revision) const {
    git_tree* tree = nullptr;
    if (git_commit_tree(&tree, commit) < 0)
        throw RepositoryError("Failed to get tree for " + revision + ": " + gitptr::lastError());
    return gitptr::Tree(tree);
}

std::string GitRepository::patchBody(git_patch* patch, const git_diff_delta* delta) {
    std::string body;
    if (!patch) {
        if (delta && (delta->flags & GIT_DIFF_FLAG_BINARY)) {
            const char* oldPath = delta->old_file.path ? delta->old_file.path : "";
            const char* newPath = delta->new_file.path ? delta->new_file.path : "";
            body = std::string("Binary files a/") + oldPath + " and b/" + newPath + " differ\n";
        }
        return body;
    }
    if (git_patch_print(patch, appendPatchLine, &body) < 0)
        throw RepositoryError("Failed to print patch: " + gitptr::lastError());
    return body;
}

std::vector<ChangedFile> GitRepository::diff(const std::string& source, const DiffTarget& target) {
    auto repo = open();
    auto sourceCommit = resolveCommit(repo.get(), source);
    auto sourceTree = commitTree(sourceCommit.get(), source);

    git_diff_options opts = GIT_DIFF_OPTIONS_INIT;
    git_diff* raw = nullptr;
    int rc = 0;
    if (target.isStaged()) {
        git_index* rawIndex = nullptr;
        if (git_repository_index(&rawIndex, repo.get()) < 0)
            throw RepositoryError("Failed to read the index: " + gitptr::lastError());
        gitptr::Index index(rawIndex);
        rc = git_diff_tree_to_index(&raw, repo.get(), sourceTree.get(), index.get(), &opts);
    } else {
        auto targetCommit = resolveCommit(repo.get(), target.rev());
        auto targetTree = commitTree(targetCommit.get(), target.rev());
        rc = git_diff_tree_to_tree(&raw, repo.get(), sourceTree.get(), targetTree.get(), &opts);
    }
    if (rc < 0) {
        throw RepositoryError("Failed to compute diff between " + source + " and " + target.describe() +
                              ": " + gitptr::lastError());
    }
    gitptr::Diff diff(raw);

    git_diff_find_options findOpts = GIT_DIFF_FIND_OPTIONS_INIT;
    findOpts.flags = GIT_DIFF_FIND_RENAMES;
    if (git_diff_find_similar(diff.get(), &findOpts) < 0)
        throw RepositoryError("Rename detection failed: " + gitptr::lastError());

    std::vector<ChangedFile> files;
    size_t count = git_diff_num_deltas(diff.get());
    files.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        const git_diff_delta* delta = git_diff_get_delta(diff.get(), i);
        git_patch* rawPatch = nullptr;
        if (git_patch_from_diff(&rawPatch, diff.get(), i) < 0)
            throw RepositoryError("Failed to build patch: " + gitptr::lastError());
        gitptr::Patch patch(rawPatch);

        ChangedFile file;
        if (delta->status != GIT_DELTA_ADDED && delta->old_file.path)
            file.oldPath = std::string(delta->old_file.path);
        if (delta->status != GIT_DELTA_DELETED && delta->new_file.path)
            file.newPath = std::string(delta->new_file.path);
        file.patchText = patchBody(patch.get(), delta);
        files.push_back(std::move(file));
    }

    Logger::getInstance().debug("diff " + source + " -> " + target.describe() + ": " +
                                std::to_string(files.size()) + " file(s)");
    return files;
}

CommitRecord GitRepository::toRecord(git_commit* commit) {
    CommitRecord rec;
    rec.id = git_oid_tostr_s(git_commit_id(commit));

    const git_signature* author = git_commit_author(commit);
    rec.author = (author && author->name) ? author->name : "";
    rec.timestamp = TextUtils::formatUtcIso8601(author ? static_cast<std::time_t>(author->when.time)
                                                       : static_cast<std::time_t>(git_commit_time(commit)));

    const char* message = git_commit_message(commit);
    rec.message = TextUtils::trim(message ? message : "");
    return rec;
}

std::vector<CommitRecord> GitRepository::log(const std::string& ancestor) {
    auto repo = open();

    git_revwalk* rawWalk = nullptr;
    if (git_revwalk_new(&rawWalk, repo.get()) < 0)
        throw RepositoryError("Failed to create revision walker: " + gitptr::lastError());
    gitptr::Revwalk walk(rawWalk);

    // default sorting: reverse chronological, same as `git rev-list`
    std::string range = ancestor + ".." + kTipRevision;
    if (git_revwalk_push_range(walk.get(), range.c_str()) < 0)
        throw InvalidRevisionRange("Invalid revision range " + range + ": " + gitptr::lastError());

    std::vector<CommitRecord> commits;
    git_oid oid;
    int rc = 0;
    while ((rc = git_revwalk_next(&oid, walk.get())) == 0) {
        git_commit* rawCommit = nullptr;
        if (git_commit_lookup(&rawCommit, repo.get(), &oid) < 0)
            throw RepositoryError("Failed to load commit " + std::string(git_oid_tostr_s(&oid)) + ": " +
                                  gitptr::lastError());
        gitptr::Commit commit(rawCommit);
        commits.push_back(toRecord(commit.get()));
    }
    if (rc != GIT_ITEROVER)
        throw InvalidRevisionRange("Failed to walk " + range + ": " + gitptr::lastError());

    return commits;
}

std::string GitRepository::resolve(const std::string& revision) {
    auto repo = open();
    auto commit = resolveCommit(repo.get(), revision);
    return git_oid_tostr_s(git_commit_id(commit.get()));
}
