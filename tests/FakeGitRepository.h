#pragma once
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "git/IGitRepository.h"
#include "core/Errors.h"

// In-memory repository for view and protocol tests. Revisions not listed in
// `known` fail to resolve.
class FakeGitRepository : public IGitRepository {
public:
    std::vector<std::string> known = {"HEAD", "main", "v1"};
    std::map<std::string, std::vector<ChangedFile>> diffs;   // keyed by source revision
    std::vector<ChangedFile> staged;
    std::map<std::string, std::vector<CommitRecord>> histories;  // keyed by ancestor

    int diffCalls = 0;
    int logCalls = 0;
    std::string lastLogAncestor;

    std::vector<ChangedFile> diff(const std::string& source, const DiffTarget& target) override {
        std::lock_guard<std::mutex> lock(mtx);
        ++diffCalls;
        requireKnown(source);
        if (target.isStaged()) return staged;
        requireKnown(target.rev());
        auto it = diffs.find(source);
        return it == diffs.end() ? std::vector<ChangedFile>{} : it->second;
    }

    std::vector<CommitRecord> log(const std::string& ancestor) override {
        std::lock_guard<std::mutex> lock(mtx);
        ++logCalls;
        lastLogAncestor = ancestor;
        auto it = histories.find(ancestor);
        if (it != histories.end()) return it->second;
        if (!isKnown(ancestor)) throw InvalidRevisionRange("Invalid revision range " + ancestor + "..HEAD");
        return {};
    }

    std::string resolve(const std::string& revision) override {
        requireKnown(revision);
        return std::string(40, '0');
    }

private:
    std::mutex mtx;

    bool isKnown(const std::string& rev) const {
        for (const auto& k : known) {
            if (k == rev) return true;
        }
        return false;
    }

    void requireKnown(const std::string& rev) const {
        if (!isKnown(rev)) throw RevisionNotFound("Unknown revision '" + rev + "'");
    }
};
