#pragma once
#include <string>
#include <vector>
#include "git/GitTypes.h"
#include "git/IGitRepository.h"
#include "git/PathExclusion.h"

/**
 * @brief Changed files between two points, filtered through the exclusion list.
 */
class ChangeSetAccessor {
public:
    ChangeSetAccessor(IGitRepository& repo, const PathExclusion& exclusion);

    /**
     * @brief Diff source -> target with full patches.
     *
     * Staged target compares source with the index (`git diff --cached`).
     * Entries whose old or new path is excluded are dropped; the order of the
     * remaining entries is the engine's.
     */
    std::vector<ChangedFile> getChanges(const std::string& source, const DiffTarget& target) const;

    // getChanges(source, staged): "none" and the staged marker are the same thing.
    std::vector<ChangedFile> getStagedChanges(const std::string& source = kTipRevision) const;

private:
    IGitRepository& repo;
    const PathExclusion& exclusion;
};
