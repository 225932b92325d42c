#pragma once
#include <string>
#include <vector>
#include "git/GitTypes.h"

/**
 * @brief Query interface over one local git repository.
 *
 * Implementations must be safe to call from several request threads at once.
 * All methods are read-only.
 */
class IGitRepository {
public:
    virtual ~IGitRepository() = default;

    /**
     * @brief Full-patch diff from source to target, unfiltered.
     * @throws RevisionNotFound when source or target does not resolve
     * @throws RepositoryError on any other engine failure
     */
    virtual std::vector<ChangedFile> diff(const std::string& source, const DiffTarget& target) = 0;

    /**
     * @brief Commits in ancestor..HEAD, in the engine's walk order.
     * @throws InvalidRevisionRange when the range cannot be walked
     */
    virtual std::vector<CommitRecord> log(const std::string& ancestor) = 0;

    /**
     * @brief Resolve a revision to its full commit id.
     * @throws RevisionNotFound
     */
    virtual std::string resolve(const std::string& revision) = 0;
};
