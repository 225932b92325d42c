#pragma once
#include <string>
#include <vector>
#include "git/GitTypes.h"
#include "git/IGitRepository.h"

class HistoryAccessor {
public:
    explicit HistoryAccessor(IGitRepository& repo);

    /**
     * @brief Commits reachable from HEAD but not from ancestor, newest first.
     *
     * Empty when HEAD is ancestor or behind it.
     * @throws InvalidRevisionRange when ancestor does not resolve
     */
    std::vector<CommitRecord> getHistory(const std::string& ancestor) const;

    // "HEAD~N"
    static std::string windowAncestor(int windowSize);

private:
    IGitRepository& repo;
};
