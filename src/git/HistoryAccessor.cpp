#include "git/HistoryAccessor.h"
#include "core/Errors.h"

HistoryAccessor::HistoryAccessor(IGitRepository& repo) : repo(repo) {}

std::vector<CommitRecord> HistoryAccessor::getHistory(const std::string& ancestor) const {
    try {
        return repo.log(ancestor);
    } catch (const RevisionNotFound& e) {
        throw InvalidRevisionRange(e.what());
    }
}

std::string HistoryAccessor::windowAncestor(int windowSize) {
    return std::string(kTipRevision) + "~" + std::to_string(windowSize);
}
