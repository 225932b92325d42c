#include "git/ChangeSetAccessor.h"
#include "utils/Logger.h"

ChangeSetAccessor::ChangeSetAccessor(IGitRepository& repo, const PathExclusion& exclusion)
    : repo(repo), exclusion(exclusion) {}

std::vector<ChangedFile> ChangeSetAccessor::getChanges(const std::string& source, const DiffTarget& target) const {
    std::vector<ChangedFile> raw = repo.diff(source, target);

    std::vector<ChangedFile> kept;
    kept.reserve(raw.size());
    for (auto& file : raw) {
        if (exclusion.excludes(file)) {
            Logger::getInstance().debug("Excluded " + file.oldPath.value_or("") + " -> " + file.newPath.value_or(""));
            continue;
        }
        kept.push_back(std::move(file));
    }
    return kept;
}

std::vector<ChangedFile> ChangeSetAccessor::getStagedChanges(const std::string& source) const {
    return getChanges(source, DiffTarget::staged());
}
