#include "render/TextRenderer.h"
#include "utils/TextUtils.h"

std::string TextRenderer::renderChanges(const std::vector<ChangedFile>& changes) const {
    std::string out;
    for (size_t i = 0; i < changes.size(); ++i) {
        const ChangedFile& file = changes[i];
        requireUtf8(file);
        if (i > 0) out += "\n";
        out += "File: " + oldPathLabel(file) + " -> " + newPathLabel(file) + "\n";
        out += TextUtils::rule('-', kDiffRuleWidth) + "\n";
        out += file.patchText;
        out += TextUtils::rule('=', kDiffRuleWidth) + "\n";
    }
    return out;
}

std::string TextRenderer::renderHistory(const std::vector<CommitRecord>& commits, const std::string& ancestor) const {
    if (commits.empty()) {
        return noCommitsSentence(ancestor);
    }

    const std::string separator = "\n\n" + TextUtils::rule('-', kHistoryRuleWidth) + "\n\n";
    std::string out = "Commit messages between " + ancestor + " and HEAD:\n" +
                      TextUtils::rule('-', kHistoryRuleWidth) + "\n\n";
    for (size_t i = 0; i < commits.size(); ++i) {
        const CommitRecord& c = commits[i];
        if (i > 0) out += separator;
        out += c.id + " by " + c.author + " at " + c.timestamp + "\n\n" + c.message;
    }
    return out;
}

std::string TextRenderer::renderComposite(const std::vector<CommitRecord>* commits, const std::string& ancestor,
                                          const std::vector<ChangedFile>& changes) const {
    std::string diff = renderChanges(changes);
    if (!commits) {
        return diff;
    }
    return renderHistory(*commits, ancestor) + "\n\n" + diff;
}
