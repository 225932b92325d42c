#include "render/JsonRenderer.h"

nlohmann::ordered_json JsonRenderer::changesToJson(const std::vector<ChangedFile>& changes) {
    nlohmann::ordered_json arr = nlohmann::ordered_json::array();
    for (const auto& file : changes) {
        requireUtf8(file);
        nlohmann::ordered_json item;
        item["a_path"] = oldPathLabel(file);
        item["b_path"] = newPathLabel(file);
        item["diff"] = file.patchText;
        arr.push_back(std::move(item));
    }
    return arr;
}

nlohmann::ordered_json JsonRenderer::commitsToJson(const std::vector<CommitRecord>& commits) {
    nlohmann::ordered_json arr = nlohmann::ordered_json::array();
    for (const auto& c : commits) {
        nlohmann::ordered_json item;
        item["hexsha"] = c.id;
        item["author"] = c.author;
        item["create_time"] = c.timestamp;
        item["message"] = c.message;
        arr.push_back(std::move(item));
    }
    return arr;
}

std::string JsonRenderer::dump(const nlohmann::ordered_json& doc, int indent) {
    // Patches were validated already; replace only affects legacy-encoded
    // author names or messages.
    return doc.dump(indent, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

std::string JsonRenderer::renderChanges(const std::vector<ChangedFile>& changes) const {
    return dump(changesToJson(changes));
}

std::string JsonRenderer::renderHistory(const std::vector<CommitRecord>& commits, const std::string& ancestor) const {
    if (commits.empty()) {
        // single line, "key": value spacing
        return "{\"error_message\": " + dump(nlohmann::ordered_json(noCommitsSentence(ancestor)), -1) + "}";
    }
    return dump(commitsToJson(commits));
}

std::string JsonRenderer::renderComposite(const std::vector<CommitRecord>* commits, const std::string&,
                                          const std::vector<ChangedFile>& changes) const {
    nlohmann::ordered_json doc = nlohmann::ordered_json::object();
    if (commits) {
        doc["commit_history"] = commitsToJson(*commits);
    }
    doc["diff"] = changesToJson(changes);
    return dump(doc);
}
