#pragma once
#include <nlohmann/json.hpp>
#include "render/Renderer.h"

/**
 * JSON rendering. Key order is part of the output contract, hence
 * ordered_json. Documents are indented by 2 spaces and non-ASCII text is
 * written as raw UTF-8.
 */
class JsonRenderer : public Renderer {
public:
    OutputFormat format() const override { return OutputFormat::Json; }
    std::string formatName() const override { return "the JSON format"; }

    std::string renderChanges(const std::vector<ChangedFile>& changes) const override;
    std::string renderHistory(const std::vector<CommitRecord>& commits, const std::string& ancestor) const override;
    std::string renderComposite(const std::vector<CommitRecord>* commits, const std::string& ancestor,
                                const std::vector<ChangedFile>& changes) const override;

    // [{a_path, b_path, diff}, ...]
    static nlohmann::ordered_json changesToJson(const std::vector<ChangedFile>& changes);
    // [{hexsha, author, create_time, message}, ...]
    static nlohmann::ordered_json commitsToJson(const std::vector<CommitRecord>& commits);

    static std::string dump(const nlohmann::ordered_json& doc, int indent = 2);
};
