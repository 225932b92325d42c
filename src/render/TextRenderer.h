#pragma once
#include "render/Renderer.h"

/**
 * Plain text rendering.
 *
 * Diff entry:
 *   File: <old|New Addition> -> <new|Deleted>
 *   -------------------------------------------------- (50)
 *   <patch>
 *   ================================================== (50)
 * Entries are joined with a blank line. History blocks are separated by a
 * 10 character '-' rule.
 */
class TextRenderer : public Renderer {
public:
    static constexpr size_t kDiffRuleWidth = 50;
    static constexpr size_t kHistoryRuleWidth = 10;

    OutputFormat format() const override { return OutputFormat::Text; }
    std::string formatName() const override { return "plain text"; }

    std::string renderChanges(const std::vector<ChangedFile>& changes) const override;
    std::string renderHistory(const std::vector<CommitRecord>& commits, const std::string& ancestor) const override;
    std::string renderComposite(const std::vector<CommitRecord>* commits, const std::string& ancestor,
                                const std::vector<ChangedFile>& changes) const override;
};
