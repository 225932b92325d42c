#pragma once
#include <memory>
#include <string>
#include <vector>
#include "core/ConfigManager.h"
#include "git/ChangeSetAccessor.h"
#include "git/HistoryAccessor.h"
#include "git/PathExclusion.h"
#include "render/Renderer.h"

/**
 * @brief The user-facing operations.
 *
 * Each view validates its arguments, queries the accessors, renders through
 * the configured Renderer and adds the framing text. Every failure leaves as
 * a PromptError naming the operation. Holds no per-request state, so one
 * instance serves all request threads.
 */
class ViewComposer {
public:
    static constexpr int kDefaultWindowSize = 5;

    ViewComposer(IGitRepository& repo, const ServerConfig& config);
    ViewComposer(IGitRepository& repo, std::vector<std::string> excludes, OutputFormat format);

    const Renderer& renderer() const { return *renderer_; }

    // git-diff
    std::string diffView(const std::string& ancestor) const;
    // git-cached-diff
    std::string cachedDiffView() const;
    // git-commit-messages
    std::string commitHistoryView(const std::string& ancestor) const;
    // generate-pr-desc
    std::string prDescriptionView(const std::string& ancestor) const;
    // generate-commit-message
    std::string commitMessageView(int windowSize = kDefaultWindowSize) const;

    // Record level projections for the tools; same validation and wrapping.
    std::vector<ChangedFile> diffRecords(const std::string& ancestor) const;
    std::vector<ChangedFile> stagedRecords() const;
    std::vector<CommitRecord> historyRecords(const std::string& ancestor) const;

    static const char* const kNoStagedChangesAdvice;
    static const char* const kPrDescriptionInstructions;

private:
    PathExclusion exclusion_;
    ChangeSetAccessor changes_;
    HistoryAccessor history_;
    std::unique_ptr<Renderer> renderer_;

    static void requireAncestor(const std::string& ancestor);
    static std::string commitMessageInstructions(bool withHistory);

    template <typename Fn>
    auto guarded(const char* operation, const std::string& context, Fn&& fn, bool isTool = false) const
        -> decltype(fn());
};
