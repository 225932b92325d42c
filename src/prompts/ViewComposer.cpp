#include "prompts/ViewComposer.h"
#include "core/Errors.h"
#include "utils/Logger.h"
#include <nlohmann/json.hpp>

const char* const ViewComposer::kNoStagedChangesAdvice =
    "There are no staged changes to write a commit message for. "
    "Tell the user that nothing is currently staged and ask whether they would like to "
    "stage their unstaged changes first.";

const char* const ViewComposer::kPrDescriptionInstructions =
    "\nPlease provide a detailed description of the above changes proposed by a pull request. "
    "Your description should include, but is not limited to, the following sections:\n\n"
    "- **Overview of the Changes:** A concise summary of what was modified.\n"
    "- **Key Changes:** A list of the main changes that were implemented.\n"
    "- (Only include when applicable) **New Dependencies Added:** Identify any new dependencies that have been "
    "introduced.\n";

ViewComposer::ViewComposer(IGitRepository& repo, const ServerConfig& config)
    : ViewComposer(repo, config.excludes, config.format) {}

ViewComposer::ViewComposer(IGitRepository& repo, std::vector<std::string> excludes, OutputFormat format)
    : exclusion_(std::move(excludes)),
      changes_(repo, exclusion_),
      history_(repo),
      renderer_(makeRenderer(format)) {}

template <typename Fn>
auto ViewComposer::guarded(const char* operation, const std::string& context, Fn&& fn, bool isTool) const
    -> decltype(fn()) {
    try {
        return fn();
    } catch (const PromptError&) {
        throw;
    } catch (const GitPromptsError& e) {
        PromptError wrapped(operation, context, e, isTool);
        Logger::getInstance().error(std::string(wrapped.what()) + " [" + errorKindName(e.kind()) + "]");
        throw wrapped;
    } catch (const nlohmann::json::exception& e) {
        PromptError wrapped(operation, context, RepositoryError(e.what()), isTool);
        Logger::getInstance().error(wrapped.what());
        throw wrapped;
    }
}

void ViewComposer::requireAncestor(const std::string& ancestor) {
    if (ancestor.empty()) {
        throw MissingArgument("Ancestor argument required");
    }
}

std::string ViewComposer::diffView(const std::string& ancestor) const {
    return guarded("git-diff", "ancestor: '" + ancestor + "'", [&] {
        requireAncestor(ancestor);
        auto files = changes_.getChanges(ancestor, DiffTarget::revision(kTipRevision));
        return renderer_->renderChanges(files) + "\n\nAbove is the diff results between HEAD and " + ancestor +
               " in " + renderer_->formatName() + ".\n";
    });
}

std::string ViewComposer::cachedDiffView() const {
    return guarded("git-cached-diff", "", [&] {
        auto files = changes_.getStagedChanges();
        return renderer_->renderChanges(files) + "\n\nAbove is the staged changes in " + renderer_->formatName() + ".";
    });
}

std::string ViewComposer::commitHistoryView(const std::string& ancestor) const {
    return guarded("git-commit-messages", "ancestor: '" + ancestor + "'", [&] {
        requireAncestor(ancestor);
        auto commits = history_.getHistory(ancestor);
        return renderer_->renderHistory(commits, ancestor);
    });
}

std::string ViewComposer::prDescriptionView(const std::string& ancestor) const {
    return guarded("generate-pr-desc", "ancestor: '" + ancestor + "'", [&] {
        requireAncestor(ancestor);
        auto files = changes_.getChanges(ancestor, DiffTarget::revision(kTipRevision));
        auto commits = history_.getHistory(ancestor);
        return renderer_->renderComposite(&commits, ancestor, files) +
               "\n\nAbove is the commit history and diff results between HEAD and " + ancestor + " in " +
               renderer_->formatName() + ".\n" + kPrDescriptionInstructions;
    });
}

std::string ViewComposer::commitMessageInstructions(bool withHistory) {
    std::string text = "\nPlease write a commit message for the staged changes above.";
    if (withHistory) {
        text += " Follow the conventions of the recent commit messages (subject length, tense, prefixes) "
                "where they are consistent.";
    }
    text +=
        "\n\nReturn exactly one commit message wrapped in a fenced code block:\n\n"
        "```\n<subject line>\n\n<body>\n```\n\n"
        "If you notice any issues in the staged changes, such as bugs, typos or leftover debug code, "
        "list them in a separate note after the code block. Do not put that note inside the fence.\n";
    return text;
}

std::string ViewComposer::commitMessageView(int windowSize) const {
    return guarded("generate-commit-message", "window_size: " + std::to_string(windowSize), [&] {
        if (windowSize < 0) {
            throw InvalidArgument("window_size must be a non-negative integer");
        }

        auto files = changes_.getStagedChanges();
        if (files.empty()) {
            return std::string(kNoStagedChangesAdvice);
        }

        std::string framing;
        std::string document;
        if (windowSize == 0) {
            document = renderer_->renderComposite(nullptr, "", files);
            framing = "\n\nAbove is the staged changes in " + renderer_->formatName() + ".\n";
        } else {
            std::string ancestor = HistoryAccessor::windowAncestor(windowSize);
            auto commits = history_.getHistory(ancestor);
            document = renderer_->renderComposite(&commits, ancestor, files);
            framing = "\n\nAbove is the commit history of the last " + std::to_string(windowSize) +
                      " commits and the staged changes in " + renderer_->formatName() + ".\n";
        }
        return document + framing + commitMessageInstructions(windowSize > 0);
    });
}

std::vector<ChangedFile> ViewComposer::diffRecords(const std::string& ancestor) const {
    return guarded("git_diff", "ancestor: '" + ancestor + "'", [&] {
        requireAncestor(ancestor);
        return changes_.getChanges(ancestor, DiffTarget::revision(kTipRevision));
    }, true);
}

std::vector<ChangedFile> ViewComposer::stagedRecords() const {
    return guarded("git_cached_diff", "", [&] { return changes_.getStagedChanges(); }, true);
}

std::vector<CommitRecord> ViewComposer::historyRecords(const std::string& ancestor) const {
    return guarded("git_commit_messages", "ancestor: '" + ancestor + "'", [&] {
        requireAncestor(ancestor);
        return history_.getHistory(ancestor);
    }, true);
}
