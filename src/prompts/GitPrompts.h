#pragma once
#include "IPrompt.h"
#include "ViewComposer.h"

class PromptRegistry;

namespace PromptArgs {
    /**
     * @brief String argument, "" when missing or null
     */
    std::string getString(const nlohmann::json& args, const std::string& key);

    /**
     * @brief Non-negative integer argument given as number or decimal string
     * @throws InvalidArgument for anything else
     */
    int getWindowSize(const nlohmann::json& args, const std::string& key, int defaultValue);
}

/**
 * @brief Base for prompts backed by the ViewComposer
 */
class GitPromptBase : public IPrompt {
public:
    explicit GitPromptBase(const ViewComposer& views) : views(views) {}

protected:
    const ViewComposer& views;

    static nlohmann::json ancestorArgument();
};

class GitDiffPrompt : public GitPromptBase {
public:
    using GitPromptBase::GitPromptBase;

    std::string getName() const override { return "git-diff"; }
    std::string getDescription() const override;
    nlohmann::json getArguments() const override { return nlohmann::json::array({ancestorArgument()}); }
    std::string render(const nlohmann::json& args) const override;
};

class GitCachedDiffPrompt : public GitPromptBase {
public:
    using GitPromptBase::GitPromptBase;

    std::string getName() const override { return "git-cached-diff"; }
    std::string getDescription() const override;
    nlohmann::json getArguments() const override { return nlohmann::json::array(); }
    std::string render(const nlohmann::json& args) const override;
};

class GitCommitMessagesPrompt : public GitPromptBase {
public:
    using GitPromptBase::GitPromptBase;

    std::string getName() const override { return "git-commit-messages"; }
    std::string getDescription() const override;
    nlohmann::json getArguments() const override { return nlohmann::json::array({ancestorArgument()}); }
    std::string render(const nlohmann::json& args) const override;
};

class GeneratePrDescPrompt : public GitPromptBase {
public:
    using GitPromptBase::GitPromptBase;

    std::string getName() const override { return "generate-pr-desc"; }
    std::string getDescription() const override;
    nlohmann::json getArguments() const override { return nlohmann::json::array({ancestorArgument()}); }
    std::string render(const nlohmann::json& args) const override;
};

/**
 * @brief Commit message draft for the staged changes
 *
 * window_size (optional, default 5): number of recent commits shown as style
 * reference, 0 to leave history out.
 */
class GenerateCommitMessagePrompt : public GitPromptBase {
public:
    using GitPromptBase::GitPromptBase;

    std::string getName() const override { return "generate-commit-message"; }
    std::string getDescription() const override;
    nlohmann::json getArguments() const override;
    std::string render(const nlohmann::json& args) const override;
};

void registerGitPrompts(PromptRegistry& registry, const ViewComposer& views);
