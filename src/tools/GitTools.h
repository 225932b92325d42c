#pragma once
#include "ITool.h"
#include "prompts/ViewComposer.h"

class ToolRegistry;

/**
 * @brief Base for tools returning raw record arrays
 *
 * Result text is the JSON array (2-space indent); structuredContent holds the
 * same array under `key`.
 */
class GitToolBase : public ITool {
public:
    explicit GitToolBase(const ViewComposer& views) : views(views) {}

protected:
    const ViewComposer& views;

    static nlohmann::json ancestorSchema();
    static nlohmann::json wrapResult(const std::string& key, const nlohmann::ordered_json& records);
};

/**
 * @brief git_diff: changed files between ancestor and HEAD
 */
class GitDiffTool : public GitToolBase {
public:
    using GitToolBase::GitToolBase;

    std::string getName() const override { return "git_diff"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override { return ancestorSchema(); }
    nlohmann::json execute(const nlohmann::json& args) override;
};

/**
 * @brief git_cached_diff: staged changes against HEAD
 */
class GitCachedDiffTool : public GitToolBase {
public:
    using GitToolBase::GitToolBase;

    std::string getName() const override { return "git_cached_diff"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;
};

/**
 * @brief git_commit_messages: commits in ancestor..HEAD
 */
class GitCommitMessagesTool : public GitToolBase {
public:
    using GitToolBase::GitToolBase;

    std::string getName() const override { return "git_commit_messages"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override { return ancestorSchema(); }
    nlohmann::json execute(const nlohmann::json& args) override;
};

void registerGitTools(ToolRegistry& registry, const ViewComposer& views);
