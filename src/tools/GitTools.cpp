#include "GitTools.h"
#include "ToolRegistry.h"
#include "prompts/GitPrompts.h"
#include "render/JsonRenderer.h"

nlohmann::json GitToolBase::ancestorSchema() {
    nlohmann::json ancestor;
    ancestor["type"] = "string";
    ancestor["description"] = "The ancestor commit hash or branch name";

    nlohmann::json schema;
    schema["type"] = "object";
    schema["properties"]["ancestor"] = ancestor;
    schema["required"] = nlohmann::json::array({"ancestor"});
    return schema;
}

nlohmann::json GitToolBase::wrapResult(const std::string& key, const nlohmann::ordered_json& records) {
    nlohmann::json item;
    item["type"] = "text";
    item["text"] = JsonRenderer::dump(records);

    nlohmann::json result;
    result["content"] = nlohmann::json::array({item});
    result["structuredContent"][key] = nlohmann::json::parse(JsonRenderer::dump(records, -1));
    return result;
}

std::string GitDiffTool::getDescription() const {
    return "List the changed files between the ancestor branch or commit and HEAD, with their patches";
}

nlohmann::json GitDiffTool::execute(const nlohmann::json& args) {
    auto files = views.diffRecords(PromptArgs::getString(args, "ancestor"));
    return wrapResult("changes", JsonRenderer::changesToJson(files));
}

std::string GitCachedDiffTool::getDescription() const {
    return "List the files staged in the index relative to HEAD, with their patches";
}

nlohmann::json GitCachedDiffTool::getSchema() const {
    nlohmann::json schema;
    schema["type"] = "object";
    schema["properties"] = nlohmann::json::object();
    return schema;
}

nlohmann::json GitCachedDiffTool::execute(const nlohmann::json&) {
    auto files = views.stagedRecords();
    return wrapResult("changes", JsonRenderer::changesToJson(files));
}

std::string GitCommitMessagesTool::getDescription() const {
    return "List the commits between the ancestor branch or commit and HEAD, newest first";
}

nlohmann::json GitCommitMessagesTool::execute(const nlohmann::json& args) {
    auto commits = views.historyRecords(PromptArgs::getString(args, "ancestor"));
    return wrapResult("commits", JsonRenderer::commitsToJson(commits));
}

void registerGitTools(ToolRegistry& registry, const ViewComposer& views) {
    registry.registerTool(std::make_unique<GitDiffTool>(views));
    registry.registerTool(std::make_unique<GitCachedDiffTool>(views));
    registry.registerTool(std::make_unique<GitCommitMessagesTool>(views));
}
