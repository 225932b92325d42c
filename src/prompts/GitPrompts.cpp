#include "GitPrompts.h"
#include "PromptRegistry.h"
#include "core/Errors.h"
#include <cctype>

namespace PromptArgs {
    std::string getString(const nlohmann::json& args, const std::string& key) {
        if (!args.is_object() || !args.contains(key) || args[key].is_null()) return "";
        const auto& v = args[key];
        if (v.is_string()) return v.get<std::string>();
        return v.dump();
    }

    int getWindowSize(const nlohmann::json& args, const std::string& key, int defaultValue) {
        if (!args.is_object() || !args.contains(key) || args[key].is_null()) return defaultValue;
        const auto& v = args[key];
        if (v.is_number_integer()) {
            long long n = v.get<long long>();
            if (n < 0 || n > 1000000) throw InvalidArgument(key + " must be a non-negative integer");
            return static_cast<int>(n);
        }
        if (v.is_string()) {
            std::string s = v.get<std::string>();
            if (s.empty()) return defaultValue;
            if (s.size() > 7) throw InvalidArgument(key + " is too large: " + s);
            for (char c : s) {
                if (!std::isdigit(static_cast<unsigned char>(c))) {
                    throw InvalidArgument(key + " must be a non-negative integer, got '" + s + "'");
                }
            }
            return std::stoi(s);
        }
        throw InvalidArgument(key + " must be a non-negative integer");
    }
}

nlohmann::json GitPromptBase::ancestorArgument() {
    return {
        {"name", "ancestor"},
        {"description", "The ancestor commit hash or branch name"},
        {"required", true}
    };
}

std::string GitDiffPrompt::getDescription() const {
    return "Generate a diff between the HEAD and the ancestor branch or commit";
}

std::string GitDiffPrompt::render(const nlohmann::json& args) const {
    return views.diffView(PromptArgs::getString(args, "ancestor"));
}

std::string GitCachedDiffPrompt::getDescription() const {
    return "Generate a diff between the files in the staging area (the index) and the HEAD";
}

std::string GitCachedDiffPrompt::render(const nlohmann::json&) const {
    return views.cachedDiffView();
}

std::string GitCommitMessagesPrompt::getDescription() const {
    return "Get commit messages between the ancestor and HEAD";
}

std::string GitCommitMessagesPrompt::render(const nlohmann::json& args) const {
    return views.commitHistoryView(PromptArgs::getString(args, "ancestor"));
}

std::string GeneratePrDescPrompt::getDescription() const {
    return "Generate PR Description based on the diff between the HEAD and the ancestor branch or commit";
}

std::string GeneratePrDescPrompt::render(const nlohmann::json& args) const {
    return views.prDescriptionView(PromptArgs::getString(args, "ancestor"));
}

std::string GenerateCommitMessagePrompt::getDescription() const {
    return "Generate a commit message for the staged changes, using recent commit messages as style reference";
}

nlohmann::json GenerateCommitMessagePrompt::getArguments() const {
    nlohmann::json windowSize;
    windowSize["name"] = "window_size";
    windowSize["description"] = "Number of recent commits to include as reference (default 5, 0 for none)";
    windowSize["required"] = false;
    return nlohmann::json::array({windowSize});
}

std::string GenerateCommitMessagePrompt::render(const nlohmann::json& args) const {
    int windowSize = ViewComposer::kDefaultWindowSize;
    try {
        windowSize = PromptArgs::getWindowSize(args, "window_size", ViewComposer::kDefaultWindowSize);
    } catch (const GitPromptsError& e) {
        throw PromptError(getName(), "window_size: " + PromptArgs::getString(args, "window_size"), e);
    }
    return views.commitMessageView(windowSize);
}

void registerGitPrompts(PromptRegistry& registry, const ViewComposer& views) {
    registry.registerPrompt(std::make_unique<GitDiffPrompt>(views));
    registry.registerPrompt(std::make_unique<GitCachedDiffPrompt>(views));
    registry.registerPrompt(std::make_unique<GitCommitMessagesPrompt>(views));
    registry.registerPrompt(std::make_unique<GeneratePrDescPrompt>(views));
    registry.registerPrompt(std::make_unique<GenerateCommitMessagePrompt>(views));
}
