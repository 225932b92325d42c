#include "PromptRegistry.h"
#include "utils/Logger.h"
#include <stdexcept>

void PromptRegistry::registerPrompt(std::unique_ptr<IPrompt> prompt) {
    if (!prompt) return;

    std::string name = prompt->getName();
    if (prompts.count(name)) {
        Logger::getInstance().warn("Prompt registered twice, replacing: " + name);
    }

    prompts[name] = std::move(prompt);
}

const IPrompt* PromptRegistry::getPrompt(const std::string& name) const {
    auto it = prompts.find(name);
    if (it == prompts.end()) {
        return nullptr;
    }
    return it->second.get();
}

std::vector<nlohmann::json> PromptRegistry::listPrompts() const {
    std::vector<nlohmann::json> list;

    for (const auto& [name, prompt] : prompts) {
        nlohmann::json entry;
        entry["name"] = name;
        entry["description"] = prompt->getDescription();
        entry["arguments"] = prompt->getArguments();
        list.push_back(entry);
    }

    return list;
}

nlohmann::json PromptRegistry::renderPrompt(const std::string& name, const nlohmann::json& args) const {
    const IPrompt* prompt = getPrompt(name);
    if (!prompt) {
        throw std::out_of_range("Unknown prompt: " + name);
    }

    nlohmann::json content;
    content["type"] = "text";
    content["text"] = prompt->render(args.is_object() ? args : nlohmann::json::object());

    nlohmann::json message;
    message["role"] = "user";
    message["content"] = content;

    nlohmann::json result;
    result["description"] = prompt->getDescription();
    result["messages"] = nlohmann::json::array({message});
    return result;
}

bool PromptRegistry::hasPrompt(const std::string& name) const {
    return prompts.count(name) > 0;
}
