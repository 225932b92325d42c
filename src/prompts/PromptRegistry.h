#pragma once
#include <string>
#include <memory>
#include <map>
#include <vector>
#include <nlohmann/json.hpp>
#include "IPrompt.h"

/**
 * @brief Registered prompts, keyed by name.
 */
class PromptRegistry {
public:
    PromptRegistry() = default;
    ~PromptRegistry() = default;

    /**
     * @brief Register a prompt (ownership moves to the registry)
     *
     * A later registration with the same name replaces the earlier one.
     */
    void registerPrompt(std::unique_ptr<IPrompt> prompt);

    /**
     * @return prompt pointer, or nullptr if unknown
     */
    const IPrompt* getPrompt(const std::string& name) const;

    /**
     * @brief MCP prompts/list entries
     *
     * [{"name": ..., "description": ..., "arguments": [...]}]
     */
    std::vector<nlohmann::json> listPrompts() const;

    /**
     * @brief MCP prompts/get result
     *
     * {"description": ..., "messages": [{"role": "user", "content": {"type": "text", "text": ...}}]}
     *
     * @throws std::out_of_range for an unknown prompt
     * @throws GitPromptsError when rendering fails
     */
    nlohmann::json renderPrompt(const std::string& name, const nlohmann::json& args) const;

    size_t getPromptCount() const { return prompts.size(); }

    bool hasPrompt(const std::string& name) const;

private:
    std::map<std::string, std::unique_ptr<IPrompt>> prompts;
};
