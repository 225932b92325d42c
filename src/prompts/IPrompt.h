#pragma once
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief MCP prompt interface.
 *
 * A prompt turns its (string) arguments into one text document for the model.
 * Failures are reported by throwing GitPromptsError; the registry turns them
 * into protocol errors.
 */
class IPrompt {
public:
    virtual ~IPrompt() = default;

    /**
     * @brief Unique prompt name, e.g. "git-diff"
     */
    virtual std::string getName() const = 0;

    /**
     * @brief One line description shown to MCP clients
     */
    virtual std::string getDescription() const = 0;

    /**
     * @brief MCP argument declarations
     *
     * Format:
     * [
     *   {"name": "ancestor", "description": "...", "required": true}
     * ]
     */
    virtual nlohmann::json getArguments() const = 0;

    /**
     * @brief Render the prompt text
     * @param args argument object, values are strings as sent by the client
     */
    virtual std::string render(const nlohmann::json& args) const = 0;
};
