#pragma once
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief MCP tool interface.
 *
 * Tools return raw records without framing text; turning them into prose is
 * the prompts' job.
 */
class ITool {
public:
    virtual ~ITool() = default;

    /**
     * @brief Unique tool name
     */
    virtual std::string getName() const = 0;

    /**
     * @brief Short description shown to the model
     */
    virtual std::string getDescription() const = 0;

    /**
     * @brief JSON Schema of the arguments object
     */
    virtual nlohmann::json getSchema() const = 0;

    /**
     * @brief Execute the tool
     * @param args arguments (JSON object)
     * @return MCP tool result
     *
     * Format:
     * {
     *   "content": [
     *     {"type": "text", "text": "..."}
     *   ],
     *   "structuredContent": {...}
     * }
     *
     * Failures are thrown; ToolRegistry turns them into
     * {"isError": true, "content": [...]}.
     */
    virtual nlohmann::json execute(const nlohmann::json& args) = 0;
};
