#pragma once
#include <string>
#include <memory>
#include <map>
#include <vector>
#include <nlohmann/json.hpp>
#include "ITool.h"

/**
 * @brief Registered tools, keyed by name.
 */
class ToolRegistry {
public:
    ToolRegistry() = default;
    ~ToolRegistry() = default;

    /**
     * @brief Register a tool (ownership moves to the registry)
     */
    void registerTool(std::unique_ptr<ITool> tool);

    /**
     * @return tool pointer, or nullptr if unknown
     */
    ITool* getTool(const std::string& name);

    /**
     * @brief MCP tools/list entries
     *
     * [{"name": ..., "description": ..., "inputSchema": { JSON Schema }}]
     */
    std::vector<nlohmann::json> listToolSchemas() const;

    /**
     * @brief Execute a tool
     *
     * Unknown tools throw std::out_of_range. Failures inside the tool come
     * back as an MCP error result:
     * {"isError": true, "content": [{"type": "text", "text": "..."}]}
     */
    nlohmann::json executeTool(const std::string& name, const nlohmann::json& args);

    size_t getToolCount() const { return tools.size(); }

    bool hasTool(const std::string& name) const;

private:
    std::map<std::string, std::unique_ptr<ITool>> tools;
};
