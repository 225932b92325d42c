#include "ToolRegistry.h"
#include "utils/Logger.h"
#include <stdexcept>

void ToolRegistry::registerTool(std::unique_ptr<ITool> tool) {
    if (!tool) return;

    std::string name = tool->getName();
    if (tools.count(name)) {
        Logger::getInstance().warn("Tool registered twice, replacing: " + name);
    }

    tools[name] = std::move(tool);
}

ITool* ToolRegistry::getTool(const std::string& name) {
    auto it = tools.find(name);
    if (it == tools.end()) {
        return nullptr;
    }
    return it->second.get();
}

std::vector<nlohmann::json> ToolRegistry::listToolSchemas() const {
    std::vector<nlohmann::json> schemas;

    for (const auto& [name, tool] : tools) {
        nlohmann::json schema;
        schema["name"] = name;
        schema["description"] = tool->getDescription();
        schema["inputSchema"] = tool->getSchema();
        schemas.push_back(schema);
    }

    return schemas;
}

nlohmann::json ToolRegistry::executeTool(const std::string& name, const nlohmann::json& args) {
    ITool* tool = getTool(name);
    if (!tool) {
        throw std::out_of_range("Unknown tool: " + name);
    }

    try {
        return tool->execute(args.is_object() ? args : nlohmann::json::object());
    } catch (const std::exception& e) {
        Logger::getInstance().error(std::string("Tool ") + name + " failed: " + e.what());
        nlohmann::json item;
        item["type"] = "text";
        item["text"] = e.what();

        nlohmann::json error;
        error["isError"] = true;
        error["content"] = nlohmann::json::array({item});
        return error;
    }
}

bool ToolRegistry::hasTool(const std::string& name) const {
    return tools.count(name) > 0;
}
