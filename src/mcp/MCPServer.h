#pragma once
#include <string>
#include <vector>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <functional>
#include <iostream>
#include <nlohmann/json.hpp>

class PromptRegistry;
class ToolRegistry;

/**
 * @brief MCP server over stdio (newline delimited JSON-RPC 2.0).
 *
 * The reading thread parses each line and queues it; a small worker pool
 * handles the requests and writes responses under a mutex, so slow git
 * queries never block `ping` or other requests.
 */
class MCPServer {
public:
    static constexpr const char* kProtocolVersion = "2024-11-05";

    // JSON-RPC error codes
    static constexpr int kParseError = -32700;
    static constexpr int kInvalidRequest = -32600;
    static constexpr int kMethodNotFound = -32601;
    static constexpr int kInvalidParams = -32602;
    static constexpr int kInternalError = -32603;

    MCPServer(PromptRegistry& prompts, ToolRegistry& tools,
              const std::string& name, const std::string& version, size_t workerCount = 4);
    ~MCPServer();

    MCPServer(const MCPServer&) = delete;
    MCPServer& operator=(const MCPServer&) = delete;

    /**
     * @brief Serve until EOF on `in`; pending requests are finished first.
     * @return process exit code
     */
    int run(std::istream& in, std::ostream& out);

    /**
     * @brief Handle one decoded message synchronously.
     * @return the response, or null for notifications
     */
    nlohmann::json handleMessage(const nlohmann::json& msg);

    /**
     * @brief Parse and handle one line (parse errors become -32700 responses).
     */
    nlohmann::json handleLine(const std::string& line);

    static nlohmann::json makeError(const nlohmann::json& id, int code, const std::string& message);
    static nlohmann::json makeResult(const nlohmann::json& id, const nlohmann::json& result);

private:
    PromptRegistry& prompts;
    ToolRegistry& tools;
    std::string serverName;
    std::string serverVersion;
    size_t workerCount;

    std::vector<std::thread> workers;
    std::queue<std::function<void()>> jobs;
    std::mutex queueMtx;
    std::condition_variable queueCv;
    bool stopping = false;

    std::mutex outMtx;

    void startWorkers();
    void stopWorkers();
    void workerLoop();
    void enqueue(std::function<void()> job);
    void writeMessage(std::ostream& out, const nlohmann::json& msg);

    nlohmann::json dispatch(const std::string& method, const nlohmann::json& params);
    nlohmann::json initialize(const nlohmann::json& params);
    nlohmann::json listPrompts();
    nlohmann::json getPrompt(const nlohmann::json& params);
    nlohmann::json listTools();
    nlohmann::json callTool(const nlohmann::json& params);
};
