#include "mcp/MCPServer.h"
#include "prompts/PromptRegistry.h"
#include "tools/ToolRegistry.h"
#include "core/Errors.h"
#include "utils/Logger.h"
#include "utils/TextUtils.h"
#include <stdexcept>

namespace {

struct RpcError : public std::runtime_error {
    RpcError(int code, const std::string& message) : std::runtime_error(message), code(code) {}
    int code;
};

int codeForKind(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MissingArgument:
        case ErrorKind::InvalidArgument:
            return MCPServer::kInvalidParams;
        default:
            return MCPServer::kInternalError;
    }
}

std::string requireName(const nlohmann::json& params) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        throw RpcError(MCPServer::kInvalidParams, "Missing 'name' parameter");
    }
    return params["name"].get<std::string>();
}

nlohmann::json argumentsOf(const nlohmann::json& params) {
    if (params.is_object() && params.contains("arguments") && params["arguments"].is_object()) {
        return params["arguments"];
    }
    return nlohmann::json::object();
}

} // namespace

MCPServer::MCPServer(PromptRegistry& prompts, ToolRegistry& tools,
                     const std::string& name, const std::string& version, size_t workerCount)
    : prompts(prompts), tools(tools), serverName(name), serverVersion(version),
      workerCount(workerCount == 0 ? 1 : workerCount) {}

MCPServer::~MCPServer() {
    stopWorkers();
}

nlohmann::json MCPServer::makeError(const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}}
    };
}

nlohmann::json MCPServer::makeResult(const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

nlohmann::json MCPServer::initialize(const nlohmann::json& params) {
    std::string version = kProtocolVersion;
    if (params.is_object() && params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
        version = params["protocolVersion"].get<std::string>();
    }
    if (params.is_object() && params.contains("clientInfo")) {
        Logger::getInstance().info("Client connected: " + params["clientInfo"].dump());
    }

    nlohmann::json result;
    result["protocolVersion"] = version;
    result["capabilities"]["prompts"]["listChanged"] = false;
    result["capabilities"]["tools"]["listChanged"] = false;
    result["serverInfo"]["name"] = serverName;
    result["serverInfo"]["version"] = serverVersion;
    return result;
}

nlohmann::json MCPServer::listPrompts() {
    nlohmann::json result;
    result["prompts"] = prompts.listPrompts();
    return result;
}

nlohmann::json MCPServer::getPrompt(const nlohmann::json& params) {
    std::string name = requireName(params);
    if (!prompts.hasPrompt(name)) {
        throw RpcError(kInvalidParams, "Unknown prompt: " + name);
    }
    nlohmann::json args = argumentsOf(params);
    Logger::getInstance().info("prompts/get " + name + " " + args.dump());
    return prompts.renderPrompt(name, args);
}

nlohmann::json MCPServer::listTools() {
    nlohmann::json result;
    result["tools"] = tools.listToolSchemas();
    return result;
}

nlohmann::json MCPServer::callTool(const nlohmann::json& params) {
    std::string name = requireName(params);
    if (!tools.hasTool(name)) {
        throw RpcError(kInvalidParams, "Unknown tool: " + name);
    }
    nlohmann::json args = argumentsOf(params);
    Logger::getInstance().info("tools/call " + name + " " + args.dump());
    return tools.executeTool(name, args);
}

nlohmann::json MCPServer::dispatch(const std::string& method, const nlohmann::json& params) {
    if (method == "initialize") return initialize(params);
    if (method == "ping") return nlohmann::json::object();
    if (method == "prompts/list") return listPrompts();
    if (method == "prompts/get") return getPrompt(params);
    if (method == "tools/list") return listTools();
    if (method == "tools/call") return callTool(params);
    if (method.rfind("notifications/", 0) == 0) return nullptr;
    throw RpcError(kMethodNotFound, "Method not found: " + method);
}

nlohmann::json MCPServer::handleMessage(const nlohmann::json& msg) {
    if (!msg.is_object()) {
        return makeError(nullptr, kInvalidRequest, "Request must be a JSON object");
    }

    const bool isNotification = !msg.contains("id");
    const nlohmann::json id = isNotification ? nlohmann::json(nullptr) : msg["id"];

    if (!msg.contains("method") || !msg["method"].is_string()) {
        if (isNotification) return nullptr;
        return makeError(id, kInvalidRequest, "Missing 'method'");
    }
    const std::string method = msg["method"].get<std::string>();
    const nlohmann::json params = msg.contains("params") ? msg["params"] : nlohmann::json::object();
    Logger::getInstance().debug("<- " + method);

    try {
        nlohmann::json result = dispatch(method, params);
        if (isNotification) return nullptr;
        return makeResult(id, result);
    } catch (const RpcError& e) {
        Logger::getInstance().warn(method + ": " + e.what());
        if (isNotification) return nullptr;
        return makeError(id, e.code, e.what());
    } catch (const GitPromptsError& e) {
        Logger::getInstance().error(method + ": " + e.what());
        if (isNotification) return nullptr;
        return makeError(id, codeForKind(e.kind()), e.what());
    } catch (const std::exception& e) {
        Logger::getInstance().error(method + ": " + e.what());
        if (isNotification) return nullptr;
        return makeError(id, kInternalError, e.what());
    }
}

nlohmann::json MCPServer::handleLine(const std::string& line) {
    nlohmann::json msg;
    try {
        msg = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        Logger::getInstance().warn(std::string("Unparsable request: ") + e.what());
        return makeError(nullptr, kParseError, std::string("Parse error: ") + e.what());
    }
    return handleMessage(msg);
}

void MCPServer::writeMessage(std::ostream& out, const nlohmann::json& msg) {
    std::string payload = msg.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    std::lock_guard<std::mutex> lock(outMtx);
    out << payload << "\n";
    out.flush();
}

void MCPServer::startWorkers() {
    {
        std::lock_guard<std::mutex> lock(queueMtx);
        stopping = false;
    }
    for (size_t i = 0; i < workerCount; ++i) {
        workers.emplace_back(&MCPServer::workerLoop, this);
    }
}

void MCPServer::stopWorkers() {
    {
        std::lock_guard<std::mutex> lock(queueMtx);
        stopping = true;
    }
    queueCv.notify_all();
    for (auto& t : workers) {
        if (t.joinable()) t.join();
    }
    workers.clear();
}

void MCPServer::enqueue(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(queueMtx);
        jobs.push(std::move(job));
    }
    queueCv.notify_one();
}

void MCPServer::workerLoop() {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(queueMtx);
            queueCv.wait(lock, [this] { return stopping || !jobs.empty(); });
            // drain remaining jobs before exiting
            if (jobs.empty()) return;
            job = std::move(jobs.front());
            jobs.pop();
        }
        job();
    }
}

int MCPServer::run(std::istream& in, std::ostream& out) {
    startWorkers();
    Logger::getInstance().info(serverName + " " + serverVersion + " serving on stdio");

    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (TextUtils::trim(line).empty()) continue;
        enqueue([this, line, &out] {
            nlohmann::json response = handleLine(line);
            if (!response.is_null()) writeMessage(out, response);
        });
    }

    stopWorkers();
    Logger::getInstance().info("Input closed, server stopped");
    return 0;
}
