#include <gtest/gtest.h>
#include "mcp/MCPServer.h"
#include "prompts/PromptRegistry.h"
#include "prompts/GitPrompts.h"
#include "tools/ToolRegistry.h"
#include "tools/GitTools.h"
#include "FakeGitRepository.h"
#include <map>
#include <sstream>

namespace {

nlohmann::json request(int id, const std::string& method, const nlohmann::json& params = nlohmann::json::object()) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}

} // namespace

class MCPServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        repo.diffs["main"] = {ChangedFile{std::string("a.txt"), std::string("a.txt"), "@@ -1 +1 @@\n-x\n+y\n"}};
        registerGitPrompts(prompts, views);
        registerGitTools(tools, views);
    }

    FakeGitRepository repo;
    ViewComposer views{repo, {}, OutputFormat::Text};
    PromptRegistry prompts;
    ToolRegistry tools;
    MCPServer server{prompts, tools, "git_prompts_mcp_server", "1.0.0", 2};
};

TEST_F(MCPServerTest, InitializeAdvertisesCapabilities) {
    auto response = server.handleMessage(request(1, "initialize", {{"protocolVersion", "2024-11-05"}}));
    EXPECT_EQ(response["jsonrpc"], "2.0");
    EXPECT_EQ(response["id"], 1);
    const auto& result = response["result"];
    EXPECT_EQ(result["protocolVersion"], "2024-11-05");
    EXPECT_TRUE(result["capabilities"].contains("prompts"));
    EXPECT_TRUE(result["capabilities"].contains("tools"));
    EXPECT_EQ(result["serverInfo"]["name"], "git_prompts_mcp_server");
}

TEST_F(MCPServerTest, ListsPromptsAndTools) {
    auto promptList = server.handleMessage(request(2, "prompts/list"));
    EXPECT_EQ(promptList["result"]["prompts"].size(), 5u);

    auto toolList = server.handleMessage(request(3, "tools/list"));
    EXPECT_EQ(toolList["result"]["tools"].size(), 3u);
}

TEST_F(MCPServerTest, GetPromptRendersDocument) {
    auto response = server.handleMessage(
        request(4, "prompts/get", {{"name", "git-diff"}, {"arguments", {{"ancestor", "main"}}}}));
    ASSERT_TRUE(response.contains("result")) << response.dump();
    std::string text = response["result"]["messages"][0]["content"]["text"].get<std::string>();
    EXPECT_NE(text.find("Above is the diff results between HEAD and main in plain text."), std::string::npos);
}

TEST_F(MCPServerTest, PromptFailuresMapToErrorCodes) {
    auto missing = server.handleMessage(request(5, "prompts/get", {{"name", "git-diff"}}));
    EXPECT_EQ(missing["error"]["code"], MCPServer::kInvalidParams);

    auto badRevision = server.handleMessage(
        request(6, "prompts/get", {{"name", "git-diff"}, {"arguments", {{"ancestor", "nope"}}}}));
    EXPECT_EQ(badRevision["error"]["code"], MCPServer::kInternalError);
    std::string message = badRevision["error"]["message"].get<std::string>();
    EXPECT_NE(message.find("git-diff"), std::string::npos);

    auto unknown = server.handleMessage(request(7, "prompts/get", {{"name", "no-such-prompt"}}));
    EXPECT_EQ(unknown["error"]["code"], MCPServer::kInvalidParams);
}

TEST_F(MCPServerTest, ToolCallReturnsStructuredContent) {
    auto response = server.handleMessage(
        request(8, "tools/call", {{"name", "git_diff"}, {"arguments", {{"ancestor", "main"}}}}));
    ASSERT_TRUE(response.contains("result"));
    EXPECT_EQ(response["result"]["structuredContent"]["changes"].size(), 1u);

    auto failed = server.handleMessage(request(9, "tools/call", {{"name", "git_diff"}}));
    ASSERT_TRUE(failed.contains("result"));
    EXPECT_EQ(failed["result"]["isError"], true);
}

TEST_F(MCPServerTest, ProtocolErrors) {
    auto unknownMethod = server.handleMessage(request(10, "resources/list"));
    EXPECT_EQ(unknownMethod["error"]["code"], MCPServer::kMethodNotFound);

    auto parseError = server.handleLine("{ this is not json");
    EXPECT_EQ(parseError["error"]["code"], MCPServer::kParseError);
    EXPECT_TRUE(parseError["id"].is_null());

    auto notObject = server.handleMessage(nlohmann::json::array({1, 2}));
    EXPECT_EQ(notObject["error"]["code"], MCPServer::kInvalidRequest);

    nlohmann::json noMethod = {{"jsonrpc", "2.0"}, {"id", 11}};
    EXPECT_EQ(server.handleMessage(noMethod)["error"]["code"], MCPServer::kInvalidRequest);
}

TEST_F(MCPServerTest, NotificationsGetNoResponse) {
    nlohmann::json initialized = {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}};
    EXPECT_TRUE(server.handleMessage(initialized).is_null());

    nlohmann::json unknownNotification = {{"jsonrpc", "2.0"}, {"method", "does/not/exist"}};
    EXPECT_TRUE(server.handleMessage(unknownNotification).is_null());
}

TEST_F(MCPServerTest, RunAnswersEveryRequestOnce) {
    std::stringstream in;
    in << request(1, "initialize").dump() << "\n";
    in << nlohmann::json({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}).dump() << "\n";
    in << "\n";
    in << request(2, "ping").dump() << "\r\n";
    in << request(3, "prompts/get", {{"name", "git-diff"}, {"arguments", {{"ancestor", "main"}}}}).dump() << "\n";
    in << request(4, "tools/call", {{"name", "git_cached_diff"}}).dump() << "\n";

    std::stringstream out;
    EXPECT_EQ(server.run(in, out), 0);

    std::map<int, nlohmann::json> responses;
    std::string line;
    while (std::getline(out, line)) {
        auto msg = nlohmann::json::parse(line);
        int id = msg["id"].get<int>();
        EXPECT_EQ(responses.count(id), 0u) << "duplicate response for id " << id;
        responses[id] = msg;
    }

    ASSERT_EQ(responses.size(), 4u);
    EXPECT_TRUE(responses[1].contains("result"));
    EXPECT_TRUE(responses[2]["result"].empty());
    EXPECT_TRUE(responses[3].contains("result"));
    EXPECT_TRUE(responses[4].contains("result"));
}

TEST(MCPServerStaticTest, EnvelopeShapes) {
    auto err = MCPServer::makeError(7, MCPServer::kInternalError, "boom");
    EXPECT_EQ(err["jsonrpc"], "2.0");
    EXPECT_EQ(err["id"], 7);
    EXPECT_EQ(err["error"]["message"], "boom");
    EXPECT_FALSE(err.contains("result"));

    auto ok = MCPServer::makeResult("abc", {{"x", 1}});
    EXPECT_EQ(ok["id"], "abc");
    EXPECT_EQ(ok["result"]["x"], 1);
}
