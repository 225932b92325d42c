#include <gtest/gtest.h>
#include "prompts/PromptRegistry.h"
#include "prompts/GitPrompts.h"
#include "core/Errors.h"
#include "FakeGitRepository.h"

class PromptRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        repo.staged = {ChangedFile{std::string("a.txt"), std::string("a.txt"), "@@ -1 +1 @@\n-x\n+y\n"}};
        repo.diffs["main"] = repo.staged;
        registerGitPrompts(registry, views);
    }

    FakeGitRepository repo;
    ViewComposer views{repo, {}, OutputFormat::Text};
    PromptRegistry registry;
};

TEST_F(PromptRegistryTest, ListsAllPrompts) {
    EXPECT_EQ(registry.getPromptCount(), 5u);
    for (const char* name : {"git-diff", "git-cached-diff", "git-commit-messages", "generate-pr-desc",
                             "generate-commit-message"}) {
        EXPECT_TRUE(registry.hasPrompt(name)) << name;
    }

    for (const auto& entry : registry.listPrompts()) {
        EXPECT_TRUE(entry.contains("name"));
        EXPECT_TRUE(entry["description"].is_string());
        EXPECT_TRUE(entry["arguments"].is_array());
        if (entry["name"] == "git-diff") {
            ASSERT_EQ(entry["arguments"].size(), 1u);
            EXPECT_EQ(entry["arguments"][0]["name"], "ancestor");
            EXPECT_EQ(entry["arguments"][0]["required"], true);
        }
        if (entry["name"] == "git-cached-diff") {
            EXPECT_TRUE(entry["arguments"].empty());
        }
    }
}

TEST_F(PromptRegistryTest, RenderWrapsTextInUserMessage) {
    auto result = registry.renderPrompt("git-diff", {{"ancestor", "main"}});
    EXPECT_EQ(result["description"], registry.getPrompt("git-diff")->getDescription());
    ASSERT_EQ(result["messages"].size(), 1u);
    EXPECT_EQ(result["messages"][0]["role"], "user");
    EXPECT_EQ(result["messages"][0]["content"]["type"], "text");
    std::string text = result["messages"][0]["content"]["text"].get<std::string>();
    EXPECT_EQ(text.rfind("File: a.txt -> a.txt", 0), 0u);
}

TEST_F(PromptRegistryTest, UnknownPromptThrows) {
    EXPECT_EQ(registry.getPrompt("nope"), nullptr);
    EXPECT_THROW(registry.renderPrompt("nope", nlohmann::json::object()), std::out_of_range);
}

TEST_F(PromptRegistryTest, MissingAncestorPropagates) {
    try {
        registry.renderPrompt("git-commit-messages", nlohmann::json::object());
        FAIL() << "expected PromptError";
    } catch (const PromptError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MissingArgument);
    }
}

TEST_F(PromptRegistryTest, WindowSizeAcceptsStringsAndNumbers) {
    registry.renderPrompt("generate-commit-message", {{"window_size", "0"}});
    EXPECT_EQ(repo.logCalls, 0);

    registry.renderPrompt("generate-commit-message", {{"window_size", 0}});
    EXPECT_EQ(repo.logCalls, 0);

    // default window of 5 is beyond the fake history
    EXPECT_THROW(registry.renderPrompt("generate-commit-message", nlohmann::json::object()), PromptError);
    EXPECT_EQ(repo.lastLogAncestor, "HEAD~5");
}

TEST_F(PromptRegistryTest, WindowSizeRejectsGarbage) {
    for (const nlohmann::json& bad : {nlohmann::json("abc"), nlohmann::json("-3"), nlohmann::json(-3),
                                      nlohmann::json(1.5)}) {
        try {
            registry.renderPrompt("generate-commit-message", {{"window_size", bad}});
            FAIL() << "expected PromptError for " << bad.dump();
        } catch (const PromptError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::InvalidArgument) << bad.dump();
        }
    }
    EXPECT_EQ(repo.diffCalls, 0);
}

TEST(PromptArgsTest, GetString) {
    nlohmann::json args = {{"ancestor", "main"}, {"n", 3}, {"empty", nullptr}};
    EXPECT_EQ(PromptArgs::getString(args, "ancestor"), "main");
    EXPECT_EQ(PromptArgs::getString(args, "n"), "3");
    EXPECT_EQ(PromptArgs::getString(args, "empty"), "");
    EXPECT_EQ(PromptArgs::getString(args, "missing"), "");
}
