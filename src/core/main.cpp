#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <cstdlib>
#include <nlohmann/json.hpp>
#include "core/CommandLine.h"
#include "core/ConfigManager.h"
#include "core/Errors.h"
#include "core/Version.h"
#include "git/GitRepository.h"
#include "prompts/ViewComposer.h"
#include "prompts/PromptRegistry.h"
#include "prompts/GitPrompts.h"
#include "tools/ToolRegistry.h"
#include "tools/GitTools.h"
#include "mcp/MCPServer.h"
#include "utils/Logger.h"

namespace {

std::optional<std::string> readEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value) return std::nullopt;
    return std::string(value);
}

// --run: render one prompt to stdout, the way an MCP client would see it.
int runOnce(const PromptRegistry& prompts, const std::string& name, const std::string& argument) {
    const IPrompt* prompt = prompts.getPrompt(name);
    if (!prompt) {
        std::cerr << "Error: unknown prompt '" << name << "'" << std::endl;
        return 2;
    }

    nlohmann::json args = nlohmann::json::object();
    nlohmann::json declared = prompt->getArguments();
    if (!declared.empty() && !argument.empty()) {
        args[declared[0]["name"].get<std::string>()] = argument;
    }

    try {
        std::cout << prompt->render(args) << std::endl;
    } catch (const GitPromptsError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv, argv + argc);
    const std::string program = args.empty() ? "git-prompts-mcp" : args[0];

    CommandLineOptions options;
    ServerConfig config;
    try {
        options = parseCommandLine(args);
        if (options.showHelp) {
            std::cout << usageText(program);
            return 0;
        }
        if (options.showVersion) {
            std::cout << kServerName << " " << kServerVersion << std::endl;
            return 0;
        }
        config = resolveConfig(options, readEnv);
    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << usageText(program);
        return 2;
    }

    Logger& logger = Logger::getInstance();
    logger.setLogFile(config.logFile.empty() ? Logger::defaultLogFilePath() : config.logFile);
    logger.setVerbose(config.verbose);

    std::string excludeList;
    for (const auto& pattern : config.excludes) {
        excludeList += (excludeList.empty() ? "" : ",") + pattern;
    }
    logger.info(std::string("Git Prompts MCP server version ") + kServerVersion + " is starting");
    logger.info("repository=" + config.repository + " format=" + toString(config.format) +
                " excludes=[" + excludeList + "]");

    try {
        LibGit2Session session;
        GitRepository repository(config.repository);

        ViewComposer views(repository, config);

        PromptRegistry prompts;
        registerGitPrompts(prompts, views);

        ToolRegistry tools;
        registerGitTools(tools, views);

        try {
            logger.info("HEAD is at " + repository.resolve(kTipRevision));
        } catch (const RevisionNotFound& e) {
            logger.warn(std::string("Repository has no commits yet: ") + e.what());
        }
        logger.success("Registered " + std::to_string(prompts.getPromptCount()) + " prompts and " +
                       std::to_string(tools.getToolCount()) + " tools for " + repository.path());

        if (!options.runPrompt.empty()) {
            return runOnce(prompts, options.runPrompt, options.runArgument);
        }

        // quiet on stderr while serving unless verbose; the log file keeps everything
        logger.setConsoleEnabled(config.verbose);
        MCPServer server(prompts, tools, kServerName, kServerVersion);
        return server.run(std::cin, std::cout);
    } catch (const RepositoryUnavailable& e) {
        logger.setConsoleEnabled(true);
        logger.error(e.what());
        logger.error(std::string("Git Prompts MCP server version ") + kServerVersion + " failed to start");
        return 1;
    } catch (const std::exception& e) {
        logger.setConsoleEnabled(true);
        logger.error(std::string("Fatal: ") + e.what());
        return 1;
    }
}
