#pragma once
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "core/ConfigManager.h"

// Bad command line; main prints usage and exits with status 2.
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

struct CommandLineOptions {
    std::string repository;
    std::vector<std::string> excludes;
    std::optional<OutputFormat> format;
    std::string configPath;
    std::string logFile;
    bool verbose = false;

    // --run <prompt> [arg]
    std::string runPrompt;
    std::string runArgument;

    bool showHelp = false;
    bool showVersion = false;
};

/**
 * @brief Parse argv (argv[0] is skipped).
 * @throws UsageError
 */
CommandLineOptions parseCommandLine(const std::vector<std::string>& args);

/**
 * @brief Merge command line, config file and environment into one config.
 *
 * Precedence: command line, then --config file, then GIT_REPOSITORY /
 * GIT_EXCLUDES / GIT_OUTPUT_FORMAT, then defaults.
 * @param getenv environment lookup, returns nullopt for unset variables
 * @throws UsageError when no repository is given or a value is invalid
 */
ServerConfig resolveConfig(const CommandLineOptions& options,
                           const std::function<std::optional<std::string>(const std::string&)>& getenv);

std::string usageText(const std::string& program);
