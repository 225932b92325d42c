#include "core/CommandLine.h"

namespace {

std::string takeValue(const std::vector<std::string>& args, size_t& i, const std::string& flag) {
    if (i + 1 >= args.size()) {
        throw UsageError("Option " + flag + " requires a value");
    }
    return args[++i];
}

OutputFormat formatOrThrow(const std::string& value) {
    try {
        return parseOutputFormat(value);
    } catch (const std::invalid_argument& e) {
        throw UsageError(e.what());
    }
}

} // namespace

CommandLineOptions parseCommandLine(const std::vector<std::string>& args) {
    CommandLineOptions opts;
    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            opts.showHelp = true;
        } else if (arg == "--version") {
            opts.showVersion = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--excludes" || arg == "-e") {
            for (auto& item : splitExcludes(takeValue(args, i, arg))) {
                opts.excludes.push_back(item);
            }
        } else if (arg == "--format" || arg == "-f") {
            opts.format = formatOrThrow(takeValue(args, i, arg));
        } else if (arg == "--config" || arg == "-c") {
            opts.configPath = takeValue(args, i, arg);
        } else if (arg == "--log-file") {
            opts.logFile = takeValue(args, i, arg);
        } else if (arg == "--run") {
            opts.runPrompt = takeValue(args, i, arg);
            // optional positional argument for the prompt
            if (i + 1 < args.size() && args[i + 1].rfind("-", 0) != 0) {
                opts.runArgument = args[++i];
            }
        } else if (arg.rfind("--", 0) == 0 && arg.find('=') != std::string::npos) {
            // --flag=value form
            size_t eq = arg.find('=');
            std::vector<std::string> split = {args[0], arg.substr(0, eq), arg.substr(eq + 1)};
            CommandLineOptions part = parseCommandLine(split);
            if (!part.excludes.empty()) opts.excludes.insert(opts.excludes.end(), part.excludes.begin(), part.excludes.end());
            if (part.format) opts.format = part.format;
            if (!part.configPath.empty()) opts.configPath = part.configPath;
            if (!part.logFile.empty()) opts.logFile = part.logFile;
            if (!part.runPrompt.empty()) opts.runPrompt = part.runPrompt;
        } else if (!arg.empty() && arg[0] == '-') {
            throw UsageError("Unknown option: " + arg);
        } else if (opts.repository.empty()) {
            opts.repository = arg;
        } else {
            throw UsageError("Unexpected argument: " + arg);
        }
    }
    return opts;
}

ServerConfig resolveConfig(const CommandLineOptions& options,
                           const std::function<std::optional<std::string>(const std::string&)>& getenv) {
    ServerConfig cfg;
    bool formatSet = false;
    bool excludesSet = false;

    if (!options.configPath.empty()) {
        try {
            nlohmann::json j = ServerConfig::readFile(options.configPath);
            cfg = ServerConfig::fromJson(j);
            formatSet = j.contains("format");
            excludesSet = j.contains("excludes");
        } catch (const std::exception& e) {
            throw UsageError(e.what());
        }
    }

    if (!options.repository.empty()) cfg.repository = options.repository;
    if (!options.excludes.empty()) {
        cfg.excludes = options.excludes;
        excludesSet = true;
    }
    if (options.format) {
        cfg.format = *options.format;
        formatSet = true;
    }
    if (!options.logFile.empty()) cfg.logFile = options.logFile;
    if (options.verbose) cfg.verbose = true;

    if (cfg.repository.empty()) {
        if (auto env = getenv("GIT_REPOSITORY")) cfg.repository = *env;
    }
    if (!excludesSet) {
        if (auto env = getenv("GIT_EXCLUDES")) cfg.excludes = splitExcludes(*env);
    }
    if (!formatSet) {
        if (auto env = getenv("GIT_OUTPUT_FORMAT")) cfg.format = formatOrThrow(*env);
    }

    if (cfg.repository.empty()) {
        throw UsageError("Missing argument 'REPOSITORY'");
    }
    return cfg;
}

std::string usageText(const std::string& program) {
    return "Usage: " + program + " <repository> [options]\n"
           "\n"
           "Serve git diff and commit history prompts over MCP (stdio).\n"
           "\n"
           "Options:\n"
           "  -e, --excludes PATTERNS  Comma separated glob patterns to leave out of diffs (repeatable)\n"
           "  -f, --format text|json   Output format of rendered documents (default: text)\n"
           "  -c, --config FILE        JSON config file (repository, excludes, format, log_file, verbose)\n"
           "      --log-file FILE      Log file (default: /tmp/git_prompts_mcp_<timestamp>.log)\n"
           "  -v, --verbose            Also print debug messages to stderr\n"
           "      --run PROMPT [ARG]   Render one prompt to stdout and exit\n"
           "      --version            Print version and exit\n"
           "  -h, --help               Show this help\n"
           "\n"
           "Prompts: git-diff <ancestor>, git-cached-diff, git-commit-messages <ancestor>,\n"
           "         generate-pr-desc <ancestor>, generate-commit-message [window_size]\n";
}
