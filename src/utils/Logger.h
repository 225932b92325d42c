#pragma once
#include <string>
#include <mutex>

enum class LogLevel {
    DEBUG,
    INFO,
    SUCCESS,
    WARNING,
    ERROR
};

/**
 * Process-wide logger. Writes to a log file and to stderr; stdout is reserved
 * for the MCP transport and is never touched here.
 */
class Logger {
public:
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    // Empty path disables the file sink.
    void setLogFile(const std::string& path) {
        std::lock_guard<std::mutex> lock(mtx);
        logFilePath = path;
    }

    std::string getLogFile() {
        std::lock_guard<std::mutex> lock(mtx);
        return logFilePath;
    }

    // DEBUG lines reach stderr only when verbose; the file always gets them.
    void setVerbose(bool enabled) {
        std::lock_guard<std::mutex> lock(mtx);
        verbose = enabled;
    }

    void setConsoleEnabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mtx);
        consoleEnabled = enabled;
    }

    void log(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mtx);
        writeToFile(level, message);
        if (consoleEnabled && (level != LogLevel::DEBUG || verbose)) {
            printToConsole(level, message);
        }
    }

    // Convenience methods
    void debug(const std::string& m) { log(LogLevel::DEBUG, m); }
    void info(const std::string& m) { log(LogLevel::INFO, m); }
    void success(const std::string& m) { log(LogLevel::SUCCESS, m); }
    void warn(const std::string& m) { log(LogLevel::WARNING, m); }
    void error(const std::string& m) { log(LogLevel::ERROR, m); }

    // /tmp/git_prompts_mcp_<YYYYmmddHHMMSS>.log
    static std::string defaultLogFilePath();

private:
    Logger() = default;
    std::mutex mtx;
    std::string logFilePath;
    bool verbose = false;
    bool consoleEnabled = true;

    void writeToFile(LogLevel level, const std::string& message);
    void printToConsole(LogLevel level, const std::string& message);
};
