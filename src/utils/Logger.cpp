#include "utils/Logger.h"
#include <iostream>
#include <fstream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <filesystem>
#ifndef _WIN32
#include <unistd.h>
#else
#include <io.h>
#endif

// ANSI Color Codes
namespace {
    const std::string RESET = "\033[0m";
    const std::string BOLD = "\033[1m";
    const std::string RED = "\033[38;5;196m";
    const std::string GREEN = "\033[38;5;46m";
    const std::string YELLOW = "\033[38;5;226m";
    const std::string CYAN = "\033[38;5;51m";
    const std::string GRAY = "\033[38;5;242m";

    const char* levelName(LogLevel level) {
        switch (level) {
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::WARNING: return "WARNING";
            case LogLevel::INFO: return "INFO";
            case LogLevel::SUCCESS: return "INFO";
            default: return "DEBUG";
        }
    }

    bool stderrIsTty() {
#ifdef _WIN32
        return _isatty(_fileno(stderr)) != 0;
#else
        return isatty(STDERR_FILENO) != 0;
#endif
    }

    std::tm localNow() {
        auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm{};
#ifdef _WIN32
        localtime_s(&tm, &now);
#else
        localtime_r(&now, &tm);
#endif
        return tm;
    }
}

std::string Logger::defaultLogFilePath() {
    std::tm tm = localNow();
    std::ostringstream name;
    name << "git_prompts_mcp_" << std::put_time(&tm, "%Y%m%d%H%M%S") << ".log";
    std::error_code ec;
    std::filesystem::path dir = std::filesystem::temp_directory_path(ec);
    if (ec) dir = "/tmp";
    return (dir / name.str()).u8string();
}

void Logger::writeToFile(LogLevel level, const std::string& message) {
    if (logFilePath.empty()) return;
    std::ofstream logFile(std::filesystem::u8path(logFilePath), std::ios::app);
    if (!logFile.is_open()) return;

    std::tm tm = localNow();
    logFile << "[" << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S%z") << "]"
            << "[" << levelName(level) << "][git_prompts_mcp_server] "
            << message << std::endl;
}

void Logger::printToConsole(LogLevel level, const std::string& message) {
    const bool color = stderrIsTty();

    std::string prefix;
    switch (level) {
        case LogLevel::INFO:
            prefix = color ? CYAN + "[Info] " + RESET : "[Info] ";
            break;
        case LogLevel::SUCCESS:
            prefix = color ? GREEN + "[OK] " + RESET : "[OK] ";
            break;
        case LogLevel::WARNING:
            prefix = color ? YELLOW + "[Warn] " + RESET : "[Warn] ";
            break;
        case LogLevel::ERROR:
            prefix = color ? RED + BOLD + "[Error] " + RESET : "[Error] ";
            break;
        case LogLevel::DEBUG:
            prefix = color ? GRAY + "[Debug] " + RESET : "[Debug] ";
            break;
    }

    // Trim trailing newlines from message to avoid double spacing
    std::string trimmedMsg = message;
    while (!trimmedMsg.empty() && (trimmedMsg.back() == '\n' || trimmedMsg.back() == '\r')) {
        trimmedMsg.pop_back();
    }

    // Handle multi-line messages by prepending prefix to each line
    std::stringstream ss(trimmedMsg);
    std::string line;
    while (std::getline(ss, line)) {
        std::cerr << prefix << line << std::endl;
    }
}
