#pragma once
#include <string>
#include <vector>
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>

enum class OutputFormat {
    Text,
    Json
};

inline std::string toString(OutputFormat format) {
    return format == OutputFormat::Json ? "json" : "text";
}

/**
 * @brief Parse an output format selector ("text" / "json", case-insensitive).
 * @throws std::invalid_argument for any other value
 */
inline OutputFormat parseOutputFormat(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "text") return OutputFormat::Text;
    if (lower == "json") return OutputFormat::Json;
    throw std::invalid_argument("Unknown output format '" + value + "' (expected 'text' or 'json')");
}

/**
 * @brief Split a comma separated exclusion list, dropping empty items.
 */
inline std::vector<std::string> splitExcludes(const std::string& value) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= value.size()) {
        size_t end = value.find(',', start);
        std::string item = (end == std::string::npos) ? value.substr(start) : value.substr(start, end - start);
        if (!item.empty()) out.push_back(item);
        if (end == std::string::npos) break;
        start = end + 1;
    }
    return out;
}

/**
 * Process-wide settings. Built once before the first request and only read
 * afterwards.
 */
struct ServerConfig {
    std::string repository;
    std::vector<std::string> excludes;
    OutputFormat format = OutputFormat::Text;
    std::string logFile;
    bool verbose = false;

    /**
     * @brief Load settings from a JSON file.
     *
     * Recognised keys: repository, excludes (array or comma string), format,
     * log_file, verbose. Missing keys keep their defaults.
     */
    static ServerConfig load(const std::string& pathStr) {
        return fromJson(readFile(pathStr));
    }

    static nlohmann::json readFile(const std::string& pathStr) {
        std::filesystem::path path = std::filesystem::u8path(pathStr);
        std::ifstream f(path);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open config file: " + pathStr);
        }

        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        f.close();

        try {
            return nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("JSON Parse Error in " + path.string() + ": " + e.what());
        }
    }

    static ServerConfig fromJson(const nlohmann::json& j) {
        if (!j.is_object()) {
            throw std::runtime_error("Config root must be a JSON object");
        }

        ServerConfig cfg;
        cfg.repository = j.value("repository", "");
        if (j.contains("excludes")) {
            const auto& ex = j["excludes"];
            if (ex.is_string()) {
                cfg.excludes = splitExcludes(ex.get<std::string>());
            } else {
                for (const auto& item : ex.get<std::vector<std::string>>()) {
                    if (item.find(',') != std::string::npos) {
                        throw std::runtime_error("Excluded item cannot contain commas: " + item);
                    }
                    if (!item.empty()) cfg.excludes.push_back(item);
                }
            }
        }
        if (j.contains("format")) {
            try {
                cfg.format = parseOutputFormat(j["format"].get<std::string>());
            } catch (const std::invalid_argument& e) {
                throw std::runtime_error(e.what());
            }
        }
        cfg.logFile = j.value("log_file", "");
        cfg.verbose = j.value("verbose", false);
        return cfg;
    }
};
