#pragma once
#include <ctime>
#include <string>

namespace UTF8Utils {
    /**
     * @brief Offset of the first byte that breaks UTF-8 well-formedness,
     *        or std::string::npos if the whole input is valid.
     *
     * Rejects overlong encodings, surrogates and code points above U+10FFFF.
     */
    size_t findInvalid(const std::string& input);

    inline bool isValid(const std::string& input) { return findInvalid(input) == std::string::npos; }
}

namespace TextUtils {
    // Strip leading/trailing ASCII whitespace.
    std::string trim(const std::string& s);

    // "2024-05-01T12:30:00+00:00"
    std::string formatUtcIso8601(std::time_t t);

    // Repeat ch n times; used for the fixed-width rules in rendered output.
    inline std::string rule(char ch, size_t n) { return std::string(n, ch); }
}
