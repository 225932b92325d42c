#include "utils/TextUtils.h"
#include <cctype>

namespace UTF8Utils {
    size_t findInvalid(const std::string& input) {
        size_t i = 0;
        const size_t n = input.size();
        while (i < n) {
            unsigned char c = static_cast<unsigned char>(input[i]);

            // ASCII
            if (c <= 0x7F) {
                i++;
                continue;
            }

            size_t len = 0;
            if (c >= 0xC2 && c <= 0xDF) len = 2;
            else if (c >= 0xE0 && c <= 0xEF) len = 3;
            else if (c >= 0xF0 && c <= 0xF4) len = 4;
            else return i;  // 0x80-0xC1 lead or 0xF5+

            if (i + len > n) return i;
            for (size_t k = 1; k < len; ++k) {
                unsigned char ck = static_cast<unsigned char>(input[i + k]);
                if ((ck & 0xC0) != 0x80) return i;
            }

            unsigned char c1 = static_cast<unsigned char>(input[i + 1]);
            if (c == 0xE0 && c1 < 0xA0) return i;  // overlong
            if (c == 0xED && c1 > 0x9F) return i;  // surrogate
            if (c == 0xF0 && c1 < 0x90) return i;  // overlong
            if (c == 0xF4 && c1 > 0x8F) return i;  // > U+10FFFF

            i += len;
        }
        return std::string::npos;
    }
}

namespace TextUtils {
    std::string trim(const std::string& s) {
        size_t start = 0;
        while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
        size_t end = s.size();
        while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
        return s.substr(start, end - start);
    }

    std::string formatUtcIso8601(std::time_t t) {
        std::tm tm{};
#ifdef _WIN32
        gmtime_s(&tm, &t);
#else
        gmtime_r(&t, &tm);
#endif
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S+00:00", &tm);
        return buf;
    }
}
