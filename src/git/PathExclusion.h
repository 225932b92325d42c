#pragma once
#include <optional>
#include <string>
#include <vector>
#include "git/GitTypes.h"

/**
 * @brief Glob based exclusion of changed files.
 *
 * Pattern semantics:
 * - '*' matches any run of characters inside one path segment, '?' one
 *   character, "[...]" / "[!...]" a character class.
 * - "**" as a whole segment matches zero or more segments.
 * - Relative patterns are anchored at the right end of the path:
 *   "target.txt" matches "a/b/target.txt", "dist/*" matches "dist/x.js".
 * - A leading '/' anchors the pattern at the repository root.
 * - "**" followed by "/tail" also matches "tail" at the root.
 */
class PathExclusion {
public:
    explicit PathExclusion(std::vector<std::string> patterns);

    const std::vector<std::string>& patterns() const { return patterns_; }

    bool shouldExclude(const std::optional<std::string>& path) const;

    // True if either side of the change matches.
    bool excludes(const ChangedFile& file) const;

    static bool matches(const std::string& path, const std::string& pattern);

private:
    std::vector<std::string> patterns_;
};

/**
 * @brief Free-standing form: false for an absent/empty path, otherwise true
 *        when any pattern matches.
 */
bool shouldExclude(const std::optional<std::string>& path, const std::vector<std::string>& patterns);
