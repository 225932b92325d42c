#pragma once
#include <optional>
#include <string>
#include <vector>

/**
 * @brief One file entry of a diff result.
 *
 * oldPath is empty for a newly added file, newPath is empty for a deleted
 * file. patchText starts at the first hunk header.
 */
struct ChangedFile {
    std::optional<std::string> oldPath;
    std::optional<std::string> newPath;
    std::string patchText;
};

/**
 * @brief One commit of a history result.
 */
struct CommitRecord {
    std::string id;         // full 40-hex object id
    std::string author;     // author display name
    std::string timestamp;  // authored time, UTC, ISO-8601
    std::string message;    // trimmed
};

/**
 * @brief Right-hand side of a diff: an explicit revision or the staged index.
 */
class DiffTarget {
public:
    static DiffTarget staged() { return DiffTarget(); }
    static DiffTarget revision(std::string rev) { return DiffTarget(std::move(rev)); }

    bool isStaged() const { return !rev_.has_value(); }
    const std::string& rev() const { return *rev_; }

    std::string describe() const { return isStaged() ? std::string("staged changes") : *rev_; }

private:
    DiffTarget() = default;
    explicit DiffTarget(std::string rev) : rev_(std::move(rev)) {}

    std::optional<std::string> rev_;
};

// Revision naming the current tip of the checked-out branch.
inline const char* const kTipRevision = "HEAD";
