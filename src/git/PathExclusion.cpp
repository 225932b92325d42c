#include "git/PathExclusion.h"

namespace {

std::vector<std::string> splitSegments(const std::string& path) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        std::string seg = (end == std::string::npos) ? path.substr(start) : path.substr(start, end - start);
        if (!seg.empty() && seg != ".") segments.push_back(seg);
        if (end == std::string::npos) break;
        start = end + 1;
    }
    return segments;
}

// Parse "[...]" starting at pat[open]. Returns false when there is no closing ']'.
bool matchClass(const std::string& pat, size_t open, char c, size_t& next, bool& matched) {
    size_t i = open + 1;
    bool negate = false;
    if (i < pat.size() && pat[i] == '!') {
        negate = true;
        ++i;
    }
    const size_t first = i;
    bool hit = false;
    while (i < pat.size() && (pat[i] != ']' || i == first)) {
        char lo = pat[i];
        if (i + 2 < pat.size() && pat[i + 1] == '-' && pat[i + 2] != ']') {
            char hi = pat[i + 2];
            if (lo <= c && c <= hi) hit = true;
            i += 3;
        } else {
            if (lo == c) hit = true;
            ++i;
        }
    }
    if (i >= pat.size()) return false;
    next = i + 1;
    matched = (hit != negate);
    return true;
}

// Match one pattern token at pat[p] against c. On success `next` is the
// position after the token.
bool matchToken(const std::string& pat, size_t p, char c, size_t& next) {
    const char pc = pat[p];
    if (pc == '?') {
        next = p + 1;
        return true;
    }
    if (pc == '[') {
        bool matched = false;
        if (matchClass(pat, p, c, next, matched)) return matched;
        // unterminated '[' is taken literally
    }
    next = p + 1;
    return pc == c;
}

// Iterative wildcard match with a single backtrack point at the last '*'.
bool globSegment(const std::string& pat, const std::string& str) {
    size_t p = 0;
    size_t s = 0;
    size_t starP = std::string::npos;
    size_t starS = 0;

    while (s < str.size()) {
        size_t next = 0;
        if (p < pat.size() && pat[p] == '*') {
            starP = ++p;
            starS = s;
        } else if (p < pat.size() && matchToken(pat, p, str[s], next)) {
            p = next;
            ++s;
        } else if (starP != std::string::npos) {
            p = starP;
            s = ++starS;
        } else {
            return false;
        }
    }
    while (p < pat.size() && pat[p] == '*') ++p;
    return p == pat.size();
}

bool matchSegments(const std::vector<std::string>& pats, size_t pi,
                   const std::vector<std::string>& segs, size_t si) {
    if (pi == pats.size()) return si == segs.size();
    if (pats[pi] == "**") {
        for (size_t k = si; k <= segs.size(); ++k) {
            if (matchSegments(pats, pi + 1, segs, k)) return true;
        }
        return false;
    }
    if (si == segs.size()) return false;
    return globSegment(pats[pi], segs[si]) && matchSegments(pats, pi + 1, segs, si + 1);
}

bool matchAnchoredRight(const std::vector<std::string>& pats, const std::vector<std::string>& segs) {
    for (size_t start = 0; start <= segs.size(); ++start) {
        if (matchSegments(pats, 0, segs, start)) return true;
    }
    return false;
}

} // namespace

PathExclusion::PathExclusion(std::vector<std::string> patterns) : patterns_(std::move(patterns)) {}

bool PathExclusion::matches(const std::string& path, const std::string& pattern) {
    if (path.empty() || pattern.empty()) return false;

    const std::vector<std::string> segs = splitSegments(path);
    const std::vector<std::string> pats = splitSegments(pattern);
    if (segs.empty() || pats.empty()) return false;

    if (pattern[0] == '/') {
        return matchSegments(pats, 0, segs, 0);
    }
    if (matchAnchoredRight(pats, segs)) return true;

    // Engines that read "**/x" as "one or more directories, then x" miss
    // root level files; retry with the tail alone.
    if (pattern.compare(0, 3, "**/") == 0) {
        return matches(path, pattern.substr(3));
    }
    return false;
}

bool PathExclusion::shouldExclude(const std::optional<std::string>& path) const {
    return ::shouldExclude(path, patterns_);
}

bool PathExclusion::excludes(const ChangedFile& file) const {
    return shouldExclude(file.oldPath) || shouldExclude(file.newPath);
}

bool shouldExclude(const std::optional<std::string>& path, const std::vector<std::string>& patterns) {
    if (!path || path->empty()) return false;
    for (const auto& pattern : patterns) {
        if (PathExclusion::matches(*path, pattern)) return true;
    }
    return false;
}
