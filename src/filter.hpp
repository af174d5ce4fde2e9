#pragma once
#include <algorithm>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

// ASCII-only lowercasing without locale.
inline char tolower_ascii(char c) {
    return (c >= 'A' && c <= 'Z') ? char(c - 'A' + 'a') : c;
}

inline bool contains_icase_ascii(std::string_view haystack, std::string_view needle) {
    if (needle.empty()) return true;
    if (needle.size() > haystack.size()) return false;
    const auto n0 = tolower_ascii(needle.front());
    for (size_t i = 0, N = haystack.size(), M = needle.size(); i + M <= N; ++i) {
        if (tolower_ascii(haystack[i]) != n0) continue;
        size_t j = 1;
        for (; j < M; ++j) {
            if (tolower_ascii(haystack[i + j]) != tolower_ascii(needle[j])) break;
        }
        if (j == M) return true;
    }
    return false;
}

// "warn" matches "WARNING"
inline bool starts_with_icase_ascii(std::string_view s, std::string_view prefix) {
    if (prefix.size() > s.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i)
        if (tolower_ascii(s[i]) != tolower_ascii(prefix[i])) return false;
    return true;
}

// Shell-style glob with '*' and '?'.
inline bool glob_match(std::string_view pattern, std::string_view s) {
    size_t p = 0, i = 0, star = std::string_view::npos, mark = 0;
    while (i < s.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == s[i])) { ++p; ++i; }
        else if (p < pattern.size() && pattern[p] == '*') { star = p++; mark = i; }
        else if (star != std::string_view::npos) { p = star + 1; i = ++mark; }
        else return false;
    }
    while (p < pattern.size() && pattern[p] == '*') ++p;
    return p == pattern.size();
}

// "logs-*,traces-*": true when any comma separated glob matches.
inline bool index_pattern_match(std::string_view patterns, std::string_view name) {
    size_t start = 0;
    while (start <= patterns.size()) {
        size_t comma = patterns.find(',', start);
        auto part = patterns.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start);
        while (!part.empty() && part.front() == ' ') part.remove_prefix(1);
        while (!part.empty() && part.back() == ' ') part.remove_suffix(1);
        if (!part.empty() && glob_match(part, name)) return true;
        if (comma == std::string_view::npos) break;
        start = comma + 1;
    }
    return false;
}

// Free-text query. Plain text is a case-insensitive substring,
// "/expr/" is an ECMAScript regex (case-insensitive).
struct CompiledFilter {
    std::string pattern;
    bool use_regex = false;

    // cache
    std::optional<std::regex> rx;
    std::string lowered;

    // false and outError filled when the regex does not compile
    bool compile(std::string p, std::string* outError = nullptr) {
        pattern = std::move(p);
        rx.reset();
        lowered.clear();
        use_regex = pattern.size() >= 2 && pattern.front() == '/' && pattern.back() == '/';
        if (use_regex) {
            try {
                rx.emplace(pattern.substr(1, pattern.size() - 2), std::regex::ECMAScript | std::regex::icase);
            }
            catch (const std::regex_error& e) {
                if (outError) *outError = std::string("invalid search pattern: ") + e.what();
                return false;
            }
            return true;
        }
        lowered.resize(pattern.size());
        std::transform(pattern.begin(), pattern.end(), lowered.begin(), tolower_ascii);
        return true;
    }

    bool empty() const { return pattern.empty(); }

    bool match(std::string_view s) const {
        if (pattern.empty()) return true;
        if (use_regex) {
            if (!rx) return true;
            return std::regex_search(s.begin(), s.end(), *rx);
        }
        return contains_icase_ascii(s, lowered);
    }

    bool matchAny(const std::vector<std::string>& values) const {
        if (pattern.empty()) return true;
        return std::any_of(values.begin(), values.end(), [&](const std::string& v) { return match(v); });
    }
};
