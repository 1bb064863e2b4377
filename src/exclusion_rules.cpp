#include "exclusion_rules.hpp"
#include <algorithm>
#include <cctype>
#include <format>
#include <utility>

namespace {

constexpr std::string_view kDoubleStar = "**";

char foldCase(char c, bool caseInsensitive) {
    return caseInsensitive ? static_cast<char>(std::tolower(static_cast<unsigned char>(c))) : c;
}

bool hasGlobChars(std::string_view segment) {
    return segment.find_first_of("*?[") != std::string_view::npos;
}

std::vector<std::string_view> splitSegments(std::string_view path) {
    std::vector<std::string_view> segments;
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string_view::npos) {
            end = path.size();
        }
        if (end > start) {
            segments.push_back(path.substr(start, end - start));
        }
        start = end + 1;
    }
    return segments;
}

/**
 * @brief Checks that every "[" in a segment glob has a closing "]".
 */
bool validSegmentGlob(std::string_view glob) {
    for (size_t i = 0; i < glob.size(); ++i) {
        if (glob[i] != '[') {
            continue;
        }
        size_t j = i + 1;
        if (j < glob.size() && (glob[j] == '!' || glob[j] == '^')) {
            ++j;
        }
        if (j < glob.size() && glob[j] == ']') {
            ++j;
        }
        while (j < glob.size() && glob[j] != ']') {
            ++j;
        }
        if (j >= glob.size()) {
            return false;
        }
        i = j;
    }
    return true;
}

/**
 * @brief Matches one character against a "[...]" class starting at glob[pos].
 *
 * On return pos points past the closing bracket.
 */
bool matchClass(std::string_view glob, size_t& pos, char c, bool caseInsensitive) {
    ++pos;
    bool negate = false;
    if (pos < glob.size() && (glob[pos] == '!' || glob[pos] == '^')) {
        negate = true;
        ++pos;
    }
    bool matched = false;
    bool first = true;
    c = foldCase(c, caseInsensitive);
    while (pos < glob.size() && (first || glob[pos] != ']')) {
        first = false;
        char lo = foldCase(glob[pos], caseInsensitive);
        char hi = lo;
        if (pos + 2 < glob.size() && glob[pos + 1] == '-' && glob[pos + 2] != ']') {
            hi = foldCase(glob[pos + 2], caseInsensitive);
            pos += 2;
        }
        if (lo <= c && c <= hi) {
            matched = true;
        }
        ++pos;
    }
    ++pos;
    return matched != negate;
}

/**
 * @brief Glob match of a single path segment ("*", "?", "[...]").
 */
bool matchSegment(std::string_view glob, std::string_view name, bool caseInsensitive) {
    if (!hasGlobChars(glob)) {
        return glob.size() == name.size() &&
               std::equal(glob.begin(), glob.end(), name.begin(), [caseInsensitive](char a, char b) {
                   return foldCase(a, caseInsensitive) == foldCase(b, caseInsensitive);
               });
    }

    size_t g = 0;
    size_t n = 0;
    size_t starG = std::string_view::npos;
    size_t starN = 0;
    while (n < name.size()) {
        if (g < glob.size() && glob[g] == '*') {
            starG = g++;
            starN = n;
            continue;
        }
        if (g < glob.size() && glob[g] == '[') {
            size_t next = g;
            if (matchClass(glob, next, name[n], caseInsensitive)) {
                g = next;
                ++n;
                continue;
            }
        } else if (g < glob.size() &&
                   (glob[g] == '?' || foldCase(glob[g], caseInsensitive) == foldCase(name[n], caseInsensitive))) {
            ++g;
            ++n;
            continue;
        }
        if (starG == std::string_view::npos) {
            return false;
        }
        g = starG + 1;
        n = ++starN;
    }
    while (g < glob.size() && glob[g] == '*') {
        ++g;
    }
    return g == glob.size();
}

/**
 * @brief Matches all of path against pattern; "**" absorbs zero or more segments.
 *
 * Iterative, backtracking only to the most recent "**".
 */
bool matchAnchored(const std::vector<std::string>& pattern, const std::vector<std::string_view>& path, size_t pathLength,
                   bool caseInsensitive) {
    size_t p = 0;
    size_t s = 0;
    size_t starP = std::string::npos;
    size_t starS = 0;
    while (s < pathLength) {
        if (p < pattern.size() && pattern[p] == kDoubleStar) {
            starP = p++;
            starS = s;
            continue;
        }
        if (p < pattern.size() && matchSegment(pattern[p], path[s], caseInsensitive)) {
            ++p;
            ++s;
            continue;
        }
        if (starP == std::string::npos) {
            return false;
        }
        p = starP + 1;
        s = ++starS;
    }
    while (p < pattern.size() && pattern[p] == kDoubleStar) {
        ++p;
    }
    return p == pattern.size();
}

bool endsWith(std::string_view name, std::string_view suffix, bool caseInsensitive) {
    if (suffix.size() > name.size()) {
        return false;
    }
    auto tail = name.substr(name.size() - suffix.size());
    return std::equal(tail.begin(), tail.end(), suffix.begin(), [caseInsensitive](char a, char b) {
        return foldCase(a, caseInsensitive) == foldCase(b, caseInsensitive);
    });
}

std::vector<std::string> substituteUser(std::vector<std::string> patterns, const std::string& username) {
    static constexpr std::string_view placeholder = "{user}";
    for (auto& pattern : patterns) {
        size_t pos = 0;
        while ((pos = pattern.find(placeholder, pos)) != std::string::npos) {
            pattern.replace(pos, placeholder.size(), username);
            pos += username.size();
        }
    }
    return patterns;
}

} // namespace

std::expected<ExclusionPattern, std::string> ExclusionPattern::parse(std::string_view pattern, bool caseInsensitive) {
    ExclusionPattern compiled;
    compiled.text_ = std::string(pattern);
    compiled.caseInsensitive_ = caseInsensitive;

    std::string normalized = ExclusionMatcher::normalize(pattern);
    if (!pattern.empty() && (pattern.back() == '/' || pattern.back() == '\\')) {
        compiled.directoryOnly_ = true;
    }
    auto segments = splitSegments(normalized);
    if (segments.size() < 2) {
        return std::unexpected(std::format("pattern '{}' matches nothing below the backup root", pattern));
    }

    bool wildcard = false;
    for (auto segment : segments) {
        if (!validSegmentGlob(segment)) {
            return std::unexpected(std::format("pattern '{}' has an unterminated character class", pattern));
        }
        if (hasGlobChars(segment)) {
            wildcard = true;
        }
        compiled.segments_.emplace_back(segment);
    }

    if (!wildcard) {
        compiled.kind_ = Kind::Prefix;
        return compiled;
    }

    const auto& last = compiled.segments_.back();
    bool leadingOnly = std::all_of(compiled.segments_.begin(), compiled.segments_.end() - 1,
                                   [](const std::string& s) { return s == "." || s == kDoubleStar; });
    bool anyDepth = std::find(compiled.segments_.begin(), compiled.segments_.end() - 1, kDoubleStar) !=
                    compiled.segments_.end() - 1;
    if (leadingOnly && anyDepth && last.size() > 1 && last[0] == '*' && !hasGlobChars(std::string_view(last).substr(1)) &&
        last.find('.') != std::string::npos) {
        compiled.kind_ = Kind::Extension;
        compiled.suffix_ = last.substr(1);
        return compiled;
    }

    compiled.kind_ = Kind::Wildcard;
    return compiled;
}

bool ExclusionPattern::matches(const std::vector<std::string_view>& segments, bool isDirectory) const {
    if (segments.size() < 2) {
        return false;
    }

    switch (kind_) {
    case Kind::Extension:
        if (directoryOnly_ && !isDirectory) {
            return false;
        }
        return endsWith(segments.back(), suffix_, caseInsensitive_);

    case Kind::Prefix: {
        if (segments.size() < segments_.size()) {
            return false;
        }
        if (directoryOnly_ && segments.size() == segments_.size() && !isDirectory) {
            return false;
        }
        for (size_t i = 0; i < segments_.size(); ++i) {
            if (!matchSegment(segments_[i], segments[i], caseInsensitive_)) {
                return false;
            }
        }
        return true;
    }

    case Kind::Wildcard:
        // A match on an ancestor excludes the whole subtree below it.
        for (size_t length = 2; length <= segments.size(); ++length) {
            if (directoryOnly_ && length == segments.size() && !isDirectory) {
                continue;
            }
            if (matchAnchored(segments_, segments, length, caseInsensitive_)) {
                return true;
            }
        }
        return false;
    }
    return false;
}

ExclusionRules::ExclusionRules(std::string platform, std::vector<std::string> patterns, bool caseInsensitive)
    : platform_(std::move(platform)), patterns_(std::move(patterns)), caseInsensitive_(caseInsensitive) {}

ExclusionRules ExclusionRules::forLinux(const std::string& username) {
    return ExclusionRules("linux",
                          substituteUser({
                                             "./**/*.sock",
                                             "./**/.build",
                                             "./**/.venv",
                                             "./**/__worktrees",
                                             "./**/node_modules",
                                             "./**/target",
                                             "./.Trash",
                                             "./.cache",
                                             "./.cargo",
                                             "./.local/share/Trash",
                                             "./.npm",
                                             "./.rustup",
                                             "./.vscode/extensions",
                                             "./Downloads",
                                             "./snap",
                                             "./go",
                                         },
                                         username),
                          false);
}

ExclusionRules ExclusionRules::forMacOS(const std::string& username) {
    return ExclusionRules("darwin",
                          substituteUser({
                                             "./**/*.sock",
                                             "./**/.build",
                                             "./**/.venv",
                                             "./**/node_modules",
                                             "./**/target",
                                             "./.Trash",
                                             "./.cache",
                                             "./.cargo",
                                             "./.npm",
                                             "./.rustup",
                                             "./.vscode/extensions",
                                             "./Downloads",
                                             "./Library/Caches",
                                             "./Library/Containers/com.docker.docker",
                                             "./Library/Developer/CoreSimulator",
                                             "./Library/Developer/Xcode/DerivedData",
                                             "./Library/Logs",
                                             "./Library/Mobile Documents",
                                             "./go",
                                         },
                                         username),
                          false);
}

ExclusionRules ExclusionRules::forWindows(const std::string& username) {
    return ExclusionRules("windows",
                          substituteUser({
                                             "./**/*.tmp",
                                             "./**/node_modules",
                                             "./**/.venv",
                                             "./**/target",
                                             "./**/{user}.zip",
                                             "./AppData/Local/CrashDumps",
                                             "./AppData/Local/Microsoft/Windows/INetCache",
                                             "./AppData/Local/Packages",
                                             "./AppData/Local/Temp",
                                             "./NTUSER.DAT*",
                                             "./.cargo",
                                             "./.rustup",
                                             "./Downloads",
                                             "./scoop/cache",
                                             "./go",
                                         },
                                         username),
                          true);
}

ExclusionRules ExclusionRules::forPlatform(PlatformKind platform, const std::string& username) {
    switch (platform) {
    case PlatformKind::Windows:
        return forWindows(username);
    case PlatformKind::MacOS:
        return forMacOS(username);
    case PlatformKind::Linux:
        break;
    }
    return forLinux(username);
}

ExclusionRules ExclusionRules::none() {
    return ExclusionRules("none", {}, false);
}

void ExclusionRules::addPatterns(const std::vector<std::string>& extra, const std::string& username) {
    auto substituted = substituteUser(extra, username);
    patterns_.insert(patterns_.end(), substituted.begin(), substituted.end());
}

ExclusionMatcher::ExclusionMatcher(const ExclusionRules& rules, Logger& logger) {
    for (const auto& text : rules.patterns()) {
        auto pattern = ExclusionPattern::parse(text, rules.caseInsensitive());
        if (!pattern) {
            logger.warn("Ignoring exclude pattern: {}", pattern.error());
            continue;
        }
        patterns.push_back(std::move(*pattern));
    }
}

std::string ExclusionMatcher::normalize(std::string_view relativePath) {
    std::string path(relativePath);
    std::replace(path.begin(), path.end(), '\\', '/');

    std::string normalized = ".";
    for (auto segment : splitSegments(path)) {
        if (segment == ".") {
            continue;
        }
        normalized += '/';
        normalized += segment;
    }
    return normalized;
}

const ExclusionPattern* ExclusionMatcher::findMatch(std::string_view relativePath, bool isDirectory) const {
    if (patterns.empty()) {
        return nullptr;
    }
    std::string normalized = normalize(relativePath);
    auto segments = splitSegments(normalized);
    for (const auto& pattern : patterns) {
        if (pattern.matches(segments, isDirectory)) {
            return &pattern;
        }
    }
    return nullptr;
}

bool ExclusionMatcher::isExcluded(std::string_view relativePath, bool isDirectory) const {
    return findMatch(relativePath, isDirectory) != nullptr;
}
