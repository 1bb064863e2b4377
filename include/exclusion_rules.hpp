/**
 * @file exclusion_rules.hpp
 * @brief Exclude-pattern matching for HomeVault.
 *
 * Patterns are written relative to the backup root with forward slashes, optionally
 * starting with "./". Three kinds are recognized:
 *  - prefix patterns ("./.cache") exclude a path and everything below it;
 *  - wildcard patterns use glob segments, where a "**" segment spans any number of
 *    directories and "*", "?", "[...]" match within one segment, so "**" followed by
 *    "node_modules" excludes every node_modules directory at any depth;
 *  - extension patterns ("**" followed by "*.sock") match the suffix of the final
 *    segment at any depth; without the "**" a "*.sock" glob only applies at the root.
 *
 * A trailing "/" restricts a pattern to directories.
 */

#ifndef EXCLUSION_RULES_HPP
#define EXCLUSION_RULES_HPP

#include <expected>
#include <string>
#include <string_view>
#include <vector>
#include "logger.hpp"
#include "platform.hpp"

/**
 * @brief One compiled exclusion pattern.
 */
class ExclusionPattern {
public:
    enum class Kind {
        Prefix,
        Wildcard,
        Extension
    };

    /**
     * @brief Compiles a pattern.
     *
     * @param pattern Pattern text.
     * @param caseInsensitive If true, segments compare without regard to ASCII case.
     * @return std::expected<ExclusionPattern, std::string> The pattern or why it is malformed.
     */
    static std::expected<ExclusionPattern, std::string> parse(std::string_view pattern, bool caseInsensitive);

    /**
     * @brief Tests the pattern against a normalized path.
     *
     * @param segments Path segments, the first one being ".".
     * @param isDirectory True if the path names a directory.
     */
    bool matches(const std::vector<std::string_view>& segments, bool isDirectory) const;

    Kind kind() const { return kind_; }
    const std::string& text() const { return text_; }

private:
    ExclusionPattern() = default;

    std::string text_;
    Kind kind_ = Kind::Prefix;
    std::vector<std::string> segments_;
    std::string suffix_;
    bool directoryOnly_ = false;
    bool caseInsensitive_ = false;
};

/**
 * @brief The pattern set of one platform.
 *
 * The set is assembled once at startup; the matcher built from it never changes.
 */
class ExclusionRules {
public:
    ExclusionRules(std::string platform, std::vector<std::string> patterns, bool caseInsensitive);

    /**
     * @brief Default patterns for Linux home directories.
     */
    static ExclusionRules forLinux(const std::string& username);

    /**
     * @brief Default patterns for macOS home directories.
     */
    static ExclusionRules forMacOS(const std::string& username);

    /**
     * @brief Default patterns for Windows profiles. Matching is case-insensitive.
     */
    static ExclusionRules forWindows(const std::string& username);

    /**
     * @brief Default patterns for the given platform.
     */
    static ExclusionRules forPlatform(PlatformKind platform, const std::string& username);

    /**
     * @brief An empty set, used when excludes are ignored.
     */
    static ExclusionRules none();

    /**
     * @brief Appends extra patterns, substituting "{user}" like the defaults.
     */
    void addPatterns(const std::vector<std::string>& extra, const std::string& username);

    const std::string& platform() const { return platform_; }
    const std::vector<std::string>& patterns() const { return patterns_; }
    bool caseInsensitive() const { return caseInsensitive_; }

private:
    std::string platform_;
    std::vector<std::string> patterns_;
    bool caseInsensitive_;
};

/**
 * @brief Decides whether a path is left out of the archive.
 *
 * isExcluded() is a pure function of the compiled pattern set and its arguments, so
 * the matcher may be shared by several threads without locking.
 */
class ExclusionMatcher {
public:
    /**
     * @brief Compiles the rules. Malformed patterns are logged and dropped.
     */
    ExclusionMatcher(const ExclusionRules& rules, Logger& logger);

    /**
     * @brief Returns true if any pattern matches the path.
     *
     * @param relativePath Path relative to the backup root, either separator.
     * @param isDirectory True if the path names a directory; the caller must not
     *        descend into an excluded directory.
     */
    bool isExcluded(std::string_view relativePath, bool isDirectory) const;

    /**
     * @brief Returns the first pattern matching the path, or nullptr.
     */
    const ExclusionPattern* findMatch(std::string_view relativePath, bool isDirectory) const;

    /**
     * @brief Normalizes a relative path to "./a/b" form ("." for the root).
     */
    static std::string normalize(std::string_view relativePath);

    std::size_t size() const { return patterns.size(); }
    bool empty() const { return patterns.empty(); }

private:
    std::vector<ExclusionPattern> patterns;
};

#endif // EXCLUSION_RULES_HPP
