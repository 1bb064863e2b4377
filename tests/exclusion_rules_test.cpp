#include <gtest/gtest.h>
#include <algorithm>
#include "exclusion_rules.hpp"
#include "test_support.hpp"

namespace {

ExclusionRules rulesOf(std::vector<std::string> patterns, bool caseInsensitive = false) {
    return ExclusionRules("test", std::move(patterns), caseInsensitive);
}

} // namespace

/**
 * @brief "**" followed by a name excludes that directory at any depth, and only that name.
 */
TEST(ExclusionMatcherTest, NodeModulesExcludedAtAnyDepth) {
    MemoryLogger logger;
    ExclusionMatcher matcher(ExclusionRules::forLinux("alice"), logger);

    EXPECT_TRUE(matcher.isExcluded("node_modules", true));
    EXPECT_TRUE(matcher.isExcluded("project/node_modules", true));
    EXPECT_TRUE(matcher.isExcluded("a/b/c/node_modules/pkg/index.js", false));
    EXPECT_FALSE(matcher.isExcluded("project/node_modules_backup", true));
    EXPECT_FALSE(matcher.isExcluded("project/src/main.js", false));
}

TEST(ExclusionMatcherTest, ExtensionMatchesFinalSegmentOnly) {
    MemoryLogger logger;
    ExclusionMatcher matcher(ExclusionRules::forLinux("alice"), logger);

    EXPECT_TRUE(matcher.isExcluded("foo.sock", false));
    EXPECT_TRUE(matcher.isExcluded("run/user/agent.sock", false));
    EXPECT_FALSE(matcher.isExcluded("foo.sock.bak", false));
    EXPECT_FALSE(matcher.isExcluded("sock", false));
}

TEST(ExclusionMatcherTest, PrefixMatchesPathAndDescendants) {
    MemoryLogger logger;
    ExclusionMatcher matcher(ExclusionRules::forLinux("alice"), logger);

    EXPECT_TRUE(matcher.isExcluded(".cache", true));
    EXPECT_TRUE(matcher.isExcluded(".cache/pip/wheels", true));
    EXPECT_TRUE(matcher.isExcluded("./.cache/pip", true));
    EXPECT_TRUE(matcher.isExcluded(".local/share/Trash/files/old.txt", false));
    EXPECT_FALSE(matcher.isExcluded(".cache-old", true));
    EXPECT_FALSE(matcher.isExcluded("projects/.cache", true));
    EXPECT_FALSE(matcher.isExcluded(".local/share/fonts", true));
    EXPECT_TRUE(matcher.isExcluded("go/pkg/mod", true));
    EXPECT_FALSE(matcher.isExcluded("gopher", true));
}

TEST(ExclusionMatcherTest, RootIsNeverExcluded) {
    MemoryLogger logger;
    ExclusionMatcher matcher(rulesOf({"./**", "./**/*.txt", "./a"}), logger);

    EXPECT_FALSE(matcher.isExcluded("", true));
    EXPECT_FALSE(matcher.isExcluded(".", true));
}

TEST(ExclusionMatcherTest, DoubleStarSpansZeroOrMoreSegments) {
    MemoryLogger logger;
    ExclusionMatcher matcher(rulesOf({"./src/**/generated"}), logger);

    EXPECT_TRUE(matcher.isExcluded("src/generated", true));
    EXPECT_TRUE(matcher.isExcluded("src/a/b/generated", true));
    EXPECT_TRUE(matcher.isExcluded("src/a/generated/file.c", false));
    EXPECT_FALSE(matcher.isExcluded("lib/generated", true));
    EXPECT_FALSE(matcher.isExcluded("src/generated2", true));
}

TEST(ExclusionMatcherTest, SegmentGlobs) {
    MemoryLogger logger;
    ExclusionMatcher matcher(rulesOf({"./**/log[0-9].txt", "./tmp?", "./[!a]*.iso"}), logger);

    EXPECT_TRUE(matcher.isExcluded("var/log1.txt", false));
    EXPECT_FALSE(matcher.isExcluded("var/log12.txt", false));
    EXPECT_FALSE(matcher.isExcluded("var/logx.txt", false));

    EXPECT_TRUE(matcher.isExcluded("tmp1", true));
    EXPECT_FALSE(matcher.isExcluded("tmp12", true));
    EXPECT_FALSE(matcher.isExcluded("work/tmp1", true));

    EXPECT_TRUE(matcher.isExcluded("ubuntu.iso", false));
    EXPECT_FALSE(matcher.isExcluded("arch.iso", false));
}

/**
 * @brief A "*.ext" glob without a leading "**" only applies at the root.
 */
TEST(ExclusionMatcherTest, RootOnlyExtensionGlob) {
    MemoryLogger logger;
    ExclusionMatcher matcher(rulesOf({"./*.log"}), logger);

    EXPECT_TRUE(matcher.isExcluded("install.log", false));
    EXPECT_FALSE(matcher.isExcluded("logs/install.log", false));
}

TEST(ExclusionMatcherTest, TrailingSlashRestrictsToDirectories) {
    MemoryLogger logger;
    ExclusionMatcher matcher(rulesOf({"./**/build/"}), logger);

    EXPECT_TRUE(matcher.isExcluded("project/build", true));
    EXPECT_FALSE(matcher.isExcluded("project/build", false));
    EXPECT_TRUE(matcher.isExcluded("project/build/out.o", false));
}

TEST(ExclusionMatcherTest, WindowsRulesIgnoreCase) {
    MemoryLogger logger;
    ExclusionMatcher matcher(ExclusionRules::forWindows("Bob"), logger);

    EXPECT_TRUE(matcher.isExcluded("code/NODE_MODULES", true));
    EXPECT_TRUE(matcher.isExcluded("downloads/setup.exe", false));
    EXPECT_TRUE(matcher.isExcluded("ntuser.dat.LOG1", false));
    EXPECT_TRUE(matcher.isExcluded("Documents\\Scratch.TMP", false));
    EXPECT_TRUE(matcher.isExcluded("Desktop/bob.zip", false));
    EXPECT_FALSE(matcher.isExcluded("Documents/report.docx", false));
}

TEST(ExclusionMatcherTest, LinuxRulesAreCaseSensitive) {
    MemoryLogger logger;
    ExclusionMatcher matcher(ExclusionRules::forLinux("alice"), logger);

    EXPECT_FALSE(matcher.isExcluded("code/Node_Modules", true));
    EXPECT_FALSE(matcher.isExcluded("downloads", true));
    EXPECT_TRUE(matcher.isExcluded("Downloads", true));
}

TEST(ExclusionMatcherTest, MalformedPatternsAreSkippedWithWarning) {
    MemoryLogger logger;
    ExclusionMatcher matcher(rulesOf({"./[abc", "", "./keep-out"}), logger);

    EXPECT_EQ(matcher.size(), 1u);
    EXPECT_EQ(logger.count(LogLevel::Warning), 2u);
    EXPECT_TRUE(matcher.isExcluded("keep-out", true));
    EXPECT_FALSE(matcher.isExcluded("abc", true));
}

TEST(ExclusionMatcherTest, NoneExcludesNothing) {
    MemoryLogger logger;
    ExclusionMatcher matcher(ExclusionRules::none(), logger);

    EXPECT_TRUE(matcher.empty());
    EXPECT_FALSE(matcher.isExcluded("node_modules", true));
    EXPECT_FALSE(matcher.isExcluded(".cache", true));
}

TEST(ExclusionMatcherTest, DecisionsDoNotDependOnHistory) {
    MemoryLogger logger;
    ExclusionMatcher matcher(ExclusionRules::forLinux("alice"), logger);
    std::vector<std::pair<std::string, bool>> paths = {
        {"a/node_modules", true}, {"a/b.txt", false}, {".cache", true}, {"x.sock", false}, {"go", true}};

    std::vector<bool> first;
    for (const auto& [path, isDirectory] : paths) {
        first.push_back(matcher.isExcluded(path, isDirectory));
    }
    std::reverse(paths.begin(), paths.end());
    std::vector<bool> second;
    for (const auto& [path, isDirectory] : paths) {
        second.push_back(matcher.isExcluded(path, isDirectory));
    }
    std::reverse(second.begin(), second.end());
    EXPECT_EQ(first, second);
}

TEST(ExclusionMatcherTest, FindMatchNamesThePattern) {
    MemoryLogger logger;
    ExclusionMatcher matcher(ExclusionRules::forLinux("alice"), logger);

    const auto* pattern = matcher.findMatch("src/target/debug", true);
    ASSERT_NE(pattern, nullptr);
    EXPECT_EQ(pattern->text(), "./**/target");
    EXPECT_EQ(matcher.findMatch("src/main.rs", false), nullptr);
}

TEST(ExclusionPatternTest, Classification) {
    auto extension = ExclusionPattern::parse("./**/*.sock", false);
    auto prefix = ExclusionPattern::parse("./.cache", false);
    auto wildcard = ExclusionPattern::parse("./**/node_modules", false);
    ASSERT_TRUE(extension && prefix && wildcard);

    EXPECT_EQ(extension->kind(), ExclusionPattern::Kind::Extension);
    EXPECT_EQ(prefix->kind(), ExclusionPattern::Kind::Prefix);
    EXPECT_EQ(wildcard->kind(), ExclusionPattern::Kind::Wildcard);
}

TEST(ExclusionPatternTest, RejectsMalformedPatterns) {
    EXPECT_FALSE(ExclusionPattern::parse("", false));
    EXPECT_FALSE(ExclusionPattern::parse("./", false));
    EXPECT_FALSE(ExclusionPattern::parse("./[a-z", false));
    EXPECT_TRUE(ExclusionPattern::parse("./[]]x", false));
}

TEST(ExclusionMatcherTest, NormalizesSeparators) {
    EXPECT_EQ(ExclusionMatcher::normalize(""), ".");
    EXPECT_EQ(ExclusionMatcher::normalize("."), ".");
    EXPECT_EQ(ExclusionMatcher::normalize("a/b"), "./a/b");
    EXPECT_EQ(ExclusionMatcher::normalize("./a//b/"), "./a/b");
    EXPECT_EQ(ExclusionMatcher::normalize("a\\b\\c"), "./a/b/c");
}

TEST(ExclusionRulesTest, UserPlaceholderIsSubstituted) {
    auto rules = ExclusionRules::forWindows("carol");
    const auto& patterns = rules.patterns();
    EXPECT_NE(std::find(patterns.begin(), patterns.end(), "./**/carol.zip"), patterns.end());
    EXPECT_TRUE(rules.caseInsensitive());

    rules.addPatterns({"./Users/{user}/scratch"}, "carol");
    EXPECT_EQ(rules.patterns().back(), "./Users/carol/scratch");
}

TEST(ExclusionRulesTest, PlatformSelection) {
    EXPECT_EQ(ExclusionRules::forPlatform(PlatformKind::Linux, "u").platform(), "linux");
    EXPECT_EQ(ExclusionRules::forPlatform(PlatformKind::MacOS, "u").platform(), "darwin");
    EXPECT_EQ(ExclusionRules::forPlatform(PlatformKind::Windows, "u").platform(), "windows");
    EXPECT_FALSE(ExclusionRules::forLinux("u").caseInsensitive());
    EXPECT_EQ(ExclusionRules::forLinux("u").patterns().size(), 16u);
}
