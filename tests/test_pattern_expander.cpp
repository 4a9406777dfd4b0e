// test_pattern_expander.cpp - Tests for cleanup pattern expansion

#include "broom/pattern_expander.hpp"
#include "test_support.hpp"

#include <vector>

using namespace Broom;

void test_literal_pattern_exists()
{
    TempTree tree("expand_literal");
    tree.makeDir("home/.npm/_logs");
    auto results = PatternExpander::expandPattern("~/.npm/_logs", tree.home());
    ASSERT_EQ(results.size(), 1u);
    ASSERT_EQ(results[0], tree.homePath(".npm/_logs"));
}

void test_literal_pattern_missing()
{
    TempTree tree("expand_missing");
    ASSERT(PatternExpander::expandPattern("~/.npm/_logs", tree.home()).empty());
}

void test_dangling_symlink_counts_as_existing()
{
    TempTree tree("expand_dangling");
    fs::create_symlink(tree.path("nowhere"), tree.path("dangling"));
    auto results = PatternExpander::expandPattern(tree.path("dangling"), tree.home());
    ASSERT_EQ(results.size(), 1u);
}

void test_wildcard_lists_children_sorted()
{
    TempTree tree("expand_children");
    tree.makeDir("home/.cache/zeta");
    tree.makeDir("home/.cache/alpha");
    tree.writeFile("home/.cache/middle.bin", 1);
    tree.makeDir("home/.cache/alpha/deeper");

    auto results = PatternExpander::expandPattern("~/.cache/*", tree.home());
    std::vector<std::string> expected = {
        tree.homePath(".cache/alpha"),
        tree.homePath(".cache/middle.bin"),
        tree.homePath(".cache/zeta")
    };
    ASSERT_EQ(results, expected);
}

void test_wildcard_includes_hidden_children()
{
    TempTree tree("expand_hidden");
    tree.makeDir("home/.Trash/.hidden");
    tree.makeDir("home/.Trash/visible");
    auto results = PatternExpander::expandPattern("~/.Trash/*", tree.home());
    ASSERT_EQ(results.size(), 2u);
}

void test_wildcard_ignores_segments_after_marker()
{
    TempTree tree("expand_one_level");
    tree.makeDir("home/Devices/one/data/Caches/x");
    tree.makeDir("home/Devices/two");

    auto results = PatternExpander::expandPattern("~/Devices/*/data/Caches/*", tree.home());
    std::vector<std::string> expected = {
        tree.homePath("Devices/one"),
        tree.homePath("Devices/two")
    };
    ASSERT_EQ(results, expected);
}

void test_wildcard_missing_directory()
{
    TempTree tree("expand_no_dir");
    ASSERT(PatternExpander::expandPattern("~/Library/Caches/*", tree.home()).empty());
}

void test_definition_tags_results()
{
    TempTree tree("expand_definition");
    tree.makeDir("home/.cache/pip/http");

    CleanupPathDefinition definition;
    definition.pattern = "~/.cache/pip/*";
    definition.category = CleanupCategory::Pip;
    definition.description = "pip cache";
    definition.requiresRoot = false;
    definition.safeToClean = false;

    auto results = PatternExpander::expandDefinition(definition, tree.home());
    ASSERT_EQ(results.size(), 1u);
    ASSERT_EQ(results[0].path, tree.homePath(".cache/pip/http"));
    ASSERT(results[0].category == CleanupCategory::Pip);
    ASSERT_EQ(results[0].description, "pip cache");
    ASSERT(!results[0].safeToClean);
    ASSERT(!results[0].requiresRoot);
}

int main()
{
    std::cout << "=== PatternExpander Tests ===\n\n";

    std::cout << "Literal Pattern Tests:\n";
    TEST(literal_pattern_exists);
    TEST(literal_pattern_missing);
    TEST(dangling_symlink_counts_as_existing);

    std::cout << "\nWildcard Tests:\n";
    TEST(wildcard_lists_children_sorted);
    TEST(wildcard_includes_hidden_children);
    TEST(wildcard_ignores_segments_after_marker);
    TEST(wildcard_missing_directory);

    std::cout << "\nDefinition Tests:\n";
    TEST(definition_tags_results);

    TEST_SUMMARY();
    return (tests_passed == tests_run) ? 0 : 1;
}
