// test_path_safety.cpp - Tests for the path safety validator and size measurement

#include "broom/path_safety.hpp"
#include "test_support.hpp"

#include <unistd.h>
#include <vector>

using namespace Broom;

static std::unique_ptr<TempTree> fixture;

static SafetyPolicy policy()
{
    return SafetyPolicy::defaults(fixture->home());
}

// =============================================================================
// Normalization
// =============================================================================

void test_normalize_collapses_separators()
{
    ASSERT_EQ(PathSafety::normalizePath("/System/"), "/System");
    ASSERT_EQ(PathSafety::normalizePath("//usr///lib//"), "/usr/lib");
    ASSERT_EQ(PathSafety::normalizePath("/a/./b/."), "/a/b");
    ASSERT_EQ(PathSafety::normalizePath("/a/b/../c"), "/a/c");
    ASSERT_EQ(PathSafety::normalizePath("/"), "/");
    ASSERT_EQ(PathSafety::normalizePath("/.."), "/");
}

void test_traversal_detection()
{
    ASSERT(PathSafety::hasTraversal("/a/../b"));
    ASSERT(PathSafety::hasTraversal(".."));
    ASSERT(!PathSafety::hasTraversal("/a/..b/c"));
    ASSERT(!PathSafety::hasTraversal("/a/b.."));
}

// =============================================================================
// Protected paths
// =============================================================================

void test_protected_paths_ignore_trailing_separators()
{
    auto p = policy();
    for (const std::string& path : {"/System", "/System/", "/System//", "/usr/", "/etc", "/"}) {
        ValidationResult result = PathSafety::validate(path, p);
        ASSERT_EQ(result.status, ValidationStatus::ProtectedPath);
    }
    ASSERT_EQ(PathSafety::validate("/System/", p).protectedPath, "/System");
    ASSERT_EQ(PathSafety::validate("/usr//", p).protectedPath, "/usr");
}

void test_linux_system_roots_are_protected()
{
    auto p = policy();
    for (const std::string& path : {"/home", "/root", "/boot", "/proc", "/sys", "/lib64"}) {
        ASSERT_EQ(PathSafety::validate(path, p).status, ValidationStatus::ProtectedPath);
    }
}

void test_home_and_home_folders_are_protected()
{
    auto p = policy();
    ASSERT_EQ(PathSafety::validate("~", p), ValidationResult::protectedBy(fixture->home()));
    ASSERT_EQ(PathSafety::validate(fixture->home() + "/", p), ValidationResult::protectedBy(fixture->home()));
    ASSERT_EQ(PathSafety::validate("~/Documents", p).status, ValidationStatus::ProtectedPath);
    ASSERT_EQ(PathSafety::validate("~/Downloads/", p).protectedPath, fixture->homePath("Downloads"));
}

void test_extra_protected_paths_tighten_policy()
{
    auto p = SafetyPolicy::defaults(fixture->home(), {"~/.cache/keep-me"});
    ASSERT_EQ(PathSafety::validate("~/.cache/keep-me", p).status, ValidationStatus::ProtectedPath);
    ASSERT(PathSafety::validate("~/.cache/other", p).isSafe());
}

// =============================================================================
// Rule ordering and allow-list
// =============================================================================

void test_traversal_rejected_even_under_allowed_root()
{
    auto p = policy();
    ASSERT_EQ(PathSafety::validate("~/Library/Caches/../../etc/passwd", p).status, ValidationStatus::PathTraversal);
    ASSERT_EQ(PathSafety::validate("~/.cache/a/../b", p).status, ValidationStatus::PathTraversal);
    ASSERT_EQ(PathSafety::validate("/usr/../usr", p).status, ValidationStatus::PathTraversal);
}

void test_empty_and_relative_paths_are_invalid()
{
    auto p = policy();
    ASSERT_EQ(PathSafety::validate("", p).status, ValidationStatus::InvalidPath);
    ASSERT_EQ(PathSafety::validate("   \t", p).status, ValidationStatus::InvalidPath);
    ASSERT_EQ(PathSafety::validate("relative/dir", p).status, ValidationStatus::InvalidPath);
    ASSERT_EQ(PathSafety::validate(std::string("/tmp/a\0b", 8), p).status, ValidationStatus::InvalidPath);
}

void test_paths_outside_allow_list_are_refused()
{
    auto p = policy();
    ASSERT_EQ(PathSafety::validate("~/Documents/report.pdf", p).status, ValidationStatus::OutsideAllowedPaths);
    ASSERT_EQ(PathSafety::validate("/usr/lib/libc.so", p).status, ValidationStatus::OutsideAllowedPaths);
    ASSERT_EQ(PathSafety::validate("~/projects/build", p).status, ValidationStatus::OutsideAllowedPaths);
}

void test_allowed_roots_themselves()
{
    auto p = policy();
    ASSERT_EQ(PathSafety::validate("~/.cache", p).status, ValidationStatus::OutsideAllowedPaths);
    ASSERT_EQ(PathSafety::validate("~/Library/Caches/", p).status, ValidationStatus::OutsideAllowedPaths);
    ASSERT(PathSafety::validate("~/Library/Developer/Xcode/DerivedData", p).isSafe());
    ASSERT(PathSafety::validate("~/.Trash", p).isSafe());
}

void test_descendants_of_allowed_roots_are_safe()
{
    auto p = policy();
    ASSERT(PathSafety::validate("~/Library/Caches/com.example.App", p).isSafe());
    ASSERT(PathSafety::validate("~/.cache/thumbnails/", p).isSafe());
    ASSERT(PathSafety::validate(fixture->homePath(".npm/_cacache/index"), p).isSafe());
    ASSERT(PathSafety::validate("/Library/Caches/com.vendor", p).isSafe());
}

void test_mixed_list_example()
{
    auto p = policy();
    std::vector<std::string> paths = {
        "~/Library/Caches/AppX",
        "/System",
        "~/Library/Caches/../../etc/passwd",
        "~/Library/Caches/AppY"
    };
    auto results = PathSafety::validateBatch(paths, p);
    ASSERT_EQ(results.size(), 4u);
    ASSERT_EQ(results[0].second.status, ValidationStatus::Safe);
    ASSERT_EQ(results[1].second, ValidationResult::protectedBy("/System"));
    ASSERT_EQ(results[2].second.status, ValidationStatus::PathTraversal);
    ASSERT_EQ(results[3].second.status, ValidationStatus::Safe);
    ASSERT_EQ(results[1].first, "/System");
}

// =============================================================================
// Symlinks
// =============================================================================

void test_symlink_into_system_is_refused()
{
    auto p = policy();
    fixture->makeDir("home/.cache");
    std::string link = fixture->homePath(".cache/etc-link");
    fs::create_symlink("/etc", link);
    ASSERT_EQ(PathSafety::validate(link, p).status, ValidationStatus::SymlinkToProtected);
}

void test_relative_symlink_into_documents_is_refused()
{
    auto p = policy();
    fixture->makeDir("home/Documents");
    fixture->makeDir("home/.cache");
    std::string link = fixture->homePath(".cache/docs-link");
    fs::create_symlink("../Documents", link);
    ASSERT_EQ(PathSafety::validate(link, p).status, ValidationStatus::SymlinkToProtected);
}

void test_symlink_inside_cache_subtree_is_safe()
{
    auto p = policy();
    fixture->makeDir("home/.cache/real");
    std::string link = fixture->homePath(".cache/alias");
    fs::create_symlink(fixture->homePath(".cache/real"), link);
    ASSERT(PathSafety::validate(link, p).isSafe());
}

void test_symlinked_parent_into_documents_is_refused()
{
    TempTree tree("safety_parent_link");
    tree.writeText("home/Documents/thesis/draft.tex", "\\chapter{One}\n");
    fs::create_directory_symlink(tree.homePath("Documents"), tree.homePath(".cache"));
    auto p = SafetyPolicy::defaults(tree.home());

    ValidationResult result = PathSafety::validate("~/.cache/thesis", p);
    ASSERT(!result.isSafe());
    ASSERT_EQ(result.status, ValidationStatus::SymlinkToProtected);
    ASSERT(fs::exists(tree.homePath("Documents/thesis/draft.tex")));
}

void test_symlinked_parent_outside_allow_list_is_refused()
{
    TempTree tree("safety_parent_outside");
    tree.writeFile("elsewhere/data/blob", 8);
    tree.makeDir("home/.cache");
    fs::create_directory_symlink(tree.path("elsewhere"), tree.homePath(".cache/moved"));
    auto p = SafetyPolicy::defaults(tree.home());

    ASSERT_EQ(PathSafety::validate("~/.cache/moved/data", p).status, ValidationStatus::SymlinkToProtected);
    ASSERT_EQ(PathSafety::validate("~/.cache/moved/data/blob", p).status, ValidationStatus::SymlinkToProtected);
}

void test_symlinked_parent_within_allow_list_is_safe()
{
    TempTree tree("safety_parent_inside");
    tree.writeFile("home/.cache/real/item.bin", 4);
    fs::create_directory_symlink(tree.homePath(".cache/real"), tree.homePath(".cache/alias"));
    auto p = SafetyPolicy::defaults(tree.home());

    ASSERT(PathSafety::validate("~/.cache/alias/item.bin", p).isSafe());
}

void test_symlinked_home_keeps_its_allow_list()
{
    TempTree tree("safety_linked_home");
    tree.writeFile("real-home/.cache/app/blob", 4);
    fs::create_directory_symlink(tree.path("real-home"), tree.path("linked-home"));
    auto p = SafetyPolicy::defaults(tree.path("linked-home"));

    ASSERT(PathSafety::validate("~/.cache/app", p).isSafe());
    ASSERT_EQ(PathSafety::validate("~/Documents", p).status, ValidationStatus::ProtectedPath);
}

// =============================================================================
// Properties
// =============================================================================

void test_validate_is_idempotent()
{
    auto p = policy();
    for (const std::string& path : {"~/.cache/x", "/System/", "~/Documents/a", "~/.cache/../x", ""}) {
        ASSERT_EQ(PathSafety::validate(path, p), PathSafety::validate(path, p));
    }
    std::string raw = fixture->homePath(".cache//nested/");
    ASSERT_EQ(PathSafety::validate(raw, p), PathSafety::validate(PathSafety::normalizePath(raw), p));
}

void test_filter_safe_paths_keeps_order()
{
    auto p = policy();
    std::vector<std::string> paths = {
        "~/.cache/b", "/usr", "~/.cache/a", "~/Music", "~/Library/Logs/app.log", "relative"
    };
    std::vector<std::string> expected;
    for (const auto& path : paths) {
        if (PathSafety::validate(path, p).isSafe()) {
            expected.push_back(path);
        }
    }
    ASSERT_EQ(PathSafety::filterSafePaths(paths, p), expected);
    ASSERT_EQ(expected.size(), 3u);
}

void test_large_batch_matches_sequential()
{
    auto p = policy();
    std::vector<std::string> paths;
    for (int i = 0; i < 600; ++i) {
        paths.push_back(i % 3 == 0 ? "/var/" + std::to_string(i) : "~/.cache/item" + std::to_string(i));
    }
    auto results = PathSafety::validateBatch(paths, p);
    ASSERT_EQ(results.size(), paths.size());
    for (size_t i = 0; i < paths.size(); ++i) {
        ASSERT_EQ(results[i].first, paths[i]);
        ASSERT_EQ(results[i].second, PathSafety::validate(paths[i], p));
    }
}

void test_reason_text()
{
    ASSERT_EQ(ValidationResult::protectedBy("/usr").reason(), "Protected system path: /usr");
    ASSERT_EQ(ValidationResult::of(ValidationStatus::PathTraversal).reason(),
              "Path contains traversal sequences (..)");
    ASSERT(ValidationResult::of(ValidationStatus::InvalidPath).errorKind() == ErrorKind::InvalidInput);
    ASSERT(ValidationResult::of(ValidationStatus::OutsideAllowedPaths).errorKind() == ErrorKind::PolicyViolation);
}

// =============================================================================
// Size measurement
// =============================================================================

void test_measure_nested_tree()
{
    fixture->writeFile("sizes/a.bin", 100);
    fixture->writeFile("sizes/one/b.bin", 250);
    fixture->writeFile("sizes/one/two/c.bin", 4096);
    ASSERT_EQ(PathSafety::measureSize(fixture->path("sizes")), 4446u);
}

void test_measure_ignores_symlinks()
{
    fixture->writeFile("linked/data.bin", 300);
    fixture->writeFile("big/huge.bin", 10000);
    fs::create_symlink(fixture->path("big/huge.bin"), fixture->path("linked/huge-link"));
    fs::create_directory_symlink(fixture->path("big"), fixture->path("linked/big-dir"));
    ASSERT_EQ(PathSafety::measureSize(fixture->path("linked")), 300u);
    ASSERT_EQ(PathSafety::measureSize(fixture->path("linked/huge-link")), 0u);
}

void test_measure_single_file()
{
    std::string file = fixture->writeFile("single/file.txt", 1234);
    ASSERT_EQ(PathSafety::measureSize(file), 1234u);
}

void test_measure_missing_path()
{
    ASSERT_THROWS_KIND(PathSafety::measureSize(fixture->path("does/not/exist")), ErrorKind::NotFound);
}

void test_measure_unreadable_directory()
{
    if (geteuid() == 0) {
        // root reads everything; nothing to observe
        return;
    }
    std::string dir = fixture->makeDir("locked");
    fixture->writeFile("locked/inner.bin", 10);
    fs::permissions(dir, fs::perms::none);
    bool thrown = false;
    try {
        PathSafety::measureSize(dir);
    } catch (const Error& e) {
        thrown = e.kind() == ErrorKind::EnumerationFailure;
    }
    fs::permissions(dir, fs::perms::owner_all);
    ASSERT(thrown);
}

int main()
{
    std::cout << "=== PathSafety Tests ===\n\n";

    // Setup
    fixture = std::make_unique<TempTree>("path_safety");

    std::cout << "Normalization Tests:\n";
    TEST(normalize_collapses_separators);
    TEST(traversal_detection);

    std::cout << "\nProtected Path Tests:\n";
    TEST(protected_paths_ignore_trailing_separators);
    TEST(linux_system_roots_are_protected);
    TEST(home_and_home_folders_are_protected);
    TEST(extra_protected_paths_tighten_policy);

    std::cout << "\nRule Tests:\n";
    TEST(traversal_rejected_even_under_allowed_root);
    TEST(empty_and_relative_paths_are_invalid);
    TEST(paths_outside_allow_list_are_refused);
    TEST(allowed_roots_themselves);
    TEST(descendants_of_allowed_roots_are_safe);
    TEST(mixed_list_example);

    std::cout << "\nSymlink Tests:\n";
    TEST(symlink_into_system_is_refused);
    TEST(relative_symlink_into_documents_is_refused);
    TEST(symlink_inside_cache_subtree_is_safe);
    TEST(symlinked_parent_into_documents_is_refused);
    TEST(symlinked_parent_outside_allow_list_is_refused);
    TEST(symlinked_parent_within_allow_list_is_safe);
    TEST(symlinked_home_keeps_its_allow_list);

    std::cout << "\nProperty Tests:\n";
    TEST(validate_is_idempotent);
    TEST(filter_safe_paths_keeps_order);
    TEST(large_batch_matches_sequential);
    TEST(reason_text);

    std::cout << "\nSize Tests:\n";
    TEST(measure_nested_tree);
    TEST(measure_ignores_symlinks);
    TEST(measure_single_file);
    TEST(measure_missing_path);
    TEST(measure_unreadable_directory);

    // Cleanup
    fixture.reset();

    TEST_SUMMARY();
    return (tests_passed == tests_run) ? 0 : 1;
}
