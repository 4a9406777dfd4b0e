// test_trash.cpp - Tests for the freedesktop.org home trash

#include "broom/trash.hpp"
#include "test_support.hpp"

#include <sstream>
#include <unistd.h>

using namespace Broom;

static std::string readAll(const std::string& path)
{
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

void test_encode_path()
{
    ASSERT_EQ(Trash::encodePath("/home/u/My File%.txt"), "/home/u/My%20File%25.txt");
    ASSERT_EQ(Trash::encodePath("/a/b-c_d.e~f"), "/a/b-c_d.e~f");
}

void test_deletion_date_format()
{
    std::string date = Trash::deletionDate();
    ASSERT_EQ(date.size(), 19u);
    ASSERT_EQ(date[4], '-');
    ASSERT_EQ(date[10], 'T');
    ASSERT_EQ(date[13], ':');
}

void test_move_file_writes_info()
{
    TempTree tree("trash_move");
    XdgTrash trash(tree.path("Trash"));
    std::string source = tree.writeFile("home/.cache/old file.log", 42);

    TrashOutcome outcome = trash.moveToTrash(source);
    ASSERT(outcome.ok);
    ASSERT(!fs::exists(source));
    ASSERT(fs::exists(tree.path("Trash/files/old file.log")));

    std::string info = readAll(tree.path("Trash/info/old file.log.trashinfo"));
    ASSERT(info.rfind("[Trash Info]\n", 0) == 0);
    ASSERT(info.find("Path=" + Trash::encodePath(source) + "\n") != std::string::npos);
    ASSERT(info.find("DeletionDate=") != std::string::npos);
}

void test_name_collisions_get_suffix()
{
    TempTree tree("trash_collide");
    XdgTrash trash(tree.path("Trash"));
    std::string first = tree.writeFile("home/a/report.txt", 1);
    std::string second = tree.writeFile("home/b/report.txt", 2);

    ASSERT(trash.moveToTrash(first).ok);
    ASSERT(trash.moveToTrash(second).ok);
    ASSERT(fs::exists(tree.path("Trash/files/report.txt")));
    ASSERT(fs::exists(tree.path("Trash/files/report.txt.2")));
    ASSERT(fs::exists(tree.path("Trash/info/report.txt.2.trashinfo")));
}

void test_move_directory()
{
    TempTree tree("trash_dir");
    XdgTrash trash(tree.path("Trash"));
    tree.writeFile("home/.cache/app/one.bin", 10);
    tree.writeFile("home/.cache/app/sub/two.bin", 20);

    ASSERT(trash.moveToTrash(tree.homePath(".cache/app")).ok);
    ASSERT(fs::exists(tree.path("Trash/files/app/sub/two.bin")));
    ASSERT_EQ(trash.size(), 30u);
}

void test_missing_source()
{
    TempTree tree("trash_missing");
    XdgTrash trash(tree.path("Trash"));
    TrashOutcome outcome = trash.moveToTrash(tree.homePath("nothing-here"));
    ASSERT(!outcome.ok);
    ASSERT(outcome.kind == ErrorKind::NotFound);
    ASSERT(!fs::exists(tree.path("Trash/info/nothing-here.trashinfo")));
}

void test_refuses_items_inside_trash()
{
    TempTree tree("trash_inside");
    XdgTrash trash(tree.path("Trash"));
    std::string source = tree.writeFile("Trash/files/kept.txt", 5);
    TrashOutcome outcome = trash.moveToTrash(source);
    ASSERT(!outcome.ok);
    ASSERT(outcome.kind == ErrorKind::PolicyViolation);
    ASSERT(fs::exists(source));
}

void test_failed_rename_leaves_no_record()
{
    if (geteuid() == 0) {
        // root ignores directory permissions
        return;
    }
    TempTree tree("trash_denied");
    XdgTrash trash(tree.path("Trash"));
    std::string source = tree.writeFile("home/locked/item.txt", 3);
    fs::permissions(tree.homePath("locked"), fs::perms::owner_read | fs::perms::owner_exec);

    TrashOutcome outcome = trash.moveToTrash(source);
    fs::permissions(tree.homePath("locked"), fs::perms::owner_all);

    ASSERT(!outcome.ok);
    ASSERT(outcome.kind == ErrorKind::PermissionDenied);
    ASSERT(fs::exists(source));
    ASSERT(!fs::exists(tree.path("Trash/info/item.txt.trashinfo")));
}

void test_size_of_missing_trash()
{
    TempTree tree("trash_empty");
    XdgTrash trash(tree.path("NoTrashYet"));
    ASSERT_EQ(trash.size(), 0u);
}

int main()
{
    std::cout << "=== Trash Tests ===\n\n";

    std::cout << "Format Tests:\n";
    TEST(encode_path);
    TEST(deletion_date_format);

    std::cout << "\nMove Tests:\n";
    TEST(move_file_writes_info);
    TEST(name_collisions_get_suffix);
    TEST(move_directory);

    std::cout << "\nFailure Tests:\n";
    TEST(missing_source);
    TEST(refuses_items_inside_trash);
    TEST(failed_rename_leaves_no_record);

    std::cout << "\nSize Tests:\n";
    TEST(size_of_missing_trash);

    TEST_SUMMARY();
    return (tests_passed == tests_run) ? 0 : 1;
}
