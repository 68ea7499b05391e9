#include <gtest/gtest.h>
#include "notes_store.hpp"
#include "test_workspace.hpp"

using namespace notehook;
using notehook::test::TempWorkspace;

class NotesStoreTest : public ::testing::Test {
protected:
    TempWorkspace ws_;
    NotesStore store_{ws_.notes_dir().string()};
};

TEST_F(NotesStoreTest, ListOnAbsentDirectoryIsEmptyAndDoesNotCreateIt) {
    EXPECT_TRUE(store_.list().empty());
    EXPECT_FALSE(fs::exists(ws_.notes_dir()));
}

TEST_F(NotesStoreTest, WriteCreatesDirectoryAndReadsBackExactly) {
    store_.write("todo.md", "buy milk");
    EXPECT_TRUE(fs::is_directory(ws_.notes_dir()));

    auto content = store_.read("todo.md");
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(*content, "buy milk");
}

TEST_F(NotesStoreTest, RoundTripPreservesEmptyContentAndNewlines) {
    store_.write("empty.md", "");
    ASSERT_TRUE(store_.read("empty.md").has_value());
    EXPECT_EQ(*store_.read("empty.md"), "");

    const std::string multi = "line one\nline two\r\n\n  trailing spaces  \n";
    store_.write("multi.md", multi);
    EXPECT_EQ(*store_.read("multi.md"), multi);

    const std::string with_nul("a\0b", 3);
    store_.write("nul.md", with_nul);
    EXPECT_EQ(*store_.read("nul.md"), with_nul);
}

TEST_F(NotesStoreTest, WriteOverwritesAndLeavesNoTempFiles) {
    store_.write("a.md", "first version, longer");
    store_.write("a.md", "second");
    EXPECT_EQ(*store_.read("a.md"), "second");
    EXPECT_EQ(store_.list(), std::vector<std::string>{"a.md"});
    auto staging = ws_.notes_dir() / NotesStore::STAGING_DIR;
    EXPECT_TRUE(!fs::exists(staging) || fs::is_empty(staging));
}

TEST_F(NotesStoreTest, WriteNeverTouchesNotesShapedLikeTempFiles) {
    store_.write(".todo.md.tmp", "keep me");
    store_.write("todo.md", "buy milk");
    store_.write("todo.md.tmp", "also keep me");
    store_.write("todo.md", "buy oat milk");

    ASSERT_TRUE(store_.read(".todo.md.tmp").has_value());
    EXPECT_EQ(*store_.read(".todo.md.tmp"), "keep me");
    EXPECT_EQ(*store_.read("todo.md.tmp"), "also keep me");
    EXPECT_EQ(*store_.read("todo.md"), "buy oat milk");

    std::vector<std::string> expected{".todo.md.tmp", "todo.md", "todo.md.tmp"};
    EXPECT_EQ(store_.list(), expected);
}

TEST_F(NotesStoreTest, StagingDirectoryNameIsReserved) {
    EXPECT_THROW(store_.write(NotesStore::STAGING_DIR, "x"), std::invalid_argument);
    EXPECT_THROW(store_.read(NotesStore::STAGING_DIR), std::invalid_argument);
}

TEST_F(NotesStoreTest, ListIsSortedAndSkipsDirectories) {
    store_.write("b.md", "b");
    store_.write("a.md", "a");
    store_.write("C.md", "c");
    fs::create_directories(ws_.notes_dir() / "subdir");

    std::vector<std::string> expected{"C.md", "a.md", "b.md"};
    EXPECT_EQ(store_.list(), expected);
}

TEST_F(NotesStoreTest, ReadMissingReturnsNullopt) {
    EXPECT_FALSE(store_.read("MISSING.md").has_value());
    store_.write("present.md", "x");
    EXPECT_FALSE(store_.read("MISSING.md").has_value());
}

TEST_F(NotesStoreTest, RemoveReportsAbsenceEveryTime) {
    store_.write("DEL.md", "delete me");
    EXPECT_TRUE(store_.remove("DEL.md"));
    EXPECT_FALSE(fs::exists(ws_.notes_dir() / "DEL.md"));
    EXPECT_FALSE(store_.remove("DEL.md"));
    EXPECT_FALSE(store_.remove("DEL.md"));
}

TEST_F(NotesStoreTest, RejectsNamesThatEscapeTheDirectory) {
    for (auto bad : {"", ".", "..", "a/b.md", "../x.md", "sub\\x.md"}) {
        EXPECT_THROW(store_.write(bad, "x"), std::invalid_argument) << bad;
        EXPECT_THROW(store_.read(bad), std::invalid_argument) << bad;
        EXPECT_THROW(store_.remove(bad), std::invalid_argument) << bad;
    }
    EXPECT_FALSE(fs::exists(ws_.root() / "x.md"));
}

TEST_F(NotesStoreTest, ReadingADirectoryIsAnError) {
    fs::create_directories(ws_.notes_dir() / "folder.md");
    EXPECT_THROW(store_.read("folder.md"), std::runtime_error);
}

TEST_F(NotesStoreTest, RemovingADirectoryIsAnError) {
    fs::create_directories(ws_.notes_dir() / "folder.md");
    EXPECT_THROW(store_.remove("folder.md"), std::runtime_error);
    EXPECT_TRUE(fs::is_directory(ws_.notes_dir() / "folder.md"));
}
