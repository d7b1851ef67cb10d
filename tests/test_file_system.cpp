#include "filetar/file_system.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <sys/stat.h>
#include <unistd.h>

namespace filetar {
namespace {

class FileSystemTests : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
    std::shared_ptr<const IFileSystem> fs = DefaultFileSystem();
};

TEST_F(FileSystemTests, LstatReportsKindWithoutFollowingLinks) {
    testutil::WriteFile(tmp / "f", "x");
    ASSERT_EQ(::symlink((tmp / "f").c_str(), (tmp / "l").c_str()), 0);

    FileKind kind = FileKind::Unknown;
    ASSERT_TRUE(fs->Lstat(tmp / "f", kind).ok);
    EXPECT_EQ(kind, FileKind::Regular);
    ASSERT_TRUE(fs->Lstat(tmp / "l", kind).ok);
    EXPECT_EQ(kind, FileKind::Symlink);
    ASSERT_TRUE(fs->Lstat(tmp.Path(), kind).ok);
    EXPECT_EQ(kind, FileKind::Directory);

    auto res = fs->Lstat(tmp / "missing", kind);
    EXPECT_EQ(res.err, ENOENT);
}

TEST_F(FileSystemTests, EnsureDirectoryCreatesNestedAndIsIdempotent) {
    const std::string dir = tmp / "a/b/c";
    ASSERT_TRUE(fs->EnsureDirectory(dir, 0755).ok);
    struct stat st{};
    ASSERT_EQ(::stat(dir.c_str(), &st), 0);
    EXPECT_TRUE(S_ISDIR(st.st_mode));

    EXPECT_TRUE(fs->EnsureDirectory(dir, 0755).ok);
}

TEST_F(FileSystemTests, EnsureDirectoryFailsOnFileInTheWay) {
    testutil::WriteFile(tmp / "file", "x");
    auto res = fs->EnsureDirectory(tmp / "file", 0755);
    EXPECT_EQ(res.err, EEXIST);

    res = fs->EnsureDirectory(tmp / "file/sub", 0755);
    EXPECT_EQ(res.err, ENOTDIR);
}

TEST_F(FileSystemTests, OpenForWriteReturnsWritable) {
    std::shared_ptr<IWritable> w;
    ASSERT_TRUE(fs->OpenForWrite(tmp / "o.tar", {}, w).ok);
    ASSERT_NE(w, nullptr);
    const std::string s = "data";
    ASSERT_TRUE(w->Write({reinterpret_cast<const std::uint8_t*>(s.data()), s.size()}).ok);
    ASSERT_TRUE(w->End().ok);
    EXPECT_EQ(testutil::ReadFile(tmp / "o.tar"), "data");
}

TEST(FileKindTests, Names) {
    EXPECT_EQ(FileKindName(FileKind::Directory), "directory");
    EXPECT_EQ(FileKindName(FileKind::Symlink), "symbolic link");
    EXPECT_EQ(FileKindName(FileKind::Fifo), "FIFO");
}

} // namespace
} // namespace filetar
