#include <gtest/gtest.h>

#include "io/file_reader.hpp"
#include "io/temp_file.hpp"
#include "testing.hpp"

#include <filesystem>
#include <sys/stat.h>

namespace cursorup {
namespace {

namespace fs = std::filesystem;

std::span<const std::uint8_t> Bytes(const std::string& s) {
    return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

TEST(TempFileTest, CreatesPrivateFileWithPrefixAndSuffix) {
    testutil::TemporaryDirectory tmp;
    TempFile file;
    ASSERT_TRUE(TempFile::Create(tmp.Path(), "cursor-", ".AppImage", file).is_ok());

    const fs::path p(file.Path());
    EXPECT_EQ(p.parent_path().string(), tmp.Path());
    EXPECT_EQ(p.filename().string().rfind("cursor-", 0), 0u);
    EXPECT_EQ(p.extension().string(), ".AppImage");

    struct stat st{};
    ASSERT_EQ(::stat(file.Path().c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);
}

TEST(TempFileTest, WritesAreReadableBackAndFileIsRemovedOnScopeExit) {
    testutil::TemporaryDirectory tmp;
    std::string path;
    {
        TempFile file;
        ASSERT_TRUE(TempFile::Create(tmp.Path(), "t-", "", file).is_ok());
        ASSERT_TRUE(file.WriteAll(Bytes("hello ")).is_ok());
        ASSERT_TRUE(file.WriteAll(Bytes("world")).is_ok());
        ASSERT_TRUE(file.FsyncNow().is_ok());
        ASSERT_TRUE(file.Close().is_ok());
        path = file.Path();

        FileReader reader;
        ASSERT_TRUE(FileReader::Open(path, reader).is_ok());
        EXPECT_EQ(reader.TotalSize(), std::optional<std::uint64_t>(11));
        EXPECT_EQ(testutil::ReadTextFile(path), "hello world");
    }
    EXPECT_FALSE(fs::exists(path));
}

TEST(TempFileTest, RemoveIsExplicitAndIdempotent) {
    testutil::TemporaryDirectory tmp;
    TempFile file;
    ASSERT_TRUE(TempFile::Create(tmp.Path(), "t-", "", file).is_ok());
    const std::string path = file.Path();

    ASSERT_TRUE(file.Remove().is_ok());
    EXPECT_FALSE(fs::exists(path));
    EXPECT_FALSE(file.Exists());
    EXPECT_TRUE(file.Remove().is_ok());
}

TEST(TempFileTest, MoveKeepsSingleOwner) {
    testutil::TemporaryDirectory tmp;
    TempFile a;
    ASSERT_TRUE(TempFile::Create(tmp.Path(), "t-", "", a).is_ok());
    const std::string path = a.Path();

    TempFile b(std::move(a));
    EXPECT_FALSE(a.Exists());
    EXPECT_EQ(b.Path(), path);
    EXPECT_TRUE(fs::exists(path));
}

TEST(TempFileTest, CreateFailsInMissingDirectory) {
    TempFile file;
    auto res = TempFile::Create("/nonexistent/cursorup", "t-", "", file);
    EXPECT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::IoError);
}

TEST(TempDirectoryTest, RemovesTreeOnScopeExit) {
    testutil::TemporaryDirectory tmp;
    std::string path;
    {
        TempDirectory dir;
        ASSERT_TRUE(TempDirectory::Create(tmp.Path(), "extract_", dir).is_ok());
        path = dir.Path();
        ASSERT_TRUE(testutil::WriteTextFile(path + "/squashfs-root/AppRun", "x"));
    }
    EXPECT_FALSE(fs::exists(path));
}

TEST(FileReaderTest, OpenMissingFileFails) {
    FileReader reader;
    EXPECT_FALSE(FileReader::Open("/nonexistent/cursorup/file", reader).is_ok());
}

} // namespace
} // namespace cursorup
