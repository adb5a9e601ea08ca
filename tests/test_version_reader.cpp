#include <gtest/gtest.h>

#include "testing.hpp"
#include "updater/version_reader.hpp"

#include <sys/stat.h>

namespace cursorup {
namespace {

TEST(VersionReaderTest, ReadsTrimmedValueOfKey) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Path() + "/cursor.desktop";
    ASSERT_TRUE(testutil::WriteTextFile(path,
                                        "[Desktop Entry]\n"
                                        "Name=Cursor\n"
                                        "X-AppImage-Version=0.42.0  \r\n"
                                        "Exec=/opt/cursor/AppRun\n"));

    auto v = ReadInstalledVersion(path, "X-AppImage-Version");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, "0.42.0");
}

TEST(VersionReaderTest, MissingFileIsAbsent) {
    testutil::TemporaryDirectory tmp;
    EXPECT_FALSE(ReadInstalledVersion(tmp.Path() + "/nope.desktop", "X-AppImage-Version"));
}

TEST(VersionReaderTest, MissingOrEmptyKeyIsAbsent) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Path() + "/cursor.desktop";
    ASSERT_TRUE(testutil::WriteTextFile(path, "Name=Cursor\nX-AppImage-VersionX=1.0.0\n"));
    EXPECT_FALSE(ReadInstalledVersion(path, "X-AppImage-Version"));

    ASSERT_TRUE(testutil::WriteTextFile(path, "X-AppImage-Version=\n"));
    EXPECT_FALSE(ReadInstalledVersion(path, "X-AppImage-Version"));
}

TEST(VersionReaderTest, UnreadableFileIsAbsent) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "root ignores file permissions";
    }
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Path() + "/cursor.desktop";
    ASSERT_TRUE(testutil::WriteTextFile(path, "X-AppImage-Version=0.42.0\n"));
    ASSERT_EQ(::chmod(path.c_str(), 0), 0);

    EXPECT_FALSE(ReadInstalledVersion(path, "X-AppImage-Version"));
}

} // namespace
} // namespace cursorup
