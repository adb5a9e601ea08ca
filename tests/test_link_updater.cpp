#include <gtest/gtest.h>

#include "testing.hpp"
#include "updater/link_updater.hpp"

#include <filesystem>

namespace cursorup {
namespace {

namespace fs = std::filesystem;

class LinkUpdaterTest : public ::testing::Test {
protected:
    void SetUp() override {
        install_dir_ = tmp_.Path() + "/opt/cursor";
        ASSERT_TRUE(testutil::WriteTextFile(install_dir_ + "/AppRun", "#!/bin/sh\n"));
        cfg_.symlink_path = tmp_.Path() + "/bin/cursor";
        cfg_.desktop_dir = tmp_.Path() + "/applications";
    }

    testutil::TemporaryDirectory tmp_;
    testutil::RecordingPrivilegedFs fs_;
    testutil::FakeProcessRunner runner_;
    UpdaterConfig cfg_;
    std::string install_dir_;
};

TEST_F(LinkUpdaterTest, CreatesLinkToEntryPoint) {
    LinkUpdater links(fs_, runner_, cfg_);
    ASSERT_TRUE(links.Relink(install_dir_).is_ok());
    ASSERT_TRUE(fs::is_symlink(cfg_.symlink_path));
    EXPECT_EQ(fs::read_symlink(cfg_.symlink_path).string(), install_dir_ + "/AppRun");
}

TEST_F(LinkUpdaterTest, ReplacesDanglingLink) {
    fs::create_directories(tmp_.Path() + "/bin");
    fs::create_symlink(tmp_.Path() + "/gone/AppRun", cfg_.symlink_path);

    LinkUpdater links(fs_, runner_, cfg_);
    ASSERT_TRUE(links.Relink(install_dir_).is_ok());
    EXPECT_EQ(fs::read_symlink(cfg_.symlink_path).string(), install_dir_ + "/AppRun");
}

TEST_F(LinkUpdaterTest, RefreshesDesktopDatabaseOnlyWhenDirectoryExists) {
    LinkUpdater links(fs_, runner_, cfg_);
    ASSERT_TRUE(links.Update(install_dir_).is_ok());
    EXPECT_FALSE(runner_.Ran("update-desktop-database"));

    fs::create_directories(cfg_.desktop_dir);
    ASSERT_TRUE(links.Update(install_dir_).is_ok());
    ASSERT_EQ(runner_.calls.size(), 1u);
    EXPECT_EQ(runner_.calls[0].argv,
              (std::vector<std::string>{"update-desktop-database", cfg_.desktop_dir}));
}

TEST_F(LinkUpdaterTest, FailuresAreLinkErrors) {
    fs::create_directories(cfg_.desktop_dir);
    fs_.failing.insert("CreateSymlink");
    runner_.failing.insert("update-desktop-database");

    LinkUpdater links(fs_, runner_, cfg_);
    auto res = links.Update(install_dir_);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::LinkError);
    // Both steps were attempted.
    EXPECT_TRUE(fs_.Called("CreateSymlink"));
    EXPECT_TRUE(runner_.Ran("update-desktop-database"));
}

} // namespace
} // namespace cursorup
