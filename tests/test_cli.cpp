#include "testing.hpp"
#include "util/path_utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <sys/wait.h>

namespace cursorup {
namespace {

int ExitCodeFromSystem(int rc) {
    if (rc == -1) {
        return -1;
    }
    if (WIFEXITED(rc)) {
        return WEXITSTATUS(rc);
    }
    return -1;
}

class MainCliTest : public ::testing::Test {
protected:
    // Runs the binary with HOME and the config variable pinned to the sandbox.
    int RunCli(const std::string& args) {
        const std::string cmd = "HOME=" + ShellQuote(tmp_.Path()) + " CURSOR_UPDATER_CONFIG= " +
                                ShellQuote(CURSORUP_BIN) + " " + args + " >" +
                                ShellQuote(stdout_path()) + " 2>" + ShellQuote(stderr_path());
        return ExitCodeFromSystem(std::system(cmd.c_str()));
    }

    // A config that keeps every path inside the sandbox.
    std::string WriteConfig(const std::string& endpoint) {
        const std::string base = tmp_.Path();
        const std::string path = base + "/updater.json";
        const std::string json = std::string("{") +
            "\"api_endpoint\": \"" + endpoint + "\"," +
            "\"metadata_timeout_sec\": 5, \"connect_timeout_sec\": 5," +
            "\"install_dir\": \"" + base + "/opt/cursor\"," +
            "\"metadata_file\": \"" + base + "/opt/cursor/cursor.desktop\"," +
            "\"backup_dir\": \"" + base + "/backups\"," +
            "\"symlink_path\": \"" + base + "/bin/cursor\"," +
            "\"temp_dir\": \"" + base + "\"," +
            "\"log_file\": \"" + base + "/updater.log\"}";
        EXPECT_TRUE(testutil::WriteTextFile(path, json));
        return path;
    }

    std::string stdout_path() const { return tmp_.Path() + "/stdout.txt"; }
    std::string stderr_path() const { return tmp_.Path() + "/stderr.txt"; }

    testutil::TemporaryDirectory tmp_;
};

TEST_F(MainCliTest, HelpExitsZero) {
    EXPECT_EQ(RunCli("--help"), 0);
    EXPECT_NE(testutil::ReadTextFile(stderr_path()).find("--check"), std::string::npos);
}

TEST_F(MainCliTest, UnknownFlagIsUsageError) {
    EXPECT_EQ(RunCli("--bogus"), 2);
    EXPECT_EQ(RunCli("extra-argument"), 2);
}

TEST_F(MainCliTest, MissingExplicitConfigIsConfigError) {
    EXPECT_EQ(RunCli("--config " + ShellQuote(tmp_.Path() + "/absent.json")), 2);
    EXPECT_NE(testutil::ReadTextFile(stderr_path()).find("ERROR:"), std::string::npos);
}

TEST_F(MainCliTest, UnreachableEndpointFailsCheckWithNetworkStatus) {
    const std::string cfg = WriteConfig("http://127.0.0.1:1/api/download");
    EXPECT_EQ(RunCli("--check --config " + ShellQuote(cfg)), 3);

    const std::string err = testutil::ReadTextFile(stderr_path());
    EXPECT_NE(err.find("ERROR:"), std::string::npos);
    EXPECT_NE(err.find("See log for details: " + tmp_.Path() + "/updater.log"), std::string::npos);
    EXPECT_FALSE(testutil::ReadTextFile(tmp_.Path() + "/updater.log").empty());
    EXPECT_FALSE(std::filesystem::exists(tmp_.Path() + "/opt/cursor"));
}

} // namespace
} // namespace cursorup
