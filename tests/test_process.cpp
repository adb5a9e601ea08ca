#include <gtest/gtest.h>

#include "system/process.hpp"
#include "testing.hpp"

namespace cursorup {
namespace {

TEST(ProcessRunnerTest, CapturesOutputAndExitCode) {
    PosixProcessRunner runner;
    auto res = runner.Run(ProcessSpec{.argv = {"sh", "-c", "echo out; echo err >&2; exit 3"}});
    ASSERT_TRUE(res.has_value()) << res.error().msg;
    EXPECT_EQ(res->exit_code, 3);
    EXPECT_FALSE(res->signaled);
    EXPECT_FALSE(res->Succeeded());
    EXPECT_NE(res->output.find("out\n"), std::string::npos);
    EXPECT_NE(res->output.find("err\n"), std::string::npos);
}

TEST(ProcessRunnerTest, RunsInRequestedDirectory) {
    testutil::TemporaryDirectory tmp;
    PosixProcessRunner runner;
    auto res = runner.Run(ProcessSpec{.argv = {"sh", "-c", "touch made-here"}, .cwd = tmp.Path()});
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(res->Succeeded());
    EXPECT_TRUE(std::filesystem::exists(tmp.Path() + "/made-here"));
}

TEST(ProcessRunnerTest, MissingProgramExits127) {
    PosixProcessRunner runner;
    auto res = runner.Run(ProcessSpec{.argv = {"cursorup-definitely-missing"}});
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->exit_code, 127);
}

TEST(ProcessRunnerTest, EmptyCommandIsAnError) {
    PosixProcessRunner runner;
    EXPECT_FALSE(runner.Run(ProcessSpec{}).has_value());
}

TEST(ProcessRunnerTest, RunCheckedMapsFailureToRequestedKind) {
    PosixProcessRunner runner;
    EXPECT_TRUE(RunChecked(runner, ProcessSpec{.argv = {"true"}}, ErrorKind::LinkError).is_ok());

    auto res = RunChecked(runner, ProcessSpec{.argv = {"false"}}, ErrorKind::ExtractionError);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::ExtractionError);
}

TEST(ProcessRunnerTest, FormatCommandQuotesOnlyWhenNeeded) {
    EXPECT_EQ(FormatCommand({"update-desktop-database", "/home/a b/apps"}),
              "update-desktop-database '/home/a b/apps'");
    EXPECT_EQ(FormatCommand({"echo", ""}), "echo ''");
}

TEST(ProcessRunnerTest, FindExecutableSearchesPath) {
    auto sh = FindExecutable("sh");
    ASSERT_TRUE(sh.has_value());
    EXPECT_EQ(std::filesystem::path(*sh).filename().string(), "sh");
    EXPECT_FALSE(FindExecutable("cursorup-definitely-missing").has_value());
    EXPECT_FALSE(FindExecutable("/nonexistent/bin/tool").has_value());
}

} // namespace
} // namespace cursorup
