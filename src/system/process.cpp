#include "system/process.hpp"

#include "io/fd.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <string_view>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace cursorup {

namespace {

constexpr size_t kMaxLoggedOutput = 4096;

std::string Tail(const std::string& s, size_t max_len) {
    if (s.size() <= max_len) return s;
    return "..." + s.substr(s.size() - max_len);
}

bool IsExecutableFile(const std::string& path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
           ::access(path.c_str(), X_OK) == 0;
}

} // namespace

Outcome<ProcessResult> PosixProcessRunner::Run(const ProcessSpec& spec) const {
    if (spec.argv.empty()) {
        return Unexpected(ErrorKind::IoError, "empty command line");
    }

    int pipefd[2];
    if (::pipe2(pipefd, O_CLOEXEC) != 0) {
        return Unexpected(ErrorKind::IoError, std::string("pipe() failed: ") + std::strerror(errno));
    }
    Fd read_end(pipefd[0]);
    Fd write_end(pipefd[1]);

    std::vector<char*> argv;
    argv.reserve(spec.argv.size() + 1);
    for (const auto& arg : spec.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        return Unexpected(ErrorKind::IoError, std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on.
        if (::dup2(write_end.Get(), STDOUT_FILENO) == -1 ||
            ::dup2(write_end.Get(), STDERR_FILENO) == -1) {
            ::_exit(126);
        }
        const int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        if (!spec.cwd.empty() && ::chdir(spec.cwd.c_str()) != 0) {
            ::_exit(126);
        }
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }

    (void)write_end.Close();

    ProcessResult result;
    std::array<char, 4096> buf{};
    while (true) {
        const ssize_t n = ::read(read_end.Get(), buf.data(), buf.size());
        if (n > 0) {
            result.output.append(buf.data(), static_cast<size_t>(n));
            continue;
        }
        if (n == -1 && errno == EINTR) continue;
        break;
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            return Unexpected(ErrorKind::IoError,
                              std::string("waitpid() failed: ") + std::strerror(errno));
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signaled = true;
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}

std::string FormatCommand(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) out.push_back(' ');
        const bool plain = !arg.empty() &&
                           arg.find_first_of(" \t\n'\"\\$`") == std::string::npos;
        out += plain ? arg : ShellQuote(arg);
    }
    return out;
}

Result RunChecked(const IProcessRunner& runner, const ProcessSpec& spec, ErrorKind failure_kind) {
    const std::string cmd = FormatCommand(spec.argv);
    LogInfo("Running: %s", cmd.c_str());

    auto res = runner.Run(spec);
    if (!res) {
        LogError("Command failed to start: %s (%s)", cmd.c_str(), res.error().msg.c_str());
        return Result::Fail(failure_kind, "cannot run " + cmd + ": " + res.error().msg);
    }
    if (!res->Succeeded()) {
        LogError("Command failed: %s", cmd.c_str());
        LogError("Exit code: %d%s", res->exit_code, res->signaled ? " (signal)" : "");
        if (!res->output.empty()) {
            LogError("Output: %s", Tail(res->output, kMaxLoggedOutput).c_str());
        }
        return Result::Fail(failure_kind,
                            cmd + " exited with status " + std::to_string(res->exit_code));
    }
    if (!res->output.empty()) {
        LogDebug("Output: %s", Tail(res->output, kMaxLoggedOutput).c_str());
    }
    return Result::Ok();
}

std::optional<std::string> FindExecutable(const std::string& name) {
    if (name.empty()) return std::nullopt;
    if (name.find('/') != std::string::npos) {
        if (IsExecutableFile(name)) return name;
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    const std::string_view path = (path_env && *path_env) ? path_env : "/usr/local/bin:/usr/bin:/bin";

    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find(':', start);
        if (end == std::string_view::npos) end = path.size();
        std::string dir(path.substr(start, end - start));
        if (dir.empty()) dir = ".";
        const std::string candidate = dir + "/" + name;
        if (IsExecutableFile(candidate)) return candidate;
        start = end + 1;
    }
    return std::nullopt;
}

} // namespace cursorup
