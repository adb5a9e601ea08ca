#pragma once

#include "util/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cursorup {

struct ProcessSpec {
    std::vector<std::string> argv;
    // Working directory for the child; empty keeps the caller's.
    std::string cwd;
};

struct ProcessResult {
    int exit_code = -1;
    bool signaled = false;
    // Combined stdout and stderr.
    std::string output;

    bool Succeeded() const { return !signaled && exit_code == 0; }
};

class IProcessRunner {
public:
    virtual ~IProcessRunner() = default;
    // Fails only when the child could not be started or waited for; a non-zero
    // exit status is reported through ProcessResult.
    virtual Outcome<ProcessResult> Run(const ProcessSpec& spec) const = 0;
};

class PosixProcessRunner final : public IProcessRunner {
public:
    Outcome<ProcessResult> Run(const ProcessSpec& spec) const override;
};

// Runs `spec`, logs the command line, and turns a start failure or non-zero
// exit into a Result of `failure_kind`.
Result RunChecked(const IProcessRunner& runner, const ProcessSpec& spec, ErrorKind failure_kind);

std::string FormatCommand(const std::vector<std::string>& argv);

// Searches $PATH like execvp does. Names containing '/' are checked directly.
std::optional<std::string> FindExecutable(const std::string& name);

} // namespace cursorup
