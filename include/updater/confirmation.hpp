#pragma once

#include <cstdio>
#include <string>

namespace cursorup {

class IConfirmation {
public:
    virtual ~IConfirmation() = default;
    virtual bool Confirm(const std::string& question) = 0;
};

// Prints "<question> (y/N): " and reads one line. Only "y"/"yes" accept;
// EOF and interruption decline.
class TerminalConfirmation final : public IConfirmation {
public:
    explicit TerminalConfirmation(std::FILE* in = stdin, std::FILE* out = stdout)
        : in_(in), out_(out) {}

    bool Confirm(const std::string& question) override;

private:
    std::FILE* in_;
    std::FILE* out_;
};

class FixedConfirmation final : public IConfirmation {
public:
    explicit FixedConfirmation(bool answer) : answer_(answer) {}

    bool Confirm(const std::string&) override { return answer_; }

private:
    bool answer_;
};

} // namespace cursorup
