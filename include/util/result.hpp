#pragma once

#include <expected>
#include <string>
#include <utility>

namespace cursorup {

enum class ErrorKind : int {
    None = 0,
    NetworkError,
    RemoteProtocolError,
    VersionParseError,
    BackupError,
    DownloadError,
    ExtractionError,
    InstallError,
    LinkError,
    ConfigError,
    PreflightError,
    PrivilegeError,
    Cancelled,
    IoError,
};

const char* ToString(ErrorKind kind);

struct Error {
    ErrorKind kind{ErrorKind::None};
    std::string msg;

    const std::string& message() const { return msg; }
};

struct Result {
    bool ok{true};
    ErrorKind kind{ErrorKind::None};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }
    Error error() const { return {kind, msg}; }

    static Result Ok() { return {}; }
    static Result Fail(ErrorKind k, std::string m) {
        return {.ok = false, .kind = k, .msg = std::move(m)};
    }
    static Result Fail(const Error& e) { return Fail(e.kind, e.msg); }
};

// Steps that produce a value return Outcome<T>; steps that only succeed or fail
// return Result.
template <typename T>
using Outcome = std::expected<T, Error>;

inline std::unexpected<Error> Unexpected(ErrorKind kind, std::string msg) {
    return std::unexpected(Error{kind, std::move(msg)});
}

inline std::unexpected<Error> Unexpected(const Result& r) {
    return std::unexpected(r.error());
}

} // namespace cursorup
