#include "util/result.hpp"

namespace cursorup {

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                return "None";
        case ErrorKind::NetworkError:        return "NetworkError";
        case ErrorKind::RemoteProtocolError: return "RemoteProtocolError";
        case ErrorKind::VersionParseError:   return "VersionParseError";
        case ErrorKind::BackupError:         return "BackupError";
        case ErrorKind::DownloadError:       return "DownloadError";
        case ErrorKind::ExtractionError:     return "ExtractionError";
        case ErrorKind::InstallError:        return "InstallError";
        case ErrorKind::LinkError:           return "LinkError";
        case ErrorKind::ConfigError:         return "ConfigError";
        case ErrorKind::PreflightError:      return "PreflightError";
        case ErrorKind::PrivilegeError:      return "PrivilegeError";
        case ErrorKind::Cancelled:           return "Cancelled";
        case ErrorKind::IoError:             return "IoError";
    }
    return "Unknown";
}

} // namespace cursorup
