#pragma once

#include "net/http_client.hpp"
#include "system/privileged_fs.hpp"
#include "system/process.hpp"
#include "updater/confirmation.hpp"
#include "updater/progress.hpp"
#include "updater/version_comparator.hpp"
#include "util/result.hpp"
#include "util/updater_config.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cursorup {

enum class UpdateState {
    Start,
    ReadInstalled,
    ResolveRemote,
    Compare,
    UpToDate,
    CheckOnly,
    Preflight,
    Backup,
    Download,
    Install,
    Relink,
    Cleanup,
    Done,
    Aborted,
};

const char* ToString(UpdateState state);

struct UpdateOptions {
    bool force = false;
    bool skip_backup = false;
    bool check_only = false;
};

struct UpdateOutcome {
    enum class Status { UpToDate, CheckOnly, Success, Aborted };

    Status status = Status::Aborted;
    // Last state entered before a terminal one; for Aborted this is the step
    // that failed.
    UpdateState last_step = UpdateState::Start;
    std::optional<Error> error;

    std::optional<std::string> installed;
    std::string latest;
    // Version read back after a successful install.
    std::string installed_now;
    // One-line user report for UpToDate and CheckOnly.
    std::string report;
    // Empty when no backup was taken.
    std::string backup_path;
    std::vector<std::string> warnings;

    bool ok() const { return status != Status::Aborted; }
};

// Runs one update pass:
//   Start -> ReadInstalled -> ResolveRemote -> Compare
//     -> UpToDate | CheckOnly
//     | Preflight -> Backup -> Download -> Install -> Relink -> Cleanup -> Done
// with Aborted reachable from every step. Nothing under the install directory,
// the backup root or the public symlink is touched before Preflight.
class UpdateOrchestrator {
public:
    UpdateOrchestrator(const UpdaterConfig& config,
                       IHttpClient& http,
                       const IProcessRunner& runner,
                       const IPrivilegedFs& fs,
                       IConfirmation& confirm,
                       IProgress* progress = nullptr);

    UpdateOutcome Run(const UpdateOptions& options);

    // Shape printed for a check-only run where an update is pending.
    static std::string CheckOnlyReport(const std::optional<std::string>& installed,
                                       const std::string& latest,
                                       const std::string& app_name);

private:
    void Enter(UpdateOutcome& out, UpdateState state) const;
    UpdateOutcome& Abort(UpdateOutcome& out, const Error& err) const;
    bool AbortIfCancelled(UpdateOutcome& out) const;

    const UpdaterConfig& config_;
    IHttpClient& http_;
    const IProcessRunner& runner_;
    const IPrivilegedFs& fs_;
    IConfirmation& confirm_;
    IProgress* progress_;
};

// Process exit status for a failed step; 0 for ErrorKind::None.
int ExitCodeFor(ErrorKind kind);
int ExitCodeFor(const UpdateOutcome& outcome);

} // namespace cursorup
