#include "updater/update_orchestrator.hpp"

#include "io/temp_file.hpp"
#include "system/signals.hpp"
#include "updater/artifact_fetcher.hpp"
#include "updater/backup_manager.hpp"
#include "updater/installer.hpp"
#include "updater/link_updater.hpp"
#include "updater/preflight.hpp"
#include "updater/release_resolver.hpp"
#include "updater/version_reader.hpp"
#include "util/logger.hpp"

namespace cursorup {

const char* ToString(UpdateState state) {
    switch (state) {
    case UpdateState::Start: return "Start";
    case UpdateState::ReadInstalled: return "ReadInstalled";
    case UpdateState::ResolveRemote: return "ResolveRemote";
    case UpdateState::Compare: return "Compare";
    case UpdateState::UpToDate: return "UpToDate";
    case UpdateState::CheckOnly: return "CheckOnly";
    case UpdateState::Preflight: return "Preflight";
    case UpdateState::Backup: return "Backup";
    case UpdateState::Download: return "Download";
    case UpdateState::Install: return "Install";
    case UpdateState::Relink: return "Relink";
    case UpdateState::Cleanup: return "Cleanup";
    case UpdateState::Done: return "Done";
    case UpdateState::Aborted: return "Aborted";
    }
    return "?";
}

UpdateOrchestrator::UpdateOrchestrator(const UpdaterConfig& config,
                                       IHttpClient& http,
                                       const IProcessRunner& runner,
                                       const IPrivilegedFs& fs,
                                       IConfirmation& confirm,
                                       IProgress* progress)
    : config_(config),
      http_(http),
      runner_(runner),
      fs_(fs),
      confirm_(confirm),
      progress_(progress) {}

std::string UpdateOrchestrator::CheckOnlyReport(const std::optional<std::string>& installed,
                                                const std::string& latest,
                                                const std::string& app_name) {
    if (!installed)
        return app_name + " not installed. Latest version available: " + latest;
    if (latest == kUnknownVersion)
        return "Currently installed: " + *installed + ". Cannot determine latest version.";
    return "Update available: " + *installed + " → " + latest;
}

void UpdateOrchestrator::Enter(UpdateOutcome& out, UpdateState state) const {
    LogDebug("Update state: %s -> %s", ToString(out.last_step), ToString(state));
    out.last_step = state;
}

UpdateOutcome& UpdateOrchestrator::Abort(UpdateOutcome& out, const Error& err) const {
    LogError("Update aborted in %s: %s (%s)", ToString(out.last_step), err.msg.c_str(),
             ToString(err.kind));
    out.status = UpdateOutcome::Status::Aborted;
    out.error = err;
    return out;
}

bool UpdateOrchestrator::AbortIfCancelled(UpdateOutcome& out) const {
    if (!CancelRequested())
        return false;
    Abort(out, Error{ErrorKind::Cancelled, "interrupted"});
    return true;
}

UpdateOutcome UpdateOrchestrator::Run(const UpdateOptions& options) {
    UpdateOutcome out;

    Enter(out, UpdateState::ReadInstalled);
    out.installed = ReadInstalledVersion(config_.metadata_file, config_.version_key);
    LogInfo("Installed version: %s", out.installed ? out.installed->c_str() : "not installed");
    if (AbortIfCancelled(out))
        return out;

    Enter(out, UpdateState::ResolveRemote);
    ReleaseResolver resolver(http_, config_);
    auto release = resolver.Resolve();
    if (!release)
        return Abort(out, release.error());
    out.latest = release->version;
    LogInfo("Latest version: %s", out.latest.c_str());
    if (AbortIfCancelled(out))
        return out;

    Enter(out, UpdateState::Compare);
    // --check reports what is available; --force only matters for a real run.
    const UpdateDecision decision = VersionComparator::Decide(out.installed, out.latest, options.force);
    LogDebug("Update decision: %s (%s)", decision.update_needed ? "update" : "keep",
             ToString(decision.reason));

    if (!decision.update_needed) {
        Enter(out, UpdateState::UpToDate);
        out.status = UpdateOutcome::Status::UpToDate;
        out.report = "Already up to date";
        if (out.installed)
            out.report += " (" + *out.installed + ")";
        LogInfo("%s", out.report.c_str());
        return out;
    }

    if (options.check_only) {
        Enter(out, UpdateState::CheckOnly);
        out.status = UpdateOutcome::Status::CheckOnly;
        out.report = CheckOnlyReport(out.installed, out.latest, config_.app_name);
        return out;
    }

    if (decision.reason == UpdateDecision::Reason::Forced)
        LogInfo("Forcing update");

    Enter(out, UpdateState::Preflight);
    if (auto r = CheckDependencies(config_.required_tools); !r.is_ok())
        return Abort(out, r.error());
    if (auto r = fs_.VerifyPrivilege(); !r.is_ok())
        return Abort(out, r.error());
    if (AbortIfCancelled(out))
        return out;

    Enter(out, UpdateState::Backup);
    if (options.skip_backup) {
        LogWarn("Skipping backup");
    } else {
        BackupManager backups(fs_, config_.backup_prefix);
        auto backup = backups.CreateBackup(config_.install_dir, config_.backup_dir,
                                           config_.verify_backup);
        if (!backup) {
            LogError("Backup failed: %s", backup.error().msg.c_str());
            if (CancelRequested() || !confirm_.Confirm("Backup failed. Continue anyway?")) {
                LogInfo("Update cancelled");
                return Abort(out, Error{ErrorKind::BackupError,
                                        "update cancelled after backup failure: " +
                                            backup.error().msg});
            }
            out.warnings.push_back("continued without a backup: " + backup.error().msg);
        } else if (backup->has_value()) {
            out.backup_path = (*backup)->path;
        } else {
            LogInfo("No existing installation at %s, nothing to back up",
                    config_.install_dir.c_str());
        }
    }
    if (AbortIfCancelled(out))
        return out;

    // Both temporaries are released on every return path below.
    TempFile artifact;
    TempDirectory workdir;

    Enter(out, UpdateState::Download);
    LogInfo("Downloading %s %s", config_.app_name.c_str(), out.latest.c_str());
    ArtifactFetcher fetcher(http_, config_, progress_);
    auto fetched = fetcher.Fetch(release->download_url, artifact);
    if (!fetched)
        return Abort(out, fetched.error());
    if (AbortIfCancelled(out))
        return out;

    Enter(out, UpdateState::Install);
    if (auto r = TempDirectory::Create(config_.temp_dir, "cursor_extract_", workdir); !r.is_ok())
        return Abort(out, Error{ErrorKind::ExtractionError, r.msg});

    Installer installer(fs_, runner_, config_);
    if (auto r = installer.Install(fetched->path, workdir.Path(), config_.install_dir); !r.is_ok()) {
        std::string msg = r.msg;
        if (r.kind != ErrorKind::Cancelled) {
            msg += out.backup_path.empty() ? "; no backup was made"
                                           : "; restore from backup " + out.backup_path;
        }
        return Abort(out, Error{r.kind, msg});
    }

    Enter(out, UpdateState::Relink);
    LinkUpdater links(fs_, runner_, config_);
    if (auto r = links.Update(config_.install_dir); !r.is_ok()) {
        LogWarn("%s", r.msg.c_str());
        out.warnings.push_back(r.msg);
    }

    Enter(out, UpdateState::Cleanup);
    if (auto r = artifact.Remove(); !r.is_ok()) {
        LogWarn("Cleanup: %s", r.msg.c_str());
        out.warnings.push_back(r.msg);
    }
    if (auto r = workdir.Remove(); !r.is_ok()) {
        LogWarn("Cleanup: %s", r.msg.c_str());
        out.warnings.push_back(r.msg);
    }

    Enter(out, UpdateState::Done);
    out.installed_now = ReadInstalledVersion(config_.metadata_file, config_.version_key)
                            .value_or(out.latest);
    out.status = UpdateOutcome::Status::Success;
    LogInfo("%s upgraded to %s", config_.app_name.c_str(), out.installed_now.c_str());
    return out;
}

int ExitCodeFor(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None: return 0;
    case ErrorKind::ConfigError: return 2;
    case ErrorKind::NetworkError:
    case ErrorKind::RemoteProtocolError: return 3;
    case ErrorKind::DownloadError: return 4;
    case ErrorKind::ExtractionError:
    case ErrorKind::InstallError: return 5;
    case ErrorKind::BackupError: return 6;
    case ErrorKind::PreflightError:
    case ErrorKind::PrivilegeError: return 7;
    case ErrorKind::Cancelled: return 130;
    case ErrorKind::VersionParseError:
    case ErrorKind::LinkError:
    case ErrorKind::IoError: return 1;
    }
    return 1;
}

int ExitCodeFor(const UpdateOutcome& outcome) {
    if (outcome.ok())
        return 0;
    return outcome.error ? ExitCodeFor(outcome.error->kind) : 1;
}

} // namespace cursorup
