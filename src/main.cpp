#include "net/curl_http_client.hpp"
#include "system/privileged_fs.hpp"
#include "system/process.hpp"
#include "system/signals.hpp"
#include "updater/confirmation.hpp"
#include "updater/progress_sinks.hpp"
#include "updater/update_orchestrator.hpp"
#include "util/logger.hpp"
#include "util/updater_config.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <getopt.h>
#include <memory>
#include <string>
#include <unistd.h>

namespace {

void PrintUsage(const char* argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-f] [-n] [-c] [-v] [-y] [-C <config.json>]\n"
        "\n"
        "Options:\n"
        "  -f, --force       Reinstall even when the installed version is current\n"
        "  -n, --no-backup   Do not back up the current installation\n"
        "  -c, --check       Only report whether an update is available\n"
        "  -v, --verbose     Debug logging\n"
        "  -y, --yes         Continue without a backup if the backup fails\n"
        "  -C, --config      JSON config file (default: $%s, then %s)\n"
        "  -h, --help        Show this help\n",
        argv0, cursorup::kConfigPathEnv, cursorup::kDefaultConfigPath);
}

// --config, then $CURSOR_UPDATER_CONFIG, then the system default if present.
// Only the first two are required to load.
cursorup::Result LoadConfig(const char* cli_path, cursorup::UpdaterConfig& cfg) {
    std::string path;
    bool required = true;
    if (cli_path) {
        path = cli_path;
    } else if (const char* env = std::getenv(cursorup::kConfigPathEnv); env && *env) {
        path = env;
    } else {
        std::error_code ec;
        if (!std::filesystem::exists(cursorup::kDefaultConfigPath, ec)) {
            cfg.ExpandPaths();
            return cursorup::Result::Ok();
        }
        path = cursorup::kDefaultConfigPath;
        required = false;
    }

    auto res = cursorup::UpdaterConfig::LoadFromFile(path, cfg);
    if (!res.is_ok() && !required) {
        std::fprintf(stderr, "WARN: %s (using defaults)\n", res.msg.c_str());
        cfg.ExpandPaths();
        return cursorup::Result::Ok();
    }
    return res;
}

} // namespace

int main(int argc, char** argv) {
    cursorup::InstallSignalHandlers();

    cursorup::UpdateOptions opts{};
    bool verbose = false;
    bool assume_yes = false;
    const char* config_path = nullptr;

    static option long_opts[] = {
        {"force", no_argument, nullptr, 'f'},
        {"no-backup", no_argument, nullptr, 'n'},
        {"check", no_argument, nullptr, 'c'},
        {"verbose", no_argument, nullptr, 'v'},
        {"yes", no_argument, nullptr, 'y'},
        {"config", required_argument, nullptr, 'C'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "fncvyC:h", long_opts, &idx)) != -1) {
        switch (c) {
            case 'f': opts.force = true; break;
            case 'n': opts.skip_backup = true; break;
            case 'c': opts.check_only = true; break;
            case 'v': verbose = true; break;
            case 'y': assume_yes = true; break;
            case 'C': config_path = optarg; break;
            case 'h':
                PrintUsage(argv[0]);
                return 0;
            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }
    if (optind < argc) {
        std::fprintf(stderr, "Unexpected argument: %s\n", argv[optind]);
        PrintUsage(argv[0]);
        return 2;
    }

    auto& logger = cursorup::Logger::Instance();
    logger.SetLevel(verbose ? cursorup::LogLevel::Debug : cursorup::LogLevel::Info);

    cursorup::UpdaterConfig cfg;
    if (auto r = LoadConfig(config_path, cfg); !r.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return cursorup::ExitCodeFor(r.kind);
    }
    if (auto r = cfg.Validate(); !r.is_ok()) {
        std::fprintf(stderr, "ERROR: invalid config: %s\n", r.msg.c_str());
        return cursorup::ExitCodeFor(r.kind);
    }

    if (!cfg.log_file.empty() && !logger.SetLogFile(cfg.log_file)) {
        std::fprintf(stderr, "WARN: cannot open log file %s\n", cfg.log_file.c_str());
    }
    if (::geteuid() != 0 && !opts.check_only)
        cfg.required_tools.push_back("sudo");

    LogInfo("Starting %s updater", cfg.app_name.c_str());

    cursorup::CurlHttpClient http;
    cursorup::PosixProcessRunner runner;
    std::unique_ptr<cursorup::IPrivilegedFs> fs = cursorup::CreateDefaultPrivilegedFs(runner);
    cursorup::ConsoleProgressSink progress;
    std::unique_ptr<cursorup::IConfirmation> confirm;
    if (assume_yes)
        confirm = std::make_unique<cursorup::FixedConfirmation>(true);
    else
        confirm = std::make_unique<cursorup::TerminalConfirmation>();

    cursorup::UpdateOrchestrator orchestrator(cfg, http, runner, *fs, *confirm, &progress);
    const cursorup::UpdateOutcome outcome = orchestrator.Run(opts);

    switch (outcome.status) {
        case cursorup::UpdateOutcome::Status::UpToDate:
            std::printf("✓ Already up to date.\n");
            break;
        case cursorup::UpdateOutcome::Status::CheckOnly:
            std::printf("%s\n", outcome.report.c_str());
            break;
        case cursorup::UpdateOutcome::Status::Success: {
            std::printf("✓ %s has been upgraded to version %s\n", cfg.app_name.c_str(),
                        outcome.installed_now.c_str());
            const std::string launcher = std::filesystem::path(cfg.symlink_path).filename().string();
            std::printf("  Run `%s` to launch\n", launcher.c_str());
            for (const auto& w : outcome.warnings)
                std::fprintf(stderr, "WARN: %s\n", w.c_str());
            break;
        }
        case cursorup::UpdateOutcome::Status::Aborted: {
            const std::string cause = outcome.error ? outcome.error->msg : "unknown failure";
            std::fprintf(stderr, "ERROR: %s\n", cause.c_str());
            const std::string log = logger.LogFilePath();
            if (!log.empty())
                std::fprintf(stderr, "See log for details: %s\n", log.c_str());
            break;
        }
    }

    return cursorup::ExitCodeFor(outcome);
}
