/**
 * Command-line front end for the update workflow.
 * Usage: upsync [--base-path DIR] [--verbose] <command>
 *   check-update
 *   sync [--dry-run] [--force]
 *   startup-check [--timeout SECONDS]
 * Prints one JSON document on stdout; logs go to stderr.
 */

#include <upsync/upsync.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static const char* kUsage =
    "Usage: upsync [--base-path DIR] [--verbose] <command>\n"
    "  check-update                    compare local VERSION with upstream\n"
    "  sync [--dry-run] [--force]      update the template paths from upstream\n"
    "  startup-check [--timeout SECS]  bounded best-effort update probe\n";

struct Args {
    fs::path    base_path = fs::current_path();
    bool        verbose   = false;
    std::string command;
    bool        dry_run   = false;
    bool        force     = false;
    std::optional<std::chrono::milliseconds> timeout;
};

static int usage_error(const std::string& msg) {
    std::cerr << "upsync: " << msg << "\n" << kUsage;
    return 2;
}

/// Parse argv into @p out.  Returns an empty string or an error message.
static std::string parse_args(int argc, char* argv[], Args& out) {
    std::vector<std::string> args(argv + 1, argv + argc);
    for (size_t i = 0; i < args.size(); ++i) {
        const auto& a = args[i];
        if (a == "--base-path") {
            if (++i >= args.size()) return "--base-path needs a directory";
            out.base_path = args[i];
        } else if (a == "--verbose" || a == "-v") {
            out.verbose = true;
        } else if (a == "--dry-run") {
            out.dry_run = true;
        } else if (a == "--force") {
            out.force = true;
        } else if (a == "--timeout") {
            if (++i >= args.size()) return "--timeout needs a value";
            out.timeout = upsync::parse_timeout_seconds(args[i]);
            if (!out.timeout) return "invalid --timeout: " + args[i];
        } else if (!a.empty() && a[0] == '-') {
            return "unknown option " + a;
        } else if (out.command.empty()) {
            out.command = a;
        } else {
            return "unexpected argument " + a;
        }
    }
    if (out.command.empty()) return "missing command";
    if (out.command != "check-update" && out.command != "sync" &&
        out.command != "startup-check") {
        return "unknown command " + out.command;
    }
    if ((out.dry_run || out.force) && out.command != "sync") {
        return "--dry-run and --force only apply to sync";
    }
    if (out.timeout && out.command != "startup-check") {
        return "--timeout only applies to startup-check";
    }
    return {};
}

static void emit(const upsync::json& j) {
    std::cout << upsync::report::render(j);
    std::cout.flush();
}

int main(int argc, char* argv[]) {
    Args args;
    if (auto err = parse_args(argc, argv, args); !err.empty()) {
        return usage_error(err);
    }

    upsync::log::init(args.verbose ? spdlog::level::debug : spdlog::level::warn);

    if (args.command == "startup-check") {
        // Never fails: even an unopenable workspace reports no update.
        upsync::StartupStatus status;
        try {
            auto config = upsync::Config::load(args.base_path);
            if (args.timeout) config.startup_timeout = *args.timeout;
            auto updater = upsync::Updater::open(config);
            status = updater.startup_check(config.startup_timeout);
        } catch (const std::exception& e) {
            upsync::log::get()->warn("startup check unavailable: {}", e.what());
        }
        emit(status);
        if (status.timed_out) {
            // The probe thread may still be blocked in the transport.
            spdlog::shutdown();
            std::fflush(nullptr);
            std::_Exit(0);
        }
        return 0;
    }

    try {
        auto updater = upsync::Updater::open(args.base_path);
        if (args.command == "check-update") {
            emit(updater.check_update());
        } else {
            upsync::SyncOptions opts;
            opts.dry_run = args.dry_run;
            opts.force   = args.force;
            auto result = updater.sync(opts);
            emit(result);
            if (result.status == upsync::SyncStatus::Error) return 1;
        }
    } catch (const std::exception& e) {
        upsync::log::get()->error("{}", e.what());
        emit(upsync::report::failure(upsync::codes::kInternal, e.what()));
        return 1;
    }
    return 0;
}
