#include "upsync/executor.h"
#include "upsync/backup.h"
#include "upsync/dirty_guard.h"
#include "upsync/error.h"
#include "upsync/log.h"
#include "upsync/paths.h"
#include "upsync/version.h"
#include "internal.h"

#include <string>

namespace upsync {

const char* state_name(SelectiveSyncExecutor::State s) {
    using State = SelectiveSyncExecutor::State;
    switch (s) {
        case State::Idle:          return "idle";
        case State::Fetching:      return "fetching";
        case State::GuardChecking: return "guard_checking";
        case State::Blocked:       return "blocked";
        case State::BackingUp:     return "backing_up";
        case State::CheckingOut:   return "checking_out";
        case State::Finalizing:    return "finalizing";
        case State::Done:          return "done";
        case State::Failed:        return "failed";
    }
    return "unknown"; // unreachable
}

SelectiveSyncExecutor::SelectiveSyncExecutor(std::shared_ptr<RepoHandle> repo,
                                             Config config,
                                             std::shared_ptr<OverwriteStrategy> strategy)
    : repo_(std::move(repo)),
      config_(std::move(config)),
      strategy_(strategy ? std::move(strategy)
                         : std::make_shared<CheckoutOverwrite>()) {}

void SelectiveSyncExecutor::enter(State s) {
    state_ = s;
    trace_.push_back(s);
    log::get()->debug("sync: {}", state_name(s));
}

SyncResult SelectiveSyncExecutor::run(const SyncOptions& opts) {
    trace_.clear();
    enter(State::Idle);

    SyncResult result;
    try {
        lock::with_sync_lock(repo_->git_dir(), config_.lock_wait,
                             [&] { result = run_locked(opts); });
    } catch (const LockError& e) {
        log::get()->warn("sync not started: {}", e.what());
        enter(State::Failed);
        result = SyncResult{};
        result.status = SyncStatus::Locked;
        result.version_before = VersionStore(repo_->workdir() / config_.version_file).read();
        result.version_after  = result.version_before;
        result.error = ErrorInfo{codes::kLockHeld, e.what()};
    } catch (const UpsyncError& e) {
        log::get()->error("sync failed: {}", e.what());
        enter(State::Failed);
        result = SyncResult{};
        result.status = SyncStatus::Error;
        result.version_before = VersionStore(repo_->workdir() / config_.version_file).read();
        result.version_after  = result.version_before;
        result.error = ErrorInfo{codes::kInternal, e.what()};
    }
    return result;
}

SyncResult SelectiveSyncExecutor::run_locked(const SyncOptions& opts) {
    SyncResult result;
    VersionStore store(repo_->workdir() / config_.version_file);
    result.version_before = store.read();
    result.version_after  = result.version_before;
    const auto sync_paths = paths::sync_paths();

    // -- Fetching -----------------------------------------------------------
    enter(State::Fetching);
    RemoteState remote;
    try {
        result.upstream_url = repo_->ensure_remote(config_.remote_name, config_.upstream_url);
        remote = repo_->fetch(config_.remote_name, config_.branch, config_.fetch_timeout);
    } catch (const NetworkError& e) {
        enter(State::Failed);
        result.status = SyncStatus::NetworkError;
        result.error  = ErrorInfo{codes::kNetworkUnreachable, e.what()};
        return result;
    } catch (const GitError& e) {
        // Remote could not be configured; nothing can be fetched.
        enter(State::Failed);
        result.status = SyncStatus::NetworkError;
        result.error  = ErrorInfo{codes::kNetworkUnreachable, e.what()};
        return result;
    }

    // -- GuardChecking ------------------------------------------------------
    enter(State::GuardChecking);
    auto dirty = DirtyTreeGuard(repo_).is_dirty(remote.ref);
    if (dirty.dirty) {
        result.dirty_paths = dirty.offending_paths;
        if (!opts.force) {
            enter(State::Blocked);
            result.status = SyncStatus::DirtyTree;
            result.error  = ErrorInfo{codes::kDirtyTree,
                                      std::to_string(dirty.offending_paths.size()) +
                                      " uncommitted change(s) inside sync paths; "
                                      "commit them or force the sync"};
            return result;
        }
        log::get()->warn("forcing sync over {} modified file(s)", dirty.offending_paths.size());
    }

    result.changed_files = repo_->diff_worktree(remote.ref, sync_paths);
    auto blob = repo_->read_file_at_ref(config_.version_file, remote.ref);
    MaybeVersion upstream_version;
    if (blob) upstream_version = Version::parse(std::string(blob->begin(), blob->end()));

    if (opts.dry_run) {
        enter(State::Done);
        result.status        = SyncStatus::DryRun;
        result.version_after = upstream_version ? upstream_version : result.version_before;
        return result;
    }

    if (!result.changed_files.empty()) {
        // -- BackingUp ------------------------------------------------------
        enter(State::BackingUp);
        BackupManager backups(repo_->workdir(), repo_->workdir() / config_.backup_dir);
        try {
            auto snap = backups.snapshot(result.changed_files);
            result.backup_location = snap.root;
        } catch (const BackupError& e) {
            log::get()->error("sync aborted before any write: {}", e.what());
            enter(State::Failed);
            result.status = SyncStatus::BackupError;
            result.error  = ErrorInfo{codes::kBackupError, e.what()};
            return result;
        }

        // -- CheckingOut ----------------------------------------------------
        enter(State::CheckingOut);
        log::get()->info("overwriting {} sync path(s) with the {} strategy",
                         sync_paths.size(), strategy_->name());
        result.paths = strategy_->apply(*repo_, remote.ref, sync_paths);

        std::string failed;
        size_t n_failed = 0;
        for (auto& p : result.paths) {
            if (p.ok) continue;
            if (n_failed++ > 0) failed += ", ";
            failed += p.path;
        }
        if (n_failed > 0) {
            enter(State::Failed);
            result.status        = SyncStatus::PartialFailure;
            result.version_after = store.read();
            result.error = ErrorInfo{codes::kPartialSync,
                                     std::to_string(n_failed) + " of " +
                                     std::to_string(result.paths.size()) +
                                     " sync paths failed: " + failed};
            return result;
        }
    } else {
        log::get()->info("already up to date with {}", remote.ref);
    }

    // -- Finalizing ---------------------------------------------------------
    enter(State::Finalizing);
    if (upstream_version && store.read() != upstream_version) {
        try {
            store.write(*upstream_version);
        } catch (const IoError& e) {
            enter(State::Failed);
            result.paths.push_back({config_.version_file, false, std::string(e.what())});
            result.status        = SyncStatus::PartialFailure;
            result.version_after = store.read();
            result.error         = ErrorInfo{codes::kPartialSync, e.what()};
            return result;
        }
    }
    result.version_after = store.read();

    enter(State::Done);
    result.status = SyncStatus::Success;
    log::get()->info("synced {} file(s): {} -> {}", result.changed_files.size(),
                     version_label(result.version_before),
                     version_label(result.version_after));
    return result;
}

} // namespace upsync
