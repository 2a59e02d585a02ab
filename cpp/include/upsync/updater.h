#pragma once

#include "config.h"
#include "overwrite.h"
#include "repo.h"
#include "types.h"

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>

namespace upsync {

/// The three operations offered to the update workflow.
///
/// Cheap to copy: holds shared pointers to the repository handle and the
/// overwrite policy.
///
/// Usage:
/// @code
///     auto updater = upsync::Updater::open("/path/to/workspace");
///     auto check   = updater.check_update();
///     if (check.update_available) updater.sync({});
/// @endcode
class Updater {
public:
    /// Open the git work tree at @p root with Config::load(root).
    /// @throws NotFoundError if @p root is not a git work tree.
    static Updater open(const std::filesystem::path& root);

    /// Open with an explicit configuration (config.root is used).
    static Updater open(Config config);

    /// Opens a handle of its own on the work tree.
    using RepoFactory = std::function<std::shared_ptr<RepoHandle>()>;

    /// Wrap an existing handle (tests use an in-memory one).
    ///
    /// @param reopen  Source of the handle startup_check() works on; when
    ///                null, GitRepoHandle::open(config.root).
    Updater(std::shared_ptr<RepoHandle> repo, Config config,
            std::shared_ptr<OverwriteStrategy> strategy = nullptr,
            RepoFactory reopen = nullptr);

    /// Read-only comparison with upstream.  Never throws.
    UpdateCheck check_update() const;

    /// Sync the sync paths from upstream.
    SyncResult sync(const SyncOptions& opts) const;

    /// check_update() bounded by @p timeout, with every failure folded into
    /// `update_available = false`.  Never throws.
    ///
    /// The check runs on a handle from the factory, opened on the worker
    /// thread, so a timed-out check still running never shares repo() with
    /// a later check_update() or sync().
    StartupStatus startup_check(std::chrono::milliseconds timeout) const;

    const Config& config() const { return config_; }
    std::shared_ptr<RepoHandle> repo() const { return repo_; }

private:
    std::shared_ptr<RepoHandle>        repo_;
    Config                             config_;
    std::shared_ptr<OverwriteStrategy> strategy_;
    RepoFactory                        reopen_;
};

/// Run @p probe on a worker thread and wait at most @p timeout for it.
///
/// Exceptions from the probe and timeouts both produce
/// `update_available = false`.  On timeout the worker is detached and keeps
/// running; @p probe must own everything it touches.  Never throws.
StartupStatus startup_check(std::function<UpdateCheck()> probe,
                            std::chrono::milliseconds timeout);

} // namespace upsync
