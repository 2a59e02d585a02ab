#include "upsync/updater.h"
#include "upsync/comparator.h"
#include "upsync/executor.h"
#include "upsync/log.h"

#include <future>
#include <thread>

namespace upsync {

Updater Updater::open(const std::filesystem::path& root) {
    return open(Config::load(root));
}

Updater Updater::open(Config config) {
    auto repo = GitRepoHandle::open(config.root);
    return Updater(std::move(repo), std::move(config));
}

Updater::Updater(std::shared_ptr<RepoHandle> repo, Config config,
                 std::shared_ptr<OverwriteStrategy> strategy,
                 RepoFactory reopen)
    : repo_(std::move(repo)),
      config_(std::move(config)),
      strategy_(strategy ? std::move(strategy)
                         : std::make_shared<CheckoutOverwrite>()),
      reopen_(std::move(reopen)) {
    if (!reopen_) {
        reopen_ = [root = config_.root]() -> std::shared_ptr<RepoHandle> {
            return GitRepoHandle::open(root);
        };
    }
}

UpdateCheck Updater::check_update() const {
    return RemoteUpdateComparator(repo_, config_).check_update(config_.fetch_timeout);
}

SyncResult Updater::sync(const SyncOptions& opts) const {
    return SelectiveSyncExecutor(repo_, config_, strategy_).run(opts);
}

StartupStatus Updater::startup_check(std::chrono::milliseconds timeout) const {
    auto reopen = reopen_;
    auto config = config_;
    return upsync::startup_check(
        [reopen, config, timeout] {
            return RemoteUpdateComparator(reopen(), config).check_update(timeout);
        },
        timeout);
}

StartupStatus startup_check(std::function<UpdateCheck()> probe,
                            std::chrono::milliseconds timeout) {
    StartupStatus status;
    try {
        auto promise = std::make_shared<std::promise<UpdateCheck>>();
        auto future  = promise->get_future();

        std::thread worker([promise, probe = std::move(probe)] {
            try {
                promise->set_value(probe());
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        });

        if (future.wait_for(timeout) != std::future_status::ready) {
            worker.detach();
            log::get()->warn("startup update check timed out after {} ms", timeout.count());
            status.timed_out = true;
            return status;
        }
        worker.join();

        auto check = future.get();
        status.update_available = check.update_available && !check.error;
        status.local_version    = check.local_version;
        status.upstream_version = check.upstream_version;
    } catch (const std::exception& e) {
        log::get()->warn("startup update check failed: {}", e.what());
        status.update_available = false;
    }
    return status;
}

} // namespace upsync
