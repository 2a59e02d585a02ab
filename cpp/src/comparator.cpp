#include "upsync/comparator.h"
#include "upsync/error.h"
#include "upsync/log.h"
#include "upsync/paths.h"
#include "upsync/version.h"

#include <string>

namespace upsync {

RemoteUpdateComparator::RemoteUpdateComparator(std::shared_ptr<RepoHandle> repo,
                                               Config config)
    : repo_(std::move(repo)), config_(std::move(config)) {}

UpdateCheck RemoteUpdateComparator::check_update(
    std::optional<std::chrono::milliseconds> timeout) const {
    UpdateCheck result;
    VersionStore store(repo_->workdir() / config_.version_file);
    result.local_version = store.read();

    try {
        result.upstream_url = repo_->ensure_remote(config_.remote_name,
                                                   config_.upstream_url);

        RemoteState remote;
        try {
            remote = repo_->fetch(config_.remote_name, config_.branch, timeout);
        } catch (const NetworkError& e) {
            log::get()->warn("update check skipped: {}", e.what());
            result.error = ErrorInfo{codes::kNetworkUnreachable, e.what()};
            return result;
        }

        auto blob = repo_->read_file_at_ref(config_.version_file, remote.ref);
        if (blob) {
            result.upstream_version = Version::parse(std::string(blob->begin(), blob->end()));
        }
        result.checked = true;

        if (!result.local_version || !result.upstream_version) {
            std::string which = !result.local_version ? "local" : "upstream";
            result.error = ErrorInfo{codes::kVersionUnreadable,
                                     which + " " + config_.version_file + " is missing or malformed"};
            return result;
        }

        if (*result.upstream_version > *result.local_version) {
            result.changed_paths = repo_->diff_paths("HEAD", remote.ref, paths::sync_paths());
            result.update_available = true;
            if (result.changed_paths.empty()) {
                result.warnings.push_back("version bumped but no tracked paths differ");
            }
        }
        log::get()->info("local {} upstream {}: {}",
                         result.local_version->str(), result.upstream_version->str(),
                         result.update_available ? "update available" : "up to date");
    } catch (const std::exception& e) {
        log::get()->error("update check failed: {}", e.what());
        result.update_available = false;
        result.changed_paths.clear();
        result.error = ErrorInfo{codes::kInternal, e.what()};
    }
    return result;
}

} // namespace upsync
