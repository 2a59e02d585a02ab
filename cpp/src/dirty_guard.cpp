#include "upsync/dirty_guard.h"
#include "upsync/error.h"
#include "upsync/log.h"
#include "upsync/paths.h"
#include "upsync/version.h"
#include "internal.h"

namespace upsync {

DirtyTreeGuard::DirtyTreeGuard(std::shared_ptr<RepoHandle> repo)
    : repo_(std::move(repo)) {}

DirtyReport DirtyTreeGuard::is_dirty(const std::optional<std::string>& target_ref) const {
    DirtyReport report;

    for (auto& path : repo_->status_dirty(paths::sync_paths())) {
        if (!paths::in_sync_paths(path)) continue;
        if (VersionStore::is_scratch_file(path)) continue;

        if (target_ref) {
            std::optional<std::vector<uint8_t>> have;
            try {
                have = fsutil::read_file(repo_->workdir() / path);
            } catch (const IoError& e) {
                log::get()->warn("treating {} as modified: {}", path, e.what());
                report.offending_paths.push_back(path);
                continue;
            }
            if (have == repo_->read_file_at_ref(path, *target_ref)) continue;
        }
        report.offending_paths.push_back(path);
    }

    report.dirty = !report.offending_paths.empty();
    if (report.dirty) {
        log::get()->info("{} modified file(s) inside sync paths", report.offending_paths.size());
    }
    return report;
}

} // namespace upsync
