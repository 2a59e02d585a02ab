#pragma once

/// @file backup.h
/// Pre-overwrite snapshots under the backup root.

#include "types.h"

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace upsync {

/// Copies the current content of paths that are about to be overwritten
/// into `<backup_root>/<timestamp>/`, mirroring their relative layout.
class BackupManager {
public:
    /// Copies one regular file; throws on failure.
    using CopyFn = std::function<void(const std::filesystem::path& from,
                                      const std::filesystem::path& to)>;

    /// @param workdir      Root the relative paths are resolved against.
    /// @param backup_root  Directory receiving timestamped snapshots.
    /// @param copy         File copier (defaults to std::filesystem::copy_file).
    BackupManager(std::filesystem::path workdir,
                  std::filesystem::path backup_root,
                  CopyFn copy = {});

    /// Snapshot every file at or below each entry of @p paths.
    ///
    /// Paths with nothing on disk are listed in `absent`.  Each copy is
    /// verified byte-for-byte.  On any failure the partial snapshot
    /// directory is removed before BackupError is thrown, so a returned
    /// snapshot is always complete.
    /// @throws BackupError
    BackupSnapshot snapshot(const std::vector<std::string>& paths) const;

    /// Directory name for a snapshot taken at @p t: UTC ISO 8601 basic time,
    /// e.g. "20261017T093005Z".
    static std::string timestamp_name(std::chrono::system_clock::time_point t);

    const std::filesystem::path& backup_root() const { return backup_root_; }

private:
    std::filesystem::path workdir_;
    std::filesystem::path backup_root_;
    CopyFn                copy_;
};

} // namespace upsync
