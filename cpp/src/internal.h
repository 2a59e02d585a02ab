#pragma once
/// Internal helpers shared between upsync source files.
/// Not part of the public API.

#include "upsync/error.h"
#include "upsync/types.h"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace upsync {

// ---------------------------------------------------------------------------
// lock: advisory single-flight lock
// ---------------------------------------------------------------------------

namespace lock {

/// Lock file name inside the repository metadata directory.
inline constexpr const char* kLockFile = "upsync.lock";

/// Acquire an exclusive advisory lock on `<gitdir>/upsync.lock`, record the
/// holder PID in it, execute `fn`, then release.  Retries for `wait`.
/// @throws LockError if the lock is still held after `wait`.
/// @throws IoError if the lock file cannot be opened.
void with_sync_lock(const std::filesystem::path& gitdir,
                    std::chrono::milliseconds wait,
                    const std::function<void()>& fn);

} // namespace lock

// ---------------------------------------------------------------------------
// fsutil: small disk helpers
// ---------------------------------------------------------------------------

namespace fsutil {

/// Whole file contents, or nullopt if it does not exist or is not a
/// regular file.
/// @throws IoError if an existing regular file cannot be read.
std::optional<std::vector<uint8_t>> read_file(const std::filesystem::path& p);

/// Walk a local directory recursively, returning sorted relative paths of
/// everything that is not a directory.
std::vector<std::string> disk_walk(const std::filesystem::path& root);

/// True when both files exist and hold identical bytes.
bool same_content(const std::filesystem::path& a,
                  const std::filesystem::path& b);

} // namespace fsutil
} // namespace upsync
