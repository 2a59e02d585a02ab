#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace upsync {

// ---------------------------------------------------------------------------
// Version
// ---------------------------------------------------------------------------

/// A semantic version triple, ordered lexicographically.
///
/// Fields avoid the names `major`/`minor`, which glibc defines as macros.
struct Version {
    uint32_t major_version = 0;
    uint32_t minor_version = 0;
    uint32_t patch_version = 0;

    /// Parse "MAJOR.MINOR.PATCH" (surrounding whitespace and a leading `v`
    /// are tolerated).  Returns nullopt for anything else.
    static std::optional<Version> parse(const std::string& text);

    /// Format as "MAJOR.MINOR.PATCH".
    std::string str() const;

    bool operator==(const Version& o) const {
        return major_version == o.major_version &&
               minor_version == o.minor_version &&
               patch_version == o.patch_version;
    }
    bool operator!=(const Version& o) const { return !(*this == o); }
    bool operator<(const Version& o) const {
        if (major_version != o.major_version) return major_version < o.major_version;
        if (minor_version != o.minor_version) return minor_version < o.minor_version;
        return patch_version < o.patch_version;
    }
    bool operator>(const Version& o) const  { return o < *this; }
    bool operator<=(const Version& o) const { return !(o < *this); }
    bool operator>=(const Version& o) const { return !(*this < o); }
};

/// A version that may be unknown (missing or malformed file).
using MaybeVersion = std::optional<Version>;

/// "unknown" for an absent version, otherwise Version::str().
inline std::string version_label(const MaybeVersion& v) {
    return v ? v->str() : std::string("unknown");
}

// ---------------------------------------------------------------------------
// RemoteState
// ---------------------------------------------------------------------------

/// Outcome of a successful fetch.  Transient, never persisted.
struct RemoteState {
    std::string ref;        ///< Remote-tracking ref, e.g. refs/remotes/upstream/main.
    std::string commit;     ///< 40-char hex SHA the ref points at after fetch.
    std::string url;        ///< URL the remote resolved to.
    bool        updated = false; ///< False when the fetch brought nothing new.
    std::chrono::system_clock::time_point fetched_at;
};

// ---------------------------------------------------------------------------
// Per-path outcomes
// ---------------------------------------------------------------------------

/// Result of overwriting one sync path.
struct PathOutcome {
    std::string                path;
    bool                       ok = true;
    std::optional<std::string> error;
};

// ---------------------------------------------------------------------------
// DirtyReport
// ---------------------------------------------------------------------------

/// Uncommitted modifications found inside the sync paths.
struct DirtyReport {
    bool                     dirty = false;
    std::vector<std::string> offending_paths;
};

// ---------------------------------------------------------------------------
// BackupSnapshot
// ---------------------------------------------------------------------------

/// One file captured in a backup snapshot.
struct BackupEntry {
    std::string path;  ///< Repo-relative path.
    uint64_t    size;  ///< Bytes copied.
};

/// A completed, verified backup snapshot.
struct BackupSnapshot {
    std::string              root;     ///< Absolute snapshot directory.
    std::vector<BackupEntry> manifest; ///< Files copied, sorted by path.
    std::vector<std::string> absent;   ///< Requested paths with nothing on disk.
};

// ---------------------------------------------------------------------------
// Structured errors
// ---------------------------------------------------------------------------

/// Machine-readable error attached to a result.
struct ErrorInfo {
    std::string code;    ///< e.g. "network_unreachable", "dirty_tree".
    std::string message; ///< Human-readable detail.
};

namespace codes {
constexpr const char* kNetworkUnreachable = "network_unreachable";
constexpr const char* kVersionUnreadable  = "version_unreadable";
constexpr const char* kDirtyTree          = "dirty_tree";
constexpr const char* kBackupError        = "backup_error";
constexpr const char* kPartialSync        = "partial_sync";
constexpr const char* kLockHeld           = "lock_held";
constexpr const char* kInternal           = "internal";
} // namespace codes

// ---------------------------------------------------------------------------
// UpdateCheck
// ---------------------------------------------------------------------------

/// Result of a read-only comparison against upstream.
struct UpdateCheck {
    bool                       checked = false;  ///< Fetch and comparison ran.
    bool                       update_available = false;
    MaybeVersion               local_version;
    MaybeVersion               upstream_version;
    std::vector<std::string>   changed_paths;
    std::optional<std::string> upstream_url;
    std::optional<ErrorInfo>   error;
    std::vector<std::string>   warnings;
};

// ---------------------------------------------------------------------------
// SyncResult
// ---------------------------------------------------------------------------

enum class SyncStatus : uint8_t {
    Success,
    DryRun,
    DirtyTree,
    NetworkError,
    BackupError,
    PartialFailure,
    Locked,
    Error,           ///< Unexpected library failure (code "internal").
};

/// Wire name of a status ("success", "dry_run", ...).
const char* status_name(SyncStatus s);

/// Outcome of one sync invocation.  Returned once, never persisted.
struct SyncResult {
    SyncStatus                 status = SyncStatus::Success;
    std::vector<std::string>   changed_files;
    std::optional<std::string> backup_location;
    MaybeVersion               version_before;
    MaybeVersion               version_after;
    std::vector<PathOutcome>   paths;        ///< Per sync path; empty for dry runs.
    std::vector<std::string>   dirty_paths;  ///< Set for dirty_tree.
    std::optional<std::string> upstream_url;
    std::optional<ErrorInfo>   error;
};

/// Options for a sync invocation.
struct SyncOptions {
    bool dry_run = false;
    bool force   = false;
};

// ---------------------------------------------------------------------------
// StartupStatus
// ---------------------------------------------------------------------------

/// Best-effort update probe run during startup.  Never carries an error.
struct StartupStatus {
    bool         update_available = false;
    MaybeVersion local_version;
    MaybeVersion upstream_version;
    bool         timed_out = false;
};

} // namespace upsync
