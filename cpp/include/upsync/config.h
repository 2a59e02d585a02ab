#pragma once

/// @file config.h
/// Engine settings.  The path sets themselves live in paths.h.

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace upsync {

/// Template repository used when the user has not configured one.
inline constexpr const char* kDefaultUpstreamUrl =
    "https://github.com/DorianSchlede/nexus-template.git";

/// User settings file, relative to the root.  Read only.
inline constexpr const char* kUserConfigFile = "01-memory/user-config.yaml";

struct Config {
    std::filesystem::path root;                          ///< Working tree root.
    std::string           remote_name  = "upstream";
    std::string           branch       = "main";
    std::string           upstream_url = kDefaultUpstreamUrl;
    std::string           version_file = "00-system/VERSION"; ///< Relative to the work tree.
    std::string           backup_dir   = ".sync-backup";       ///< Relative to the work tree; in neither path set.

    /// Bound on fetches made by interactive commands (nullopt = none).
    std::optional<std::chrono::milliseconds> fetch_timeout;
    /// Bound on the whole startup probe.
    std::chrono::milliseconds startup_timeout{5000};
    /// How long to wait for another sync to release the lock.
    std::chrono::milliseconds lock_wait{2000};

    /// Defaults for @p root, with `sync.upstream_url` taken from the
    /// front matter of kUserConfigFile when present.  A missing or
    /// malformed file leaves the defaults in place.
    static Config load(const std::filesystem::path& root);
};

/// Upper bound for a startup timeout given on the command line.
inline constexpr std::chrono::seconds kMaxStartupTimeout{3600};

/// Parse a positive number of seconds ("2", "0.5") into milliseconds,
/// clamped to kMaxStartupTimeout.  nullopt for anything else, including
/// zero, negative, infinite and NaN values.
std::optional<std::chrono::milliseconds> parse_timeout_seconds(const std::string& text);

} // namespace upsync
