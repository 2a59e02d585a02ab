#pragma once

/// @file paths.h
/// The fixed path sets that bound every sync.

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace upsync {

// ---------------------------------------------------------------------------
// Path sets
// ---------------------------------------------------------------------------

/// Locations overwritten from upstream: the system tree and the root entry
/// files.  Directories are written without a trailing slash.
inline constexpr std::array<std::string_view, 3> kSyncPaths = {
    "00-system",
    "CLAUDE.md",
    "README.md",
};

/// Locations a sync never touches: user memory, projects, user-authored
/// skills, workspace, secrets and local tool settings.
inline constexpr std::array<std::string_view, 6> kProtectedPaths = {
    "01-memory",
    "02-projects",
    "03-skills",
    "04-workspace",
    ".env",
    ".claude",
};

namespace paths {

/// kSyncPaths as owned strings (libgit2 pathspecs need them).
std::vector<std::string> sync_paths();

/// kProtectedPaths as owned strings.
std::vector<std::string> protected_paths();

/// Normalize a repo-relative path: strip leading/trailing slashes, collapse
/// repeated slashes and `.` segments.
/// @throws InvalidPathError for `..` segments or paths that collapse to
///         nothing.
std::string normalize(const std::string& path);

/// True when @p path equals @p prefix or lies below it.
bool is_within(const std::string& path, const std::string& prefix);

/// True when two path entries overlap (one contains the other).
bool overlaps(const std::string& a, const std::string& b);

/// True when @p path lies inside any sync path.
bool in_sync_paths(const std::string& path);

/// True when @p path lies inside any protected path.
bool in_protected_paths(const std::string& path);

} // namespace paths
} // namespace upsync
