#pragma once

/// @file version.h
/// The VERSION file inside the synced tree.

#include "types.h"

#include <filesystem>

namespace upsync {

/// Reads and writes the single semantic version string kept in a
/// plain-text file.
class VersionStore {
public:
    explicit VersionStore(std::filesystem::path file);

    /// Parse the file.  A missing, unreadable or malformed file yields
    /// nullopt; this never throws.
    MaybeVersion read() const;

    /// Replace the file with "MAJOR.MINOR.PATCH\n".
    ///
    /// The text goes to a temporary sibling which is then renamed over the
    /// target, so a crash leaves either the old or the new version.
    /// Temporaries left behind by an earlier crash are removed first.
    /// @throws IoError if the temporary cannot be written or renamed.
    void write(const Version& v) const;

    /// True for a temporary sibling created by write() ("<name>.upsync-tmp.N").
    static bool is_scratch_file(const std::string& path);

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace upsync
