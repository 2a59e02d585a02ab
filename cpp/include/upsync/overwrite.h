#pragma once

/// @file overwrite.h
/// How upstream content replaces local content for the sync paths.

#include "repo.h"
#include "types.h"

#include <string>
#include <vector>

namespace upsync {

/// Policy applied by SelectiveSyncExecutor once the backup is taken.
class OverwriteStrategy {
public:
    virtual ~OverwriteStrategy() = default;

    /// Short identifier used in logs.
    virtual const char* name() const = 0;

    /// Bring each of @p paths to its content at @p ref.  Must attempt every
    /// path and report one outcome per path.
    virtual std::vector<PathOutcome> apply(RepoHandle& repo,
                                           const std::string& ref,
                                           const std::vector<std::string>& paths) = 0;
};

/// One-way overwrite: a forced, path-scoped checkout of each path.  Local
/// edits under the paths are discarded; nothing outside them is touched.
class CheckoutOverwrite : public OverwriteStrategy {
public:
    const char* name() const override { return "checkout"; }

    std::vector<PathOutcome> apply(RepoHandle& repo,
                                   const std::string& ref,
                                   const std::vector<std::string>& paths) override;
};

} // namespace upsync
