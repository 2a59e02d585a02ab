#pragma once

#include "config.h"
#include "repo.h"
#include "types.h"

#include <chrono>
#include <memory>
#include <optional>

namespace upsync {

/// Read-only comparison of the local tree against the upstream template.
class RemoteUpdateComparator {
public:
    RemoteUpdateComparator(std::shared_ptr<RepoHandle> repo, Config config);

    /// Fetch upstream and compare VERSION files.
    ///
    /// Never throws.  A failed fetch yields `error = network_unreachable`;
    /// an unknown local or upstream version yields `version_unreadable`.
    /// Both report `update_available = false`.  When upstream is newer the
    /// HEAD-vs-upstream differences inside the sync paths are listed; a
    /// version bump with no such differences adds a warning.
    ///
    /// @param timeout  Optional bound on the fetch.
    UpdateCheck check_update(
        std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

private:
    std::shared_ptr<RepoHandle> repo_;
    Config                      config_;
};

} // namespace upsync
