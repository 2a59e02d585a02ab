#pragma once

#include "repo.h"
#include "types.h"

#include <memory>
#include <optional>
#include <string>

namespace upsync {

/// Detects in-flight edits to system files.
///
/// Only the sync paths are inspected; changes in user territory are
/// irrelevant because a sync never writes there.
class DirtyTreeGuard {
public:
    explicit DirtyTreeGuard(std::shared_ptr<RepoHandle> repo);

    /// Report uncommitted modifications inside the sync paths.
    ///
    /// When @p target_ref is given, files whose working-tree bytes already
    /// equal their content at that ref are skipped (e.g. files written by a
    /// previous sync): overwriting them would lose nothing.  Temporaries
    /// left by an interrupted VERSION write never count as edits.
    DirtyReport is_dirty(const std::optional<std::string>& target_ref = std::nullopt) const;

private:
    std::shared_ptr<RepoHandle> repo_;
};

} // namespace upsync
