#pragma once

#include "config.h"
#include "overwrite.h"
#include "repo.h"
#include "types.h"

#include <memory>
#include <string>
#include <vector>

namespace upsync {

/// Orchestrates fetch, dirty guard, backup, overwrite and VERSION update.
///
/// Runs under the advisory sync lock.  Every outcome, including network,
/// dirty-tree, backup and lock failures, is returned as a SyncResult.
class SelectiveSyncExecutor {
public:
    enum class State {
        Idle,
        Fetching,
        GuardChecking,
        Blocked,
        BackingUp,
        CheckingOut,
        Finalizing,
        Done,
        Failed,
    };

    /// @param strategy  Overwrite policy; CheckoutOverwrite when null.
    SelectiveSyncExecutor(std::shared_ptr<RepoHandle> repo,
                          Config config,
                          std::shared_ptr<OverwriteStrategy> strategy = nullptr);

    /// Run one sync.  Never throws for library failures: a lock held
    /// elsewhere yields Locked, any other UpsyncError (lock file I/O,
    /// libgit2 internals) yields Error with code "internal".
    SyncResult run(const SyncOptions& opts);

    /// Last state reached by run().
    State state() const { return state_; }

    /// States visited by the last run(), in order.
    const std::vector<State>& trace() const { return trace_; }

private:
    SyncResult run_locked(const SyncOptions& opts);
    void       enter(State s);

    std::shared_ptr<RepoHandle>        repo_;
    Config                             config_;
    std::shared_ptr<OverwriteStrategy> strategy_;
    State                              state_ = State::Idle;
    std::vector<State>                 trace_;
};

/// Name of an executor state, for logs.
const char* state_name(SelectiveSyncExecutor::State s);

} // namespace upsync
