#include "upsync/overwrite.h"

#include <algorithm>

namespace upsync {

std::vector<PathOutcome> CheckoutOverwrite::apply(RepoHandle& repo,
                                                  const std::string& ref,
                                                  const std::vector<std::string>& paths) {
    auto outcomes = repo.checkout_paths(ref, paths);

    // Every requested path gets exactly one outcome.
    for (auto& p : paths) {
        bool seen = std::any_of(outcomes.begin(), outcomes.end(),
                                [&](const PathOutcome& o) { return o.path == p; });
        if (!seen) outcomes.push_back({p, false, std::string("no checkout result")});
    }
    return outcomes;
}

} // namespace upsync
