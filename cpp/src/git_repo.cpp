#include "upsync/repo.h"
#include "upsync/error.h"
#include "upsync/log.h"
#include "upsync/paths.h"

#include <git2.h>

#include <chrono>
#include <set>
#include <string>
#include <vector>

namespace upsync {

// ---------------------------------------------------------------------------
// libgit2 lifecycle: initialise once per process
// ---------------------------------------------------------------------------

namespace {
struct LibGit2Init {
    LibGit2Init()  { git_libgit2_init(); }
    ~LibGit2Init() { git_libgit2_shutdown(); }
};
static LibGit2Init s_libgit2;

[[noreturn]] void throw_git(const std::string& ctx) {
    const git_error* e = git_error_last();
    std::string msg = ctx;
    if (e && e->message) { msg += ": "; msg += e->message; }
    throw GitError(msg);
}

std::string last_error_message() {
    const git_error* e = git_error_last();
    return (e && e->message) ? std::string(e->message) : std::string("unknown error");
}

std::string oid_hex(const git_oid* o) {
    char buf[GIT_OID_HEXSZ + 1];
    git_oid_tostr(buf, sizeof(buf), o);
    return std::string(buf, GIT_OID_HEXSZ);
}

/// RAII wrapper for git_object*.
struct ObjectGuard {
    git_object* o = nullptr;
    ~ObjectGuard() { if (o) git_object_free(o); }
};

/// RAII wrapper for git_tree*.
struct TreeGuard {
    git_tree* t = nullptr;
    ~TreeGuard() { if (t) git_tree_free(t); }
};

/// RAII wrapper for git_diff*.
struct DiffGuard {
    git_diff* d = nullptr;
    ~DiffGuard() { if (d) git_diff_free(d); }
};

/// RAII wrapper for git_remote*.
struct RemoteGuard {
    git_remote* r = nullptr;
    ~RemoteGuard() { if (r) git_remote_free(r); }
};

/// RAII wrapper for git_status_list*.
struct StatusGuard {
    git_status_list* s = nullptr;
    ~StatusGuard() { if (s) git_status_list_free(s); }
};

/// Owned strings exposed as a git_strarray (pathspecs, refspecs).
struct StrArray {
    std::vector<std::string> strs;
    std::vector<char*>       ptrs;
    git_strarray             arr{};

    explicit StrArray(const std::vector<std::string>& in) : strs(in) {
        ptrs.reserve(strs.size());
        for (auto& s : strs) ptrs.push_back(s.data());
        arr.strings = ptrs.data();
        arr.count   = ptrs.size();
    }
    StrArray(const StrArray&) = delete;
    StrArray& operator=(const StrArray&) = delete;
};

std::vector<std::string> normalized(const std::vector<std::string>& in) {
    std::vector<std::string> out;
    out.reserve(in.size());
    for (auto& p : in) out.push_back(paths::normalize(p));
    return out;
}

/// Resolve @p ref to its tree.
/// @throws NotFoundError if the ref does not resolve.
void lookup_tree(git_repository* repo, const std::string& ref, TreeGuard& out) {
    ObjectGuard obj;
    std::string spec = ref + "^{tree}";
    int rc = git_revparse_single(&obj.o, repo, spec.c_str());
    if (rc == GIT_ENOTFOUND) throw NotFoundError(ref);
    if (rc != 0) throw_git("git_revparse_single " + spec);
    if (git_tree_lookup(&out.t, repo, git_object_id(obj.o)) != 0)
        throw_git("git_tree_lookup");
}

bool within_any(const std::string& path, const std::vector<std::string>& prefixes) {
    for (auto& prefix : prefixes) {
        if (paths::is_within(path, prefix)) return true;
    }
    return false;
}

/// Sorted, unique paths touched by a diff, restricted to @p scope.
std::vector<std::string> delta_paths(git_diff* diff, const std::vector<std::string>& scope) {
    std::set<std::string> out;
    size_t n = git_diff_num_deltas(diff);
    for (size_t i = 0; i < n; ++i) {
        const git_diff_delta* d = git_diff_get_delta(diff, i);
        const char* p = (d->status == GIT_DELTA_DELETED || !d->new_file.path)
                            ? d->old_file.path : d->new_file.path;
        if (p && within_any(p, scope)) out.insert(p);
    }
    return {out.begin(), out.end()};
}

// ---------------------------------------------------------------------------
// Fetch failure taxonomy (never leaves this file)
// ---------------------------------------------------------------------------

enum class FetchFailure { Timeout, Unreachable, Auth, Other };

const char* failure_name(FetchFailure f) {
    switch (f) {
        case FetchFailure::Timeout:     return "timeout";
        case FetchFailure::Unreachable: return "unreachable";
        case FetchFailure::Auth:        return "auth";
        case FetchFailure::Other:       return "other";
    }
    return "other"; // unreachable
}

bool mentions_auth(const std::string& msg) {
    for (const char* needle : {"authentication", "401", "403", "credentials"}) {
        if (msg.find(needle) != std::string::npos) return true;
    }
    return false;
}

FetchFailure classify(int rc, bool deadline_hit) {
    if (deadline_hit) return FetchFailure::Timeout;
#if LIBGIT2_VER_MAJOR > 1 || (LIBGIT2_VER_MAJOR == 1 && LIBGIT2_VER_MINOR >= 7)
    if (rc == GIT_TIMEOUT) return FetchFailure::Timeout;
#else
    (void)rc;
#endif
    const git_error* e = git_error_last();
    if (!e) return FetchFailure::Other;
    std::string msg = e->message ? e->message : "";
    switch (e->klass) {
        case GIT_ERROR_HTTP:
        case GIT_ERROR_SSH:
            return mentions_auth(msg) ? FetchFailure::Auth : FetchFailure::Unreachable;
        case GIT_ERROR_NET:
        case GIT_ERROR_SSL:
        case GIT_ERROR_OS:
            return FetchFailure::Unreachable;
        default:
            return mentions_auth(msg) ? FetchFailure::Auth : FetchFailure::Other;
    }
}

/// Transfer deadline shared with the libgit2 progress callbacks.
struct FetchDeadline {
    std::optional<std::chrono::steady_clock::time_point> at;
    bool hit = false;

    int check() {
        if (at && std::chrono::steady_clock::now() >= *at) {
            hit = true;
            return -1; // abort the transfer
        }
        return 0;
    }
};

int on_transfer(const git_indexer_progress* /*stats*/, void* payload) {
    return static_cast<FetchDeadline*>(payload)->check();
}

int on_sideband(const char* /*str*/, int /*len*/, void* payload) {
    return static_cast<FetchDeadline*>(payload)->check();
}

void set_server_timeouts(std::optional<std::chrono::milliseconds> timeout) {
#if LIBGIT2_VER_MAJOR > 1 || (LIBGIT2_VER_MAJOR == 1 && LIBGIT2_VER_MINOR >= 7)
    int ms = timeout ? static_cast<int>(timeout->count()) : 0;
    git_libgit2_opts(GIT_OPT_SET_SERVER_CONNECT_TIMEOUT, ms);
    git_libgit2_opts(GIT_OPT_SET_SERVER_TIMEOUT, ms);
#else
    // Older libgit2 only honours the progress-callback deadline.
    (void)timeout;
#endif
}

std::optional<std::string> ref_target(git_repository* repo, const std::string& name) {
    git_oid oid;
    if (git_reference_name_to_id(&oid, repo, name.c_str()) != 0) return std::nullopt;
    return oid_hex(&oid);
}

std::filesystem::path strip_trailing_slash(const char* p) {
    std::string s = p ? p : "";
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

GitRepoHandle::GitRepoHandle(git_repository* repo,
                             std::filesystem::path workdir,
                             std::filesystem::path git_dir)
    : repo_(repo), workdir_(std::move(workdir)), git_dir_(std::move(git_dir)) {
    // libgit2 counts init calls; a handle outliving s_libgit2 (a detached
    // startup check at exit) keeps the library up until it is freed.
    git_libgit2_init();
}

GitRepoHandle::~GitRepoHandle() {
    if (repo_) git_repository_free(repo_);
    git_libgit2_shutdown();
}

std::shared_ptr<GitRepoHandle> GitRepoHandle::open(const std::filesystem::path& workdir) {
    git_repository* repo = nullptr;
    int rc = git_repository_open_ext(&repo, workdir.string().c_str(),
                                     GIT_REPOSITORY_OPEN_NO_SEARCH, nullptr);
    if (rc == GIT_ENOTFOUND) {
        throw NotFoundError("git work tree: " + workdir.string());
    }
    if (rc != 0) throw_git("git_repository_open_ext");

    if (git_repository_is_bare(repo)) {
        git_repository_free(repo);
        throw NotFoundError("git work tree (repository is bare): " + workdir.string());
    }

    auto wd = strip_trailing_slash(git_repository_workdir(repo));
    auto gd = strip_trailing_slash(git_repository_path(repo));
    log::get()->debug("opened repository {} (gitdir {})", wd.string(), gd.string());
    return std::shared_ptr<GitRepoHandle>(new GitRepoHandle(repo, wd, gd));
}

// ---------------------------------------------------------------------------
// Remote
// ---------------------------------------------------------------------------

std::string GitRepoHandle::ensure_remote(const std::string& name,
                                         const std::string& url) {
    RemoteGuard remote;
    int rc = git_remote_lookup(&remote.r, repo_, name.c_str());
    if (rc == 0) {
        const char* existing = git_remote_url(remote.r);
        return existing ? existing : "";
    }
    if (rc != GIT_ENOTFOUND) throw_git("git_remote_lookup " + name);

    if (git_remote_create(&remote.r, repo_, name.c_str(), url.c_str()) != 0)
        throw_git("git_remote_create " + name);
    log::get()->info("added remote {} -> {}", name, url);
    return url;
}

RemoteState GitRepoHandle::fetch(const std::string& remote_name,
                                 const std::string& branch,
                                 std::optional<std::chrono::milliseconds> timeout) {
    RemoteGuard remote;
    if (git_remote_lookup(&remote.r, repo_, remote_name.c_str()) != 0) {
        throw NetworkError("remote '" + remote_name + "': " + last_error_message());
    }
    const char* url = git_remote_url(remote.r);

    RemoteState state;
    state.ref = "refs/remotes/" + remote_name + "/" + branch;
    state.url = url ? url : "";
    auto before = ref_target(repo_, state.ref);

    FetchDeadline deadline;
    if (timeout) deadline.at = std::chrono::steady_clock::now() + *timeout;
    set_server_timeouts(timeout);

    git_fetch_options opts;
    git_fetch_options_init(&opts, GIT_FETCH_OPTIONS_VERSION);
    opts.callbacks.transfer_progress = on_transfer;
    opts.callbacks.sideband_progress = on_sideband;
    opts.callbacks.payload           = &deadline;

    log::get()->debug("fetching {} ({})", remote_name, state.url);
    int rc = git_remote_fetch(remote.r, nullptr, &opts, "upsync: fetch");
    if (rc != 0) {
        auto kind = classify(rc, deadline.hit);
        auto msg  = last_error_message();
        log::get()->warn("fetch {} failed ({}): {}", remote_name, failure_name(kind), msg);
        throw NetworkError(std::string(failure_name(kind)) + ": " + msg);
    }

    auto after = ref_target(repo_, state.ref);
    if (!after) {
        throw NetworkError("remote '" + remote_name + "' has no branch '" + branch + "'");
    }
    state.commit     = *after;
    state.updated    = before != after;
    state.fetched_at = std::chrono::system_clock::now();
    log::get()->debug("{} at {}{}", state.ref, state.commit,
                      state.updated ? "" : " (nothing new)");
    return state;
}

// ---------------------------------------------------------------------------
// Reads
// ---------------------------------------------------------------------------

std::optional<std::vector<uint8_t>>
GitRepoHandle::read_file_at_ref(const std::string& path, const std::string& ref) {
    ObjectGuard obj;
    std::string spec = ref + ":" + paths::normalize(path);
    int rc = git_revparse_single(&obj.o, repo_, spec.c_str());
    if (rc == GIT_ENOTFOUND) return std::nullopt;
    if (rc != 0) throw_git("git_revparse_single " + spec);
    if (git_object_type(obj.o) != GIT_OBJECT_BLOB) return std::nullopt;

    auto* blob = reinterpret_cast<git_blob*>(obj.o);
    auto* raw  = static_cast<const uint8_t*>(git_blob_rawcontent(blob));
    auto  size = static_cast<size_t>(git_blob_rawsize(blob));
    return std::vector<uint8_t>(raw, raw + size);
}

std::vector<std::string>
GitRepoHandle::diff_paths(const std::string& base_ref,
                          const std::string& target_ref,
                          const std::vector<std::string>& paths) {
    TreeGuard base, target;
    lookup_tree(repo_, base_ref, base);
    lookup_tree(repo_, target_ref, target);

    auto scope = normalized(paths);
    StrArray spec(scope);
    git_diff_options opts = GIT_DIFF_OPTIONS_INIT;
    opts.flags    = GIT_DIFF_DISABLE_PATHSPEC_MATCH;
    opts.pathspec = spec.arr;

    DiffGuard diff;
    if (git_diff_tree_to_tree(&diff.d, repo_, base.t, target.t, &opts) != 0)
        throw_git("git_diff_tree_to_tree");
    return delta_paths(diff.d, scope);
}

std::vector<std::string>
GitRepoHandle::diff_worktree(const std::string& ref,
                             const std::vector<std::string>& paths) {
    TreeGuard tree;
    lookup_tree(repo_, ref, tree);

    auto scope = normalized(paths);
    StrArray spec(scope);
    git_diff_options opts = GIT_DIFF_OPTIONS_INIT;
    opts.flags    = GIT_DIFF_DISABLE_PATHSPEC_MATCH;
    opts.pathspec = spec.arr;

    DiffGuard diff;
    if (git_diff_tree_to_workdir_with_index(&diff.d, repo_, tree.t, &opts) != 0)
        throw_git("git_diff_tree_to_workdir_with_index");
    return delta_paths(diff.d, scope);
}

std::vector<std::string>
GitRepoHandle::status_dirty(const std::vector<std::string>& paths) {
    auto scope = normalized(paths);
    StrArray spec(scope);
    git_status_options opts = GIT_STATUS_OPTIONS_INIT;
    opts.show     = GIT_STATUS_SHOW_INDEX_AND_WORKDIR;
    opts.flags    = GIT_STATUS_OPT_INCLUDE_UNTRACKED |
                    GIT_STATUS_OPT_RECURSE_UNTRACKED_DIRS |
                    GIT_STATUS_OPT_EXCLUDE_SUBMODULES |
                    GIT_STATUS_OPT_DISABLE_PATHSPEC_MATCH;
    opts.pathspec = spec.arr;

    StatusGuard list;
    if (git_status_list_new(&list.s, repo_, &opts) != 0)
        throw_git("git_status_list_new");

    std::set<std::string> out;
    size_t n = git_status_list_entrycount(list.s);
    for (size_t i = 0; i < n; ++i) {
        const git_status_entry* e = git_status_byindex(list.s, i);
        if (e->status == GIT_STATUS_CURRENT || (e->status & GIT_STATUS_IGNORED))
            continue;
        const git_diff_delta* d = e->index_to_workdir ? e->index_to_workdir
                                                      : e->head_to_index;
        if (!d) continue;
        const char* p = d->new_file.path ? d->new_file.path : d->old_file.path;
        if (p && within_any(p, scope)) out.insert(p);
    }
    return {out.begin(), out.end()};
}

// ---------------------------------------------------------------------------
// Writes
// ---------------------------------------------------------------------------

std::vector<PathOutcome>
GitRepoHandle::checkout_paths(const std::string& ref,
                              const std::vector<std::string>& paths) {
    std::vector<PathOutcome> outcomes;
    outcomes.reserve(paths.size());

    ObjectGuard target;
    std::string spec = ref + "^{tree}";
    if (git_revparse_single(&target.o, repo_, spec.c_str()) != 0) {
        auto msg = last_error_message();
        for (auto& p : paths) outcomes.push_back({p, false, msg});
        return outcomes;
    }

    for (auto& p : paths) {
        PathOutcome outcome{p, true, std::nullopt};
        try {
            StrArray one(std::vector<std::string>{paths::normalize(p)});
            git_checkout_options opts;
            git_checkout_options_init(&opts, GIT_CHECKOUT_OPTIONS_VERSION);
            opts.checkout_strategy = GIT_CHECKOUT_FORCE |
                                     GIT_CHECKOUT_DISABLE_PATHSPEC_MATCH;
            opts.paths = one.arr;

            if (git_checkout_tree(repo_, target.o, &opts) != 0) {
                outcome.ok    = false;
                outcome.error = last_error_message();
            }
        } catch (const InvalidPathError& e) {
            outcome.ok    = false;
            outcome.error = e.what();
        }
        if (outcome.ok) {
            log::get()->debug("checked out {} from {}", p, ref);
        } else {
            log::get()->error("checkout of {} failed: {}", p, *outcome.error);
        }
        outcomes.push_back(std::move(outcome));
    }
    return outcomes;
}

} // namespace upsync
