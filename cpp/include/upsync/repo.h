#pragma once

/// @file repo.h
/// Version-control primitives.  Nothing above this layer talks to git.

#include "types.h"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Forward-declare libgit2 types to avoid pulling the header into every TU.
struct git_repository;

namespace upsync {

// ---------------------------------------------------------------------------
// RepoHandle
// ---------------------------------------------------------------------------

/// Abstract view of the local working copy and its upstream remote.
///
/// Refs are anything git's revparse understands ("HEAD",
/// "refs/remotes/upstream/main").  Path arguments are repo-relative; a
/// directory path covers everything below it.
class RepoHandle {
public:
    virtual ~RepoHandle() = default;

    /// Make sure remote @p name exists.  A missing remote is created pointing
    /// at @p url; an existing one is left unchanged.
    /// @return The URL the remote points at.
    virtual std::string ensure_remote(const std::string& name,
                                      const std::string& url) = 0;

    /// Fetch @p remote and resolve its tracking ref for @p branch.
    /// @param timeout  Abort the transfer once this much time has passed.
    /// @throws NetworkError for every transport failure (timeout, unreachable
    ///         host, rejected credentials).
    virtual RemoteState fetch(const std::string& remote,
                              const std::string& branch,
                              std::optional<std::chrono::milliseconds> timeout) = 0;

    /// Contents of @p path at @p ref, or nullopt if absent there.
    virtual std::optional<std::vector<uint8_t>>
    read_file_at_ref(const std::string& path, const std::string& ref) = 0;

    /// Files under @p paths that differ between two refs, sorted.
    virtual std::vector<std::string>
    diff_paths(const std::string& base_ref,
               const std::string& target_ref,
               const std::vector<std::string>& paths) = 0;

    /// Tracked files under @p paths whose working-tree content differs from
    /// @p ref (what a checkout of @p ref would rewrite), sorted.
    virtual std::vector<std::string>
    diff_worktree(const std::string& ref,
                  const std::vector<std::string>& paths) = 0;

    /// Files under @p paths with uncommitted changes: staged, unstaged or
    /// untracked.  Sorted.
    virtual std::vector<std::string>
    status_dirty(const std::vector<std::string>& paths) = 0;

    /// Overwrite each of @p paths in the working tree (and index) with its
    /// content at @p ref.  Every path is attempted; failures are reported
    /// per path rather than thrown.
    virtual std::vector<PathOutcome>
    checkout_paths(const std::string& ref,
                   const std::vector<std::string>& paths) = 0;

    /// Root of the working tree.
    virtual const std::filesystem::path& workdir() const = 0;

    /// Repository metadata directory (where the sync lock lives).
    virtual const std::filesystem::path& git_dir() const = 0;
};

// ---------------------------------------------------------------------------
// GitRepoHandle
// ---------------------------------------------------------------------------

/// RepoHandle backed by libgit2 on a non-bare repository.
class GitRepoHandle : public RepoHandle {
public:
    /// Open the repository containing @p workdir.
    /// @throws NotFoundError if @p workdir is not inside a git work tree.
    /// @throws GitError on other libgit2 failures.
    static std::shared_ptr<GitRepoHandle> open(const std::filesystem::path& workdir);

    ~GitRepoHandle() override;

    GitRepoHandle(const GitRepoHandle&) = delete;
    GitRepoHandle& operator=(const GitRepoHandle&) = delete;

    std::string ensure_remote(const std::string& name,
                              const std::string& url) override;

    RemoteState fetch(const std::string& remote,
                      const std::string& branch,
                      std::optional<std::chrono::milliseconds> timeout) override;

    std::optional<std::vector<uint8_t>>
    read_file_at_ref(const std::string& path, const std::string& ref) override;

    std::vector<std::string>
    diff_paths(const std::string& base_ref,
               const std::string& target_ref,
               const std::vector<std::string>& paths) override;

    std::vector<std::string>
    diff_worktree(const std::string& ref,
                  const std::vector<std::string>& paths) override;

    std::vector<std::string>
    status_dirty(const std::vector<std::string>& paths) override;

    std::vector<PathOutcome>
    checkout_paths(const std::string& ref,
                   const std::vector<std::string>& paths) override;

    const std::filesystem::path& workdir() const override { return workdir_; }
    const std::filesystem::path& git_dir() const override { return git_dir_; }

private:
    GitRepoHandle(git_repository* repo,
                  std::filesystem::path workdir,
                  std::filesystem::path git_dir);

    git_repository*       repo_;    ///< Raw libgit2 handle (owned).
    std::filesystem::path workdir_;
    std::filesystem::path git_dir_;
};

} // namespace upsync
