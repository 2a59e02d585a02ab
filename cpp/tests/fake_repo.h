#pragma once

// In-memory RepoHandle for unit tests.  Trees are path -> content maps; the
// working tree is a real temporary directory so backups, the dirty guard
// and VERSION writes exercise the filesystem.

#include <upsync/upsync.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

/// Unique path under the system temp dir (not created).
inline fs::path make_temp_path(const std::string& prefix) {
    static int counter = 0;
    return fs::temp_directory_path() /
           (prefix + std::to_string(
                std::hash<std::thread::id>{}(std::this_thread::get_id())
                ^ static_cast<size_t>(
                      std::chrono::steady_clock::now()
                          .time_since_epoch()
                          .count())) +
            "_" + std::to_string(++counter));
}

inline void write_text(const fs::path& p, const std::string& text) {
    fs::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << text;
}

inline std::optional<std::string> read_text(const fs::path& p) {
    if (!fs::is_regular_file(p)) return std::nullopt;
    std::ifstream in(p, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

/// Every regular file below @p root as relative path -> content.
inline std::map<std::string, std::string> snapshot_dir(const fs::path& root) {
    std::map<std::string, std::string> out;
    if (!fs::exists(root)) return out;
    for (auto& e : fs::recursive_directory_iterator(root)) {
        if (!e.is_regular_file()) continue;
        out[fs::relative(e.path(), root).generic_string()] = *read_text(e.path());
    }
    return out;
}

class FakeRepo : public upsync::RepoHandle {
public:
    using Tree = std::map<std::string, std::string>;

    FakeRepo()
        : workdir_(make_temp_path("upsync_wd_")),
          git_dir_(make_temp_path("upsync_git_")) {
        fs::create_directories(workdir_);
        fs::create_directories(git_dir_);
    }

    ~FakeRepo() override {
        std::error_code ec;
        fs::remove_all(workdir_, ec);
        fs::remove_all(git_dir_, ec);
    }

    // -- Scenario controls --------------------------------------------------

    Tree                  head;            ///< Committed tree (also the index).
    Tree                  upstream;        ///< What the remote's main holds.
    bool                  network_down = false;
    std::set<std::string> fail_checkout;   ///< Sync paths whose checkout fails.
    std::optional<std::string> remote_url; ///< Set once the remote exists.
    std::optional<std::string> remote_error; ///< ensure_remote throws GitError.
    bool                  fail_diff = false; ///< diff_worktree throws GitError.
    std::chrono::milliseconds fetch_delay{0};
    std::atomic<int>      fetch_calls{0};
    std::atomic<int>      in_flight{0};    ///< Calls currently inside this handle.
    std::atomic<int>      max_in_flight{0};

    /// Write @p text to the working tree.
    void put(const std::string& rel, const std::string& text) {
        write_text(workdir_ / rel, text);
    }

    std::optional<std::string> get(const std::string& rel) const {
        return read_text(workdir_ / rel);
    }

    /// Record the working tree (minus backups) as HEAD.
    void commit() {
        head.clear();
        for (auto& [p, text] : snapshot_dir(workdir_)) {
            if (upsync::paths::is_within(p, upsync::Config{}.backup_dir)) continue;
            head[p] = text;
        }
    }

    // -- RepoHandle ---------------------------------------------------------

    std::string ensure_remote(const std::string& /*name*/,
                              const std::string& url) override {
        InFlight busy(*this);
        if (remote_error) throw upsync::GitError(*remote_error);
        if (!remote_url) remote_url = url;
        return *remote_url;
    }

    upsync::RemoteState fetch(const std::string& remote,
                              const std::string& branch,
                              std::optional<std::chrono::milliseconds>) override {
        InFlight busy(*this);
        ++fetch_calls;
        if (fetch_delay.count() > 0) std::this_thread::sleep_for(fetch_delay);
        if (network_down) throw upsync::NetworkError("could not resolve host");
        upsync::RemoteState st;
        st.ref = "refs/remotes/" + remote + "/" + branch;
        st.updated = fetched_.count(st.ref) == 0 || fetched_[st.ref] != upstream;
        st.commit = std::string(40, 'a');
        st.url = remote_url.value_or("");
        st.fetched_at = std::chrono::system_clock::now();
        fetched_[st.ref] = upstream;
        return st;
    }

    std::optional<std::vector<uint8_t>>
    read_file_at_ref(const std::string& path, const std::string& ref) override {
        const Tree& t = tree(ref);
        auto it = t.find(path);
        if (it == t.end()) return std::nullopt;
        return std::vector<uint8_t>(it->second.begin(), it->second.end());
    }

    std::vector<std::string>
    diff_paths(const std::string& base_ref, const std::string& target_ref,
               const std::vector<std::string>& paths) override {
        const Tree& a = tree(base_ref);
        const Tree& b = tree(target_ref);
        std::set<std::string> out;
        for (auto& p : keys_under(a, b, paths)) {
            auto ia = a.find(p);
            auto ib = b.find(p);
            if (ia == a.end() || ib == b.end() || ia->second != ib->second) out.insert(p);
        }
        return {out.begin(), out.end()};
    }

    std::vector<std::string>
    diff_worktree(const std::string& ref,
                  const std::vector<std::string>& paths) override {
        if (fail_diff) throw upsync::GitError("simulated diff failure");
        const Tree& t = tree(ref);
        std::set<std::string> out;
        for (auto& p : keys_under(t, head, paths)) {
            auto disk = get(p);
            auto it = t.find(p);
            if (it == t.end()) {
                if (disk) out.insert(p);
            } else if (!disk || *disk != it->second) {
                out.insert(p);
            }
        }
        return {out.begin(), out.end()};
    }

    std::vector<std::string>
    status_dirty(const std::vector<std::string>& paths) override {
        std::set<std::string> out;
        auto disk = snapshot_dir(workdir_);
        for (auto& p : keys_under(head, disk, paths)) {
            auto ih = head.find(p);
            auto id = disk.find(p);
            if (ih == head.end() || id == disk.end() || ih->second != id->second)
                out.insert(p);
        }
        return {out.begin(), out.end()};
    }

    std::vector<upsync::PathOutcome>
    checkout_paths(const std::string& ref,
                   const std::vector<std::string>& paths) override {
        const Tree& t = tree(ref);
        std::vector<upsync::PathOutcome> out;
        for (auto& p : paths) {
            if (fail_checkout.count(p)) {
                out.push_back({p, false, std::string("simulated checkout failure")});
                continue;
            }
            for (auto& [f, text] : head) {
                if (upsync::paths::is_within(f, p) && !t.count(f))
                    fs::remove(workdir_ / f);
            }
            for (auto& [f, text] : t) {
                if (upsync::paths::is_within(f, p)) put(f, text);
            }
            out.push_back({p, true, std::nullopt});
        }
        return out;
    }

    const fs::path& workdir() const override { return workdir_; }
    const fs::path& git_dir() const override { return git_dir_; }

private:
    struct InFlight {
        FakeRepo& repo;
        explicit InFlight(FakeRepo& r) : repo(r) {
            int now = ++repo.in_flight;
            int seen = repo.max_in_flight.load();
            while (now > seen && !repo.max_in_flight.compare_exchange_weak(seen, now)) {}
        }
        ~InFlight() { --repo.in_flight; }
    };

    const Tree& tree(const std::string& ref) {
        if (ref == "HEAD") return head;
        auto it = fetched_.find(ref);
        if (it == fetched_.end()) throw upsync::GitError("unknown ref " + ref);
        return it->second;
    }

    static std::set<std::string> keys_under(const Tree& a, const Tree& b,
                                            const std::vector<std::string>& paths) {
        std::set<std::string> out;
        for (const Tree* t : {&a, &b}) {
            for (auto& [f, text] : *t) {
                for (auto& p : paths) {
                    if (upsync::paths::is_within(f, p)) { out.insert(f); break; }
                }
            }
        }
        return out;
    }

    fs::path             workdir_;
    fs::path             git_dir_;
    std::map<std::string, Tree> fetched_;
};

/// A fake holding a typical workspace: system files at @p local_version,
/// user territory populated, everything committed.  Upstream starts equal.
inline std::shared_ptr<FakeRepo> make_workspace(const std::string& local_version) {
    auto repo = std::make_shared<FakeRepo>();
    repo->put("00-system/VERSION", local_version + "\n");
    repo->put("00-system/core/orchestrator.md", "orchestrator v" + local_version + "\n");
    repo->put("00-system/skills/close-session.md", "close session\n");
    repo->put("CLAUDE.md", "# Guide " + local_version + "\n");
    repo->put("README.md", "readme\n");
    repo->put("01-memory/user-config.yaml", "---\nname: dana\n---\n");
    repo->put("02-projects/01-alpha/plan.md", "my plan\n");
    repo->put("03-skills/custom/SKILL.md", "my skill\n");
    repo->put("04-workspace/notes.txt", "notes\n");
    repo->put(".env", "TOKEN=secret\n");
    repo->put(".claude/settings.json", "{}\n");
    repo->commit();
    repo->upstream = repo->head;
    return repo;
}

/// Upstream release @p version: bumps VERSION and rewrites system files.
inline void publish_upstream(FakeRepo& repo, const std::string& version) {
    repo.upstream["00-system/VERSION"] = version + "\n";
    repo.upstream["00-system/core/orchestrator.md"] = "orchestrator v" + version + "\n";
    repo.upstream["00-system/core/new-feature.md"] = "feature from " + version + "\n";
    repo.upstream["CLAUDE.md"] = "# Guide " + version + "\n";
}

inline upsync::Config test_config(const FakeRepo& repo) {
    upsync::Config cfg;
    cfg.root      = repo.workdir();
    cfg.lock_wait = std::chrono::milliseconds(200);
    return cfg;
}
