#include <catch2/catch_test_macros.hpp>
#include "fake_repo.h"

#include <atomic>
#include <stdexcept>
#include <thread>

using namespace upsync;
using namespace std::chrono_literals;

// ---------------------------------------------------------------------------
// startup_check (free function)
// ---------------------------------------------------------------------------

TEST_CASE("startup_check: forwards a completed probe", "[startup]") {
    auto status = startup_check([] {
        UpdateCheck c;
        c.checked = true;
        c.update_available = true;
        c.local_version = Version{0, 80, 0};
        c.upstream_version = Version{0, 82, 0};
        return c;
    }, 2s);

    CHECK(status.update_available);
    CHECK_FALSE(status.timed_out);
    CHECK(status.local_version == Version{0, 80, 0});
    CHECK(status.upstream_version == Version{0, 82, 0});
}

TEST_CASE("startup_check: probe exceptions become no update", "[startup]") {
    StartupStatus status;
    REQUIRE_NOTHROW(status = startup_check(
        []() -> UpdateCheck { throw std::runtime_error("libgit2 exploded"); }, 2s));
    CHECK_FALSE(status.update_available);
    CHECK_FALSE(status.timed_out);
}

TEST_CASE("startup_check: probe errors become no update", "[startup]") {
    auto status = startup_check([] {
        UpdateCheck c;
        c.update_available = true;
        c.error = ErrorInfo{codes::kInternal, "inconsistent"};
        return c;
    }, 2s);
    CHECK_FALSE(status.update_available);
}

TEST_CASE("startup_check: returns within the timeout for a hung probe", "[startup]") {
    auto start = std::chrono::steady_clock::now();
    auto status = startup_check([] {
        std::this_thread::sleep_for(3s);
        UpdateCheck c;
        c.update_available = true;
        return c;
    }, 100ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    CHECK(status.timed_out);
    CHECK_FALSE(status.update_available);
    CHECK(elapsed < 1s);
}

// ---------------------------------------------------------------------------
// Updater facade
// ---------------------------------------------------------------------------

/// Factory for the startup check: a fresh workspace at @p local, with
/// upstream at @p remote unless empty.
static Updater::RepoFactory workspace_factory(std::string local, std::string remote,
                                              bool offline = false) {
    return [local, remote, offline]() -> std::shared_ptr<RepoHandle> {
        auto repo = make_workspace(local);
        if (!remote.empty()) publish_upstream(*repo, remote);
        repo->network_down = offline;
        return repo;
    };
}

TEST_CASE("Updater: startup check reports an available update", "[startup][updater]") {
    auto repo = make_workspace("0.80.0");
    publish_upstream(*repo, "0.82.0");
    Updater updater(repo, test_config(*repo), nullptr,
                    workspace_factory("0.80.0", "0.82.0"));

    auto status = updater.startup_check(2s);
    CHECK(status.update_available);
    CHECK(status.upstream_version == Version{0, 82, 0});
    CHECK(repo->fetch_calls.load() == 0);
}

TEST_CASE("Updater: startup check is quiet when offline", "[startup][updater]") {
    auto repo = make_workspace("0.80.0");
    Updater updater(repo, test_config(*repo), nullptr,
                    workspace_factory("0.80.0", "", true));

    StartupStatus status;
    REQUIRE_NOTHROW(status = updater.startup_check(2s));
    CHECK_FALSE(status.update_available);
    CHECK_FALSE(status.timed_out);
}

TEST_CASE("Updater: startup check opens its own repository handle", "[startup][updater]") {
    // Without a factory the check opens config.root with libgit2; the fake's
    // directory is no repository, so the check fails quietly.
    auto repo = make_workspace("0.80.0");
    publish_upstream(*repo, "0.82.0");
    Updater updater(repo, test_config(*repo));

    StartupStatus status;
    REQUIRE_NOTHROW(status = updater.startup_check(2s));
    CHECK_FALSE(status.update_available);
    CHECK(repo->fetch_calls.load() == 0);
}

TEST_CASE("Updater: sync after a timed-out startup check runs alone on its handle",
          "[startup][updater]") {
    auto repo = make_workspace("0.80.0");
    publish_upstream(*repo, "0.82.0");
    repo->fetch_delay = 500ms;

    auto opened = std::make_shared<std::atomic<int>>(0);
    Updater updater(repo, test_config(*repo), nullptr,
                    [opened]() -> std::shared_ptr<RepoHandle> {
                        ++*opened;
                        auto slow = make_workspace("0.80.0");
                        publish_upstream(*slow, "0.82.0");
                        slow->fetch_delay = 500ms;
                        return slow;
                    });

    auto status = updater.startup_check(50ms);
    REQUIRE(status.timed_out);

    auto result = updater.sync({});
    CHECK(result.status == SyncStatus::Success);
    CHECK(repo->max_in_flight.load() == 1);
    CHECK(repo->fetch_calls.load() == 1);
    CHECK(opened->load() == 1);
}

TEST_CASE("Updater: check then sync", "[updater]") {
    auto repo = make_workspace("0.80.0");
    publish_upstream(*repo, "0.82.0");
    Updater updater(repo, test_config(*repo));

    auto check = updater.check_update();
    REQUIRE(check.update_available);

    auto result = updater.sync({});
    CHECK(result.status == SyncStatus::Success);
    CHECK(result.version_after == check.upstream_version);
    CHECK_FALSE(updater.check_update().update_available);
}

TEST_CASE("Updater: open rejects a directory outside any repository", "[updater]") {
    auto dir = make_temp_path("upsync_nogit_");
    fs::create_directories(dir);
    CHECK_THROWS_AS(Updater::open(dir), NotFoundError);
    fs::remove_all(dir);
}
