#include <catch2/catch_test_macros.hpp>
#include "fake_repo.h"

using upsync::Version;
using upsync::VersionStore;

// ---------------------------------------------------------------------------
// Version::parse
// ---------------------------------------------------------------------------

TEST_CASE("Version: parses a plain triple", "[version]") {
    auto v = Version::parse("0.82.0");
    REQUIRE(v.has_value());
    CHECK(v->major_version == 0);
    CHECK(v->minor_version == 82);
    CHECK(v->patch_version == 0);
    CHECK(v->str() == "0.82.0");
}

TEST_CASE("Version: tolerates whitespace and a leading v", "[version]") {
    CHECK(Version::parse("  1.2.3\n") == Version{1, 2, 3});
    CHECK(Version::parse("v4.5.6") == Version{4, 5, 6});
    CHECK(Version::parse("V0.0.1\r\n") == Version{0, 0, 1});
}

TEST_CASE("Version: rejects malformed text", "[version]") {
    CHECK_FALSE(Version::parse("").has_value());
    CHECK_FALSE(Version::parse("   \n").has_value());
    CHECK_FALSE(Version::parse("1.2").has_value());
    CHECK_FALSE(Version::parse("1.2.3.4").has_value());
    CHECK_FALSE(Version::parse("1..3").has_value());
    CHECK_FALSE(Version::parse("1.2.x").has_value());
    CHECK_FALSE(Version::parse("-1.2.3").has_value());
    CHECK_FALSE(Version::parse("1.2.3-beta").has_value());
    CHECK_FALSE(Version::parse("1.2 .3").has_value());
}

TEST_CASE("Version: ordering is numeric per field", "[version]") {
    CHECK(Version{0, 80, 0} < Version{0, 82, 0});
    CHECK(Version{0, 9, 0} < Version{0, 10, 0});
    CHECK(Version{1, 0, 0} > Version{0, 99, 99});
    CHECK(Version{2, 3, 4} <= Version{2, 3, 4});
    CHECK(Version{2, 3, 5} >= Version{2, 3, 4});
    CHECK(Version{2, 3, 4} != Version{2, 4, 3});
}

TEST_CASE("Version: version_label reports unknown for missing", "[version]") {
    CHECK(upsync::version_label(std::nullopt) == "unknown");
    CHECK(upsync::version_label(Version{0, 1, 2}) == "0.1.2");
}

// ---------------------------------------------------------------------------
// VersionStore
// ---------------------------------------------------------------------------

TEST_CASE("VersionStore: missing file reads as unknown", "[version][store]") {
    auto dir = make_temp_path("upsync_ver_");
    VersionStore store(dir / "VERSION");
    CHECK_FALSE(store.read().has_value());
}

TEST_CASE("VersionStore: malformed file reads as unknown", "[version][store]") {
    auto dir = make_temp_path("upsync_ver_");
    write_text(dir / "VERSION", "not a version\n");
    VersionStore store(dir / "VERSION");
    CHECK_FALSE(store.read().has_value());
    fs::remove_all(dir);
}

TEST_CASE("VersionStore: directory in place of the file reads as unknown", "[version][store]") {
    auto dir = make_temp_path("upsync_ver_");
    fs::create_directories(dir / "VERSION");
    VersionStore store(dir / "VERSION");
    CHECK_FALSE(store.read().has_value());
    fs::remove_all(dir);
}

TEST_CASE("VersionStore: write then read", "[version][store]") {
    auto dir = make_temp_path("upsync_ver_");
    VersionStore store(dir / "00-system" / "VERSION");
    store.write(Version{0, 82, 0});

    CHECK(store.read() == Version{0, 82, 0});
    CHECK(read_text(store.path()) == std::string("0.82.0\n"));

    // No temporaries left beside the file.
    size_t n = 0;
    for (auto& e : fs::directory_iterator(dir / "00-system")) { (void)e; ++n; }
    CHECK(n == 1);

    fs::remove_all(dir);
}

TEST_CASE("VersionStore: write sweeps temporaries of an interrupted write", "[version][store]") {
    auto dir = make_temp_path("upsync_ver_");
    write_text(dir / "VERSION", "0.80.0\n");
    write_text(dir / "VERSION.upsync-tmp.12345", "0.81");
    write_text(dir / "NOTES.upsync-tmp.1", "not ours\n");

    VersionStore(dir / "VERSION").write(Version{0, 82, 0});

    CHECK(read_text(dir / "VERSION") == std::string("0.82.0\n"));
    CHECK_FALSE(fs::exists(dir / "VERSION.upsync-tmp.12345"));
    CHECK(fs::exists(dir / "NOTES.upsync-tmp.1"));
    fs::remove_all(dir);
}

TEST_CASE("VersionStore: scratch file names", "[version][store]") {
    CHECK(VersionStore::is_scratch_file("00-system/VERSION.upsync-tmp.998877"));
    CHECK(VersionStore::is_scratch_file("VERSION.upsync-tmp.1"));
    CHECK_FALSE(VersionStore::is_scratch_file("00-system/VERSION"));
    CHECK_FALSE(VersionStore::is_scratch_file("00-system/.upsync-tmp.1"));
    CHECK_FALSE(VersionStore::is_scratch_file("00-system/VERSION.upsync-tmp."));
    CHECK_FALSE(VersionStore::is_scratch_file("00-system/a.upsync-tmp.1/notes.md"));
}

TEST_CASE("VersionStore: write replaces existing content", "[version][store]") {
    auto dir = make_temp_path("upsync_ver_");
    write_text(dir / "VERSION", "0.80.0\n");
    VersionStore store(dir / "VERSION");
    store.write(Version{0, 81, 3});
    CHECK(read_text(dir / "VERSION") == std::string("0.81.3\n"));
    fs::remove_all(dir);
}

TEST_CASE("VersionStore: failed write throws IoError and keeps the target", "[version][store]") {
    auto dir = make_temp_path("upsync_ver_");
    // A non-empty directory cannot be replaced by rename.
    write_text(dir / "VERSION" / "keep", "x");
    VersionStore store(dir / "VERSION");

    CHECK_THROWS_AS(store.write(Version{1, 0, 0}), upsync::IoError);
    CHECK(read_text(dir / "VERSION" / "keep") == std::string("x"));

    fs::remove_all(dir);
}
