#include "upsync/version.h"
#include "upsync/error.h"
#include "upsync/log.h"
#include "internal.h"

#include <charconv>
#include <chrono>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>

namespace upsync {

// ---------------------------------------------------------------------------
// Version
// ---------------------------------------------------------------------------

std::optional<Version> Version::parse(const std::string& text) {
    const char* ws = " \t\r\n";
    auto first = text.find_first_not_of(ws);
    if (first == std::string::npos) return std::nullopt;
    auto last = text.find_last_not_of(ws);

    std::string_view sv(text.data() + first, last - first + 1);
    if (sv.front() == 'v' || sv.front() == 'V') sv.remove_prefix(1);

    uint32_t parts[3] = {0, 0, 0};
    for (size_t i = 0; i < 3; ++i) {
        auto dot = sv.find('.');
        bool last_part = (i == 2);
        if (last_part != (dot == std::string_view::npos)) return std::nullopt;

        std::string_view field = last_part ? sv : sv.substr(0, dot);
        if (field.empty()) return std::nullopt;

        auto* begin = field.data();
        auto* end   = field.data() + field.size();
        auto [ptr, ec] = std::from_chars(begin, end, parts[i]);
        if (ec != std::errc() || ptr != end) return std::nullopt;

        if (!last_part) sv.remove_prefix(dot + 1);
    }
    return Version{parts[0], parts[1], parts[2]};
}

std::string Version::str() const {
    return std::to_string(major_version) + "." +
           std::to_string(minor_version) + "." +
           std::to_string(patch_version);
}

// ---------------------------------------------------------------------------
// VersionStore
// ---------------------------------------------------------------------------

VersionStore::VersionStore(std::filesystem::path file) : path_(std::move(file)) {}

MaybeVersion VersionStore::read() const {
    std::optional<std::vector<uint8_t>> data;
    try {
        data = fsutil::read_file(path_);
    } catch (const IoError& e) {
        log::get()->warn("cannot read {}: {}", path_.string(), e.what());
        return std::nullopt;
    }
    if (!data) return std::nullopt;

    auto v = Version::parse(std::string(data->begin(), data->end()));
    if (!v) log::get()->warn("malformed version in {}", path_.string());
    return v;
}

namespace {

constexpr std::string_view kScratchMarker = ".upsync-tmp.";

} // anonymous namespace

bool VersionStore::is_scratch_file(const std::string& path) {
    auto slash = path.find_last_of('/');
    auto name  = slash == std::string::npos ? std::string_view(path)
                                            : std::string_view(path).substr(slash + 1);
    auto pos = name.find(kScratchMarker);
    return pos != std::string_view::npos && pos > 0 &&
           pos + kScratchMarker.size() < name.size();
}

void VersionStore::write(const Version& v) const {
    namespace fs = std::filesystem;
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto tmp = path_;
    tmp += std::string(kScratchMarker) + std::to_string(stamp);

    std::error_code ec;
    fs::create_directories(path_.parent_path(), ec);
    if (ec) throw IoError("cannot create " + path_.parent_path().string() + ": " + ec.message());

    // Sweep leftovers of an interrupted write.
    const std::string stale_prefix = path_.filename().string() + std::string(kScratchMarker);
    for (fs::directory_iterator it(path_.parent_path(), ec), end; !ec && it != end;
         it.increment(ec)) {
        auto name = it->path().filename().string();
        if (name.compare(0, stale_prefix.size(), stale_prefix) != 0) continue;
        std::error_code rm_ec;
        if (fs::remove(it->path(), rm_ec)) {
            log::get()->debug("removed stale {}", it->path().string());
        } else if (rm_ec) {
            log::get()->warn("cannot remove stale {}: {}", it->path().string(), rm_ec.message());
        }
    }
    ec.clear();

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw IoError("cannot open " + tmp.string());
        std::string text = v.str() + "\n";
        out.write(text.data(), static_cast<std::streamsize>(text.size()));
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmp, ec);
            throw IoError("write failed: " + tmp.string());
        }
    }

    fs::rename(tmp, path_, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(tmp, rm_ec);
        throw IoError("cannot replace " + path_.string() + ": " + ec.message());
    }
    log::get()->debug("wrote version {} to {}", v.str(), path_.string());
}

// ---------------------------------------------------------------------------
// SyncStatus
// ---------------------------------------------------------------------------

const char* status_name(SyncStatus s) {
    switch (s) {
        case SyncStatus::Success:        return "success";
        case SyncStatus::DryRun:         return "dry_run";
        case SyncStatus::DirtyTree:      return "dirty_tree";
        case SyncStatus::NetworkError:   return "network_error";
        case SyncStatus::BackupError:    return "backup_error";
        case SyncStatus::PartialFailure: return "partial_failure";
        case SyncStatus::Locked:         return "locked";
        case SyncStatus::Error:          return "error";
    }
    return "unknown"; // unreachable
}

} // namespace upsync
