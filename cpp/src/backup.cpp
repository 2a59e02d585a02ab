#include "upsync/backup.h"
#include "upsync/error.h"
#include "upsync/log.h"
#include "upsync/paths.h"
#include "internal.h"

#include <algorithm>
#include <ctime>
#include <system_error>

namespace upsync {

namespace fs = std::filesystem;

namespace {

void default_copy(const fs::path& from, const fs::path& to) {
    fs::copy_file(from, to, fs::copy_options::overwrite_existing);
}

void discard(const fs::path& root) {
    std::error_code ec;
    fs::remove_all(root, ec);
    if (ec) {
        log::get()->error("could not remove incomplete backup {}: {}", root.string(), ec.message());
    }
}

} // anonymous namespace

BackupManager::BackupManager(fs::path workdir, fs::path backup_root, CopyFn copy)
    : workdir_(std::move(workdir)),
      backup_root_(std::move(backup_root)),
      copy_(copy ? std::move(copy) : CopyFn(default_copy)) {}

std::string BackupManager::timestamp_name(std::chrono::system_clock::time_point t) {
    std::time_t tt = std::chrono::system_clock::to_time_t(t);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm);
    return buf;
}

BackupSnapshot BackupManager::snapshot(const std::vector<std::string>& paths) const {
    BackupSnapshot snap;

    // Expand directories into the files below them.
    std::vector<std::string> files;
    for (auto& requested : paths) {
        std::string norm;
        try {
            norm = paths::normalize(requested);
        } catch (const InvalidPathError& e) {
            throw BackupError(requested, e.what());
        }

        std::error_code ec;
        auto status = fs::symlink_status(workdir_ / norm, ec);
        if (!fs::exists(status)) {
            snap.absent.push_back(norm);
            continue;
        }
        if (fs::is_directory(status)) {
            for (auto& rel : fsutil::disk_walk(workdir_ / norm)) {
                files.push_back(norm + "/" + rel);
            }
        } else {
            files.push_back(norm);
        }
    }
    std::sort(files.begin(), files.end());
    files.erase(std::unique(files.begin(), files.end()), files.end());

    // Never reuse a directory: two syncs in the same second get a suffix.
    auto base = timestamp_name(std::chrono::system_clock::now());
    auto root = backup_root_ / base;
    for (int n = 1; fs::exists(root); ++n) {
        root = backup_root_ / (base + "-" + std::to_string(n));
    }

    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) throw BackupError(root.string(), ec.message());

    std::string current;
    try {
        for (auto& rel : files) {
            current = rel;
            auto src = workdir_ / rel;
            auto dst = root / rel;
            fs::create_directories(dst.parent_path());

            if (fs::is_symlink(fs::symlink_status(src))) {
                fs::copy_symlink(src, dst);
                if (fs::read_symlink(src) != fs::read_symlink(dst)) {
                    throw BackupError(rel, "symlink target mismatch after copy");
                }
                snap.manifest.push_back({rel, 0});
                continue;
            }

            copy_(src, dst);
            if (!fsutil::same_content(src, dst)) {
                throw BackupError(rel, "content mismatch after copy");
            }
            snap.manifest.push_back({rel, static_cast<uint64_t>(fs::file_size(dst))});
        }
    } catch (const BackupError&) {
        discard(root);
        throw;
    } catch (const std::exception& e) {
        discard(root);
        throw BackupError(current, e.what());
    }

    snap.root = root.string();
    log::get()->info("backed up {} file(s) to {}", snap.manifest.size(), snap.root);
    return snap;
}

} // namespace upsync
