#include "internal.h"
#include "upsync/paths.h"

#include <string>
#include <string_view>
#include <vector>

namespace upsync {
namespace paths {

std::vector<std::string> sync_paths() {
    return {kSyncPaths.begin(), kSyncPaths.end()};
}

std::vector<std::string> protected_paths() {
    return {kProtectedPaths.begin(), kProtectedPaths.end()};
}

/// Normalize a repo-relative path: strip leading/trailing slashes, reject ..,
/// collapse repeated slashes and `.` segments.
std::string normalize(const std::string& path) {
    std::vector<std::string_view> segments;
    std::string_view sv(path);
    size_t start = 0;

    while (start < sv.size()) {
        size_t end = sv.find('/', start);
        if (end == std::string_view::npos) end = sv.size();

        std::string_view seg = sv.substr(start, end - start);
        start = end + 1;

        if (seg.empty() || seg == ".") continue;
        if (seg == "..") {
            throw InvalidPathError("path segment '..' is not allowed: " + path);
        }
        segments.push_back(seg);
    }

    if (segments.empty()) {
        throw InvalidPathError("path must not be empty: '" + path + "'");
    }

    std::string out;
    out.reserve(path.size());
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) out += '/';
        out += std::string(segments[i]);
    }
    return out;
}

bool is_within(const std::string& path, const std::string& prefix) {
    if (path.size() < prefix.size()) return false;
    if (path.compare(0, prefix.size(), prefix) != 0) return false;
    return path.size() == prefix.size() || path[prefix.size()] == '/';
}

bool overlaps(const std::string& a, const std::string& b) {
    return is_within(a, b) || is_within(b, a);
}

bool in_sync_paths(const std::string& path) {
    for (auto p : kSyncPaths) {
        if (is_within(path, std::string(p))) return true;
    }
    return false;
}

bool in_protected_paths(const std::string& path) {
    for (auto p : kProtectedPaths) {
        if (is_within(path, std::string(p))) return true;
    }
    return false;
}

} // namespace paths
} // namespace upsync
