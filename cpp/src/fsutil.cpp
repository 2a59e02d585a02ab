#include "internal.h"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>

namespace upsync {
namespace fsutil {

std::optional<std::vector<uint8_t>> read_file(const std::filesystem::path& p) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (!fs::is_regular_file(p, ec)) return std::nullopt;

    std::ifstream in(p, std::ios::binary);
    if (!in) throw IoError("cannot open " + p.string());
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)),
                               std::istreambuf_iterator<char>());
    if (in.bad()) throw IoError("read failed: " + p.string());
    return data;
}

/// Walk a local directory recursively, returning sorted relative paths.
std::vector<std::string> disk_walk(const std::filesystem::path& root) {
    namespace fs = std::filesystem;
    std::vector<std::string> results;
    if (!fs::exists(root)) return results;

    for (auto& entry : fs::recursive_directory_iterator(
             root, fs::directory_options::skip_permission_denied)) {
        auto status = entry.symlink_status();
        if (fs::is_directory(status)) continue;
        results.push_back(fs::relative(entry.path(), root).generic_string());
    }
    std::sort(results.begin(), results.end());
    return results;
}

bool same_content(const std::filesystem::path& a,
                  const std::filesystem::path& b) {
    auto da = read_file(a);
    auto db = read_file(b);
    return da && db && *da == *db;
}

} // namespace fsutil
} // namespace upsync
