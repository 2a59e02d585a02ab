#include "upsync/config.h"
#include "upsync/log.h"

#include <yaml-cpp/yaml.h>

#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace upsync {

namespace {

/// Extract the YAML between a leading "---" line and the next "---" line.
std::optional<std::string> front_matter(const std::string& content) {
    if (content.compare(0, 3, "---") != 0) return std::nullopt;

    auto body_start = content.find('\n');
    if (body_start == std::string::npos) return std::nullopt;
    ++body_start;

    auto end = content.find("\n---", body_start - 1);
    if (end == std::string::npos) return std::nullopt;
    if (end < body_start) return std::string();
    return content.substr(body_start, end - body_start);
}

} // anonymous namespace

Config Config::load(const std::filesystem::path& root) {
    Config cfg;
    cfg.root = root;

    auto user_file = root / kUserConfigFile;
    std::ifstream in(user_file);
    if (!in) return cfg;

    std::stringstream ss;
    ss << in.rdbuf();
    auto yaml_text = front_matter(ss.str());
    if (!yaml_text) return cfg;

    try {
        YAML::Node doc = YAML::Load(*yaml_text);
        if (auto sync = doc["sync"]) {
            auto url = sync["upstream_url"].as<std::string>("");
            if (!url.empty()) {
                cfg.upstream_url = url;
                log::get()->debug("upstream url from {}: {}", user_file.string(), url);
            }
        }
    } catch (const YAML::Exception& e) {
        log::get()->warn("ignoring malformed {}: {}", user_file.string(), e.what());
    }
    return cfg;
}

std::optional<std::chrono::milliseconds> parse_timeout_seconds(const std::string& text) {
    double v = 0;
    try {
        size_t used = 0;
        v = std::stod(text, &used);
        if (used != text.size()) return std::nullopt;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
    if (!std::isfinite(v) || v <= 0) return std::nullopt;

    const double max_seconds = static_cast<double>(kMaxStartupTimeout.count());
    if (v > max_seconds) {
        log::get()->warn("timeout {}s capped at {}s", text, kMaxStartupTimeout.count());
        return std::chrono::duration_cast<std::chrono::milliseconds>(kMaxStartupTimeout);
    }
    // At least 1 ms so a tiny positive value still bounds the wait.
    auto ms = static_cast<long long>(v * 1000);
    return std::chrono::milliseconds(ms > 0 ? ms : 1);
}

} // namespace upsync
