#include "upsync/reporter.h"

namespace upsync {

void to_json(json& j, const ErrorInfo& e) {
    j = json{{"code", e.code}, {"message", e.message}};
}

void to_json(json& j, const PathOutcome& p) {
    j = json{{"path", p.path}, {"ok", p.ok}};
    if (p.error) j["error"] = *p.error;
}

void to_json(json& j, const UpdateCheck& c) {
    j = json{
        {"checked",         c.checked},
        {"updateAvailable", c.update_available},
        {"localVersion",    version_label(c.local_version)},
        {"upstreamVersion", version_label(c.upstream_version)},
        {"changedPaths",    c.changed_paths},
    };
    if (c.upstream_url) j["upstreamUrl"] = *c.upstream_url;
    if (!c.warnings.empty()) j["warnings"] = c.warnings;
    // check-update keeps the flat string code; the detail goes alongside.
    if (c.error) {
        j["error"]        = c.error->code;
        j["errorMessage"] = c.error->message;
    }
}

void to_json(json& j, const SyncResult& r) {
    j = json{
        {"status",         status_name(r.status)},
        {"changedFiles",   r.changed_files},
        {"backupLocation", r.backup_location ? json(*r.backup_location) : json(nullptr)},
        {"versionBefore",  version_label(r.version_before)},
        {"versionAfter",   version_label(r.version_after)},
    };
    if (r.status != SyncStatus::DryRun && !r.paths.empty()) j["paths"] = r.paths;
    if (!r.dirty_paths.empty()) j["dirtyPaths"] = r.dirty_paths;
    if (r.upstream_url) j["upstreamUrl"] = *r.upstream_url;
    if (r.error) j["error"] = *r.error;
}

void to_json(json& j, const StartupStatus& s) {
    j = json{
        {"updateAvailable", s.update_available},
        {"localVersion",    version_label(s.local_version)},
        {"upstreamVersion", version_label(s.upstream_version)},
    };
    if (s.timed_out) j["timedOut"] = true;
}

namespace report {

json failure(const std::string& code, const std::string& message) {
    return json{{"status", "error"}, {"error", ErrorInfo{code, message}}};
}

std::string render(const json& j) {
    return j.dump(2) + "\n";
}

} // namespace report
} // namespace upsync
