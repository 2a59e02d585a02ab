#pragma once

/// @file reporter.h
/// JSON contract consumed by the update workflow.

#include "types.h"

#include <nlohmann/json.hpp>

#include <string>

namespace upsync {

using json = nlohmann::json;

// nlohmann::json ADL serializers.  Keys are camelCase; versions are
// strings, "unknown" when unreadable.

void to_json(json& j, const ErrorInfo& e);
void to_json(json& j, const PathOutcome& p);
void to_json(json& j, const UpdateCheck& c);
void to_json(json& j, const SyncResult& r);
void to_json(json& j, const StartupStatus& s);

namespace report {

/// Generic failure document: {"status":"error","error":{code,message}}.
json failure(const std::string& code, const std::string& message);

/// Serialize for stdout (two-space indent, trailing newline).
std::string render(const json& j);

} // namespace report
} // namespace upsync
