#pragma once

#include <json/json.h>
#include <string>

namespace agentlink {

// Compact single-line JSON.
std::string write_json(const Json::Value& value);

bool parse_json(const std::string& text, Json::Value& out, std::string* error = nullptr);

} // namespace agentlink
