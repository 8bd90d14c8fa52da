#pragma once

#include <json/json.h>

#include <optional>
#include <string>
#include <string_view>

namespace pv::core {

// Strict parse: a single JSON document with no trailing content.
std::optional<Json::Value> ParseJson(std::string_view text);

// Compact single-line output.
std::string WriteJson(const Json::Value& value);

}  // namespace pv::core
