#pragma once

#include <map>
#include <string>
#include <vector>

namespace berth::common {

// Readers for the handful of fields berth takes from GitHub API responses. Lookups
// only see members of the outermost object and return "" when the field is absent
// or has another type.

[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);

/// Numeric member as its literal text, e.g. "42".
[[nodiscard]] std::string json_get_number(const std::string &json, const std::string &field);

/// Array member as raw JSON, brackets included.
[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &field);

/// Raw JSON text of each element of an array.
[[nodiscard]] std::vector<std::string> json_array_elements(const std::string &array_json);

/// Flat string maps are how extra environment entries and history details are stored.
using JsonFlatMap = std::map<std::string, std::string>;

/// Parse a flat JSON object. Non-string values are kept as their literal text.
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// Serialize a flat map as a JSON object with string values, keys in sorted order.
[[nodiscard]] std::string json_encode_flat(const JsonFlatMap &values);

} // namespace berth::common
