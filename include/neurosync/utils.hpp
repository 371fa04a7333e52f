#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace neurosync {

std::string trim(const std::string& s);

// Remove a UTF-8 BOM (0xEF,0xBB,0xBF) from the beginning of a string if present.
std::string strip_utf8_bom(std::string s);

std::vector<std::string> split(const std::string& s, char delim);

// Split a single CSV row into fields.
//
// Supports double-quoted fields with "" escaping. Fields are returned unquoted.
// Multi-line quoted fields are not supported.
std::vector<std::string> split_csv_row(const std::string& row, char delim);

std::string to_lower(std::string s);

bool starts_with(const std::string& s, const std::string& prefix);

// Strict numeric parsing.
//
// Leading/trailing whitespace is ignored; anything else after the number is an
// error (std::runtime_error). Uses the classic "C" locale; nan and inf
// (any case, optional sign on inf) are accepted.
double to_double(const std::string& s);

// Look up a member of the top-level JSON object and return its raw value
// text: the unescaped content for string values, the literal token otherwise
// (e.g. "250", "true"). Occurrences inside nested objects or inside string
// values are ignored.
//
// Returns false if the key is not present at depth 1.
bool json_find_raw_value(const std::string& json, const std::string& key, std::string* out);

// List the keys of the top-level JSON object, in document order.
std::vector<std::string> json_top_level_keys(const std::string& json);

} // namespace neurosync
