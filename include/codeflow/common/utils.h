#ifndef CODEFLOW_COMMON_UTILS_H
#define CODEFLOW_COMMON_UTILS_H

#include <string>
#include <string_view>

namespace codeflow {

// Strip leading/trailing whitespace (spaces, tabs, CR, LF).
std::string trim(std::string_view text);

std::string to_upper(std::string_view text);
std::string to_lower(std::string_view text);

// Case-insensitive substring test.
bool contains_ci(std::string_view haystack, std::string_view needle);

// e.g. "run-20261018-142501-3fa9c2d1"
std::string generate_run_id();

// Run ids become file names: letters, digits, '-', '_', '.' only, no "..".
bool is_valid_run_id(std::string_view run_id);

} // namespace codeflow

#endif // CODEFLOW_COMMON_UTILS_H
