#pragma once

#include <string>
#include <vector>

namespace agripv {

std::string to_lower(std::string s);

// Strips leading/trailing ASCII whitespace.
std::string trim(const std::string& s);

// Wraps the cell in double quotes (doubling inner quotes) when it holds a comma,
// quote or newline.
std::string csv_escape(const std::string& s);

std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Fixed-point formatting for log lines and CLI tables, e.g. format_fixed(1234.5, 1) == "1234.5".
std::string format_fixed(double v, int precision);

} // namespace agripv
