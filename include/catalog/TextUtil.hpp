#pragma once
#include <string>
#include <vector>

namespace textutil {

// strip leading/trailing ASCII whitespace (incl. \r)
std::string trim(const std::string& s);

// split on '\n', dropping '\r'; a trailing newline does not produce an empty last line
std::vector<std::string> split_lines(const std::string& s);

std::string to_lower_ascii(const std::string& s);

bool starts_with(const std::string& s, const std::string& prefix);
bool contains(const std::string& haystack, const std::string& needle);

std::string join(const std::vector<std::string>& parts, const std::string& sep);

}
