#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace taptik {

// Matches a '/'-separated relative path. '*' and '?' stay within one
// segment, '**' spans any number of segments (including none).
bool glob_match(std::string_view pattern, std::string_view path);

bool matches_any(const std::vector<std::string>& patterns, std::string_view path);

} // namespace taptik
