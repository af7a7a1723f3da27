#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace litecdn {

std::vector<std::string_view> split_topic(std::string_view topic);

// '*' matches exactly one segment, '**' matches zero or more segments.
// Anything else must match the segment byte for byte.
bool topic_matches(std::string_view pattern, std::string_view topic);

bool is_pattern(std::string_view selector);

} // namespace litecdn
