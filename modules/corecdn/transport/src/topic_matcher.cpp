#include "topic_matcher.h"

namespace litecdn {

std::vector<std::string_view> split_topic(std::string_view topic) {
    std::vector<std::string_view> segments;
    size_t start = 0;
    while (true) {
        const size_t slash = topic.find('/', start);
        if (slash == std::string_view::npos) {
            segments.push_back(topic.substr(start));
            break;
        }
        segments.push_back(topic.substr(start, slash - start));
        start = slash + 1;
    }
    return segments;
}

static bool match_segments(const std::vector<std::string_view>& pat, size_t pi,
                           const std::vector<std::string_view>& top, size_t ti) {
    while (pi < pat.size()) {
        if (pat[pi] == "**") {
            // collapse consecutive '**'
            while (pi + 1 < pat.size() && pat[pi + 1] == "**") ++pi;
            if (pi + 1 == pat.size()) {
                return true;
            }
            for (size_t k = ti; k <= top.size(); ++k) {
                if (match_segments(pat, pi + 1, top, k)) {
                    return true;
                }
            }
            return false;
        }
        if (ti >= top.size()) {
            return false;
        }
        if (pat[pi] != "*" && pat[pi] != top[ti]) {
            return false;
        }
        ++pi;
        ++ti;
    }
    return ti == top.size();
}

bool topic_matches(std::string_view pattern, std::string_view topic) {
    if (pattern == topic) {
        return true;
    }
    return match_segments(split_topic(pattern), 0, split_topic(topic), 0);
}

bool is_pattern(std::string_view selector) {
    return selector.find('*') != std::string_view::npos;
}

} // namespace litecdn
