#include "deltacode/inventory/types.hpp"

#include <algorithm>
#include <numeric>

namespace deltacode::inventory {

std::string FileRecord::path_string() const {
    return PathUtils::join(path);
}

PathSegments PathUtils::split(const std::string& path) {
    PathSegments segments;
    std::string current;
    for (char c : path) {
        if (c == '/') {
            if (!current.empty() && current != ".") {
                segments.push_back(current);
            }
            current.clear();
            continue;
        }
        current.push_back(c);
    }
    if (!current.empty() && current != ".") {
        segments.push_back(current);
    }
    return segments;
}

std::string PathUtils::join(const PathSegments& segments) {
    std::string joined;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) {
            joined.push_back('/');
        }
        joined += segments[i];
    }
    return joined;
}

std::size_t PathUtils::edit_distance(const PathSegments& lhs, const PathSegments& rhs) {
    std::vector<std::size_t> rows;
    return bounded_edit_distance(lhs, rhs, std::max(lhs.size(), rhs.size()), rows);
}

std::size_t PathUtils::bounded_edit_distance(const PathSegments& lhs,
                                             const PathSegments& rhs,
                                             std::size_t limit,
                                             std::vector<std::size_t>& rows) {
    const std::size_t length_gap = lhs.size() > rhs.size() ? lhs.size() - rhs.size()
                                                            : rhs.size() - lhs.size();
    if (length_gap > limit) {
        return limit + 1;
    }

    // Two-row dynamic programming table in one buffer
    const std::size_t width = rhs.size() + 1;
    rows.assign(2 * width, 0);
    std::size_t* previous = rows.data();
    std::size_t* current = rows.data() + width;
    std::iota(previous, previous + width, std::size_t{0});

    for (std::size_t i = 1; i <= lhs.size(); ++i) {
        current[0] = i;
        std::size_t row_min = i;
        for (std::size_t j = 1; j <= rhs.size(); ++j) {
            const std::size_t substitution = previous[j - 1] + (lhs[i - 1] == rhs[j - 1] ? 0 : 1);
            current[j] = std::min({previous[j] + 1, current[j - 1] + 1, substitution});
            row_min = std::min(row_min, current[j]);
        }
        // Row minima never decrease, so the distance is already past the limit
        if (row_min > limit) {
            return limit + 1;
        }
        std::swap(previous, current);
    }
    return std::min(previous[rhs.size()], limit + 1);
}

} // namespace deltacode::inventory
