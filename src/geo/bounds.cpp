#include "geo/bounds.h"
#include <algorithm>

namespace rastile {

std::optional<Bounds> merge_bounds(const std::vector<Bounds>& boxes) {
    if (boxes.empty()) return std::nullopt;

    Bounds out = boxes.front();
    for (auto& b : boxes) {
        out.min_x = std::min(out.min_x, b.min_x);
        out.min_y = std::min(out.min_y, b.min_y);
        out.max_x = std::max(out.max_x, b.max_x);
        out.max_y = std::max(out.max_y, b.max_y);
    }
    return out;
}

bool bounds_intersect(const Bounds& a, const Bounds& b) {
    return !(a.max_x < b.min_x || a.min_x > b.max_x ||
             a.max_y < b.min_y || a.min_y > b.max_y);
}

std::string file_name_of(const std::string& path) {
    size_t pos = path.find_last_of("/\\");
    if (pos == std::string::npos) return path;
    return path.substr(pos + 1);
}

} // namespace rastile
