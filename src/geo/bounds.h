#pragma once
#include <string>
#include <vector>
#include <optional>

namespace rastile {

/* Axis-aligned box in map units (degrees for geographic data,
   pseudo-degrees for non-georeferenced imagery). */
struct Bounds {
    double min_x = 0, min_y = 0;
    double max_x = 0, max_y = 0;

    bool operator==(const Bounds& o) const {
        return min_x == o.min_x && min_y == o.min_y &&
               max_x == o.max_x && max_y == o.max_y;
    }
    bool operator!=(const Bounds& o) const { return !(*this == o); }

    double width() const { return max_x - min_x; }
    double height() const { return max_y - min_y; }
};

/* Union of all boxes. nullopt for an empty list. */
std::optional<Bounds> merge_bounds(const std::vector<Bounds>& boxes);

/* Touching edges count as intersecting. */
bool bounds_intersect(const Bounds& a, const Bounds& b);

/* Last path component, splitting on both '/' and '\'. */
std::string file_name_of(const std::string& path);

} // namespace rastile
