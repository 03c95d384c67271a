#include "geo/pixel_mapper.h"
#include <algorithm>
#include <cmath>

namespace rastile {

PseudoGeoBounds compute_pseudo_geo_bounds(int width, int height, double scale) {
    double half_w = width * scale / 2.0;
    double half_h = std::min(height * scale / 2.0, MAX_PSEUDO_LAT);

    PseudoGeoBounds out;
    out.bounds = {-half_w, -half_h, half_w, half_h};
    out.pixel_scale = scale;
    out.pixel_offset = {half_w, half_h};
    return out;
}

glm::dvec2 pixel_to_map(const glm::dvec2& px, double scale, const glm::dvec2& offset) {
    return {px.x * scale - offset.x,
            offset.y - px.y * scale};
}

glm::dvec2 map_to_pixel(const glm::dvec2& lnglat, double scale, const glm::dvec2& offset) {
    return {std::round((lnglat.x + offset.x) / scale),
            std::round((offset.y - lnglat.y) / scale)};
}

} // namespace rastile
