#pragma once
#include "geo/bounds.h"
#include <glm/glm.hpp>

namespace rastile {

/* Half-height limit in pseudo-degrees, inside Web Mercator's valid latitude range */
constexpr double MAX_PSEUDO_LAT = 85.0;
constexpr double DEFAULT_PIXEL_SCALE = 0.01;

/* Framing of a non-georeferenced image in pseudo-geographic space.
   Pixel (0,0) is the top-left corner of the image. */
struct PseudoGeoBounds {
    Bounds bounds;
    double pixel_scale = DEFAULT_PIXEL_SCALE;
    glm::dvec2 pixel_offset{0.0, 0.0};
};

/* Extent handed to the renderer's pixel-coordinate mode */
struct PixelExtent {
    int width = 0;
    int height = 0;
    double scale = DEFAULT_PIXEL_SCALE;
    glm::dvec2 offset{0.0, 0.0};
};

/* Center a width x height image on (0,0) at `scale` degrees per pixel.
   The half-height is clamped to MAX_PSEUDO_LAT; the offset uses the
   clamped value so pixel_to_map() and map_to_pixel() stay inverses. */
PseudoGeoBounds compute_pseudo_geo_bounds(int width, int height,
                                          double scale = DEFAULT_PIXEL_SCALE);

/* pixel (x right, y down) -> (lng, lat) */
glm::dvec2 pixel_to_map(const glm::dvec2& px, double scale, const glm::dvec2& offset);

/* (lng, lat) -> nearest integer pixel */
glm::dvec2 map_to_pixel(const glm::dvec2& lnglat, double scale, const glm::dvec2& offset);

} // namespace rastile
