#pragma once
#include "geo/bounds.h"
#include "geo/pixel_mapper.h"
#include <string>
#include <vector>
#include <optional>
#include <variant>

namespace rastile {

struct BandStats {
    double min = 0.0;
    double max = 255.0;
    std::optional<double> mean;
    std::optional<double> std_dev;
};

/* min/max/gamma transform applied by the raster engine */
struct Stretch {
    double min = 0.0;
    double max = 255.0;
    double gamma = 1.0;

    bool operator==(const Stretch& o) const {
        return min == o.min && max == o.max && gamma == o.gamma;
    }
    bool operator!=(const Stretch& o) const { return !(*this == o); }
};

enum class Channel { R, G, B };

struct RgbBands {
    int r = 1, g = 2, b = 3;

    bool operator==(const RgbBands& o) const { return r == o.r && g == o.g && b == o.b; }
    bool operator!=(const RgbBands& o) const { return !(*this == o); }
};

struct RgbStretch {
    Stretch r, g, b;

    Stretch& operator[](Channel c) { return c == Channel::R ? r : c == Channel::G ? g : b; }
    const Stretch& operator[](Channel c) const {
        return c == Channel::R ? r : c == Channel::G ? g : b;
    }
    bool operator==(const RgbStretch& o) const { return r == o.r && g == o.g && b == o.b; }
    bool operator!=(const RgbStretch& o) const { return !(*this == o); }
};

/* Each channel sourced from a single band of a (different) layer */
struct CrossLayerRgb {
    std::string r_layer_id;
    int r_band = 1;
    std::string g_layer_id;
    int g_band = 1;
    std::string b_layer_id;
    int b_band = 1;
};

enum class DisplayMode { Grayscale, Rgb, CrossLayerRgb };

const char* display_mode_name(DisplayMode mode);

/* Fields shared by every layer kind. Stacking order lives in the registry. */
struct LayerCommon {
    std::string id;
    std::string path;
    bool visible = true;
    double opacity = 1.0;
    std::optional<std::string> display_name;
    Bounds bounds;
};

struct RasterLayer : LayerCommon {
    int width = 0;
    int height = 0;
    int bands = 1;
    std::vector<BandStats> band_stats;
    bool is_georeferenced = true;

    DisplayMode display_mode = DisplayMode::Grayscale;

    /* Grayscale */
    int band = 1;
    Stretch stretch;

    /* RGB */
    RgbBands rgb_bands;
    RgbStretch rgb_stretch;

    std::optional<CrossLayerRgb> cross_layer_rgb;

    /* Set once at load time for non-georeferenced data */
    std::optional<double> pixel_scale;
    std::optional<glm::dvec2> pixel_offset;

    /* Composition flags */
    bool is_composition = false;
    bool is_cross_layer_composition = false;
    std::optional<std::string> source_layer_id;

    /* Stats of a 1-indexed band, or the {0,255} default */
    BandStats stats_for_band(int band_index) const;
};

/* Geometry/attributes/styling live with an external collaborator;
   the registry only needs to tell vector layers apart. */
struct VectorLayer : LayerCommon {
    int feature_count = 0;
    std::string geometry_type;
};

using Layer = std::variant<RasterLayer, VectorLayer>;

LayerCommon& common(Layer& layer);
const LayerCommon& common(const Layer& layer);

inline RasterLayer* as_raster(Layer* layer) {
    return layer ? std::get_if<RasterLayer>(layer) : nullptr;
}
inline const RasterLayer* as_raster(const Layer* layer) {
    return layer ? std::get_if<RasterLayer>(layer) : nullptr;
}

/* display_name if set, otherwise the file name of the path */
std::string layer_label(const Layer& layer);

} // namespace rastile
