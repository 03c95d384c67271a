#include "layer/layer.h"

namespace rastile {

const char* display_mode_name(DisplayMode mode) {
    switch (mode) {
        case DisplayMode::Grayscale:     return "grayscale";
        case DisplayMode::Rgb:           return "rgb";
        case DisplayMode::CrossLayerRgb: return "crossLayerRgb";
    }
    return "grayscale";
}

BandStats RasterLayer::stats_for_band(int band_index) const {
    if (band_index >= 1 && band_index <= static_cast<int>(band_stats.size())) {
        return band_stats[band_index - 1];
    }
    return BandStats{};
}

LayerCommon& common(Layer& layer) {
    return std::visit([](auto& l) -> LayerCommon& { return l; }, layer);
}

const LayerCommon& common(const Layer& layer) {
    return std::visit([](const auto& l) -> const LayerCommon& { return l; }, layer);
}

std::string layer_label(const Layer& layer) {
    const LayerCommon& c = common(layer);
    if (c.display_name) return *c.display_name;
    std::string name = file_name_of(c.path);
    return name.empty() ? "Unknown" : name;
}

} // namespace rastile
