#include "layer/layer_registry.h"
#include "util/log.h"
#include <algorithm>

namespace rastile {

bool LayerRegistry::add(Layer layer) {
    const std::string id = common(layer).id;
    if (id.empty()) {
        LOG_WARN("Refusing to register a layer without an id");
        return false;
    }
    if (m_used_ids.count(id)) {
        LOG_WARN("Layer id %s already in use", id.c_str());
        return false;
    }

    m_used_ids.insert(id);
    m_layers.emplace(id, std::move(layer));
    m_order.push_back(id);
    return true;
}

bool LayerRegistry::remove(const std::string& id) {
    auto it = m_layers.find(id);
    if (it == m_layers.end()) return false;

    m_layers.erase(it);
    m_order.erase(std::remove(m_order.begin(), m_order.end(), id), m_order.end());

    if (m_selected && *m_selected == id) {
        if (m_order.empty()) m_selected.reset();
        else m_selected = m_order.back();
    }
    return true;
}

Layer* LayerRegistry::get(const std::string& id) {
    auto it = m_layers.find(id);
    return it == m_layers.end() ? nullptr : &it->second;
}

const Layer* LayerRegistry::get(const std::string& id) const {
    auto it = m_layers.find(id);
    return it == m_layers.end() ? nullptr : &it->second;
}

RasterLayer* LayerRegistry::get_raster(const std::string& id) {
    return as_raster(get(id));
}

const RasterLayer* LayerRegistry::get_raster(const std::string& id) const {
    return as_raster(get(id));
}

bool LayerRegistry::reorder(int from_index, int to_index) {
    int n = static_cast<int>(m_order.size());
    if (from_index == to_index) return false;
    if (from_index < 0 || from_index >= n || to_index < 0 || to_index >= n) return false;

    std::string moved = m_order[from_index];
    m_order.erase(m_order.begin() + from_index);
    m_order.insert(m_order.begin() + to_index, moved);
    return true;
}

bool LayerRegistry::set_band(const std::string& id, int band) {
    RasterLayer* layer = get_raster(id);
    if (!layer) return false;
    if (band < 1 || band > layer->bands) {
        LOG_DEBUG("Band %d out of range for layer %s (%d bands)", band, id.c_str(), layer->bands);
        return false;
    }

    layer->band = band;
    if (band <= static_cast<int>(layer->band_stats.size())) {
        const BandStats& s = layer->band_stats[band - 1];
        layer->stretch.min = s.min;
        layer->stretch.max = s.max;
    }
    return true;
}

bool LayerRegistry::set_stretch(const std::string& id, const Stretch& stretch) {
    RasterLayer* layer = get_raster(id);
    if (!layer) return false;
    layer->stretch = stretch;
    return true;
}

bool LayerRegistry::set_display_mode(const std::string& id, DisplayMode mode) {
    RasterLayer* layer = get_raster(id);
    if (!layer) return false;
    layer->display_mode = mode;
    return true;
}

bool LayerRegistry::set_rgb_bands(const std::string& id, const RgbBands& bands) {
    RasterLayer* layer = get_raster(id);
    if (!layer) return false;

    auto in_range = [&](int b) { return b >= 1 && b <= layer->bands; };
    if (!layer->is_composition && !(in_range(bands.r) && in_range(bands.g) && in_range(bands.b))) {
        LOG_DEBUG("RGB bands %d/%d/%d out of range for layer %s",
                  bands.r, bands.g, bands.b, id.c_str());
        return false;
    }

    layer->rgb_bands = bands;

    int n = static_cast<int>(layer->band_stats.size());
    auto reseed = [&](int band, Stretch& s) {
        if (band >= 1 && band <= n) {
            s = {layer->band_stats[band - 1].min, layer->band_stats[band - 1].max, 1.0};
        }
    };
    reseed(bands.r, layer->rgb_stretch.r);
    reseed(bands.g, layer->rgb_stretch.g);
    reseed(bands.b, layer->rgb_stretch.b);
    return true;
}

bool LayerRegistry::set_rgb_stretch(const std::string& id, Channel channel, const Stretch& stretch) {
    RasterLayer* layer = get_raster(id);
    if (!layer) return false;
    layer->rgb_stretch[channel] = stretch;
    return true;
}

bool LayerRegistry::set_rgb_stretch(const std::string& id, const RgbStretch& stretch) {
    RasterLayer* layer = get_raster(id);
    if (!layer) return false;
    layer->rgb_stretch = stretch;
    return true;
}

bool LayerRegistry::set_cross_layer_rgb(const std::string& id, std::optional<CrossLayerRgb> config) {
    RasterLayer* layer = get_raster(id);
    if (!layer) return false;
    layer->cross_layer_rgb = std::move(config);
    return true;
}

bool LayerRegistry::set_visible(const std::string& id, bool visible) {
    Layer* layer = get(id);
    if (!layer) return false;
    common(*layer).visible = visible;
    return true;
}

bool LayerRegistry::set_opacity(const std::string& id, double opacity) {
    Layer* layer = get(id);
    if (!layer) return false;
    common(*layer).opacity = std::clamp(opacity, 0.0, 1.0);
    return true;
}

bool LayerRegistry::set_display_name(const std::string& id, const std::string& name) {
    Layer* layer = get(id);
    if (!layer) return false;
    if (name.empty()) common(*layer).display_name.reset();
    else common(*layer).display_name = name;
    return true;
}

bool LayerRegistry::select(const std::string& id) {
    if (!contains(id)) return false;
    m_selected = id;
    return true;
}

std::string LayerRegistry::make_id(const std::string& prefix) {
    std::string id;
    do {
        id = prefix + "-" + std::to_string(m_next_id++);
    } while (m_used_ids.count(id));
    return id;
}

void LayerRegistry::clear() {
    m_layers.clear();
    m_order.clear();
    m_selected.reset();
}

} // namespace rastile
