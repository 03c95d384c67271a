#pragma once
#include "layer/layer.h"
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <string>
#include <optional>

namespace rastile {

/* Single source of truth for layer records and their bottom-to-top order.
   Mutators on an unknown id are silent no-ops returning false: UI callers
   can race with removal. */
class LayerRegistry {
public:
    /* Append on top of the stack. Fails if the id is live or was used before. */
    bool add(Layer layer);
    bool remove(const std::string& id);

    Layer* get(const std::string& id);
    const Layer* get(const std::string& id) const;
    RasterLayer* get_raster(const std::string& id);
    const RasterLayer* get_raster(const std::string& id) const;
    bool contains(const std::string& id) const { return m_layers.count(id) > 0; }

    /* Bottom-to-top */
    const std::vector<std::string>& order() const { return m_order; }
    int size() const { return static_cast<int>(m_order.size()); }
    bool empty() const { return m_order.empty(); }

    /* Move the entry at from_index to to_index. Out of range or equal: no-op. */
    bool reorder(int from_index, int to_index);

    /* Grayscale band (1-indexed). Re-seeds stretch min/max from that band's stats. */
    bool set_band(const std::string& id, int band);
    bool set_stretch(const std::string& id, const Stretch& stretch);
    bool set_display_mode(const std::string& id, DisplayMode mode);
    /* Re-seeds each channel's stretch from the new band's stats (gamma 1). */
    bool set_rgb_bands(const std::string& id, const RgbBands& bands);
    bool set_rgb_stretch(const std::string& id, Channel channel, const Stretch& stretch);
    bool set_rgb_stretch(const std::string& id, const RgbStretch& stretch);
    bool set_cross_layer_rgb(const std::string& id, std::optional<CrossLayerRgb> config);

    bool set_visible(const std::string& id, bool visible);
    bool set_opacity(const std::string& id, double opacity);
    bool set_display_name(const std::string& id, const std::string& name);

    /* Active layer for editing */
    std::optional<std::string> selected() const { return m_selected; }
    bool select(const std::string& id);

    /* Fresh id of the form <prefix>-<n>, never handed out twice */
    std::string make_id(const std::string& prefix);

    /* Drop every record. Retired ids stay retired. */
    void clear();

private:
    std::unordered_map<std::string, Layer> m_layers;
    std::vector<std::string> m_order;
    std::unordered_set<std::string> m_used_ids;
    std::optional<std::string> m_selected;
    unsigned long m_next_id = 1;
};

} // namespace rastile
