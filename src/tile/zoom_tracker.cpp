#include "tile/zoom_tracker.h"
#include "util/log.h"
#include <cmath>

namespace rastile {

ZoomInvalidationTracker::ZoomInvalidationTracker(const LayerRegistry& registry,
                                                 MapRenderer& renderer, CacheBuster& buster,
                                                 std::vector<std::string> remote_prefixes)
    : m_registry(registry), m_renderer(renderer), m_buster(buster),
      m_remote_prefixes(std::move(remote_prefixes)) {}

void ZoomInvalidationTracker::attach() {
    if (m_subscription.active()) return;
    /* Baseline so the first level change already invalidates */
    if (!m_last_zoom) m_last_zoom = static_cast<int>(std::floor(m_renderer.zoom()));
    m_subscription = m_renderer.on_zoom_end([this] { on_zoom_end(m_renderer.zoom()); });
}

void ZoomInvalidationTracker::detach() {
    m_subscription.reset();
}

bool ZoomInvalidationTracker::is_remote(const std::string& path) const {
    for (const auto& prefix : m_remote_prefixes) {
        if (!prefix.empty() && path.compare(0, prefix.size(), prefix) == 0) return true;
    }
    return false;
}

std::vector<std::string> ZoomInvalidationTracker::on_zoom_end(double zoom) {
    int level = static_cast<int>(std::floor(zoom));
    std::vector<std::string> refreshed;

    if (m_last_zoom && *m_last_zoom != level) {
        for (const auto& id : m_registry.order()) {
            const RasterLayer* layer = m_registry.get_raster(id);
            if (!layer || !is_remote(layer->path)) continue;
            if (refresh_layer_tiles(m_renderer, id, m_buster.next())) {
                refreshed.push_back(id);
            }
        }
        if (!refreshed.empty()) {
            LOG_DEBUG("Zoom level %d -> %d: refreshed %d remote layer(s)",
                      *m_last_zoom, level, static_cast<int>(refreshed.size()));
        }
    }

    m_last_zoom = level;
    return refreshed;
}

} // namespace rastile
