#pragma once
#include "layer/layer_registry.h"
#include "render/layer_binding.h"
#include "render/map_renderer.h"
#include <optional>
#include <string>
#include <vector>

namespace rastile {

/* Watches integer zoom-level changes and makes the renderer refetch tiles
   of remote/streamed layers, whose pixels depend on the overview level. */
class ZoomInvalidationTracker {
public:
    ZoomInvalidationTracker(const LayerRegistry& registry, MapRenderer& renderer,
                            CacheBuster& buster, std::vector<std::string> remote_prefixes);

    /* Subscribe to the renderer's zoom-end events, taking its current
       level as the baseline if none was recorded yet */
    void attach();
    /* Release the subscription */
    void detach();
    bool attached() const { return m_subscription.active(); }

    /* Handle one zoom-end at `zoom`. Returns the layers that were invalidated. */
    std::vector<std::string> on_zoom_end(double zoom);

    std::optional<int> last_zoom_level() const { return m_last_zoom; }

    bool is_remote(const std::string& path) const;

private:
    const LayerRegistry& m_registry;
    MapRenderer& m_renderer;
    CacheBuster& m_buster;
    std::vector<std::string> m_remote_prefixes;

    std::optional<int> m_last_zoom;
    Subscription m_subscription;
};

} // namespace rastile
