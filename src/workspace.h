#pragma once
#include "engine/raster_engine.h"
#include "layer/composition_manager.h"
#include "layer/layer_registry.h"
#include "render/layer_binding.h"
#include "render/map_renderer.h"
#include "tile/tile_dispatcher.h"
#include "tile/zoom_tracker.h"
#include "util/config.h"
#include <optional>
#include <string>
#include <vector>

namespace rastile {

/* Ties the registry, dispatcher, compositions and zoom tracking to one
   engine and one renderer. Every display edit goes through here so the
   renderer is told to refetch. Call from the renderer's event loop. */
class Workspace {
public:
    Workspace(RasterEngine& engine, MapRenderer& renderer, const Config& config);
    ~Workspace();

    /* Open a dataset and show it on top. Throws EngineError (logged). */
    std::string open_raster(const std::string& path);

    /* Register a vector record. No tiles are served for it. */
    bool add_vector_layer(VectorLayer layer);

    /* Unknown id: no-op returning false */
    bool remove_layer(const std::string& id);

    /* Display edits. Each returns false for unknown ids or rejected values. */
    bool set_band(const std::string& id, int band);
    bool set_stretch(const std::string& id, const Stretch& stretch);
    bool set_display_mode(const std::string& id, DisplayMode mode);
    bool set_rgb_bands(const std::string& id, const RgbBands& bands);
    bool set_rgb_stretch(const std::string& id, Channel channel, const Stretch& stretch);
    bool set_cross_layer_rgb(const std::string& id, std::optional<CrossLayerRgb> config);

    bool set_visible(const std::string& id, bool visible);
    bool toggle_visibility(const std::string& id);
    bool set_opacity(const std::string& id, double opacity);
    bool rename(const std::string& id, const std::string& name);
    bool select(const std::string& id) { return m_registry.select(id); }
    bool reorder(int from_index, int to_index);

    /* Fit the view to every layer. False when there is nothing to fit. */
    bool fit_all();

    std::optional<Histogram> histogram(const std::string& id, int band, int bins = 256);

    std::optional<std::string> create_composition(const std::string& source_id, bool cross_layer);

    /* Make the renderer refetch a layer's tiles with its current settings */
    bool refresh(const std::string& id);

    /* Synchronous tile through the full dispatch path */
    std::vector<uint8_t> fetch_tile(const std::string& url) { return m_dispatcher.fetch(url); }
    int pump() { return m_dispatcher.pump(); }

    /* Release the zoom subscription and every protocol */
    void shutdown();

    const Config& config() const { return m_config; }
    LayerRegistry& registry() { return m_registry; }
    const LayerRegistry& registry() const { return m_registry; }
    TileProtocolDispatcher& dispatcher() { return m_dispatcher; }
    CompositionManager& compositions() { return m_compositions; }
    ZoomInvalidationTracker& zoom_tracker() { return m_zoom; }
    bool pixel_coord_mode() const { return m_pixel_mode; }

    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

private:
    Config m_config;
    RasterEngine& m_engine;
    MapRenderer& m_renderer;

    LayerRegistry m_registry;
    CacheBuster m_buster;
    TileProtocolDispatcher m_dispatcher;
    CompositionManager m_compositions;
    ZoomInvalidationTracker m_zoom;

    bool m_pixel_mode = false;
    bool m_shut_down = false;

    /* Restack renderer layers to match the registry order */
    void apply_layer_order();
};

} // namespace rastile
