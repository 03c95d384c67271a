#include "workspace.h"
#include "geo/pixel_mapper.h"
#include "tile/tile_address.h"
#include "util/error.h"
#include "util/log.h"

namespace rastile {

static Stretch stretch_from(const BandStats& s) {
    return Stretch{s.min, s.max, 1.0};
}

Workspace::Workspace(RasterEngine& engine, MapRenderer& renderer, const Config& config)
    : m_config(config), m_engine(engine), m_renderer(renderer),
      m_dispatcher(m_registry, engine, renderer, m_config),
      m_compositions(m_registry, m_dispatcher, renderer, m_config, m_buster),
      m_zoom(m_registry, renderer, m_buster, m_config.remote_prefixes) {
    m_zoom.attach();
}

Workspace::~Workspace() {
    shutdown();
}

std::string Workspace::open_raster(const std::string& path) {
    DatasetInfo info;
    try {
        info = m_engine.open(path);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to open raster %s: %s", path.c_str(), e.what());
        throw;
    }

    RasterLayer layer;
    layer.id = info.id;
    layer.path = info.path.empty() ? path : info.path;
    layer.width = info.width;
    layer.height = info.height;
    layer.bands = info.bands;
    layer.bounds = info.bounds;
    layer.band_stats = info.band_stats;
    layer.is_georeferenced = info.is_georeferenced;

    layer.display_mode = info.bands >= 3 ? DisplayMode::Rgb : DisplayMode::Grayscale;
    layer.band = 1;
    layer.stretch = stretch_from(layer.stats_for_band(1));
    layer.rgb_bands = RgbBands{1, 2, 3};
    layer.rgb_stretch = RgbStretch{stretch_from(layer.stats_for_band(1)),
                                   stretch_from(layer.stats_for_band(2)),
                                   stretch_from(layer.stats_for_band(3))};

    std::optional<PixelExtent> extent;
    if (!info.is_georeferenced) {
        PseudoGeoBounds pg = compute_pseudo_geo_bounds(info.width, info.height, m_config.pixel_scale);
        layer.bounds = pg.bounds;
        layer.pixel_scale = pg.pixel_scale;
        layer.pixel_offset = pg.pixel_offset;
        extent = PixelExtent{info.width, info.height, pg.pixel_scale, pg.pixel_offset};
    }

    if (!m_registry.add(layer)) {
        LOG_ERROR("Failed to add raster %s: id '%s' is already in use",
                  path.c_str(), info.id.c_str());
        throw EngineError("dataset id already in use: " + info.id);
    }

    if (extent) {
        m_renderer.set_pixel_coord_mode(true, extent);
        m_pixel_mode = true;
    } else if (m_pixel_mode) {
        m_renderer.set_pixel_coord_mode(false, std::nullopt);
        m_pixel_mode = false;
    }

    m_dispatcher.register_layer(layer.id, ProtocolKind::Layer);
    attach_layer(m_renderer, layer, m_config);
    m_registry.select(layer.id);
    m_renderer.fit_bounds(layer.bounds);

    LOG_INFO("Opened %s (%dx%d, %d band%s%s)", file_name_of(layer.path).c_str(),
             layer.width, layer.height, layer.bands, layer.bands == 1 ? "" : "s",
             layer.is_georeferenced ? "" : ", pixel space");
    return layer.id;
}

bool Workspace::add_vector_layer(VectorLayer layer) {
    std::string id = layer.id;
    if (!m_registry.add(std::move(layer))) return false;
    m_registry.select(id);
    return true;
}

bool Workspace::remove_layer(const std::string& id) {
    const Layer* layer = m_registry.get(id);
    if (!layer) return false;

    if (const RasterLayer* raster = as_raster(layer)) {
        bool composition = raster->is_composition;
        detach_layer(m_renderer, id);
        m_dispatcher.unregister_layer(id);

        /* Compositions borrow their sources' datasets */
        if (!composition) {
            try {
                m_engine.close(id);
            } catch (const std::exception& e) {
                LOG_WARN("Failed to close dataset %s: %s", id.c_str(), e.what());
            }
        }
    }

    m_registry.remove(id);
    LOG_DEBUG("Removed layer %s", id.c_str());
    return true;
}

bool Workspace::refresh(const std::string& id) {
    const RasterLayer* layer = m_registry.get_raster(id);
    if (!layer) return false;
    if (layer->is_composition) return m_compositions.refresh(id);
    return refresh_layer_tiles(m_renderer, id, m_buster.next());
}

bool Workspace::set_band(const std::string& id, int band) {
    return m_registry.set_band(id, band) && refresh(id);
}

bool Workspace::set_stretch(const std::string& id, const Stretch& stretch) {
    return m_registry.set_stretch(id, stretch) && refresh(id);
}

bool Workspace::set_display_mode(const std::string& id, DisplayMode mode) {
    return m_registry.set_display_mode(id, mode) && refresh(id);
}

bool Workspace::set_rgb_bands(const std::string& id, const RgbBands& bands) {
    return m_registry.set_rgb_bands(id, bands) && refresh(id);
}

bool Workspace::set_rgb_stretch(const std::string& id, Channel channel, const Stretch& stretch) {
    return m_registry.set_rgb_stretch(id, channel, stretch) && refresh(id);
}

bool Workspace::set_cross_layer_rgb(const std::string& id, std::optional<CrossLayerRgb> config) {
    return m_registry.set_cross_layer_rgb(id, std::move(config)) && refresh(id);
}

bool Workspace::set_visible(const std::string& id, bool visible) {
    if (!m_registry.set_visible(id, visible)) return false;
    if (m_registry.get_raster(id)) m_renderer.set_layer_visibility(layer_id_for(id), visible);
    return true;
}

bool Workspace::toggle_visibility(const std::string& id) {
    const Layer* layer = m_registry.get(id);
    if (!layer) return false;
    return set_visible(id, !common(*layer).visible);
}

bool Workspace::set_opacity(const std::string& id, double opacity) {
    if (!m_registry.set_opacity(id, opacity)) return false;
    if (const RasterLayer* raster = m_registry.get_raster(id)) {
        m_renderer.set_layer_opacity(layer_id_for(id), raster->opacity);
    }
    return true;
}

bool Workspace::rename(const std::string& id, const std::string& name) {
    return m_registry.set_display_name(id, name);
}

bool Workspace::reorder(int from_index, int to_index) {
    if (!m_registry.reorder(from_index, to_index)) return false;
    apply_layer_order();
    return true;
}

void Workspace::apply_layer_order() {
    /* Raising each layer to the top, bottom first, leaves the stack in registry order */
    for (const auto& id : m_registry.order()) {
        if (m_registry.get_raster(id)) m_renderer.move_layer(layer_id_for(id), "");
    }
}

bool Workspace::fit_all() {
    std::vector<Bounds> boxes;
    for (const auto& id : m_registry.order()) {
        if (const Layer* layer = m_registry.get(id)) boxes.push_back(common(*layer).bounds);
    }
    auto merged = merge_bounds(boxes);
    if (!merged) return false;
    m_renderer.fit_bounds(*merged);
    return true;
}

std::optional<Histogram> Workspace::histogram(const std::string& id, int band, int bins) {
    const RasterLayer* layer = m_registry.get_raster(id);
    if (!layer) return std::nullopt;

    /* Composition bands 1..3 are the R/G/B channels; read them from the
       dataset and band that feed each channel */
    std::string dataset = layer->id;
    int dataset_band = band;
    if (layer->is_composition) {
        if (band < 1 || band > 3) return std::nullopt;
        Channel channel = static_cast<Channel>(band - 1);
        if (layer->is_cross_layer_composition) {
            if (!layer->cross_layer_rgb) return std::nullopt;
            const CrossLayerRgb& cfg = *layer->cross_layer_rgb;
            dataset = channel == Channel::R ? cfg.r_layer_id
                    : channel == Channel::G ? cfg.g_layer_id : cfg.b_layer_id;
            dataset_band = channel == Channel::R ? cfg.r_band
                         : channel == Channel::G ? cfg.g_band : cfg.b_band;
        } else {
            if (!layer->source_layer_id) return std::nullopt;
            dataset = *layer->source_layer_id;
            dataset_band = channel == Channel::R ? layer->rgb_bands.r
                         : channel == Channel::G ? layer->rgb_bands.g : layer->rgb_bands.b;
        }
    }

    try {
        return m_engine.histogram(dataset, dataset_band, bins);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to load histogram for %s band %d: %s", id.c_str(), band, e.what());
        return std::nullopt;
    }
}

std::optional<std::string> Workspace::create_composition(const std::string& source_id,
                                                         bool cross_layer) {
    return cross_layer ? m_compositions.create_cross_layer_composition(source_id)
                       : m_compositions.create_single_layer_composition(source_id);
}

void Workspace::shutdown() {
    if (m_shut_down) return;
    m_shut_down = true;
    m_zoom.detach();
    m_dispatcher.shutdown();
    LOG_DEBUG("Workspace shut down (%d layer(s))", m_registry.size());
}

} // namespace rastile
