#include "layer/composition_manager.h"
#include "util/log.h"

namespace rastile {

static std::string name_or_unknown(const std::string& path) {
    std::string name = file_name_of(path);
    return name.empty() ? "Unknown" : name;
}

/* Grayscale fallback shared by both composition kinds */
static void reset_grayscale(RasterLayer& comp) {
    comp.band = 1;
    comp.stretch = Stretch{0.0, 255.0, 1.0};
}

CompositionManager::CompositionManager(LayerRegistry& registry, TileProtocolDispatcher& dispatcher,
                                       MapRenderer& renderer, const Config& config,
                                       CacheBuster& buster)
    : m_registry(registry), m_dispatcher(dispatcher), m_renderer(renderer),
      m_config(config), m_buster(buster) {}

std::optional<std::string> CompositionManager::create_single_layer_composition(
        const std::string& source_id) {
    const RasterLayer* src = m_registry.get_raster(source_id);
    if (!src) {
        LOG_ERROR("Composition: source layer '%s' not found or not a raster", source_id.c_str());
        return std::nullopt;
    }

    RasterLayer comp;
    comp.id = m_registry.make_id("rgb-comp");
    comp.path = "RGB Composite: " + name_or_unknown(src->path);
    comp.is_composition = true;
    comp.source_layer_id = source_id;

    comp.width = src->width;
    comp.height = src->height;
    comp.bands = 3;
    comp.bounds = src->bounds;
    comp.is_georeferenced = src->is_georeferenced;
    comp.band_stats = {src->stats_for_band(src->rgb_bands.r),
                       src->stats_for_band(src->rgb_bands.g),
                       src->stats_for_band(src->rgb_bands.b)};

    comp.display_mode = DisplayMode::Rgb;
    comp.rgb_bands = src->rgb_bands;
    comp.rgb_stretch = src->rgb_stretch;
    reset_grayscale(comp);

    comp.pixel_scale = src->pixel_scale;
    comp.pixel_offset = src->pixel_offset;

    return install(std::move(comp), ProtocolKind::Composition);
}

std::optional<std::string> CompositionManager::create_cross_layer_composition(
        const std::string& source_id) {
    const RasterLayer* src = m_registry.get_raster(source_id);
    if (!src || !src->cross_layer_rgb) {
        LOG_ERROR("Composition: layer '%s' not found or not configured for cross-layer RGB",
                  source_id.c_str());
        return std::nullopt;
    }

    const CrossLayerRgb& cfg = *src->cross_layer_rgb;
    const RasterLayer* r = m_registry.get_raster(cfg.r_layer_id);
    const RasterLayer* g = m_registry.get_raster(cfg.g_layer_id);
    const RasterLayer* b = m_registry.get_raster(cfg.b_layer_id);
    if (!r || !g || !b) {
        LOG_ERROR("Composition: one or more cross-layer sources of '%s' not found",
                  source_id.c_str());
        return std::nullopt;
    }

    RasterLayer comp;
    comp.id = m_registry.make_id("cross-rgb-comp");
    comp.path = "Cross RGB: " + name_or_unknown(r->path) + "/" +
                name_or_unknown(g->path) + "/" + name_or_unknown(b->path);
    comp.is_composition = true;
    comp.is_cross_layer_composition = true;

    comp.cross_layer_rgb = CrossLayerRgb{
        cfg.r_layer_id, cfg.r_band > 0 ? cfg.r_band : 1,
        cfg.g_layer_id, cfg.g_band > 0 ? cfg.g_band : 1,
        cfg.b_layer_id, cfg.b_band > 0 ? cfg.b_band : 1};

    /* Red layer frames the composite */
    comp.width = r->width;
    comp.height = r->height;
    comp.bands = 3;
    comp.bounds = r->bounds;
    comp.is_georeferenced = r->is_georeferenced;
    comp.band_stats = {r->stats_for_band(1), g->stats_for_band(1), b->stats_for_band(1)};

    comp.display_mode = DisplayMode::CrossLayerRgb;
    comp.rgb_bands = RgbBands{1, 1, 1};
    for (int i = 0; i < 3; i++) {
        const BandStats& s = comp.band_stats[i];
        comp.rgb_stretch[static_cast<Channel>(i)] = Stretch{s.min, s.max, 1.0};
    }
    reset_grayscale(comp);

    comp.pixel_scale = r->pixel_scale;
    comp.pixel_offset = r->pixel_offset;

    return install(std::move(comp), ProtocolKind::CrossLayerComposition);
}

std::optional<std::string> CompositionManager::install(RasterLayer comp, ProtocolKind kind) {
    std::string id = comp.id;
    RasterLayer snapshot = comp;
    if (!m_registry.add(std::move(comp))) {
        LOG_ERROR("Composition: could not add layer '%s'", id.c_str());
        return std::nullopt;
    }

    m_dispatcher.register_layer(id, kind);
    attach_layer(m_renderer, snapshot, m_config);
    m_registry.select(id);

    LOG_INFO("Composition: created %s (%s)", id.c_str(), snapshot.path.c_str());
    return id;
}

bool CompositionManager::refresh(const std::string& composition_id) {
    const RasterLayer* comp = m_registry.get_raster(composition_id);
    if (!comp || !comp->is_composition) return false;

    m_dispatcher.register_layer(composition_id, protocol_kind_for(*comp));
    refresh_layer_tiles(m_renderer, composition_id, m_buster.next());
    return true;
}

} // namespace rastile
