#include "tile/tile_dispatcher.h"
#include "util/error.h"
#include "util/log.h"

namespace rastile {

ProtocolKind protocol_kind_for(const RasterLayer& layer) {
    if (layer.is_cross_layer_composition) return ProtocolKind::CrossLayerComposition;
    if (layer.is_composition) return ProtocolKind::Composition;
    return ProtocolKind::Layer;
}

/* First-band min/max of a cross-layer source, gamma 1 */
static Stretch source_stretch(const RasterLayer& src) {
    Stretch s;
    if (!src.band_stats.empty()) {
        s.min = src.band_stats[0].min;
        s.max = src.band_stats[0].max;
    }
    return s;
}

TileProtocolDispatcher::TileProtocolDispatcher(const LayerRegistry& registry, RasterEngine& engine,
                                               MapRenderer& renderer, const Config& config)
    : m_registry(registry), m_engine(engine), m_renderer(renderer), m_config(config),
      m_cache(config.tile_cache_size), m_fetcher(engine) {
    m_fetcher.start(config.fetch_threads);
}

TileProtocolDispatcher::~TileProtocolDispatcher() {
    shutdown();
}

void TileProtocolDispatcher::register_layer(const std::string& layer_id, ProtocolKind kind) {
    std::string scheme = scheme_for(layer_id);
    if (m_protocols.count(layer_id)) {
        m_renderer.remove_protocol(scheme);
    }

    ProtocolHandler handler;
    handler.request = [this](const std::string& url, TileCallback done) {
        return request(url, std::move(done));
    };
    handler.cancel = [this](RequestId id) { cancel(id); };

    m_renderer.add_protocol(scheme, std::move(handler));
    m_protocols[layer_id] = kind;
    if (m_shut_down) {
        m_shut_down = false;
        m_fetcher.start(m_config.fetch_threads);
    }
    LOG_DEBUG("Dispatcher: registered %s", scheme.c_str());
}

bool TileProtocolDispatcher::unregister_layer(const std::string& layer_id) {
    auto it = m_protocols.find(layer_id);
    if (it == m_protocols.end()) return false;
    m_renderer.remove_protocol(scheme_for(layer_id));
    m_protocols.erase(it);
    LOG_DEBUG("Dispatcher: unregistered %s", scheme_for(layer_id).c_str());
    return true;
}

bool TileProtocolDispatcher::is_registered(const std::string& layer_id) const {
    return m_protocols.count(layer_id) > 0;
}

std::optional<ProtocolKind> TileProtocolDispatcher::registered_kind(const std::string& layer_id) const {
    auto it = m_protocols.find(layer_id);
    if (it == m_protocols.end()) return std::nullopt;
    return it->second;
}

TilePlan TileProtocolDispatcher::resolve(const TileAddress& addr) const {
    const Layer* layer = m_registry.get(addr.layer_id);
    if (!layer) {
        throw TileError(TileError::Kind::UnknownLayer, "Layer not found: " + addr.layer_id);
    }
    const RasterLayer* raster = as_raster(layer);
    if (!raster) {
        throw TileError(TileError::Kind::NotRaster, "Not a raster layer: " + addr.layer_id);
    }

    auto registered = registered_kind(addr.layer_id);
    ProtocolKind kind = registered ? *registered : protocol_kind_for(*raster);

    switch (kind) {
        case ProtocolKind::Layer:
            return plan_layer(*raster, addr.coord);
        case ProtocolKind::Composition:
            return plan_composition(*raster, addr.coord);
        case ProtocolKind::CrossLayerComposition:
            if (!raster->cross_layer_rgb) return TilePlan{};
            return plan_cross_layer(*raster->cross_layer_rgb, &raster->rgb_stretch, addr.coord);
    }
    return TilePlan{};
}

TilePlan TileProtocolDispatcher::plan_layer(const RasterLayer& layer, const TileCoord& coord) const {
    switch (layer.display_mode) {
        case DisplayMode::CrossLayerRgb:
            if (layer.cross_layer_rgb) {
                return plan_cross_layer(*layer.cross_layer_rgb, nullptr, coord);
            }
            break;
        case DisplayMode::Rgb:
            if (layer.bands >= 3) {
                RgbTileRequest req;
                req.dataset_id = layer.id;
                req.coord = coord;
                req.tile_size = m_config.tile_size;
                req.bands = layer.rgb_bands;
                req.stretch = layer.rgb_stretch;
                return TilePlan{EngineRequest(std::move(req))};
            }
            break;
        case DisplayMode::Grayscale:
            break;
    }

    StretchTileRequest req;
    req.dataset_id = layer.id;
    req.coord = coord;
    req.tile_size = m_config.tile_size;
    req.band = layer.band;
    req.stretch = layer.stretch;
    req.pixel_space = !layer.is_georeferenced;
    return TilePlan{EngineRequest(std::move(req))};
}

TilePlan TileProtocolDispatcher::plan_composition(const RasterLayer& comp, const TileCoord& coord) const {
    /* The source dataset is closed once its layer is gone */
    if (!comp.source_layer_id || !m_registry.get_raster(*comp.source_layer_id)) {
        return TilePlan{};
    }

    RgbTileRequest req;
    req.dataset_id = *comp.source_layer_id;
    req.coord = coord;
    req.tile_size = m_config.tile_size;
    req.bands = comp.rgb_bands;
    req.stretch = comp.rgb_stretch;
    return TilePlan{EngineRequest(std::move(req))};
}

TilePlan TileProtocolDispatcher::plan_cross_layer(const CrossLayerRgb& cfg, const RgbStretch* stretch,
                                                  const TileCoord& coord) const {
    const RasterLayer* r = m_registry.get_raster(cfg.r_layer_id);
    const RasterLayer* g = m_registry.get_raster(cfg.g_layer_id);
    const RasterLayer* b = m_registry.get_raster(cfg.b_layer_id);
    if (!r || !g || !b) return TilePlan{};

    CrossLayerRgbTileRequest req;
    req.red_id = cfg.r_layer_id;
    req.green_id = cfg.g_layer_id;
    req.blue_id = cfg.b_layer_id;
    req.red_band = cfg.r_band;
    req.green_band = cfg.g_band;
    req.blue_band = cfg.b_band;
    req.coord = coord;
    req.tile_size = m_config.tile_size;
    if (stretch) {
        req.stretch = *stretch;
    } else {
        req.stretch = RgbStretch{source_stretch(*r), source_stretch(*g), source_stretch(*b)};
    }
    req.pixel_space = !r->is_georeferenced || !g->is_georeferenced || !b->is_georeferenced;
    return TilePlan{EngineRequest(std::move(req))};
}

std::string TileProtocolDispatcher::cache_key(const TileAddress& addr, const EngineRequest& req) {
    return addr.layer_id + "|v=" + addr.cache_buster + "|" + request_signature(req);
}

std::vector<uint8_t> TileProtocolDispatcher::fetch(const std::string& url) {
    TileAddress addr = parse_tile_url(url);
    TilePlan plan = resolve(addr);
    if (plan.empty()) return {};

    std::string key = cache_key(addr, *plan.request);
    if (auto hit = m_cache.get(key)) return std::move(*hit);

    std::vector<uint8_t> data;
    try {
        data = m_engine.render(*plan.request);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to load tile %s z=%d x=%d y=%d: %s", addr.layer_id.c_str(),
                  addr.coord.z, addr.coord.x, addr.coord.y, e.what());
        throw TileError(TileError::Kind::Engine, e.what());
    }
    m_cache.set(key, data);
    return data;
}

RequestId TileProtocolDispatcher::request(const std::string& url, TileCallback done) {
    RequestId id = m_next_id++;

    TileAddress addr;
    TilePlan plan;
    try {
        addr = parse_tile_url(url);
        plan = resolve(addr);
    } catch (const TileError& e) {
        LOG_WARN("Dispatcher: %s", e.what());
        m_ready.push_back({id, TileResponse{{}, std::current_exception()}, std::move(done)});
        return id;
    }

    if (plan.empty()) {
        m_ready.push_back({id, TileResponse{}, std::move(done)});
        return id;
    }

    std::string key = cache_key(addr, *plan.request);
    if (auto hit = m_cache.get(key)) {
        m_ready.push_back({id, TileResponse{std::move(*hit), nullptr}, std::move(done)});
        return id;
    }

    m_pending[id] = Pending{key, addr, std::move(done)};
    m_fetcher.submit(id, std::move(*plan.request));
    return id;
}

void TileProtocolDispatcher::cancel(RequestId id) {
    for (auto it = m_ready.begin(); it != m_ready.end(); ++it) {
        if (it->id == id) {
            m_ready.erase(it);
            return;
        }
    }
    if (m_pending.erase(id)) {
        m_fetcher.cancel(id);
    }
}

void TileProtocolDispatcher::deliver(RequestId id, const TileCallback& done,
                                     TileResponse response) {
    try {
        done(std::move(response));
    } catch (const std::exception& e) {
        LOG_ERROR("Tile callback for request %llu failed: %s",
                  static_cast<unsigned long long>(id), e.what());
    }
}

int TileProtocolDispatcher::pump() {
    int delivered = 0;

    /* Callbacks may issue new requests; only deliver what is queued now */
    std::deque<Ready> ready;
    ready.swap(m_ready);
    for (auto& r : ready) {
        deliver(r.id, r.done, std::move(r.response));
        delivered++;
    }

    TileFetcher::Result result;
    while (m_fetcher.poll_result(result)) {
        auto it = m_pending.find(result.id);
        if (it == m_pending.end()) continue; // cancelled after completion
        Pending pending = std::move(it->second);
        m_pending.erase(it);

        TileResponse response;
        if (result.error) {
            try {
                std::rethrow_exception(result.error);
            } catch (const std::exception& e) {
                LOG_ERROR("Failed to load tile %s z=%d x=%d y=%d: %s",
                          pending.addr.layer_id.c_str(), pending.addr.coord.z,
                          pending.addr.coord.x, pending.addr.coord.y, e.what());
                response.error = std::make_exception_ptr(
                    TileError(TileError::Kind::Engine, e.what()));
            } catch (...) {
                LOG_ERROR("Failed to load tile %s z=%d x=%d y=%d (unknown error)",
                          pending.addr.layer_id.c_str(), pending.addr.coord.z,
                          pending.addr.coord.x, pending.addr.coord.y);
                response.error = result.error;
            }
        } else {
            m_cache.set(pending.cache_key, result.data);
            response.data = std::move(result.data);
        }

        deliver(result.id, pending.done, std::move(response));
        delivered++;
    }
    return delivered;
}

void TileProtocolDispatcher::shutdown() {
    if (m_shut_down) return;
    m_shut_down = true;

    for (auto& [layer_id, kind] : m_protocols) {
        m_renderer.remove_protocol(scheme_for(layer_id));
    }
    m_protocols.clear();
    m_fetcher.stop();
    m_pending.clear();
    m_ready.clear();
}

} // namespace rastile
