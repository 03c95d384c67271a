#pragma once
#include "cache/lru_cache.h"
#include "engine/raster_engine.h"
#include "layer/layer_registry.h"
#include "render/map_renderer.h"
#include "tile/tile_address.h"
#include "tile/tile_fetcher.h"
#include "util/config.h"
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace rastile {

/* What a registered scheme renders */
enum class ProtocolKind {
    Layer,                 // follow the layer's own display mode
    Composition,           // RGB of the source dataset with the composition's bands/stretch
    CrossLayerComposition  // three source datasets with the composition's stretch
};

ProtocolKind protocol_kind_for(const RasterLayer& layer);

/* Outcome of resolving a tile address against the registry.
   No request means the tile is intentionally blank. */
struct TilePlan {
    std::optional<EngineRequest> request;

    bool empty() const { return !request.has_value(); }
};

/* Owns one virtual protocol per raster/composition layer and turns tile
   requests into engine calls, with an LRU cache in front of the engine.
   Every request re-reads the registry; handlers capture nothing but the
   dispatcher itself. Not thread-safe: call from the owning event loop. */
class TileProtocolDispatcher {
public:
    TileProtocolDispatcher(const LayerRegistry& registry, RasterEngine& engine,
                           MapRenderer& renderer, const Config& config);
    ~TileProtocolDispatcher();

    /* (Re)register the scheme for a layer. A previous handler is removed first. */
    void register_layer(const std::string& layer_id, ProtocolKind kind);
    bool unregister_layer(const std::string& layer_id);
    bool is_registered(const std::string& layer_id) const;
    std::optional<ProtocolKind> registered_kind(const std::string& layer_id) const;
    int registered_count() const { return static_cast<int>(m_protocols.size()); }

    /* Throws TileError(UnknownLayer / NotRaster) */
    TilePlan resolve(const TileAddress& addr) const;

    /* Synchronous cache-then-compute. Throws TileError; engine failures
       are logged and re-raised as TileError(Engine). Blank tiles are empty. */
    std::vector<uint8_t> fetch(const std::string& url);

    /* Asynchronous path used by the renderer. Never blocks; `done` runs
       from pump() exactly once unless the request is cancelled first. */
    RequestId request(const std::string& url, TileCallback done);
    void cancel(RequestId id);

    /* Deliver completed requests. Returns the number of callbacks invoked. */
    int pump();

    /* Requests issued but not yet delivered */
    int in_flight() const { return static_cast<int>(m_pending.size() + m_ready.size()); }

    CacheStats cache_stats() const { return m_cache.stats(); }
    void clear_cache() { m_cache.clear(); }

    /* Remove every scheme from the renderer and stop the fetcher.
       Undelivered requests are dropped. */
    void shutdown();

    static std::string cache_key(const TileAddress& addr, const EngineRequest& req);

    TileProtocolDispatcher(const TileProtocolDispatcher&) = delete;
    TileProtocolDispatcher& operator=(const TileProtocolDispatcher&) = delete;

private:
    const LayerRegistry& m_registry;
    RasterEngine& m_engine;
    MapRenderer& m_renderer;
    Config m_config;

    LruCache<std::vector<uint8_t>> m_cache;
    TileFetcher m_fetcher;
    std::unordered_map<std::string, ProtocolKind> m_protocols;

    struct Pending {
        std::string cache_key;
        TileAddress addr;
        TileCallback done;
    };
    std::unordered_map<RequestId, Pending> m_pending;

    /* Answered without an engine call; delivered on the next pump() */
    struct Ready {
        RequestId id;
        TileResponse response;
        TileCallback done;
    };
    std::deque<Ready> m_ready;

    /* Invoke one callback; a throwing callback is logged and does not
       stop delivery of the others */
    static void deliver(RequestId id, const TileCallback& done, TileResponse response);

    RequestId m_next_id = 1;
    bool m_shut_down = false;

    TilePlan plan_layer(const RasterLayer& layer, const TileCoord& coord) const;
    TilePlan plan_composition(const RasterLayer& comp, const TileCoord& coord) const;
    TilePlan plan_cross_layer(const CrossLayerRgb& cfg, const RgbStretch* stretch,
                              const TileCoord& coord) const;
};

} // namespace rastile
