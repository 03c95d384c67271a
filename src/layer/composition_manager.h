#pragma once
#include "layer/layer_registry.h"
#include "render/layer_binding.h"
#include "render/map_renderer.h"
#include "tile/tile_dispatcher.h"
#include "util/config.h"
#include <optional>
#include <string>

namespace rastile {

/* Freezes a layer's current RGB configuration into a new, independently
   addressable layer. The new record holds its own copies of bands and
   stretch; later edits to the sources do not reach it. */
class CompositionManager {
public:
    CompositionManager(LayerRegistry& registry, TileProtocolDispatcher& dispatcher,
                       MapRenderer& renderer, const Config& config, CacheBuster& buster);

    /* Three bands of one dataset. nullopt if the source is missing or not raster. */
    std::optional<std::string> create_single_layer_composition(const std::string& source_id);

    /* One band from each of three datasets, taken from the source's
       cross-layer config. nullopt if the config or any referenced layer is missing. */
    std::optional<std::string> create_cross_layer_composition(const std::string& source_id);

    /* Re-register the composition's scheme and make the renderer refetch.
       Returns false for unknown ids and non-composition layers. */
    bool refresh(const std::string& composition_id);

private:
    LayerRegistry& m_registry;
    TileProtocolDispatcher& m_dispatcher;
    MapRenderer& m_renderer;
    const Config& m_config;
    CacheBuster& m_buster;

    std::optional<std::string> install(RasterLayer comp, ProtocolKind kind);
};

} // namespace rastile
