#pragma once
#include "layer/layer.h"
#include "render/map_renderer.h"
#include "util/config.h"
#include <string>
#include <cstdint>

namespace rastile {

/* Monotonic token appended as ?v= to force the renderer to re-request tiles */
class CacheBuster {
public:
    std::string next() { return std::to_string(++m_counter); }
    uint64_t current() const { return m_counter; }

private:
    uint64_t m_counter = 0;
};

/* Source description for a raster layer. Non-georeferenced layers get
   clamped pseudo-geographic bounds. */
RasterSourceSpec source_spec_for(const RasterLayer& layer, const Config& config,
                                 const std::string& cache_buster = "");

/* Add source + layer for a raster record, applying visibility and opacity */
void attach_layer(MapRenderer& renderer, const RasterLayer& layer, const Config& config);

/* Remove layer then source. Missing entries are ignored. */
void detach_layer(MapRenderer& renderer, const std::string& layer_id);

/* Point the layer's source at a fresh URL. Returns false if it has no source. */
bool refresh_layer_tiles(MapRenderer& renderer, const std::string& layer_id,
                         const std::string& cache_buster);

} // namespace rastile
