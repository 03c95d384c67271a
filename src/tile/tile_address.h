#pragma once
#include "tile/tile_coord.h"
#include <string>

namespace rastile {

/* Parsed form of a virtual tile URL:
     raster-<layer id>://<z>/<x>/<y>[?v=<cache buster>]
   The cache buster only forces the renderer to treat the URL as new;
   it plays no part in routing. */
struct TileAddress {
    std::string layer_id;
    TileCoord coord{0, 0, 0};
    std::string cache_buster;
};

/* Throws TileError(BadAddress) on malformed input. */
TileAddress parse_tile_url(const std::string& url);

std::string format_tile_url(const TileAddress& addr);

/* Renderer-boundary names for a layer */
std::string scheme_for(const std::string& layer_id);    // raster-<id>
std::string source_id_for(const std::string& layer_id); // raster-source-<id>
std::string layer_id_for(const std::string& layer_id);  // raster-layer-<id>

/* "{z}/{x}/{y}" template registered with the renderer's tile source */
std::string tile_template(const std::string& layer_id, const std::string& cache_buster = "");

} // namespace rastile
