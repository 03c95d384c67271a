#include "render/layer_binding.h"
#include "geo/pixel_mapper.h"
#include "tile/tile_address.h"

namespace rastile {

RasterSourceSpec source_spec_for(const RasterLayer& layer, const Config& config,
                                 const std::string& cache_buster) {
    RasterSourceSpec spec;
    spec.tiles = {tile_template(layer.id, cache_buster)};
    spec.tile_size = config.tile_size;
    spec.min_zoom = config.min_zoom;
    spec.max_zoom = config.max_zoom;
    spec.bounds = layer.bounds;

    if (!layer.is_georeferenced && layer.pixel_scale) {
        spec.bounds = compute_pseudo_geo_bounds(layer.width, layer.height, *layer.pixel_scale).bounds;
    }
    return spec;
}

void attach_layer(MapRenderer& renderer, const RasterLayer& layer, const Config& config) {
    std::string source_id = source_id_for(layer.id);
    std::string layer_id = layer_id_for(layer.id);

    renderer.add_source(source_id, source_spec_for(layer, config));
    renderer.add_layer(layer_id, source_id);
    renderer.set_layer_opacity(layer_id, layer.opacity);
    if (!layer.visible) renderer.set_layer_visibility(layer_id, false);
}

void detach_layer(MapRenderer& renderer, const std::string& layer_id) {
    renderer.remove_layer(layer_id_for(layer_id));
    std::string source_id = source_id_for(layer_id);
    if (renderer.has_source(source_id)) renderer.remove_source(source_id);
}

bool refresh_layer_tiles(MapRenderer& renderer, const std::string& layer_id,
                         const std::string& cache_buster) {
    std::string source_id = source_id_for(layer_id);
    if (!renderer.has_source(source_id)) return false;
    renderer.set_tiles(source_id, {tile_template(layer_id, cache_buster)});
    return true;
}

} // namespace rastile
