#pragma once
#include "tile/tile_coord.h"
#include "layer/layer.h"
#include "geo/bounds.h"
#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <cstdint>

namespace rastile {

/* Metadata returned when a dataset is opened */
struct DatasetInfo {
    std::string id;
    std::string path;
    int width = 0;
    int height = 0;
    int bands = 0;
    Bounds bounds;
    std::vector<BandStats> band_stats;
    bool is_georeferenced = true;
    std::optional<double> nodata;
    std::string projection;
};

struct Histogram {
    int band = 1;
    double min = 0.0;
    double max = 0.0;
    std::vector<uint64_t> counts;
    std::vector<double> bin_edges;
};

/* Single-band stretch. pixel_space selects the non-georeferenced variant. */
struct StretchTileRequest {
    std::string dataset_id;
    TileCoord coord{0, 0, 0};
    int tile_size = 256;
    int band = 1;
    Stretch stretch;
    bool pixel_space = false;
};

/* Three bands of one dataset */
struct RgbTileRequest {
    std::string dataset_id;
    TileCoord coord{0, 0, 0};
    int tile_size = 256;
    RgbBands bands;
    RgbStretch stretch;
};

/* One band from each of three datasets */
struct CrossLayerRgbTileRequest {
    std::string red_id, green_id, blue_id;
    int red_band = 1, green_band = 1, blue_band = 1;
    TileCoord coord{0, 0, 0};
    int tile_size = 256;
    RgbStretch stretch;
    bool pixel_space = false;
};

using EngineRequest = std::variant<StretchTileRequest, RgbTileRequest, CrossLayerRgbTileRequest>;

/* Wire command name, e.g. "get_tile_stretched" or "get_cross_layer_pixel_rgb_tile" */
const char* command_name(const EngineRequest& req);

/* Deterministic text covering every parameter that affects pixel output */
std::string request_signature(const EngineRequest& req);

const TileCoord& request_coord(const EngineRequest& req);

/* External raster-processing service. Decoding, resampling and stretch
   math all happen on the other side of this interface.
   render() is called from the tile fetcher thread; implementations must
   tolerate calls from a thread other than the one that opened datasets.
   All methods report failures by throwing EngineError. */
class RasterEngine {
public:
    virtual ~RasterEngine() = default;

    virtual DatasetInfo open(const std::string& path) = 0;
    virtual void close(const std::string& dataset_id) = 0;
    virtual Histogram histogram(const std::string& dataset_id, int band, int bins) = 0;

    /* Encoded tile bytes for one request */
    virtual std::vector<uint8_t> render(const EngineRequest& req) = 0;
};

} // namespace rastile
