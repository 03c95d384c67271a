#pragma once
#include "engine/raster_engine.h"
#include <string>
#include <vector>
#include <utility>

namespace rastile {

/* RasterEngine client for a raster-processing service reached over HTTP.
   Every command is GET <base_url>/invoke/<command>?<named params>.
   Tile commands answer with the tile bytes; open_raster and get_histogram
   answer with JSON. Uses libcurl, one easy handle per call. */
class HttpRasterEngine : public RasterEngine {
public:
    explicit HttpRasterEngine(const std::string& base_url,
                              long timeout_s = 30,
                              const std::string& user_agent = "");

    DatasetInfo open(const std::string& path) override;
    void close(const std::string& dataset_id) override;
    Histogram histogram(const std::string& dataset_id, int band, int bins) override;
    std::vector<uint8_t> render(const EngineRequest& req) override;

    using Params = std::vector<std::pair<std::string, std::string>>;

    /* Build the full request URL (exposed for diagnostics and tests) */
    std::string build_url(const std::string& command, const Params& params) const;

    /* Named parameters sent for a tile request */
    static Params tile_params(const EngineRequest& req);
    /* Named parameters sent for get_histogram */
    static Params histogram_params(const std::string& dataset_id, int band, int bins);

    /* Decode service JSON payloads. Throw EngineError on malformed input. */
    static DatasetInfo parse_dataset_info(const std::string& json);
    static Histogram parse_histogram(const std::string& json);

private:
    std::string m_base_url;
    long m_timeout_s;
    std::string m_user_agent;

    /* Perform the call. Throws EngineError on transport failure or non-200. */
    std::vector<uint8_t> invoke(const std::string& command, const Params& params) const;
};

} // namespace rastile
