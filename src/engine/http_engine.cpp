#include "engine/http_engine.h"
#include "util/error.h"
#include "util/log.h"
#include <curl/curl.h>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <mutex>
#include <sstream>
#include <iomanip>

namespace pt = boost::property_tree;

namespace rastile {

static std::once_flag g_curl_init;

HttpRasterEngine::HttpRasterEngine(const std::string& base_url,
                                   long timeout_s,
                                   const std::string& user_agent)
    : m_base_url(base_url)
    , m_timeout_s(timeout_s)
    , m_user_agent(user_agent)
{
    while (!m_base_url.empty() && m_base_url.back() == '/') m_base_url.pop_back();
    std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

static std::string num(double v) {
    std::ostringstream ss;
    ss << std::setprecision(17) << v;
    return ss.str();
}

static std::string escape(const std::string& s) {
    std::string out;
    char* e = curl_easy_escape(nullptr, s.c_str(), static_cast<int>(s.size()));
    if (e) {
        out = e;
        curl_free(e);
    }
    return out;
}

std::string HttpRasterEngine::build_url(const std::string& command, const Params& params) const {
    std::string url = m_base_url + "/invoke/" + command;
    char sep = '?';
    for (auto& [key, value] : params) {
        url += sep;
        url += escape(key);
        url += '=';
        url += escape(value);
        sep = '&';
    }
    return url;
}

namespace {

void add_coord(HttpRasterEngine::Params& p, const TileCoord& c, int tile_size) {
    p.emplace_back("x", std::to_string(c.x));
    p.emplace_back("y", std::to_string(c.y));
    p.emplace_back("z", std::to_string(c.z));
    p.emplace_back("tileSize", std::to_string(tile_size));
}

void add_rgb_stretch(HttpRasterEngine::Params& p, const RgbStretch& s) {
    p.emplace_back("redMin", num(s.r.min));
    p.emplace_back("redMax", num(s.r.max));
    p.emplace_back("redGamma", num(s.r.gamma));
    p.emplace_back("greenMin", num(s.g.min));
    p.emplace_back("greenMax", num(s.g.max));
    p.emplace_back("greenGamma", num(s.g.gamma));
    p.emplace_back("blueMin", num(s.b.min));
    p.emplace_back("blueMax", num(s.b.max));
    p.emplace_back("blueGamma", num(s.b.gamma));
}

struct ParamVisitor {
    HttpRasterEngine::Params& p;

    void operator()(const StretchTileRequest& r) const {
        p.emplace_back("id", r.dataset_id);
        add_coord(p, r.coord, r.tile_size);
        p.emplace_back("band", std::to_string(r.band));
        p.emplace_back("min", num(r.stretch.min));
        p.emplace_back("max", num(r.stretch.max));
        p.emplace_back("gamma", num(r.stretch.gamma));
    }
    void operator()(const RgbTileRequest& r) const {
        p.emplace_back("id", r.dataset_id);
        add_coord(p, r.coord, r.tile_size);
        p.emplace_back("redBand", std::to_string(r.bands.r));
        p.emplace_back("greenBand", std::to_string(r.bands.g));
        p.emplace_back("blueBand", std::to_string(r.bands.b));
        add_rgb_stretch(p, r.stretch);
    }
    void operator()(const CrossLayerRgbTileRequest& r) const {
        p.emplace_back("redId", r.red_id);
        p.emplace_back("redBand", std::to_string(r.red_band));
        p.emplace_back("greenId", r.green_id);
        p.emplace_back("greenBand", std::to_string(r.green_band));
        p.emplace_back("blueId", r.blue_id);
        p.emplace_back("blueBand", std::to_string(r.blue_band));
        add_coord(p, r.coord, r.tile_size);
        add_rgb_stretch(p, r.stretch);
    }
};

/* libcurl write callback */
size_t curl_write_cb(void* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* buf = static_cast<std::vector<uint8_t>*>(userdata);
    size_t total = size * nmemb;
    auto* bytes = static_cast<uint8_t*>(ptr);
    buf->insert(buf->end(), bytes, bytes + total);
    return total;
}

pt::ptree parse_json(const std::string& json) {
    pt::ptree tree;
    std::istringstream in(json);
    try {
        pt::read_json(in, tree);
    } catch (const pt::json_parser_error& e) {
        throw EngineError(std::string("Malformed engine response: ") + e.what());
    }
    return tree;
}

std::vector<double> read_numbers(const pt::ptree& node) {
    std::vector<double> out;
    for (auto& [_, child] : node) {
        out.push_back(child.get_value<double>());
    }
    return out;
}

} // namespace

HttpRasterEngine::Params HttpRasterEngine::tile_params(const EngineRequest& req) {
    Params p;
    std::visit(ParamVisitor{p}, req);
    return p;
}

HttpRasterEngine::Params HttpRasterEngine::histogram_params(const std::string& dataset_id,
                                                            int band, int bins) {
    return {{"id", dataset_id},
            {"band", std::to_string(band)},
            {"numBins", std::to_string(bins)}};
}

std::vector<uint8_t> HttpRasterEngine::invoke(const std::string& command, const Params& params) const {
    std::string url = build_url(command, params);
    std::vector<uint8_t> data;

    CURL* curl = curl_easy_init();
    if (!curl) throw EngineError("curl_easy_init failed");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &data);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, m_timeout_s);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L); // called from worker threads

    if (!m_user_agent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, m_user_agent.c_str());
    }

    CURLcode res = curl_easy_perform(curl);
    long http_code = 0;
    if (res == CURLE_OK) curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        throw EngineError(command + " failed: " + curl_easy_strerror(res));
    }
    if (http_code != 200) {
        std::string body(data.begin(), data.end());
        if (body.size() > 200) body.resize(200);
        throw EngineError(command + " returned HTTP " + std::to_string(http_code) +
                          (body.empty() ? "" : ": " + body));
    }

    LOG_DEBUG("%s -> %zu bytes", command.c_str(), data.size());
    return data;
}

DatasetInfo HttpRasterEngine::open(const std::string& path) {
    auto body = invoke("open_raster", {{"path", path}});
    return parse_dataset_info(std::string(body.begin(), body.end()));
}

void HttpRasterEngine::close(const std::string& dataset_id) {
    invoke("close_dataset", {{"id", dataset_id}});
}

Histogram HttpRasterEngine::histogram(const std::string& dataset_id, int band, int bins) {
    auto body = invoke("get_histogram", histogram_params(dataset_id, band, bins));
    return parse_histogram(std::string(body.begin(), body.end()));
}

std::vector<uint8_t> HttpRasterEngine::render(const EngineRequest& req) {
    return invoke(command_name(req), tile_params(req));
}

DatasetInfo HttpRasterEngine::parse_dataset_info(const std::string& json) {
    pt::ptree tree = parse_json(json);

    DatasetInfo info;
    try {
        info.id = tree.get<std::string>("id");
        info.path = tree.get<std::string>("path", "");
        info.width = tree.get<int>("width");
        info.height = tree.get<int>("height");
        info.bands = tree.get<int>("bands");
        info.is_georeferenced = tree.get<bool>("is_georeferenced", true);
        info.projection = tree.get<std::string>("projection", "");
        if (auto nd = tree.get_optional<double>("nodata")) info.nodata = *nd;

        std::vector<double> b = read_numbers(tree.get_child("bounds"));
        if (b.size() != 4) throw EngineError("open_raster: bounds must have 4 values");
        info.bounds = {b[0], b[1], b[2], b[3]};

        if (auto stats = tree.get_child_optional("band_stats")) {
            for (auto& [_, s] : *stats) {
                BandStats bs;
                bs.min = s.get<double>("min");
                bs.max = s.get<double>("max");
                if (auto mean = s.get_optional<double>("mean")) bs.mean = *mean;
                if (auto sd = s.get_optional<double>("std_dev")) bs.std_dev = *sd;
                info.band_stats.push_back(bs);
            }
        }
    } catch (const pt::ptree_error& e) {
        throw EngineError(std::string("Malformed open_raster response: ") + e.what());
    }

    if (info.width <= 0 || info.height <= 0 || info.bands < 1) {
        throw EngineError("open_raster: invalid dimensions for " + info.id);
    }
    return info;
}

Histogram HttpRasterEngine::parse_histogram(const std::string& json) {
    pt::ptree tree = parse_json(json);

    Histogram h;
    try {
        h.band = tree.get<int>("band", 1);
        h.min = tree.get<double>("min");
        h.max = tree.get<double>("max");
        for (auto& [_, c] : tree.get_child("counts")) {
            h.counts.push_back(c.get_value<uint64_t>());
        }
        if (auto edges = tree.get_child_optional("bin_edges")) {
            h.bin_edges = read_numbers(*edges);
        }
    } catch (const pt::ptree_error& e) {
        throw EngineError(std::string("Malformed histogram response: ") + e.what());
    }
    return h;
}

} // namespace rastile
