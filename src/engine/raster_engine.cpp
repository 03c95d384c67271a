#include "engine/raster_engine.h"
#include <sstream>
#include <iomanip>

namespace rastile {

namespace {

/* Fixed formatting keeps signatures stable across platforms */
void put_stretch(std::ostringstream& ss, const Stretch& s) {
    ss << std::setprecision(17) << s.min << "," << s.max << "," << s.gamma;
}

void put_coord(std::ostringstream& ss, const TileCoord& c, int tile_size) {
    ss << c.z << "/" << c.x << "/" << c.y << "@" << tile_size;
}

struct CommandVisitor {
    const char* operator()(const StretchTileRequest& r) const {
        return r.pixel_space ? "get_pixel_tile" : "get_tile_stretched";
    }
    const char* operator()(const RgbTileRequest&) const {
        return "get_rgb_tile";
    }
    const char* operator()(const CrossLayerRgbTileRequest& r) const {
        return r.pixel_space ? "get_cross_layer_pixel_rgb_tile" : "get_cross_layer_rgb_tile";
    }
};

struct SignatureVisitor {
    std::ostringstream& ss;

    void operator()(const StretchTileRequest& r) const {
        ss << r.dataset_id << "|";
        put_coord(ss, r.coord, r.tile_size);
        ss << "|b" << r.band << "|";
        put_stretch(ss, r.stretch);
    }
    void operator()(const RgbTileRequest& r) const {
        ss << r.dataset_id << "|";
        put_coord(ss, r.coord, r.tile_size);
        ss << "|b" << r.bands.r << "," << r.bands.g << "," << r.bands.b << "|";
        put_stretch(ss, r.stretch.r);
        ss << ";";
        put_stretch(ss, r.stretch.g);
        ss << ";";
        put_stretch(ss, r.stretch.b);
    }
    void operator()(const CrossLayerRgbTileRequest& r) const {
        ss << r.red_id << ":" << r.red_band << ","
           << r.green_id << ":" << r.green_band << ","
           << r.blue_id << ":" << r.blue_band << "|";
        put_coord(ss, r.coord, r.tile_size);
        ss << "|";
        put_stretch(ss, r.stretch.r);
        ss << ";";
        put_stretch(ss, r.stretch.g);
        ss << ";";
        put_stretch(ss, r.stretch.b);
    }
};

} // namespace

const char* command_name(const EngineRequest& req) {
    return std::visit(CommandVisitor{}, req);
}

std::string request_signature(const EngineRequest& req) {
    std::ostringstream ss;
    ss << command_name(req) << "|";
    std::visit(SignatureVisitor{ss}, req);
    return ss.str();
}

const TileCoord& request_coord(const EngineRequest& req) {
    return std::visit([](const auto& r) -> const TileCoord& { return r.coord; }, req);
}

} // namespace rastile
