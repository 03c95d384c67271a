#include "tile/tile_address.h"
#include "util/error.h"
#include <cctype>
#include <climits>
#include <sstream>

namespace rastile {

static const std::string SCHEME_PREFIX = "raster-";
static const std::string SCHEME_SEP = "://";

static bool parse_component(const std::string& s, int& out) {
    if (s.empty() || s.size() > 9) return false;
    long v = 0;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        v = v * 10 + (c - '0');
    }
    if (v > INT_MAX) return false;
    out = static_cast<int>(v);
    return true;
}

TileAddress parse_tile_url(const std::string& url) {
    auto bad = [&](const char* why) {
        return TileError(TileError::Kind::BadAddress,
                         "Invalid raster URL format (" + std::string(why) + "): " + url);
    };

    if (url.compare(0, SCHEME_PREFIX.size(), SCHEME_PREFIX) != 0) throw bad("scheme");
    size_t sep = url.find(SCHEME_SEP, SCHEME_PREFIX.size());
    if (sep == std::string::npos || sep == SCHEME_PREFIX.size()) throw bad("layer id");

    TileAddress addr;
    addr.layer_id = url.substr(SCHEME_PREFIX.size(), sep - SCHEME_PREFIX.size());

    std::string rest = url.substr(sep + SCHEME_SEP.size());
    std::string query;
    size_t q = rest.find('?');
    if (q != std::string::npos) {
        query = rest.substr(q + 1);
        rest = rest.substr(0, q);
    }

    /* z/x/y */
    int parts[3];
    size_t pos = 0;
    for (int i = 0; i < 3; ++i) {
        size_t slash = rest.find('/', pos);
        bool last = (i == 2);
        if (last != (slash == std::string::npos)) throw bad("path");
        std::string token = last ? rest.substr(pos) : rest.substr(pos, slash - pos);
        if (!parse_component(token, parts[i])) throw bad("coordinate");
        pos = slash + 1;
    }
    addr.coord = {parts[0], parts[1], parts[2]};

    /* Only the v= parameter is meaningful; anything else is kept verbatim */
    std::istringstream qs(query);
    std::string kv;
    while (std::getline(qs, kv, '&')) {
        if (kv.compare(0, 2, "v=") == 0) {
            addr.cache_buster = kv.substr(2);
            break;
        }
    }
    if (addr.cache_buster.empty() && !query.empty()) addr.cache_buster = query;

    return addr;
}

std::string format_tile_url(const TileAddress& addr) {
    std::ostringstream ss;
    ss << scheme_for(addr.layer_id) << SCHEME_SEP
       << addr.coord.z << "/" << addr.coord.x << "/" << addr.coord.y;
    if (!addr.cache_buster.empty()) ss << "?v=" << addr.cache_buster;
    return ss.str();
}

std::string scheme_for(const std::string& layer_id) {
    return SCHEME_PREFIX + layer_id;
}

std::string source_id_for(const std::string& layer_id) {
    return "raster-source-" + layer_id;
}

std::string layer_id_for(const std::string& layer_id) {
    return "raster-layer-" + layer_id;
}

std::string tile_template(const std::string& layer_id, const std::string& cache_buster) {
    std::string t = scheme_for(layer_id) + SCHEME_SEP + "{z}/{x}/{y}";
    if (!cache_buster.empty()) t += "?v=" + cache_buster;
    return t;
}

} // namespace rastile
