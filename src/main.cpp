#include "engine/http_engine.h"
#include "render/headless_renderer.h"
#include "tile/tile_address.h"
#include "util/config.h"
#include "util/log.h"
#include "workspace.h"
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <thread>

using namespace rastile;

static void print_usage() {
    printf("Usage: rastile [options]\n"
           "  --config FILE            Config file (default ~/.config/rastile/config.json)\n"
           "  --engine URL             Raster engine base URL\n"
           "  --open PATH              Open a raster (repeatable; last one is on top)\n"
           "  --rgb                    Show the top layer as RGB\n"
           "  --band N                 Show band N of the top layer in grayscale\n"
           "  --stretch MIN,MAX,GAMMA  Grayscale stretch for the top layer\n"
           "  --composite              Freeze the top layer's RGB into a composition\n"
           "  --tile Z/X/Y             Tile to fetch (default 0/0/0)\n"
           "  --out FILE               Write the tile bytes to FILE\n"
           "  --debug                  Enable debug logging\n"
           "  --help                   Show this help\n");
}

static bool parse_stretch(const char* s, Stretch& out) {
    return std::sscanf(s, "%lf,%lf,%lf", &out.min, &out.max, &out.gamma) == 3;
}

static bool parse_coord(const char* s, TileCoord& out) {
    char tail;
    return std::sscanf(s, "%d/%d/%d%c", &out.z, &out.x, &out.y, &tail) == 3 &&
           out.z >= 0 && out.x >= 0 && out.y >= 0;
}

int main(int argc, char* argv[]) {
    const char* config_path = nullptr;
    const char* engine_url = nullptr;
    const char* out_path = nullptr;
    std::vector<std::string> open_paths;
    bool rgb = false, composite = false, debug = false;
    int band = 0;
    std::optional<Stretch> stretch;
    TileCoord coord{0, 0, 0};

    /* Simple arg parsing */
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--engine") == 0 && i + 1 < argc) {
            engine_url = argv[++i];
        } else if (std::strcmp(argv[i], "--open") == 0 && i + 1 < argc) {
            open_paths.push_back(argv[++i]);
        } else if (std::strcmp(argv[i], "--rgb") == 0) {
            rgb = true;
        } else if (std::strcmp(argv[i], "--band") == 0 && i + 1 < argc) {
            band = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--stretch") == 0 && i + 1 < argc) {
            Stretch s;
            if (!parse_stretch(argv[++i], s)) {
                fprintf(stderr, "Invalid --stretch '%s' (expected MIN,MAX,GAMMA)\n", argv[i]);
                return 2;
            }
            stretch = s;
        } else if (std::strcmp(argv[i], "--composite") == 0) {
            composite = true;
        } else if (std::strcmp(argv[i], "--tile") == 0 && i + 1 < argc) {
            if (!parse_coord(argv[++i], coord)) {
                fprintf(stderr, "Invalid --tile '%s' (expected Z/X/Y)\n", argv[i]);
                return 2;
            }
        } else if (std::strcmp(argv[i], "--out") == 0 && i + 1 < argc) {
            out_path = argv[++i];
        } else if (std::strcmp(argv[i], "--debug") == 0) {
            debug = true;
        } else if (std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else {
            fprintf(stderr, "Unknown option: %s\n", argv[i]);
            print_usage();
            return 2;
        }
    }

    Config cfg = config_load_or_default(config_path ? config_path : config_default_path());
    if (engine_url) cfg.engine_url = engine_url;
    log_set_level(debug ? LogLevel::Debug : cfg.log_level);

    if (open_paths.empty()) {
        LOG_ERROR("Nothing to do: pass at least one --open PATH");
        return 2;
    }

    HttpRasterEngine engine(cfg.engine_url, cfg.engine_timeout_s, cfg.user_agent);
    HeadlessRenderer renderer;
    Workspace ws(engine, renderer, cfg);

    for (const auto& path : open_paths) {
        try {
            ws.open_raster(path);
        } catch (const std::exception&) {
            return 1;
        }
    }

    std::string top = ws.registry().order().back();
    if (band > 0) {
        if (!ws.set_band(top, band) || !ws.set_display_mode(top, DisplayMode::Grayscale)) {
            LOG_ERROR("Band %d is out of range for %s", band, top.c_str());
            return 1;
        }
    }
    if (stretch && !ws.set_stretch(top, *stretch)) return 1;
    if (rgb && !ws.set_display_mode(top, DisplayMode::Rgb)) return 1;
    if (composite) {
        auto comp = ws.create_composition(top, false);
        if (!comp) return 1;
        top = *comp;
    }

    /* One tile through the renderer's protocol, as a map view would ask for it */
    bool done = false;
    TileResponse response;
    renderer.request_tile(source_id_for(top), coord, [&](TileResponse r) {
        response = std::move(r);
        done = true;
    });

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(cfg.engine_timeout_s + 5);
    while (!done && std::chrono::steady_clock::now() < deadline) {
        if (ws.pump() == 0) std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    int rc = 0;
    if (!done) {
        LOG_ERROR("Timed out waiting for tile %d/%d/%d", coord.z, coord.x, coord.y);
        rc = 1;
    } else if (!response.ok()) {
        try {
            std::rethrow_exception(response.error);
        } catch (const std::exception& e) {
            LOG_ERROR("Tile %d/%d/%d failed: %s", coord.z, coord.x, coord.y, e.what());
        } catch (...) {
            LOG_ERROR("Tile %d/%d/%d failed (unknown error)", coord.z, coord.x, coord.y);
        }
        rc = 1;
    } else if (out_path) {
        std::ofstream out(out_path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(response.data.data()),
                  static_cast<std::streamsize>(response.data.size()));
        if (!out) {
            LOG_ERROR("Failed to write %s", out_path);
            rc = 1;
        } else {
            LOG_INFO("Wrote %zu bytes to %s", response.data.size(), out_path);
        }
    } else {
        printf("%s: %zu bytes\n", format_tile_url({top, coord, ""}).c_str(), response.data.size());
    }

    CacheStats s = ws.dispatcher().cache_stats();
    printf("cache: %d/%d entries, %ld hits, %ld misses, %ld evictions (%.1f%% hit rate)\n",
           s.size, s.max_size, s.hits, s.misses, s.evictions, s.hit_rate);

    ws.shutdown();
    return rc;
}
