#include <rastile/rastile.h>
#include "engine/http_engine.h"
#include "render/headless_renderer.h"
#include "util/config.h"
#include "util/log.h"
#include "workspace.h"
#include <algorithm>
#include <cstring>
#include <memory>

using namespace rastile;

namespace {

struct Runtime {
    Config config;
    std::unique_ptr<HttpRasterEngine> engine;
    std::unique_ptr<HeadlessRenderer> renderer;
    std::unique_ptr<Workspace> workspace;
};

std::unique_ptr<Runtime> g_rt;

Workspace* ws() {
    if (!g_rt) {
        LOG_WARN("rastile: not initialized");
        return nullptr;
    }
    return g_rt->workspace.get();
}

int copy_out(const std::string& s, char* out, int cap) {
    if (!out || cap <= 0) return 0;
    size_t n = std::min(s.size(), static_cast<size_t>(cap - 1));
    std::memcpy(out, s.data(), n);
    out[n] = '\0';
    return 1;
}

} // namespace

int rastile_init(const char* engine_url) {
    if (g_rt) rastile_shutdown();

    auto rt = std::make_unique<Runtime>();
    rt->config = config_load_or_default(config_default_path());
    if (engine_url && *engine_url) rt->config.engine_url = engine_url;
    log_set_level(rt->config.log_level);

    try {
        rt->engine = std::make_unique<HttpRasterEngine>(rt->config.engine_url,
                                                        rt->config.engine_timeout_s,
                                                        rt->config.user_agent);
        rt->renderer = std::make_unique<HeadlessRenderer>();
        rt->workspace = std::make_unique<Workspace>(*rt->engine, *rt->renderer, rt->config);
    } catch (const std::exception& e) {
        LOG_ERROR("rastile_init failed: %s", e.what());
        return 0;
    }

    g_rt = std::move(rt);
    LOG_INFO("rastile: engine at %s", g_rt->config.engine_url.c_str());
    return 1;
}

void rastile_shutdown(void) {
    if (!g_rt) return;
    g_rt->workspace->shutdown();
    /* Workspace references the engine and renderer */
    g_rt->workspace.reset();
    g_rt.reset();
}

int rastile_open_raster(const char* path, char* out_id, int cap) {
    Workspace* w = ws();
    if (!w || !path) return 0;
    try {
        copy_out(w->open_raster(path), out_id, cap);
        return 1;
    } catch (const std::exception&) {
        /* Already logged by the workspace */
        return 0;
    }
}

int rastile_remove_layer(const char* id) {
    Workspace* w = ws();
    return w && id && w->remove_layer(id) ? 1 : 0;
}

int rastile_set_band(const char* id, int band) {
    Workspace* w = ws();
    return w && id && w->set_band(id, band) ? 1 : 0;
}

int rastile_set_stretch(const char* id, rastile_stretch_t stretch) {
    Workspace* w = ws();
    return w && id && w->set_stretch(id, Stretch{stretch.min, stretch.max, stretch.gamma}) ? 1 : 0;
}

int rastile_set_display_mode(const char* id, rastile_display_mode_t mode) {
    Workspace* w = ws();
    if (!w || !id) return 0;
    DisplayMode m;
    switch (mode) {
        case RASTILE_DISPLAY_GRAYSCALE:       m = DisplayMode::Grayscale; break;
        case RASTILE_DISPLAY_RGB:             m = DisplayMode::Rgb; break;
        case RASTILE_DISPLAY_CROSS_LAYER_RGB: m = DisplayMode::CrossLayerRgb; break;
        default:
            LOG_WARN("rastile_set_display_mode: unknown mode %d", static_cast<int>(mode));
            return 0;
    }
    return w->set_display_mode(id, m) ? 1 : 0;
}

int rastile_set_rgb_bands(const char* id, rastile_rgb_bands_t bands) {
    Workspace* w = ws();
    return w && id && w->set_rgb_bands(id, RgbBands{bands.r, bands.g, bands.b}) ? 1 : 0;
}

int rastile_create_composition(const char* source_id, int cross, char* out_id, int cap) {
    Workspace* w = ws();
    if (!w || !source_id) return 0;
    auto id = w->create_composition(source_id, cross != 0);
    if (!id) return 0;
    copy_out(*id, out_id, cap);
    return 1;
}

int rastile_fetch_tile(const char* url, uint8_t* buf, int cap) {
    Workspace* w = ws();
    if (!w || !url) return -1;
    try {
        std::vector<uint8_t> data = w->fetch_tile(url);
        int size = static_cast<int>(data.size());
        if (buf && size <= cap && size > 0) std::memcpy(buf, data.data(), data.size());
        return size;
    } catch (const std::exception& e) {
        LOG_WARN("rastile_fetch_tile %s: %s", url, e.what());
        return -1;
    }
}

int rastile_cache_stats(rastile_cache_stats_t* out) {
    Workspace* w = ws();
    if (!w || !out) return 0;
    CacheStats s = w->dispatcher().cache_stats();
    out->hits = s.hits;
    out->misses = s.misses;
    out->evictions = s.evictions;
    out->size = s.size;
    out->max_size = s.max_size;
    out->hit_rate = s.hit_rate;
    return 1;
}

void rastile_set_zoom(double zoom) {
    if (!g_rt) return;
    g_rt->renderer->set_zoom(zoom);
}

int rastile_last_log(char* buf, int cap) {
    auto recent = log_recent(1);
    if (recent.empty()) return -1;
    copy_out(recent.back().text, buf, cap);
    return static_cast<int>(recent.back().level);
}
