#pragma once
#include "engine/raster_engine.h"
#include "render/headless_renderer.h"
#include "tile/tile_dispatcher.h"
#include "util/error.h"
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>

namespace rastile::testing {

/* In-process RasterEngine: datasets are scripted by path, tiles are the
   request signature bytes, failures and stalls can be injected. */
class FakeEngine : public RasterEngine {
public:
    void add_dataset(const std::string& path, DatasetInfo info) {
        std::lock_guard<std::mutex> lock(m_mutex);
        info.path = path;
        m_datasets[path] = std::move(info);
    }

    DatasetInfo open(const std::string& path) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_datasets.find(path);
        if (it == m_datasets.end()) throw EngineError("cannot open " + path);
        return it->second;
    }

    void close(const std::string& dataset_id) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed.push_back(dataset_id);
        if (m_fail_close) throw EngineError("close failed");
    }

    Histogram histogram(const std::string& dataset_id, int band, int bins) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_histogram_ids.push_back(dataset_id);
        Histogram h;
        h.band = band;
        h.min = 0.0;
        h.max = 255.0;
        h.counts.assign(static_cast<size_t>(bins), static_cast<uint64_t>(band));
        return h;
    }

    std::vector<uint8_t> render(const EngineRequest& req) override {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_requests.push_back(req);
        m_cv.wait(lock, [this] { return !m_hold; });
        if (m_failures > 0) {
            m_failures--;
            throw EngineError("scripted failure");
        }
        std::string sig = request_signature(req);
        return std::vector<uint8_t>(sig.begin(), sig.end());
    }

    /* Next n render() calls throw EngineError */
    void fail_next(int n) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failures = n;
    }
    void set_fail_close(bool fail) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_fail_close = fail;
    }

    /* Block render() until release() */
    void hold() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_hold = true;
    }
    void release() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_hold = false;
        }
        m_cv.notify_all();
    }

    int render_count() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return static_cast<int>(m_requests.size());
    }
    std::vector<EngineRequest> requests() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_requests;
    }
    EngineRequest last_request() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_requests.back();
    }
    std::vector<std::string> closed() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }
    std::vector<std::string> histogram_ids() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_histogram_ids;
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::map<std::string, DatasetInfo> m_datasets;
    std::vector<EngineRequest> m_requests;
    std::vector<std::string> m_closed;
    std::vector<std::string> m_histogram_ids;
    int m_failures = 0;
    bool m_fail_close = false;
    bool m_hold = false;
};

/* Dataset with per-band stats {10*b, 100 + 10*b} */
inline DatasetInfo make_dataset(const std::string& id, int bands, bool georeferenced = true,
                                int width = 1000, int height = 1000) {
    DatasetInfo info;
    info.id = id;
    info.width = width;
    info.height = height;
    info.bands = bands;
    info.bounds = {10.0, 40.0, 11.0, 41.0};
    info.is_georeferenced = georeferenced;
    for (int b = 1; b <= bands; b++) {
        BandStats s;
        s.min = 10.0 * b;
        s.max = 100.0 + 10.0 * b;
        info.band_stats.push_back(s);
    }
    return info;
}

/* Raster record as the workspace would seed it */
inline RasterLayer make_raster(const std::string& id, int bands, bool georeferenced = true) {
    DatasetInfo info = make_dataset(id, bands, georeferenced);
    RasterLayer l;
    l.id = id;
    l.path = "/data/" + id + ".tif";
    l.width = info.width;
    l.height = info.height;
    l.bands = bands;
    l.bounds = info.bounds;
    l.band_stats = info.band_stats;
    l.is_georeferenced = georeferenced;
    l.display_mode = bands >= 3 ? DisplayMode::Rgb : DisplayMode::Grayscale;
    l.stretch = {l.band_stats[0].min, l.band_stats[0].max, 1.0};
    if (bands >= 3) {
        l.rgb_stretch = {{l.band_stats[0].min, l.band_stats[0].max, 1.0},
                         {l.band_stats[1].min, l.band_stats[1].max, 1.0},
                         {l.band_stats[2].min, l.band_stats[2].max, 1.0}};
    }
    return l;
}

/* Pump until pred() holds or the timeout expires */
template<typename Pred>
bool pump_until(TileProtocolDispatcher& d, Pred pred, int timeout_ms = 2000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        if (d.pump() == 0) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

/* Message of a failed response, or "" */
inline std::string error_message(const TileResponse& r) {
    if (!r.error) return "";
    try {
        std::rethrow_exception(r.error);
    } catch (const std::exception& e) {
        return e.what();
    }
}

inline std::string as_text(const std::vector<uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

} // namespace rastile::testing
