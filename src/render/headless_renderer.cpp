#include "render/headless_renderer.h"
#include "util/log.h"
#include <algorithm>
#include <stdexcept>

namespace rastile {

HeadlessRenderer::HeadlessRenderer()
    : m_listeners(std::make_shared<ListenerTable>()) {}

void HeadlessRenderer::add_protocol(const std::string& scheme, ProtocolHandler handler) {
    m_protocols[scheme] = std::move(handler);
}

void HeadlessRenderer::remove_protocol(const std::string& scheme) {
    m_protocols.erase(scheme);
}

void HeadlessRenderer::add_source(const std::string& source_id, const RasterSourceSpec& spec) {
    if (m_sources.count(source_id)) {
        LOG_WARN("HeadlessRenderer: source '%s' already exists, replacing", source_id.c_str());
    }
    m_sources[source_id] = spec;
}

void HeadlessRenderer::remove_source(const std::string& source_id) {
    m_sources.erase(source_id);
}

bool HeadlessRenderer::has_source(const std::string& source_id) const {
    return m_sources.count(source_id) > 0;
}

void HeadlessRenderer::set_tiles(const std::string& source_id,
                                 const std::vector<std::string>& tiles) {
    auto it = m_sources.find(source_id);
    if (it == m_sources.end()) {
        LOG_WARN("HeadlessRenderer: set_tiles on unknown source '%s'", source_id.c_str());
        return;
    }
    it->second.tiles = tiles;
}

void HeadlessRenderer::add_layer(const std::string& layer_id, const std::string& source_id) {
    if (m_layers.count(layer_id)) {
        LOG_WARN("HeadlessRenderer: layer '%s' already exists", layer_id.c_str());
        return;
    }
    m_layers[layer_id] = LayerState{source_id, true, 1.0};
    m_stack.push_back(layer_id);
}

void HeadlessRenderer::remove_layer(const std::string& layer_id) {
    m_layers.erase(layer_id);
    m_stack.erase(std::remove(m_stack.begin(), m_stack.end(), layer_id), m_stack.end());
}

void HeadlessRenderer::move_layer(const std::string& layer_id, const std::string& before_id) {
    auto it = std::find(m_stack.begin(), m_stack.end(), layer_id);
    if (it == m_stack.end()) return;
    m_stack.erase(it);

    auto before = before_id.empty() ? m_stack.end()
                                    : std::find(m_stack.begin(), m_stack.end(), before_id);
    m_stack.insert(before, layer_id);
}

void HeadlessRenderer::set_layer_visibility(const std::string& layer_id, bool visible) {
    auto it = m_layers.find(layer_id);
    if (it != m_layers.end()) it->second.visible = visible;
}

void HeadlessRenderer::set_layer_opacity(const std::string& layer_id, double opacity) {
    auto it = m_layers.find(layer_id);
    if (it != m_layers.end()) it->second.opacity = opacity;
}

void HeadlessRenderer::fit_bounds(const Bounds& bounds) {
    m_last_fit = bounds;
}

Subscription HeadlessRenderer::on_zoom_end(std::function<void()> callback) {
    uint64_t key = m_next_listener++;
    (*m_listeners)[key] = std::move(callback);

    std::weak_ptr<ListenerTable> weak = m_listeners;
    return Subscription([weak, key] {
        if (auto table = weak.lock()) table->erase(key);
    });
}

void HeadlessRenderer::set_pixel_coord_mode(bool enabled, std::optional<PixelExtent> extent) {
    m_pixel_mode = enabled;
    m_pixel_extent = enabled ? extent : std::nullopt;
}

void HeadlessRenderer::set_zoom(double zoom) {
    m_zoom = zoom;

    /* Listeners may unsubscribe while being called */
    std::vector<std::function<void()>> callbacks;
    callbacks.reserve(m_listeners->size());
    for (auto& [key, cb] : *m_listeners) callbacks.push_back(cb);
    for (auto& cb : callbacks) cb();
}

const RasterSourceSpec* HeadlessRenderer::source(const std::string& source_id) const {
    auto it = m_sources.find(source_id);
    return it == m_sources.end() ? nullptr : &it->second;
}

bool HeadlessRenderer::layer_visible(const std::string& layer_id) const {
    auto it = m_layers.find(layer_id);
    return it != m_layers.end() && it->second.visible;
}

double HeadlessRenderer::layer_opacity(const std::string& layer_id) const {
    auto it = m_layers.find(layer_id);
    return it == m_layers.end() ? 0.0 : it->second.opacity;
}

std::string HeadlessRenderer::scheme_of(const std::string& url) {
    auto pos = url.find("://");
    return pos == std::string::npos ? std::string() : url.substr(0, pos);
}

static void replace_all(std::string& s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::optional<std::string> HeadlessRenderer::tile_url(const std::string& source_id,
                                                      const TileCoord& coord) const {
    auto it = m_sources.find(source_id);
    if (it == m_sources.end() || it->second.tiles.empty()) return std::nullopt;

    std::string url = it->second.tiles.front();
    replace_all(url, "{z}", std::to_string(coord.z));
    replace_all(url, "{x}", std::to_string(coord.x));
    replace_all(url, "{y}", std::to_string(coord.y));
    return url;
}

std::optional<RequestId> HeadlessRenderer::request_tile(const std::string& source_id,
                                                        const TileCoord& coord,
                                                        TileCallback done) {
    auto url = tile_url(source_id, coord);
    if (!url) {
        done(TileResponse{{}, std::make_exception_ptr(
            std::runtime_error("no tiles for source '" + source_id + "'"))});
        return std::nullopt;
    }

    auto it = m_protocols.find(scheme_of(*url));
    if (it == m_protocols.end() || !it->second.request) {
        done(TileResponse{{}, std::make_exception_ptr(
            std::runtime_error("no protocol handler for '" + *url + "'"))});
        return std::nullopt;
    }
    return it->second.request(*url, std::move(done));
}

void HeadlessRenderer::cancel_tile(const std::string& source_id, RequestId id) {
    auto src = m_sources.find(source_id);
    if (src == m_sources.end() || src->second.tiles.empty()) return;

    auto it = m_protocols.find(scheme_of(src->second.tiles.front()));
    if (it != m_protocols.end() && it->second.cancel) it->second.cancel(id);
}

} // namespace rastile
