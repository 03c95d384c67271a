#pragma once
#include "render/map_renderer.h"
#include "tile/tile_coord.h"
#include <map>
#include <memory>
#include <unordered_map>

namespace rastile {

/* MapRenderer without a display: keeps the protocol, source and layer
   tables, expands tile templates on request and emits zoom events.
   Drives the library from the CLI and from tests. */
class HeadlessRenderer : public MapRenderer {
public:
    HeadlessRenderer();

    void add_protocol(const std::string& scheme, ProtocolHandler handler) override;
    void remove_protocol(const std::string& scheme) override;

    void add_source(const std::string& source_id, const RasterSourceSpec& spec) override;
    void remove_source(const std::string& source_id) override;
    bool has_source(const std::string& source_id) const override;
    void set_tiles(const std::string& source_id, const std::vector<std::string>& tiles) override;

    void add_layer(const std::string& layer_id, const std::string& source_id) override;
    void remove_layer(const std::string& layer_id) override;
    void move_layer(const std::string& layer_id, const std::string& before_id) override;
    void set_layer_visibility(const std::string& layer_id, bool visible) override;
    void set_layer_opacity(const std::string& layer_id, double opacity) override;

    void fit_bounds(const Bounds& bounds) override;
    double zoom() const override { return m_zoom; }
    Subscription on_zoom_end(std::function<void()> callback) override;

    void set_pixel_coord_mode(bool enabled, std::optional<PixelExtent> extent) override;

    /* Change zoom and fire zoom-end listeners */
    void set_zoom(double zoom);

    /* Request one tile of a source through its registered scheme.
       Returns nullopt (and reports through `done`) if nothing can serve it. */
    std::optional<RequestId> request_tile(const std::string& source_id, const TileCoord& coord,
                                          TileCallback done);
    /* Cancel a request issued through request_tile */
    void cancel_tile(const std::string& source_id, RequestId id);

    /* Expanded URL of source_id's first template for coord */
    std::optional<std::string> tile_url(const std::string& source_id, const TileCoord& coord) const;

    /* Inspection */
    bool has_protocol(const std::string& scheme) const { return m_protocols.count(scheme) > 0; }
    int protocol_count() const { return static_cast<int>(m_protocols.size()); }
    const RasterSourceSpec* source(const std::string& source_id) const;
    const std::vector<std::string>& layer_stack() const { return m_stack; }
    bool layer_visible(const std::string& layer_id) const;
    double layer_opacity(const std::string& layer_id) const;
    std::optional<Bounds> last_fit() const { return m_last_fit; }
    bool pixel_coord_mode() const { return m_pixel_mode; }
    std::optional<PixelExtent> pixel_extent() const { return m_pixel_extent; }
    int zoom_listener_count() const { return static_cast<int>(m_listeners->size()); }

private:
    struct LayerState {
        std::string source_id;
        bool visible = true;
        double opacity = 1.0;
    };

    std::unordered_map<std::string, ProtocolHandler> m_protocols;
    std::unordered_map<std::string, RasterSourceSpec> m_sources;
    std::unordered_map<std::string, LayerState> m_layers;
    std::vector<std::string> m_stack; // bottom to top

    double m_zoom = 0.0;
    std::optional<Bounds> m_last_fit;
    bool m_pixel_mode = false;
    std::optional<PixelExtent> m_pixel_extent;

    /* Shared with Subscription closures so a late unsubscribe is harmless */
    using ListenerTable = std::map<uint64_t, std::function<void()>>;
    std::shared_ptr<ListenerTable> m_listeners;
    uint64_t m_next_listener = 1;

    static std::string scheme_of(const std::string& url);
};

} // namespace rastile
