#pragma once
#include "geo/bounds.h"
#include "geo/pixel_mapper.h"
#include <functional>
#include <exception>
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace rastile {

using RequestId = uint64_t;

/* Result of one virtual tile request: bytes, or the failure to report */
struct TileResponse {
    std::vector<uint8_t> data;
    std::exception_ptr error;

    bool ok() const { return !error; }
};

using TileCallback = std::function<void(TileResponse)>;

/* Handler for one virtual scheme. request() must return without blocking;
   completion is signalled through the callback, possibly later. */
struct ProtocolHandler {
    std::function<RequestId(const std::string& url, TileCallback done)> request;
    std::function<void(RequestId)> cancel;
};

struct RasterSourceSpec {
    std::vector<std::string> tiles; // URL templates with {z}/{x}/{y}
    int tile_size = 256;
    Bounds bounds;
    int min_zoom = 0;
    int max_zoom = 22;
};

/* Move-only handle for an event subscription. Unsubscribes on destruction. */
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> unsubscribe)
        : m_unsubscribe(std::move(unsubscribe)) {}
    ~Subscription() { reset(); }

    Subscription(Subscription&& o) noexcept : m_unsubscribe(std::move(o.m_unsubscribe)) {
        o.m_unsubscribe = nullptr;
    }
    Subscription& operator=(Subscription&& o) noexcept {
        if (this != &o) {
            reset();
            m_unsubscribe = std::move(o.m_unsubscribe);
            o.m_unsubscribe = nullptr;
        }
        return *this;
    }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    void reset() {
        if (m_unsubscribe) {
            auto fn = std::move(m_unsubscribe);
            m_unsubscribe = nullptr;
            fn();
        }
    }

    bool active() const { return static_cast<bool>(m_unsubscribe); }

private:
    std::function<void()> m_unsubscribe;
};

/* Slippy-map renderer boundary. The renderer owns decoding, drawing and
   user input; this library only feeds it tiles through virtual schemes. */
class MapRenderer {
public:
    virtual ~MapRenderer() = default;

    virtual void add_protocol(const std::string& scheme, ProtocolHandler handler) = 0;
    virtual void remove_protocol(const std::string& scheme) = 0;

    virtual void add_source(const std::string& source_id, const RasterSourceSpec& spec) = 0;
    virtual void remove_source(const std::string& source_id) = 0;
    virtual bool has_source(const std::string& source_id) const = 0;
    /* Replace a source's URL templates; the renderer re-requests its tiles */
    virtual void set_tiles(const std::string& source_id, const std::vector<std::string>& tiles) = 0;

    virtual void add_layer(const std::string& layer_id, const std::string& source_id) = 0;
    virtual void remove_layer(const std::string& layer_id) = 0;
    /* Place layer_id directly below before_id; empty before_id means top */
    virtual void move_layer(const std::string& layer_id, const std::string& before_id) = 0;
    virtual void set_layer_visibility(const std::string& layer_id, bool visible) = 0;
    virtual void set_layer_opacity(const std::string& layer_id, double opacity) = 0;

    virtual void fit_bounds(const Bounds& bounds) = 0;
    virtual double zoom() const = 0;
    virtual Subscription on_zoom_end(std::function<void()> callback) = 0;

    /* Pixel-coordinate display for non-georeferenced imagery */
    virtual void set_pixel_coord_mode(bool enabled, std::optional<PixelExtent> extent) = 0;
};

} // namespace rastile
