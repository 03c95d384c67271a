#pragma once
#include <stdexcept>
#include <string>

namespace rastile {

/* Raised by RasterEngine implementations (transport, decode, missing dataset). */
class EngineError : public std::runtime_error {
public:
    explicit EngineError(const std::string& what) : std::runtime_error(what) {}
};

/* Per-tile failure reported to the renderer. Never fatal to the process. */
class TileError : public std::runtime_error {
public:
    enum class Kind {
        BadAddress,   // malformed virtual tile URL
        UnknownLayer, // no registry entry at dispatch time
        NotRaster,    // protocol resolved to a vector layer
        Engine        // upstream engine failure
    };

    TileError(Kind kind, const std::string& what)
        : std::runtime_error(what), m_kind(kind) {}

    Kind kind() const { return m_kind; }

private:
    Kind m_kind;
};

} // namespace rastile
