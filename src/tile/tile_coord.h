#pragma once

namespace rastile {

struct TileCoord {
    int z, x, y;

    bool operator==(const TileCoord& o) const {
        return z == o.z && x == o.x && y == o.y;
    }
    bool operator!=(const TileCoord& o) const { return !(*this == o); }
};

} // namespace rastile
