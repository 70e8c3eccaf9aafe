#include "hexfire/hexgrid.hpp"

#include <h3/h3api.h>

#include <cmath>
#include <stdexcept>

namespace hexfire {

    std::optional<CellId> CellAt(double lat, double lon, int res) {
        if (!IsValidResolution(res) || !std::isfinite(lat) || !std::isfinite(lon))
            return std::nullopt;
        LatLng g{degsToRads(lat), degsToRads(lon)};
        H3Index cell = 0;
        if (latLngToCell(&g, res, &cell) != E_SUCCESS)
            return std::nullopt;
        return static_cast<CellId>(cell);
    }

    std::string CellToString(CellId cell) {
        char buf[17];
        if (h3ToString(static_cast<H3Index>(cell), buf, sizeof(buf)) != E_SUCCESS)
            throw std::runtime_error("h3ToString failed");
        return buf;
    }

    std::optional<CellId> CellFromString(const std::string &text) {
        H3Index cell = 0;
        if (stringToH3(text.c_str(), &cell) != E_SUCCESS || !isValidCell(cell))
            return std::nullopt;
        return static_cast<CellId>(cell);
    }

    std::vector<Position> CellBoundaryRing(CellId cell) {
        CellBoundary boundary;
        if (cellToBoundary(static_cast<H3Index>(cell), &boundary) != E_SUCCESS)
            throw std::runtime_error("cellToBoundary failed for " + CellToString(cell));

        std::vector<Position> ring;
        ring.reserve(static_cast<std::size_t>(boundary.numVerts) + 1);
        for (int i = 0; i < boundary.numVerts; ++i) {
            ring.push_back(Position{radsToDegs(boundary.verts[i].lng), radsToDegs(boundary.verts[i].lat), {}});
        }
        if (!ring.empty() && (ring.front().x != ring.back().x || ring.front().y != ring.back().y))
            ring.push_back(ring.front());
        return ring;
    }

} // namespace hexfire
