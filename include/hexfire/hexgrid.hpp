#pragma once

#include "hexfire/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hexfire {

    using CellId = std::uint64_t;

    constexpr int kMinResolution = 0;
    constexpr int kMaxResolution = 15;

    inline bool IsValidResolution(int res) { return res >= kMinResolution && res <= kMaxResolution; }

    // Cell containing (lat, lon) degrees at the given resolution; nullopt when the index rejects the input.
    std::optional<CellId> CellAt(double lat, double lon, int res);

    std::string CellToString(CellId cell);

    std::optional<CellId> CellFromString(const std::string &text);

    // Cell outline as a closed [lon, lat] ring (first vertex repeated at the end).
    std::vector<Position> CellBoundaryRing(CellId cell);

} // namespace hexfire
