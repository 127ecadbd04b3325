#pragma once

#include "grid_utils.hpp"
#include "level_builder.hpp"

#include <cstdint>
#include <string>
#include <vector>

// Headless views of a generated level, for tooling and CI. These only read
// the builder output; nothing here feeds back into generation.

struct CellBounds {
    int minX = 0;
    int minY = 0;
    int maxX = -1;
    int maxY = -1;

    bool empty() const { return maxX < minX || maxY < minY; }
    int width() const { return empty() ? 0 : maxX - minX + 1; }
    int height() const { return empty() ? 0 : maxY - minY + 1; }
};

CellBounds boundsOf(const CellSet& cells);
CellBounds boundsOf(const CellSet& a, const CellSet& b);

// Cells ordered by (y, x) so dumps are stable across runs and platforms.
std::vector<Vec2i> sortedCells(const CellSet& cells);

// Text map, top row = highest y. '.' floor, '#' wall, '@' start, ' ' empty.
std::string renderAscii(const CellSet& floor, const CellSet& walls, const Vec2i& start);

// Writes a JSON summary of a generation result (status, seed, attempts,
// config, bounds, and the floor/wall cells as [x, y] pairs).
bool writeJsonReport(const std::string& path,
                     const GenerationResult& result,
                     uint32_t seed,
                     std::string* err = nullptr);
