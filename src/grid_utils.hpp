#pragma once

#include "common.hpp"
#include "rng.hpp"

#include <array>
#include <cstddef>
#include <unordered_set>

// Small lattice helpers shared by the walk and wall passes.

struct Vec2iHash {
    size_t operator()(const Vec2i& p) const {
        return static_cast<size_t>(hashCombine(static_cast<uint32_t>(p.x), static_cast<uint32_t>(p.y)));
    }
};

// Unordered set of lattice cells. Only membership matters.
using CellSet = std::unordered_set<Vec2i, Vec2iHash>;

// Walk directions: up, down, left, right (y grows upward).
inline constexpr std::array<Vec2i, 4> kCardinalDirs = {{
    { 0,  1},
    { 0, -1},
    {-1,  0},
    { 1,  0},
}};

// Cardinal first, then the four diagonals.
inline constexpr std::array<Vec2i, 8> kNeighborDirs8 = {{
    { 0,  1},
    { 0, -1},
    {-1,  0},
    { 1,  0},
    { 1,  1},
    { 1, -1},
    {-1,  1},
    {-1, -1},
}};

inline bool contains(const CellSet& cells, const Vec2i& p) {
    return cells.find(p) != cells.end();
}
