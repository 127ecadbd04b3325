#pragma once

#include "grid_utils.hpp"
#include "level_config.hpp"
#include "rng.hpp"

#include <cstddef>
#include <functional>

// Random-walk floor pass
//
// Starting at cfg.startPosition, the walker repeats cfg.walkSteps times:
//  - stamp a (2*stampSize+1)^2 square of floor centered on itself
//  - move one cell in a uniformly chosen cardinal direction (never diagonal)
//
// The lattice is unbounded; no clipping is applied to the stamp.

// Called after each stamp with the step index, the walker position that was
// stamped and the floor size so far.
using WalkStepObserver = std::function<void(int step, const Vec2i& pos, size_t floorSize)>;

// Uniform choice over kCardinalDirs.
Vec2i randomCardinal(RNG& rng);

// Adds every cell of the square of half-width stampSize around center.
void stampSquare(CellSet& floor, const Vec2i& center, int stampSize);

// Runs one full walk. cfg is assumed to be valid (see validateConfig).
CellSet generateWalkFloor(const GenerationConfig& cfg, RNG& rng, const WalkStepObserver& onStep = {});
