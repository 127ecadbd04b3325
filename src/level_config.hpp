#pragma once

#include "common.hpp"

#include <string>

// Parameters for one generation run. Defaults match the shipped settings file.
struct GenerationConfig {
    // Number of stamp-then-move iterations per attempt (must be > 0).
    int walkSteps = 200;

    // Half-width of the square stamped at each step:
    // 0 = 1x1, 1 = 3x3, 2 = 5x5, 3 = 7x7.
    int stampSize = 1;

    // An attempt is accepted only if it produced at least this many floor cells.
    int minFloorTiles = 100;

    // Upper bound on walk attempts before giving up.
    int maxGenerationAttempts = 100;

    Vec2i startPosition{ 0, 0 };
};

inline constexpr int kMaxStampSize = 3;

// Side length of one stamp square.
inline int stampWidth(int stampSize) {
    return 2 * stampSize + 1;
}

// Largest floor set a single attempt could possibly produce (no overlap at all).
long long maxPossibleFloorTiles(const GenerationConfig& cfg);

// Cells any walk can touch lie within this Chebyshev distance of the start
// (walker drift + stamp + wall ring).
long long maxReachFromStart(const GenerationConfig& cfg);

// Returns false (and fills err, if provided) when a field is out of range,
// including a start too close to the int limits for the walk to stay
// representable. Values are never clamped.
bool validateConfig(const GenerationConfig& cfg, std::string* err = nullptr);
