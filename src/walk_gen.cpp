#include "walk_gen.hpp"

Vec2i randomCardinal(RNG& rng) {
    return rng.pick(kCardinalDirs);
}

void stampSquare(CellSet& floor, const Vec2i& center, int stampSize) {
    for (int oy = -stampSize; oy <= stampSize; ++oy) {
        for (int ox = -stampSize; ox <= stampSize; ++ox) {
            floor.insert({ center.x + ox, center.y + oy });
        }
    }
}

CellSet generateWalkFloor(const GenerationConfig& cfg, RNG& rng, const WalkStepObserver& onStep) {
    CellSet floor;
    if (cfg.walkSteps <= 0) return floor;

    // Heavily self-overlapping walks are the norm; reserve for a fraction of the worst case.
    const int w = stampWidth(cfg.stampSize);
    floor.reserve(static_cast<size_t>(cfg.walkSteps) * static_cast<size_t>(w) / 2u + 1u);

    Vec2i cur = cfg.startPosition;
    for (int i = 0; i < cfg.walkSteps; ++i) {
        stampSquare(floor, cur, cfg.stampSize);
        if (onStep) onStep(i, cur, floor.size());

        cur = cur + randomCardinal(rng);
    }

    return floor;
}
