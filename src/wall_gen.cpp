#include "wall_gen.hpp"

CellSet deriveWalls(const CellSet& floor) {
    CellSet walls;
    walls.reserve(floor.size());

    for (const Vec2i& p : floor) {
        for (const Vec2i& d : kNeighborDirs8) {
            const Vec2i n = p + d;
            if (!contains(floor, n)) walls.insert(n);
        }
    }
    return walls;
}

bool wallsEncloseFloor(const CellSet& floor, const CellSet& walls) {
    for (const Vec2i& p : floor) {
        for (const Vec2i& d : kNeighborDirs8) {
            const Vec2i n = p + d;
            if (!contains(floor, n) && !contains(walls, n)) return false;
        }
    }
    return true;
}
