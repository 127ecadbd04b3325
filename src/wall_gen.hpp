#pragma once

#include "grid_utils.hpp"

// Wall ring pass
//
// Every cell that touches a floor cell (8-neighbourhood) and is not floor
// itself becomes a wall. Cells two or more steps away from any floor are left
// out entirely. The result never overlaps `floor`.
CellSet deriveWalls(const CellSet& floor);

// True if every 8-neighbour of every floor cell is in floor or walls.
bool wallsEncloseFloor(const CellSet& floor, const CellSet& walls);
