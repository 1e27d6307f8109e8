#pragma once

#include "particles.hpp"

// uniform grid over the toroidal plane, rebuilt from scratch every frame with a counting sort:
// count particles per cell, prefix-sum the counts into cellStart, then scatter particle indices
// so every cell owns the contiguous range indices[cellStart[c], cellStart[c + 1])
// no per-cell vectors, no allocation after the first frame at a given size/population
struct SpatialGrid {
    int cols = 0;
    int rows = 0;
    float cellWidth = 0.0f;
    float cellHeight = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    std::vector<int> cellStart;
    std::vector<int> indices;
    std::vector<int> cellOf;
    std::vector<int> cursor;

    int cellCount() const { return cols * rows; }
};

// up to 9 distinct cells, fewer when the grid is narrower than 3 cells in a direction
struct NeighborCells {
    std::array<int, 9> cells;
    int count = 0;
};

// cells are at least minCellSize wide, stretched so an integer number of them tiles the plane exactly
// (a narrower leftover column at the seam would let real neighbors hide 2 cells away)
void resizeGrid(SpatialGrid& grid, float width, float height, float minCellSize);

void rebuildGrid(SpatialGrid& grid, const Particles& particles);

int cellIndexAt(const SpatialGrid& grid, float x, float y);

// 3x3 block centered on the cell containing (x, y), cell indices wrap around like positions do
NeighborCells neighborCells(const SpatialGrid& grid, float x, float y);

inline int cellBegin(const SpatialGrid& grid, int cell) { return grid.cellStart[cell]; }
inline int cellEnd(const SpatialGrid& grid, int cell) { return grid.cellStart[cell + 1]; }
