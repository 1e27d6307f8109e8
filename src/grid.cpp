#include "grid.hpp"

void resizeGrid(SpatialGrid& grid, float width, float height, float minCellSize)
{
    grid.width = width;
    grid.height = height;
    // floor (not ceil) so cells grow instead of leaving a sliver at the right/bottom edge
    grid.cols = std::max(1, static_cast<int>(std::floor(width / minCellSize)));
    grid.rows = std::max(1, static_cast<int>(std::floor(height / minCellSize)));
    grid.cellWidth = width / grid.cols;
    grid.cellHeight = height / grid.rows;
    grid.cellStart.assign(grid.cellCount() + 1, 0);
}

int cellIndexAt(const SpatialGrid& grid, float x, float y)
{
    // positions are wrapped into [0, width) by the integrator but clamp anyway, a float
    // landing exactly on width would otherwise index one column past the end
    const int cellX = std::min(std::max(static_cast<int>(x / grid.cellWidth), 0), grid.cols - 1);
    const int cellY = std::min(std::max(static_cast<int>(y / grid.cellHeight), 0), grid.rows - 1);
    return cellY * grid.cols + cellX;
}

void rebuildGrid(SpatialGrid& grid, const Particles& particles)
{
    const int count = particles.size();
    const int cells = grid.cellCount();

    grid.cellStart.assign(cells + 1, 0);
    grid.indices.resize(count);
    grid.cellOf.resize(count);

    // histogram, shifted by one so the prefix sum lands directly on start offsets
    for (int index = 0; index < count; index++) {
        const int cell = cellIndexAt(grid, particles.posX[index], particles.posY[index]);
        grid.cellOf[index] = cell;
        grid.cellStart[cell + 1]++;
    }
    for (int cell = 0; cell < cells; cell++)
        grid.cellStart[cell + 1] += grid.cellStart[cell];

    // scatter, cursor starts as a copy of the start offsets and walks forward per cell
    grid.cursor.assign(grid.cellStart.begin(), grid.cellStart.end() - 1);
    for (int index = 0; index < count; index++)
        grid.indices[grid.cursor[grid.cellOf[index]]++] = index;
}

NeighborCells neighborCells(const SpatialGrid& grid, float x, float y)
{
    NeighborCells result;
    const int center = cellIndexAt(grid, x, y);
    const int cellX = center % grid.cols;
    const int cellY = center / grid.cols;

    // on a 1 or 2 wide grid, -1 and +1 wrap onto the same column, visit each column once
    const int spanX = std::min(grid.cols, 3);
    const int spanY = std::min(grid.rows, 3);

    for (int dy = 0; dy < spanY; dy++) {
        // + rows before the modulo so -1 wraps to the last row instead of going negative
        const int y = (cellY + dy - 1 + grid.rows) % grid.rows;
        for (int dx = 0; dx < spanX; dx++) {
            const int x = (cellX + dx - 1 + grid.cols) % grid.cols;
            result.cells[result.count++] = y * grid.cols + x;
        }
    }
    return result;
}
