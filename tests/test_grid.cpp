#include <catch2/catch.hpp>

#include "forces.hpp"

static Particles scatter(int count, float width, float height, std::mt19937& rng)
{
    Particles particles(count);
    std::uniform_real_distribution<float> x(0.0f, width);
    std::uniform_real_distribution<float> y(0.0f, height);
    for (int i = 0; i < count; i++) {
        particles.posX[i] = x(rng);
        particles.posY[i] = y(rng);
    }
    return particles;
}

TEST_CASE("grid tiles the plane with cells at least the interaction radius", "[grid]")
{
    SpatialGrid grid;
    resizeGrid(grid, 1000.0f, 500.0f, interactionRadius);

    REQUIRE(grid.cols == 12);
    REQUIRE(grid.rows == 6);
    REQUIRE(grid.cellWidth >= interactionRadius);
    REQUIRE(grid.cellHeight >= interactionRadius);
    REQUIRE(grid.cellWidth * grid.cols == Approx(1000.0f));
    REQUIRE(grid.cellHeight * grid.rows == Approx(500.0f));

    SECTION("planes smaller than a cell still get one")
    {
        resizeGrid(grid, 30.0f, 20.0f, interactionRadius);
        REQUIRE(grid.cols == 1);
        REQUIRE(grid.rows == 1);
    }
}

TEST_CASE("counting sort puts every particle in exactly one cell", "[grid]")
{
    std::mt19937 rng(11);
    SpatialGrid grid;
    resizeGrid(grid, 640.0f, 480.0f, interactionRadius);
    const Particles particles = scatter(500, 640.0f, 480.0f, rng);
    rebuildGrid(grid, particles);

    REQUIRE(grid.cellStart.front() == 0);
    REQUIRE(grid.cellStart.back() == particles.size());

    std::vector<int> seen(particles.size(), 0);
    for (int cell = 0; cell < grid.cellCount(); cell++) {
        REQUIRE(cellBegin(grid, cell) <= cellEnd(grid, cell));
        for (int slot = cellBegin(grid, cell); slot < cellEnd(grid, cell); slot++) {
            const int index = grid.indices[slot];
            seen[index]++;
            REQUIRE(cellIndexAt(grid, particles.posX[index], particles.posY[index]) == cell);
        }
    }
    for (int count : seen)
        REQUIRE(count == 1);
}

TEST_CASE("neighbor cells reach every particle within the interaction radius", "[grid]")
{
    std::mt19937 rng(5);
    const float width = 730.0f;
    const float height = 410.0f;
    SpatialGrid grid;
    resizeGrid(grid, width, height, interactionRadius);
    const Particles particles = scatter(400, width, height, rng);
    rebuildGrid(grid, particles);

    for (int i = 0; i < particles.size(); i++) {
        const NeighborCells neighbors = neighborCells(grid, particles.posX[i], particles.posY[i]);
        for (int j = 0; j < particles.size(); j++) {
            const Eigen::Vector2f delta
                = torusDelta(particles.posX[i], particles.posY[i], particles.posX[j], particles.posY[j], width, height);
            if (delta.norm() > interactionRadius)
                continue;
            const int cell = grid.cellOf[j];
            bool found = false;
            for (int c = 0; c < neighbors.count; c++)
                found = found || neighbors.cells[c] == cell;
            INFO("particle " << i << " neighbor " << j);
            REQUIRE(found);
        }
    }
}

TEST_CASE("neighbor cells wrap across the seam", "[grid]")
{
    SpatialGrid grid;
    resizeGrid(grid, 800.0f, 600.0f, interactionRadius);

    const NeighborCells neighbors = neighborCells(grid, 1.0f, 1.0f);
    REQUIRE(neighbors.count == 9);

    const int farCorner = cellIndexAt(grid, 799.0f, 599.0f);
    const int farRight = cellIndexAt(grid, 799.0f, 1.0f);
    const int farBottom = cellIndexAt(grid, 1.0f, 599.0f);
    bool corner = false, right = false, bottom = false;
    for (int c = 0; c < neighbors.count; c++) {
        corner = corner || neighbors.cells[c] == farCorner;
        right = right || neighbors.cells[c] == farRight;
        bottom = bottom || neighbors.cells[c] == farBottom;
    }
    REQUIRE(corner);
    REQUIRE(right);
    REQUIRE(bottom);
}

TEST_CASE("narrow grids visit each cell once", "[grid]")
{
    SpatialGrid grid;

    SECTION("one cell")
    {
        resizeGrid(grid, 100.0f, 100.0f, interactionRadius);
        const NeighborCells neighbors = neighborCells(grid, 50.0f, 50.0f);
        REQUIRE(neighbors.count == 1);
        REQUIRE(neighbors.cells[0] == 0);
    }

    SECTION("two columns, many rows")
    {
        resizeGrid(grid, 200.0f, 800.0f, interactionRadius);
        REQUIRE(grid.cols == 2);
        const NeighborCells neighbors = neighborCells(grid, 10.0f, 400.0f);
        REQUIRE(neighbors.count == 6);
        std::vector<int> cells(neighbors.cells.begin(), neighbors.cells.begin() + neighbors.count);
        std::sort(cells.begin(), cells.end());
        REQUIRE(std::unique(cells.begin(), cells.end()) == cells.end());
    }
}
