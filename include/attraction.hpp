#pragma once

#include "config.hpp"

// cell (i, j) is how type i feels about type j, + is attraction, - is repulsion, always in [-1, 1]
// row-major so a particle's whole row is contiguous when looping over its neighbors
using AttractionMatrix = Eigen::Matrix<float, numTypes, numTypes, Eigen::RowMajor>;

// named recipes, each one is a formula over (i, j) that tends to produce a recognizable behavior
enum class Preset {
    Random, // classic uniform noise
    Planets, // orbital systems with satellites
    Snakes, // every type chases the next one and flees the previous one
    Chaos, // only extreme values
    Balanced, // small values, gentle and stable
    Spirals, // rotational asymmetry
    Clusters, // same and similar types group up
};

static constexpr int numPresets = 7;

const char* presetName(Preset preset);

// uniformly random preset
Preset randomPreset(std::mt19937& rng);

AttractionMatrix generateMatrix(Preset preset, std::mt19937& rng);
// random preset, the one picked is written to chosen when given
AttractionMatrix generateMatrix(std::mt19937& rng, Preset* chosen = nullptr);
