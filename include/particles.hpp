#pragma once

#include "config.hpp"

// a point a particle can be pulled toward, type is the color it should wear once there
struct ShapeTarget {
    float x;
    float y;
    int type;
};

// StructOfArrays so Eigen can vectorize the integration step, the force pass walks them by index
// hasTarget is 0/1, targetX/targetY/formationSpeed are meaningless while it's 0
struct Particles {
    Eigen::ArrayXf posX;
    Eigen::ArrayXf posY;
    Eigen::ArrayXf velX;
    Eigen::ArrayXf velY;
    Eigen::ArrayXi type;

    Eigen::ArrayXf targetX;
    Eigen::ArrayXf targetY;
    Eigen::ArrayXf formationSpeed;
    Eigen::Array<bool, Eigen::Dynamic, 1> hasTarget;

    Particles() = default;

    explicit Particles(int count)
        : posX(Eigen::ArrayXf::Zero(count)), posY(Eigen::ArrayXf::Zero(count)),
          velX(Eigen::ArrayXf::Zero(count)), velY(Eigen::ArrayXf::Zero(count)),
          type(Eigen::ArrayXi::Zero(count)),
          targetX(Eigen::ArrayXf::Zero(count)), targetY(Eigen::ArrayXf::Zero(count)),
          formationSpeed(Eigen::ArrayXf::Ones(count)),
          hasTarget(Eigen::Array<bool, Eigen::Dynamic, 1>::Constant(count, false)) {}

    int size() const { return static_cast<int>(posX.size()); }
};

// Fisher-Yates, raster scan order would otherwise show up as horizontal stripes when assigned cyclically
void shuffleTargets(std::vector<ShapeTarget>& targets, std::mt19937& rng);

// every particle gets targets[i % size] and a fresh 0.5-1.5 speed, no-op when targets is empty
// returns false when there was nothing to assign
bool assignTargets(Particles& particles, const std::vector<ShapeTarget>& targets, std::mt19937& rng);

// population sitting exactly on (shuffled) targets so the first frame already shows formed text
// without targets they're scattered uniformly over the plane
Particles spawnOnTargets(int count, const std::vector<ShapeTarget>& targets, float width, float height, std::mt19937& rng);

// population scattered around the plane center with random types, used by the explosion intro
Particles spawnAtCenter(int count, float width, float height, std::mt19937& rng);

void clearTargets(Particles& particles);
