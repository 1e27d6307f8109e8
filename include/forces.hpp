#pragma once

#include "attraction.hpp"
#include "grid.hpp"
#include "modes.hpp"

// shortest displacement from a to b through the torus, a world of width 100 sees 5 -> 95 as -10 not +90
Eigen::Vector2f torusDelta(float ax, float ay, float bx, float by, float width, float height);

// force felt by a particle of type selfType from a neighbor of type otherType sitting at delta
// (delta points from the particle to its neighbor)
Eigen::Vector2f pairForce(const Eigen::Vector2f& delta, int selfType, int otherType, const AttractionMatrix& matrix);

// push away from the pointer, quadratic falloff inside pointerRadius
Eigen::Vector2f pointerRepulsion(const Eigen::Vector2f& position, const Eigen::Vector2f& pointer);

// pull toward a target, constant magnitude (no distance falloff) scaled by strength and speed
Eigen::Vector2f formationPull(const Eigen::Vector2f& position, const Eigen::Vector2f& target, float strength, float speed);

// everything the force pass reads besides the particles themselves
struct ForceContext {
    const AttractionMatrix* matrix = nullptr;
    const SpatialGrid* grid = nullptr;
    Mode mode = Mode::ParticleLife;
    ForceWeights weights { 1.0f, 0.0f };
    // 1 -> 0 over EXPLOSION/DISSOLVING
    float blast = 0.0f;
    float width = 0.0f;
    float height = 0.0f;
    bool pointerActive = false;
    Eigen::Vector2f pointer = Eigen::Vector2f::Zero();
    // false when the current shape sampled to nothing, formation then does nothing at all
    bool shapeAvailable = false;
};

// total force on every particle for this frame, written into forceX/forceY
void accumulateForces(const Particles& particles, const ForceContext& context, std::mt19937& rng,
    Eigen::ArrayXf& forceX, Eigen::ArrayXf& forceY);

// v += F dt, v *= friction, speed cap, x += v dt, toroidal wrap
void integrate(Particles& particles, const Eigen::ArrayXf& forceX, const Eigen::ArrayXf& forceY,
    float deltaTime, float width, float height);
