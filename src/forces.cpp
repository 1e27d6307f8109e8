#include "forces.hpp"

Eigen::Vector2f torusDelta(float ax, float ay, float bx, float by, float width, float height)
{
    // basically if delta is bigger than half of the world then the wrapped way is shorter (hence round)
    float deltaX = bx - ax;
    float deltaY = by - ay;
    deltaX -= std::round(deltaX / width) * width;
    deltaY -= std::round(deltaY / height) * height;
    return { deltaX, deltaY };
}

// 0 -> repulsionRadius = species-blind pushback, linear from full strength at contact to 0 at the edge
// repulsionRadius -> interactionRadius = matrix zone, linear falloff from full matrix force to 0 at the edge
// linear instead of inverse-square so the force is bounded at every range and the sim never blows up
Eigen::Vector2f pairForce(const Eigen::Vector2f& delta, int selfType, int otherType, const AttractionMatrix& matrix)
{
    const float distanceSquared = delta.squaredNorm();
    // coincident particles have no direction to push along
    if (distanceSquared < 0.01f || distanceSquared > interactionRadius * interactionRadius)
        return Eigen::Vector2f::Zero();

    const float distance = std::sqrt(distanceSquared);
    const Eigen::Vector2f direction = delta / distance;

    if (distance < repulsionRadius) {
        const float repulsion = (repulsionRadius - distance) / repulsionRadius * repulsionStrength;
        return -direction * repulsion;
    }

    const float magnitude = matrix(selfType, otherType) * (1.0f - distance / interactionRadius) * maxForce;
    return direction * magnitude;
}

Eigen::Vector2f pointerRepulsion(const Eigen::Vector2f& position, const Eigen::Vector2f& pointer)
{
    const Eigen::Vector2f away = position - pointer;
    const float distanceSquared = away.squaredNorm();
    if (distanceSquared < 0.01f || distanceSquared >= pointerRadius * pointerRadius)
        return Eigen::Vector2f::Zero();

    const float distance = std::sqrt(distanceSquared);
    const float falloff = 1.0f - distance / pointerRadius;
    return away / distance * (pointerForce * falloff * falloff);
}

Eigen::Vector2f formationPull(const Eigen::Vector2f& position, const Eigen::Vector2f& target, float strength, float speed)
{
    const Eigen::Vector2f toward = target - position;
    const float distance = toward.norm();
    if (distance <= arrivalRadius)
        return Eigen::Vector2f::Zero();
    return toward / distance * (formationForce * strength * speed);
}

// EXPLOSION blasts from the plane center, DISSOLVING from each particle's own target so the
// text scatters outward along its own outline instead of as one uniform ball
static Eigen::Vector2f blastForce(const Particles& particles, int index, const ForceContext& context, std::mt19937& rng)
{
    if (context.blast <= 0.0f)
        return Eigen::Vector2f::Zero();

    const Eigen::Vector2f position(particles.posX[index], particles.posY[index]);

    if (context.mode == Mode::Explosion) {
        const Eigen::Vector2f away = position - Eigen::Vector2f(context.width * 0.5f, context.height * 0.5f);
        const float distance = away.norm();
        if (distance < 1.0f)
            return Eigen::Vector2f::Zero();
        return away / distance * (explosionForce * context.blast);
    }

    if (context.mode == Mode::Dissolving && particles.hasTarget[index]) {
        const Eigen::Vector2f away = position - Eigen::Vector2f(particles.targetX[index], particles.targetY[index]);
        const float distance = away.norm();
        const float strength = dissolveForce * context.blast;
        // sitting right on its target, no "away" exists so pick one
        if (distance < 1.0f) {
            std::uniform_real_distribution<float> angle(0.0f, 2.0f * PI);
            const float a = angle(rng);
            return Eigen::Vector2f(std::cos(a), std::sin(a)) * strength;
        }
        return away / distance * strength;
    }

    return Eigen::Vector2f::Zero();
}

void accumulateForces(const Particles& particles, const ForceContext& context, std::mt19937& rng,
    Eigen::ArrayXf& forceX, Eigen::ArrayXf& forceY)
{
    const int count = particles.size();
    forceX = Eigen::ArrayXf::Zero(count);
    forceY = Eigen::ArrayXf::Zero(count);

    const bool lifeActive = context.weights.lifeStrength > 0.0f && context.matrix && context.grid;
    const bool formationActive = context.weights.formationStrength > 0.0f && context.shapeAvailable;
    // the pointer would fight shape formation so it only matters while particles roam freely
    const bool pointerActive = context.pointerActive && context.mode == Mode::ParticleLife;

    for (int i = 0; i < count; i++) {
        Eigen::Vector2f total = Eigen::Vector2f::Zero();
        const float x = particles.posX[i];
        const float y = particles.posY[i];

        if (lifeActive) {
            Eigen::Vector2f life = Eigen::Vector2f::Zero();
            const SpatialGrid& grid = *context.grid;
            const NeighborCells neighbors = neighborCells(grid, x, y);
            for (int c = 0; c < neighbors.count; c++) {
                const int cell = neighbors.cells[c];
                for (int slot = cellBegin(grid, cell); slot < cellEnd(grid, cell); slot++) {
                    const int j = grid.indices[slot];
                    if (j == i)
                        continue;
                    const Eigen::Vector2f delta
                        = torusDelta(x, y, particles.posX[j], particles.posY[j], context.width, context.height);
                    life += pairForce(delta, particles.type[i], particles.type[j], *context.matrix);
                }
            }
            total += life * context.weights.lifeStrength;
        }

        total += blastForce(particles, i, context, rng);

        if (formationActive && particles.hasTarget[i]) {
            total += formationPull(Eigen::Vector2f(x, y), Eigen::Vector2f(particles.targetX[i], particles.targetY[i]),
                context.weights.formationStrength, particles.formationSpeed[i]);
        }

        if (pointerActive)
            total += pointerRepulsion(Eigen::Vector2f(x, y), context.pointer);

        forceX[i] = total.x();
        forceY[i] = total.y();
    }
}

void integrate(Particles& particles, const Eigen::ArrayXf& forceX, const Eigen::ArrayXf& forceY,
    float deltaTime, float width, float height)
{
    // force first, then friction, applied once per frame whatever the frame time is
    particles.velX = (particles.velX + forceX * deltaTime) * friction;
    particles.velY = (particles.velY + forceY * deltaTime) * friction;

    // branchless speed cap, 1e-6f clamp to prevent divide by 0, min(1) leaves slow particles untouched
    Eigen::ArrayXf speed = (particles.velX * particles.velX + particles.velY * particles.velY).sqrt().max(1e-6f);
    Eigen::ArrayXf speedScale = (maxSpeed / speed).min(1.0f);
    particles.velX *= speedScale;
    particles.velY *= speedScale;

    particles.posX += particles.velX * deltaTime;
    particles.posY += particles.velY * deltaTime;

    // toroidal wrap, a particle at width + 7 reappears at 7 and one at -3 at width - 3
    particles.posX -= (particles.posX / width).floor() * width;
    particles.posY -= (particles.posY / height).floor() * height;
    // float rounding can leave a tiny negative at exactly width, fold it back to 0
    particles.posX = (particles.posX >= width).select(0.0f, particles.posX);
    particles.posY = (particles.posY >= height).select(0.0f, particles.posY);
}
