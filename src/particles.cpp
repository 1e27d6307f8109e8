#include "particles.hpp"

void shuffleTargets(std::vector<ShapeTarget>& targets, std::mt19937& rng)
{
    std::shuffle(targets.begin(), targets.end(), rng);
}

bool assignTargets(Particles& particles, const std::vector<ShapeTarget>& targets, std::mt19937& rng)
{
    if (targets.empty())
        return false;

    std::uniform_real_distribution<float> speed(0.5f, 1.5f);
    const int targetCount = static_cast<int>(targets.size());
    for (int index = 0; index < particles.size(); index++) {
        const ShapeTarget& target = targets[index % targetCount];
        particles.targetX[index] = target.x;
        particles.targetY[index] = target.y;
        particles.hasTarget[index] = true;
        particles.formationSpeed[index] = speed(rng);
    }
    return true;
}

Particles spawnOnTargets(int count, const std::vector<ShapeTarget>& targets, float width, float height, std::mt19937& rng)
{
    Particles particles(count);

    if (targets.empty()) {
        std::uniform_real_distribution<float> randomX(0.0f, width);
        std::uniform_real_distribution<float> randomY(0.0f, height);
        std::uniform_int_distribution<int> randomType(0, numTypes - 1);
        for (int index = 0; index < count; index++) {
            particles.posX[index] = randomX(rng);
            particles.posY[index] = randomY(rng);
            particles.type[index] = randomType(rng);
        }
        return particles;
    }

    assignTargets(particles, targets, rng);
    const int targetCount = static_cast<int>(targets.size());
    for (int index = 0; index < count; index++) {
        particles.posX[index] = particles.targetX[index];
        particles.posY[index] = particles.targetY[index];
        particles.type[index] = targets[index % targetCount].type;
    }
    return particles;
}

Particles spawnAtCenter(int count, float width, float height, std::mt19937& rng)
{
    Particles particles(count);

    // small disc around the center, the explosion force does the rest
    std::uniform_real_distribution<float> angle(0.0f, 2.0f * PI);
    std::uniform_real_distribution<float> radius(0.0f, std::min(width, height) * 0.05f);
    std::uniform_int_distribution<int> randomType(0, numTypes - 1);
    for (int index = 0; index < count; index++) {
        const float a = angle(rng);
        const float r = radius(rng);
        particles.posX[index] = width * 0.5f + std::cos(a) * r;
        particles.posY[index] = height * 0.5f + std::sin(a) * r;
        particles.type[index] = randomType(rng);
    }
    return particles;
}

void clearTargets(Particles& particles)
{
    particles.hasTarget.setConstant(false);
}
