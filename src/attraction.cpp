#include "attraction.hpp"

const char* presetName(Preset preset)
{
    switch (preset) {
    case Preset::Random:
        return "random";
    case Preset::Planets:
        return "planets";
    case Preset::Snakes:
        return "snakes";
    case Preset::Chaos:
        return "chaos";
    case Preset::Balanced:
        return "balanced";
    case Preset::Spirals:
        return "spirals";
    case Preset::Clusters:
        return "clusters";
    }
    return "unknown";
}

Preset randomPreset(std::mt19937& rng)
{
    std::uniform_int_distribution<int> pick(0, numPresets - 1);
    return static_cast<Preset>(pick(rng));
}

AttractionMatrix generateMatrix(Preset preset, std::mt19937& rng)
{
    std::uniform_real_distribution<float> unit(0.0f, 1.0f);
    AttractionMatrix matrix;

    for (int i = 0; i < numTypes; i++) {
        for (int j = 0; j < numTypes; j++) {
            float value = 0.0f;
            switch (preset) {
            case Preset::Random:
                value = unit(rng) * 2.0f - 1.0f;
                break;
            case Preset::Planets:
                // self-repulsion keeps a species from clumping, neighbors by index orbit each other
                if (i == j)
                    value = -0.5f;
                else if (std::abs(i - j) == 1)
                    value = 0.8f;
                else
                    value = -0.2f;
                break;
            case Preset::Snakes:
                // i hunts i+1 and runs from i-1 (mod numTypes) so chains form and chase around
                if (i == j)
                    value = -0.3f;
                else if ((i + 1) % numTypes == j)
                    value = 0.9f;
                else if ((j + 1) % numTypes == i)
                    value = -0.7f;
                else
                    value = 0.0f;
                break;
            case Preset::Chaos: {
                const float sign = unit(rng) > 0.5f ? 1.0f : -1.0f;
                value = sign * (0.5f + unit(rng) * 0.5f);
                break;
            }
            case Preset::Balanced:
                value = (unit(rng) - 0.5f) * 0.6f;
                break;
            case Preset::Spirals: {
                // attraction fades with how far ahead j is of i, anything "behind" is repelled
                // the asymmetry (i likes j but j doesn't like i back) is what makes things rotate
                const int diff = (j - i + numTypes) % numTypes;
                const float half = numTypes / 2.0f;
                value = diff < half ? 0.6f * (1.0f - diff / half) : -0.4f;
                break;
            }
            case Preset::Clusters:
                if (i == j)
                    value = 0.5f;
                else if (std::abs(i - j) <= 2)
                    value = 0.3f;
                else
                    value = -0.4f;
                break;
            }
            matrix(i, j) = value;
        }
    }
    return matrix;
}

AttractionMatrix generateMatrix(std::mt19937& rng, Preset* chosen)
{
    const Preset preset = randomPreset(rng);
    if (chosen)
        *chosen = preset;
    return generateMatrix(preset, rng);
}
