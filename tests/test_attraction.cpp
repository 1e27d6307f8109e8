#include <catch2/catch.hpp>

#include "attraction.hpp"

static const Preset allPresets[] = { Preset::Random, Preset::Planets, Preset::Snakes, Preset::Chaos, Preset::Balanced,
    Preset::Spirals, Preset::Clusters };

TEST_CASE("every preset stays inside [-1, 1]", "[attraction]")
{
    std::mt19937 rng(42);
    for (Preset preset : allPresets) {
        INFO(presetName(preset));
        for (int round = 0; round < 20; round++) {
            const AttractionMatrix matrix = generateMatrix(preset, rng);
            REQUIRE(matrix.rows() == numTypes);
            REQUIRE(matrix.cols() == numTypes);
            REQUIRE(matrix.allFinite());
            REQUIRE(matrix.minCoeff() >= -1.0f);
            REQUIRE(matrix.maxCoeff() <= 1.0f);
        }
    }
}

TEST_CASE("structured presets", "[attraction]")
{
    std::mt19937 rng(1);

    SECTION("planets")
    {
        const AttractionMatrix matrix = generateMatrix(Preset::Planets, rng);
        REQUIRE(matrix(3, 3) == Approx(-0.5f));
        REQUIRE(matrix(3, 4) == Approx(0.8f));
        REQUIRE(matrix(4, 3) == Approx(0.8f));
        REQUIRE(matrix(3, 7) == Approx(-0.2f));
        // neighbors by index only, no wrap from the last type to the first
        REQUIRE(matrix(0, numTypes - 1) == Approx(-0.2f));
    }

    SECTION("snakes chase the next type around the ring")
    {
        const AttractionMatrix matrix = generateMatrix(Preset::Snakes, rng);
        for (int i = 0; i < numTypes; i++) {
            const int next = (i + 1) % numTypes;
            const int previous = (i + numTypes - 1) % numTypes;
            REQUIRE(matrix(i, i) == Approx(-0.3f));
            REQUIRE(matrix(i, next) == Approx(0.9f));
            REQUIRE(matrix(i, previous) == Approx(-0.7f));
        }
        REQUIRE(matrix(0, 6) == 0.0f);
    }

    SECTION("spirals are asymmetric")
    {
        const AttractionMatrix matrix = generateMatrix(Preset::Spirals, rng);
        REQUIRE(matrix(0, 0) == Approx(0.6f));
        REQUIRE(matrix(0, 3) == Approx(0.3f));
        REQUIRE(matrix(3, 0) == Approx(-0.4f));
    }

    SECTION("clusters")
    {
        const AttractionMatrix matrix = generateMatrix(Preset::Clusters, rng);
        REQUIRE(matrix(5, 5) == Approx(0.5f));
        REQUIRE(matrix(5, 7) == Approx(0.3f));
        REQUIRE(matrix(5, 8) == Approx(-0.4f));
    }

    SECTION("chaos only has extreme values")
    {
        const AttractionMatrix matrix = generateMatrix(Preset::Chaos, rng);
        REQUIRE(matrix.cwiseAbs().minCoeff() >= 0.5f);
    }

    SECTION("balanced stays gentle")
    {
        const AttractionMatrix matrix = generateMatrix(Preset::Balanced, rng);
        REQUIRE(matrix.cwiseAbs().maxCoeff() <= 0.3f);
    }
}

TEST_CASE("random preset picks every recipe", "[attraction]")
{
    std::mt19937 rng(3);
    std::array<int, numPresets> hits {};
    for (int round = 0; round < 7000; round++)
        hits[static_cast<int>(randomPreset(rng))]++;

    for (int preset = 0; preset < numPresets; preset++) {
        INFO(presetName(static_cast<Preset>(preset)));
        REQUIRE(hits[preset] > 700);
    }
}

TEST_CASE("random matrices come from every recipe", "[attraction]")
{
    std::mt19937 rng(8);
    std::array<bool, numPresets> picked {};
    bool planets = false;
    bool snakes = false;

    for (int round = 0; round < 300; round++) {
        Preset preset = Preset::Random;
        const AttractionMatrix matrix = generateMatrix(rng, &preset);
        picked[static_cast<int>(preset)] = true;
        REQUIRE(matrix.cwiseAbs().maxCoeff() <= 1.0f);

        if (preset == Preset::Planets) {
            REQUIRE((matrix.diagonal().array() == -0.5f).all());
            REQUIRE(matrix(0, 1) == Approx(0.8f));
        }
        if (preset == Preset::Clusters)
            REQUIRE((matrix.diagonal().array() == 0.5f).all());

        // the signatures are recognizable without being told the recipe
        planets = planets || ((matrix.diagonal().array() == -0.5f).all() && matrix(5, 6) == 0.8f);
        snakes = snakes || ((matrix.diagonal().array() == -0.3f).all() && matrix(5, 6) == 0.9f);
    }

    for (int preset = 0; preset < numPresets; preset++) {
        INFO(presetName(static_cast<Preset>(preset)));
        REQUIRE(picked[preset]);
    }
    REQUIRE(planets);
    REQUIRE(snakes);

    // asking for the recipe doesn't change what comes out
    std::mt19937 quiet(15);
    std::mt19937 told(15);
    Preset preset = Preset::Random;
    for (int round = 0; round < 10; round++)
        REQUIRE(generateMatrix(quiet) == generateMatrix(told, &preset));
}
