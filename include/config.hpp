#pragma once

#include "main.hpp"

// how many particle species exist, each one has a color and a row/column in the attraction matrix
static constexpr int numTypes = 12;

// physics, all distances are in simulation units (logical pixels, not device pixels)

// how far a particle can "sense" others, also the spatial grid cell size
// low (40) = small tight clusters, high (150) = global behavior but far more neighbors per cell
static constexpr float interactionRadius = 80.0f;

// species-blind pushback below this distance so particles never stack on the same pixel
static constexpr float repulsionRadius = 8.0f;
static constexpr float repulsionStrength = 50.0f;

// scales every matrix value (the matrix encodes relationships, this encodes their intensity)
static constexpr float maxForce = 180.0f;

// velocity is multiplied by this every frame regardless of frame time
// low (0.7) = syrupy, high (0.97) = ice rink
static constexpr float friction = 0.88f;

// hard speed cap in units/second, same for every mode
static constexpr float maxSpeed = 150.0f;

// formation pull toward a target, multiplied by formation strength and per-particle speed
static constexpr float formationForce = 2500.0f;
// within this distance of its target a particle feels no pull (avoids jitter at convergence)
static constexpr float arrivalRadius = 1.0f;

// radial blasts, both fade linearly to zero over their phase
static constexpr float explosionForce = 3000.0f;
static constexpr float dissolveForce = 6000.0f;

// pointer pushes particles away during free-running particle life only
static constexpr float pointerRadius = 120.0f;
static constexpr float pointerForce = 800.0f;

// frame time clamp so a stall (debugger, window drag) doesn't teleport everything
static constexpr double maxFrameTime = 0.1;

// rendering
static constexpr float particleRadius = 1.5f;
static constexpr float holdJitterAmplitude = 1.2f;
static constexpr float holdJitterSpeed = 2.4f;

// phase durations in seconds
static constexpr double explosionDuration = 2.0;
static constexpr double particleLifeDuration = 10.0;
static constexpr double formingDuration = 3.0;
static constexpr double holdingDuration = 8.0;
static constexpr double firstHoldingDuration = 4.0;
static constexpr double balloonHoldingDuration = 2.0;
static constexpr double balloonRisingDuration = 6.0;
static constexpr double dissolveDuration = 2.0;
// once every message was shown, the infinite tail re-rolls its matrix this often
static constexpr double rerollInterval = 20.0;

// a size change bigger than this while text is shown re-rasterizes the text
static constexpr float resizeRegenerateThreshold = 50.0f;

// text rasterization
static constexpr int rasterOversampling = 2;
static constexpr unsigned char alphaThreshold = 128;
static constexpr float minFontSize = 28.0f;
static constexpr float maxFontSize = 96.0f;
// font size as a fraction of min(width, height) before clamping
static constexpr float fontSizeFactor = 0.09f;
// widest line may use this much of the plane width
static constexpr float maxTextWidthFraction = 0.9f;
static constexpr float lineHeightFactor = 1.2f;

// image formation, pictures are sampled at their native resolution
// lower stride = more targets (and more duplicates when the picture is small on screen)
static constexpr int imageSampleStride = 2;
// low on purpose so anti-aliased edges of cut-out pictures still count
static constexpr unsigned char imageAlphaThreshold = 50;

// balloon sub-animation
static constexpr int balloonParticles = 140;
// balloon height relative to the message font size
static constexpr float balloonHeightFactor = 1.6f;
static constexpr float balloonTopMargin = 12.0f;

// a line of the intro script, when balloonWord is set the "i" of that word releases a balloon
struct Message {
    std::string text;
    std::string balloonWord;
};

struct HeroConfig {
    std::vector<Message> messages;

    // bold serif used for every message
    std::string fontPath = "/usr/share/fonts/truetype/dejavu/DejaVuSerif-Bold.ttf";

    // population, the mobile count kicks in below mobileBreakpoint (plane width)
    int desktopParticles = 2000;
    int mobileParticles = 1200;
    float mobileBreakpoint = 768.0f;
    // upper bound when scaling the population up to cover the largest message
    int maxParticles = 5000;

    // legacy intro: start with particles bursting from the center instead of already formed text
    bool beginWithExplosion = false;

    // 0 = seed from std::random_device
    unsigned int seed = 0;
};

HeroConfig defaultConfig();

// one color per type, tailwind's 500 shades around the color wheel
static constexpr Color typeColors[numTypes] = {
    { 239, 68, 68, 255 }, // red
    { 251, 146, 60, 255 }, // orange
    { 234, 179, 8, 255 }, // yellow
    { 132, 204, 22, 255 }, // lime
    { 34, 197, 94, 255 }, // green
    { 16, 185, 129, 255 }, // emerald
    { 20, 184, 166, 255 }, // teal
    { 6, 182, 212, 255 }, // cyan
    { 59, 130, 246, 255 }, // blue
    { 99, 102, 241, 255 }, // indigo
    { 168, 85, 247, 255 }, // purple
    { 236, 72, 153, 255 }, // pink
};
