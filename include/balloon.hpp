#pragma once

#include "shapes.hpp"

// a handful of particles peel off the dot of an "i" and trace a hot air balloon that floats up
// the shape is sampled once at launch and stored as offsets from its own centroid, every frame only
// the centroid moves, re-sampling at a new base position would reshuffle points and visibly jitter
struct BalloonFlight {
    bool active = false;
    std::vector<int> recruits;
    std::vector<Eigen::Vector2f> offsets;
    Eigen::Vector2f start = Eigen::Vector2f::Zero();
    float rise = 0.0f;
};

// centroid of the dot over the first "i" of word inside the held text: targets in that letter's column,
// upper part of the line, sorted top to bottom, everything above the first vertical gap is the dot
// falls back to the topmost targets of a wider band when no clean gap shows up (fonts with a merged dot)
// false when there are no targets to look at
bool findLetterDot(const TextShape& shape, const std::string& text, const std::string& word, Eigen::Vector2f& dot);

// indices of the count particles closest to point, closest first
std::vector<int> recruitNearest(const Particles& particles, const Eigen::Vector2f& point, int count);

// entry hook of BALLOON_RISING, flight.active stays false if there is nothing to launch from
BalloonFlight launchBalloon(const Particles& particles, const TextShape& shape, const Message& message, std::mt19937& rng);

// per-frame hook, progress 0..1 through BALLOON_RISING
void steerBalloon(Particles& particles, const BalloonFlight& flight, float progress);

float easeInOutCubic(float t);
