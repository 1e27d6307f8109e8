#pragma once

#include "balloon.hpp"
#include "forces.hpp"
#include "host.hpp"

// the whole animation behind four calls, everything it needs lives in here (no globals) so a page
// can run several of them side by side
// single threaded: every method, including the frame callback, runs on the host's thread
class ParticleLifeSystem {
public:
    ParticleLifeSystem(Canvas& canvas, Host& host, HeroConfig config);
    ~ParticleLifeSystem();

    ParticleLifeSystem(const ParticleLifeSystem&) = delete;
    ParticleLifeSystem& operator=(const ParticleLifeSystem&) = delete;

    // measure, sample the first message, spawn everyone on it, begin the frame loop
    // a canvas without a size yet retries on the next frame, a second call while running is ignored
    void start();

    // cancel the pending frame, drop every listener, clear the canvas
    void stop();

    // call on every canvas size change
    void resize();

    // 0..1 through the intro, pause time excluded
    double getProgress() const;
    // the intro has played completely
    bool isReady() const;

    double getModeElapsedTime() const;

    // sample a picture drawn at bounds (plane units) and make it the current shape, every particle gets
    // a target in it and pixel colors pick the types, the next FORMING replaces it with text again
    // false when nothing in the picture is opaque enough or on the plane
    bool setImageTargets(const Image& image, Rectangle bounds);

    bool running() const { return isRunning; }
    bool pointerActive() const { return pointerIsActive; }
    float width() const { return planeWidth; }
    float height() const { return planeHeight; }
    const Particles& particles() const { return swarm; }
    const Timeline& timeline() const { return clock; }
    const AttractionMatrix& matrix() const { return attraction; }
    const TextShape& shape() const { return currentShape; }
    const BalloonFlight& balloon() const { return flight; }

private:
    void frame(double now);
    void step(double now, float deltaTime);
    void draw(double now);
    void applyTransition(Transition transition, double now);
    void regenerateShape(int messageIndex);
    void rollMatrix();
    int population();
    void attachListeners();
    void detachListeners();
    void onVisibility(const HostEvent& event);
    void onPointer(const HostEvent& event);

    Canvas& canvas;
    Host& host;
    HeroConfig config;
    std::mt19937 rng;

    Particles swarm;
    AttractionMatrix attraction;
    SpatialGrid grid;
    GlyphFont font;
    TextShape currentShape;
    BalloonFlight flight;
    Timeline clock;

    Eigen::ArrayXf forceX;
    Eigen::ArrayXf forceY;

    float planeWidth = 0.0f;
    float planeHeight = 0.0f;
    float pixelRatio = 1.0f;

    bool isRunning = false;
    bool started = false;
    double lastFrameTime = 0.0;
    // progress and mode time stay where stop() left them
    double stopTime = 0.0;
    int frameHandle = 0;
    int retryHandle = 0;
    std::vector<int> listenerHandles;

    bool pointerIsActive = false;
    Eigen::Vector2f pointer = Eigen::Vector2f::Zero();
};

// null when the canvas has no drawing context, the page simply goes without the animation
std::unique_ptr<ParticleLifeSystem> createParticleLifeSystem(Canvas& canvas, Host& host, HeroConfig config = defaultConfig());
