#pragma once

#include "host.hpp"

// a raylib window standing in for the page: GetTime is the clock, each pass of the main loop is an
// animation frame, input and window state are polled and turned into host events
class RaylibHost : public Host {
public:
    double now() const override;
    int requestFrame(FrameCallback callback) override;
    void cancelFrame(int handle) override;

    // poll input/visibility, dispatch what changed, then run the pending frame callback
    // call once per pass of the main loop between BeginDrawing and EndDrawing
    void pump();

private:
    void pollPointer();
    void pollVisibility();

    // like requestAnimationFrame: whatever is requested during a frame runs on the next one
    std::vector<std::pair<int, FrameCallback>> queue;
    // handles cancelled while their frame was already being run
    std::vector<int> cancelled;
    int nextHandle = 1;

    bool pointerInside = false;
    Vector2 lastPointer { -1.0f, -1.0f };
    bool touching = false;
    bool hidden = false;
};

class RaylibCanvas : public Canvas {
public:
    explicit RaylibCanvas(Color background);

    bool hasContext() const override;
    float clientWidth() const override;
    float clientHeight() const override;
    float pixelRatio() const override;
    void setBackingSize(int width, int height) override;
    void clear() override;
    void beginScene(float scale) override;
    void endScene() override;
    void fillCircle(float x, float y, float radius, Color color) override;

private:
    Color background;
};
