#pragma once

#include "hero.hpp"

// manual clock, frames only run when the test advances time
class FakeHost : public Host {
public:
    double clock = 100.0;

    double now() const override { return clock; }

    int requestFrame(FrameCallback callback) override
    {
        const int handle = nextHandle++;
        queue.emplace_back(handle, std::move(callback));
        return handle;
    }

    void cancelFrame(int handle) override
    {
        queue.erase(std::remove_if(queue.begin(), queue.end(),
                        [handle](const std::pair<int, FrameCallback>& entry) { return entry.first == handle; }),
            queue.end());
    }

    std::size_t pendingFrames() const { return queue.size(); }

    // move the clock forward and run one frame
    void advance(double seconds)
    {
        clock += seconds;
        std::vector<std::pair<int, FrameCallback>> due;
        due.swap(queue);
        for (auto& entry : due)
            entry.second(clock);
    }

    // frames of frameTime until seconds have passed
    void run(double seconds, double frameTime)
    {
        for (double t = 0.0; t < seconds; t += frameTime)
            advance(frameTime);
    }

    void setHidden(bool hidden)
    {
        HostEvent event { HostEvent::Kind::VisibilityChange };
        event.hidden = hidden;
        dispatch(event);
    }

private:
    std::vector<std::pair<int, FrameCallback>> queue;
    int nextHandle = 1;
};

class FakeCanvas : public Canvas {
public:
    bool context = true;
    float width = 1280.0f;
    float height = 720.0f;
    float ratio = 1.0f;

    int clears = 0;
    int circles = 0;
    // centers of the circles drawn since the last clear, in draw order
    std::vector<Eigen::Vector2f> drawn;
    float lastScale = 0.0f;
    int backingWidth = 0;
    int backingHeight = 0;

    bool hasContext() const override { return context; }
    float clientWidth() const override { return width; }
    float clientHeight() const override { return height; }
    float pixelRatio() const override { return ratio; }
    void setBackingSize(int w, int h) override
    {
        backingWidth = w;
        backingHeight = h;
    }
    void clear() override
    {
        clears++;
        circles = 0;
        drawn.clear();
    }
    void beginScene(float scale) override { lastScale = scale; }
    void endScene() override { }
    void fillCircle(float x, float y, float, Color) override
    {
        circles++;
        drawn.emplace_back(x, y);
    }
};

inline const char* testFontPath()
{
    return "/usr/share/fonts/truetype/dejavu/DejaVuSerif-Bold.ttf";
}

inline bool testFontAvailable()
{
    return FileExists(testFontPath());
}
