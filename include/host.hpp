#pragma once

#include "main.hpp"

// what the page around the animation can tell it, positions are in canvas client units
struct HostEvent {
    enum class Kind {
        PointerMove,
        PointerLeave,
        TouchMove,
        TouchEnd,
        VisibilityChange,
    };

    Kind kind;
    Eigen::Vector2f position = Eigen::Vector2f::Zero();
    bool hidden = false;
};

// the page: a clock, an animation-frame scheduler and document-level events
// listeners are tracked by handle so an owner can take exactly its own listeners back
class Host {
public:
    using FrameCallback = std::function<void(double)>;
    using Listener = std::function<void(const HostEvent&)>;

    virtual ~Host() = default;

    // seconds, monotonic
    virtual double now() const = 0;

    // schedule callback for the next frame, returns a handle for cancelFrame (never 0)
    virtual int requestFrame(FrameCallback callback) = 0;
    virtual void cancelFrame(int handle) = 0;

    int addListener(HostEvent::Kind kind, Listener listener);
    void removeListener(int handle);
    std::size_t listenerCount() const { return listeners.size(); }

    // listeners may add or remove listeners from inside their callback
    void dispatch(const HostEvent& event);

private:
    struct Entry {
        int handle;
        HostEvent::Kind kind;
        Listener listener;
    };
    std::vector<Entry> listeners;
    int nextHandle = 1;
};

// the element the animation draws into
class Canvas {
public:
    virtual ~Canvas() = default;

    // false when no 2D drawing context can be had, the animation then doesn't exist at all
    virtual bool hasContext() const = 0;

    // layout size in client units, 0 while layout hasn't settled
    virtual float clientWidth() const = 0;
    virtual float clientHeight() const = 0;
    // device pixels per client unit
    virtual float pixelRatio() const = 0;

    // backing store in device pixels
    virtual void setBackingSize(int width, int height) = 0;

    virtual void clear() = 0;
    // everything drawn until endScene is scaled by scale (client units -> device pixels)
    virtual void beginScene(float scale) = 0;
    virtual void endScene() = 0;
    virtual void fillCircle(float x, float y, float radius, Color color) = 0;
};
