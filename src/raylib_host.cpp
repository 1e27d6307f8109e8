#include "raylib_host.hpp"

double RaylibHost::now() const
{
    return GetTime();
}

int RaylibHost::requestFrame(FrameCallback callback)
{
    const int handle = nextHandle++;
    queue.emplace_back(handle, std::move(callback));
    return handle;
}

void RaylibHost::cancelFrame(int handle)
{
    cancelled.push_back(handle);
    queue.erase(std::remove_if(queue.begin(), queue.end(),
                    [handle](const std::pair<int, FrameCallback>& entry) { return entry.first == handle; }),
        queue.end());
}

void RaylibHost::pump()
{
    pollVisibility();
    pollPointer();

    // swap first, callbacks re-request themselves for the next pass
    std::vector<std::pair<int, FrameCallback>> due;
    due.swap(queue);
    cancelled.clear();
    const double time = now();
    for (auto& entry : due) {
        if (std::find(cancelled.begin(), cancelled.end(), entry.first) != cancelled.end())
            continue;
        entry.second(time);
    }
    cancelled.clear();
}

void RaylibHost::pollVisibility()
{
    // a minimized/hidden window is the desktop version of a background tab
    const bool hiddenNow = IsWindowMinimized() || IsWindowHidden();
    if (hiddenNow == hidden)
        return;
    hidden = hiddenNow;
    HostEvent event { HostEvent::Kind::VisibilityChange };
    event.hidden = hidden;
    dispatch(event);
}

void RaylibHost::pollPointer()
{
    if (IsCursorOnScreen()) {
        const Vector2 mouse = GetMousePosition();
        if (!pointerInside || !Vector2Equals(mouse, lastPointer)) {
            HostEvent event { HostEvent::Kind::PointerMove };
            event.position = Eigen::Vector2f(mouse.x, mouse.y);
            dispatch(event);
        }
        pointerInside = true;
        lastPointer = mouse;
    } else if (pointerInside) {
        pointerInside = false;
        dispatch(HostEvent { HostEvent::Kind::PointerLeave });
    }

    if (GetTouchPointCount() > 0) {
        const Vector2 touch = GetTouchPosition(0);
        HostEvent event { HostEvent::Kind::TouchMove };
        event.position = Eigen::Vector2f(touch.x, touch.y);
        dispatch(event);
        touching = true;
    } else if (touching) {
        touching = false;
        dispatch(HostEvent { HostEvent::Kind::TouchEnd });
    }
}

RaylibCanvas::RaylibCanvas(Color background)
    : background(background)
{
}

bool RaylibCanvas::hasContext() const
{
    return IsWindowReady();
}

float RaylibCanvas::clientWidth() const
{
    return static_cast<float>(GetScreenWidth());
}

float RaylibCanvas::clientHeight() const
{
    return static_cast<float>(GetScreenHeight());
}

float RaylibCanvas::pixelRatio() const
{
    const int screenWidth = GetScreenWidth();
    return screenWidth > 0 ? static_cast<float>(GetRenderWidth()) / screenWidth : 1.0f;
}

void RaylibCanvas::setBackingSize(int width, int height)
{
    // the framebuffer follows the window, GLFW resized it already
    TraceLog(LOG_DEBUG, "HERO: Backing store %dx%d", width, height);
}

void RaylibCanvas::clear()
{
    ClearBackground(background);
}

void RaylibCanvas::beginScene(float scale)
{
    // with FLAG_WINDOW_HIGHDPI raylib already maps screen units onto the framebuffer through its
    // screenScale matrix, only what's left of the requested scale goes on the modelview stack
    const float builtIn = pixelRatio();
    rlDrawRenderBatchActive();
    rlPushMatrix();
    rlScalef(scale / builtIn, scale / builtIn, 1.0f);
}

void RaylibCanvas::endScene()
{
    rlDrawRenderBatchActive();
    rlPopMatrix();
}

void RaylibCanvas::fillCircle(float x, float y, float radius, Color color)
{
    // particles are ~3px wide, 8 segments is already round at that size
    DrawCircleSector(Vector2 { x, y }, radius, 0.0f, 360.0f, 8, color);
}
