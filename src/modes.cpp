#include "modes.hpp"

const char* modeName(Mode mode)
{
    switch (mode) {
    case Mode::Explosion:
        return "EXPLOSION";
    case Mode::ParticleLife:
        return "PARTICLE_LIFE";
    case Mode::Forming:
        return "FORMING";
    case Mode::Holding:
        return "HOLDING";
    case Mode::BalloonRising:
        return "BALLOON_RISING";
    case Mode::Dissolving:
        return "DISSOLVING";
    }
    return "UNKNOWN";
}

static bool releasesBalloon(const std::vector<Message>& messages, int index)
{
    return index >= 0 && index < static_cast<int>(messages.size()) && !messages[index].balloonWord.empty();
}

// the very first hold is short so the page doesn't sit on a static greeting, a balloon
// message is shorter still because the balloon phase that follows keeps the text on screen
static double holdDuration(const std::vector<Message>& messages, int index, bool firstHold)
{
    if (releasesBalloon(messages, index))
        return balloonHoldingDuration;
    if (firstHold)
        return firstHoldingDuration;
    return holdingDuration;
}

Timeline beginTimeline(double now, bool withExplosion)
{
    Timeline timeline;
    timeline.mode = withExplosion ? Mode::Explosion : Mode::Holding;
    timeline.startTime = now;
    timeline.modeStartTime = now;
    return timeline;
}

bool isFreeRunning(const Timeline& timeline, const std::vector<Message>& messages)
{
    return timeline.messageIndex >= static_cast<int>(messages.size());
}

bool showsShape(Mode mode)
{
    return mode == Mode::Forming || mode == Mode::Holding || mode == Mode::BalloonRising;
}

double modeElapsed(const Timeline& timeline, double now)
{
    const double clock = timeline.paused ? timeline.pauseStart : now;
    return clock - timeline.modeStartTime;
}

double modeDuration(const Timeline& timeline, const std::vector<Message>& messages)
{
    switch (timeline.mode) {
    case Mode::Explosion:
        return explosionDuration;
    case Mode::ParticleLife:
        return isFreeRunning(timeline, messages) ? rerollInterval : particleLifeDuration;
    case Mode::Forming:
        return formingDuration;
    case Mode::Holding:
        return holdDuration(messages, timeline.messageIndex, timeline.firstHold);
    case Mode::BalloonRising:
        return balloonRisingDuration;
    case Mode::Dissolving:
        return dissolveDuration;
    }
    return std::numeric_limits<double>::infinity();
}

Transition advanceTimeline(Timeline& timeline, const std::vector<Message>& messages, double now)
{
    if (timeline.paused || modeElapsed(timeline, now) < modeDuration(timeline, messages))
        return Transition::None;

    Transition transition = Transition::None;
    switch (timeline.mode) {
    case Mode::Explosion:
        timeline.mode = Mode::ParticleLife;
        transition = Transition::EnterParticleLife;
        break;
    case Mode::ParticleLife:
        // the tail never forms text again, it only restarts its own clock with a new matrix
        if (isFreeRunning(timeline, messages)) {
            transition = Transition::Reroll;
        } else {
            timeline.mode = Mode::Forming;
            transition = Transition::EnterForming;
        }
        break;
    case Mode::Forming:
        timeline.mode = Mode::Holding;
        transition = Transition::EnterHolding;
        break;
    case Mode::Holding:
        timeline.firstHold = false;
        if (releasesBalloon(messages, timeline.messageIndex)) {
            timeline.mode = Mode::BalloonRising;
            transition = Transition::EnterBalloon;
        } else {
            timeline.mode = Mode::Dissolving;
            transition = Transition::EnterDissolving;
        }
        break;
    case Mode::BalloonRising:
        timeline.mode = Mode::Dissolving;
        transition = Transition::EnterDissolving;
        break;
    case Mode::Dissolving:
        timeline.messageIndex++;
        timeline.mode = Mode::ParticleLife;
        transition = isFreeRunning(timeline, messages) ? Transition::EnterFreeRunning : Transition::EnterParticleLife;
        break;
    }

    timeline.modeStartTime = now;
    return transition;
}

ForceWeights forceWeights(const Timeline& timeline, double now)
{
    const double elapsed = modeElapsed(timeline, now);
    switch (timeline.mode) {
    case Mode::Explosion:
    case Mode::ParticleLife:
        return { 1.0f, 0.0f };
    case Mode::Forming: {
        // quadratic ease-in, particle life hands over to formation smoothly
        const float progress = static_cast<float>(elapsed / formingDuration);
        const float formation = std::min(1.0f, progress * progress);
        return { 1.0f - formation, formation };
    }
    case Mode::Holding:
    case Mode::BalloonRising:
        return { 0.0f, 1.0f };
    case Mode::Dissolving: {
        const float progress = static_cast<float>(elapsed / dissolveDuration);
        return { 0.0f, std::max(0.0f, 1.0f - progress) };
    }
    }
    return { 1.0f, 0.0f };
}

float blastStrength(const Timeline& timeline, double now)
{
    double duration = 0.0;
    if (timeline.mode == Mode::Explosion)
        duration = explosionDuration;
    else if (timeline.mode == Mode::Dissolving)
        duration = dissolveDuration;
    else
        return 0.0f;
    return static_cast<float>(std::max(0.0, 1.0 - modeElapsed(timeline, now) / duration));
}

void pauseTimeline(Timeline& timeline, double now)
{
    if (timeline.paused)
        return;
    timeline.paused = true;
    timeline.pauseStart = now;
}

double resumeTimeline(Timeline& timeline, double now)
{
    if (!timeline.paused)
        return 0.0;
    const double duration = std::max(0.0, now - timeline.pauseStart);
    timeline.modeStartTime += duration;
    timeline.pausedTime += duration;
    timeline.paused = false;
    return duration;
}

double introDuration(const std::vector<Message>& messages, bool withExplosion)
{
    if (messages.empty())
        return withExplosion ? explosionDuration : 0.0;

    const int last = static_cast<int>(messages.size()) - 1;
    double total = 0.0;
    if (withExplosion)
        total += explosionDuration + particleLifeDuration + formingDuration;

    for (int index = 0; index <= last; index++) {
        if (index > 0)
            total += dissolveDuration + particleLifeDuration + formingDuration;
        total += holdDuration(messages, index, index == 0);
        // the last message counts up to its hold only
        if (index < last && releasesBalloon(messages, index))
            total += balloonRisingDuration;
    }
    return total;
}

double introProgress(const Timeline& timeline, const std::vector<Message>& messages, bool withExplosion, double now)
{
    const double total = introDuration(messages, withExplosion);
    if (total <= 0.0)
        return 1.0;
    const double clock = timeline.paused ? timeline.pauseStart : now;
    const double elapsed = clock - timeline.startTime - timeline.pausedTime;
    return std::min(1.0, std::max(0.0, elapsed / total));
}
