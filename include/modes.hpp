#pragma once

#include "config.hpp"

enum class Mode {
    Explosion,
    ParticleLife,
    Forming,
    Holding,
    BalloonRising,
    Dissolving,
};

const char* modeName(Mode mode);

// everything time related, all in seconds on the host clock
// messageIndex is the message being formed/held, it reaches messages.size() once the
// last one dissolved and from then on the machine is in its free-running tail
struct Timeline {
    Mode mode = Mode::Holding;
    double startTime = 0.0;
    double modeStartTime = 0.0;
    int messageIndex = 0;
    bool firstHold = true;

    // visibility pause bookkeeping
    double pausedTime = 0.0;
    bool paused = false;
    double pauseStart = 0.0;
};

// what the caller has to do after a transition, the machine itself only moves clocks and indices
enum class Transition {
    None,
    EnterParticleLife, // regenerate the attraction matrix
    EnterForming, // rasterize messages[messageIndex] and assign targets
    EnterHolding,
    EnterBalloon, // run the balloon entry hook
    EnterDissolving,
    EnterFreeRunning, // last message done, regenerate the matrix one more time
    Reroll, // free-running tail clock wrapped, regenerate the matrix
};

// how much of each force family a particle feels, lifeStrength + formationStrength == 1 while forming
struct ForceWeights {
    float lifeStrength;
    float formationStrength;
};

Timeline beginTimeline(double now, bool withExplosion);

bool isFreeRunning(const Timeline& timeline, const std::vector<Message>& messages);

bool showsShape(Mode mode);

// logical time spent in the current mode, frozen while paused
double modeElapsed(const Timeline& timeline, double now);

double modeDuration(const Timeline& timeline, const std::vector<Message>& messages);

// single step of the transition table, at most one transition per call
Transition advanceTimeline(Timeline& timeline, const std::vector<Message>& messages, double now);

ForceWeights forceWeights(const Timeline& timeline, double now);

// 1 at the start of EXPLOSION/DISSOLVING fading to 0 at their end, 0 in every other mode
float blastStrength(const Timeline& timeline, double now);

void pauseTimeline(Timeline& timeline, double now);
// returns how long the pause lasted so the caller can shift its own timestamps
double resumeTimeline(Timeline& timeline, double now);

// sum of every fixed duration from start up to and including the last message's hold
double introDuration(const std::vector<Message>& messages, bool withExplosion);

// 0..1, pause time excluded, saturates once the intro is over
double introProgress(const Timeline& timeline, const std::vector<Message>& messages, bool withExplosion, double now);
