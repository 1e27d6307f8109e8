#include "hero.hpp"

static unsigned int resolveSeed(unsigned int seed)
{
    return seed != 0 ? seed : std::random_device {}();
}

ParticleLifeSystem::ParticleLifeSystem(Canvas& canvas, Host& host, HeroConfig config)
    : canvas(canvas), host(host), config(std::move(config)), rng(resolveSeed(this->config.seed))
{
    font.path = this->config.fontPath;
    attraction = generateMatrix(Preset::Balanced, rng);
}

ParticleLifeSystem::~ParticleLifeSystem()
{
    // a pending frame or listener would otherwise call back into a dead object
    stop();
    unloadGlyphFont(font);
}

std::unique_ptr<ParticleLifeSystem> createParticleLifeSystem(Canvas& canvas, Host& host, HeroConfig config)
{
    if (!canvas.hasContext()) {
        TraceLog(LOG_WARNING, "HERO: Canvas has no drawing context, animation disabled");
        return nullptr;
    }
    return std::make_unique<ParticleLifeSystem>(canvas, host, std::move(config));
}

void ParticleLifeSystem::start()
{
    if (isRunning || retryHandle != 0) {
        TraceLog(LOG_WARNING, "HERO: start() called while already running, ignored");
        return;
    }

    // layout not settled yet, a zero sized plane would divide by zero everywhere, look again next frame
    if (canvas.clientWidth() <= 0.0f || canvas.clientHeight() <= 0.0f) {
        TraceLog(LOG_DEBUG, "HERO: Canvas has no size yet, deferring start");
        retryHandle = host.requestFrame([this](double) {
            retryHandle = 0;
            start();
        });
        return;
    }

    resize();

    const double now = host.now();
    const int count = population();
    clock = beginTimeline(now, config.beginWithExplosion);

    if (config.beginWithExplosion) {
        currentShape = TextShape {};
        swarm = spawnAtCenter(count, planeWidth, planeHeight, rng);
    } else if (config.messages.empty()) {
        clock.mode = Mode::ParticleLife;
        currentShape = TextShape {};
        swarm = spawnOnTargets(count, currentShape.targets, planeWidth, planeHeight, rng);
    } else {
        currentShape = rasterizeText(font, config.messages[0].text, planeWidth, planeHeight, rng);
        shuffleTargets(currentShape.targets, rng);
        swarm = spawnOnTargets(count, currentShape.targets, planeWidth, planeHeight, rng);
        if (currentShape.targets.empty())
            TraceLog(LOG_WARNING, "HERO: First message sampled to nothing, starting unformed");
    }
    flight = BalloonFlight {};
    rollMatrix();

    lastFrameTime = now;
    started = true;
    isRunning = true;
    pointerIsActive = false;
    attachListeners();
    frameHandle = host.requestFrame([this](double time) { frame(time); });

    TraceLog(LOG_INFO, "HERO: Started with %d particles on a %.0fx%.0f plane (pixel ratio %.2f)", count, planeWidth,
        planeHeight, pixelRatio);
}

void ParticleLifeSystem::stop()
{
    if (frameHandle != 0) {
        host.cancelFrame(frameHandle);
        frameHandle = 0;
    }
    if (retryHandle != 0) {
        host.cancelFrame(retryHandle);
        retryHandle = 0;
    }
    detachListeners();
    pointerIsActive = false;
    if (isRunning) {
        stopTime = host.now();
        canvas.clear();
        TraceLog(LOG_INFO, "HERO: Stopped");
    }
    isRunning = false;
}

void ParticleLifeSystem::resize()
{
    const float width = canvas.clientWidth();
    const float height = canvas.clientHeight();
    if (width <= 0.0f || height <= 0.0f)
        return;

    pixelRatio = std::max(canvas.pixelRatio(), 0.1f);
    canvas.setBackingSize(static_cast<int>(std::round(width * pixelRatio)), static_cast<int>(std::round(height * pixelRatio)));

    const bool bigChange = std::abs(width - planeWidth) > resizeRegenerateThreshold
        || std::abs(height - planeHeight) > resizeRegenerateThreshold;
    planeWidth = width;
    planeHeight = height;
    resizeGrid(grid, planeWidth, planeHeight, interactionRadius);

    if (!isRunning)
        return;

    // bring everyone back onto the (possibly smaller) plane
    swarm.posX -= (swarm.posX / planeWidth).floor() * planeWidth;
    swarm.posY -= (swarm.posY / planeHeight).floor() * planeHeight;

    if (bigChange && showsShape(clock.mode) && !isFreeRunning(clock, config.messages)) {
        TraceLog(LOG_DEBUG, "HERO: Resized to %.0fx%.0f, resampling current message", planeWidth, planeHeight);
        regenerateShape(clock.messageIndex);
        // a flight in the air was laid out on the old text, launch it again from the new dot
        if (clock.mode == Mode::BalloonRising)
            flight = launchBalloon(swarm, currentShape, config.messages[clock.messageIndex], rng);
    }
}

double ParticleLifeSystem::getProgress() const
{
    if (!started)
        return 0.0;
    return introProgress(clock, config.messages, config.beginWithExplosion, isRunning ? host.now() : stopTime);
}

bool ParticleLifeSystem::isReady() const
{
    return getProgress() >= 1.0;
}

double ParticleLifeSystem::getModeElapsedTime() const
{
    if (!started)
        return 0.0;
    return modeElapsed(clock, isRunning ? host.now() : stopTime);
}

void ParticleLifeSystem::frame(double now)
{
    frameHandle = 0;
    if (!isRunning)
        return;

    // hidden: keep the callback chain alive so resuming is instant, but no clock moves
    if (!clock.paused) {
        const float deltaTime = static_cast<float>(std::min(std::max(now - lastFrameTime, 0.0), maxFrameTime));
        lastFrameTime = now;

        const Transition transition = advanceTimeline(clock, config.messages, now);
        if (transition != Transition::None)
            applyTransition(transition, now);

        step(now, deltaTime);
    }

    draw(now);
    frameHandle = host.requestFrame([this](double time) { frame(time); });
}

void ParticleLifeSystem::step(double now, float deltaTime)
{
    if (clock.mode == Mode::BalloonRising)
        steerBalloon(swarm, flight, static_cast<float>(modeElapsed(clock, now) / balloonRisingDuration));

    rebuildGrid(grid, swarm);

    ForceContext context;
    context.matrix = &attraction;
    context.grid = &grid;
    context.mode = clock.mode;
    context.weights = forceWeights(clock, now);
    context.blast = blastStrength(clock, now);
    context.width = planeWidth;
    context.height = planeHeight;
    context.pointerActive = pointerIsActive;
    context.pointer = pointer;
    context.shapeAvailable = !currentShape.targets.empty();

    accumulateForces(swarm, context, rng, forceX, forceY);
    integrate(swarm, forceX, forceY, deltaTime, planeWidth, planeHeight);
}

void ParticleLifeSystem::draw(double now)
{
    canvas.clear();
    canvas.beginScene(pixelRatio);

    // first hold only: a faint shimmer creeping in over the second half of the hold, so the greeting
    // looks alive without any particle leaving its spot
    float shimmer = 0.0f;
    const double elapsed = modeElapsed(clock, now);
    if (clock.mode == Mode::Holding && clock.firstHold) {
        const double half = modeDuration(clock, config.messages) * 0.5;
        shimmer = static_cast<float>(std::min(1.0, std::max(0.0, (elapsed - half) / half)));
    }

    for (int i = 0; i < swarm.size(); i++) {
        float x = swarm.posX[i];
        float y = swarm.posY[i];
        if (shimmer > 0.0f && swarm.hasTarget[i]) {
            // phase hashed from the target so it is the same every frame for the same particle
            const float hash = std::sin(swarm.targetX[i] * 12.9898f + swarm.targetY[i] * 78.233f) * 43758.5453f;
            const float phase = (hash - std::floor(hash)) * 2.0f * PI;
            const float t = static_cast<float>(elapsed) * holdJitterSpeed;
            x += std::sin(t + phase) * holdJitterAmplitude * shimmer;
            y += std::cos(t * 1.3f + phase) * holdJitterAmplitude * shimmer;
        }
        canvas.fillCircle(x, y, particleRadius, typeColors[swarm.type[i]]);
    }

    canvas.endScene();
}

void ParticleLifeSystem::applyTransition(Transition transition, double now)
{
    TraceLog(LOG_DEBUG, "HERO: -> %s (message %d) at %.2fs", modeName(clock.mode), clock.messageIndex, now - clock.startTime);

    switch (transition) {
    case Transition::None:
    case Transition::EnterHolding:
    case Transition::EnterDissolving:
        break;
    case Transition::EnterParticleLife:
        clearTargets(swarm);
        flight = BalloonFlight {};
        rollMatrix();
        break;
    case Transition::EnterFreeRunning:
        clearTargets(swarm);
        flight = BalloonFlight {};
        rollMatrix();
        TraceLog(LOG_INFO, "HERO: Intro complete, free running from now on");
        break;
    case Transition::Reroll:
        rollMatrix();
        break;
    case Transition::EnterForming:
        regenerateShape(clock.messageIndex);
        break;
    case Transition::EnterBalloon:
        flight = launchBalloon(swarm, currentShape, config.messages[clock.messageIndex], rng);
        break;
    }
}

void ParticleLifeSystem::regenerateShape(int messageIndex)
{
    if (messageIndex < 0 || messageIndex >= static_cast<int>(config.messages.size()))
        return;

    currentShape = rasterizeText(font, config.messages[messageIndex].text, planeWidth, planeHeight, rng);
    shuffleTargets(currentShape.targets, rng);
    // nothing sampled (font missing, plane too small): keep whatever targets particles had, formation
    // is switched off through shapeAvailable and the timeline carries on
    if (!assignTargets(swarm, currentShape.targets, rng))
        TraceLog(LOG_WARNING, "HERO: Message %d sampled to nothing, skipping formation", messageIndex);
}

bool ParticleLifeSystem::setImageTargets(const Image& image, Rectangle bounds)
{
    std::vector<ShapeTarget> targets = sampleImageTargets(image, bounds, planeWidth, planeHeight);
    if (targets.empty()) {
        TraceLog(LOG_WARNING, "HERO: Image sampled to nothing, targets unchanged");
        return false;
    }

    shuffleTargets(targets, rng);
    currentShape = TextShape {};
    currentShape.targets = std::move(targets);
    // a balloon would keep steering its recruits toward the old text
    flight = BalloonFlight {};
    assignTargets(swarm, currentShape.targets, rng);
    TraceLog(LOG_INFO, "HERO: Image formation with %d targets", static_cast<int>(currentShape.targets.size()));
    return true;
}

void ParticleLifeSystem::rollMatrix()
{
    Preset preset = Preset::Random;
    attraction = generateMatrix(rng, &preset);
    TraceLog(LOG_DEBUG, "HERO: Attraction preset [%s]", presetName(preset));
}

int ParticleLifeSystem::population()
{
    const int base = planeWidth < config.mobileBreakpoint ? config.mobileParticles : config.desktopParticles;

    // enough particles to fill the densest message, otherwise big text comes out patchy
    std::size_t largest = 0;
    for (const Message& message : config.messages)
        largest = std::max(largest, rasterizeText(font, message.text, planeWidth, planeHeight, rng).targets.size());

    const int needed = static_cast<int>(std::min<std::size_t>(largest, static_cast<std::size_t>(config.maxParticles)));
    return std::max(base, needed);
}

void ParticleLifeSystem::attachListeners()
{
    detachListeners();
    const auto pointerListener = [this](const HostEvent& event) { onPointer(event); };
    listenerHandles.push_back(host.addListener(HostEvent::Kind::PointerMove, pointerListener));
    listenerHandles.push_back(host.addListener(HostEvent::Kind::PointerLeave, pointerListener));
    listenerHandles.push_back(host.addListener(HostEvent::Kind::TouchMove, pointerListener));
    listenerHandles.push_back(host.addListener(HostEvent::Kind::TouchEnd, pointerListener));
    listenerHandles.push_back(
        host.addListener(HostEvent::Kind::VisibilityChange, [this](const HostEvent& event) { onVisibility(event); }));
}

void ParticleLifeSystem::detachListeners()
{
    for (int handle : listenerHandles)
        host.removeListener(handle);
    listenerHandles.clear();
}

void ParticleLifeSystem::onVisibility(const HostEvent& event)
{
    const double now = host.now();
    if (event.hidden) {
        pauseTimeline(clock, now);
        TraceLog(LOG_DEBUG, "HERO: Hidden, pausing");
    } else {
        const double paused = resumeTimeline(clock, now);
        lastFrameTime += paused;
        TraceLog(LOG_DEBUG, "HERO: Visible again after %.2fs", paused);
    }
}

void ParticleLifeSystem::onPointer(const HostEvent& event)
{
    switch (event.kind) {
    case HostEvent::Kind::PointerMove:
    case HostEvent::Kind::TouchMove:
        pointerIsActive = true;
        pointer = event.position;
        break;
    case HostEvent::Kind::PointerLeave:
    case HostEvent::Kind::TouchEnd:
        pointerIsActive = false;
        break;
    case HostEvent::Kind::VisibilityChange:
        break;
    }
}
