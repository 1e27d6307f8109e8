#include <catch2/catch.hpp>

#include "fakes.hpp"

static HeroConfig smallConfig()
{
    HeroConfig config = defaultConfig();
    config.fontPath = testFontPath();
    config.seed = 7;
    config.desktopParticles = 300;
    config.mobileParticles = 200;
    config.maxParticles = 400;
    config.messages = { { "Hi", "" }, { "a bikepacker", "bikepacker" }, { "ok", "" } };
    return config;
}

TEST_CASE("no drawing context, no animation", "[system]")
{
    FakeHost host;
    FakeCanvas canvas;
    canvas.context = false;
    REQUIRE(createParticleLifeSystem(canvas, host, smallConfig()) == nullptr);
    REQUIRE(host.pendingFrames() == 0);
}

TEST_CASE("start and stop", "[system]")
{
    FakeHost host;
    FakeCanvas canvas;
    std::unique_ptr<ParticleLifeSystem> hero = createParticleLifeSystem(canvas, host, smallConfig());
    REQUIRE(hero != nullptr);
    REQUIRE_FALSE(hero->running());
    REQUIRE(hero->getProgress() == 0.0);

    hero->start();
    REQUIRE(hero->running());
    REQUIRE(host.pendingFrames() == 1);
    REQUIRE(host.listenerCount() == 5);
    REQUIRE(hero->timeline().mode == Mode::Holding);
    REQUIRE(hero->particles().size() >= 300);
    REQUIRE(hero->particles().size() <= 400);

    SECTION("a second start is ignored")
    {
        hero->start();
        REQUIRE(host.pendingFrames() == 1);
        REQUIRE(host.listenerCount() == 5);
    }

    SECTION("frames keep coming and draw every particle")
    {
        host.run(0.5, 1.0 / 60.0);
        REQUIRE(host.pendingFrames() == 1);
        REQUIRE(canvas.circles == hero->particles().size());
        REQUIRE(canvas.lastScale == 1.0f);
    }

    SECTION("stop leaves nothing behind")
    {
        host.advance(1.0 / 60.0);
        const int clears = canvas.clears;
        hero->stop();
        REQUIRE_FALSE(hero->running());
        REQUIRE(host.pendingFrames() == 0);
        REQUIRE(host.listenerCount() == 0);
        REQUIRE(canvas.clears == clears + 1);

        // stopping twice is harmless
        hero->stop();
        REQUIRE(canvas.clears == clears + 1);
    }

    SECTION("repeated cycles don't pile up listeners")
    {
        for (int cycle = 0; cycle < 4; cycle++) {
            hero->stop();
            REQUIRE(host.listenerCount() == 0);
            REQUIRE(host.pendingFrames() == 0);
            hero->start();
            REQUIRE(host.listenerCount() == 5);
            REQUIRE(host.pendingFrames() == 1);
            host.run(0.2, 1.0 / 30.0);
        }
    }

    SECTION("destroying a running system cancels everything")
    {
        hero.reset();
        REQUIRE(host.pendingFrames() == 0);
        REQUIRE(host.listenerCount() == 0);
    }
}

TEST_CASE("start waits for the canvas to get a size", "[system]")
{
    FakeHost host;
    FakeCanvas canvas;
    canvas.width = 0.0f;
    std::unique_ptr<ParticleLifeSystem> hero = createParticleLifeSystem(canvas, host, smallConfig());
    REQUIRE(hero != nullptr);

    hero->start();
    REQUIRE_FALSE(hero->running());
    REQUIRE(host.pendingFrames() == 1);
    REQUIRE(host.listenerCount() == 0);

    host.advance(1.0 / 60.0);
    REQUIRE_FALSE(hero->running());
    REQUIRE(host.pendingFrames() == 1);

    canvas.width = 1024.0f;
    host.advance(1.0 / 60.0);
    REQUIRE(hero->running());
    REQUIRE(hero->width() == 1024.0f);
    REQUIRE(host.listenerCount() == 5);

    SECTION("stop before the canvas settles cancels the retry")
    {
        hero->stop();
        canvas.width = 0.0f;
        hero->start();
        hero->stop();
        REQUIRE(host.pendingFrames() == 0);
    }
}

TEST_CASE("the first frame already shows the greeting", "[system][font]")
{
    if (!testFontAvailable()) {
        WARN("font not installed, skipping: " << testFontPath());
        return;
    }

    FakeHost host;
    FakeCanvas canvas;
    std::unique_ptr<ParticleLifeSystem> hero = createParticleLifeSystem(canvas, host, smallConfig());
    hero->start();

    const Particles& particles = hero->particles();
    REQUIRE_FALSE(hero->shape().targets.empty());
    REQUIRE(particles.hasTarget.all());
    REQUIRE((particles.posX - particles.targetX).abs().maxCoeff() == 0.0f);
    REQUIRE((particles.posY - particles.targetY).abs().maxCoeff() == 0.0f);

    // holding keeps them put
    host.run(1.0, 1.0 / 60.0);
    REQUIRE((hero->particles().posX - hero->particles().targetX).abs().maxCoeff() < arrivalRadius + 0.5f);
    REQUIRE((hero->particles().posY - hero->particles().targetY).abs().maxCoeff() < arrivalRadius + 0.5f);
}

TEST_CASE("hiding the page pauses the timeline", "[system]")
{
    FakeHost host;
    FakeCanvas canvas;
    std::unique_ptr<ParticleLifeSystem> hero = createParticleLifeSystem(canvas, host, smallConfig());
    hero->start();
    host.run(1.0, 1.0 / 60.0);

    const double elapsed = hero->getModeElapsedTime();
    const double progress = hero->getProgress();
    const Mode mode = hero->timeline().mode;

    host.setHidden(true);
    host.clock += 100.0;
    host.run(1.0, 1.0 / 60.0);
    REQUIRE(host.pendingFrames() == 1);
    REQUIRE(hero->getModeElapsedTime() == Approx(elapsed));
    REQUIRE(hero->getProgress() == Approx(progress));
    REQUIRE(hero->timeline().mode == mode);

    host.setHidden(false);
    REQUIRE(hero->getModeElapsedTime() == Approx(elapsed));
    REQUIRE(hero->getProgress() == Approx(progress));
    REQUIRE(hero->timeline().mode == mode);

    host.advance(0.5);
    REQUIRE(hero->getModeElapsedTime() == Approx(elapsed + 0.5));
}

TEST_CASE("the intro plays out then the swarm runs free", "[system]")
{
    FakeHost host;
    FakeCanvas canvas;
    const HeroConfig config = smallConfig();
    std::unique_ptr<ParticleLifeSystem> hero = createParticleLifeSystem(canvas, host, config);
    hero->start();

    const double total = introDuration(config.messages, false);
    REQUIRE(total == Approx(50.0));

    double lastProgress = 0.0;
    bool sawBalloon = false;
    bool sawForming = false;
    while (!hero->isReady()) {
        host.advance(0.25);
        const double progress = hero->getProgress();
        REQUIRE(progress >= lastProgress);
        lastProgress = progress;
        sawBalloon = sawBalloon || hero->timeline().mode == Mode::BalloonRising;
        sawForming = sawForming || hero->timeline().mode == Mode::Forming;
        REQUIRE(host.clock < 100.0 + total + 1.0);
    }
    REQUIRE(sawBalloon);
    REQUIRE(sawForming);
    REQUIRE(hero->timeline().messageIndex == 2);

    host.run(rerollInterval + 15.0, 0.25);
    REQUIRE(isFreeRunning(hero->timeline(), config.messages));
    REQUIRE(hero->timeline().mode == Mode::ParticleLife);
    REQUIRE(hero->getProgress() == 1.0);

    const Particles& particles = hero->particles();
    REQUIRE_FALSE(particles.hasTarget.any());
    REQUIRE(particles.posX.allFinite());
    REQUIRE(particles.posX.minCoeff() >= 0.0f);
    REQUIRE(particles.posX.maxCoeff() < hero->width());
    REQUIRE(particles.posY.minCoeff() >= 0.0f);
    REQUIRE(particles.posY.maxCoeff() < hero->height());
}

TEST_CASE("pointer follows host events while running", "[system]")
{
    FakeHost host;
    FakeCanvas canvas;
    std::unique_ptr<ParticleLifeSystem> hero = createParticleLifeSystem(canvas, host, smallConfig());
    hero->start();

    HostEvent move { HostEvent::Kind::PointerMove };
    move.position = Eigen::Vector2f(200.0f, 150.0f);
    host.dispatch(move);
    REQUIRE(hero->pointerActive());
    host.dispatch(HostEvent { HostEvent::Kind::PointerLeave });
    REQUIRE_FALSE(hero->pointerActive());

    HostEvent touch { HostEvent::Kind::TouchMove };
    touch.position = Eigen::Vector2f(20.0f, 15.0f);
    host.dispatch(touch);
    REQUIRE(hero->pointerActive());
    host.dispatch(HostEvent { HostEvent::Kind::TouchEnd });
    REQUIRE_FALSE(hero->pointerActive());

    hero->stop();
    host.dispatch(move);
    REQUIRE_FALSE(hero->pointerActive());
}

TEST_CASE("resizing", "[system]")
{
    FakeHost host;
    FakeCanvas canvas;
    canvas.ratio = 2.0f;
    std::unique_ptr<ParticleLifeSystem> hero = createParticleLifeSystem(canvas, host, smallConfig());
    hero->start();
    REQUIRE(canvas.backingWidth == 2560);
    REQUIRE(canvas.backingHeight == 1440);
    host.advance(1.0 / 60.0);
    REQUIRE(canvas.lastScale == 2.0f);

    SECTION("small changes keep the current targets")
    {
        const Eigen::ArrayXf before = hero->particles().targetX;
        canvas.width = 1260.0f;
        hero->resize();
        REQUIRE(hero->width() == 1260.0f);
        REQUIRE((hero->particles().targetX == before).all());
    }

    SECTION("big changes resample the held message for the new plane")
    {
        if (!testFontAvailable()) {
            WARN("font not installed, skipping: " << testFontPath());
            return;
        }
        const float fontSize = hero->shape().fontSize;
        canvas.width = 700.0f;
        canvas.height = 500.0f;
        hero->resize();
        REQUIRE(hero->shape().fontSize < fontSize);
        REQUIRE_FALSE(hero->shape().targets.empty());
        const Particles& particles = hero->particles();
        REQUIRE(particles.targetX.maxCoeff() < 700.0f);
        REQUIRE(particles.targetY.maxCoeff() < 500.0f);
        REQUIRE(particles.posX.maxCoeff() < 700.0f);
        REQUIRE(particles.posY.maxCoeff() < 500.0f);
    }

    SECTION("zero sized canvases are ignored")
    {
        canvas.width = 0.0f;
        hero->resize();
        REQUIRE(hero->width() == 1280.0f);
    }
}

TEST_CASE("unusual configurations", "[system]")
{
    FakeHost host;
    FakeCanvas canvas;
    HeroConfig config = smallConfig();

    SECTION("missing font still animates")
    {
        config.fontPath = "/nonexistent/font.ttf";
        std::unique_ptr<ParticleLifeSystem> hero = createParticleLifeSystem(canvas, host, config);
        hero->start();
        REQUIRE(hero->running());
        REQUIRE(hero->particles().size() == config.desktopParticles);
        REQUIRE(hero->shape().targets.empty());
        host.run(60.0, 0.25);
        REQUIRE(hero->isReady());
        REQUIRE(hero->timeline().mode == Mode::ParticleLife);
        REQUIRE(hero->particles().posX.allFinite());
    }

    SECTION("no messages runs free immediately")
    {
        config.messages.clear();
        std::unique_ptr<ParticleLifeSystem> hero = createParticleLifeSystem(canvas, host, config);
        hero->start();
        REQUIRE(hero->timeline().mode == Mode::ParticleLife);
        REQUIRE(hero->isReady());
        REQUIRE(hero->particles().size() == config.desktopParticles);
    }

    SECTION("explosion intro starts from the center")
    {
        config.beginWithExplosion = true;
        std::unique_ptr<ParticleLifeSystem> hero = createParticleLifeSystem(canvas, host, config);
        hero->start();
        REQUIRE(hero->timeline().mode == Mode::Explosion);
        const Particles& particles = hero->particles();
        REQUIRE((particles.posX - 640.0f).abs().maxCoeff() <= 720.0f * 0.05f + 0.01f);
        host.run(explosionDuration + 0.2, 0.1);
        REQUIRE(hero->timeline().mode == Mode::ParticleLife);
    }

    SECTION("narrow canvases use the mobile population")
    {
        config.fontPath = "/nonexistent/font.ttf";
        canvas.width = 400.0f;
        std::unique_ptr<ParticleLifeSystem> hero = createParticleLifeSystem(canvas, host, config);
        hero->start();
        REQUIRE(hero->particles().size() == config.mobileParticles);
    }
}

TEST_CASE("progress freezes once stopped", "[system]")
{
    FakeHost host;
    FakeCanvas canvas;
    std::unique_ptr<ParticleLifeSystem> hero = createParticleLifeSystem(canvas, host, smallConfig());
    REQUIRE(hero->getModeElapsedTime() == 0.0);
    hero->start();
    host.run(3.0, 0.25);

    hero->stop();
    const double progress = hero->getProgress();
    const double elapsed = hero->getModeElapsedTime();
    REQUIRE(progress > 0.0);

    host.clock += 500.0;
    REQUIRE(hero->getProgress() == progress);
    REQUIRE(hero->getModeElapsedTime() == elapsed);
    REQUIRE_FALSE(hero->isReady());

    // a fresh start begins a fresh intro
    hero->start();
    REQUIRE(hero->getProgress() == 0.0);
}

TEST_CASE("a picture can take the place of the text", "[system][image]")
{
    FakeHost host;
    FakeCanvas canvas;
    std::unique_ptr<ParticleLifeSystem> hero = createParticleLifeSystem(canvas, host, smallConfig());
    hero->start();

    Image image = GenImageColor(40, 40, BLANK);
    ImageDrawRectangle(&image, 10, 10, 20, 20, typeColors[8]);
    const Rectangle bounds { 500.0f, 200.0f, 200.0f, 200.0f };

    REQUIRE(hero->setImageTargets(image, bounds));
    REQUIRE(hero->shape().targets.size() == 100);
    REQUIRE_FALSE(hero->balloon().active);

    const Particles& particles = hero->particles();
    REQUIRE(particles.hasTarget.all());
    REQUIRE(particles.targetX.minCoeff() >= 550.0f);
    REQUIRE(particles.targetX.maxCoeff() <= 645.0f);
    REQUIRE(particles.targetY.minCoeff() >= 250.0f);
    REQUIRE(particles.targetY.maxCoeff() <= 345.0f);
    for (const ShapeTarget& target : hero->shape().targets)
        REQUIRE(target.type == 8);

    // holding pulls everyone into the picture
    host.run(3.0, 1.0 / 60.0);
    REQUIRE(hero->timeline().mode == Mode::Holding);
    int arrived = 0;
    for (int i = 0; i < particles.size(); i++)
        if (std::abs(particles.posX[i] - particles.targetX[i]) < 6.0f && std::abs(particles.posY[i] - particles.targetY[i]) < 6.0f)
            arrived++;
    REQUIRE(arrived > particles.size() * 4 / 5);

    SECTION("an empty picture leaves the targets alone")
    {
        const Eigen::ArrayXf before = particles.targetX;
        Image blank = GenImageColor(8, 8, BLANK);
        REQUIRE_FALSE(hero->setImageTargets(blank, bounds));
        REQUIRE((hero->particles().targetX == before).all());
        UnloadImage(blank);
    }

    UnloadImage(image);
}

TEST_CASE("a big resize relaunches a rising balloon on the new layout", "[system][font]")
{
    if (!testFontAvailable()) {
        WARN("font not installed, skipping: " << testFontPath());
        return;
    }

    FakeHost host;
    FakeCanvas canvas;
    HeroConfig config = smallConfig();
    // balloon message first, its short hold is over after 2 seconds
    config.messages = { { "a bikepacker", "bikepacker" }, { "ok", "" } };
    std::unique_ptr<ParticleLifeSystem> hero = createParticleLifeSystem(canvas, host, config);
    hero->start();
    host.run(balloonHoldingDuration + balloonRisingDuration * 0.5, 0.1);
    REQUIRE(hero->timeline().mode == Mode::BalloonRising);
    REQUIRE(hero->balloon().active);

    canvas.width = 600.0f;
    canvas.height = 400.0f;
    hero->resize();
    host.advance(1.0 / 60.0);

    const BalloonFlight& flight = hero->balloon();
    REQUIRE(flight.active);
    REQUIRE(flight.start.x() < 600.0f);
    const Particles& particles = hero->particles();
    for (int recruit : flight.recruits) {
        REQUIRE(particles.targetX[recruit] >= 0.0f);
        REQUIRE(particles.targetX[recruit] < 600.0f);
        REQUIRE(particles.targetY[recruit] >= 0.0f);
        REQUIRE(particles.targetY[recruit] < 400.0f);
    }
}

// largest per-axis distance between where particles are and where they were drawn
static float drawnOffset(const FakeCanvas& canvas, const Particles& particles)
{
    REQUIRE(static_cast<int>(canvas.drawn.size()) == particles.size());
    float largest = 0.0f;
    for (int i = 0; i < particles.size(); i++) {
        largest = std::max(largest, std::abs(canvas.drawn[i].x() - particles.posX[i]));
        largest = std::max(largest, std::abs(canvas.drawn[i].y() - particles.posY[i]));
    }
    return largest;
}

TEST_CASE("the first hold shimmers in over its second half", "[system][font]")
{
    if (!testFontAvailable()) {
        WARN("font not installed, skipping: " << testFontPath());
        return;
    }

    FakeHost host;
    FakeCanvas canvas;
    HeroConfig config = smallConfig();
    config.messages = { { "Hi", "" }, { "ok", "" } };
    std::unique_ptr<ParticleLifeSystem> hero = createParticleLifeSystem(canvas, host, config);
    hero->start();
    const Particles& particles = hero->particles();

    // first half: drawn exactly where they are
    host.advance(1.0);
    REQUIRE(drawnOffset(canvas, particles) == 0.0f);
    host.advance(0.9);
    REQUIRE(drawnOffset(canvas, particles) == 0.0f);

    // a quarter of the way into the ramp
    host.advance(0.6);
    const float early = drawnOffset(canvas, particles);
    REQUIRE(early > 0.0f);
    REQUIRE(early <= holdJitterAmplitude * 0.25f + 1e-4f);

    // nearly at full amplitude
    host.advance(1.4);
    REQUIRE(hero->timeline().mode == Mode::Holding);
    const float late = drawnOffset(canvas, particles);
    REQUIRE(late > holdJitterAmplitude * 0.5f);
    REQUIRE(late <= holdJitterAmplitude * 0.95f + 1e-4f);

    // same time, same picture
    host.setHidden(true);
    host.advance(0.5);
    const std::vector<Eigen::Vector2f> frozen = canvas.drawn;
    host.advance(0.5);
    REQUIRE(canvas.drawn == frozen);
    host.setHidden(false);

    // later holds stay still
    bool checked = false;
    for (int frame = 0; frame < 200 && !checked; frame++) {
        host.advance(0.25);
        const Timeline& timeline = hero->timeline();
        if (timeline.mode == Mode::Holding && !timeline.firstHold && hero->getModeElapsedTime() > holdingDuration * 0.5) {
            REQUIRE(drawnOffset(canvas, particles) == 0.0f);
            checked = true;
        }
    }
    REQUIRE(checked);
}
