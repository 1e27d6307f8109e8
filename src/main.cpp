#include "hero.hpp"
#include "raylib_host.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>

static void printUsage(const char* program)
{
    std::printf("usage: %s [--font path.ttf] [--image picture.png] [--explosion] [--seed n] [--width w] [--height h] [--fullscreen] [--quiet]\n",
        program);
}

int main(int argc, char** argv)
{
    HeroConfig config = defaultConfig();
    int windowWidth = 1280;
    int windowHeight = 720;
    bool fullscreen = false;
    std::string imagePath;
    int logLevel = LOG_INFO;

    for (int i = 1; i < argc; i++) {
        const bool hasValue = i + 1 < argc;
        if (std::strcmp(argv[i], "--font") == 0 && hasValue) {
            config.fontPath = argv[++i];
        } else if (std::strcmp(argv[i], "--image") == 0 && hasValue) {
            imagePath = argv[++i];
        } else if (std::strcmp(argv[i], "--explosion") == 0) {
            config.beginWithExplosion = true;
        } else if (std::strcmp(argv[i], "--seed") == 0 && hasValue) {
            config.seed = static_cast<unsigned int>(std::strtoul(argv[++i], nullptr, 10));
        } else if (std::strcmp(argv[i], "--width") == 0 && hasValue) {
            windowWidth = std::max(1, std::atoi(argv[++i]));
        } else if (std::strcmp(argv[i], "--height") == 0 && hasValue) {
            windowHeight = std::max(1, std::atoi(argv[++i]));
        } else if (std::strcmp(argv[i], "--fullscreen") == 0) {
            fullscreen = true;
        } else if (std::strcmp(argv[i], "--quiet") == 0) {
            logLevel = LOG_NONE;
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            logLevel = LOG_DEBUG;
        } else {
            printUsage(argv[0]);
            return std::strcmp(argv[i], "--help") == 0 ? 0 : 1;
        }
    }

    SetTraceLogLevel(logLevel);
    unsigned int flags = FLAG_WINDOW_RESIZABLE | FLAG_WINDOW_HIGHDPI | FLAG_MSAA_4X_HINT | FLAG_VSYNC_HINT;
    if (fullscreen)
        flags |= FLAG_FULLSCREEN_MODE;
    SetConfigFlags(flags);
    InitWindow(fullscreen ? 0 : windowWidth, fullscreen ? 0 : windowHeight, "Particle Hero");
    SetTargetFPS(60);

    RaylibHost host;
    // near black with a hint of blue, same as the site's dark hero
    RaylibCanvas canvas(Color { 3, 7, 18, 255 });

    std::unique_ptr<ParticleLifeSystem> hero = createParticleLifeSystem(canvas, host, config);
    if (!hero) {
        CloseWindow();
        return 1;
    }
    hero->start();

    // a picture formed in the middle of the screen instead of the first message
    if (!imagePath.empty()) {
        Image image = LoadImage(imagePath.c_str());
        if (image.data != nullptr) {
            const float side = std::min(hero->width(), hero->height()) * 0.5f;
            const float scale = side / std::max(image.width, image.height);
            const float width = image.width * scale;
            const float height = image.height * scale;
            const Rectangle bounds { (hero->width() - width) * 0.5f, (hero->height() - height) * 0.5f, width, height };
            if (!hero->setImageTargets(image, bounds))
                TraceLog(LOG_WARNING, "HERO: [%s] has no opaque pixels, keeping the text", imagePath.c_str());
            UnloadImage(image);
        } else {
            TraceLog(LOG_WARNING, "HERO: Failed to load image [%s]", imagePath.c_str());
        }
    }

    while (!WindowShouldClose()) {
        if (IsWindowResized())
            hero->resize();

        BeginDrawing();
        {
            host.pump();

            // thin loader line along the bottom edge until the intro has played, like the page's progress bar
            if (!hero->isReady()) {
                const float progress = static_cast<float>(hero->getProgress());
                DrawRectangle(0, GetScreenHeight() - 2, static_cast<int>(GetScreenWidth() * progress), 2, Fade(RAYWHITE, 0.35f));
            }
        }
        EndDrawing();
    }

    hero->stop();
    hero.reset();
    CloseWindow();
    return 0;
}
