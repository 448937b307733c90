// Application.cpp

#include "Application.h"
#include "Window.h"

#include "../events/Event.h"
#include "../ui/ActivityFeed.h"
#include "../utils/ShaderLibrary.h"

#include "../../game/TableScene.h"
#include "../../game/TableRenderer.h"
#include "../../game/DeckConfigLoader.h"
#include "../../game/LogBus.h"
#include "../../game/TableActivityLog.h"
#include "../../game/systems/TableInteractionSystem.h"

#include <SDL2/SDL.h>
#include <SDL2/SDL_ttf.h>
#include <glad/glad.h>

#include <iostream>
#include <chrono>
#include <filesystem>
#include <algorithm>
#include <random>

namespace {
    MouseButton toMouseButton(Uint8 b) {
        switch (b) {
            case SDL_BUTTON_LEFT:   return MouseButton::Left;
            case SDL_BUTTON_MIDDLE: return MouseButton::Middle;
            case SDL_BUTTON_RIGHT:  return MouseButton::Right;
            default:                return MouseButton::Other;
        }
    }

    // Card shown next to the deck when the table opens.
    constexpr const char* kStarterCard = "A♠";
    constexpr float kStarterGap = 24.0f;
}

Application::Application(const GameConfigData& config)
    : config(config)
{
    init();
}

Application::~Application() { shutdown(); }

void Application::init() {
    std::cout << "[Init] CWD: " << std::filesystem::current_path() << "\n";

    window = std::make_unique<Window>(config.title, config.width, config.height, config.fullscreen);

    if (!gladLoadGLLoader((GLADloadproc)SDL_GL_GetProcAddress)) {
        std::cerr << "Failed to initialize GLAD\n";
        std::exit(EXIT_FAILURE);
    }

    if (TTF_Init() == -1) {
        std::cerr << "[Application] TTF_Init error: " << TTF_GetError() << "\n";
        std::exit(EXIT_FAILURE);
    }

    int drawW = config.width, drawH = config.height;
    window->getDrawableSize(drawW, drawH);
    glViewport(0, 0, drawW, drawH);
    glDisable(GL_DEPTH_TEST);

    // Attached first so deck config errors reach the screen.
    activityFeed = std::make_unique<ActivityFeed>(config.fontPath, config.fontSize);
    ActivityFeed* feed = activityFeed.get();
    LogBus::attach([feed](const std::string& line, const glm::vec3& rgb, float lifetime) {
        feed->push(line, rgb, lifetime);
    });
    activityLog = std::make_unique<TableActivityLog>();

    DeckConfigLoader::getInstance().loadConfig(config.deckConfigPath);

    scene = std::make_unique<TableScene>(config);
    scene->camera.setScreenSize(static_cast<float>(drawW), static_cast<float>(drawH));

    tableRenderer = std::make_unique<TableRenderer>(config);

    interaction = std::make_shared<TableInteractionSystem>(
        *scene, input, InteractionSettings::fromConfig(config));
    SystemRegistry::getInstance().registerSystem(interaction);

    auto& events = EventManager::getInstance();
    subscriptions.push_back(events.subscribe(EventType::Quit, [this](const Event&) {
        running = false;
    }));

    spawnInitialObjects();

    std::cout << "[Init] Application initialized.\n";
}

void Application::spawnInitialObjects() {
    const auto& def = DeckConfigLoader::getInstance().getDefinition();
    const unsigned int seed = config.deckSeed != 0 ? config.deckSeed : std::random_device{}();

    auto deck = std::make_unique<Deck>(def.buildCards(), seed);
    if (def.shuffle) deck->shuffle();

    const glm::vec2 size = scene->world.getCardSize();

    // Starter card left of the origin, deck right of it.
    ObjectId cardId = scene->world.spawnCard(kStarterCard, {-size.x - kStarterGap * 0.5f, -size.y * 0.5f});
    ObjectId deckId = scene->world.spawnDeck(std::move(deck), {kStarterGap * 0.5f, -size.y * 0.5f});

    if (TableObject* card = scene->world.find(cardId)) scene->grid.snap(*card);
    if (TableObject* d = scene->world.find(deckId)) scene->grid.snap(*d);
}

void Application::dispatch(const SDL_Event& event) {
    auto& events = EventManager::getInstance();

    switch (event.type) {
        case SDL_QUIT: {
            QuitEvent qe;
            events.emit(qe);
            break;
        }
        case SDL_KEYDOWN: {
            if (event.key.repeat) break;
            KeyDownEvent ke(event.key.keysym.sym == SDLK_ESCAPE ? Key::Escape : Key::Other);
            events.emit(ke);
            break;
        }
        case SDL_MOUSEBUTTONDOWN: {
            MouseButtonDownEvent mbe(toMouseButton(event.button.button), event.button.x, event.button.y);
            events.emit(mbe);
            break;
        }
        case SDL_MOUSEBUTTONUP: {
            MouseButtonUpEvent mue(toMouseButton(event.button.button), event.button.x, event.button.y);
            events.emit(mue);
            break;
        }
        case SDL_MOUSEWHEEL: {
            int steps = event.wheel.y;
            if (event.wheel.direction == SDL_MOUSEWHEEL_FLIPPED) steps = -steps;
            if (steps != 0) {
                MouseWheelEvent mwe(steps);
                events.emit(mwe);
            }
            break;
        }
        case SDL_WINDOWEVENT: {
            if (event.window.event == SDL_WINDOWEVENT_SIZE_CHANGED) {
                int w = 0, h = 0;
                window->getDrawableSize(w, h);
                glViewport(0, 0, w, h);
                scene->camera.setScreenSize(static_cast<float>(w), static_cast<float>(h));
            }
            break;
        }
        default: break;
    }
}

void Application::run() {
    std::cout << "[Run] Main loop @ " << config.fps << " Hz...\n";

    using clock = std::chrono::high_resolution_clock;
    auto previous = clock::now();
    double fpsTimer = 0.0;
    int frameCount = 0;
    running = true;
    SDL_Event event;

    const auto frameBudget = std::chrono::duration<double>(1.0 / std::max(1, config.fps));

    while (running) {
        auto frameStart = clock::now();

        // --- Input ---
        while (SDL_PollEvent(&event)) {
            dispatch(event);
        }

        // --- Update (once per frame) ---
        auto now = clock::now();
        double frameDt = std::chrono::duration<double>(now - previous).count();
        frameDt = std::min(frameDt, 0.25);
        previous = now;

        SystemRegistry::getInstance().updateAll(static_cast<float>(frameDt));
        if (activityFeed) activityFeed->update(static_cast<float>(frameDt));

        // --- Render ---
        render();
        window->swap();

        // --- FPS ---
        frameCount++;
        fpsTimer += frameDt;
        if (fpsTimer >= 1.0) {
            std::cout << "[FPS] " << frameCount << "\n";
            frameCount = 0;
            fpsTimer = 0.0;
        }

        auto spent = clock::now() - frameStart;
        if (spent < frameBudget) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(frameBudget - spent);
            if (left.count() > 0) SDL_Delay(static_cast<Uint32>(left.count()));
        }
    }
}

void Application::render() {
    glClearColor(32.0f / 255.0f, 48.0f / 255.0f, 64.0f / 255.0f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);

    if (scene && tableRenderer && interaction) {
        InteractionView view;
        view.dragged = interaction->getDragged();
        view.draggedGroup = interaction->getDraggedGroup();
        view.panning = interaction->isPanning();
        tableRenderer->draw(*scene, view, static_cast<float>(input.ticksMs()) / 1000.0f);
    }

    // Feed overlays everything.
    if (activityFeed && scene) {
        const glm::vec2 screen = scene->camera.getScreenSize();
        activityFeed->render(static_cast<int>(screen.x), static_cast<int>(screen.y));
    }
}

void Application::shutdown() {
    std::cout << "[Shutdown] ...\n";

    auto& events = EventManager::getInstance();
    for (auto id : subscriptions) events.unsubscribe(id);
    subscriptions.clear();

    activityLog.reset();
    LogBus::detach();
    SystemRegistry::getInstance().clear();
    interaction.reset();

    activityFeed.reset();
    tableRenderer.reset();
    scene.reset();

    ShaderLibrary::clear();
    TTF_Quit();
    window.reset();

    std::cout << "[Shutdown] Done.\n";
}
