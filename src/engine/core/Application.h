// Application.h

#pragma once

#include "SystemRegistry.h"
#include "SdlInputState.h"
#include "../events/EventManager.h"
#include "../../game/GameConfig.h"
#include <memory>
#include <vector>
#include <SDL2/SDL.h>

class Window;
class ActivityFeed;
class TableRenderer;
class TableInteractionSystem;
class TableActivityLog;
struct TableScene;

class Application {
public:
    explicit Application(const GameConfigData& config);
    ~Application();
    void run();

private:
    void init();
    void spawnInitialObjects();
    void dispatch(const SDL_Event& event);
    void render();
    void shutdown();

    GameConfigData config;
    bool running = false;

    std::unique_ptr<Window> window;
    std::unique_ptr<TableScene> scene;
    std::unique_ptr<TableRenderer> tableRenderer;
    std::unique_ptr<ActivityFeed> activityFeed;
    std::unique_ptr<TableActivityLog> activityLog;
    SdlInputState input;

    std::shared_ptr<TableInteractionSystem> interaction;
    std::vector<EventManager::SubscriptionId> subscriptions;
};
