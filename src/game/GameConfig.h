// GameConfig.h

#pragma once
#include <string>

struct GameConfigData {
    // display
    int width = 1280;
    int height = 720;
    int fps = 60;
    bool fullscreen = false;
    std::string title = "CCCG - Collectible Children Card Game";

    // grid
    float cellSize = 48.0f;
    float dashLength = 10.0f;
    float gapLength = 6.0f;

    // cards
    float cardWidth = 90.0f;
    float cardHeight = 132.0f;
    int spanCols = 2;
    int spanRows = 3;
    int renderScale = 4;

    // camera
    float minZoom = 0.25f;
    float maxZoom = 2.0f;
    float zoomStep = 1.2f;

    // drag
    float liftScale = 1.15f;
    float shadowLifetime = 0.25f;
    float shadowMinDistance = 8.0f;

    // hand (ratios of the screen size)
    float handMarginRatio = 0.08f;
    float handBottomMarginRatio = 0.0f;
    float handArcHeightRatio = 0.15f;
    float handHoverLiftRatio = 0.20f;
    float handZoneHeightRatio = 0.25f;
    float handScale = 1.5f;
    float handHoverScale = 1.5f;
    float handHangDepthRatio = 0.40f;

    // input
    int doubleClickMs = 400;
    int escapeDoublePressMs = 500;

    // fonts
    std::string fontPath = "assets/fonts/DejaVuSans.ttf";
    int fontSize = 22;
    std::string cardFontPath = "assets/fonts/DejaVuSans.ttf";
    std::string cardBoldFontPath = "assets/fonts/DejaVuSans-Bold.ttf";

    // deck
    std::string deckConfigPath = "config/deck.json";
    unsigned int deckSeed = 0;   // 0 = random
};

class GameConfig {
public:
    static constexpr const char* kDefaultPath = "scripts/config/game.lua";

    // Loads once (from setSource() or the default path) and caches.
    static const GameConfigData& get();

    // Must run before the first get() to take effect.
    static void setSource(const std::string& path);

    // Reads `path` over the built-in defaults. Missing keys keep their
    // defaults; a missing or broken file logs and returns false.
    static bool loadFrom(const std::string& path, GameConfigData& out);
};
