// GameConfig.cpp

#include "GameConfig.h"
#include "LogBus.h"
#include <sol/sol.hpp>
#include <iostream>

namespace {
    std::string& sourcePath() {
        static std::string path = GameConfig::kDefaultPath;
        return path;
    }
}

void GameConfig::setSource(const std::string& path) {
    sourcePath() = path;
}

const GameConfigData& GameConfig::get() {
    static GameConfigData cfg;
    static bool inited = false;
    if (!inited) {
        loadFrom(sourcePath(), cfg);
        inited = true;
    }
    return cfg;
}

bool GameConfig::loadFrom(const std::string& path, GameConfigData& cfg) {
    sol::state L;
    L.open_libraries(sol::lib::base, sol::lib::table, sol::lib::string, sol::lib::math);

    sol::load_result chunk = L.load_file(path);
    if (!chunk.valid()) {
        sol::error e = chunk;
        LogBus::error("[GameConfig] Failed to load " + path + ": " + e.what());
        return false;
    }

    sol::protected_function_result r = chunk();
    if (!r.valid()) {
        sol::error e = r;
        LogBus::error("[GameConfig] Failed to execute " + path + ": " + e.what());
        return false;
    }

    if (r.get_type() != sol::type::table) {
        LogBus::error("[GameConfig] " + path + " must return a table");
        return false;
    }
    sol::table t = r;

    sol::optional<sol::table> display = t["display"];
    if (display) {
        cfg.width      = display->get_or("width", cfg.width);
        cfg.height     = display->get_or("height", cfg.height);
        cfg.fps        = display->get_or("fps", cfg.fps);
        cfg.fullscreen = display->get_or("fullscreen", cfg.fullscreen);
        cfg.title      = display->get_or("title", cfg.title);
    }
    sol::optional<sol::table> grid = t["grid"];
    if (grid) {
        cfg.cellSize   = grid->get_or("cellSize", cfg.cellSize);
        cfg.dashLength = grid->get_or("dashLength", cfg.dashLength);
        cfg.gapLength  = grid->get_or("gapLength", cfg.gapLength);
    }
    sol::optional<sol::table> card = t["card"];
    if (card) {
        cfg.cardWidth   = card->get_or("width", cfg.cardWidth);
        cfg.cardHeight  = card->get_or("height", cfg.cardHeight);
        cfg.spanCols    = card->get_or("spanCols", cfg.spanCols);
        cfg.spanRows    = card->get_or("spanRows", cfg.spanRows);
        cfg.renderScale = card->get_or("renderScale", cfg.renderScale);
    }
    sol::optional<sol::table> camera = t["camera"];
    if (camera) {
        cfg.minZoom  = camera->get_or("minZoom", cfg.minZoom);
        cfg.maxZoom  = camera->get_or("maxZoom", cfg.maxZoom);
        cfg.zoomStep = camera->get_or("zoomStep", cfg.zoomStep);
    }
    sol::optional<sol::table> drag = t["drag"];
    if (drag) {
        cfg.liftScale         = drag->get_or("liftScale", cfg.liftScale);
        cfg.shadowLifetime    = drag->get_or("shadowLifetime", cfg.shadowLifetime);
        cfg.shadowMinDistance = drag->get_or("shadowMinDistance", cfg.shadowMinDistance);
    }
    sol::optional<sol::table> hand = t["hand"];
    if (hand) {
        cfg.handMarginRatio       = hand->get_or("marginRatio", cfg.handMarginRatio);
        cfg.handBottomMarginRatio = hand->get_or("bottomMarginRatio", cfg.handBottomMarginRatio);
        cfg.handArcHeightRatio    = hand->get_or("arcHeightRatio", cfg.handArcHeightRatio);
        cfg.handHoverLiftRatio    = hand->get_or("hoverLiftRatio", cfg.handHoverLiftRatio);
        cfg.handZoneHeightRatio   = hand->get_or("zoneHeightRatio", cfg.handZoneHeightRatio);
        cfg.handScale             = hand->get_or("scale", cfg.handScale);
        cfg.handHoverScale        = hand->get_or("hoverScale", cfg.handHoverScale);
        cfg.handHangDepthRatio    = hand->get_or("hangDepthRatio", cfg.handHangDepthRatio);
    }
    sol::optional<sol::table> input = t["input"];
    if (input) {
        cfg.doubleClickMs       = input->get_or("doubleClickMs", cfg.doubleClickMs);
        cfg.escapeDoublePressMs = input->get_or("escapeDoublePressMs", cfg.escapeDoublePressMs);
    }
    sol::optional<sol::table> fonts = t["fonts"];
    if (fonts) {
        sol::optional<sol::table> ui = (*fonts)["ui"];
        if (ui) {
            cfg.fontPath = ui->get_or("path", cfg.fontPath);
            cfg.fontSize = ui->get_or("size", cfg.fontSize);
        }
        sol::optional<sol::table> cardFonts = (*fonts)["card"];
        if (cardFonts) {
            cfg.cardFontPath     = cardFonts->get_or("path", cfg.cardFontPath);
            cfg.cardBoldFontPath = cardFonts->get_or("boldPath", cfg.cardBoldFontPath);
        }
    }
    sol::optional<sol::table> deck = t["deck"];
    if (deck) {
        cfg.deckConfigPath = deck->get_or("config", cfg.deckConfigPath);
        cfg.deckSeed       = deck->get_or("seed", cfg.deckSeed);
    }

    std::cout << "[GameConfig] Loaded " << path << "\n";
    return true;
}
