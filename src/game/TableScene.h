// TableScene.h
#pragma once

#include "TableWorld.h"
#include "SpatialGrid.h"
#include "GameConfig.h"
#include "systems/HandZone.h"
#include "../engine/render/Camera2D.h"

// Everything the interaction and render passes operate on.
struct TableScene {
    TableWorld  world;
    SpatialGrid grid;
    Camera2D    camera;
    HandZone    hand;

    explicit TableScene(const GameConfigData& cfg)
        : world({cfg.cardWidth, cfg.cardHeight}, {cfg.spanCols, cfg.spanRows}),
          grid(cfg.cellSize),
          camera(static_cast<float>(cfg.width), static_cast<float>(cfg.height),
                 cfg.minZoom, cfg.maxZoom, cfg.zoomStep),
          hand(HandSettings::fromConfig(cfg))
    {}
};
