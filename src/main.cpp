// main.cpp

#include "engine/core/Application.h"
#include "game/GameConfig.h"
#include "game/LaunchOptions.h"
#include <iostream>

int main(int argc, char* argv[]) {
    LaunchOptions options;
    std::string error;
    if (!LaunchOptions::parse(argc, argv, options, error)) {
        std::cerr << "[Main] " << error << "\n" << LaunchOptions::usage(argv[0]);
        return EXIT_FAILURE;
    }
    if (options.showHelp) {
        std::cout << LaunchOptions::usage(argv[0]);
        return EXIT_SUCCESS;
    }

    if (options.configPath) GameConfig::setSource(*options.configPath);

    GameConfigData config = GameConfig::get();
    options.applyTo(config);

    Application app(config);
    app.run();
    return EXIT_SUCCESS;
}
