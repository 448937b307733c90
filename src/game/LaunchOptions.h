// LaunchOptions.h
#pragma once

#include <optional>
#include <string>

struct GameConfigData;

// Command-line overrides, applied on top of the Lua config.
struct LaunchOptions {
    std::optional<int> width;
    std::optional<int> height;
    std::optional<int> fps;
    std::optional<bool> fullscreen;
    std::optional<std::string> configPath;
    bool showHelp = false;

    // Returns false and fills `error` on an unknown flag or a bad value.
    static bool parse(int argc, const char* const* argv, LaunchOptions& out, std::string& error);
    static std::string usage(const std::string& program);

    void applyTo(GameConfigData& cfg) const;
};
