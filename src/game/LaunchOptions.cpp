// LaunchOptions.cpp
#include "LaunchOptions.h"
#include "GameConfig.h"
#include <args.hxx>
#include <sstream>

namespace {
    constexpr int kMaxValue = 100000;

    // Flags are declared on one parser so parse() and usage() agree.
    struct LaunchParser {
        args::ArgumentParser parser{"CCCG card table", "Overrides are applied on top of the Lua config."};
        args::HelpFlag help{parser, "help", "Show this help", {'h', "help"}};
        args::ValueFlag<int> width{parser, "px", "Window width", {"width"}};
        args::ValueFlag<int> height{parser, "px", "Window height", {"height"}};
        args::ValueFlag<int> fps{parser, "n", "Frame rate cap", {"fps"}};
        args::ValueFlag<std::string> config{parser, "path", "Lua config file", {"config"}};
        args::ActionFlag fullscreen;
        args::ActionFlag windowed;

        // Both display flags write the same optional in command-line order.
        explicit LaunchParser(std::optional<bool>& displayMode)
            : fullscreen(parser, "fullscreen", "Start fullscreen", {"fullscreen"},
                         [&displayMode]() { displayMode = true; })
            , windowed(parser, "windowed", "Start in a window", {"windowed"},
                       [&displayMode]() { displayMode = false; })
        {
            parser.Prog("cccg");
        }
    };

    bool readPositive(args::ValueFlag<int>& flag, const char* name,
                      std::optional<int>& out, std::string& error) {
        if (!flag) return true;
        const int v = args::get(flag);
        if (v <= 0 || v > kMaxValue) {
            error = std::string("invalid value for --") + name + ": " + std::to_string(v);
            return false;
        }
        out = v;
        return true;
    }
}

bool LaunchOptions::parse(int argc, const char* const* argv, LaunchOptions& out, std::string& error) {
    LaunchParser cli(out.fullscreen);
    try {
        cli.parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        out.showHelp = true;
        return true;
    } catch (const args::Error& e) {
        error = e.what();
        return false;
    }

    if (!readPositive(cli.width, "width", out.width, error)) return false;
    if (!readPositive(cli.height, "height", out.height, error)) return false;
    if (!readPositive(cli.fps, "fps", out.fps, error)) return false;
    if (cli.config) out.configPath = args::get(cli.config);
    return true;
}

std::string LaunchOptions::usage(const std::string& program) {
    std::optional<bool> unused;
    LaunchParser cli(unused);
    cli.parser.Prog(program);
    std::ostringstream out;
    out << cli.parser;
    return out.str();
}

void LaunchOptions::applyTo(GameConfigData& cfg) const {
    if (width)      cfg.width = *width;
    if (height)     cfg.height = *height;
    if (fps)        cfg.fps = *fps;
    if (fullscreen) cfg.fullscreen = *fullscreen;
}
