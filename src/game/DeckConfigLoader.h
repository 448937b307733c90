// DeckConfigLoader.h
#pragma once

#include <string>
#include <vector>

struct DeckDefinition {
    std::vector<std::string> suits;
    std::vector<std::string> ranks;
    std::vector<std::string> extras;
    bool shuffle = true;

    // ranks x suits, suit-major, followed by the extras.
    std::vector<std::string> buildCards() const;
};

class DeckConfigLoader {
public:
    static DeckConfigLoader& getInstance();

    // Parses a deck definition; on failure the standard deck stays in place.
    bool loadConfig(const std::string& filePath);
    bool loadFromString(const std::string& text);

    const DeckDefinition& getDefinition() const { return definition; }
    static DeckDefinition standardDefinition();

private:
    DeckConfigLoader();
    DeckDefinition definition;
};
