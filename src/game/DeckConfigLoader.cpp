// DeckConfigLoader.cpp
#include "DeckConfigLoader.h"
#include "LogBus.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <sstream>

namespace {
    std::vector<std::string> stringList(const nlohmann::json& data, const char* key,
                                        const std::vector<std::string>& fallback) {
        if (!data.contains(key)) return fallback;
        const auto& arr = data[key];
        if (!arr.is_array()) return fallback;

        std::vector<std::string> out;
        for (const auto& item : arr) {
            if (item.is_string()) out.push_back(item.get<std::string>());
        }
        return out;
    }
}

std::vector<std::string> DeckDefinition::buildCards() const {
    std::vector<std::string> cards;
    cards.reserve(suits.size() * ranks.size() + extras.size());
    for (const auto& suit : suits) {
        for (const auto& rank : ranks) {
            cards.push_back(rank + suit);
        }
    }
    cards.insert(cards.end(), extras.begin(), extras.end());
    return cards;
}

DeckConfigLoader& DeckConfigLoader::getInstance() {
    static DeckConfigLoader instance;
    return instance;
}

DeckConfigLoader::DeckConfigLoader()
    : definition(standardDefinition())
{}

DeckDefinition DeckConfigLoader::standardDefinition() {
    DeckDefinition def;
    def.suits  = {"♠", "♥", "♦", "♣"};
    def.ranks  = {"A", "2", "3", "4", "5", "6", "7", "8", "9", "10", "J", "Q", "K"};
    def.extras = {"Joker", "Joker"};
    def.shuffle = true;
    return def;
}

bool DeckConfigLoader::loadConfig(const std::string& filePath) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        LogBus::error("[DeckConfigLoader] Failed to open: " + filePath + " (using standard deck)");
        return false;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return loadFromString(ss.str());
}

bool DeckConfigLoader::loadFromString(const std::string& text) {
    nlohmann::json data;
    try {
        data = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        LogBus::error(std::string("[DeckConfigLoader] Parse error: ") + e.what() + " (using standard deck)");
        return false;
    }
    if (!data.is_object()) {
        LogBus::error("[DeckConfigLoader] Deck definition must be an object");
        return false;
    }

    const DeckDefinition standard = standardDefinition();
    DeckDefinition def;
    def.suits   = stringList(data, "suits", standard.suits);
    def.ranks   = stringList(data, "ranks", standard.ranks);
    def.extras  = stringList(data, "extras", standard.extras);
    def.shuffle = data.value("shuffle", true);

    definition = std::move(def);
    std::cout << "[DeckConfigLoader] Deck definition has "
              << definition.buildCards().size() << " cards\n";
    return true;
}
