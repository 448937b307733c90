// Deck.cpp

#include "Deck.h"
#include <algorithm>

namespace {
    constexpr int kCardsPerLayer = 6;
    constexpr int kMaxLayers = 9;
}

Deck::Deck(std::vector<std::string> cards, unsigned int seed)
    : cards(std::move(cards)), rng(seed)
{
    updateThickness();
}

std::optional<std::string> Deck::draw() {
    if (cards.empty()) return std::nullopt;
    std::string top = std::move(cards.back());
    cards.pop_back();
    updateThickness();
    return top;
}

void Deck::shuffleIn(const std::string& label) {
    std::uniform_int_distribution<size_t> pick(0, cards.size());
    cards.insert(cards.begin() + static_cast<std::ptrdiff_t>(pick(rng)), label);
    updateThickness();
}

void Deck::shuffle() {
    std::shuffle(cards.begin(), cards.end(), rng);
}

int Deck::thicknessFor(size_t count) {
    if (count == 0) return 0;
    return std::min(kMaxLayers, 1 + static_cast<int>((count - 1) / kCardsPerLayer));
}

void Deck::updateThickness() {
    thickness = thicknessFor(cards.size());
}
