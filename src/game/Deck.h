// Deck.h

#pragma once
#include <optional>
#include <random>
#include <string>
#include <vector>

// Face-down stack of card labels. The back of the vector is the top.
class Deck {
public:
    explicit Deck(std::vector<std::string> cards = {}, unsigned int seed = std::random_device{}());

    std::optional<std::string> draw();
    void shuffleIn(const std::string& label);
    void shuffle();

    bool isEmpty() const { return cards.empty(); }
    size_t size() const { return cards.size(); }
    const std::string* peek() const { return cards.empty() ? nullptr : &cards.back(); }
    const std::vector<std::string>& getCards() const { return cards; }

    // Number of edge layers drawn under the deck face.
    int getThickness() const { return thickness; }
    static int thicknessFor(size_t count);

private:
    void updateThickness();

    std::vector<std::string> cards;
    std::mt19937 rng;
    int thickness = 0;
};
