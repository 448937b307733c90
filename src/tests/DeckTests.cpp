#include <gtest/gtest.h>
#include <algorithm>
#include <map>
#include <string>
#include <vector>

#include "../game/Deck.h"

TEST(Deck, DrawLastCardEmptiesDeck)
{
    Deck deck({"K♠"}, 7u);
    auto card = deck.draw();
    ASSERT_TRUE(card.has_value());
    EXPECT_EQ(*card, "K♠");
    EXPECT_TRUE(deck.isEmpty());
    EXPECT_FALSE(deck.draw().has_value());
}

TEST(Deck, DrawsFromTheTopUntilEmpty)
{
    std::vector<std::string> cards{"A♥", "2♥", "3♥", "4♥", "5♥"};
    Deck deck(cards, 11u);

    for (size_t i = 0; i < cards.size(); ++i)
    {
        auto card = deck.draw();
        ASSERT_TRUE(card.has_value());
        EXPECT_EQ(*card, cards[cards.size() - 1 - i]);
        EXPECT_EQ(deck.size(), cards.size() - 1 - i);
    }
    EXPECT_TRUE(deck.isEmpty());
    EXPECT_EQ(deck.peek(), nullptr);
}

TEST(Deck, ShuffleInAddsExactlyOneCard)
{
    Deck deck;
    deck.shuffleIn("J♦");
    ASSERT_EQ(deck.size(), 1u);
    ASSERT_NE(deck.peek(), nullptr);
    EXPECT_EQ(*deck.peek(), "J♦");

    deck.shuffleIn("Q♦");
    EXPECT_EQ(deck.size(), 2u);
}

TEST(Deck, ShuffleInReachesEveryPosition)
{
    std::map<size_t, int> hits;
    for (unsigned int seed = 1; seed <= 400; ++seed)
    {
        Deck deck({"a", "b", "c"}, seed);
        deck.shuffleIn("x");
        const auto& cards = deck.getCards();
        for (size_t i = 0; i < cards.size(); ++i)
        {
            if (cards[i] == "x") ++hits[i];
        }
    }
    ASSERT_EQ(hits.size(), 4u);
    for (const auto& [pos, count] : hits)
    {
        // Uniform would be 100 per slot.
        EXPECT_GT(count, 50) << "position " << pos;
    }
}

TEST(Deck, ShuffleKeepsComposition)
{
    std::vector<std::string> cards{"A", "B", "C", "D", "E", "F"};
    Deck deck(cards, 5u);
    deck.shuffle();

    auto shuffled = deck.getCards();
    std::sort(shuffled.begin(), shuffled.end());
    EXPECT_EQ(shuffled, cards);
}

TEST(Deck, ThicknessTracksCount)
{
    EXPECT_EQ(Deck::thicknessFor(0), 0);
    EXPECT_EQ(Deck::thicknessFor(1), 1);
    EXPECT_EQ(Deck::thicknessFor(6), 1);
    EXPECT_EQ(Deck::thicknessFor(7), 2);
    EXPECT_EQ(Deck::thicknessFor(54), 9);
    EXPECT_EQ(Deck::thicknessFor(500), 9);

    Deck deck({"a", "b", "c", "d", "e", "f", "g"}, 1u);
    EXPECT_EQ(deck.getThickness(), 2);
    deck.draw();
    EXPECT_EQ(deck.getThickness(), 1);
}
