// TableEvents.h

#pragma once
#include "Event.h"
#include <string>

struct CardDrawnEvent : public Event {
    int cardId;
    std::string label;
    size_t remaining;

    CardDrawnEvent(int id, const std::string& label, size_t remaining)
        : Event(EventType::CardDrawn),
          cardId(id), label(label), remaining(remaining) {}

    std::string toString() const override {
        return "CardDrawn: " + label + " (" + std::to_string(remaining) + " left)";
    }
};

struct DeckExhaustedEvent : public Event {
    int deckId;

    explicit DeckExhaustedEvent(int id)
        : Event(EventType::DeckExhausted), deckId(id) {}

    std::string toString() const override {
        return "DeckExhausted: deck " + std::to_string(deckId);
    }
};

struct CardReturnedToDeckEvent : public Event {
    std::string label;
    size_t deckSize;

    CardReturnedToDeckEvent(const std::string& label, size_t deckSize)
        : Event(EventType::CardReturnedToDeck),
          label(label), deckSize(deckSize) {}

    std::string toString() const override {
        return "CardReturnedToDeck: " + label + " (" + std::to_string(deckSize) + " in deck)";
    }
};
