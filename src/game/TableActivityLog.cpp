// TableActivityLog.cpp
#include "TableActivityLog.h"
#include "LogBus.h"
#include "../engine/events/TableEvents.h"

TableActivityLog::TableActivityLog() {
    auto& events = EventManager::getInstance();

    subscriptions.push_back(events.subscribe(EventType::CardDrawn, [](const Event& e) {
        const auto& drawn = static_cast<const CardDrawnEvent&>(e);
        LogBus::info("Drew " + drawn.label + " (" + std::to_string(drawn.remaining) + " left)");
    }));

    subscriptions.push_back(events.subscribe(EventType::DeckExhausted, [](const Event&) {
        LogBus::colored("The deck is empty", {1.0f, 0.6f, 0.2f});
    }));

    subscriptions.push_back(events.subscribe(EventType::CardReturnedToDeck, [](const Event& e) {
        const auto& returned = static_cast<const CardReturnedToDeckEvent&>(e);
        LogBus::info("Shuffled " + returned.label + " back into the deck ("
                     + std::to_string(returned.deckSize) + " cards)");
    }));
}

TableActivityLog::~TableActivityLog() {
    auto& events = EventManager::getInstance();
    for (auto id : subscriptions) events.unsubscribe(id);
}
