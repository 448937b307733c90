// TableActivityLog.h
#pragma once

#include "../engine/events/EventManager.h"
#include <vector>

// Turns deck events into activity feed lines through LogBus.
class TableActivityLog {
public:
    TableActivityLog();
    ~TableActivityLog();

    TableActivityLog(const TableActivityLog&) = delete;
    TableActivityLog& operator=(const TableActivityLog&) = delete;

private:
    std::vector<EventManager::SubscriptionId> subscriptions;
};
