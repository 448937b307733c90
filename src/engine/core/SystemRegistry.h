// SystemRegistry.h

#pragma once

#include "IUpdatable.h"
#include <vector>
#include <memory>

class SystemRegistry {
public:
    static SystemRegistry& getInstance();

    void registerSystem(std::shared_ptr<IUpdatable> system);
    void updateAll(float deltaTime);
    void clear();

    size_t size() const { return systems.size(); }

private:
    SystemRegistry() = default;
    SystemRegistry(const SystemRegistry&) = delete;
    SystemRegistry& operator=(const SystemRegistry&) = delete;

    std::vector<std::shared_ptr<IUpdatable>> systems;
};
