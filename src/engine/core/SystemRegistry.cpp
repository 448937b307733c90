// SystemRegistry.cpp

#include "SystemRegistry.h"

SystemRegistry& SystemRegistry::getInstance() {
    static SystemRegistry instance;
    return instance;
}

void SystemRegistry::registerSystem(std::shared_ptr<IUpdatable> system) {
    if (!system) return;
    systems.push_back(std::move(system));
}

void SystemRegistry::updateAll(float deltaTime) {
    // Index loop: a system may register another one while updating.
    for (size_t i = 0; i < systems.size(); ++i) {
        systems[i]->update(deltaTime);
    }
}

void SystemRegistry::clear() {
    systems.clear();
}
