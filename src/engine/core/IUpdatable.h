// IUpdatable.h

#pragma once

// Anything the SystemRegistry ticks once per fixed step.
class IUpdatable {
public:
    virtual ~IUpdatable() = default;
    virtual void update(float deltaTime) = 0;
};
