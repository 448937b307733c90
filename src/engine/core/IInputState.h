// IInputState.h

#pragma once
#include <cstdint>
#include <glm/glm.hpp>

// Device state the systems poll on demand instead of tracking events.
class IInputState {
public:
    virtual ~IInputState() = default;

    virtual glm::vec2 pointerPosition() const = 0;   // screen pixels
    virtual bool isModifierDown() const = 0;         // Ctrl
    virtual uint32_t ticksMs() const = 0;            // monotonic
};
