// SdlInputState.h

#pragma once
#include "IInputState.h"

class SdlInputState : public IInputState {
public:
    glm::vec2 pointerPosition() const override;
    bool isModifierDown() const override;
    uint32_t ticksMs() const override;
};
