// SdlInputState.cpp

#include "SdlInputState.h"
#include <SDL2/SDL.h>

glm::vec2 SdlInputState::pointerPosition() const {
    int x = 0, y = 0;
    SDL_GetMouseState(&x, &y);
    return glm::vec2(static_cast<float>(x), static_cast<float>(y));
}

bool SdlInputState::isModifierDown() const {
    return (SDL_GetModState() & KMOD_CTRL) != 0;
}

uint32_t SdlInputState::ticksMs() const {
    return SDL_GetTicks();
}
