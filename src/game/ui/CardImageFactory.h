// CardImageFactory.h

#pragma once

#include "../TableObject.h"
#include "../../engine/utils/GLResource.h"
#include <SDL2/SDL.h>
#include <SDL2/SDL_ttf.h>
#include <glm/glm.hpp>
#include <string>
#include <unordered_map>
#include <utility>

/*  Rasterizes card faces and the deck back with SDL_ttf at a multiple
    of the on-table size, uploads them as mip-mapped textures and keeps
    them. The GPU then scales them smoothly for any zoom or hand size.  */
class CardImageFactory {
public:
    CardImageFactory(const std::string& fontPath, const std::string& boldFontPath,
                     const glm::vec2& cardSize, int renderScale);
    ~CardImageFactory();

    CardImageFactory(const CardImageFactory&) = delete;
    CardImageFactory& operator=(const CardImageFactory&) = delete;

    const Texture2D* imageFor(const TableObject& obj);

    // "10♥" -> {"10", "♥"}; labels without a trailing suit -> {label, ""}.
    static std::pair<std::string, std::string> splitLabel(const std::string& label);

private:
    SDL_Surface* renderCardFace(const std::string& label);
    SDL_Surface* renderDeckBack(size_t count, int thickness);
    Texture2D upload(SDL_Surface* surface) const;

    TTF_Font* font(int pointSize, bool bold);
    void blitText(SDL_Surface* target, TTF_Font* f, const std::string& text,
                  SDL_Color color, int x, int y);

    std::string fontPath;
    std::string boldFontPath;
    glm::ivec2 cardSize;
    int renderScale;

    std::unordered_map<std::string, Texture2D> faces;
    std::unordered_map<ObjectId, std::pair<size_t, Texture2D>> deckBacks;
    std::unordered_map<int, TTF_Font*> fonts;   // key: size * 2 + bold
};
