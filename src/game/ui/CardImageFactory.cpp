// CardImageFactory.cpp

#include "CardImageFactory.h"
#include <glad/glad.h>
#include <algorithm>
#include <iostream>

namespace {
    constexpr int kCardPadding = 6;

    const char* kSuits[] = {"♠", "♣", "♥", "♦"};

    SDL_Color suitColor(const std::string& suit) {
        if (suit == "♥" || suit == "♦") return {200, 16, 46, 255};
        if (suit == "♠" || suit == "♣") return {20, 20, 20, 255};
        return {24, 24, 24, 255};
    }

    void fill(SDL_Surface* s, const SDL_Rect& r, Uint8 red, Uint8 green, Uint8 blue, Uint8 a = 255) {
        SDL_FillRect(s, &r, SDL_MapRGBA(s->format, red, green, blue, a));
    }

    void outline(SDL_Surface* s, const SDL_Rect& r, int t, Uint8 red, Uint8 green, Uint8 blue) {
        fill(s, {r.x, r.y, r.w, t}, red, green, blue);
        fill(s, {r.x, r.y + r.h - t, r.w, t}, red, green, blue);
        fill(s, {r.x, r.y, t, r.h}, red, green, blue);
        fill(s, {r.x + r.w - t, r.y, t, r.h}, red, green, blue);
    }

    SDL_Rect inset(const SDL_Rect& r, int by) {
        return {r.x + by, r.y + by, std::max(0, r.w - 2 * by), std::max(0, r.h - 2 * by)};
    }
}

CardImageFactory::CardImageFactory(const std::string& fontPath, const std::string& boldFontPath,
                                   const glm::vec2& cardSize, int renderScale)
    : fontPath(fontPath),
      boldFontPath(boldFontPath),
      cardSize(static_cast<int>(cardSize.x), static_cast<int>(cardSize.y)),
      renderScale(std::max(1, renderScale))
{}

CardImageFactory::~CardImageFactory() {
    faces.clear();
    deckBacks.clear();
    for (auto& [key, f] : fonts) {
        if (f) TTF_CloseFont(f);
    }
}

std::pair<std::string, std::string> CardImageFactory::splitLabel(const std::string& label) {
    for (const char* suit : kSuits) {
        const std::string s(suit);
        if (label.size() >= s.size() && label.compare(label.size() - s.size(), s.size(), s) == 0) {
            std::string value = label.substr(0, label.size() - s.size());
            return {value.empty() ? s : value, s};
        }
    }
    return {label, ""};
}

const Texture2D* CardImageFactory::imageFor(const TableObject& obj) {
    if (obj.isDeck()) {
        const Deck* deck = obj.getDeck();
        const size_t count = deck ? deck->size() : 0;
        auto it = deckBacks.find(obj.getId());
        if (it != deckBacks.end() && it->second.first == count) return &it->second.second;

        SDL_Surface* surface = renderDeckBack(count, Deck::thicknessFor(count));
        if (!surface) return nullptr;
        Texture2D tex = upload(surface);
        SDL_FreeSurface(surface);
        auto& slot = deckBacks[obj.getId()];
        slot = {count, std::move(tex)};
        return &slot.second;
    }

    auto it = faces.find(obj.getLabel());
    if (it != faces.end()) return &it->second;

    SDL_Surface* surface = renderCardFace(obj.getLabel());
    if (!surface) return nullptr;
    auto inserted = faces.emplace(obj.getLabel(), upload(surface)).first;
    SDL_FreeSurface(surface);
    return &inserted->second;
}

SDL_Surface* CardImageFactory::renderCardFace(const std::string& label) {
    const int s = renderScale;
    SDL_Surface* surface = SDL_CreateRGBSurfaceWithFormat(0, cardSize.x * s, cardSize.y * s, 32, SDL_PIXELFORMAT_RGBA32);
    if (!surface) {
        std::cerr << "[CardImageFactory] Surface creation failed: " << SDL_GetError() << "\n";
        return nullptr;
    }
    SDL_FillRect(surface, nullptr, SDL_MapRGBA(surface->format, 0, 0, 0, 0));

    const SDL_Rect card = inset({0, 0, surface->w, surface->h}, kCardPadding * s);
    fill(surface, card, 24, 24, 24);
    fill(surface, inset(card, 2 * s), 246, 246, 246);

    auto [value, suit] = splitLabel(label);
    const int pad = 6 * s;

    if (!suit.empty()) {
        SDL_Color color = suitColor(suit);
        blitText(surface, font(48 * s, true), value, color, card.x + pad, card.y + pad);

        if (TTF_Font* suitFont = font(40 * s, false)) {
            int w = 0, h = 0;
            TTF_SizeUTF8(suitFont, suit.c_str(), &w, &h);
            blitText(surface, suitFont, suit, color, card.x + card.w - pad - w, card.y + card.h - pad - h);
        }
    } else if (TTF_Font* probe = font(54 * s, false)) {
        // Shrink long literal labels ("Joker") until they fit the face.
        int w = 0, h = 0;
        TTF_SizeUTF8(probe, label.c_str(), &w, &h);
        int size = 54 * s;
        const int room = card.w - 2 * pad;
        if (w > room && w > 0) size = std::max(8, size * room / w);

        TTF_Font* f = font(size, false);
        if (f) {
            TTF_SizeUTF8(f, label.c_str(), &w, &h);
            blitText(surface, f, label, {24, 24, 24, 255}, card.x + (card.w - w) / 2, card.y + (card.h - h) / 2);
        }
    }
    return surface;
}

SDL_Surface* CardImageFactory::renderDeckBack(size_t count, int thickness) {
    const int s = renderScale;
    SDL_Surface* surface = SDL_CreateRGBSurfaceWithFormat(0, cardSize.x * s, cardSize.y * s, 32, SDL_PIXELFORMAT_RGBA32);
    if (!surface) {
        std::cerr << "[CardImageFactory] Surface creation failed: " << SDL_GetError() << "\n";
        return nullptr;
    }
    SDL_FillRect(surface, nullptr, SDL_MapRGBA(surface->format, 0, 0, 0, 0));

    const SDL_Rect card = inset({0, 0, surface->w, surface->h}, kCardPadding * s);

    // Edge layers peek out down-right, deepest first.
    const int step = std::max(1, (kCardPadding * s) / std::max(1, thickness));
    for (int i = thickness; i >= 1; --i) {
        SDL_Rect edge = {card.x + i * step, card.y + i * step, card.w, card.h};
        fill(surface, edge, 160, 30, 30);
        outline(surface, edge, std::max(1, s / 2), 60, 0, 0);
    }

    fill(surface, card, 120, 0, 0);

    const SDL_Rect inner = inset(card, 8 * s);
    for (int y = 0; y < inner.h; ++y) {
        float t = inner.h > 1 ? static_cast<float>(y) / static_cast<float>(inner.h - 1) : 0.0f;
        Uint8 r = static_cast<Uint8>(210 + (90 - 210) * t);
        Uint8 g = static_cast<Uint8>(60 + (0 - 60) * t);
        fill(surface, {inner.x, inner.y + y, inner.w, 1}, r, g, 0);
    }

    outline(surface, card, std::max(1, 3 * s), 30, 0, 0);
    outline(surface, inset(card, 5 * s), std::max(1, 2 * s), 230, 200, 200);

    if (TTF_Font* f = font(18 * s, true)) {
        const std::string caption = "Deck (" + std::to_string(count) + ")";
        int w = 0, h = 0;
        TTF_SizeUTF8(f, caption.c_str(), &w, &h);
        blitText(surface, f, caption, {230, 200, 200, 255}, card.x + (card.w - w) / 2, card.y + (card.h - h) / 2);
    }
    return surface;
}

Texture2D CardImageFactory::upload(SDL_Surface* surface) const {
    SDL_Surface* converted = SDL_ConvertSurfaceFormat(surface, SDL_PIXELFORMAT_RGBA32, 0);
    if (!converted) {
        std::cerr << "[CardImageFactory] Failed to convert surface: " << SDL_GetError() << "\n";
        return Texture2D();
    }

    GLuint id = 0;
    glGenTextures(1, &id);
    glBindTexture(GL_TEXTURE_2D, id);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR_MIPMAP_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glPixelStorei(GL_UNPACK_ROW_LENGTH, converted->pitch / 4);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA, converted->w, converted->h, 0,
                 GL_RGBA, GL_UNSIGNED_BYTE, converted->pixels);
    glPixelStorei(GL_UNPACK_ROW_LENGTH, 0);
    glGenerateMipmap(GL_TEXTURE_2D);
    glBindTexture(GL_TEXTURE_2D, 0);

    Texture2D tex(id, converted->w, converted->h);
    SDL_FreeSurface(converted);
    return tex;
}

TTF_Font* CardImageFactory::font(int pointSize, bool bold) {
    const int key = pointSize * 2 + (bold ? 1 : 0);
    if (auto it = fonts.find(key); it != fonts.end()) return it->second;

    const std::string& path = bold ? boldFontPath : fontPath;
    TTF_Font* f = TTF_OpenFont(path.c_str(), pointSize);
    if (!f && bold) {
        // No bold face on disk: embolden the regular one.
        f = TTF_OpenFont(fontPath.c_str(), pointSize);
        if (f) TTF_SetFontStyle(f, TTF_STYLE_BOLD);
    }
    if (!f) {
        std::cerr << "[CardImageFactory] Failed to load font " << path << ": " << TTF_GetError() << "\n";
    }
    fonts[key] = f;
    return f;
}

void CardImageFactory::blitText(SDL_Surface* target, TTF_Font* f, const std::string& text,
                                SDL_Color color, int x, int y)
{
    if (!f || text.empty()) return;
    SDL_Surface* rendered = TTF_RenderUTF8_Blended(f, text.c_str(), color);
    if (!rendered) return;
    SDL_SetSurfaceBlendMode(rendered, SDL_BLENDMODE_BLEND);
    SDL_Rect dst = {x, y, rendered->w, rendered->h};
    SDL_BlitSurface(rendered, nullptr, target, &dst);
    SDL_FreeSurface(rendered);
}
