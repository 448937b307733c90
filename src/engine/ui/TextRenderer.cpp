// TextRenderer.cpp

#include "TextRenderer.h"
#include "../utils/Shader.h"
#include "../utils/ShaderLibrary.h"
#include <SDL2/SDL.h>
#include <glad/glad.h>
#include <glm/gtc/matrix_transform.hpp>
#include <iostream>

namespace {
    constexpr size_t kMaxCachedStrings = 256;
}

TextRenderer::TextRenderer(const std::string& fontPath, int fontSize) {
    font = TTF_OpenFont(fontPath.c_str(), fontSize);
    if (!font) {
        std::cerr << "[TextRenderer] Failed to load font " << fontPath << ": " << TTF_GetError() << "\n";
    }
    textShader = ShaderLibrary::get("assets/shaders/ui/text.vert", "assets/shaders/ui/text.frag");

    vao.bind();
    vbo.upload(16 * sizeof(float), nullptr, GL_DYNAMIC_DRAW);
    glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, 4 * sizeof(float), (void*)0);
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(1, 2, GL_FLOAT, GL_FALSE, 4 * sizeof(float), (void*)(2 * sizeof(float)));
    glEnableVertexAttribArray(1);
    VertexArray::unbind();
}

TextRenderer::~TextRenderer() {
    cache.clear();
    if (font) {
        TTF_CloseFont(font);
        font = nullptr;
    }
}

int TextRenderer::lineHeight() const {
    if (!font) return 0;
    return TTF_FontHeight(font);
}

const Texture2D* TextRenderer::textureFor(const std::string& text) {
    if (auto it = cache.find(text); it != cache.end()) return &it->second;
    if (cache.size() >= kMaxCachedStrings) cache.clear();

    SDL_Color white = {255, 255, 255, 255};
    SDL_Surface* rendered = TTF_RenderUTF8_Blended(font, text.c_str(), white);
    if (!rendered) {
        std::cerr << "[TextRenderer] Render failed: " << TTF_GetError() << "\n";
        return nullptr;
    }
    SDL_Surface* converted = SDL_ConvertSurfaceFormat(rendered, SDL_PIXELFORMAT_RGBA32, 0);
    SDL_FreeSurface(rendered);
    if (!converted) {
        std::cerr << "[TextRenderer] Failed to convert surface: " << SDL_GetError() << "\n";
        return nullptr;
    }

    GLuint id = 0;
    glGenTextures(1, &id);
    glBindTexture(GL_TEXTURE_2D, id);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glPixelStorei(GL_UNPACK_ROW_LENGTH, converted->pitch / 4);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA, converted->w, converted->h, 0,
                 GL_RGBA, GL_UNSIGNED_BYTE, converted->pixels);
    glPixelStorei(GL_UNPACK_ROW_LENGTH, 0);
    glBindTexture(GL_TEXTURE_2D, 0);

    auto it = cache.emplace(text, Texture2D(id, converted->w, converted->h)).first;
    SDL_FreeSurface(converted);
    return &it->second;
}

void TextRenderer::renderText(const std::string& text,
                              float x,
                              float y,
                              const glm::vec3& color,
                              float scale,
                              float alpha)
{
    if (!font || !textShader || text.empty()) return;

    const Texture2D* tex = textureFor(text);
    if (!tex) return;

    // Projection from the current viewport so HiDPI and resizes stay correct.
    int vp[4] = {0, 0, 0, 0};
    glGetIntegerv(GL_VIEWPORT, vp);
    glm::mat4 projection = glm::ortho(0.0f, static_cast<float>(vp[2]), static_cast<float>(vp[3]), 0.0f);

    textShader->use();
    textShader->setUniform("u_Projection", projection);
    textShader->setUniform("u_TextColor", color);
    textShader->setUniform("u_GlobalAlpha", alpha);
    textShader->setUniform("u_Texture", 0);

    const float w = tex->getWidth() * scale;
    const float h = tex->getHeight() * scale;
    const float vertices[] = {
        x,     y + h, 0.0f, 1.0f,
        x,     y,     0.0f, 0.0f,
        x + w, y,     1.0f, 0.0f,
        x + w, y + h, 1.0f, 1.0f
    };

    vao.bind();
    vbo.bind();
    glBufferSubData(GL_ARRAY_BUFFER, 0, sizeof(vertices), vertices);

    glActiveTexture(GL_TEXTURE0);
    glBindTexture(GL_TEXTURE_2D, tex->getID());

    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
    glDrawArrays(GL_TRIANGLE_FAN, 0, 4);
    glDisable(GL_BLEND);

    VertexArray::unbind();
    glBindTexture(GL_TEXTURE_2D, 0);
}

float TextRenderer::measureTextWidth(const std::string& text, float scale) const {
    if (!font || text.empty()) return 0.0f;
    int w = 0, h = 0;
    if (TTF_SizeUTF8(font, text.c_str(), &w, &h) != 0) return 0.0f;
    return static_cast<float>(w) * scale;
}
