// TextRenderer.h

#pragma once
#include <string>
#include <unordered_map>
#include <memory>
#include <glm/glm.hpp>
#include <SDL2/SDL_ttf.h>
#include "../utils/GLResource.h"

class Shader;

// UTF-8 text in screen space. Each distinct string is rasterized once
// by SDL_ttf and kept as a texture.
class TextRenderer {
public:
    TextRenderer(const std::string& fontPath, int fontSize);
    ~TextRenderer();

    TextRenderer(const TextRenderer&) = delete;
    TextRenderer& operator=(const TextRenderer&) = delete;

    // (x, y) is the top-left of the line in pixels.
    void renderText(const std::string& text,
                    float x,
                    float y,
                    const glm::vec3& color,
                    float scale,
                    float alpha = 1.0f);

    TTF_Font* getFont() const { return font; }
    int lineHeight() const;

    float measureTextWidth(const std::string& text, float scale = 1.0f) const;

private:
    const Texture2D* textureFor(const std::string& text);

    TTF_Font* font = nullptr;
    std::shared_ptr<Shader> textShader;
    VertexArray vao;
    BufferObject vbo{GL_ARRAY_BUFFER};
    std::unordered_map<std::string, Texture2D> cache;
};
