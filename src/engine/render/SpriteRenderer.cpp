// SpriteRenderer.cpp

#include "SpriteRenderer.h"
#include "../utils/Shader.h"
#include "../utils/ShaderLibrary.h"
#include <glm/gtc/matrix_transform.hpp>

SpriteRenderer::SpriteRenderer() {
    shader = ShaderLibrary::get("assets/shaders/ui/sprite.vert", "assets/shaders/ui/sprite.frag");

    // Unit quad, top-left origin; u_Model stretches it.
    const float vertices[] = {
        0.0f, 0.0f, 0.0f, 0.0f,
        1.0f, 0.0f, 1.0f, 0.0f,
        1.0f, 1.0f, 1.0f, 1.0f,
        0.0f, 1.0f, 0.0f, 1.0f
    };
    const unsigned int indices[] = { 0, 1, 2, 2, 3, 0 };

    vao.bind();
    vbo.upload(sizeof(vertices), vertices, GL_STATIC_DRAW);
    ebo.upload(sizeof(indices), indices, GL_STATIC_DRAW);

    glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, 4 * sizeof(float), (void*)0);
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(1, 2, GL_FLOAT, GL_FALSE, 4 * sizeof(float), (void*)(2 * sizeof(float)));
    glEnableVertexAttribArray(1);

    VertexArray::unbind();
}

void SpriteRenderer::begin(const glm::mat4& projection) {
    shader->use();
    shader->setUniform("u_Projection", projection);
    shader->setUniform("u_Texture", 0);

    glDisable(GL_DEPTH_TEST);
    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
    vao.bind();
}

void SpriteRenderer::drawTexture(GLuint texture, const glm::vec2& topLeft, const glm::vec2& size,
                                 const glm::vec3& tint, float alpha)
{
    if (texture == 0) return;
    shader->setUniform("u_UseTexture", 1);
    shader->setUniform("u_Tint", tint);
    shader->setUniform("u_Alpha", alpha);

    glActiveTexture(GL_TEXTURE0);
    glBindTexture(GL_TEXTURE_2D, texture);
    drawQuad(topLeft, size);
}

void SpriteRenderer::drawRect(const glm::vec2& topLeft, const glm::vec2& size,
                              const glm::vec3& color, float alpha)
{
    shader->setUniform("u_UseTexture", 0);
    shader->setUniform("u_Tint", color);
    shader->setUniform("u_Alpha", alpha);
    drawQuad(topLeft, size);
}

void SpriteRenderer::end() {
    VertexArray::unbind();
    glBindTexture(GL_TEXTURE_2D, 0);
    glDisable(GL_BLEND);
}

void SpriteRenderer::drawQuad(const glm::vec2& topLeft, const glm::vec2& size) {
    glm::mat4 model = glm::translate(glm::mat4(1.0f), glm::vec3(topLeft, 0.0f));
    model = glm::scale(model, glm::vec3(size, 1.0f));
    shader->setUniform("u_Model", model);
    glDrawElements(GL_TRIANGLES, 6, GL_UNSIGNED_INT, 0);
}
