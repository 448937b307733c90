// GLResource.h

#pragma once
#include <glad/glad.h>

// RAII wrapper for a Vertex Array Object
class VertexArray {
public:
    VertexArray() { glGenVertexArrays(1, &ID); }
    ~VertexArray() { if (ID) glDeleteVertexArrays(1, &ID); }

    VertexArray(const VertexArray&) = delete;
    VertexArray& operator=(const VertexArray&) = delete;
    VertexArray(VertexArray&& other) noexcept : ID(other.ID) { other.ID = 0; }
    VertexArray& operator=(VertexArray&& other) noexcept {
        if (this != &other) {
            if (ID) glDeleteVertexArrays(1, &ID);
            ID = other.ID;
            other.ID = 0;
        }
        return *this;
    }

    void bind() const { glBindVertexArray(ID); }
    static void unbind() { glBindVertexArray(0); }
    GLuint getID() const { return ID; }
private:
    GLuint ID = 0;
};

// RAII wrapper for a buffer object (VBO, EBO)
class BufferObject {
public:
    explicit BufferObject(GLenum target_) : target(target_) { glGenBuffers(1, &ID); }
    ~BufferObject() { if (ID) glDeleteBuffers(1, &ID); }

    BufferObject(const BufferObject&) = delete;
    BufferObject& operator=(const BufferObject&) = delete;
    BufferObject(BufferObject&& other) noexcept : ID(other.ID), target(other.target) { other.ID = 0; }
    BufferObject& operator=(BufferObject&& other) noexcept {
        if (this != &other) {
            if (ID) glDeleteBuffers(1, &ID);
            ID = other.ID;
            target = other.target;
            other.ID = 0;
        }
        return *this;
    }

    void bind() const { glBindBuffer(target, ID); }
    // Re-specifies the whole store; `usage` is GL_STATIC_DRAW or GL_DYNAMIC_DRAW.
    void upload(GLsizeiptr bytes, const void* data, GLenum usage) const {
        glBindBuffer(target, ID);
        glBufferData(target, bytes, data, usage);
    }
    GLuint getID() const { return ID; }
    GLenum getTarget() const { return target; }
private:
    GLuint ID = 0;
    GLenum target;
};

// RAII wrapper for a 2D texture
class Texture2D {
public:
    Texture2D() = default;
    Texture2D(GLuint id, int w, int h) : ID(id), width(w), height(h) {}
    ~Texture2D() { if (ID) glDeleteTextures(1, &ID); }

    Texture2D(const Texture2D&) = delete;
    Texture2D& operator=(const Texture2D&) = delete;
    Texture2D(Texture2D&& other) noexcept
        : ID(other.ID), width(other.width), height(other.height) { other.ID = 0; }
    Texture2D& operator=(Texture2D&& other) noexcept {
        if (this != &other) {
            if (ID) glDeleteTextures(1, &ID);
            ID = other.ID;
            width = other.width;
            height = other.height;
            other.ID = 0;
        }
        return *this;
    }

    GLuint getID() const { return ID; }
    int getWidth() const { return width; }
    int getHeight() const { return height; }
    bool isValid() const { return ID != 0; }
private:
    GLuint ID = 0;
    int width = 0;
    int height = 0;
};
