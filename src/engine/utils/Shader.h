// Shader.h

#ifndef SHADER_H
#define SHADER_H

#include <string>
#include <glad/glad.h>
#include <glm/glm.hpp>
#include <unordered_map>

class Shader {
public:
    Shader(const std::string& vertexPath, const std::string& fragmentPath);
    ~Shader();

    Shader(const Shader&) = delete;
    Shader& operator=(const Shader&) = delete;

    void use() const;
    GLuint getID() const { return ID; }
    bool isValid() const { return valid; }

    // Uniform setters
    void setUniform(const std::string &name, int value) const;
    void setUniform(const std::string &name, float value) const;
    void setUniform(const std::string &name, const glm::vec2 &vec) const;
    void setUniform(const std::string &name, const glm::vec3 &vec) const;
    void setUniform(const std::string &name, const glm::mat4 &matrix) const;

private:
    GLuint ID = 0;
    bool valid = false;

    static std::string loadSource(const std::string& filePath);
    static GLuint compileShader(GLenum type, const std::string& source, const std::string& path);

    // Cache for uniform locations. Marked mutable so it can be updated in const functions.
    mutable std::unordered_map<std::string, GLint> uniformLocationCache;
    GLint getUniformLocation(const std::string &name) const;
};

#endif // SHADER_H
