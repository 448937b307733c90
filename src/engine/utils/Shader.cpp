// Shader.cpp

#include "Shader.h"
#include <fstream>
#include <sstream>
#include <iostream>
#include <glm/gtc/type_ptr.hpp>

Shader::Shader(const std::string& vertexPath, const std::string& fragmentPath) {
    GLuint vertexShader   = compileShader(GL_VERTEX_SHADER, loadSource(vertexPath), vertexPath);
    GLuint fragmentShader = compileShader(GL_FRAGMENT_SHADER, loadSource(fragmentPath), fragmentPath);

    ID = glCreateProgram();
    if (vertexShader)   glAttachShader(ID, vertexShader);
    if (fragmentShader) glAttachShader(ID, fragmentShader);
    glLinkProgram(ID);

    GLint success = 0;
    glGetProgramiv(ID, GL_LINK_STATUS, &success);
    if (!success) {
        char infoLog[512];
        glGetProgramInfoLog(ID, 512, nullptr, infoLog);
        std::cerr << "[Shader] Program linking error (" << vertexPath << ", "
                  << fragmentPath << "): " << infoLog << "\n";
    }
    valid = success && vertexShader && fragmentShader;

    if (vertexShader)   glDeleteShader(vertexShader);
    if (fragmentShader) glDeleteShader(fragmentShader);
}

Shader::~Shader() {
    if (ID) glDeleteProgram(ID);
}

void Shader::use() const {
    glUseProgram(ID);
}

std::string Shader::loadSource(const std::string& filePath) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        std::cerr << "[Shader] Error opening shader file: " << filePath << "\n";
        return "";
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

GLuint Shader::compileShader(GLenum type, const std::string& source, const std::string& path) {
    if (source.empty()) return 0;

    GLuint shader = glCreateShader(type);
    const char* src = source.c_str();
    glShaderSource(shader, 1, &src, nullptr);
    glCompileShader(shader);

    GLint success = 0;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &success);
    if (!success) {
        char infoLog[512];
        glGetShaderInfoLog(shader, 512, nullptr, infoLog);
        std::cerr << "[Shader] " << (type == GL_VERTEX_SHADER ? "Vertex" : "Fragment")
                  << " shader compilation error in " << path << ": " << infoLog << "\n";
        glDeleteShader(shader);
        return 0;
    }
    return shader;
}

GLint Shader::getUniformLocation(const std::string &name) const {
    auto it = uniformLocationCache.find(name);
    if (it != uniformLocationCache.end()) {
        return it->second;
    }
    GLint location = glGetUniformLocation(ID, name.c_str());
    if (location == -1)
        std::cerr << "[Shader] Warning: Uniform '" << name << "' not found!\n";

    uniformLocationCache[name] = location;
    return location;
}

void Shader::setUniform(const std::string &name, int value) const {
    glUniform1i(getUniformLocation(name), value);
}

void Shader::setUniform(const std::string &name, float value) const {
    glUniform1f(getUniformLocation(name), value);
}

void Shader::setUniform(const std::string &name, const glm::vec2 &vec) const {
    glUniform2f(getUniformLocation(name), vec.x, vec.y);
}

void Shader::setUniform(const std::string &name, const glm::vec3 &vec) const {
    glUniform3f(getUniformLocation(name), vec.x, vec.y, vec.z);
}

void Shader::setUniform(const std::string &name, const glm::mat4 &matrix) const {
    glUniformMatrix4fv(getUniformLocation(name), 1, GL_FALSE, glm::value_ptr(matrix));
}
