// ShaderLibrary.h

#pragma once
#include "Shader.h"
#include <map>
#include <memory>
#include <string>
#include <utility>

/*  Programs keyed by their (vertex, fragment) source pair and compiled
    on first request. Shared by the sprite, grid and text passes.      */
class ShaderLibrary {
public:
    // A program that failed to build is still cached (and logged once);
    // check Shader::isValid() where it matters.
    static std::shared_ptr<Shader> get(const std::string& vert,
                                       const std::string& frag);

    // Drop all programs; call while the GL context is still alive.
    static void clear();
    static size_t size() { return programs().size(); }

private:
    using Key = std::pair<std::string, std::string>;
    static std::map<Key, std::shared_ptr<Shader>>& programs();
};
