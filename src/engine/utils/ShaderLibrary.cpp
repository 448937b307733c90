// ShaderLibrary.cpp

#include "ShaderLibrary.h"
#include <iostream>

std::map<ShaderLibrary::Key, std::shared_ptr<Shader>>& ShaderLibrary::programs() {
    static std::map<Key, std::shared_ptr<Shader>> cache;
    return cache;
}

std::shared_ptr<Shader> ShaderLibrary::get(const std::string& vert,
                                           const std::string& frag)
{
    auto& cache = programs();
    Key key{vert, frag};
    if (auto it = cache.find(key); it != cache.end()) return it->second;

    auto shader = std::make_shared<Shader>(vert, frag);
    if (!shader->isValid()) {
        std::cerr << "[ShaderLibrary] Program " << vert << " + " << frag << " is unusable\n";
    }
    cache.emplace(std::move(key), shader);
    return shader;
}

void ShaderLibrary::clear() {
    std::cout << "[ShaderLibrary] Releasing " << programs().size() << " program(s)\n";
    programs().clear();
}
