#include "modules/graphics/spriteManager.hpp"
#include <modules/utils/print.hpp>

std::unordered_map<std::string, sf::Texture> SpriteManager::textures;
std::unordered_map<std::string, sf::Sprite> SpriteManager::sprites;

void SpriteManager::init() {
    // Hardcoded map of key to file path
    std::unordered_map<std::string, std::string> spriteMappings = {
            {"play", "./assets/icons/play.png"},
            {"settings", "./assets/icons/settings.png"},
            {"save", "./assets/icons/save.png"},
    };

    for (const auto& [key, filePath] : spriteMappings) {
        sf::Image image;
        if (!image.loadFromFile(filePath)) {
            consoleLog("Failed to load texture ", key, " from ", filePath);
            continue;
        }
        add(key, image);
    }
}

bool SpriteManager::add(const std::string& key, const sf::Image& image) {
    sf::Texture texture;
    if (!texture.loadFromImage(image)) {
        consoleLog("Failed to create texture ", key);
        return false;
    }
    texture.setSmooth(true);
    textures[key] = texture;
    sprites[key] = sf::Sprite(textures[key]);
    return true;
}

sf::Sprite* SpriteManager::get(const std::string& key) {
    auto it = sprites.find(key);
    if (it != sprites.end()) {
        return &it->second;
    }
    return nullptr;
}
