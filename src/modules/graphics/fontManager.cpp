#include "modules/graphics/fontManager.hpp"
#include <modules/utils/print.hpp>

std::unordered_map<std::string, sf::Font> FontManager::fonts;

void FontManager::init() {
    // Hardcoded map of key to file path
    std::unordered_map<std::string, std::string> fontMappings = {
        {"russo", "./assets/fonts/russoone-regular.ttf"}
    };

    for (const auto& [key, filePath] : fontMappings) {
        sf::Font font;
        if (!font.loadFromFile(filePath)) {
            consoleLog("Failed to load font ", key, " from ", filePath);
            continue;
        }
        fonts[key] = font;
        consoleLog("Loaded font: ", key);
    }
}

sf::Font* FontManager::get(const std::string& key) {
    auto it = fonts.find(key);
    if (it != fonts.end()) {
        return &it->second;
    }
    return nullptr;
}
