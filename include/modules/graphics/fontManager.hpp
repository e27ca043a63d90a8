#ifndef FONT_MANAGER
#define FONT_MANAGER

#include <unordered_map>
#include <string>
#include "SFML/Graphics.hpp"

class FontManager {
public:
    // Loads the fonts bundled with the demo assets
    static void init();

    // Gets a font by its key, nullptr when it never loaded
    static sf::Font* get(const std::string& key);

private:
    static std::unordered_map<std::string, sf::Font> fonts;
};

#endif
