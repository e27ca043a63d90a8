#ifndef SPRITE_MANAGER
#define SPRITE_MANAGER

#include <unordered_map>
#include <string>
#include "SFML/Graphics.hpp"

class SpriteManager {
public:
    // Loads the icon textures bundled with the demo assets
    static void init();

    // Registers a texture built in code, replacing any sprite with the same key
    static bool add(const std::string& key, const sf::Image& image);

    // Gets a sprite by its key, nullptr when it never loaded
    static sf::Sprite* get(const std::string& key);

private:
    static std::unordered_map<std::string, sf::Texture> textures;
    static std::unordered_map<std::string, sf::Sprite> sprites;
};

#endif
