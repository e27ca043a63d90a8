#ifndef IMAGE_ELEMENT
#define IMAGE_ELEMENT

#include "SFML/Graphics.hpp"
#include "modules/graphics/utils/UIElement.hpp"
#include "modules/graphics/utils/color.hpp"

class ImageElement : public UIElement {
public:
    explicit ImageElement(const unordered_map<string, string>& properties);
    void draw(sf::RenderTarget& target) override;
    void onLayout() override;

    // The tint multiplied into the sprite's texture
    [[nodiscard]] Color getColor() const { return tintColor; }
    void setColor(const Color& color);

private:
    sf::Sprite sprite;
    Color tintColor;
    string resizeMode = "contain";
};

#endif
