#include <SFML/Graphics.hpp>
#include <algorithm>
#include <modules/graphics/utils/UIElement.hpp>
#include <modules/graphics/spriteManager.hpp>
#include <modules/graphics/components/image.hpp>

ImageElement::ImageElement(const unordered_map<string, string>& properties)
    : UIElement(properties, {}) {
    styleSetters["resizeMode"] = [this](const string& value) {
        resizeMode = value;
    };
    styleSetters["tint"] = [this](const string& value) {
        setColor(parseColor(value));
    };
    styleSetters["image"] = [this](const string& value) {
        if (sf::Sprite* loaded = SpriteManager::get(value)) {
            sprite = *loaded;
        }
    };

    setProperties(properties);
    restyle();
}

void ImageElement::setColor(const Color& color) {
    tintColor = color;
    sprite.setColor(tintColor.toSFML());
}

void ImageElement::onLayout() {
    UIElement::onLayout();
    sprite.setPosition(layout.left, layout.top);

    sf::Vector2f textureSize(sprite.getTextureRect().getSize());
    if (sprite.getTexture() == nullptr || textureSize.x <= 0 || textureSize.y <= 0) {
        return;
    }

    if (resizeMode == "contain" || resizeMode == "cover") {
        float scaleX = layout.width / textureSize.x;
        float scaleY = layout.height / textureSize.y;
        float scale = resizeMode == "contain" ? std::min(scaleX, scaleY) : std::max(scaleX, scaleY);
        sprite.setScale(scale, scale);
        sprite.setPosition(layout.left + (layout.width - textureSize.x * scale) / 2,
                           layout.top + (layout.height - textureSize.y * scale) / 2);
    }
    else {
        sprite.setScale(layout.width / textureSize.x, layout.height / textureSize.y);
    }
}

void ImageElement::draw(sf::RenderTarget& target) {
    if (!visible) return;
    target.draw(sprite);
}
