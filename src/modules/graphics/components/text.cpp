#include <SFML/Graphics.hpp>
#include <modules/graphics/fontManager.hpp>
#include <modules/graphics/components/text.hpp>

using namespace std;

Text::Text(const unordered_map<string, string>& properties, const string& value)
    : UIElement(properties, {}) {
    text = value;

    styleSetters["font"] = [this](const string& v) {
        font = FontManager::get(v);
    };
    styleSetters["font-size"] = [this](const string& v) {
        fontSize = parseValue(v);
    };
    styleSetters["color"] = [this](const string& v) {
        setColor(parseColor(v));
    };
    styleSetters["outline"] = [this](const string& v) {
        outlineThickness = parseValue(v);
    };

    setProperties(properties);
    restyle();
}

void Text::setColor(const Color& color) {
    fillColor = color;
    labelElement.setFillColor(fillColor.toSFML());
}

void Text::draw(sf::RenderTarget& target) {
    if (!visible || font == nullptr) return;
    target.draw(labelElement);
}

void Text::onLayout() {
    UIElement::onLayout();
    if (font != nullptr) {
        labelElement.setFont(*font);
    }
    labelElement.setString(text);

    float effectiveFontSize = (fontSize > 0) ? fontSize : 20.0f;
    labelElement.setCharacterSize((unsigned int)effectiveFontSize);
    labelElement.setFillColor(fillColor.toSFML());
    labelElement.setOutlineThickness(outlineThickness);
    labelElement.setOutlineColor(sf::Color::Black);
    labelElement.setScale(getContentScale());
    setText(text);
}

void Text::setText(const string& value) {
    text = value;
    labelElement.setString(text);
    labelElement.setOrigin(labelElement.getLocalBounds().getSize() / 2.f + labelElement.getLocalBounds().getPosition());
    labelElement.setPosition(layout.getPosition() + (layout.getSize() / 2.f));
}
