#include <unordered_map>
#include <string>
#include "modules/graphics/utils/styleParser.hpp"
#include "modules/graphics/utils/UIElement.hpp"

using namespace std;

UIElement::UIElement(const unordered_map<string, string>& properties,
                     const vector<shared_ptr<UIElement>>& children)
    : children(children) {
}

void UIElement::setProperties(unordered_map<string, string> properties) {
    for (const auto& [property, setter] : propertySetters) {
        if (properties.contains(property)) {
            setter(properties[property]);
        }
    }
}

void UIElement::setStyle(unordered_map<string, string> styleProps) {
    for (const auto& [property, setter] : styleSetters) {
        if (styleProps.contains(property)) {
            setter(styleProps[property]);
        }
    }
}

void UIElement::restyle() {
    setStyle(style);
    onLayout();
}

shared_ptr<UIElement> UIElement::find(const string& searchKey) const {
    for (const auto& child : children) {
        if (!child) continue;
        if (child->key == searchKey) {
            return child;
        }
        if (auto match = child->find(searchKey)) {
            return match;
        }
    }
    return nullptr;
}

sf::Vector2f UIElement::getContentScale() const {
    sf::Vector3f scale = transform.getScale();
    return {inheritedScale.x * scale.x, inheritedScale.y * scale.y};
}

// Shrinks or grows the layout about its centre by the transform's scale
void UIElement::onLayout() {
    layout = base_layout;

    if (!transform.isIdentity()) {
        sf::Vector3f scale = transform.getScale();
        float newWidth = base_layout.width * scale.x;
        float newHeight = base_layout.height * scale.y;
        layout.left += (layout.width - newWidth) / 2;
        layout.top += (layout.height - newHeight) / 2;
        layout.width = newWidth;
        layout.height = newHeight;
    }
}
