#include <modules/graphics/components/view.hpp>
#include <algorithm>
#include "vector"

using namespace std;

View::View(const unordered_map<string, string>& properties, const vector<shared_ptr<UIElement>>& children) :
    UIElement(properties, children) {
    styleSetters["background"] = [this](const string& v) {
        backgroundColor = parseColor(v);
    };
    styleSetters["border-color"] = [this](const string& v) {
        borderColor = parseColor(v);
    };
    styleSetters["border-width"] = [this](const string& v) {
        borderStroke = parseValue(v);
    };
    styleSetters["flex-direction"] = [this](const string& v) {
        flexDirection = parseDirection(v);
    };
    styleSetters["gap"] = [this](const string& v) {
        gap = parseValue(v);
    };

    setProperties(properties);
    restyle();
}

void View::onLayout() {
    UIElement::onLayout();
    shape.setFillColor(backgroundColor.toSFML());
    shape.setOutlineColor(borderColor.toSFML());
    shape.setOutlineThickness(borderStroke);
    shape.setPosition(layout.getPosition());
    shape.setSize(layout.getSize());
    updateLayout();
    for (auto& child : children) {
        if (child) child->onLayout();
    }
}

void View::updateLayout() {
    sf::Vector2f contentScale = getContentScale();
    bool row = flexDirection == Direction::Row;
    float scaledGap = gap * (row ? contentScale.x : contentScale.y);
    float availableMain = row ? layout.width : layout.height;
    float availableCross = row ? layout.height : layout.width;

    vector<UIElement*> visibleChildren;
    int flexCount = 0;
    float fixedMain = 0;
    for (const auto& child : children) {
        if (!child || !child->visible) continue;
        visibleChildren.push_back(child.get());
        float mainSize = row ? child->width * contentScale.x : child->height * contentScale.y;
        if (mainSize > 0) {
            fixedMain += mainSize;
        } else {
            flexCount++;
        }
    }
    if (visibleChildren.empty()) return;

    float totalGap = scaledGap * (float)(visibleChildren.size() - 1);
    float flexSize = flexCount > 0 ? max(0.0f, availableMain - fixedMain - totalGap) / (float)flexCount : 0;
    float used = fixedMain + totalGap + flexSize * (float)flexCount;
    float mainPos = (row ? layout.left : layout.top) + max(0.0f, availableMain - used) / 2;

    for (auto* child : visibleChildren) {
        float mainSize = row ? child->width * contentScale.x : child->height * contentScale.y;
        float crossSize = row ? child->height * contentScale.y : child->width * contentScale.x;
        if (mainSize <= 0) mainSize = flexSize;
        if (crossSize <= 0) crossSize = availableCross;
        float crossPos = (row ? layout.top : layout.left) + (availableCross - crossSize) / 2;

        child->inheritedScale = contentScale;
        if (row) {
            child->base_layout = {mainPos, crossPos, mainSize, crossSize};
        } else {
            child->base_layout = {crossPos, mainPos, crossSize, mainSize};
        }
        mainPos += mainSize + scaledGap;
    }
}

void View::draw(sf::RenderTarget& target) {
    if (!visible) return;
    target.draw(shape);
    for (const auto& child : children) {
        if (child) child->draw(target);
    }
}

bool View::handleEvent(const sf::Event& event) {
    if (!visible) return false;
    for (auto& child : children) {
        if (child && child->handleEvent(event)) return true;
    }
    return false;
}
