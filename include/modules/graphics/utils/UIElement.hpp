#ifndef UI_ELEMENT
#define UI_ELEMENT

#include "SFML/Graphics.hpp"
#include "transform.hpp"
#include "styleParser.hpp"
#include <unordered_map>
#include <functional>
#include <memory>
#include <string>
#include <vector>

using namespace std;

class UIElement {
public:
    explicit UIElement(const unordered_map<string, string>& properties,
                       const vector<shared_ptr<UIElement>>& children = {});
    virtual ~UIElement() = default;

    virtual void draw(sf::RenderTarget &target) = 0;
    virtual bool handleEvent(const sf::Event &event) { return false; };
    virtual void onLayout();
    virtual void restyle();

    [[nodiscard]] virtual bool contains(const sf::Vector2f &point) const {
        return layout.contains(point);
    };

    void setStyle(unordered_map<string, string> style);
    void setProperties(unordered_map<string, string> properties);

    // Depth first search of this element and its descendants
    [[nodiscard]] shared_ptr<UIElement> find(const string& key) const;

    // Scale of this element multiplied through its ancestors
    [[nodiscard]] sf::Vector2f getContentScale() const;

    unordered_map<string, string> style;
    string key;
    float width = 0;
    float height = 0;
    bool visible = true;

    sf::FloatRect base_layout = {0, 0, 0, 0};
    sf::FloatRect layout = {0, 0, 0, 0};
    sf::Vector2f inheritedScale = {1, 1};
    UITransform transform = UITransform::Scale(1);
    vector<shared_ptr<UIElement>> children;

    unordered_map<string, function<void(const string &)>> styleSetters = {
      {"width",     [this](const string &v) { width = parseValue(v); }},
      {"height",    [this](const string &v) { height = parseValue(v); }},
      {"visible",   [this](const string &v) { visible = (v == "true"); }},
      {"transform", [this](const string &v) { transform.setScale(parseTransform(v)); }},
    };

    unordered_map<string, function<void(const string &)>> propertySetters = {
      {"key", [this](const string& v) { key = v; }},
      {"style", [this](const string& v) {
          for (const auto& [property, value] : parseStyleString(v)) {
              style[property] = value;
          }
      }},
    };
};

// Collects every element of type T in the subtree rooted at root, root included.
// Hidden elements are collected too.
template<typename T>
void collectElements(const shared_ptr<UIElement>& root, vector<shared_ptr<T>>& result) {
    if (!root) return;
    if (auto element = dynamic_pointer_cast<T>(root)) {
        result.push_back(element);
    }
    for (const auto& child : root->children) {
        collectElements(child, result);
    }
}

#endif
