#ifndef VIEW
#define VIEW

#include <SFML/Graphics.hpp>
#include "modules/graphics/utils/UIElement.hpp"
#include "modules/graphics/utils/color.hpp"
#include "vector"
#include "memory"

// Container that stacks its visible children along one axis, centred in both
class View : public UIElement {
public:
    explicit View(const unordered_map<string, string>& properties,
                  const vector<shared_ptr<UIElement>>& children = {});

    void draw(sf::RenderTarget& target) override;
    bool handleEvent(const sf::Event& event) override;
    void onLayout() override;

    sf::RectangleShape shape;
    Direction flexDirection = Direction::Row;
    Color backgroundColor = {0, 0, 0, 0};
    Color borderColor = {0, 0, 0, 0};
    float borderStroke = 0;
    float gap = 0;

private:
    void updateLayout();
};

#endif
