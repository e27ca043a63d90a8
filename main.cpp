// main.cpp
#include <SFML/Graphics.hpp>
#include "stdexcept"
#include <memory>
#include <vector>
#include <modules/graphics/fontManager.hpp>
#include <modules/graphics/spriteManager.hpp>
#include <modules/graphics/components/view.hpp>
#include <modules/graphics/components/image.hpp>
#include <modules/graphics/components/text.hpp>
#include <modules/graphics/effects/scaleEffect.hpp>
#include <modules/utils/print.hpp>

namespace {
    // Icons for when the asset folder is missing
    sf::Image makeDisc(unsigned int size, const sf::Color& color) {
        sf::Image image;
        image.create(size, size, sf::Color::Transparent);
        float radius = size / 2.0f;
        for (unsigned int y = 0; y < size; y++) {
            for (unsigned int x = 0; x < size; x++) {
                float dx = x + 0.5f - radius;
                float dy = y + 0.5f - radius;
                if (dx * dx + dy * dy <= radius * radius) {
                    image.setPixel(x, y, color);
                }
            }
        }
        return image;
    }

    shared_ptr<View> makeButton(const string& key, const string& icon, const string& label, bool withBadge) {
        vector<shared_ptr<UIElement>> children = {
            make_shared<ImageElement>(unordered_map<string, string>{
                {"key", key + "-icon"},
                {"style", "image: " + icon + "; width: 40px; height: 40px; tint: #ffd27f"}}),
            make_shared<Text>(unordered_map<string, string>{
                {"key", key + "-label"},
                {"style", "font-size: 22px; color: #f0f0f0"}}, label),
        };
        if (withBadge) {
            children.push_back(make_shared<ImageElement>(unordered_map<string, string>{
                {"key", key + "-badge"},
                {"style", "image: badge; width: 14px; height: 14px; tint: #ff4040"}}));
        }
        return make_shared<View>(unordered_map<string, string>{
            {"key", key},
            {"style", "width: 260px; height: 64px; gap: 12px; background: #2d3e50; "
                      "border-color: #6f8ba6; border-width: 2px"}}, children);
    }
}

int main() {
    try {
        consoleLog("Starting Tactile demo");
        FontManager::init();
        SpriteManager::init();
        if (SpriteManager::get("play") == nullptr) {
            SpriteManager::add("play", makeDisc(64, sf::Color::White));
            SpriteManager::add("settings", makeDisc(64, sf::Color::White));
            SpriteManager::add("save", makeDisc(64, sf::Color::White));
        }
        SpriteManager::add("badge", makeDisc(32, sf::Color::White));

        sf::RenderWindow window(sf::VideoMode(480, 360), "Tactile");
        window.setFramerateLimit(60);

        vector<shared_ptr<View>> buttons = {
            makeButton("play", "play", "Play", false),
            makeButton("settings", "settings", "Settings", true),
            makeButton("save", "save", "Save", false),
        };
        vector<shared_ptr<UIElement>> rootChildren(buttons.begin(), buttons.end());
        auto root = make_shared<View>(unordered_map<string, string>{
            {"key", "root"},
            {"style", "flex-direction: column; gap: 20px; background: #15202b"}}, rootChildren);
        root->base_layout = {0, 0, 480, 360};
        root->onLayout();

        vector<unique_ptr<ScaleEffect>> effects;
        effects.push_back(make_unique<ScaleEffect>(buttons[0]));
        effects.push_back(make_unique<ScaleEffect>(buttons[1], unordered_map<string, string>{
            {"exclude", "settings-badge"},
            {"punch-strength", "0.12"},
            {"punch-duration", "220ms"}}));
        effects.push_back(make_unique<ScaleEffect>(buttons[2], unordered_map<string, string>{
            {"target", "save-icon"},
            {"scale-amount", "0.8"},
            {"pressed-color-multiplier", "0.6"}}));

        sf::Clock clock;
        while (window.isOpen()) {
            sf::Event event{};
            while (window.pollEvent(event)) {
                if (event.type == sf::Event::Closed) {
                    window.close();
                }
                else if (event.type == sf::Event::Resized) {
                    window.setView(sf::View(sf::FloatRect(0, 0, (float)event.size.width, (float)event.size.height)));
                    root->base_layout = {0, 0, (float)event.size.width, (float)event.size.height};
                    root->onLayout();
                }
                else if (event.type == sf::Event::KeyPressed && event.key.code == sf::Keyboard::R) {
                    for (auto& effect : effects) effect->rebind();
                }
                else if (event.type == sf::Event::KeyPressed && event.key.code == sf::Keyboard::D) {
                    effects[0]->setEnabled(!effects[0]->isEnabled());
                    consoleLog("Play effect ", effects[0]->isEnabled() ? "enabled" : "disabled");
                    if (auto icon = buttons[0]->find("play-icon")) {
                        print("play scale", buttons[0]->transform.getScale(),
                              "icon", static_pointer_cast<ImageElement>(icon)->getColor());
                    }
                }
                for (auto& effect : effects) {
                    if (effect->handleEvent(event)) break;
                }
            }

            float dt = clock.restart().asSeconds();
            for (auto& effect : effects) {
                effect->update(dt);
            }

            window.clear();
            root->draw(window);
            window.display();
        }
    }
    catch (const std::runtime_error& error) {
        std::cerr << "Error: " << error.what() << std::endl;
        return 1;
    }
    return 0;
}
