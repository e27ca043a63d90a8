#ifndef TEST_SCENE
#define TEST_SCENE

#include <cmath>
#include <memory>
#include <modules/graphics/components/view.hpp>
#include <modules/graphics/components/image.hpp>
#include <modules/graphics/components/text.hpp>
#include <modules/graphics/effects/scaleEffect.hpp>

// A button: icon, label and badge in a row, plus a hidden icon in a nested view
struct TestScene {
    shared_ptr<ImageElement> icon = make_shared<ImageElement>(unordered_map<string, string>{
        {"key", "icon"}, {"style", "width: 32px; height: 32px; tint: #ffffff"}});
    shared_ptr<Text> label = make_shared<Text>(unordered_map<string, string>{
        {"key", "label"}, {"style", "color: rgba(255, 255, 255, 255)"}}, "Play");
    shared_ptr<ImageElement> badge = make_shared<ImageElement>(unordered_map<string, string>{
        {"key", "badge"}, {"style", "width: 8px; height: 8px; tint: #ff0000"}});
    shared_ptr<ImageElement> hiddenIcon = make_shared<ImageElement>(unordered_map<string, string>{
        {"key", "hiddenIcon"}, {"style", "visible: false; tint: #808080"}});
    shared_ptr<View> inner = make_shared<View>(unordered_map<string, string>{{"key", "inner"}},
                                               vector<shared_ptr<UIElement>>{hiddenIcon});
    shared_ptr<View> root = make_shared<View>(unordered_map<string, string>{{"key", "button"}},
                                              vector<shared_ptr<UIElement>>{icon, label, badge, inner});

    TestScene() {
        root->base_layout = {0, 0, 100, 100};
        root->onLayout();
    }
};

inline constexpr float kFrame = 1.0f / 60.0f;

// Steps well past the given time so every animation reaches its end
inline void runFor(ScaleEffect& effect, float seconds, float dt = kFrame) {
    int frames = (int)std::ceil(seconds / dt) + 2;
    for (int i = 0; i < frames; i++) {
        effect.update(dt);
    }
}

#endif
