#ifndef SCALE_EFFECT
#define SCALE_EFFECT

#include <SFML/Graphics.hpp>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "modules/graphics/utils/UIElement.hpp"
#include "modules/graphics/utils/animation.hpp"
#include "boundVisuals.hpp"
#include "colorCache.hpp"

using namespace std;

enum class PressState { Idle, Pressing, Pressed, Releasing };

/**
 * Press feedback for an interactive element. Pointer down shrinks the target and
 * darkens every bound image and text; pointer up punches the target past its
 * resting scale and fades the visuals back to their original colours.
 *
 * The effect owns nothing in the scene: the host, the target and the visuals are
 * held weakly and silently skipped once destroyed. At most one animation runs at a
 * time, starting another cancels it where it stands. The host drives the effect
 * by calling update() once per frame.
 *
 * The effect is active while it is enabled and the host's own visible flag is set.
 * Ancestors are not consulted: hiding a container does not hide the elements in it,
 * so hosts that can disappear with their parent should be hidden themselves.
 *
 * Properties: target, include, exclude (element keys), scale-amount, duration,
 * punch-strength, punch-duration and pressed-color-multiplier.
 */
class ScaleEffect {
public:
    explicit ScaleEffect(const shared_ptr<UIElement>& host,
                         const unordered_map<string, string>& properties = {});
    ~ScaleEffect();

    ScaleEffect(const ScaleEffect&) = delete;
    ScaleEffect& operator=(const ScaleEffect&) = delete;

    // Translates left mouse and touch presses on the host into pointer events.
    // Release is delivered to the effect that saw the press, wherever the pointer is.
    bool handleEvent(const sf::Event& event);

    // Advances the running animation by dt seconds
    void update(float dt);

    void onPointerDown();
    void onPointerUp();

    // Re-resolves the target and rebuilds the bound visuals and the original colour cache
    void rebind();

    // Disabling cancels any animation and restores resting scale and original colours
    void setEnabled(bool enabled);
    [[nodiscard]] bool isEnabled() const { return enabled; }

    // Take effect on the next rebind
    void setTarget(const shared_ptr<UIElement>& target);
    void include(const shared_ptr<UIElement>& element);
    void exclude(const shared_ptr<UIElement>& element);

    [[nodiscard]] PressState getState() const { return state; }
    [[nodiscard]] shared_ptr<UIElement> getTarget() const { return actualTarget.lock(); }
    [[nodiscard]] sf::Vector3f getRestingScale() const { return restingScale; }
    [[nodiscard]] const BoundVisuals& getVisuals() const { return visuals; }
    [[nodiscard]] const ColorCache& getColorCache() const { return originalColors; }

    [[nodiscard]] float getScaleAmount() const { return scaleAmount; }
    [[nodiscard]] float getDuration() const { return duration; }
    [[nodiscard]] float getPunchStrength() const { return punchStrength; }
    [[nodiscard]] float getPunchDuration() const { return punchDuration; }
    [[nodiscard]] float getPressedColorMultiplier() const { return pressedColorMultiplier; }

private:
    [[nodiscard]] bool isActive() const;
    void resolveTarget();
    void resolveKeys(const string& keys, WeakList<UIElement>& result) const;
    [[nodiscard]] shared_ptr<UIElement> findByKey(const string& key) const;
    void deactivate();
    void cancelAnimation();
    void applyScale(const sf::Vector3f& scale);

    void startPress();
    void startRelease();
    void lerpColorsToPressed(const ColorSnapshot& start, float t);
    void lerpColorsToOriginal(const ColorSnapshot& start, float t);
    void setColorsPressed();

    weak_ptr<UIElement> host;
    weak_ptr<UIElement> targetOverride;
    weak_ptr<UIElement> actualTarget;
    sf::Vector3f restingScale = {1, 1, 1};

    string targetKey;
    string includeKeys;
    string excludeKeys;
    WeakList<UIElement> includedElements;
    WeakList<UIElement> excludedElements;

    BoundVisuals visuals;
    ColorCache originalColors;
    unique_ptr<Animation> animation;
    PressState state = PressState::Idle;
    bool enabled = true;
    bool wasActive = true;
    bool pointerHeld = false;

    // Fixed once the property map has been applied
    float scaleAmount = 0.95f;
    float duration = 0.1f;
    float punchStrength = 0.08f;
    float punchDuration = 0.15f;
    float pressedColorMultiplier = 0.85f;

    unordered_map<string, function<void(const string &)>> propertySetters = {
      {"target",  [this](const string& v) { targetKey = v; }},
      {"include", [this](const string& v) { includeKeys = v; }},
      {"exclude", [this](const string& v) { excludeKeys = v; }},
      {"scale-amount",   [this](const string& v) { scaleAmount = parseNumber(v, "scale-amount"); }},
      {"duration",       [this](const string& v) { duration = parseTime(v, "duration"); }},
      {"punch-strength", [this](const string& v) { punchStrength = parseNumber(v, "punch-strength"); }},
      {"punch-duration", [this](const string& v) { punchDuration = parseTime(v, "punch-duration"); }},
      {"pressed-color-multiplier", [this](const string& v) {
          pressedColorMultiplier = clamp01(parseNumber(v, "pressed-color-multiplier"));
      }},
    };
};

#endif
