#include <modules/graphics/effects/scaleEffect.hpp>
#include <modules/utils/mathUtils.hpp>
#include <modules/utils/stringUtils.hpp>
#include <modules/utils/print.hpp>

namespace {
    template<typename T>
    void lerpToPressed(const vector<pair<weak_ptr<T>, Color>>& start, const ColorCache& cache,
                       float multiplier, float t) {
        for (const auto& [entry, startColor] : start) {
            auto element = entry.lock();
            if (!element) continue;
            // Elements bound after the last capture fall back to their own start colour
            Color original = cache.getOriginal(element).value_or(startColor);
            element->setColor(interpolate(startColor, multiplyRGB(original, multiplier), t));
        }
    }

    template<typename T>
    void lerpToOriginal(const vector<pair<weak_ptr<T>, Color>>& start, const ColorCache& cache, float t) {
        for (const auto& [entry, startColor] : start) {
            auto element = entry.lock();
            if (!element) continue;
            if (auto original = cache.getOriginal(element)) {
                element->setColor(interpolate(startColor, *original, t));
            }
        }
    }

    template<typename T>
    void setPressed(const WeakList<T>& elements, const ColorCache& cache, float multiplier) {
        for (const auto& entry : elements) {
            auto element = entry.lock();
            if (!element) continue;
            if (auto original = cache.getOriginal(element)) {
                element->setColor(multiplyRGB(*original, multiplier));
            }
        }
    }
}

ScaleEffect::ScaleEffect(const shared_ptr<UIElement>& hostElement,
                         const unordered_map<string, string>& properties)
    : host(hostElement) {
    for (const auto& [property, setter] : propertySetters) {
        auto it = properties.find(property);
        if (it != properties.end()) {
            setter(it->second);
        }
    }

    rebind();
    wasActive = isActive();
}

ScaleEffect::~ScaleEffect() {
    if (enabled) {
        deactivate();
    }
}

bool ScaleEffect::isActive() const {
    auto hostElement = host.lock();
    return enabled && hostElement && hostElement->visible;
}

shared_ptr<UIElement> ScaleEffect::findByKey(const string& key) const {
    auto hostElement = host.lock();
    if (!hostElement || key.empty()) return nullptr;
    if (hostElement->key == key) return hostElement;
    return hostElement->find(key);
}

void ScaleEffect::resolveKeys(const string& keys, WeakList<UIElement>& result) const {
    for (const auto& key : split(keys)) {
        if (auto element = findByKey(key)) {
            result.push_back(element);
        } else {
            consoleLog("Scale effect could not find element '", key, "'");
        }
    }
}

// Explicit override first, then the keyed element, then the host itself.
// The resting scale is only recorded when the target changes. A change always ends
// the running animation since its setters would otherwise drive the new target.
void ScaleEffect::resolveTarget() {
    shared_ptr<UIElement> target = targetOverride.lock();
    if (!target && !targetKey.empty()) {
        target = findByKey(targetKey);
    }
    if (!target) {
        target = host.lock();
    }

    auto previous = actualTarget.lock();
    if (target == previous && target) return;

    cancelAnimation();
    state = PressState::Idle;
    if (previous) {
        applyScale(restingScale);
    }
    actualTarget = target;
    if (target) {
        restingScale = target->transform.getScale();
    }
}

void ScaleEffect::rebind() {
    resolveTarget();

    removeExpiredAndDuplicates(includedElements);
    removeExpiredAndDuplicates(excludedElements);

    WeakList<UIElement> include = includedElements;
    WeakList<UIElement> exclude = excludedElements;
    resolveKeys(includeKeys, include);
    resolveKeys(excludeKeys, exclude);

    visuals.bind(host.lock(), include, exclude);
    originalColors.capture(visuals);

    if (auto hostElement = host.lock()) {
        consoleLog("Scale effect on '", hostElement->key, "' bound ", visuals.getImages().size(),
                   " images and ", visuals.getTexts().size(), " texts");
    }
}

void ScaleEffect::setTarget(const shared_ptr<UIElement>& target) {
    targetOverride = target;
}

void ScaleEffect::include(const shared_ptr<UIElement>& element) {
    if (element) includedElements.push_back(element);
}

void ScaleEffect::exclude(const shared_ptr<UIElement>& element) {
    if (element) excludedElements.push_back(element);
}

void ScaleEffect::setEnabled(bool value) {
    if (enabled == value) return;
    enabled = value;
    if (!enabled) {
        deactivate();
        wasActive = false;
    } else {
        wasActive = isActive();
    }
}

bool ScaleEffect::handleEvent(const sf::Event& event) {
    // Inactive effects leave presses to whoever else wants them
    auto pressedAt = [this](float x, float y) {
        if (!isActive()) return false;
        auto hostElement = host.lock();
        return hostElement && hostElement->contains({x, y});
    };

    switch (event.type) {
        case sf::Event::MouseButtonPressed:
            if (event.mouseButton.button == sf::Mouse::Left
                && pressedAt((float)event.mouseButton.x, (float)event.mouseButton.y)) {
                pointerHeld = true;
                onPointerDown();
                return true;
            }
            break;
        case sf::Event::TouchBegan:
            if (pressedAt((float)event.touch.x, (float)event.touch.y)) {
                pointerHeld = true;
                onPointerDown();
                return true;
            }
            break;
        case sf::Event::MouseButtonReleased:
            if (event.mouseButton.button == sf::Mouse::Left && pointerHeld) {
                pointerHeld = false;
                onPointerUp();
                return true;
            }
            break;
        case sf::Event::TouchEnded:
            if (pointerHeld) {
                pointerHeld = false;
                onPointerUp();
                return true;
            }
            break;
        default:
            break;
    }
    return false;
}

void ScaleEffect::update(float dt) {
    if (!isActive()) {
        // Host hidden or destroyed since the last frame
        if (wasActive) {
            deactivate();
        }
        wasActive = false;
        return;
    }
    wasActive = true;

    if (animation && !animation->completed) {
        animation->update(dt);
    }
}

void ScaleEffect::onPointerDown() {
    if (!isActive() || actualTarget.expired()) return;
    cancelAnimation();
    startPress();
}

void ScaleEffect::onPointerUp() {
    if (!isActive() || actualTarget.expired()) return;
    cancelAnimation();
    startRelease();
}

void ScaleEffect::cancelAnimation() {
    if (animation) {
        animation->cancel();
        animation.reset();
    }
}

void ScaleEffect::deactivate() {
    cancelAnimation();
    pointerHeld = false;
    applyScale(restingScale);
    originalColors.restore();
    state = PressState::Idle;
}

void ScaleEffect::applyScale(const sf::Vector3f& scale) {
    auto target = actualTarget.lock();
    if (!target) return;
    target->transform.setScale(scale);
    target->onLayout();
}

// Shrinks from wherever the target currently is towards resting * scaleAmount
void ScaleEffect::startPress() {
    auto target = actualTarget.lock();
    if (!target) return;

    sf::Vector3f startScale = target->transform.getScale();
    sf::Vector3f endScale = restingScale * scaleAmount;
    ColorSnapshot start = ColorSnapshot::take(visuals);

    state = PressState::Pressing;
    animation = make_unique<Animation>(
        [this, startScale, endScale, start](float t) {
            applyScale(interpolate(startScale, endScale, t));
            lerpColorsToPressed(start, t);
        },
        duration, easeOutSine,
        [this, endScale]() {
            applyScale(endScale);
            setColorsPressed();
            state = PressState::Pressed;
        });
    animation->start();
}

// One decaying oscillation about the resting scale while colours fade back
void ScaleEffect::startRelease() {
    ColorSnapshot start = ColorSnapshot::take(visuals);

    state = PressState::Releasing;
    animation = make_unique<Animation>(
        [this, start](float t) {
            applyScale(restingScale * (1.0f + punchOffset(t, punchStrength)));
            lerpColorsToOriginal(start, t);
        },
        punchDuration, nullptr,
        [this]() {
            applyScale(restingScale);
            originalColors.restore();
            state = PressState::Idle;
        });
    animation->start();
}

void ScaleEffect::lerpColorsToPressed(const ColorSnapshot& start, float t) {
    lerpToPressed(start.images, originalColors, pressedColorMultiplier, t);
    lerpToPressed(start.texts, originalColors, pressedColorMultiplier, t);
}

void ScaleEffect::lerpColorsToOriginal(const ColorSnapshot& start, float t) {
    lerpToOriginal(start.images, originalColors, t);
    lerpToOriginal(start.texts, originalColors, t);
}

void ScaleEffect::setColorsPressed() {
    setPressed(visuals.getImages(), originalColors, pressedColorMultiplier);
    setPressed(visuals.getTexts(), originalColors, pressedColorMultiplier);
}
