#ifndef ANIMATION
#define ANIMATION

#include <functional>
#include <utility>
#include "modules/utils/mathUtils.hpp"

/**
 * A timed transition advanced by the frame delta. Each update hands the setter the
 * eased progress in [0, 1]. Once the elapsed time reaches the duration the setter is
 * skipped and onComplete snaps the animated values to their exact end state.
 */
class Animation {
public:
    Animation(std::function<void(float)> setter, float duration = 0.1,
              std::function<float(float)> easing = nullptr,
              std::function<void()> onComplete = nullptr)
            : duration(duration), setter(std::move(setter)),
              easing(std::move(easing)), onComplete(std::move(onComplete)) {}

    // Zero or negative durations finish straight away
    void start() {
        elapsed = 0;
        completed = false;
        if (duration <= 0) {
            finish();
        }
    }

    void update(float dt) {
        if (completed) return;
        elapsed += dt;
        if (elapsed >= duration) {
            finish();
            return;
        }
        float progress = clamp01(elapsed / duration);
        if (easing) {
            progress = easing(progress);
        }
        if (setter) {
            setter(progress);
        }
    }

    // Stops where it is, nothing is rolled back
    void cancel() {
        completed = true;
    }

    bool completed = true;
    float duration = 0.1;
    float elapsed = 0;
    std::function<void(float)> setter;
    std::function<float(float)> easing;
    std::function<void()> onComplete;

private:
    void finish() {
        completed = true;
        if (onComplete) {
            onComplete();
        }
    }
};

#endif
