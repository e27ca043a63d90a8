#include "cmath"
#include <algorithm>
#include <modules/utils/mathUtils.hpp>

float clamp(float min_val, float x, float max_val) {
    return std::max(min_val, std::min(x, max_val));
}

float clamp01(float x) {
    return clamp(0.0f, x, 1.0f);
}

float interpolate(float a, float b, float x) {
    return a + (b - a) * x;
}

sf::Vector3f interpolate(const sf::Vector3f& a, const sf::Vector3f& b, float x) {
    return {interpolate(a.x, b.x, x),
            interpolate(a.y, b.y, x),
            interpolate(a.z, b.z, x)};
}

float easeOutSine(float t) {
    t = clamp01(t);
    return std::sin(t * HALF_PI);
}

float punchOffset(float t, float strength) {
    t = clamp01(t);
    return std::sin(t * TWO_PI) * (1.0f - t) * strength;
}
