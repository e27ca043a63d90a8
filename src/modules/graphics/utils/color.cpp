#include <cmath>
#include <modules/graphics/utils/color.hpp>
#include <modules/utils/mathUtils.hpp>

namespace {
    sf::Uint8 toByte(float channel) {
        return static_cast<sf::Uint8>(std::lround(clamp01(channel) * 255.0f));
    }
}

sf::Color Color::toSFML() const {
    return {toByte(r), toByte(g), toByte(b), toByte(a)};
}

Color Color::fromSFML(const sf::Color& color) {
    return {color.r / 255.0f, color.g / 255.0f, color.b / 255.0f, color.a / 255.0f};
}

Color interpolate(const Color& c1, const Color& c2, float x) {
    return {interpolate(c1.r, c2.r, x),
            interpolate(c1.g, c2.g, x),
            interpolate(c1.b, c2.b, x),
            interpolate(c1.a, c2.a, x)};
}

Color multiplyRGB(const Color& c, float multiplier) {
    return {c.r * multiplier, c.g * multiplier, c.b * multiplier, c.a};
}
