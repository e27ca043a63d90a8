#ifndef COLOR
#define COLOR

#include <SFML/Graphics/Color.hpp>

// Floating point RGBA, each channel in [0, 1]
struct Color {
    float r = 1.0f;
    float g = 1.0f;
    float b = 1.0f;
    float a = 1.0f;

    bool operator==(const Color& other) const = default;

    [[nodiscard]] sf::Color toSFML() const;
    static Color fromSFML(const sf::Color& color);
};

Color interpolate(const Color& c1, const Color& c2, float x);

// Scales r, g and b, alpha is left as is
Color multiplyRGB(const Color& c, float multiplier);

#endif
