#ifndef MATHUTILS_HPP
#define MATHUTILS_HPP

#include <SFML/System/Vector3.hpp>

constexpr float PI = 3.14159265358979323846f;
constexpr float HALF_PI = PI / 2;
constexpr float TWO_PI = PI * 2;

float clamp(float min_val, float x, float max_val);
float clamp01(float x);

float interpolate(float a, float b, float x);
sf::Vector3f interpolate(const sf::Vector3f& a, const sf::Vector3f& b, float x);

// Ease-out sine over [0, 1]: fast start, slow finish
float easeOutSine(float t);

// One full sine cycle over [0, 1] whose amplitude decays linearly to zero at t = 1
float punchOffset(float t, float strength);

#endif // MATHUTILS_HPP
