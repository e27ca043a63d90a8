#ifndef TRANSFORM
#define TRANSFORM

#include <SFML/System/Vector3.hpp>

class UITransform {
public:
    [[nodiscard]] sf::Vector3f getScale() const {
        return m_scale;
    }

    void setScale(const sf::Vector3f& scale) {
        m_scale = scale;
    }

    [[nodiscard]] bool isIdentity() const {
        return m_scale == sf::Vector3f(1, 1, 1);
    }

    static UITransform Scale(float value) { return UITransform({value, value, value}); }
    static UITransform Scale(const sf::Vector3f& value) { return UITransform(value); }

private:
    explicit UITransform(const sf::Vector3f& scale) : m_scale(scale) {}
    sf::Vector3f m_scale;
};

#endif
