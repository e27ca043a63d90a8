#ifndef PRINT
#define PRINT

#include <iostream>
#include <string>
#include <SFML/System/Vector3.hpp>
#include <modules/graphics/utils/color.hpp>

inline void printElement(const Color& c) {
    std::cout << "Color(" << c.r << ", " << c.g << ", " << c.b << ", " << c.a << ")";
}

template<typename T>
inline void printElement(const sf::Vector3<T>& v) {
    std::cout << "(" << v.x << ", " << v.y << ", " << v.z << ")";
}

inline void printElement(const std::string& str) {
    std::cout << str;
}

inline void printElement(const char* str) {
    std::cout << str;
}

template <typename T>
inline void printElement(const T& item) {
    std::cout << item;
}

// Space separated
template <typename T, typename... Args>
inline void print(const T& first, const Args&... args) {
    printElement(first);
    if constexpr (sizeof...(args) > 0) {
        std::cout << " ";
        print(args...);
    } else {
        std::cout << std::endl;
    }
}

// Arguments are written back to back, callers supply their own spacing
template <typename... Args>
inline void consoleLog(const Args&... args) {
    std::cout << "[tactile] ";
    (printElement(args), ...);
    std::cout << std::endl;
}

#endif
