#include "modules/graphics/utils/styleParser.hpp"
#include "modules/utils/stringUtils.hpp"
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <string>
#include <vector>
#include <regex>

using namespace std;

unordered_map<string, string> parseStyleString(const string& styleString) {
    unordered_map<string, string> result;
    istringstream ss(styleString);
    string token;
    regex keyValuePattern("([^:]+):\\s*([^;]+)");

    while (getline(ss, token, ';')) {
        smatch match;
        if (regex_search(token, match, keyValuePattern)) {
            result[trim(match[1].str())] = trim(match[2].str());
        }
    }
    return result;
}

float parseValue(const string& value) {
    if (value.find("px") != string::npos) {
        return stof(value.substr(0, value.find("px")));
    }
    return 0; // Default
}

float parseNumber(const string& value, const string& property) {
    try {
        size_t consumed = 0;
        float number = stof(value, &consumed);
        if (!trim(value.substr(consumed)).empty()) {
            throw invalid_argument(value);
        }
        return number;
    } catch (const logic_error&) {
        throw runtime_error("Invalid value for " + property + ": '" + value + "'");
    }
}

// Accepts "0.15s", "150ms" or bare seconds
float parseTime(const string& value, const string& property) {
    string trimmed = trim(value);
    if (trimmed.size() > 2 && trimmed.ends_with("ms")) {
        return parseNumber(trimmed.substr(0, trimmed.size() - 2), property) / 1000.0f;
    }
    if (trimmed.size() > 1 && trimmed.ends_with("s")) {
        return parseNumber(trimmed.substr(0, trimmed.size() - 1), property);
    }
    return parseNumber(trimmed, property);
}

Color parseColor(const string& value) {
    if (value == "transparent") {
        return {0, 0, 0, 0};
    }
    if (value.find("rgba") != string::npos) {
        regex rgbaPattern(R"(rgba\((\d+),\s*(\d+),\s*(\d+),\s*(\d+)\))");
        smatch match;
        if (regex_search(value, match, rgbaPattern)) {
            return Color::fromSFML(sf::Color(stoi(match[1].str()), stoi(match[2].str()),
                                             stoi(match[3].str()), stoi(match[4].str())));
        }
    } else if (value.find("rgb") != string::npos) {
        regex rgbPattern(R"(rgb\((\d+),\s*(\d+),\s*(\d+)\))");
        smatch match;
        if (regex_search(value, match, rgbPattern)) {
            return Color::fromSFML(sf::Color(stoi(match[1].str()), stoi(match[2].str()),
                                             stoi(match[3].str())));
        }
    } else if (value.find('#') != string::npos) {
        string hex = value.substr(value.find('#') + 1);
        if (hex.size() == 6 || hex.size() == 8) {
            sf::Color color(stoi(hex.substr(0, 2), nullptr, 16),
                            stoi(hex.substr(2, 2), nullptr, 16),
                            stoi(hex.substr(4, 2), nullptr, 16));
            if (hex.size() == 8) {
                color.a = stoi(hex.substr(6, 2), nullptr, 16);
            }
            return Color::fromSFML(color);
        }
    }
    return {}; // White
}

Direction parseDirection(const string& value) {
    if (value == "column") {
        return Direction::Column;
    }
    return Direction::Row; // Default
}

// "scale(0.9)" or "scale(1, 0.8, 1)"
sf::Vector3f parseTransform(const string& value) {
    regex scalePattern(R"(scale\(\s*([^,\)]+)(?:,\s*([^,\)]+),\s*([^,\)]+))?\s*\))");
    smatch match;
    if (regex_search(value, match, scalePattern)) {
        float x = parseNumber(match[1].str(), "transform");
        if (match[2].matched) {
            return {x, parseNumber(match[2].str(), "transform"), parseNumber(match[3].str(), "transform")};
        }
        return {x, x, x};
    }
    return {1, 1, 1};
}
