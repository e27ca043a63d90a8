#ifndef STYLE_PARSER
#define STYLE_PARSER

#include <unordered_map>
#include <string>
#include <SFML/System/Vector3.hpp>
#include "color.hpp"

using namespace std;

enum class Direction { Row, Column };

unordered_map<string, string> parseStyleString(const string& styleString);

float parseValue(const string& value);
float parseNumber(const string& value, const string& property = "");
float parseTime(const string& value, const string& property = "");
Color parseColor(const string& value);
Direction parseDirection(const string& value);
sf::Vector3f parseTransform(const string& value);

#endif
