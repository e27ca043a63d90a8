#include <string>
#include <algorithm>
#include <cctype>
#include <modules/utils/stringUtils.hpp>

using namespace std;

string trim(const string& str) {
    auto isSpace = [](char ch) { return isspace(static_cast<unsigned char>(ch)); };

    auto start = find_if_not(str.begin(), str.end(), isSpace);
    if (start == str.end()) {
        return "";
    }
    auto end = find_if_not(str.rbegin(), str.rend(), isSpace).base();
    return {start, end};
}

// Empty tokens are dropped, so "a  b" splits into two keys
vector<string> split(const string& str, const string& delimiter) {
    vector<string> tokens;
    size_t start = 0, end = 0;
    while ((end = str.find(delimiter, start)) != string::npos) {
        if (end > start) {
            tokens.push_back(str.substr(start, end - start));
        }
        start = end + delimiter.length();
    }
    if (start < str.size()) {
        tokens.push_back(str.substr(start));
    }
    return tokens;
}
