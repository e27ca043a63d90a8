#ifndef STRING_UTILS
#define STRING_UTILS

#include <string>
#include <vector>

using namespace std;

// Function to trim leading and trailing spaces from a string
string trim(const string& str);
vector<string> split(const string& str, const string& delimiter=" ");

#endif
