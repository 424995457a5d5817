// ==========================
// Strings.cpp
// ==========================
// Small string helpers shared by the name parsers.
// ==========================

#include "util/Strings.hpp"

#include <cctype>                         // std::tolower

std::string to_lower(std::string s) {                              // Copy input string.
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c))); // Lowercase each byte.
    return s;                                                      // Return transformed string.
}
