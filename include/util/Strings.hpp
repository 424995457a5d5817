#pragma once                              // ensure this header is included only once per translation unit

#include <string>                         // std::string

// ---------- helper: to-lower a string (safe cast to unsigned char) ----------
// Used by every case-insensitive name parser (strategies, factory, log levels).
std::string to_lower(std::string s);
