#pragma once                              // ensure this header is included only once per translation unit

#include <map>                            // std::map keeps keys sorted for stable printing
#include <string>                         // std::string
#include <variant>                        // std::variant for heterogeneous values

// Key/value record used for statistics, suitability analysis, metrics and parameters.
using InfoValue = std::variant<bool, long long, double, std::string>;
using InfoMap   = std::map<std::string, InfoValue>;

// Render a single value ("true", "42", "0.500", "SPARSE").
std::string toString(const InfoValue& value);

// Render a whole map as "{a=1, b=true}".
std::string toString(const InfoMap& info);

// Typed lookups; throw std::out_of_range if the key is missing and
// std::bad_variant_access if it holds another type.
bool        infoBool(const InfoMap& info, const std::string& key);
long long   infoInt(const InfoMap& info, const std::string& key);
double      infoDouble(const InfoMap& info, const std::string& key);
std::string infoString(const InfoMap& info, const std::string& key);
