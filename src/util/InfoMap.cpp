#include "util/InfoMap.hpp"

#include <iomanip>                        // std::setprecision
#include <sstream>                        // std::ostringstream

std::string toString(const InfoValue& value) {
    std::ostringstream oss;
    if (const auto* b = std::get_if<bool>(&value)) {
        oss << (*b ? "true" : "false");
    } else if (const auto* i = std::get_if<long long>(&value)) {
        oss << *i;
    } else if (const auto* d = std::get_if<double>(&value)) {
        oss << std::fixed << std::setprecision(3) << *d;
    } else {
        oss << std::get<std::string>(value);
    }
    return oss.str();
}

std::string toString(const InfoMap& info) {
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& kv : info) {
        if (!first) oss << ", ";
        oss << kv.first << "=" << toString(kv.second);
        first = false;
    }
    oss << "}";
    return oss.str();
}

bool infoBool(const InfoMap& info, const std::string& key) {
    return std::get<bool>(info.at(key));
}

long long infoInt(const InfoMap& info, const std::string& key) {
    return std::get<long long>(info.at(key));
}

double infoDouble(const InfoMap& info, const std::string& key) {
    return std::get<double>(info.at(key));
}

std::string infoString(const InfoMap& info, const std::string& key) {
    return std::get<std::string>(info.at(key));
}
