#include "model/Types.hpp"

const std::vector<std::string>& canonicalTokens() {
    static const std::vector<std::string> tokens = {
        "fontSize", "spacing", "radius", "lineHeight", "shadow", "border"};
    return tokens;
}

const std::vector<std::string>& outputTailNames() {
    static const std::vector<std::string> names = {
        "renderTime", "bundleSize", "memoryUsage", "layoutShift",
        "satisfaction_mean", "satisfaction_std",
        "accessibility_fontSize", "accessibility_tapTarget"};
    return names;
}

const std::vector<std::string>& outputNames() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> n;
        for (const auto& token : canonicalTokens()) {
            for (const char* field : {"scale", "min", "max", "step"}) {
                n.push_back(token + "_" + field);
            }
        }
        n.insert(n.end(), outputTailNames().begin(), outputTailNames().end());
        return n;
    }();
    return names;
}
