#pragma once
#include <vector>

#include "model/Types.hpp"

// Structural checks on optimisation input. Each throws ValidationError with a
// message naming the offending field.
class InputValidator {
public:
    static void validateUsage(const std::vector<ComponentUsageData>& usage);
    static void validateConfig(const ResponsiveConfig& config);

    // usage first, then config
    static void validateOptimizationInput(const ResponsiveConfig& config,
                                          const std::vector<ComponentUsageData>& usage);
};
