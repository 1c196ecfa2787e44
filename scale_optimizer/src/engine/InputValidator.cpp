#include "engine/InputValidator.hpp"

#include <cmath>
#include <string>

#include "utils/Errors.hpp"

void InputValidator::validateUsage(const std::vector<ComponentUsageData>& usage) {
    if (usage.empty()) {
        throw ValidationError("Usage data is required and must be a non-empty array");
    }

    for (std::size_t i = 0; i < usage.size(); ++i) {
        const auto& data = usage[i];
        const std::string where = "Invalid usage data at index " + std::to_string(i) + ": ";

        if (!data.responsiveValues) {
            throw ValidationError(where + "responsiveValues is required");
        }
        for (const auto& v : *data.responsiveValues) {
            if (!std::isfinite(v.baseValue)) {
                throw ValidationError(where + "baseValue of '" + v.property + "' must be a finite number");
            }
        }
    }
}

void InputValidator::validateConfig(const ResponsiveConfig& config) {
    if (!config.strategy) {
        throw ValidationError("Configuration is required for optimization: missing scaling strategy");
    }
    if (!(config.base.width > 0.0)) {
        throw ValidationError("Invalid configuration: base width must be positive");
    }
    for (const auto& bp : config.breakpoints) {
        if (!(bp.width > 0.0)) {
            throw ValidationError("Invalid configuration: breakpoint '" + bp.name + "' must have a positive width");
        }
    }
    for (const auto& [name, token] : config.strategy->tokens) {
        if (token.min > token.max) {
            throw ValidationError("Invalid configuration: token '" + name + "' has min greater than max");
        }
        if (!(token.step > 0.0)) {
            throw ValidationError("Invalid configuration: token '" + name + "' must have a positive step");
        }
    }
}

void InputValidator::validateOptimizationInput(const ResponsiveConfig& config,
                                               const std::vector<ComponentUsageData>& usage) {
    validateUsage(usage);
    validateConfig(config);
}
