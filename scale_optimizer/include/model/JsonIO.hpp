#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "model/Types.hpp"

// nlohmann::json bindings for the data model. Input documents may omit optional
// fields; required numeric fields use the defaults of the structs.

void from_json(const nlohmann::json& j, Breakpoint& b);
void to_json(nlohmann::json& j, const Breakpoint& b);

void from_json(const nlohmann::json& j, ScalingToken& t);
void to_json(nlohmann::json& j, const ScalingToken& t);

void from_json(const nlohmann::json& j, ScalingStrategy& s);
void from_json(const nlohmann::json& j, ResponsiveConfig& c);

void from_json(const nlohmann::json& j, ResponsiveValueUsage& v);
void from_json(const nlohmann::json& j, ComponentUsageData& d);

void from_json(const nlohmann::json& j, ModelLabels& l);
void from_json(const nlohmann::json& j, TrainingData& t);

void to_json(nlohmann::json& j, const TrainingMetrics& m);
void to_json(nlohmann::json& j, const CrossValidationMetrics& m);
void to_json(nlohmann::json& j, const HyperparameterAdvice& a);
void to_json(nlohmann::json& j, const ScalingCurveRecommendation& r);
void to_json(nlohmann::json& j, const PerformanceImpact& p);
void to_json(nlohmann::json& j, const AccessibilityWarning& w);
void to_json(nlohmann::json& j, const EstimatedImprovements& e);
void to_json(nlohmann::json& j, const OptimizationSuggestions& s);
void to_json(nlohmann::json& j, const ModelInfo& i);

template <typename T>
void to_json(nlohmann::json& j, const HyperparameterSuggestion<T>& s) {
    j = nlohmann::json{{"current", s.current}, {"suggested", s.suggested}, {"reason", s.reason}};
}

// Reads a whole JSON document from disk; throws std::runtime_error when the
// file cannot be opened and nlohmann::json::exception when it does not parse.
nlohmann::json readJsonFile(const std::string& path);
