#include "model/JsonIO.hpp"

#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

// =======================
//  Helpers
// =======================
static std::optional<double> optionalNumber(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return j.at(key).get<double>();
}

template <std::size_t N>
static void readArray(const json& j, const char* key, std::array<double, N>& out) {
    if (!j.contains(key)) return;
    const auto& arr = j.at(key);
    for (std::size_t i = 0; i < N && i < arr.size(); ++i) {
        out[i] = arr.at(i).get<double>();
    }
}

json readJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open JSON file: " + path);
    }
    json j;
    file >> j;
    return j;
}

// =======================
//  Configuration
// =======================
void from_json(const json& j, Breakpoint& b) {
    b.name   = j.value("name", "");
    b.width  = j.value("width", 0.0);
    b.height = j.value("height", 0.0);
    b.alias  = j.value("alias", "");
}

void to_json(json& j, const Breakpoint& b) {
    j = json{{"name", b.name}, {"width", b.width}, {"height", b.height}};
    if (!b.alias.empty()) j["alias"] = b.alias;
}

void from_json(const json& j, ScalingToken& t) {
    if (j.contains("scale") && j.at("scale").is_number()) {
        t.scale = j.at("scale").get<double>();
    }
    t.min        = j.value("min", t.min);
    t.max        = j.value("max", t.max);
    t.step       = j.value("step", t.step);
    t.curve      = j.value("curve", "");
    t.unit       = j.value("unit", "");
    t.responsive = j.value("responsive", true);
    if (j.contains("precision") && !j.at("precision").is_null()) {
        t.precision = j.at("precision").get<int>();
    }
}

void to_json(json& j, const ScalingToken& t) {
    j = json{{"scale", t.scale},
             {"min", t.min},
             {"max", t.max},
             {"step", t.step},
             {"responsive", t.responsive}};
    if (!t.curve.empty()) j["curve"] = t.curve;
    if (!t.unit.empty()) j["unit"] = t.unit;
    if (t.precision) j["precision"] = *t.precision;
}

void from_json(const json& j, ScalingStrategy& s) {
    s.origin = j.value("origin", s.origin);
    s.mode   = j.value("mode", s.mode);

    if (j.contains("tokens")) {
        for (const auto& item : j.at("tokens").items()) {
            s.tokens[item.key()] = item.value().get<ScalingToken>();
        }
    }
    if (j.contains("rounding")) {
        const auto& r = j.at("rounding");
        s.rounding.mode      = r.value("mode", s.rounding.mode);
        s.rounding.precision = r.value("precision", s.rounding.precision);
    }
    if (j.contains("accessibility")) {
        const auto& a = j.at("accessibility");
        s.accessibility.minFontSize          = a.value("minFontSize", s.accessibility.minFontSize);
        s.accessibility.minTapTarget         = a.value("minTapTarget", s.accessibility.minTapTarget);
        s.accessibility.contrastPreservation = a.value("contrastPreservation", true);
    }
    if (j.contains("performance")) {
        const auto& p = j.at("performance");
        s.performance.memoization      = p.value("memoization", true);
        s.performance.cacheStrategy    = p.value("cacheStrategy", s.performance.cacheStrategy);
        s.performance.precomputeValues = p.value("precomputeValues", false);
    }
}

void from_json(const json& j, ResponsiveConfig& c) {
    if (j.contains("base")) c.base = j.at("base").get<Breakpoint>();
    if (j.contains("breakpoints")) {
        c.breakpoints = j.at("breakpoints").get<std::vector<Breakpoint>>();
    }
    if (j.contains("strategy") && !j.at("strategy").is_null()) {
        c.strategy = j.at("strategy").get<ScalingStrategy>();
    }
}

// =======================
//  Usage data
// =======================
void from_json(const json& j, ResponsiveValueUsage& v) {
    v.property       = j.value("property", "");
    v.baseValue      = j.value("baseValue", 0.0);
    v.token          = j.value("token", "");
    v.usageFrequency = j.value("usageFrequency", 0.0);
    if (j.contains("breakpointValues")) {
        v.breakpointValues = j.at("breakpointValues").get<std::map<std::string, double>>();
    }
    v.satisfactionScore = optionalNumber(j, "satisfactionScore");
}

void from_json(const json& j, ComponentUsageData& d) {
    d.componentId   = j.value("componentId", "");
    d.componentType = j.value("componentType", "");

    if (j.contains("responsiveValues") && !j.at("responsiveValues").is_null()) {
        d.responsiveValues = j.at("responsiveValues").get<std::vector<ResponsiveValueUsage>>();
    }

    if (j.contains("performance")) {
        const auto& p = j.at("performance");
        d.performance.renderTime  = optionalNumber(p, "renderTime");
        d.performance.layoutShift = optionalNumber(p, "layoutShift");
        d.performance.memoryUsage = optionalNumber(p, "memoryUsage");
        d.performance.bundleSize  = optionalNumber(p, "bundleSize");
    }
    if (j.contains("interactions")) {
        const auto& i = j.at("interactions");
        d.interactions.interactionRate    = optionalNumber(i, "interactionRate");
        d.interactions.viewTime           = optionalNumber(i, "viewTime");
        d.interactions.scrollBehavior     = i.value("scrollBehavior", "normal");
        d.interactions.accessibilityScore = optionalNumber(i, "accessibilityScore");
    }
    if (j.contains("context")) {
        const auto& c = j.at("context");
        if (c.contains("parent") && c.at("parent").is_string()) {
            d.context.parent = c.at("parent").get<std::string>();
        }
        if (c.contains("children")) {
            d.context.children = c.at("children").get<std::vector<std::string>>();
        }
        d.context.position   = c.value("position", d.context.position);
        d.context.importance = c.value("importance", d.context.importance);
    }
}

// =======================
//  Features / training data
// =======================
static void readFeatures(const json& j, ModelFeatures& f) {
    if (j.contains("config")) {
        const auto& c = j.at("config");
        f.config.breakpointCount = c.value("breakpointCount", 0.0);
        f.config.tokenComplexity = c.value("tokenComplexity", 0.0);
        f.config.breakpointRatios.fill(1.0);
        readArray(c, "breakpointRatios", f.config.breakpointRatios);
        readArray(c, "originDistribution", f.config.originDistribution);
    }
    if (j.contains("usage")) {
        const auto& u = j.at("usage");
        readArray(u, "commonValues", f.usage.commonValues);
        if (u.contains("valueDistributions")) {
            f.usage.valueDistributions =
                u.at("valueDistributions").get<std::map<std::string, std::vector<double>>>();
        }
        if (u.contains("componentFrequencies")) {
            f.usage.componentFrequencies =
                u.at("componentFrequencies").get<std::map<std::string, double>>();
        }
        if (u.contains("propertyPatterns")) {
            f.usage.propertyPatterns = u.at("propertyPatterns").get<std::map<std::string, double>>();
        }
    }
    if (j.contains("performance")) {
        const auto& p = j.at("performance");
        readArray(p, "avgRenderTimes", f.performance.avgRenderTimes);
        readArray(p, "bundleSizes", f.performance.bundleSizes);
        readArray(p, "memoryPatterns", f.performance.memoryPatterns);
        readArray(p, "layoutShiftFreq", f.performance.layoutShiftFreq);
    }
    if (j.contains("context")) {
        const auto& c = j.at("context");
        f.context.applicationType = c.value("applicationType", "general");
        f.context.industry        = c.value("industry", "general");
        if (c.contains("deviceDistribution")) {
            const auto& d = c.at("deviceDistribution");
            f.context.deviceDistribution.desktop = d.value("desktop", 0.0);
            f.context.deviceDistribution.tablet  = d.value("tablet", 0.0);
            f.context.deviceDistribution.mobile  = d.value("mobile", 0.0);
            f.context.deviceDistribution.other   = d.value("other", 0.0);
        }
        if (c.contains("userBehavior")) {
            const auto& b = c.at("userBehavior");
            f.context.userBehavior.engagement    = b.value("engagement", 0.0);
            f.context.userBehavior.accessibility = b.value("accessibility", 0.0);
            f.context.userBehavior.performance   = b.value("performance", 0.0);
        }
    }
}

void from_json(const json& j, ModelLabels& l) {
    if (j.contains("optimalTokens")) {
        for (const auto& item : j.at("optimalTokens").items()) {
            l.optimalTokens[item.key()] = item.value().get<ScalingToken>();
        }
    }
    if (j.contains("performanceScores")) {
        l.performanceScores = j.at("performanceScores").get<std::map<std::string, double>>();
    }
    if (j.contains("satisfactionRatings")) {
        l.satisfactionRatings = j.at("satisfactionRatings").get<std::vector<double>>();
    }
    if (j.contains("accessibilityScores")) {
        l.accessibilityScores = j.at("accessibilityScores").get<std::map<std::string, double>>();
    }
}

void from_json(const json& j, TrainingData& t) {
    if (!j.contains("features") || j.at("features").is_null()) {
        throw std::runtime_error("training record is missing features");
    }
    if (!j.contains("labels") || j.at("labels").is_null()) {
        throw std::runtime_error("training record is missing labels");
    }
    readFeatures(j.at("features"), t.features);
    t.labels = j.at("labels").get<ModelLabels>();

    if (j.contains("metadata")) {
        const auto& m = j.at("metadata");
        t.metadata.timestamp    = m.value("timestamp", "");
        t.metadata.source       = m.value("source", "");
        t.metadata.qualityScore = m.value("qualityScore", 0.0);
        t.metadata.sampleSize   = m.value("sampleSize", std::size_t{0});
        t.metadata.region       = m.value("region", "");
    }
}

// =======================
//  Outputs
// =======================
void to_json(json& j, const TrainingMetrics& m) {
    j = json{{"accuracy", m.accuracy},
             {"precision", m.precision},
             {"recall", m.recall},
             {"f1Score", m.f1Score},
             {"mse", m.mse}};
    json ci = json::object();
    for (const auto& kv : m.confidenceIntervals) {
        ci[kv.first] = {kv.second.first, kv.second.second};
    }
    j["confidenceIntervals"] = ci;
}

void to_json(json& j, const CrossValidationMetrics& m) {
    j = json{{"meanAccuracy", m.meanAccuracy},
             {"meanPrecision", m.meanPrecision},
             {"meanRecall", m.meanRecall},
             {"meanF1Score", m.meanF1Score},
             {"meanMSE", m.meanMSE},
             {"stdAccuracy", m.stdAccuracy},
             {"stdPrecision", m.stdPrecision},
             {"stdRecall", m.stdRecall},
             {"stdF1Score", m.stdF1Score},
             {"stdMSE", m.stdMSE},
             {"folds", m.folds}};
}

void to_json(json& j, const HyperparameterAdvice& a) {
    j = json{{"learningRate", a.learningRate},
             {"batchSize", a.batchSize},
             {"epochs", a.epochs},
             {"architecture", a.architecture}};
}

void to_json(json& j, const ScalingCurveRecommendation& r) {
    j = json{{"token", r.token},
             {"mode", r.mode},
             {"scale", r.scale},
             {"breakpointAdjustments", r.breakpointAdjustments},
             {"confidence", r.confidence},
             {"reasoning", r.reasoning}};
}

void to_json(json& j, const PerformanceImpact& p) {
    j = json{{"aspect", p.aspect},
             {"currentValue", p.currentValue},
             {"predictedValue", p.predictedValue},
             {"improvementPercent", p.improvementPercent},
             {"severity", p.severity}};
}

void to_json(json& j, const AccessibilityWarning& w) {
    j = json{{"type", w.type},
             {"currentValue", w.currentValue},
             {"recommendedValue", w.recommendedValue},
             {"wcagReference", w.wcagReference},
             {"severity", w.severity},
             {"description", w.description}};
}

void to_json(json& j, const EstimatedImprovements& e) {
    j = json{
        {"performance",
         {{"renderTime", e.performance.renderTime},
          {"bundleSize", e.performance.bundleSize},
          {"memoryUsage", e.performance.memoryUsage},
          {"layoutShift", e.performance.layoutShift}}},
        {"userExperience",
         {{"interactionRate", e.userExperience.interactionRate},
          {"accessibilityScore", e.userExperience.accessibilityScore},
          {"visualHierarchy", e.userExperience.visualHierarchy}}},
        {"developerExperience",
         {{"codeReduction", e.developerExperience.codeReduction},
          {"maintenanceEffort", e.developerExperience.maintenanceEffort},
          {"debuggingTime", e.developerExperience.debuggingTime}}},
        {"overall", e.overall}};
}

void to_json(json& j, const OptimizationSuggestions& s) {
    json tokens = json::object();
    for (const auto& kv : s.suggestedTokens) {
        tokens[kv.first] = kv.second;
    }
    j = json{{"suggestedTokens", tokens},
             {"scalingCurveRecommendations", s.scalingCurveRecommendations},
             {"performanceImpacts", s.performanceImpacts},
             {"accessibilityWarnings", s.accessibilityWarnings},
             {"confidenceScore", s.confidenceScore},
             {"estimatedImprovements", s.estimatedImprovements}};
}

void to_json(json& j, const ModelInfo& i) {
    j = json{{"architecture", i.architecture},
             {"parameters", i.parameters},
             {"layers", i.layers},
             {"isInitialized", i.isInitialized}};
}
