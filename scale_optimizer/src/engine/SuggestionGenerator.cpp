#include "engine/SuggestionGenerator.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <sstream>
#include <utility>

#include "engine/ModelTrainer.hpp"
#include "monitor/Logger.hpp"
#include "utils/Stats.hpp"

namespace {

constexpr double kModeTolerance = 0.05;
constexpr double kMaxAdjustment = 0.5;
constexpr double kRecommendedTapTarget = 44.0;

constexpr const char* kResizeText = "WCAG 2.1 AA - 1.4.4 Resize text";
constexpr const char* kTargetSize = "WCAG 2.1 AAA - 2.5.5 Target Size";

// output slot of a tail name
std::size_t tailSlot(std::size_t i) { return canonicalTokens().size() * 4 + i; }

struct Aspect {
    const char* output;
    const char* name;
    std::function<std::optional<double>(const PerformanceMetrics&)> read;
};

const std::vector<Aspect>& aspects() {
    static const std::vector<Aspect> list = {
        {"renderTime", "render-time", [](const PerformanceMetrics& p) { return p.renderTime; }},
        {"bundleSize", "bundle-size", [](const PerformanceMetrics& p) { return p.bundleSize; }},
        {"memoryUsage", "memory", [](const PerformanceMetrics& p) { return p.memoryUsage; }},
        {"layoutShift", "layout-shift", [](const PerformanceMetrics& p) { return p.layoutShift; }},
    };
    return list;
}

std::string num(double v) {
    std::ostringstream os;
    os.precision(3);
    os << v;
    return os.str();
}

}  // namespace

SuggestionGenerator::SuggestionGenerator(std::shared_ptr<Logger> log) : log_(std::move(log)) {
    if (!log_) log_ = Logger::silent();
}

std::string SuggestionGenerator::severityFor(double improvementPercent) {
    if (improvementPercent >= 30.0) return "critical";
    if (improvementPercent >= 20.0) return "high";
    if (improvementPercent >= 10.0) return "medium";
    return "low";
}

PostProcessConstraints SuggestionGenerator::constraintsFor(const ResponsiveConfig& config,
                                                           const std::vector<RangeConstraint>& performance) {
    PostProcessConstraints c;
    if (config.strategy) {
        for (const auto& [name, token] : config.strategy->tokens) {
            c.tokens.push_back({name, token.min, token.max, token.step});
        }
    }
    c.performance = performance;
    return c;
}

std::vector<double> SuggestionGenerator::baselineVector(const ResponsiveConfig& config,
                                                        const std::vector<ComponentUsageData>& usage) {
    ModelLabels labels;
    if (config.strategy) {
        for (const auto& name : canonicalTokens()) {
            auto it = config.strategy->tokens.find(name);
            if (it != config.strategy->tokens.end()) labels.optimalTokens[name] = it->second;
        }
        labels.accessibilityScores["minFontSize"] = config.strategy->accessibility.minFontSize;
        labels.accessibilityScores["minTapTarget"] = config.strategy->accessibility.minTapTarget;
    }

    for (const auto& data : usage) {
        if (!data.responsiveValues) continue;
        for (const auto& v : *data.responsiveValues) {
            if (v.satisfactionScore) labels.satisfactionRatings.push_back(*v.satisfactionScore);
        }
    }
    return ModelTrainer::labelsToVector(labels);
}

OptimizationSuggestions SuggestionGenerator::generate(const ResponsiveConfig& config,
                                                      const std::vector<ComponentUsageData>& usage,
                                                      const ProcessedPrediction& prediction,
                                                      double confidenceScore,
                                                      const PredictionComparison& comparison) const {
    OptimizationSuggestions s;
    s.confidenceScore = stats::clamp(confidenceScore, 0.0, 1.0);
    s.suggestedTokens = suggestTokens(config, prediction);
    s.scalingCurveRecommendations = recommendCurves(config, usage, s.suggestedTokens, s.confidenceScore);
    s.performanceImpacts = predictImpacts(usage, prediction);
    s.accessibilityWarnings = checkAccessibility(config, s.suggestedTokens, prediction);
    s.estimatedImprovements = estimate(config, usage, s, prediction, comparison);

    log_->debug("SuggestionGenerator", std::to_string(s.suggestedTokens.size()) + " tokens, " +
                                       std::to_string(s.performanceImpacts.size()) + " impacts, " +
                                       std::to_string(s.accessibilityWarnings.size()) + " warnings");
    return s;
}

// ==========================================================
// Tokens and curves
// ==========================================================
std::map<std::string, ScalingToken> SuggestionGenerator::suggestTokens(const ResponsiveConfig& config,
                                                                       const ProcessedPrediction& prediction) const {
    std::map<std::string, ScalingToken> out;
    if (!config.strategy) return out;

    for (const auto& [name, current] : config.strategy->tokens) {
        auto it = prediction.tokens.find(name);
        if (it != prediction.tokens.end()) {
            ScalingToken t = it->second;
            t.curve = current.curve;
            t.unit = current.unit;
            t.precision = current.precision;
            t.responsive = current.responsive;
            out[name] = t;
            continue;
        }

        // no model output for this token: keep it, trimmed onto its own step grid
        ScalingToken t = current;
        double steps = std::floor((t.max - t.min) / t.step + 1e-9);
        t.max = t.min + steps * t.step;
        out[name] = t;
    }
    return out;
}

std::vector<ScalingCurveRecommendation> SuggestionGenerator::recommendCurves(
    const ResponsiveConfig& config, const std::vector<ComponentUsageData>& usage,
    const std::map<std::string, ScalingToken>& suggested, double confidenceScore) const {
    std::vector<ScalingCurveRecommendation> recs;
    if (!config.strategy) return recs;

    std::size_t totalValues = 0;
    for (const auto& data : usage) {
        if (data.responsiveValues) totalValues += data.responsiveValues->size();
    }

    const double baseWidth = config.base.width;

    for (const auto& [name, token] : suggested) {
        auto cfg = config.strategy->tokens.find(name);
        if (cfg == config.strategy->tokens.end()) continue;

        const double current = cfg->second.scale;
        const double scale = token.scale;

        ScalingCurveRecommendation rec;
        rec.token = name;
        rec.scale = scale;
        if (std::fabs(scale - current) < kModeTolerance) rec.mode = config.strategy->mode;
        else if (scale < current) rec.mode = "logarithmic";
        else rec.mode = "exponential";

        std::vector<const ResponsiveValueUsage*> records;
        for (const auto& data : usage) {
            if (!data.responsiveValues) continue;
            for (const auto& v : *data.responsiveValues) {
                if (v.token == name) records.push_back(&v);
            }
        }

        for (const auto& bp : config.breakpoints) {
            double r = baseWidth > 0.0 ? bp.width / baseWidth : 1.0;
            double suggestedFactor = 1.0 + (r - 1.0) * scale;

            std::vector<double> observed;
            for (const auto* v : records) {
                if (v->baseValue <= 0.0) continue;
                auto hit = v->breakpointValues.find(bp.name);
                if (hit == v->breakpointValues.end() && !bp.alias.empty()) hit = v->breakpointValues.find(bp.alias);
                if (hit != v->breakpointValues.end()) observed.push_back(hit->second / v->baseValue);
            }
            double reference = observed.empty() ? 1.0 + (r - 1.0) * current : stats::mean(observed);
            rec.breakpointAdjustments[bp.name] =
                stats::clamp(suggestedFactor - reference, -kMaxAdjustment, kMaxAdjustment);
        }

        double support = totalValues ? static_cast<double>(records.size()) / totalValues : 0.0;
        rec.confidence = stats::clamp(confidenceScore * (0.5 + 0.5 * support), 0.0, 1.0);

        std::string reason = name + ": scale " + num(current) + " -> " + num(scale) + " (" + rec.mode + ")";
        if (records.empty()) {
            reason += ", no usage records reference this token";
        } else {
            reason += ", derived from " + std::to_string(records.size()) + " usage record(s)";
        }
        rec.reasoning = reason;

        recs.push_back(std::move(rec));
    }

    std::sort(recs.begin(), recs.end(), [](const auto& a, const auto& b) {
        if (a.confidence != b.confidence) return a.confidence > b.confidence;
        return a.token < b.token;
    });
    return recs;
}

// ==========================================================
// Impacts and warnings
// ==========================================================
std::vector<PerformanceImpact> SuggestionGenerator::predictImpacts(const std::vector<ComponentUsageData>& usage,
                                                                   const ProcessedPrediction& prediction) const {
    std::vector<PerformanceImpact> impacts;
    const auto& list = aspects();

    for (std::size_t i = 0; i < list.size(); ++i) {
        std::vector<double> observed;
        for (const auto& data : usage) {
            auto v = list[i].read(data.performance);
            if (v) observed.push_back(*v);
        }
        if (observed.empty()) continue;

        double fraction = 0.0;
        auto it = prediction.performance.find(list[i].output);
        if (it != prediction.performance.end()) {
            fraction = it->second;
        } else if (tailSlot(i) < prediction.values.size()) {
            fraction = prediction.values[tailSlot(i)];
        }
        if (!std::isfinite(fraction)) fraction = 0.0;
        fraction = stats::clamp(fraction, -0.5, 0.9);

        PerformanceImpact impact;
        impact.aspect = list[i].name;
        impact.currentValue = stats::mean(observed);
        impact.predictedValue = impact.currentValue * (1.0 - fraction);
        impact.improvementPercent = fraction * 100.0;
        impact.severity = severityFor(impact.improvementPercent);
        impacts.push_back(impact);
    }
    return impacts;
}

std::vector<AccessibilityWarning> SuggestionGenerator::checkAccessibility(
    const ResponsiveConfig& config, const std::map<std::string, ScalingToken>& suggested,
    const ProcessedPrediction& prediction) const {
    std::vector<AccessibilityWarning> warnings;
    if (!config.strategy) return warnings;
    const auto& acc = config.strategy->accessibility;

    auto font = suggested.find("fontSize");
    if (font != suggested.end() && font->second.min < acc.minFontSize) {
        warnings.push_back({"font-size", font->second.min, acc.minFontSize, kResizeText, "AA",
                            "Suggested minimum font size is below the declared accessibility minimum"});
    }

    const std::size_t fontSlot = tailSlot(6);
    const std::size_t tapSlot = tailSlot(7);

    if (fontSlot < prediction.values.size() && std::isfinite(prediction.values[fontSlot])) {
        double recommended = std::ceil(prediction.values[fontSlot]);
        if (recommended > acc.minFontSize) {
            warnings.push_back({"font-size", acc.minFontSize, recommended, kResizeText, "AA",
                                "Minimum font size should be increased for better readability"});
        }
    }

    if (tapSlot < prediction.values.size() && std::isfinite(prediction.values[tapSlot])) {
        double recommended = std::ceil(prediction.values[tapSlot]);
        if (recommended > acc.minTapTarget) {
            warnings.push_back({"tap-target", acc.minTapTarget, recommended, kTargetSize, "AAA",
                                "Tap targets should be larger for better accessibility"});
        }
    }

    if (acc.minTapTarget < kRecommendedTapTarget) {
        warnings.push_back({"tap-target", acc.minTapTarget, kRecommendedTapTarget, kTargetSize, "best-practice",
                            "Declared minimum tap target is below the recommended 44px"});
    }
    return warnings;
}

// ==========================================================
// Estimated improvements
// ==========================================================
EstimatedImprovements SuggestionGenerator::estimate(const ResponsiveConfig& config,
                                                    const std::vector<ComponentUsageData>& usage,
                                                    const OptimizationSuggestions& s,
                                                    const ProcessedPrediction& prediction,
                                                    const PredictionComparison& comparison) const {
    EstimatedImprovements e;

    for (const auto& impact : s.performanceImpacts) {
        if (impact.aspect == "render-time") e.performance.renderTime = impact.improvementPercent;
        else if (impact.aspect == "bundle-size") e.performance.bundleSize = impact.improvementPercent;
        else if (impact.aspect == "memory") e.performance.memoryUsage = impact.improvementPercent;
        else if (impact.aspect == "layout-shift") e.performance.layoutShift = impact.improvementPercent;
    }

    std::vector<double> satisfaction;
    for (const auto& data : usage) {
        if (!data.responsiveValues) continue;
        for (const auto& v : *data.responsiveValues) {
            if (v.satisfactionScore) satisfaction.push_back(*v.satisfactionScore);
        }
    }
    double currentSatisfaction = satisfaction.empty() ? 0.5 : stats::mean(satisfaction);
    const std::size_t satSlot = tailSlot(4);
    if (satSlot < prediction.values.size() && std::isfinite(prediction.values[satSlot])) {
        e.userExperience.interactionRate =
            stats::clamp((prediction.values[satSlot] - currentSatisfaction) * 100.0, 0.0, 100.0);
    }
    e.userExperience.accessibilityScore = 5.0 * static_cast<double>(s.accessibilityWarnings.size());

    std::vector<double> scaleShift, narrowing;
    if (config.strategy) {
        for (const auto& [name, token] : s.suggestedTokens) {
            auto cfg = config.strategy->tokens.find(name);
            if (cfg == config.strategy->tokens.end()) continue;
            const ScalingToken& current = cfg->second;

            if (current.scale > 0.0) {
                scaleShift.push_back(std::min(100.0, std::fabs(token.scale - current.scale) / current.scale * 100.0));
            }
            double range = current.max - current.min;
            if (range > 0.0) {
                narrowing.push_back(std::max(0.0, 1.0 - (token.max - token.min) / range) * 100.0);
            }
        }
    }
    e.userExperience.visualHierarchy = stats::mean(scaleShift);

    e.developerExperience.codeReduction = stats::mean(narrowing);
    e.developerExperience.maintenanceEffort = std::min(100.0, e.developerExperience.codeReduction * 1.2);

    std::size_t confident = 0;
    for (const auto& rec : s.scalingCurveRecommendations) {
        if (rec.confidence >= 0.5) ++confident;
    }
    if (!s.scalingCurveRecommendations.empty()) {
        e.developerExperience.debuggingTime =
            40.0 * static_cast<double>(confident) / s.scalingCurveRecommendations.size();
    }

    e.overall = comparison.overallImprovement;
    return e;
}
