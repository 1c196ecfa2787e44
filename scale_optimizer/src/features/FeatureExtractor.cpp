#include "features/FeatureExtractor.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <utility>

#include "utils/Stats.hpp"

namespace {

const char* kOrigins[6] = {"width", "height", "min", "max", "diagonal", "area"};

constexpr std::size_t kMapSlots = 10;
constexpr std::size_t kDistributionSlots = 8;

// Map entries ordered by value desc, then key asc
std::vector<std::pair<std::string, double>> rankEntries(const std::map<std::string, double>& m) {
    std::vector<std::pair<std::string, double>> entries(m.begin(), m.end());
    std::stable_sort(entries.begin(), entries.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    return entries;
}

void appendRanked(std::vector<double>& out, const std::map<std::string, double>& m) {
    auto entries = rankEntries(m);
    for (std::size_t i = 0; i < kMapSlots; ++i) {
        out.push_back(i < entries.size() ? entries[i].second : 0.0);
    }
}

void appendSummary(std::vector<double>& out, const StatSummary& s) {
    out.insert(out.end(), s.begin(), s.end());
}

}  // namespace

FeatureExtractor::FeatureExtractor(FeatureHeuristics heuristics)
    : heuristics_(std::move(heuristics)) {}

ModelFeatures FeatureExtractor::extractFeatures(const ResponsiveConfig& config,
                                                const std::vector<ComponentUsageData>& usage) const {
    ModelFeatures f;
    f.config = extractConfiguration(config);
    f.usage = extractUsage(usage);
    f.performance = extractPerformance(usage);
    f.context = extractContext(usage);
    return f;
}

// ==========================================================
// Configuration
// ==========================================================
ConfigurationFeatures FeatureExtractor::extractConfiguration(const ResponsiveConfig& config) const {
    ConfigurationFeatures c;
    c.breakpointCount = static_cast<double>(config.breakpoints.size());

    const double baseWidth = config.base.width;
    for (std::size_t i = 0; i < kBreakpointSlots; ++i) {
        if (i < config.breakpoints.size() && baseWidth > 0.0) {
            c.breakpointRatios[i] = config.breakpoints[i].width / baseWidth;
        } else {
            c.breakpointRatios[i] = 1.0;
        }
    }

    if (config.strategy) {
        c.tokenComplexity = static_cast<double>(config.strategy->tokens.size()) * 4.0;
        for (std::size_t i = 0; i < 6; ++i) {
            c.originDistribution[i] = config.strategy->origin == kOrigins[i] ? 1.0 : 0.0;
        }
    }
    return c;
}

// ==========================================================
// Usage
// ==========================================================
UsageFeatures FeatureExtractor::extractUsage(const std::vector<ComponentUsageData>& usage) const {
    UsageFeatures u;

    std::map<double, int> valueCounts;
    std::map<std::string, int> typeCounts;

    for (const auto& data : usage) {
        typeCounts[data.componentType]++;
        if (!data.responsiveValues) continue;

        for (const auto& v : *data.responsiveValues) {
            valueCounts[v.baseValue]++;
            u.propertyPatterns[v.property] += 1.0;
            u.valueDistributions[v.token].push_back(v.baseValue);
        }
    }

    // most frequent base values, ties by value ascending
    std::vector<std::pair<double, int>> ranked(valueCounts.begin(), valueCounts.end());
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    for (std::size_t i = 0; i < kCommonValueSlots && i < ranked.size(); ++i) {
        u.commonValues[i] = ranked[i].first;
    }

    if (!usage.empty()) {
        const double total = static_cast<double>(usage.size());
        for (const auto& [type, count] : typeCounts) {
            u.componentFrequencies[type] = count / total;
        }
    }
    return u;
}

// ==========================================================
// Performance
// ==========================================================
PerformanceFeatures FeatureExtractor::extractPerformance(const std::vector<ComponentUsageData>& usage) const {
    std::vector<double> render, bundle, memory, shift;

    for (const auto& data : usage) {
        const auto& p = data.performance;
        if (p.renderTime)  render.push_back(*p.renderTime);
        if (p.bundleSize)  bundle.push_back(*p.bundleSize);
        if (p.memoryUsage) memory.push_back(*p.memoryUsage);
        if (p.layoutShift) shift.push_back(*p.layoutShift);
    }

    PerformanceFeatures out;
    out.avgRenderTimes = stats::summary(render);
    out.bundleSizes = stats::summary(bundle);
    out.memoryPatterns = stats::summary(memory);
    out.layoutShiftFreq = stats::summary(shift);
    return out;
}

// ==========================================================
// Context
// ==========================================================
ContextFeatures FeatureExtractor::extractContext(const std::vector<ComponentUsageData>& usage) const {
    ContextFeatures ctx;
    ctx.applicationType = inferApplicationType(usage);
    ctx.industry = inferIndustry(ctx.applicationType);

    if (usage.empty()) return ctx;

    const double total = static_cast<double>(usage.size());
    std::vector<double> engagement, accessibility, performance;

    for (const auto& data : usage) {
        std::string bucket = "other";
        auto it = heuristics_.positions.find(data.context.position);
        if (it != heuristics_.positions.end()) bucket = it->second;

        if (bucket == "desktop")      ctx.deviceDistribution.desktop += 1.0;
        else if (bucket == "tablet")  ctx.deviceDistribution.tablet += 1.0;
        else if (bucket == "mobile")  ctx.deviceDistribution.mobile += 1.0;
        else                          ctx.deviceDistribution.other += 1.0;

        const auto& in = data.interactions;
        if (in.interactionRate)    engagement.push_back(*in.interactionRate);
        if (in.accessibilityScore) accessibility.push_back(*in.accessibilityScore);

        if (data.performance.renderTime && heuristics_.renderBudgetMs > 0.0) {
            double score = 1.0 - *data.performance.renderTime / heuristics_.renderBudgetMs;
            performance.push_back(stats::clamp(score, 0.0, 1.0));
        }
    }

    ctx.deviceDistribution.desktop /= total;
    ctx.deviceDistribution.tablet /= total;
    ctx.deviceDistribution.mobile /= total;
    ctx.deviceDistribution.other /= total;

    ctx.userBehavior.engagement = stats::mean(engagement);
    ctx.userBehavior.accessibility = stats::mean(accessibility);
    ctx.userBehavior.performance = stats::mean(performance);
    return ctx;
}

std::string FeatureExtractor::inferApplicationType(const std::vector<ComponentUsageData>& usage) const {
    if (usage.empty()) return "general";

    std::map<std::string, int> counts;
    for (const auto& data : usage) counts[data.componentType]++;

    // map order makes ties resolve to the lexically first type
    auto dominant = counts.begin();
    for (auto it = counts.begin(); it != counts.end(); ++it) {
        if (it->second > dominant->second) dominant = it;
    }

    double share = static_cast<double>(dominant->second) / usage.size();
    if (share < heuristics_.dominanceThreshold) return "general";

    auto archetype = heuristics_.archetypes.find(dominant->first);
    return archetype != heuristics_.archetypes.end() ? archetype->second : "general";
}

std::string FeatureExtractor::inferIndustry(const std::string& applicationType) const {
    auto it = heuristics_.industries.find(applicationType);
    return it != heuristics_.industries.end() ? it->second : "general";
}

// ==========================================================
// Flattening
// ==========================================================
std::vector<double> FeatureExtractor::featuresToVector(const ModelFeatures& f) const {
    std::vector<double> v;
    v.reserve(kFeatureDimension);

    // config: 16
    v.push_back(f.config.breakpointCount);
    v.insert(v.end(), f.config.breakpointRatios.begin(), f.config.breakpointRatios.end());
    v.push_back(f.config.tokenComplexity);
    v.insert(v.end(), f.config.originDistribution.begin(), f.config.originDistribution.end());

    // usage: 38
    v.insert(v.end(), f.usage.commonValues.begin(), f.usage.commonValues.end());
    appendRanked(v, f.usage.componentFrequencies);
    appendRanked(v, f.usage.propertyPatterns);
    std::size_t tokens = 0;
    for (const auto& [token, values] : f.usage.valueDistributions) {
        if (tokens++ == kDistributionSlots) break;
        v.push_back(stats::mean(values));
    }
    for (; tokens < kDistributionSlots; ++tokens) v.push_back(0.0);

    // performance: 20
    appendSummary(v, f.performance.avgRenderTimes);
    appendSummary(v, f.performance.bundleSizes);
    appendSummary(v, f.performance.memoryPatterns);
    appendSummary(v, f.performance.layoutShiftFreq);

    // context: 9
    v.push_back(encodeApplicationType(f.context.applicationType));
    v.push_back(f.context.deviceDistribution.desktop);
    v.push_back(f.context.deviceDistribution.tablet);
    v.push_back(f.context.deviceDistribution.mobile);
    v.push_back(f.context.deviceDistribution.other);
    v.push_back(f.context.userBehavior.engagement);
    v.push_back(f.context.userBehavior.accessibility);
    v.push_back(f.context.userBehavior.performance);
    v.push_back(encodeIndustry(f.context.industry));

    v.resize(kFeatureDimension, 0.0);
    for (auto& x : v) {
        if (!std::isfinite(x)) x = 0.0;
    }
    return v;
}

const std::vector<std::string>& FeatureExtractor::featureNames() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> n;
        n.push_back("breakpoint_count");
        for (std::size_t i = 0; i < kBreakpointSlots; ++i) n.push_back("breakpoint_ratio_" + std::to_string(i));
        n.push_back("token_complexity");
        for (const char* o : kOrigins) n.push_back(std::string("origin_") + o);

        for (std::size_t i = 0; i < kCommonValueSlots; ++i) n.push_back("common_value_" + std::to_string(i));
        for (std::size_t i = 0; i < kMapSlots; ++i) n.push_back("component_frequency_" + std::to_string(i));
        for (std::size_t i = 0; i < kMapSlots; ++i) n.push_back("property_count_" + std::to_string(i));
        for (std::size_t i = 0; i < kDistributionSlots; ++i) n.push_back("token_mean_" + std::to_string(i));

        const char* stat[5] = {"mean", "median", "min", "max", "stddev"};
        for (const char* group : {"render_time", "bundle_size", "memory", "layout_shift"}) {
            for (const char* s : stat) n.push_back(std::string(group) + "_" + s);
        }

        for (const char* c : {"application_type", "device_desktop", "device_tablet", "device_mobile",
                              "device_other", "behavior_engagement", "behavior_accessibility",
                              "behavior_performance", "industry"}) {
            n.push_back(c);
        }

        for (std::size_t i = n.size(); i < kFeatureDimension; ++i) n.push_back("reserved_" + std::to_string(i));
        return n;
    }();
    return names;
}

double FeatureExtractor::encodeApplicationType(const std::string& type) {
    static const std::map<std::string, double> codes = {
        {"e-commerce", 1}, {"dashboard", 2}, {"blog", 3}, {"social", 4}, {"general", 5}};
    auto it = codes.find(type);
    return it != codes.end() ? it->second : 5.0;
}

double FeatureExtractor::encodeIndustry(const std::string& industry) {
    static const std::map<std::string, double> codes = {
        {"retail", 1},  {"technology", 2}, {"media", 3},     {"social-media", 4},
        {"finance", 5}, {"healthcare", 6}, {"education", 7}, {"general", 8}};
    auto it = codes.find(industry);
    return it != codes.end() ? it->second : 8.0;
}
