#include "utils/Stats.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace stats {

double mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

double variance(const std::vector<double>& values) {
    if (values.size() < 2) return 0.0;

    double avg = mean(values);
    double var = 0.0;
    for (double v : values) {
        var += (v - avg) * (v - avg);
    }
    return var / values.size();
}

double stddev(const std::vector<double>& values) {
    return std::sqrt(variance(values));
}

double median(std::vector<double> values) {
    if (values.empty()) return 0.0;

    std::sort(values.begin(), values.end());
    std::size_t mid = values.size() / 2;
    if (values.size() % 2 == 1) return values[mid];
    return (values[mid - 1] + values[mid]) / 2.0;
}

std::array<double, 5> summary(const std::vector<double>& values) {
    if (values.empty()) return {0.0, 0.0, 0.0, 0.0, 0.0};

    auto mm = std::minmax_element(values.begin(), values.end());
    return {mean(values), median(values), *mm.first, *mm.second, stddev(values)};
}

double clamp(double v, double lo, double hi) {
    if (v < lo) return lo;
    if (v > hi) return hi;
    return v;
}

double correlation(const std::vector<double>& a, const std::vector<double>& b) {
    std::size_t n = std::min(a.size(), b.size());
    if (n < 2) return 0.0;

    double ma = 0.0, mb = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        ma += a[i];
        mb += b[i];
    }
    ma /= n;
    mb /= n;

    double num = 0.0, da = 0.0, db = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        num += (a[i] - ma) * (b[i] - mb);
        da  += (a[i] - ma) * (a[i] - ma);
        db  += (b[i] - mb) * (b[i] - mb);
    }
    if (da <= 0.0 || db <= 0.0) return 0.0;
    return num / std::sqrt(da * db);
}

}  // namespace stats
