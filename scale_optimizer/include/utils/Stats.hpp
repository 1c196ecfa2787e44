#pragma once
#include <array>
#include <cstddef>
#include <vector>

namespace stats {

double mean(const std::vector<double>& values);

// Population variance (divides by n). 0 for fewer than two values.
double variance(const std::vector<double>& values);

double stddev(const std::vector<double>& values);

// Middle value; average of the two middle values for even sizes
double median(std::vector<double> values);

// [mean, median, min, max, stddev]; all zero when values is empty
std::array<double, 5> summary(const std::vector<double>& values);

double clamp(double v, double lo, double hi);

// Pearson correlation; 0 when either side has no spread
double correlation(const std::vector<double>& a, const std::vector<double>& b);

}  // namespace stats
