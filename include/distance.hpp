#ifndef CENTRIX_DISTANCE_HPP
#define CENTRIX_DISTANCE_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace centrix {

enum class Metric { Euclidean, Manhattan, Cosine };

// Norms at or below this are treated as zero by the cosine metric.
constexpr double kZeroNormEpsilon = 1e-12;

const char* metric_name(Metric m);

// Case-insensitive: "euclidean"/"l2", "manhattan"/"l1", "cosine".
// Throws std::invalid_argument for anything else.
Metric parse_metric(const std::string& name);

// All metrics are "smaller is closer"; cosine is reported as 1 - cos(theta).
// Throws DimensionMismatchError when na != nb and ZeroVectorError for a
// zero-norm operand under Metric::Cosine. Accumulates in double.
float distance(const float* a, size_t na, const float* b, size_t nb,
               Metric metric);

float distance(const std::vector<float>& a, const std::vector<float>& b,
               Metric metric);

double squared_norm(const float* x, size_t dim);

namespace detail {

// No dimension, null or zero-norm checks. Safe inside OpenMP regions once
// the caller has validated its inputs.
double raw_distance(const float* a, const float* b, size_t dim, Metric metric);

}  // namespace detail

}  // namespace centrix

#endif  // CENTRIX_DISTANCE_HPP
