#include "distance.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace centrix {

namespace {

double euclidean(const float* a, const float* b, size_t dim) {
    double s = 0.0;
    for (size_t j = 0; j < dim; ++j) {
        double d = static_cast<double>(a[j]) - static_cast<double>(b[j]);
        s += d * d;
    }
    return std::sqrt(s);
}

double manhattan(const float* a, const float* b, size_t dim) {
    double s = 0.0;
    for (size_t j = 0; j < dim; ++j)
        s += std::fabs(static_cast<double>(a[j]) - static_cast<double>(b[j]));
    return s;
}

struct CosineTerms {
    double dot;
    double norm_a;
    double norm_b;
};

CosineTerms cosine_terms(const float* a, const float* b, size_t dim) {
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t j = 0; j < dim; ++j) {
        double x = a[j], y = b[j];
        dot += x * y;
        na += x * x;
        nb += y * y;
    }
    return {dot, std::sqrt(na), std::sqrt(nb)};
}

double cosine_from_terms(const CosineTerms& t) {
    double d = 1.0 - t.dot / (t.norm_a * t.norm_b);
    // Rounding can push |cos| slightly past 1.
    return std::min(2.0, std::max(0.0, d));
}

double cosine(const float* a, const float* b, size_t dim) {
    CosineTerms t = cosine_terms(a, b, dim);
    if (t.norm_a <= kZeroNormEpsilon)
        throw ZeroVectorError("cosine distance: first operand has zero norm");
    if (t.norm_b <= kZeroNormEpsilon)
        throw ZeroVectorError("cosine distance: second operand has zero norm");
    return cosine_from_terms(t);
}

}  // namespace

const char* metric_name(Metric m) {
    switch (m) {
        case Metric::Euclidean: return "euclidean";
        case Metric::Manhattan: return "manhattan";
        case Metric::Cosine:    return "cosine";
    }
    return "unknown";
}

Metric parse_metric(const std::string& name) {
    std::string s(name);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "euclidean" || s == "l2") return Metric::Euclidean;
    if (s == "manhattan" || s == "l1") return Metric::Manhattan;
    if (s == "cosine") return Metric::Cosine;
    throw std::invalid_argument("parse_metric: unknown metric '" + name + "'");
}

float distance(const float* a, size_t na, const float* b, size_t nb,
               Metric metric) {
    if (na != nb)
        throw DimensionMismatchError("distance", na, nb);
    if (na > 0 && (!a || !b))
        throw std::invalid_argument("distance: null vector");

    switch (metric) {
        case Metric::Euclidean: return static_cast<float>(euclidean(a, b, na));
        case Metric::Manhattan: return static_cast<float>(manhattan(a, b, na));
        case Metric::Cosine:    return static_cast<float>(cosine(a, b, na));
    }
    throw std::invalid_argument("distance: unknown metric");
}

float distance(const std::vector<float>& a, const std::vector<float>& b,
               Metric metric) {
    return distance(a.data(), a.size(), b.data(), b.size(), metric);
}

double squared_norm(const float* x, size_t dim) {
    double s = 0.0;
    for (size_t j = 0; j < dim; ++j)
        s += static_cast<double>(x[j]) * static_cast<double>(x[j]);
    return s;
}

namespace detail {

double raw_distance(const float* a, const float* b, size_t dim, Metric metric) {
    switch (metric) {
        case Metric::Euclidean: return euclidean(a, b, dim);
        case Metric::Manhattan: return manhattan(a, b, dim);
        case Metric::Cosine:    return cosine_from_terms(cosine_terms(a, b, dim));
    }
    return 0.0;
}

}  // namespace detail

}  // namespace centrix
