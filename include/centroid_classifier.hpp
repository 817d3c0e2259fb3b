#ifndef CENTRIX_CENTROID_CLASSIFIER_HPP
#define CENTRIX_CENTROID_CLASSIFIER_HPP

#include "centroids.hpp"
#include "distance.hpp"
#include <cstddef>
#include <memory>
#include <vector>

namespace centrix {

struct ClassifierConfig {
    float tie_tolerance = kDefaultTieTolerance;
    bool verbose = false;
};

/**
 * Nearest-centroid classifier over a fixed class set and dimension.
 *
 * Untrained until fit() succeeds; predict() before that throws
 * NotFittedError. Every fit() recomputes all centroids from scratch and
 * either replaces them completely or, on error, leaves the previous state
 * untouched. Fitted centroids are immutable and shared: a snapshot taken
 * with centroids() stays valid across later refits.
 *
 * Flat inputs are contiguous row-major float32:
 *   data[i * dim + j] = i-th vector, j-th component.
 */
class CentroidClassifier {
public:
    CentroidClassifier(ClassSet classes, size_t dim,
                       const ClassifierConfig& cfg = {});

    std::shared_ptr<const Centroids> fit(const std::vector<Sample>& samples);
    std::shared_ptr<const Centroids> fit(const float* data, size_t n, size_t dim,
                                         const int* labels);

    Prediction predict(const float* x, size_t dim, Metric metric) const;
    Prediction predict(const std::vector<float>& x, Metric metric) const;

    // Independent predictions, parallel across inputs.
    std::vector<Prediction> predict_batch(const float* data, size_t n,
                                          size_t dim, Metric metric) const;

    // Labels only.
    void assign(const float* data, size_t n, size_t dim, Metric metric,
                std::vector<int>& labels) const;

    bool fitted() const { return centroids_ != nullptr; }
    std::shared_ptr<const Centroids> centroids() const { return centroids_; }
    const ClassSet& classes() const { return classes_; }
    size_t dim() const { return dim_; }
    const ClassifierConfig& config() const { return cfg_; }

private:
    ClassSet classes_;
    size_t dim_;
    ClassifierConfig cfg_;
    std::shared_ptr<const Centroids> centroids_;

    const Centroids& require_fitted(const char* where) const;
    void validate_batch(const char* where, const Centroids& c, const float* data,
                        size_t n, size_t dim, Metric metric) const;
};

}  // namespace centrix

#endif  // CENTRIX_CENTROID_CLASSIFIER_HPP
