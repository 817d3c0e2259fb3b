#ifndef CENTRIX_METRICS_HPP
#define CENTRIX_METRICS_HPP

#include "centroids.hpp"
#include "distance.hpp"
#include <cstddef>
#include <vector>

namespace centrix {

struct CentroidStats {
    float min_dist;
    float max_dist;
    float mean_dist;
    float radius_ratio;   // max_dist / mean_dist — flags outlier-heavy classes
    size_t count;
};

// counts[true_label][pred_label]; rows and columns in declared class order.
struct ConfusionMatrix {
    size_t k = 0;
    std::vector<size_t> counts;  // k * k, row-major

    size_t at(size_t truth, size_t pred) const { return counts[truth * k + pred]; }
    size_t total() const;
    size_t correct() const;
    // Fraction of class `truth` predicted correctly; 0 for an absent class.
    float recall(size_t truth) const;
};

// Fraction of positions where pred == truth. 0 for n == 0.
float compute_accuracy(const int* pred_labels, const int* true_labels, size_t n);

// Labels outside [0, k) are ignored.
ConfusionMatrix compute_confusion_matrix(const int* pred_labels,
                                         const int* true_labels,
                                         size_t n, size_t k);

void compute_class_sizes(const int* labels, size_t n, size_t k,
                         size_t* out_sizes);

// Spread of each class's samples around its own centroid under `metric`.
// Throws DimensionMismatchError when dim != centroids.dim().
std::vector<CentroidStats> compute_centroid_stats(
    const float* data, size_t n, size_t dim, const int* labels,
    const Centroids& centroids, Metric metric);

}  // namespace centrix

#endif  // CENTRIX_METRICS_HPP
