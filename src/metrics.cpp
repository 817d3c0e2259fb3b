#include "metrics.hpp"
#include "errors.hpp"
#include <cstring>
#include <limits>

namespace centrix {

size_t ConfusionMatrix::total() const {
    size_t s = 0;
    for (size_t v : counts) s += v;
    return s;
}

size_t ConfusionMatrix::correct() const {
    size_t s = 0;
    for (size_t c = 0; c < k; ++c) s += at(c, c);
    return s;
}

float ConfusionMatrix::recall(size_t truth) const {
    size_t row = 0;
    for (size_t p = 0; p < k; ++p) row += at(truth, p);
    if (row == 0) return 0.0f;
    return static_cast<float>(at(truth, truth)) / static_cast<float>(row);
}

float compute_accuracy(const int* pred_labels, const int* true_labels, size_t n) {
    if (n == 0) return 0.0f;
    size_t hits = 0;
    for (size_t i = 0; i < n; ++i)
        if (pred_labels[i] == true_labels[i]) ++hits;
    return static_cast<float>(hits) / static_cast<float>(n);
}

ConfusionMatrix compute_confusion_matrix(const int* pred_labels,
                                         const int* true_labels,
                                         size_t n, size_t k) {
    ConfusionMatrix cm;
    cm.k = k;
    cm.counts.assign(k * k, 0);
    for (size_t i = 0; i < n; ++i) {
        int t = true_labels[i];
        int p = pred_labels[i];
        if (t < 0 || p < 0 || static_cast<size_t>(t) >= k ||
            static_cast<size_t>(p) >= k)
            continue;
        cm.counts[static_cast<size_t>(t) * k + static_cast<size_t>(p)]++;
    }
    return cm;
}

void compute_class_sizes(const int* labels, size_t n, size_t k,
                         size_t* out_sizes) {
    std::memset(out_sizes, 0, k * sizeof(size_t));
    for (size_t i = 0; i < n; ++i) {
        int l = labels[i];
        if (l >= 0 && static_cast<size_t>(l) < k)
            out_sizes[static_cast<size_t>(l)]++;
    }
}

std::vector<CentroidStats> compute_centroid_stats(
    const float* data, size_t n, size_t dim, const int* labels,
    const Centroids& centroids, Metric metric) {

    if (dim != centroids.dim())
        throw DimensionMismatchError("compute_centroid_stats", centroids.dim(), dim);

    const size_t k = centroids.k();
    std::vector<CentroidStats> stats(k);
    for (size_t c = 0; c < k; ++c) {
        stats[c].min_dist = std::numeric_limits<float>::max();
        stats[c].max_dist = 0.0f;
        stats[c].mean_dist = 0.0f;
        stats[c].radius_ratio = 0.0f;
        stats[c].count = 0;
    }

    for (size_t i = 0; i < n; ++i) {
        int l = labels[i];
        if (l < 0 || static_cast<size_t>(l) >= k) continue;

        auto& s = stats[static_cast<size_t>(l)];
        float dist = distance(data + i * dim, dim,
                              centroids.row(static_cast<size_t>(l)), dim, metric);
        if (dist < s.min_dist) s.min_dist = dist;
        if (dist > s.max_dist) s.max_dist = dist;
        s.mean_dist += dist;
        s.count++;
    }

    for (auto& s : stats) {
        if (s.count > 0) {
            s.mean_dist /= static_cast<float>(s.count);
            s.radius_ratio = (s.mean_dist > 0.0f) ? s.max_dist / s.mean_dist : 0.0f;
        } else {
            s.min_dist = 0.0f;
        }
    }
    return stats;
}

}  // namespace centrix
