#ifndef CENTRIX_BLAS_ASSIGNER_HPP
#define CENTRIX_BLAS_ASSIGNER_HPP

#include "centroids.hpp"
#include "distance.hpp"
#include <cstddef>
#include <memory>
#include <vector>

namespace centrix {

/**
 * BLAS-backed batch nearest-centroid assignment: cblas_dgemm for all
 * query/centroid dot products, OpenMP for the per-row argmin.
 * Products and norms are double: at pixel scale ||x||^2 reaches 1e8 and
 * float cancellation would swamp distance gaps of a few units.
 *   Euclidean: ||x - c|| = sqrt(||x||^2 - 2 x.c + ||c||^2)
 *   Cosine:    1 - x.c / (||x|| ||c||)
 * Manhattan has no dot-product form and is rejected.
 * Queries are processed in blocks of block_rows to bound the N x K buffer.
 */
class BlasAssigner {
public:
    explicit BlasAssigner(std::shared_ptr<const Centroids> centroids,
                          float tie_tolerance = kDefaultTieTolerance,
                          size_t block_rows = 4096);

    void assign(const float* data, size_t n, size_t dim, Metric metric,
                std::vector<int>& labels) const;

    static bool supports(Metric metric) { return metric != Metric::Manhattan; }

    size_t k() const { return centroids_->k(); }
    size_t dim() const { return centroids_->dim(); }

private:
    std::shared_ptr<const Centroids> centroids_;
    float tie_tolerance_;
    size_t block_rows_;
    std::vector<double> centroids_d_;     // k x dim
    std::vector<double> centroid_norms_;  // ||c||^2
};

}  // namespace centrix

#endif  // CENTRIX_BLAS_ASSIGNER_HPP
