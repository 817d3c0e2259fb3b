#include "blas_assigner.hpp"
#include "errors.hpp"
#include <cblas.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

// OpenBLAS releases before CBLAS_INT was exported name the index type blasint.
#ifndef CBLAS_INT
#define CBLAS_INT blasint
#endif

namespace centrix {

BlasAssigner::BlasAssigner(std::shared_ptr<const Centroids> centroids,
                           float tie_tolerance, size_t block_rows)
    : centroids_(std::move(centroids)), tie_tolerance_(tie_tolerance),
      block_rows_(block_rows) {
    if (!centroids_)
        throw std::invalid_argument("BlasAssigner: null centroids");
    if (block_rows_ == 0)
        throw std::invalid_argument("BlasAssigner: block_rows must be > 0");

    const size_t k = centroids_->k();
    const size_t dim = centroids_->dim();
    centroids_d_.assign(centroids_->data(), centroids_->data() + k * dim);
    centroid_norms_.resize(k);
    for (size_t c = 0; c < k; ++c)
        centroid_norms_[c] = squared_norm(centroids_->row(c), dim);
}

void BlasAssigner::assign(const float* data, size_t n, size_t dim,
                          Metric metric, std::vector<int>& labels) const {
    if (!supports(metric))
        throw std::invalid_argument(std::string("BlasAssigner::assign: metric '") +
                                    metric_name(metric) + "' is not supported");
    if (dim != centroids_->dim())
        throw DimensionMismatchError("BlasAssigner::assign", centroids_->dim(), dim);
    if (n > 0 && !data)
        throw std::invalid_argument("BlasAssigner::assign: null data");

    const size_t k = centroids_->k();
    labels.resize(n);
    if (n == 0) return;

    std::vector<double> qnorms(n);
    #pragma omp parallel for schedule(static)
    for (size_t i = 0; i < n; ++i)
        qnorms[i] = squared_norm(data + i * dim, dim);

    if (metric == Metric::Cosine) {
        for (size_t c = 0; c < k; ++c)
            if (std::sqrt(centroid_norms_[c]) <= kZeroNormEpsilon)
                throw ZeroVectorError("BlasAssigner::assign: centroid of class '" +
                                      centroids_->classes().name(c) +
                                      "' has zero norm");
        for (size_t i = 0; i < n; ++i)
            if (std::sqrt(qnorms[i]) <= kZeroNormEpsilon)
                throw ZeroVectorError("BlasAssigner::assign: input row " +
                                      std::to_string(i) + " has zero norm");
    }

    const size_t block = std::min(block_rows_, n);
    std::vector<double> q(block * dim);
    std::vector<double> dot_buf(block * k);
    std::vector<float> dist_buf(block * k);

    for (size_t start = 0; start < n; start += block) {
        const size_t rows = std::min(block, n - start);
        const float* src = data + start * dim;
        #pragma omp parallel for schedule(static)
        for (size_t i = 0; i < rows * dim; ++i)
            q[i] = static_cast<double>(src[i]);

        // dot_buf[i,c] = x_i . c_c
        cblas_dgemm(CblasRowMajor, CblasNoTrans, CblasTrans,
                    static_cast<CBLAS_INT>(rows),
                    static_cast<CBLAS_INT>(k),
                    static_cast<CBLAS_INT>(dim),
                    1.0,
                    q.data(), static_cast<CBLAS_INT>(dim),
                    centroids_d_.data(), static_cast<CBLAS_INT>(dim),
                    0.0,
                    dot_buf.data(), static_cast<CBLAS_INT>(k));

        #pragma omp parallel for schedule(static)
        for (size_t i = 0; i < rows; ++i) {
            const double* dots = dot_buf.data() + i * k;
            float* row = dist_buf.data() + i * k;
            const double qn = qnorms[start + i];
            if (metric == Metric::Euclidean) {
                for (size_t c = 0; c < k; ++c) {
                    double d2 = qn - 2.0 * dots[c] + centroid_norms_[c];
                    row[c] = static_cast<float>(std::sqrt(std::max(0.0, d2)));
                }
            } else {
                const double qlen = std::sqrt(qn);
                for (size_t c = 0; c < k; ++c) {
                    double d = 1.0 - dots[c] / (qlen * std::sqrt(centroid_norms_[c]));
                    row[c] = static_cast<float>(std::min(2.0, std::max(0.0, d)));
                }
            }
            labels[start + i] = select_nearest(row, k, tie_tolerance_);
        }
    }
}

}  // namespace centrix
