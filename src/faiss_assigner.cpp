#include "faiss_assigner.hpp"
#include "errors.hpp"
#include <faiss/IndexFlat.h>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace centrix {

namespace {

void normalize_rows(std::vector<float>& v, size_t n, size_t dim) {
    for (size_t i = 0; i < n; ++i) {
        float* row = v.data() + i * dim;
        float len = static_cast<float>(std::sqrt(squared_norm(row, dim)));
        for (size_t j = 0; j < dim; ++j) row[j] /= len;
    }
}

}  // namespace

FaissAssigner::FaissAssigner(std::shared_ptr<const Centroids> centroids,
                             Metric metric)
    : centroids_(std::move(centroids)), metric_(metric) {
    if (!centroids_)
        throw std::invalid_argument("FaissAssigner: null centroids");

    const size_t k = centroids_->k();
    const size_t dim = centroids_->dim();

    switch (metric_) {
        case Metric::Euclidean:
            index_ = std::make_unique<faiss::IndexFlatL2>(static_cast<faiss::idx_t>(dim));
            index_->add(static_cast<faiss::idx_t>(k), centroids_->data());
            break;
        case Metric::Cosine: {
            std::vector<float> unit(centroids_->data(), centroids_->data() + k * dim);
            for (size_t c = 0; c < k; ++c)
                if (std::sqrt(squared_norm(centroids_->row(c), dim)) <= kZeroNormEpsilon)
                    throw ZeroVectorError("FaissAssigner: centroid of class '" +
                                          centroids_->classes().name(c) +
                                          "' has zero norm");
            normalize_rows(unit, k, dim);
            index_ = std::make_unique<faiss::IndexFlatIP>(static_cast<faiss::idx_t>(dim));
            index_->add(static_cast<faiss::idx_t>(k), unit.data());
            break;
        }
        case Metric::Manhattan:
            throw std::invalid_argument(
                "FaissAssigner: metric 'manhattan' is not supported");
    }
}

FaissAssigner::~FaissAssigner() = default;

void FaissAssigner::assign(const float* data, size_t n, size_t dim,
                           std::vector<int>& labels) const {
    if (dim != centroids_->dim())
        throw DimensionMismatchError("FaissAssigner::assign", centroids_->dim(), dim);
    if (n > 0 && !data)
        throw std::invalid_argument("FaissAssigner::assign: null data");

    labels.resize(n);
    if (n == 0) return;

    std::vector<float> scores(n);
    std::vector<faiss::idx_t> ids(n);

    if (metric_ == Metric::Cosine) {
        std::vector<float> queries(data, data + n * dim);
        for (size_t i = 0; i < n; ++i)
            if (std::sqrt(squared_norm(queries.data() + i * dim, dim)) <= kZeroNormEpsilon)
                throw ZeroVectorError("FaissAssigner::assign: input row " +
                                      std::to_string(i) + " has zero norm");
        normalize_rows(queries, n, dim);
        index_->search(static_cast<faiss::idx_t>(n), queries.data(), 1,
                       scores.data(), ids.data());
    } else {
        index_->search(static_cast<faiss::idx_t>(n), data, 1,
                       scores.data(), ids.data());
    }

    for (size_t i = 0; i < n; ++i)
        labels[i] = static_cast<int>(ids[i]);
}

}  // namespace centrix
