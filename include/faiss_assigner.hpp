#ifndef CENTRIX_FAISS_ASSIGNER_HPP
#define CENTRIX_FAISS_ASSIGNER_HPP

#include "centroids.hpp"
#include "distance.hpp"
#include <cstddef>
#include <memory>
#include <vector>

namespace faiss {
struct IndexFlat;
}

namespace centrix {

/**
 * FAISS-backed batch assignment over a fixed set of centroids.
 * Euclidean: IndexFlatL2. Cosine: IndexFlatIP over L2-normalised centroids
 * and queries (max inner product == min cosine distance).
 * The metric is fixed at construction; Manhattan is rejected.
 */
class FaissAssigner {
public:
    FaissAssigner(std::shared_ptr<const Centroids> centroids, Metric metric);
    ~FaissAssigner();

    FaissAssigner(const FaissAssigner&) = delete;
    FaissAssigner& operator=(const FaissAssigner&) = delete;

    void assign(const float* data, size_t n, size_t dim,
                std::vector<int>& labels) const;

    Metric metric() const { return metric_; }
    size_t k() const { return centroids_->k(); }
    size_t dim() const { return centroids_->dim(); }

private:
    std::shared_ptr<const Centroids> centroids_;
    Metric metric_;
    std::unique_ptr<faiss::IndexFlat> index_;
};

}  // namespace centrix

#endif  // CENTRIX_FAISS_ASSIGNER_HPP
