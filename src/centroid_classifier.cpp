#include "centroid_classifier.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace centrix {

CentroidClassifier::CentroidClassifier(ClassSet classes, size_t dim,
                                       const ClassifierConfig& cfg)
    : classes_(std::move(classes)), dim_(dim), cfg_(cfg) {
    if (dim_ == 0)
        throw std::invalid_argument("CentroidClassifier: dim must be > 0");
    if (!(cfg_.tie_tolerance >= 0.0f))
        throw std::invalid_argument("CentroidClassifier: tie_tolerance must be >= 0");
}

std::shared_ptr<const Centroids> CentroidClassifier::fit(
    const std::vector<Sample>& samples) {
    std::vector<float> data;
    std::vector<int> labels;
    data.reserve(samples.size() * dim_);
    labels.reserve(samples.size());

    for (const Sample& s : samples) {
        if (s.vector.size() != dim_)
            throw DimensionMismatchError("CentroidClassifier::fit", dim_,
                                         s.vector.size());
        labels.push_back(classes_.index_of(s.label));
        data.insert(data.end(), s.vector.begin(), s.vector.end());
    }
    return fit(data.data(), samples.size(), dim_, labels.data());
}

std::shared_ptr<const Centroids> CentroidClassifier::fit(const float* data,
                                                         size_t n, size_t dim,
                                                         const int* labels) {
    if (dim != dim_)
        throw DimensionMismatchError("CentroidClassifier::fit", dim_, dim);

    if (cfg_.verbose)
        log_info("fit: N=%zu D=%zu classes=%zu", n, dim_, classes_.size());

    // Build the replacement completely before publishing it.
    std::shared_ptr<const Centroids> fresh = std::make_shared<Centroids>(
        compute_centroids(classes_, data, n, dim_, labels, cfg_.verbose));
    centroids_ = std::move(fresh);
    return centroids_;
}

const Centroids& CentroidClassifier::require_fitted(const char* where) const {
    if (!centroids_) throw NotFittedError(where);
    return *centroids_;
}

Prediction CentroidClassifier::predict(const float* x, size_t dim,
                                       Metric metric) const {
    const Centroids& c = require_fitted("CentroidClassifier::predict");
    if (dim != dim_)
        throw DimensionMismatchError("CentroidClassifier::predict", dim_, dim);
    return nearest_centroid(x, dim, c, metric, cfg_.tie_tolerance);
}

Prediction CentroidClassifier::predict(const std::vector<float>& x,
                                       Metric metric) const {
    return predict(x.data(), x.size(), metric);
}

void CentroidClassifier::validate_batch(const char* where, const Centroids& c,
                                        const float* data, size_t n, size_t dim,
                                        Metric metric) const {
    if (dim != dim_)
        throw DimensionMismatchError(where, dim_, dim);
    if (n > 0 && !data)
        throw std::invalid_argument(std::string(where) + ": null data");
    if (metric != Metric::Cosine) return;

    for (size_t k = 0; k < c.k(); ++k)
        if (std::sqrt(squared_norm(c.row(k), dim)) <= kZeroNormEpsilon)
            throw ZeroVectorError(std::string(where) + ": centroid of class '" +
                                  c.classes().name(k) + "' has zero norm");
    for (size_t i = 0; i < n; ++i)
        if (std::sqrt(squared_norm(data + i * dim, dim)) <= kZeroNormEpsilon)
            throw ZeroVectorError(std::string(where) + ": input row " +
                                  std::to_string(i) + " has zero norm");
}

std::vector<Prediction> CentroidClassifier::predict_batch(const float* data,
                                                          size_t n, size_t dim,
                                                          Metric metric) const {
    std::shared_ptr<const Centroids> snap = centroids_;
    if (!snap) throw NotFittedError("CentroidClassifier::predict_batch");
    const Centroids& c = *snap;
    validate_batch("CentroidClassifier::predict_batch", c, data, n, dim, metric);

    const size_t k = c.k();
    std::vector<Prediction> out(n);
    for (Prediction& p : out) p.distances.resize(k);

    // Inputs are validated and storage allocated; nothing below throws.
    #pragma omp parallel for schedule(static)
    for (size_t i = 0; i < n; ++i) {
        const float* x = data + i * dim;
        Prediction& p = out[i];
        for (size_t cc = 0; cc < k; ++cc)
            p.distances[cc] = static_cast<float>(
                detail::raw_distance(x, c.row(cc), dim, metric));
        p.label = select_nearest(p.distances.data(), k, cfg_.tie_tolerance);
    }

    for (Prediction& p : out)
        p.class_name = c.classes().name(static_cast<size_t>(p.label));
    return out;
}

void CentroidClassifier::assign(const float* data, size_t n, size_t dim,
                                Metric metric, std::vector<int>& labels) const {
    std::shared_ptr<const Centroids> snap = centroids_;
    if (!snap) throw NotFittedError("CentroidClassifier::assign");
    const Centroids& c = *snap;
    validate_batch("CentroidClassifier::assign", c, data, n, dim, metric);

    const size_t k = c.k();
    labels.resize(n);

    #pragma omp parallel
    {
        std::vector<float> dists(k);
        #pragma omp for schedule(static)
        for (size_t i = 0; i < n; ++i) {
            const float* x = data + i * dim;
            for (size_t cc = 0; cc < k; ++cc)
                dists[cc] = static_cast<float>(
                    detail::raw_distance(x, c.row(cc), dim, metric));
            labels[i] = select_nearest(dists.data(), k, cfg_.tie_tolerance);
        }
    }
}

}  // namespace centrix
