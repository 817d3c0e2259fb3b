#include "centroids.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace centrix {

// ============== ClassSet ==============

ClassSet::ClassSet(std::vector<std::string> names) : names_(std::move(names)) {
    if (names_.empty())
        throw std::invalid_argument("ClassSet: at least one class is required");
    for (size_t i = 0; i < names_.size(); ++i) {
        if (names_[i].empty())
            throw std::invalid_argument("ClassSet: class names must be non-empty");
        if (!index_.emplace(names_[i], static_cast<int>(i)).second)
            throw std::invalid_argument("ClassSet: duplicate class '" + names_[i] + "'");
    }
}

ClassSet::ClassSet(std::initializer_list<std::string> names)
    : ClassSet(std::vector<std::string>(names)) {}

const std::string& ClassSet::name(size_t index) const {
    if (index >= names_.size())
        throw std::out_of_range("ClassSet::name: index " + std::to_string(index) +
                                " out of range");
    return names_[index];
}

bool ClassSet::contains(const std::string& name) const {
    return index_.count(name) != 0;
}

int ClassSet::index_of(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) throw UnknownClassError(name);
    return it->second;
}

// ============== Centroids ==============

Centroids::Centroids(ClassSet classes, size_t dim, std::vector<float> data,
                     std::vector<size_t> counts)
    : classes_(std::move(classes)), dim_(dim), data_(std::move(data)),
      counts_(std::move(counts)) {
    if (dim_ == 0)
        throw std::invalid_argument("Centroids: dim must be > 0");
    if (data_.size() != classes_.size() * dim_)
        throw DimensionMismatchError("Centroids: data", classes_.size() * dim_,
                                     data_.size());
    if (counts_.empty())
        counts_.assign(classes_.size(), 0);
    else if (counts_.size() != classes_.size())
        throw DimensionMismatchError("Centroids: counts", classes_.size(),
                                     counts_.size());
}

std::vector<float> Centroids::centroid(size_t c) const {
    if (c >= k())
        throw std::out_of_range("Centroids::centroid: class index out of range");
    return std::vector<float>(row(c), row(c) + dim_);
}

std::vector<float> Centroids::centroid(const std::string& class_name) const {
    return centroid(static_cast<size_t>(classes_.index_of(class_name)));
}

// ============== Training ==============

Centroids compute_centroids(const ClassSet& classes, const float* data,
                            size_t n, size_t dim, const int* labels,
                            bool verbose) {
    if (dim == 0)
        throw std::invalid_argument("compute_centroids: dim must be > 0");
    if (n > 0 && (!data || !labels))
        throw std::invalid_argument("compute_centroids: null data or labels");

    const size_t k = classes.size();
    auto t0 = std::chrono::steady_clock::now();

    // Partition row indices by class, in input order.
    std::vector<std::vector<size_t>> members(k);
    for (size_t i = 0; i < n; ++i) {
        int l = labels[i];
        if (l < 0 || static_cast<size_t>(l) >= k)
            throw UnknownClassError(std::to_string(l));
        members[static_cast<size_t>(l)].push_back(i);
    }
    for (size_t c = 0; c < k; ++c)
        if (members[c].empty()) throw EmptyClassError(classes.name(c));

    std::vector<float> means(k * dim);
    std::vector<size_t> counts(k);

    for (size_t c = 0; c < k; ++c) {
        const std::vector<size_t>& rows = members[c];
        const double inv_n = 1.0 / static_cast<double>(rows.size());
        float* out = means.data() + c * dim;
        counts[c] = rows.size();

        // Neumaier-compensated sum per coordinate keeps the mean stable
        // under reordering of the samples.
        #pragma omp parallel for schedule(static)
        for (size_t j = 0; j < dim; ++j) {
            double sum = 0.0;
            double comp = 0.0;
            for (size_t r : rows) {
                double x = data[r * dim + j];
                double t = sum + x;
                if (std::fabs(sum) >= std::fabs(x))
                    comp += (sum - t) + x;
                else
                    comp += (x - t) + sum;
                sum = t;
            }
            out[j] = static_cast<float>((sum + comp) * inv_n);
        }

        if (verbose)
            log_info("  class '%s': %zu samples", classes.name(c).c_str(),
                     rows.size());
    }

    if (verbose) {
        double ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - t0).count();
        log_info("computed %zu centroids (N=%zu, D=%zu) in %.2fms", k, n, dim, ms);
    }

    return Centroids(classes, dim, std::move(means), std::move(counts));
}

// ============== Inference ==============

int select_nearest(const float* dists, size_t k, float tie_tolerance) {
    if (k == 0) return -1;
    int best = 0;
    float best_val = dists[0];
    for (size_t c = 1; c < k; ++c) {
        float margin = tie_tolerance * std::max(1.0f, std::fabs(best_val));
        if (dists[c] < best_val - margin) {
            best_val = dists[c];
            best = static_cast<int>(c);
        }
    }
    return best;
}

Prediction nearest_centroid(const float* x, size_t n,
                            const Centroids& centroids, Metric metric,
                            float tie_tolerance) {
    if (n != centroids.dim())
        throw DimensionMismatchError("nearest_centroid", centroids.dim(), n);
    if (!x)
        throw std::invalid_argument("nearest_centroid: null vector");

    if (metric == Metric::Cosine) {
        if (std::sqrt(squared_norm(x, n)) <= kZeroNormEpsilon)
            throw ZeroVectorError("nearest_centroid: input has zero norm");
        for (size_t c = 0; c < centroids.k(); ++c)
            if (std::sqrt(squared_norm(centroids.row(c), n)) <= kZeroNormEpsilon)
                throw ZeroVectorError("nearest_centroid: centroid of class '" +
                                      centroids.classes().name(c) +
                                      "' has zero norm");
    }

    Prediction p;
    p.distances.resize(centroids.k());
    for (size_t c = 0; c < centroids.k(); ++c)
        p.distances[c] = distance(x, n, centroids.row(c), centroids.dim(), metric);

    p.label = select_nearest(p.distances.data(), p.distances.size(), tie_tolerance);
    p.class_name = centroids.classes().name(static_cast<size_t>(p.label));
    return p;
}

}  // namespace centrix
