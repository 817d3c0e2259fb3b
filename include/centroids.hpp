#ifndef CENTRIX_CENTROIDS_HPP
#define CENTRIX_CENTROIDS_HPP

#include "distance.hpp"
#include <cstddef>
#include <initializer_list>
#include <string>
#include <unordered_map>
#include <vector>

namespace centrix {

// Relative tolerance under which two centroid distances count as a tie.
constexpr float kDefaultTieTolerance = 1e-6f;

/**
 * Fixed, ordered set of class names. Index order is the declared order and
 * is the order used for tie-breaking and for per-class distance vectors.
 */
class ClassSet {
public:
    explicit ClassSet(std::vector<std::string> names);
    ClassSet(std::initializer_list<std::string> names);

    size_t size() const { return names_.size(); }
    const std::string& name(size_t index) const;
    const std::vector<std::string>& names() const { return names_; }

    bool contains(const std::string& name) const;

    // Throws UnknownClassError.
    int index_of(const std::string& name) const;

private:
    std::vector<std::string> names_;
    std::unordered_map<std::string, int> index_;
};

struct Sample {
    std::string label;
    std::vector<float> vector;
};

/**
 * One mean vector per class, row-major k() x dim(), plus the number of
 * training samples behind each row. Immutable once built.
 */
class Centroids {
public:
    Centroids(ClassSet classes, size_t dim, std::vector<float> data,
              std::vector<size_t> counts);

    const ClassSet& classes() const { return classes_; }
    size_t k() const { return classes_.size(); }
    size_t dim() const { return dim_; }

    const float* data() const { return data_.data(); }
    const float* row(size_t c) const { return data_.data() + c * dim_; }
    std::vector<float> centroid(size_t c) const;
    std::vector<float> centroid(const std::string& class_name) const;

    // Training samples averaged into class c.
    size_t count(size_t c) const { return counts_[c]; }

private:
    ClassSet classes_;
    size_t dim_;
    std::vector<float> data_;
    std::vector<size_t> counts_;
};

struct Prediction {
    int label = -1;
    std::string class_name;
    // Distance to every centroid, in declared class order.
    std::vector<float> distances;

    float distance() const { return distances[static_cast<size_t>(label)]; }
};

// Coordinate-wise class means. data is row-major n x dim, labels[i] is an
// index into classes. Throws DimensionMismatchError, UnknownClassError or
// EmptyClassError (first empty class in declared order).
Centroids compute_centroids(const ClassSet& classes, const float* data,
                            size_t n, size_t dim, const int* labels,
                            bool verbose = false);

// Argmin over dists[0..k). A later entry wins only when it is smaller by
// more than tie_tolerance * max(1, |best|), so ties go to the lowest index.
int select_nearest(const float* dists, size_t k, float tie_tolerance);

Prediction nearest_centroid(const float* x, size_t n,
                            const Centroids& centroids, Metric metric,
                            float tie_tolerance = kDefaultTieTolerance);

}  // namespace centrix

#endif  // CENTRIX_CENTROIDS_HPP
