#ifndef CENTRIX_DATA_GENERATOR_HPP
#define CENTRIX_DATA_GENERATOR_HPP

#include "vectorizer.hpp"
#include <cstddef>
#include <vector>

namespace centrix {

struct SyntheticImages {
    std::vector<float> data;   // n x shape.dim(), row-major
    std::vector<int> labels;   // n, round-robin over classes
};

// Synthetic labelled image vectors for tests and benchmarks.
// Each class gets a random prototype image with intensities in [0, 255];
// samples add Gaussian pixel noise of stddev `noise` and a per-sample
// brightness factor in [1 - brightness_jitter, 1 + brightness_jitter],
// clamped back to [0, 255]. Same seed -> same output.
SyntheticImages generate_class_images(size_t n, const ImageShape& shape,
                                      int num_classes, unsigned seed,
                                      float noise = 20.0f,
                                      float brightness_jitter = 0.0f);

}  // namespace centrix

#endif  // CENTRIX_DATA_GENERATOR_HPP
