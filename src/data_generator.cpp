#include "data_generator.hpp"
#include <algorithm>
#include <random>
#include <stdexcept>

namespace centrix {

SyntheticImages generate_class_images(size_t n, const ImageShape& shape,
                                      int num_classes, unsigned seed,
                                      float noise, float brightness_jitter) {
    const size_t dim = shape.dim();
    if (n == 0 || dim == 0 || num_classes <= 0)
        throw std::invalid_argument("generate_class_images: invalid parameters");
    if (noise < 0.0f || brightness_jitter < 0.0f || brightness_jitter >= 1.0f)
        throw std::invalid_argument("generate_class_images: invalid noise parameters");

    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> pixel_dist(0.0f, 255.0f);
    std::uniform_real_distribution<float> gain_dist(1.0f - brightness_jitter,
                                                    1.0f + brightness_jitter);
    std::normal_distribution<float> noise_dist(0.0f, 1.0f);

    std::vector<float> prototypes(static_cast<size_t>(num_classes) * dim);
    for (float& p : prototypes) p = pixel_dist(rng);

    SyntheticImages out;
    out.data.resize(n * dim);
    out.labels.resize(n);

    for (size_t i = 0; i < n; ++i) {
        int c = static_cast<int>(i % static_cast<size_t>(num_classes));
        out.labels[i] = c;
        const float* proto = prototypes.data() + static_cast<size_t>(c) * dim;
        float* row = out.data.data() + i * dim;
        float gain = gain_dist(rng);
        for (size_t j = 0; j < dim; ++j) {
            float v = gain * proto[j] + noise * noise_dist(rng);
            row[j] = std::min(255.0f, std::max(0.0f, v));
        }
    }
    return out;
}

}  // namespace centrix
