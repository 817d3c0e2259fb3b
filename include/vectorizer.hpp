#ifndef CENTRIX_VECTORIZER_HPP
#define CENTRIX_VECTORIZER_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace centrix {

// H rows, each holding W * C interleaved channel values.
using Grid = std::vector<std::vector<float>>;

struct ImageShape {
    int height = 0;
    int width = 0;
    int channels = 1;

    size_t dim() const {
        return static_cast<size_t>(height) * static_cast<size_t>(width) *
               static_cast<size_t>(channels);
    }
    size_t row_length() const {
        return static_cast<size_t>(width) * static_cast<size_t>(channels);
    }
};

enum class PixelScale { Raw, Unit };

/**
 * Flattens a fixed-shape image into a vector of length D = H * W * C.
 * Row-major, channels interleaved: element (i, j, c) lands at flat index
 * (i * W + j) * C + c. With C == 1 that is i * W + j. Every vector fed to
 * the classifier must come from the same shape so coordinates line up.
 */
class Vectorizer {
public:
    explicit Vectorizer(ImageShape shape);

    const ImageShape& shape() const { return shape_; }
    size_t dim() const { return shape_.dim(); }

    std::vector<float> vectorize(const Grid& grid) const;

    // Flat HWC buffer, already in row-major order.
    std::vector<float> vectorize(const float* pixels, size_t count) const;

    // Decoded 8-bit image. Raw keeps 0..255, Unit maps to [0, 1].
    std::vector<float> vectorize_u8(const uint8_t* pixels, size_t count,
                                    PixelScale scale = PixelScale::Raw) const;

    // Inverse of vectorize(); reshapes a vector (e.g. a centroid) to a grid.
    Grid unvectorize(const float* v, size_t n) const;

    // Truncating, saturating conversion to 8-bit pixels for mean images.
    std::vector<uint8_t> to_u8(const float* v, size_t n) const;

private:
    ImageShape shape_;

    void check_length(const char* where, size_t n) const;
};

}  // namespace centrix

#endif  // CENTRIX_VECTORIZER_HPP
