#include "vectorizer.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace centrix {

namespace {

std::string shape_str(const ImageShape& s) {
    return std::to_string(s.height) + "x" + std::to_string(s.width) + "x" +
           std::to_string(s.channels);
}

}  // namespace

Vectorizer::Vectorizer(ImageShape shape) : shape_(shape) {
    if (shape_.height <= 0 || shape_.width <= 0 || shape_.channels <= 0)
        throw ShapeError("Vectorizer: invalid image shape " + shape_str(shape_));
}

void Vectorizer::check_length(const char* where, size_t n) const {
    if (n != dim())
        throw ShapeError(std::string(where) + ": expected " +
                         std::to_string(dim()) + " values for shape " +
                         shape_str(shape_) + ", got " + std::to_string(n));
}

std::vector<float> Vectorizer::vectorize(const Grid& grid) const {
    const size_t rows = static_cast<size_t>(shape_.height);
    const size_t row_len = shape_.row_length();
    if (grid.size() != rows)
        throw ShapeError("Vectorizer::vectorize: expected " +
                         std::to_string(rows) + " rows, got " +
                         std::to_string(grid.size()));

    std::vector<float> out;
    out.reserve(dim());
    for (size_t i = 0; i < rows; ++i) {
        if (grid[i].size() != row_len)
            throw ShapeError("Vectorizer::vectorize: row " + std::to_string(i) +
                             " has " + std::to_string(grid[i].size()) +
                             " values, expected " + std::to_string(row_len));
        out.insert(out.end(), grid[i].begin(), grid[i].end());
    }
    return out;
}

std::vector<float> Vectorizer::vectorize(const float* pixels,
                                         size_t count) const {
    if (!pixels)
        throw ShapeError("Vectorizer::vectorize: null pixel buffer");
    check_length("Vectorizer::vectorize", count);
    return std::vector<float>(pixels, pixels + count);
}

std::vector<float> Vectorizer::vectorize_u8(const uint8_t* pixels, size_t count,
                                            PixelScale scale) const {
    if (!pixels)
        throw ShapeError("Vectorizer::vectorize_u8: null pixel buffer");
    check_length("Vectorizer::vectorize_u8", count);

    const float mul = (scale == PixelScale::Unit) ? 1.0f / 255.0f : 1.0f;
    std::vector<float> out(count);
    for (size_t i = 0; i < count; ++i)
        out[i] = static_cast<float>(pixels[i]) * mul;
    return out;
}

Grid Vectorizer::unvectorize(const float* v, size_t n) const {
    if (!v)
        throw ShapeError("Vectorizer::unvectorize: null vector");
    check_length("Vectorizer::unvectorize", n);

    const size_t row_len = shape_.row_length();
    Grid grid(static_cast<size_t>(shape_.height));
    for (size_t i = 0; i < grid.size(); ++i)
        grid[i].assign(v + i * row_len, v + (i + 1) * row_len);
    return grid;
}

std::vector<uint8_t> Vectorizer::to_u8(const float* v, size_t n) const {
    if (!v)
        throw ShapeError("Vectorizer::to_u8: null vector");
    check_length("Vectorizer::to_u8", n);

    std::vector<uint8_t> out(n);
    for (size_t i = 0; i < n; ++i) {
        float x = std::isfinite(v[i]) ? v[i] : 0.0f;
        x = std::min(255.0f, std::max(0.0f, x));
        out[i] = static_cast<uint8_t>(x);
    }
    return out;
}

}  // namespace centrix
