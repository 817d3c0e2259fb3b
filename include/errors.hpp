#ifndef CENTRIX_ERRORS_HPP
#define CENTRIX_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace centrix {

// Grid or flat pixel buffer does not match the declared image shape.
class ShapeError : public std::invalid_argument {
public:
    explicit ShapeError(const std::string& what)
        : std::invalid_argument(what) {}
};

// Two vectors (or a vector and the classifier) disagree on dimension.
class DimensionMismatchError : public std::invalid_argument {
public:
    DimensionMismatchError(const std::string& where, size_t expected,
                           size_t actual)
        : std::invalid_argument(where + ": dimension mismatch (expected " +
                                std::to_string(expected) + ", got " +
                                std::to_string(actual) + ")"),
          expected_(expected), actual_(actual) {}

    size_t expected() const { return expected_; }
    size_t actual() const { return actual_; }

private:
    size_t expected_;
    size_t actual_;
};

// A declared class received no training samples; its mean is undefined.
class EmptyClassError : public std::invalid_argument {
public:
    explicit EmptyClassError(const std::string& class_name)
        : std::invalid_argument("class '" + class_name +
                                "' has no training samples"),
          class_name_(class_name) {}

    const std::string& class_name() const { return class_name_; }

private:
    std::string class_name_;
};

// Label outside the declared class set.
class UnknownClassError : public std::invalid_argument {
public:
    explicit UnknownClassError(const std::string& label)
        : std::invalid_argument("unknown class label '" + label + "'"),
          label_(label) {}

    const std::string& label() const { return label_; }

private:
    std::string label_;
};

// Cosine distance is undefined when either operand has zero norm.
class ZeroVectorError : public std::domain_error {
public:
    explicit ZeroVectorError(const std::string& what)
        : std::domain_error(what) {}
};

class NotFittedError : public std::logic_error {
public:
    explicit NotFittedError(const std::string& where)
        : std::logic_error(where + ": classifier has not been fitted") {}
};

}  // namespace centrix

#endif  // CENTRIX_ERRORS_HPP
