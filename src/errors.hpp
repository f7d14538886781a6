#ifndef ERRORS_HPP
#define ERRORS_HPP
#include <stdexcept>
#include <string>

// FFT input length is not a power of two.
class SizeError : public std::invalid_argument {
public:
    explicit SizeError(const std::string& what) : std::invalid_argument(what) {}
};

// Tensor dimensions disagree between two operands or with a transform's
// expectations.
class ShapeError : public std::invalid_argument {
public:
    explicit ShapeError(const std::string& what) : std::invalid_argument(what) {}
};

// Offsets, lengths or targets outside the bounds of a tensor.
class RangeError : public std::out_of_range {
public:
    explicit RangeError(const std::string& what) : std::out_of_range(what) {}
};

class SeparationCancelled : public std::runtime_error {
public:
    SeparationCancelled() : std::runtime_error("separation cancelled") {}
};

#endif
