//! # Arrays
//!
//! `Array<T>` is a reference-typed array of any rank. Elements are stored
//! contiguously in row-major order; each dimension keeps its own length.
//!
//! ```cpp
//! auto grid = make<Array<int>>(std::vector<std::size_t>{2, 3});
//! grid->at({1, 2}) = 7;
//! ```

#pragma once

#include "runtime/object.hpp"

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace deepclone {

template <typename T> class Array final : public Object {
public:
    using value_type = T;

    Array() : Array(std::vector<std::size_t>{0}) {}

    explicit Array(std::size_t length) : Array(std::vector<std::size_t>{length}) {}

    explicit Array(std::vector<std::size_t> lengths)
        : lengths_(std::move(lengths)), size_(element_total(lengths_)),
          elements_(std::make_unique<T[]>(size_)) {}

    /// Builds a rank-1 array holding `values`.
    static Ref<Array> from(const std::vector<T>& values) {
        auto array = std::make_shared<Array>(values.size());
        std::copy(values.begin(), values.end(), array->begin());
        return array;
    }

    [[nodiscard]] std::size_t rank() const {
        return lengths_.size();
    }

    [[nodiscard]] std::size_t length(std::size_t dimension) const {
        if (dimension >= lengths_.size()) {
            throw std::out_of_range("array dimension " + std::to_string(dimension) +
                                    " out of range for rank " + std::to_string(lengths_.size()));
        }
        return lengths_[dimension];
    }

    [[nodiscard]] const std::vector<std::size_t>& lengths() const {
        return lengths_;
    }

    /// Total number of elements across all dimensions.
    [[nodiscard]] std::size_t size() const {
        return size_;
    }

    [[nodiscard]] bool empty() const {
        return size_ == 0;
    }

    T& operator[](std::size_t index) {
        return elements_[index];
    }

    const T& operator[](std::size_t index) const {
        return elements_[index];
    }

    /// Multi-dimensional access with bounds checking.
    T& at(std::initializer_list<std::size_t> index) {
        return elements_[offset_of(index)];
    }

    const T& at(std::initializer_list<std::size_t> index) const {
        return elements_[offset_of(index)];
    }

    T* data() {
        return elements_.get();
    }

    const T* data() const {
        return elements_.get();
    }

    T* begin() {
        return elements_.get();
    }

    T* end() {
        return elements_.get() + size_;
    }

    const T* begin() const {
        return elements_.get();
    }

    const T* end() const {
        return elements_.get() + size_;
    }

private:
    static std::size_t element_total(const std::vector<std::size_t>& lengths) {
        if (lengths.empty()) {
            throw std::invalid_argument("array rank must be at least 1");
        }
        std::size_t total = 1;
        for (std::size_t length : lengths) {
            total *= length;
        }
        return total;
    }

    std::size_t offset_of(std::initializer_list<std::size_t> index) const {
        if (index.size() != lengths_.size()) {
            throw std::out_of_range("expected " + std::to_string(lengths_.size()) +
                                    " indices, got " + std::to_string(index.size()));
        }
        std::size_t offset = 0;
        std::size_t dimension = 0;
        for (std::size_t i : index) {
            if (i >= lengths_[dimension]) {
                throw std::out_of_range("index " + std::to_string(i) + " out of range in dimension " +
                                        std::to_string(dimension));
            }
            offset = offset * lengths_[dimension] + i;
            ++dimension;
        }
        return offset;
    }

    std::vector<std::size_t> lengths_;
    std::size_t size_;
    std::unique_ptr<T[]> elements_;
};

} // namespace deepclone
