#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "errors.hpp"

namespace quizterm {

// m x n grid of term sources, stored row-major.
class Matrix {
public:
    static constexpr std::size_t kMaxDimension = 50;

    Matrix(std::size_t rows = 0, std::size_t cols = 0);

    // Parses e.g. "[[1+sin(x),2,3/x],[4,5^2,6]]". Commas separate elements,
    // so element terms must not contain one. Throws MatrixError when the
    // element count does not fill a rectangle.
    static Matrix from_string(const std::string& source);

    std::size_t rows() const { return rows_; }
    std::size_t cols() const { return cols_; }
    const std::vector<std::string>& elements() const { return elements_; }

    // Returns "" if (i, j) is out of range.
    std::string element(std::size_t i, std::size_t j) const;

    // Keeps the overlapping elements and fills new cells with init. Returns
    // false, leaving the matrix unchanged, unless 1 <= rows, cols <= 50.
    bool resize(std::size_t rows, std::size_t cols, const std::string& init);

    std::size_t max_cell_length() const;

    // bmatrix/pmatrix, or an array with a bar before the last column if
    // augmented. Elements that do not parse are emitted verbatim.
    std::string to_tex_string(bool augmented = false, bool brackets = true) const;

private:
    std::size_t rows_;
    std::size_t cols_;
    std::vector<std::string> elements_;
};

}
