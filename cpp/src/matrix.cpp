#include "quizterm/matrix.h"

#include <algorithm>
#include <sstream>
#include <utility>

#include "quizterm/term.h"

namespace quizterm {

namespace {

std::string trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\n\r");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = s.find_last_not_of(" \t\n\r");
    return s.substr(begin, end - begin + 1);
}

std::size_t count_occurrences(const std::string& s, const std::string& needle) {
    std::size_t count = 0;
    for (auto pos = s.find(needle); pos != std::string::npos; pos = s.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

std::string element_tex(const std::string& source) {
    try {
        return Term::parse(source).to_tex_string();
    } catch (const ParseError&) {
        return source;
    }
}

}

Matrix::Matrix(std::size_t rows, std::size_t cols)
    : rows_(rows), cols_(cols), elements_(rows * cols, "0") {}

Matrix Matrix::from_string(const std::string& source) {
    std::string stripped;
    for (char ch : source) {
        if (ch != '[' && ch != ']') {
            stripped += ch;
        }
    }
    if (trim(stripped).empty()) {
        throw MatrixError("empty matrix '" + source + "'");
    }

    std::vector<std::string> elements;
    std::istringstream stream(stripped);
    std::string item;
    while (std::getline(stream, item, ',')) {
        elements.push_back(trim(item));
    }
    if (!stripped.empty() && stripped.back() == ',') {
        elements.push_back("");
    }

    const std::size_t rows = count_occurrences(source, "],") + 1;
    if (elements.size() % rows != 0) {
        throw MatrixError("rows of unequal length in '" + source + "'");
    }

    Matrix matrix;
    matrix.rows_ = rows;
    matrix.cols_ = elements.size() / rows;
    matrix.elements_ = std::move(elements);
    return matrix;
}

std::string Matrix::element(std::size_t i, std::size_t j) const {
    if (i >= rows_ || j >= cols_) {
        return "";
    }
    return elements_[i * cols_ + j];
}

bool Matrix::resize(std::size_t rows, std::size_t cols, const std::string& init) {
    if (rows < 1 || rows > kMaxDimension || cols < 1 || cols > kMaxDimension) {
        return false;
    }
    std::vector<std::string> elements(rows * cols, init);
    for (std::size_t i = 0; i < std::min(rows, rows_); ++i) {
        for (std::size_t j = 0; j < std::min(cols, cols_); ++j) {
            elements[i * cols + j] = elements_[i * cols_ + j];
        }
    }
    rows_ = rows;
    cols_ = cols;
    elements_ = std::move(elements);
    return true;
}

std::size_t Matrix::max_cell_length() const {
    std::size_t length = 0;
    for (const auto& element : elements_) {
        length = std::max(length, element.size());
    }
    return length;
}

std::string Matrix::to_tex_string(bool augmented, bool brackets) const {
    std::string tex;
    if (brackets) {
        tex += augmented ? "\\left[\\begin{array}" : "\\begin{bmatrix}";
    } else {
        tex += augmented ? "\\left(\\begin{array}" : "\\begin{pmatrix}";
    }
    if (augmented) {
        tex += "{" + std::string(cols_ > 0 ? cols_ - 1 : 0, 'c') + "|c}";
    }
    for (std::size_t i = 0; i < rows_; ++i) {
        for (std::size_t j = 0; j < cols_; ++j) {
            if (j > 0) {
                tex += "&";
            }
            tex += element_tex(element(i, j));
        }
        tex += "\\\\";
    }
    if (brackets) {
        tex += augmented ? "\\end{array}\\right]" : "\\end{bmatrix}";
    } else {
        tex += augmented ? "\\end{array}\\right)" : "\\end{pmatrix}";
    }
    return tex;
}

}
