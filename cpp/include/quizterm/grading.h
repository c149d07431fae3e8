#pragma once

#include <cstddef>
#include <random>
#include <string>
#include <vector>

#include "errors.hpp"

namespace quizterm {

struct GradeResult {
    std::size_t checked = 0;
    std::size_t correct = 0;

    bool passed() const { return correct == checked; }

    GradeResult& operator+=(const GradeResult& other) {
        checked += other.checked;
        correct += other.correct;
        return *this;
    }
};

enum class ListKind { Vector, Complex, Set };

// Answer grading for quiz input fields. An answer that does not parse counts
// as checked but not correct; parse errors are never raised to the caller.

// Number of single-character insertions, deletions and substitutions that
// turn a into b.
std::size_t levenshtein_distance(const std::string& a, const std::string& b);

// Choice fields; values are "true"/"false" and must match exactly.
GradeResult grade_bool(const std::string& expected, const std::string& student);

// Gap fields. expected lists alternatives separated by '|'. The answer is
// trimmed and compared case-insensitively; one typo is tolerated.
GradeResult grade_gap(const std::string& expected, const std::string& student);

// Both sides are read as decimal numbers and must agree to within 1e-9.
GradeResult grade_int(const std::string& expected, const std::string& student);

// Single term field, compared with compare(), or with compare_ode() if is_ode.
GradeResult grade_term(const std::string& expected, const std::string& student, bool is_ode,
                       std::mt19937& rng);
GradeResult grade_term(const std::string& expected, const std::string& student,
                       bool is_ode = false);

// expected is a comma separated list, e.g. "1,2,3" for a vector or "2,3" for
// 2+3i. Vector and Complex fields match by position; for a Set every expected
// element counts once if any student element matches it.
GradeResult grade_list(ListKind kind, const std::string& expected,
                       const std::vector<std::string>& students, std::mt19937& rng);
GradeResult grade_list(ListKind kind, const std::string& expected,
                       const std::vector<std::string>& students);

// expected in Matrix::from_string syntax; students in row-major order.
// Throws MatrixError if expected itself is malformed.
GradeResult grade_matrix(const std::string& expected, const std::vector<std::string>& students,
                         std::mt19937& rng);
GradeResult grade_matrix(const std::string& expected, const std::vector<std::string>& students);

}
