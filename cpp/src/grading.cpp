#include "quizterm/grading.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>

#include "quizterm/matrix.h"
#include "quizterm/numeric.h"
#include "quizterm/ode.h"
#include "quizterm/term.h"

namespace quizterm {

namespace {

// Leading numeric prefix, NaN if there is none.
double read_number(const std::string& s) {
    const char* begin = s.c_str();
    char* end = nullptr;
    const double value = std::strtod(begin, &end);
    if (end == begin) {
        return std::nan("");
    }
    return value;
}

std::vector<std::string> split(const std::string& s, char separator) {
    std::vector<std::string> parts;
    std::istringstream stream(s);
    std::string part;
    while (std::getline(stream, part, separator)) {
        parts.push_back(part);
    }
    if (s.empty() || s.back() == separator) {
        parts.push_back("");
    }
    return parts;
}

std::string trim_upper(const std::string& s) {
    const std::size_t first = s.find_first_not_of(" \t\r\n\f\v");
    if (first == std::string::npos) {
        return std::string();
    }
    const std::size_t last = s.find_last_not_of(" \t\r\n\f\v");
    std::string out = s.substr(first, last - first + 1);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    return out;
}

std::string student_at(const std::vector<std::string>& students, std::size_t i) {
    return i < students.size() ? students[i] : std::string();
}

bool terms_match(const std::string& expected, const std::string& student, bool is_ode,
                 std::mt19937& rng) {
    try {
        const Term u = Term::parse(expected);
        const Term v = Term::parse(student);
        if (is_ode) {
            const StepHalvingMinimizer minimizer;
            return compare_ode(u, v, rng, minimizer);
        }
        return compare(u, v, Bindings(), rng);
    } catch (const ParseError&) {
        return false;
    } catch (const EvalError&) {
        return false;
    }
}

}

std::size_t levenshtein_distance(const std::string& a, const std::string& b) {
    // one row of the edit-distance table at a time
    std::vector<std::size_t> row(b.size() + 1);
    for (std::size_t j = 0; j <= b.size(); ++j) {
        row[j] = j;
    }
    for (std::size_t i = 1; i <= a.size(); ++i) {
        std::size_t diagonal = row[0];
        row[0] = i;
        for (std::size_t j = 1; j <= b.size(); ++j) {
            const std::size_t above = row[j];
            const std::size_t substitution = diagonal + (a[i - 1] == b[j - 1] ? 0 : 1);
            row[j] = std::min(std::min(row[j - 1] + 1, above + 1), substitution);
            diagonal = above;
        }
    }
    return row[b.size()];
}

GradeResult grade_bool(const std::string& expected, const std::string& student) {
    GradeResult result;
    result.checked = 1;
    if (student == expected) {
        result.correct = 1;
    }
    return result;
}

GradeResult grade_gap(const std::string& expected, const std::string& student) {
    GradeResult result;
    result.checked = 1;
    const std::string answer = trim_upper(student);
    for (const std::string& alternative : split(trim_upper(expected), '|')) {
        if (levenshtein_distance(answer, alternative) <= 1) {
            result.correct = 1;
            break;
        }
    }
    return result;
}

GradeResult grade_int(const std::string& expected, const std::string& student) {
    GradeResult result;
    result.checked = 1;
    if (std::fabs(read_number(student) - read_number(expected)) < 1e-9) {
        result.correct = 1;
    }
    return result;
}

GradeResult grade_term(const std::string& expected, const std::string& student, bool is_ode,
                       std::mt19937& rng) {
    GradeResult result;
    result.checked = 1;
    if (terms_match(expected, student, is_ode, rng)) {
        result.correct = 1;
    }
    return result;
}

GradeResult grade_term(const std::string& expected, const std::string& student, bool is_ode) {
    std::random_device device;
    std::mt19937 rng(device());
    return grade_term(expected, student, is_ode, rng);
}

GradeResult grade_list(ListKind kind, const std::string& expected,
                       const std::vector<std::string>& students, std::mt19937& rng) {
    const std::vector<std::string> expected_list = split(expected, ',');
    GradeResult result;
    result.checked = expected_list.size();
    for (std::size_t i = 0; i < expected_list.size(); ++i) {
        if (kind != ListKind::Set) {
            if (terms_match(expected_list[i], student_at(students, i), false, rng)) {
                ++result.correct;
            }
            continue;
        }
        for (std::size_t j = 0; j < expected_list.size(); ++j) {
            if (terms_match(expected_list[i], student_at(students, j), false, rng)) {
                ++result.correct;
                break;
            }
        }
    }
    return result;
}

GradeResult grade_list(ListKind kind, const std::string& expected,
                       const std::vector<std::string>& students) {
    std::random_device device;
    std::mt19937 rng(device());
    return grade_list(kind, expected, students, rng);
}

GradeResult grade_matrix(const std::string& expected, const std::vector<std::string>& students,
                         std::mt19937& rng) {
    const Matrix matrix = Matrix::from_string(expected);
    GradeResult result;
    result.checked = matrix.elements().size();
    for (std::size_t idx = 0; idx < matrix.elements().size(); ++idx) {
        if (terms_match(matrix.elements()[idx], student_at(students, idx), false, rng)) {
            ++result.correct;
        }
    }
    return result;
}

GradeResult grade_matrix(const std::string& expected, const std::vector<std::string>& students) {
    std::random_device device;
    std::mt19937 rng(device());
    return grade_matrix(expected, students, rng);
}

}
