#include <pybind11/pybind11.h>
#include <pybind11/complex.h>
#include <pybind11/stl.h>

#include <random>

#include "quizterm/grading.h"
#include "quizterm/matrix.h"
#include "quizterm/numeric.h"
#include "quizterm/ode.h"
#include "quizterm/symbolic.h"
#include "quizterm/term.h"

namespace py = pybind11;

PYBIND11_MODULE(quizterm, m) {
    m.doc() = "Permissive math term parsing and randomized equivalence testing";

    auto& base = py::register_exception<quizterm::QuizTermError>(m, "QuizTermError");
    py::register_exception<quizterm::ParseError>(m, "ParseError", base.ptr());
    py::register_exception<quizterm::EvalError>(m, "EvalError", base.ptr());
    py::register_exception<quizterm::TermError>(m, "TermError", base.ptr());
    py::register_exception<quizterm::NumericError>(m, "NumericError", base.ptr());
    py::register_exception<quizterm::SymbolicError>(m, "SymbolicError", base.ptr());
    py::register_exception<quizterm::MatrixError>(m, "MatrixError", base.ptr());

    py::class_<quizterm::Term>(m, "Term")
        .def_static("parse", &quizterm::Term::parse, py::arg("source"))
        .def("eval", &quizterm::Term::eval, py::arg("bindings") = quizterm::Bindings())
        .def("variables", &quizterm::Term::variables, py::arg("prefix") = "")
        .def("to_display_string", &quizterm::Term::to_display_string)
        .def("to_tex_string", &quizterm::Term::to_tex_string)
        .def("__str__", &quizterm::Term::to_display_string);

    py::class_<quizterm::ProbeResult>(m, "ProbeResult")
        .def_readonly("equal", &quizterm::ProbeResult::equal)
        .def_readonly("trials_executed", &quizterm::ProbeResult::trials_executed)
        .def_readonly("max_error", &quizterm::ProbeResult::max_error);

    m.def("probe_equal",
          [](const quizterm::Term& lhs, const quizterm::Term& rhs, int trials, unsigned seed,
             double domain_min, double domain_max, double epsilon) {
              quizterm::CompareOptions options;
              options.trials = trials;
              options.domain_min = domain_min;
              options.domain_max = domain_max;
              options.epsilon = epsilon;
              std::mt19937 rng(seed);
              return quizterm::probe_equal(lhs, rhs, quizterm::Bindings(), rng, options);
          },
          py::arg("lhs"), py::arg("rhs"),
          py::arg("trials") = 10,
          py::arg("seed") = 42,
          py::arg("domain_min") = 0.0,
          py::arg("domain_max") = 1.0,
          py::arg("epsilon") = 1e-9);

    m.def("compare",
          [](const quizterm::Term& lhs, const quizterm::Term& rhs) { return quizterm::compare(lhs, rhs); },
          py::arg("lhs"), py::arg("rhs"));
    m.def("compare_ode",
          [](const quizterm::Term& lhs, const quizterm::Term& rhs) { return quizterm::compare_ode(lhs, rhs); },
          py::arg("lhs"), py::arg("rhs"));

    m.def("to_symengine_string", &quizterm::to_symengine_string, py::arg("term"));
    m.def("reference_eval", &quizterm::reference_eval,
          py::arg("term"), py::arg("bindings") = quizterm::Bindings());

    py::class_<quizterm::Matrix>(m, "Matrix")
        .def(py::init<std::size_t, std::size_t>(), py::arg("rows") = 0, py::arg("cols") = 0)
        .def_static("from_string", &quizterm::Matrix::from_string, py::arg("source"))
        .def_property_readonly("rows", &quizterm::Matrix::rows)
        .def_property_readonly("cols", &quizterm::Matrix::cols)
        .def("element", &quizterm::Matrix::element, py::arg("i"), py::arg("j"))
        .def("resize", &quizterm::Matrix::resize, py::arg("rows"), py::arg("cols"), py::arg("init"))
        .def("max_cell_length", &quizterm::Matrix::max_cell_length)
        .def("to_tex_string", &quizterm::Matrix::to_tex_string,
             py::arg("augmented") = false, py::arg("brackets") = true);

    py::class_<quizterm::GradeResult>(m, "GradeResult")
        .def_readonly("checked", &quizterm::GradeResult::checked)
        .def_readonly("correct", &quizterm::GradeResult::correct)
        .def("passed", &quizterm::GradeResult::passed);

    py::enum_<quizterm::ListKind>(m, "ListKind")
        .value("Vector", quizterm::ListKind::Vector)
        .value("Complex", quizterm::ListKind::Complex)
        .value("Set", quizterm::ListKind::Set);

    m.def("levenshtein_distance", &quizterm::levenshtein_distance, py::arg("a"), py::arg("b"));
    m.def("grade_bool", &quizterm::grade_bool, py::arg("expected"), py::arg("student"));
    m.def("grade_gap", &quizterm::grade_gap, py::arg("expected"), py::arg("student"));
    m.def("grade_int", &quizterm::grade_int, py::arg("expected"), py::arg("student"));
    m.def("grade_term",
          py::overload_cast<const std::string&, const std::string&, bool>(&quizterm::grade_term),
          py::arg("expected"), py::arg("student"), py::arg("is_ode") = false);
    m.def("grade_list",
          py::overload_cast<quizterm::ListKind, const std::string&, const std::vector<std::string>&>(
              &quizterm::grade_list),
          py::arg("kind"), py::arg("expected"), py::arg("students"));
    m.def("grade_matrix",
          py::overload_cast<const std::string&, const std::vector<std::string>&>(&quizterm::grade_matrix),
          py::arg("expected"), py::arg("students"));
}
