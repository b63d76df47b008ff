#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/operators.h>
#include "winprob/common.hpp"
#include "winprob/poly/polynomial.hpp"
#include "winprob/poly/display_polynomial.hpp"
#include "winprob/poly/rational.hpp"
#include "winprob/solver/memo_table.hpp"
#include "winprob/solver/solver.hpp"
#include "winprob/solver/batch_solver.hpp"

namespace py = pybind11;

namespace {

using winprob::poly::DisplayPolynomial;
using winprob::poly::Polynomial;

// Exact coefficient as fractions.Fraction
py::object to_fraction(const mpq_class& value) {
    return py::module_::import("fractions").attr("Fraction")(value.get_str());
}

// Accepts int, str ("3/8") or fractions.Fraction
mpq_class from_python(const py::object& value) {
    try {
        return winprob::poly::parse_rational(py::str(value).cast<std::string>());
    } catch (const winprob::InvalidInputError& e) {
        throw py::value_error(e.what());
    }
}

py::list fraction_list(const Polynomial& poly) {
    py::list out;
    for (const auto& c : poly.coefficients()) {
        out.append(to_fraction(c));
    }
    return out;
}

} // namespace

PYBIND11_MODULE(win_prob_cpp, m) {
    m.doc() = "Win probability of a race to N points as a cubic in (p - 1/2)";

    py::register_exception<winprob::OutOfRangeError>(m, "OutOfRangeError", PyExc_ValueError);

    // Score
    py::class_<winprob::Score>(m, "Score")
        .def(py::init<>())
        .def(py::init([](int win, int lose) { return winprob::Score{win, lose}; }),
             py::arg("win"), py::arg("lose"))
        .def_readwrite("win", &winprob::Score::win, "Points won")
        .def_readwrite("lose", &winprob::Score::lose, "Points lost");

    // DisplayPolynomial
    py::class_<DisplayPolynomial>(m, "DisplayPolynomial")
        .def(py::init<double, double, double, double>(),
             py::arg("c0"), py::arg("c1"), py::arg("c2"), py::arg("c3"))
        .def("coefficients", &DisplayPolynomial::coefficients, "Coefficients of degree 0..3")
        .def("at", &DisplayPolynomial::at, py::arg("p"), "Value at win probability p")
        .def("__str__", &DisplayPolynomial::to_string)
        .def("__repr__", [](const DisplayPolynomial& poly) {
            return "DisplayPolynomial(" + poly.to_string() + ")";
        })
        .def(py::self == py::self);

    // Polynomial (exact)
    py::class_<Polynomial>(m, "Polynomial")
        .def(py::init<>())
        .def(py::init([](const py::object& c0, const py::object& c1,
                         const py::object& c2, const py::object& c3) {
                 return Polynomial(from_python(c0), from_python(c1), from_python(c2), from_python(c3));
             }),
             py::arg("c0"), py::arg("c1"), py::arg("c2"), py::arg("c3"))
        .def("coefficients", &fraction_list, "Coefficients of degree 0..3 as Fractions")
        .def("at", [](const Polynomial& poly, const py::object& p) {
                 return to_fraction(poly.at(from_python(p)));
             },
             py::arg("p"), "Exact value at win probability p")
        .def("float", &Polynomial::to_display, "Nearest-double copy for output")
        .def("__str__", &Polynomial::to_string)
        .def("__repr__", [](const Polynomial& poly) {
            return "Polynomial(" + poly.to_string() + ")";
        })
        .def(py::self + py::self)
        .def(py::self - py::self)
        .def(py::self * py::self)
        .def(py::self == py::self);

    m.def("P", &Polynomial::p, "Probability of winning a point: 1/2 + (p - 1/2)");
    m.def("Q", &Polynomial::q, "Probability of losing a point: 1/2 - (p - 1/2)");

    // Memo tables
    py::class_<winprob::solver::MemoTable, std::shared_ptr<winprob::solver::MemoTable>>(m, "MemoTable")
        .def("__len__", &winprob::solver::MemoTable::size);

    py::class_<winprob::solver::HashMemoTable, winprob::solver::MemoTable,
               std::shared_ptr<winprob::solver::HashMemoTable>>(m, "HashMemoTable")
        .def(py::init<>(), "Single-threaded memo table");

    py::class_<winprob::solver::ConcurrentMemoTable, winprob::solver::MemoTable,
               std::shared_ptr<winprob::solver::ConcurrentMemoTable>>(m, "ConcurrentMemoTable")
        .def(py::init<>(), "Thread-safe memo table");

    // Solver
    py::class_<winprob::solver::Solver>(m, "Solver")
        .def(py::init<>())
        .def(py::init<std::shared_ptr<winprob::solver::MemoTable>>(), py::arg("table"))
        .def("solve",
             py::overload_cast<int, int, int>(&winprob::solver::Solver::solve),
             py::arg("win"),
             py::arg("lose"),
             py::arg("goal") = winprob::kDefaultGoal,
             "Win probability polynomial from the score win-lose")
        .def_property_readonly("table", &winprob::solver::Solver::table);

    // BatchSolver
    py::class_<winprob::solver::BatchSolver>(m, "BatchSolver")
        .def(py::init<std::shared_ptr<winprob::solver::ConcurrentMemoTable>, int>(),
             py::arg("table"),
             py::arg("num_threads") = 4,
             "Create a parallel solver over a shared ConcurrentMemoTable")
        .def("solve_batch", &winprob::solver::BatchSolver::solve_batch,
             py::arg("scores"),
             py::arg("goal") = winprob::kDefaultGoal,
             py::call_guard<py::gil_scoped_release>(),
             "Solve many scores in parallel")
        .def("num_threads", &winprob::solver::BatchSolver::num_threads,
             "Get number of threads");

    m.attr("__version__") = "0.1.0";
}
