#include "palincheck/normalizer.h"
#include "palincheck/palindrome.h"
#include "palincheck/symmetry.h"
#include "palincheck/unicode_utils.h"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <stdexcept>
#include <string>

namespace py = pybind11;

using palincheck::ClassificationTable;
using palincheck::PalindromeAnalysis;
using palincheck::parse_table;

namespace {

// Python str arrives as UTF-8; table is "unicode" or "ascii"
ClassificationTable table_from_py(const std::string& name) {
    try {
        return parse_table(name);
    } catch (const std::invalid_argument& ex) {
        throw py::value_error(ex.what());
    }
}

py::dict analysis_to_py(const PalindromeAnalysis& analysis) {
    py::dict out;
    out["text"] = palincheck::unicode::sanitize_utf8(analysis.text);
    out["normalized"] = analysis.normalized;
    out["palindrome"] = analysis.palindrome;
    out["exact"] = analysis.exact;
    return out;
}

std::string normalize_py(const std::string& text, const std::string& table) {
    return palincheck::normalize(text, table_from_py(table)).utf8();
}

bool is_symmetric_py(const std::string& text) {
    return palincheck::is_symmetric(palincheck::unicode::to_code_points(text));
}

bool is_palindrome_py(const std::string& text, const std::string& table) {
    return palincheck::is_palindrome(text, table_from_py(table));
}

bool is_palindrome_exact_py(const std::string& text) {
    return palincheck::is_palindrome_exact(text);
}

py::dict analyze_py(const std::string& text, const std::string& table) {
    return analysis_to_py(palincheck::analyze(text, table_from_py(table)));
}

} // namespace

PYBIND11_MODULE(palincheck, m) {
    m.doc() = "Python bindings for the palincheck symmetry checker";

    m.def("normalize", &normalize_py, py::arg("text"), py::arg("table") = "unicode",
          "Lower-cased alphanumeric characters of text, in order");
    m.def("is_symmetric", &is_symmetric_py, py::arg("text"),
          "True if text equals its own reverse, code point by code point");
    m.def("is_palindrome", &is_palindrome_py, py::arg("text"), py::arg("table") = "unicode",
          "Palindrome check ignoring case, spaces and punctuation");
    m.def("is_palindrome_exact", &is_palindrome_exact_py, py::arg("text"),
          "Case-sensitive palindrome check on the text as written");
    m.def("analyze", &analyze_py, py::arg("text"), py::arg("table") = "unicode",
          "Both checks plus the normalized form, as a dict");
}
