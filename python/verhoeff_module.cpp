// python/verhoeff_module.cpp - Pybind11 module entrypoint exposing the verhoeff checksum API.

#include <cstddef>
#include <string>
#include <vector>

#include <pybind11/pybind11.h>

#include <pybind11/stl.h>

#include <verhoeff/verhoeff.hpp>

namespace py = pybind11;

PYBIND11_MODULE(verhoeff, module) {
    module.doc() = "Python bindings for the verhoeff check digit library";

    static py::exception<verhoeff::checksum_error> checksum_exception(module, "ChecksumError",
                                                                      PyExc_ValueError);
    py::register_exception_translator([](std::exception_ptr pointer) {
        try {
            if (pointer) {
                std::rethrow_exception(pointer);
            }
        } catch (const verhoeff::checksum_error& error) {
            py::object instance = py::handle(checksum_exception.ptr())(error.what());
            instance.attr("code") = std::string(verhoeff::to_string(error.code()));
            switch (error.code()) {
            case verhoeff::errc::invalid_character:
                instance.attr("character") = py::bytes(std::string(1, error.character()));
                instance.attr("position") = error.position();
                break;
            case verhoeff::errc::invalid_length:
                instance.attr("length") = error.length();
                instance.attr("expected_length") = error.expected_length();
                break;
            case verhoeff::errc::empty_input:
                break;
            }
            PyErr_SetObject(checksum_exception.ptr(), instance.ptr());
        }
    });

    module.attr("IDENTIFIER_LENGTH") = verhoeff::IDENTIFIER_LENGTH;

    module.def(
        "calculate_checksum",
        [](const std::string& input) { return static_cast<int>(verhoeff::calculate_checksum(input)); },
        py::arg("input"),
        "Check digit (0-9) for a string of decimal digits");
    module.def("append_checksum", &verhoeff::append_checksum, py::arg("input"),
               "Return the input with its check digit appended");
    module.def("validate", &verhoeff::validate, py::arg("input"),
               "True when the trailing check digit matches; malformed input yields False");
    module.def("validate_strict", &verhoeff::validate_strict, py::arg("input"),
               "True when the trailing check digit matches; raises ChecksumError for malformed input");
    module.def("validate_identifier", &verhoeff::validate_identifier, py::arg("identifier"),
               "Validate a 12 digit identifier; raises ChecksumError for malformed input or length");
    module.def("make_identifier", &verhoeff::make_identifier, py::arg("body"),
               "Build a 12 digit identifier from 11 body digits");
    module.def(
        "parse_digits",
        [](const std::string& input) {
            const auto digits = verhoeff::io::parse_digits(input);
            return std::vector<int>(digits.begin(), digits.end());
        },
        py::arg("input"),
        "Digit values of a decimal string, in input order");
}
