#ifndef ENVELOPEKIT_COMMON_ERRORS_HPP
#define ENVELOPEKIT_COMMON_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace envelopekit {

enum class ErrorKind {
    InputValidation,
    GeometryConstruction,
    UnsupportedInput
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InputValidation: return "InputValidationError";
        case ErrorKind::GeometryConstruction: return "GeometryConstructionError";
        case ErrorKind::UnsupportedInput: return "UnsupportedInputError";
    }
    return "Error";
}

// Base of every error raised by the generators.
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Bad counts, null or open curves, misaligned sequences.
// Always raised before any geometry is built.
class InputValidationError : public Error {
public:
    explicit InputValidationError(const std::string& message)
        : Error(ErrorKind::InputValidation, message) {}
};

// A kernel operation returned nothing. `element` names the failing
// cell, panel or floor pair so the caller can localize the fault.
class GeometryConstructionError : public Error {
public:
    GeometryConstructionError(const std::string& message, std::string element)
        : Error(ErrorKind::GeometryConstruction, message), element_(std::move(element)) {}

    const std::string& element() const { return element_; }

private:
    std::string element_;
};

// Geometry of a shape the generator cannot take as a surface.
class UnsupportedInputError : public Error {
public:
    explicit UnsupportedInputError(const std::string& message)
        : Error(ErrorKind::UnsupportedInput, message) {}
};

}  // namespace envelopekit

#endif // ENVELOPEKIT_COMMON_ERRORS_HPP
