// error.hpp - error taxonomy raised by the builder
#pragma once
#include <stdexcept>
#include <string>

namespace forge {

enum class ErrorKind {
    ShapeMismatch,
    NoSuchField,
    FieldIndexOutOfBounds,
    NoSuchVariant,
    VariantIndexOutOfBounds,
    ArrayIndexOutOfBounds,
    WrongKind,
    NoDefault,
    AllocationFailed,
    Unsized,
    NotFullyInitialized,
    InvariantViolation,
    Poisoned,
    ConversionFailed,
    ParseFailed
};

// Stable diagnostic code, e.g. "E2002".
const char* error_code(ErrorKind k);
const char* error_kind_name(ErrorKind k);

struct build_error : std::runtime_error {
    build_error(ErrorKind kind, std::string message, std::string hint = {});

    ErrorKind kind;
    std::string message;
    std::string hint;
    std::string path; // frame path at the point of failure, filled in by Partial

    const char* code() const { return error_code(kind); }
    void set_path(std::string p);
    const char* what() const noexcept override { return full_.c_str(); }

private:
    void render();
    std::string full_;
};

} // namespace forge
