#include "forge/error.hpp"

#include <llvm/Support/raw_ostream.h>

namespace forge {

const char* error_code(ErrorKind k){
    switch(k){
        case ErrorKind::ShapeMismatch: return "E2001";
        case ErrorKind::NoSuchField: return "E2002";
        case ErrorKind::FieldIndexOutOfBounds: return "E2003";
        case ErrorKind::NoSuchVariant: return "E2004";
        case ErrorKind::VariantIndexOutOfBounds: return "E2005";
        case ErrorKind::ArrayIndexOutOfBounds: return "E2006";
        case ErrorKind::WrongKind: return "E2007";
        case ErrorKind::NoDefault: return "E2008";
        case ErrorKind::AllocationFailed: return "E2009";
        case ErrorKind::Unsized: return "E2010";
        case ErrorKind::NotFullyInitialized: return "E2011";
        case ErrorKind::InvariantViolation: return "E2012";
        case ErrorKind::Poisoned: return "E2013";
        case ErrorKind::ConversionFailed: return "E2014";
        case ErrorKind::ParseFailed: return "E2015";
    }
    return "E2000";
}

const char* error_kind_name(ErrorKind k){
    switch(k){
        case ErrorKind::ShapeMismatch: return "ShapeMismatch";
        case ErrorKind::NoSuchField: return "NoSuchField";
        case ErrorKind::FieldIndexOutOfBounds: return "FieldIndexOutOfBounds";
        case ErrorKind::NoSuchVariant: return "NoSuchVariant";
        case ErrorKind::VariantIndexOutOfBounds: return "VariantIndexOutOfBounds";
        case ErrorKind::ArrayIndexOutOfBounds: return "ArrayIndexOutOfBounds";
        case ErrorKind::WrongKind: return "WrongKind";
        case ErrorKind::NoDefault: return "NoDefault";
        case ErrorKind::AllocationFailed: return "AllocationFailed";
        case ErrorKind::Unsized: return "Unsized";
        case ErrorKind::NotFullyInitialized: return "NotFullyInitialized";
        case ErrorKind::InvariantViolation: return "InvariantViolation";
        case ErrorKind::Poisoned: return "Poisoned";
        case ErrorKind::ConversionFailed: return "ConversionFailed";
        case ErrorKind::ParseFailed: return "ParseFailed";
    }
    return "Unknown";
}

build_error::build_error(ErrorKind k, std::string msg, std::string h)
    : std::runtime_error(msg), kind(k), message(std::move(msg)), hint(std::move(h)) {
    render();
}

void build_error::set_path(std::string p){
    path = std::move(p);
    render();
}

void build_error::render(){
    full_.clear();
    llvm::raw_string_ostream os(full_);
    os << error_code(kind) << " " << error_kind_name(kind);
    if(!path.empty()) os << " at " << path;
    os << ": " << message;
    if(!hint.empty()) os << " (hint: " << hint << ")";
    os.flush();
}

} // namespace forge
