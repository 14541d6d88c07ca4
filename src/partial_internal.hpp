// partial_internal.hpp - helpers shared by the partial_*.cpp translation units
#pragma once
#include <exception>
#include <type_traits>

#include <llvm/Support/raw_ostream.h>

#include "forge/diagnostics_json.hpp"
#include "forge/partial.hpp"

namespace forge {

// Runs one public operation: rejects calls on a poisoned or consumed builder,
// traces the call, and poisons the builder if the body throws.
template <class F>
auto Partial::guarded(const char* op, llvm::StringRef detail, F&& body) -> decltype(body()) {
    ensure_active(op);
    trace(op, detail);
    try {
        if constexpr (std::is_void_v<decltype(body())>) {
            body();
            if(env_.check_invariants && state_ == State::Active) check_invariants();
        } else {
            auto result = body();
            if(env_.check_invariants && state_ == State::Active) check_invariants();
            return result;
        }
    } catch (build_error& e) {
        poison(e);
        throw;
    } catch (const std::exception& e) {
        // thrown by a user hook or the allocator; surfaces unchanged
        poison_foreign(op, e);
        throw;
    }
}

inline llvm::StringRef as_ref(std::string_view s) { return llvm::StringRef(s.data(), s.size()); }

std::string join_key(const KeyPath& key);

inline const Shape& pointee_of(const Shape& ptr){
    return ptr.pointer.build_via ? ptr.pointer.build_via() : ptr.inner();
}

// Can a value of shape src be written into a slot of shape dst?
inline bool accepts(const Shape& dst, const Shape& src){
    if(&dst == &src || dst.vtable.try_from) return true;
    switch(dst.kind){
        case ShapeKind::Transparent:
        case ShapeKind::Option:
            return &dst.inner() == &src;
        case ShapeKind::Pointer:
            return !dst.pointer.slice && &pointee_of(dst) == &src;
        default:
            return false;
    }
}

} // namespace forge
