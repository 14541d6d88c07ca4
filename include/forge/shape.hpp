// shape.hpp - runtime type descriptors consumed by the builder
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <llvm/ADT/STLFunctionalExtras.h>

namespace forge {

struct Shape;

// Child shapes are referenced lazily so that descriptors may be recursive.
using ShapeFn = const Shape& (*)();

enum class ShapeKind {
    Scalar,
    Struct,
    Enum,
    List,
    Map,
    Set,
    Option,
    Either,
    Pointer,
    Array,
    Transparent
};

const char* kind_name(ShapeKind k);

struct Layout {
    size_t size = 0;
    size_t align = 1;
    bool sized = true;
};

// Per-type operations. A null drop_in_place means trivially destructible and a
// null move_into means the bytes may be relocated with memcpy.
struct VTable {
    void (*default_in_place)(void* dst) = nullptr;
    void (*drop_in_place)(void* value) = nullptr;
    void (*clone_into)(const void* src, void* dst) = nullptr;
    // Relocate: move-construct dst from src, then destroy src.
    void (*move_into)(void* src, void* dst) = nullptr;
    bool (*parse)(std::string_view text, void* dst, std::string& err) = nullptr;
    // Construct dst from a value of another shape; src is left untouched.
    // Returning false with err left empty means src_shape is not supported.
    bool (*try_from)(const Shape& src_shape, const void* src, void* dst, std::string& err) = nullptr;
};

enum FieldFlags : unsigned {
    FieldNone = 0,
    FieldHasDefault = 1u << 0,
};

struct Field {
    std::string name;
    size_t offset = 0;
    ShapeFn shape = nullptr;
    unsigned flags = FieldNone;
    void (*default_fn)(void* dst) = nullptr; // overrides the field shape's default
    std::string alias;
    ShapeFn proxy = nullptr;                 // alternate shape accepted by begin_field_as

    const Shape& type() const { return shape(); }
    bool has_default() const { return (flags & FieldHasDefault) != 0; }
    // Fields with a default or an optional type may be left unset.
    bool is_required() const;
};

enum class VariantKind { Unit, Tuple, Struct };

struct Variant {
    std::string name;
    int64_t discriminant = 0;
    VariantKind kind = VariantKind::Unit;
    std::vector<Field> fields; // offsets are relative to the start of the enum value
};

struct EnumRepr {
    size_t tag_offset = 0;
    size_t tag_size = 1; // 1, 2, 4 or 8
};

// Container operations. Every operation that takes a value pointer relocates it.
struct ListOps {
    void (*init_with_capacity)(void* list, size_t capacity) = nullptr;
    void (*push)(void* list, void* item) = nullptr;
    size_t (*len)(const void* list) = nullptr;
    size_t (*capacity)(const void* list) = nullptr;
    const void* (*get)(const void* list, size_t index) = nullptr;
};

struct MapOps {
    void (*init)(void* map) = nullptr;
    void (*insert)(void* map, void* key, void* value) = nullptr;
    size_t (*len)(const void* map) = nullptr;
    void (*for_each)(const void* map, llvm::function_ref<void(const void* key, const void* value)> visit) = nullptr;
};

struct SetOps {
    void (*init)(void* set) = nullptr;
    void (*insert)(void* set, void* item) = nullptr;
    size_t (*len)(const void* set) = nullptr;
};

struct OptionOps {
    void (*init_none)(void* opt) = nullptr;
    void (*init_some)(void* opt, void* value) = nullptr;
    bool (*is_some)(const void* opt) = nullptr;
    const void* (*get)(const void* opt) = nullptr;
};

struct EitherOps {
    void (*init_left)(void* either, void* value) = nullptr;
    void (*init_right)(void* either, void* value) = nullptr;
    bool (*is_left)(const void* either) = nullptr;
    const void* (*get)(const void* either) = nullptr;
};

// Builder used by pointers to unsized slices: items are pushed one at a
// time and the pointer is produced when the builder is finished.
struct SliceBuilderOps {
    void* (*new_builder)() = nullptr;
    void (*push)(void* builder, void* item) = nullptr;
    void (*finish)(void* builder, void* ptr) = nullptr; // consumes the builder
    void (*free)(void* builder) = nullptr;
};

struct PointerOps {
    // Move the pointee (of shape build_via when set, else the inner shape)
    // into a fresh heap value owned by *ptr.
    void (*wrap)(void* ptr, void* pointee) = nullptr;
    const void* (*borrow)(const void* ptr) = nullptr;
    ShapeFn build_via = nullptr;
    const SliceBuilderOps* slice = nullptr;
};

struct Shape {
    ShapeKind kind = ShapeKind::Scalar;
    std::string name;
    Layout layout{};
    VTable vtable{};

    std::vector<Field> fields;     // Struct
    std::vector<Variant> variants; // Enum
    EnumRepr repr{};               // Enum

    ShapeFn elem = nullptr;   // List, Set, Array
    ShapeFn key = nullptr;    // Map
    ShapeFn value = nullptr;  // Map
    ShapeFn inner = nullptr;  // Option, Pointer (pointee or slice item), Transparent
    ShapeFn left = nullptr;   // Either
    ShapeFn right = nullptr;  // Either
    size_t array_len = 0;     // Array

    ListOps list{};
    MapOps map{};
    SetOps set{};
    OptionOps option{};
    EitherOps either{};
    PointerOps pointer{};

    bool is(ShapeKind k) const { return kind == k; }
    bool is_zst() const { return layout.sized && layout.size == 0; }
    bool has_default() const { return vtable.default_in_place != nullptr; }
};

// Value helpers that dispatch through the vtable.
void drop_value(const Shape& shape, void* value);
void relocate_value(const Shape& shape, void* src, void* dst);
bool default_value(const Shape& shape, void* dst);

// Discriminant access for enum shapes. A tag size outside {1,2,4,8} is a
// malformed descriptor and reported through llvm::report_fatal_error.
int64_t read_discriminant(const Shape& shape, const void* value);
void write_discriminant(const Shape& shape, void* value, int64_t discriminant);
const Variant* variant_for_discriminant(const Shape& shape, int64_t discriminant, size_t* index = nullptr);

// Fields visible on a struct shape or on one variant of an enum shape.
const std::vector<Field>& fields_of(const Shape& shape, size_t variant = 0);

// Linear lookup by name or alias.
bool find_field(const std::vector<Field>& fields, std::string_view name, size_t& index);
bool find_variant(const Shape& shape, std::string_view name, size_t& index);

std::string describe(const Shape& shape);

} // namespace forge
