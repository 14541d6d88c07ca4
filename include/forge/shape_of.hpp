// shape_of.hpp - compile-time bridge from C++ types to runtime shapes
#pragma once
#include <cstddef>
#include <cstring>
#include <new>
#include <string>
#include <type_traits>
#include <utility>

#include "forge/shape.hpp"

namespace forge {

// Specialize for every type that should be buildable:
//   template <> struct ShapeOf<Point> {
//       static std::string name() { return "Point"; }
//       static const Shape& shape();
//   };
template <class T, class Enable = void>
struct ShapeOf;

template <class T>
const Shape& shape_of() { return ShapeOf<T>::shape(); }

template <class T>
std::string type_name() { return ShapeOf<T>::name(); }

namespace detail {

template <class T> void drop_fn(void* p) { static_cast<T*>(p)->~T(); }
template <class T> void default_fn(void* dst) { new (dst) T(); }
template <class T> void clone_fn(const void* src, void* dst) { new (dst) T(*static_cast<const T*>(src)); }
template <class T> void move_fn(void* src, void* dst){
    T* s = static_cast<T*>(src);
    new (dst) T(std::move(*s));
    s->~T();
}

// std containers advertise copy constructors even when their elements
// cannot be copied; look through them.
template <class T> struct is_cloneable : std::is_copy_constructible<T> {};

template <class T>
VTable vtable_for(){
    VTable v;
    if constexpr (!std::is_trivially_destructible_v<T>) v.drop_in_place = &drop_fn<T>;
    if constexpr (!std::is_trivially_copyable_v<T>) v.move_into = &move_fn<T>;
    if constexpr (std::is_default_constructible_v<T>) v.default_in_place = &default_fn<T>;
    if constexpr (is_cloneable<T>::value) v.clone_into = &clone_fn<T>;
    return v;
}

template <class T>
Shape make_shape(ShapeKind kind, std::string name){
    Shape s;
    s.kind = kind;
    s.name = std::move(name);
    s.layout = Layout{sizeof(T), alignof(T), true};
    s.vtable = vtable_for<T>();
    return s;
}

} // namespace detail

// Byte offset of a data member, computed without constructing a T.
template <class T, class M>
size_t member_offset(M T::*member){
    std::aligned_storage_t<sizeof(T), alignof(T)> storage;
    const auto* obj = reinterpret_cast<const T*>(&storage);
    return static_cast<size_t>(reinterpret_cast<const char*>(&(obj->*member)) -
                               reinterpret_cast<const char*>(obj));
}

// Fluent descriptor builder for user structs:
//   static const Shape s = StructShape<Point>("Point").field("x", &Point::x).field("y", &Point::y).finish();
template <class T>
class StructShape {
public:
    explicit StructShape(std::string name) : shape_(detail::make_shape<T>(ShapeKind::Struct, std::move(name))) {}

    template <class M>
    StructShape& field(std::string name, M T::*member, unsigned flags = FieldNone){
        Field f;
        f.name = std::move(name);
        f.offset = member_offset(member);
        f.shape = &shape_of<M>;
        f.flags = flags;
        shape_.fields.push_back(std::move(f));
        return *this;
    }

    // Field addressed by byte offset, for members a pointer-to-member cannot name.
    StructShape& field_at(std::string name, size_t offset, ShapeFn shape, unsigned flags = FieldNone){
        Field f;
        f.name = std::move(name);
        f.offset = offset;
        f.shape = shape;
        f.flags = flags;
        shape_.fields.push_back(std::move(f));
        return *this;
    }

    // Field whose default is produced by Make() instead of the field type's default.
    template <auto Make, class M>
    StructShape& field_default(std::string name, M T::*member){
        field(std::move(name), member, FieldHasDefault);
        shape_.fields.back().default_fn = [](void* dst){ new (dst) M(Make()); };
        return *this;
    }

    StructShape& alias(std::string a){
        shape_.fields.back().alias = std::move(a);
        return *this;
    }

    template <class P>
    StructShape& proxy(){
        shape_.fields.back().proxy = &shape_of<P>;
        return *this;
    }

    StructShape& parse(bool (*fn)(std::string_view, void*, std::string&)){ shape_.vtable.parse = fn; return *this; }
    StructShape& try_from(bool (*fn)(const Shape&, const void*, void*, std::string&)){ shape_.vtable.try_from = fn; return *this; }
    StructShape& no_default(){ shape_.vtable.default_in_place = nullptr; return *this; }

    Shape finish(){ return std::move(shape_); }

private:
    Shape shape_;
};

// Descriptor builder for tagged unions. Field offsets are absolute within T.
template <class T>
class EnumShape {
public:
    explicit EnumShape(std::string name) : shape_(detail::make_shape<T>(ShapeKind::Enum, std::move(name))) {}

    template <class Tag>
    EnumShape& tag(Tag T::*member){
        shape_.repr.tag_offset = member_offset(member);
        shape_.repr.tag_size = sizeof(Tag);
        return *this;
    }

    EnumShape& variant(std::string name, int64_t discriminant, VariantKind kind = VariantKind::Unit){
        Variant v;
        v.name = std::move(name);
        v.discriminant = discriminant;
        v.kind = kind;
        shape_.variants.push_back(std::move(v));
        return *this;
    }

    EnumShape& field(std::string name, size_t offset, ShapeFn shape, unsigned flags = FieldNone){
        Field f;
        f.name = std::move(name);
        f.offset = offset;
        f.shape = shape;
        f.flags = flags;
        shape_.variants.back().fields.push_back(std::move(f));
        return *this;
    }

    EnumShape& no_default(){ shape_.vtable.default_in_place = nullptr; return *this; }

    Shape finish(){ return std::move(shape_); }

private:
    Shape shape_;
};

// Single-member wrapper whose value lives at offset 0.
template <class T, class Inner>
Shape transparent_shape(std::string name){
    static_assert(sizeof(T) == sizeof(Inner), "transparent wrappers hold exactly their inner value");
    Shape s = detail::make_shape<T>(ShapeKind::Transparent, std::move(name));
    s.inner = &shape_of<Inner>;
    return s;
}

} // namespace forge
