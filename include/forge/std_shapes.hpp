// std_shapes.hpp - shapes for scalars and standard library types
#pragma once
#include <array>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

#include "forge/shape_of.hpp"

namespace forge {

namespace detail {

template <class T, class A> struct is_cloneable<std::vector<T, A>> : is_cloneable<T> {};
template <class K, class V, class C, class A>
struct is_cloneable<std::map<K, V, C, A>> : std::conjunction<is_cloneable<K>, is_cloneable<V>> {};
template <class K, class V, class H, class E, class A>
struct is_cloneable<std::unordered_map<K, V, H, E, A>> : std::conjunction<is_cloneable<K>, is_cloneable<V>> {};
template <class T, class C, class A> struct is_cloneable<std::set<T, C, A>> : is_cloneable<T> {};
template <class T, class H, class E, class A> struct is_cloneable<std::unordered_set<T, H, E, A>> : is_cloneable<T> {};
template <class T> struct is_cloneable<std::optional<T>> : is_cloneable<T> {};
template <class L, class R> struct is_cloneable<std::variant<L, R>> : std::conjunction<is_cloneable<L>, is_cloneable<R>> {};

template <class T> struct ScalarName;
template <> struct ScalarName<bool> { static constexpr const char* value = "bool"; };
template <> struct ScalarName<char> { static constexpr const char* value = "char"; };
template <> struct ScalarName<int8_t> { static constexpr const char* value = "i8"; };
template <> struct ScalarName<int16_t> { static constexpr const char* value = "i16"; };
template <> struct ScalarName<int32_t> { static constexpr const char* value = "i32"; };
template <> struct ScalarName<int64_t> { static constexpr const char* value = "i64"; };
template <> struct ScalarName<uint8_t> { static constexpr const char* value = "u8"; };
template <> struct ScalarName<uint16_t> { static constexpr const char* value = "u16"; };
template <> struct ScalarName<uint32_t> { static constexpr const char* value = "u32"; };
template <> struct ScalarName<uint64_t> { static constexpr const char* value = "u64"; };
template <> struct ScalarName<float> { static constexpr const char* value = "f32"; };
template <> struct ScalarName<double> { static constexpr const char* value = "f64"; };

template <class T>
bool parse_scalar(std::string_view text, void* dst, std::string& err){
    if constexpr (std::is_same_v<T, bool>){
        if(text == "true"){ new (dst) bool(true); return true; }
        if(text == "false"){ new (dst) bool(false); return true; }
        err = "expected 'true' or 'false', got '" + std::string(text) + "'";
        return false;
    } else if constexpr (std::is_same_v<T, char>){
        if(text.size() != 1){ err = "expected a single character, got '" + std::string(text) + "'"; return false; }
        new (dst) char(text[0]);
        return true;
    } else if constexpr (std::is_integral_v<T>){
        T v{};
        const char* end = text.data() + text.size();
        auto res = std::from_chars(text.data(), end, v);
        if(res.ec == std::errc::result_out_of_range){
            err = "'" + std::string(text) + "' is out of range for " + ScalarName<T>::value;
            return false;
        }
        if(res.ec != std::errc() || res.ptr != end || text.empty()){
            err = "'" + std::string(text) + "' is not a valid " + ScalarName<T>::value;
            return false;
        }
        new (dst) T(v);
        return true;
    } else {
        std::string buf(text);
        char* end = nullptr;
        errno = 0;
        long double v = std::strtold(buf.c_str(), &end);
        if(buf.empty() || *end != '\0'){
            err = "'" + buf + "' is not a valid " + ScalarName<T>::value;
            return false;
        }
        if(errno == ERANGE || (std::isfinite(v) && std::fabs(v) > std::numeric_limits<T>::max())){
            err = "'" + buf + "' is out of range for " + ScalarName<T>::value;
            return false;
        }
        new (dst) T(static_cast<T>(v));
        return true;
    }
}

template <class Dst, class Src>
bool checked_numeric(Src v, Dst& out){
    if constexpr (std::is_floating_point_v<Dst>){
        if constexpr (std::is_floating_point_v<Src> && sizeof(Src) > sizeof(Dst)){
            // infinities and NaN carry over; finite values must stay finite
            if(std::isfinite(v) && std::fabs(v) > static_cast<Src>(std::numeric_limits<Dst>::max())) return false;
        }
        out = static_cast<Dst>(v);
        return true;
    } else if constexpr (std::is_floating_point_v<Src>){
        if(std::isnan(v) || std::trunc(v) != v) return false;
        long double lv = v;
        if(lv < static_cast<long double>(std::numeric_limits<Dst>::min()) ||
           lv > static_cast<long double>(std::numeric_limits<Dst>::max()))
            return false;
        out = static_cast<Dst>(v);
        return true;
    } else {
        if constexpr (std::is_signed_v<Src>){
            if(v < 0){
                if constexpr (std::is_unsigned_v<Dst>){
                    return false;
                } else {
                    if(static_cast<intmax_t>(v) < static_cast<intmax_t>(std::numeric_limits<Dst>::min())) return false;
                    out = static_cast<Dst>(v);
                    return true;
                }
            }
        }
        if(static_cast<uintmax_t>(v) > static_cast<uintmax_t>(std::numeric_limits<Dst>::max())) return false;
        out = static_cast<Dst>(v);
        return true;
    }
}

// Numeric conversion between scalar shapes, range-checked.
template <class Dst>
bool convert_numeric(const Shape& src_shape, const void* src, void* dst, std::string& err){
    bool handled = false;
    bool ok = false;
    auto attempt = [&](auto tag){
        using Src = decltype(tag);
        if(handled || &src_shape != &shape_of<Src>()) return;
        handled = true;
        Src v;
        std::memcpy(&v, src, sizeof(Src));
        Dst out{};
        ok = checked_numeric<Dst>(v, out);
        if(ok) new (dst) Dst(out);
        else err = "value of " + src_shape.name + " does not fit in " + ScalarName<Dst>::value;
    };
    attempt(int8_t{}); attempt(int16_t{}); attempt(int32_t{}); attempt(int64_t{});
    attempt(uint8_t{}); attempt(uint16_t{}); attempt(uint32_t{}); attempt(uint64_t{});
    attempt(float{}); attempt(double{});
    return ok;
}

} // namespace detail

template <class T>
struct ShapeOf<T, std::enable_if_t<std::is_arithmetic_v<T>>> {
    static std::string name() { return detail::ScalarName<T>::value; }
    static const Shape& shape(){
        static const Shape s = []{
            Shape s = detail::make_shape<T>(ShapeKind::Scalar, name());
            s.vtable.parse = &detail::parse_scalar<T>;
            if constexpr (!std::is_same_v<T, bool> && !std::is_same_v<T, char>)
                s.vtable.try_from = &detail::convert_numeric<T>;
            return s;
        }();
        return s;
    }
};

template <>
struct ShapeOf<std::string> {
    static std::string name() { return "String"; }
    static const Shape& shape(){
        static const Shape s = []{
            Shape s = detail::make_shape<std::string>(ShapeKind::Scalar, name());
            s.vtable.parse = [](std::string_view text, void* dst, std::string&){
                new (dst) std::string(text);
                return true;
            };
            return s;
        }();
        return s;
    }
};

// Unsized text, the pointee of std::unique_ptr<char[]>.
template <>
struct ShapeOf<char[]> {
    static std::string name() { return "str"; }
    static const Shape& shape(){
        static const Shape s = []{
            Shape s;
            s.kind = ShapeKind::Scalar;
            s.name = name();
            s.layout = Layout{0, 1, false};
            return s;
        }();
        return s;
    }
};

template <class T, class A>
struct ShapeOf<std::vector<T, A>> {
    using V = std::vector<T, A>;
    static std::string name() { return "Vec<" + type_name<T>() + ">"; }
    static const Shape& shape(){
        static const Shape s = []{
            Shape s = detail::make_shape<V>(ShapeKind::List, name());
            s.elem = &shape_of<T>;
            s.list.init_with_capacity = [](void* p, size_t cap){ auto* v = new (p) V(); v->reserve(cap); };
            s.list.push = [](void* p, void* item){
                T* src = static_cast<T*>(item);
                static_cast<V*>(p)->push_back(std::move(*src));
                src->~T();
            };
            s.list.len = [](const void* p){ return static_cast<const V*>(p)->size(); };
            s.list.capacity = [](const void* p){ return static_cast<const V*>(p)->capacity(); };
            s.list.get = [](const void* p, size_t i) -> const void* { return &(*static_cast<const V*>(p))[i]; };
            return s;
        }();
        return s;
    }
};

namespace detail {

template <class M>
Shape make_map_shape(std::string name){
    using K = typename M::key_type;
    using V = typename M::mapped_type;
    Shape s = make_shape<M>(ShapeKind::Map, std::move(name));
    s.key = &shape_of<K>;
    s.value = &shape_of<V>;
    s.map.init = [](void* p){ new (p) M(); };
    s.map.insert = [](void* p, void* k, void* v){
        K* key = static_cast<K*>(k);
        V* val = static_cast<V*>(v);
        static_cast<M*>(p)->insert_or_assign(std::move(*key), std::move(*val));
        key->~K();
        val->~V();
    };
    s.map.len = [](const void* p){ return static_cast<const M*>(p)->size(); };
    s.map.for_each = [](const void* p, llvm::function_ref<void(const void*, const void*)> visit){
        for(const auto& kv : *static_cast<const M*>(p)) visit(&kv.first, &kv.second);
    };
    return s;
}

template <class S>
Shape make_set_shape(std::string name){
    using T = typename S::value_type;
    Shape s = make_shape<S>(ShapeKind::Set, std::move(name));
    s.elem = &shape_of<T>;
    s.set.init = [](void* p){ new (p) S(); };
    s.set.insert = [](void* p, void* item){
        T* src = static_cast<T*>(item);
        static_cast<S*>(p)->insert(std::move(*src));
        src->~T();
    };
    s.set.len = [](const void* p){ return static_cast<const S*>(p)->size(); };
    return s;
}

} // namespace detail

template <class K, class V, class C, class A>
struct ShapeOf<std::map<K, V, C, A>> {
    static std::string name() { return "Map<" + type_name<K>() + ", " + type_name<V>() + ">"; }
    static const Shape& shape(){
        static const Shape s = detail::make_map_shape<std::map<K, V, C, A>>(name());
        return s;
    }
};

template <class K, class V, class H, class E, class A>
struct ShapeOf<std::unordered_map<K, V, H, E, A>> {
    static std::string name() { return "HashMap<" + type_name<K>() + ", " + type_name<V>() + ">"; }
    static const Shape& shape(){
        static const Shape s = detail::make_map_shape<std::unordered_map<K, V, H, E, A>>(name());
        return s;
    }
};

template <class T, class C, class A>
struct ShapeOf<std::set<T, C, A>> {
    static std::string name() { return "Set<" + type_name<T>() + ">"; }
    static const Shape& shape(){
        static const Shape s = detail::make_set_shape<std::set<T, C, A>>(name());
        return s;
    }
};

template <class T, class H, class E, class A>
struct ShapeOf<std::unordered_set<T, H, E, A>> {
    static std::string name() { return "HashSet<" + type_name<T>() + ">"; }
    static const Shape& shape(){
        static const Shape s = detail::make_set_shape<std::unordered_set<T, H, E, A>>(name());
        return s;
    }
};

template <class T>
struct ShapeOf<std::optional<T>> {
    using O = std::optional<T>;
    static std::string name() { return "Option<" + type_name<T>() + ">"; }
    static const Shape& shape(){
        static const Shape s = []{
            Shape s = detail::make_shape<O>(ShapeKind::Option, name());
            s.inner = &shape_of<T>;
            s.option.init_none = [](void* p){ new (p) O(); };
            s.option.init_some = [](void* p, void* v){
                T* src = static_cast<T*>(v);
                new (p) O(std::in_place, std::move(*src));
                src->~T();
            };
            s.option.is_some = [](const void* p){ return static_cast<const O*>(p)->has_value(); };
            s.option.get = [](const void* p) -> const void* {
                const O* o = static_cast<const O*>(p);
                return o->has_value() ? &**o : nullptr;
            };
            return s;
        }();
        return s;
    }
};

template <class L, class R>
struct ShapeOf<std::variant<L, R>> {
    using E = std::variant<L, R>;
    static std::string name() { return "Either<" + type_name<L>() + ", " + type_name<R>() + ">"; }
    static const Shape& shape(){
        static const Shape s = []{
            Shape s = detail::make_shape<E>(ShapeKind::Either, name());
            s.vtable.default_in_place = nullptr;
            s.left = &shape_of<L>;
            s.right = &shape_of<R>;
            s.either.init_left = [](void* p, void* v){
                L* src = static_cast<L*>(v);
                new (p) E(std::in_place_index<0>, std::move(*src));
                src->~L();
            };
            s.either.init_right = [](void* p, void* v){
                R* src = static_cast<R*>(v);
                new (p) E(std::in_place_index<1>, std::move(*src));
                src->~R();
            };
            s.either.is_left = [](const void* p){ return static_cast<const E*>(p)->index() == 0; };
            s.either.get = [](const void* p) -> const void* {
                const E* e = static_cast<const E*>(p);
                if(e->index() == 0) return std::get_if<0>(e);
                return std::get_if<1>(e);
            };
            return s;
        }();
        return s;
    }
};

template <class T>
struct ShapeOf<std::unique_ptr<T>, std::enable_if_t<!std::is_array_v<T>>> {
    using P = std::unique_ptr<T>;
    static std::string name() { return "Box<" + type_name<T>() + ">"; }
    static const Shape& shape(){
        static const Shape s = []{
            Shape s = detail::make_shape<P>(ShapeKind::Pointer, name());
            s.vtable.default_in_place = nullptr;
            s.inner = &shape_of<T>;
            s.pointer.wrap = [](void* p, void* v){
                T* src = static_cast<T*>(v);
                new (p) P(new T(std::move(*src)));
                src->~T();
            };
            s.pointer.borrow = [](const void* p) -> const void* { return static_cast<const P*>(p)->get(); };
            return s;
        }();
        return s;
    }
};

template <class T>
struct ShapeOf<std::shared_ptr<T>> {
    using P = std::shared_ptr<T>;
    static std::string name() { return "Arc<" + type_name<T>() + ">"; }
    static const Shape& shape(){
        static const Shape s = []{
            Shape s = detail::make_shape<P>(ShapeKind::Pointer, name());
            s.vtable.default_in_place = nullptr;
            s.inner = &shape_of<T>;
            s.pointer.wrap = [](void* p, void* v){
                T* src = static_cast<T*>(v);
                new (p) P(std::make_shared<T>(std::move(*src)));
                src->~T();
            };
            s.pointer.borrow = [](const void* p) -> const void* { return static_cast<const P*>(p)->get(); };
            return s;
        }();
        return s;
    }
};

// Owned text: the unsized pointee is built through a std::string.
template <>
struct ShapeOf<std::unique_ptr<char[]>> {
    using P = std::unique_ptr<char[]>;
    static std::string name() { return "Box<str>"; }
    static const Shape& shape(){
        static const Shape s = []{
            Shape s = detail::make_shape<P>(ShapeKind::Pointer, name());
            s.vtable.default_in_place = nullptr;
            s.inner = &shape_of<char[]>;
            s.pointer.build_via = &shape_of<std::string>;
            s.pointer.wrap = [](void* p, void* v){
                auto* src = static_cast<std::string*>(v);
                P buf(new char[src->size() + 1]);
                std::memcpy(buf.get(), src->c_str(), src->size() + 1);
                new (p) P(std::move(buf));
                src->~basic_string();
            };
            s.pointer.borrow = [](const void* p) -> const void* { return static_cast<const P*>(p)->get(); };
            return s;
        }();
        return s;
    }
};

template <class T, size_t N>
struct ShapeOf<std::array<T, N>> {
    static std::string name() { return "[" + type_name<T>() + "; " + std::to_string(N) + "]"; }
    static const Shape& shape(){
        static const Shape s = []{
            Shape s = detail::make_shape<std::array<T, N>>(ShapeKind::Array, name());
            s.elem = &shape_of<T>;
            s.array_len = N;
            return s;
        }();
        return s;
    }
};

} // namespace forge
