#pragma once
// Sample types and shape descriptors shared by the builder tests.

#include <cstdint>
#include <charconv>
#include <cstdlib>
#include <new>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "forge/std_shapes.hpp"

namespace forge_test {

// Counts live instances so tests can check that nothing leaks or is dropped twice.
struct Tracked {
    static inline int live = 0;
    static inline int dropped = 0;
    static void reset() { live = 0; dropped = 0; }

    int value = 0;

    Tracked() { ++live; }
    explicit Tracked(int v) : value(v) { ++live; }
    Tracked(const Tracked& o) : value(o.value) { ++live; }
    Tracked(Tracked&& o) noexcept : value(o.value) { ++live; }
    Tracked& operator=(const Tracked&) = default;
    Tracked& operator=(Tracked&&) = default;
    ~Tracked() { --live; ++dropped; }

    bool operator<(const Tracked& o) const { return value < o.value; }
};

struct Point {
    int32_t x = 0;
    int32_t y = 0;
};

struct Inner {
    std::string name;
    int32_t weight = 0;
};

struct Outer {
    Inner inner;
    std::vector<int32_t> items;
    std::optional<std::string> note;
    uint16_t port = 8080;
};

// Every field required.
struct Pair {
    Tracked first;
    Tracked second;
};

struct MovePayload {
    int32_t x;
    int32_t y;
};

// Tagged union: 0 = Quit, 1 = Move { x, y }, 2 = Write(text).
struct Command {
    uint8_t tag = 0;
    union {
        MovePayload mv;
        std::string text;
    };

    Command() : tag(0) {}
    Command(Command&& o) noexcept : tag(o.tag) {
        if(tag == 1) mv = o.mv;
        else if(tag == 2) new (&text) std::string(std::move(o.text));
    }
    Command(const Command&) = delete;
    Command& operator=(const Command&) = delete;
    ~Command() { if(tag == 2) text.~basic_string(); }
};

// Recursive through a list.
struct Node {
    int32_t value = 0;
    std::vector<Node> children;
};

// Owned slice of i32 assembled through a builder.
struct IntSlice {
    std::unique_ptr<int32_t[]> data;
    size_t len = 0;
};

// Accepts "21.5C" through a String proxy.
struct Celsius {
    double degrees = 0;
};

struct Reading {
    Celsius temp;
    std::string sensor;
};

struct UserId {
    uint64_t raw;
};

struct Account {
    UserId id;
    std::unique_ptr<Inner> profile;
    std::unique_ptr<char[]> motto;
};

struct Wide {
    int32_t f0 = 0, f1 = 0, f2 = 0, f3 = 0, f4 = 0, f5 = 0, f6 = 0, f7 = 0, f8 = 0, f9 = 0;
};

struct Holder {
    Pair pair;
    Tracked extra;
};

// Recursive through an optional box.
struct Chain {
    int32_t value = 0;
    std::optional<std::unique_ptr<Chain>> next;
};

} // namespace forge_test

namespace forge {

template <>
struct ShapeOf<forge_test::Tracked> {
    static std::string name() { return "Tracked"; }
    static const Shape& shape(){
        static const Shape s = []{
            Shape s = detail::make_shape<forge_test::Tracked>(ShapeKind::Scalar, name());
            s.vtable.parse = [](std::string_view text, void* dst, std::string& err){
                int v = 0;
                auto res = std::from_chars(text.data(), text.data() + text.size(), v);
                if(res.ec != std::errc() || res.ptr != text.data() + text.size()){
                    err = "not a number";
                    return false;
                }
                new (dst) forge_test::Tracked(v);
                return true;
            };
            return s;
        }();
        return s;
    }
};

template <>
struct ShapeOf<forge_test::Point> {
    static std::string name() { return "Point"; }
    static const Shape& shape(){
        using forge_test::Point;
        static const Shape s = StructShape<Point>(name()).field("x", &Point::x).field("y", &Point::y).finish();
        return s;
    }
};

inline int32_t default_weight() { return 7; }

template <>
struct ShapeOf<forge_test::Inner> {
    static std::string name() { return "Inner"; }
    static const Shape& shape(){
        using forge_test::Inner;
        static const Shape s = StructShape<Inner>(name())
                                   .field("name", &Inner::name)
                                   .field_default<&default_weight>("weight", &Inner::weight)
                                   .alias("w")
                                   .finish();
        return s;
    }
};

template <>
struct ShapeOf<forge_test::Outer> {
    static std::string name() { return "Outer"; }
    static const Shape& shape(){
        using forge_test::Outer;
        static const Shape s = StructShape<Outer>(name())
                                   .field("inner", &Outer::inner)
                                   .field("items", &Outer::items)
                                   .field("note", &Outer::note)
                                   .field("port", &Outer::port, FieldHasDefault)
                                   .finish();
        return s;
    }
};

template <>
struct ShapeOf<forge_test::Pair> {
    static std::string name() { return "Pair"; }
    static const Shape& shape(){
        using forge_test::Pair;
        static const Shape s = StructShape<Pair>(name()).field("first", &Pair::first).field("second", &Pair::second).finish();
        return s;
    }
};

template <>
struct ShapeOf<forge_test::Holder> {
    static std::string name() { return "Holder"; }
    static const Shape& shape(){
        using forge_test::Holder;
        static const Shape s = StructShape<Holder>(name()).field("pair", &Holder::pair).field("extra", &Holder::extra).finish();
        return s;
    }
};

template <>
struct ShapeOf<forge_test::Chain> {
    static std::string name() { return "Chain"; }
    static const Shape& shape(){
        using forge_test::Chain;
        static const Shape s = StructShape<Chain>(name()).field("value", &Chain::value).field("next", &Chain::next).finish();
        return s;
    }
};

template <>
struct ShapeOf<forge_test::Command> {
    static std::string name() { return "Command"; }
    static const Shape& shape(){
        using forge_test::Command;
        using forge_test::MovePayload;
        static const Shape s = []{
            size_t mv = member_offset(&Command::mv);
            size_t text = member_offset(&Command::text);
            return EnumShape<Command>(name())
                .tag(&Command::tag)
                .variant("Quit", 0)
                .variant("Move", 1, VariantKind::Struct)
                .field("x", mv + member_offset(&MovePayload::x), &shape_of<int32_t>)
                .field("y", mv + member_offset(&MovePayload::y), &shape_of<int32_t>)
                .variant("Write", 2, VariantKind::Tuple)
                .field("0", text, &shape_of<std::string>)
                .finish();
        }();
        return s;
    }
};

template <>
struct ShapeOf<forge_test::Node> {
    static std::string name() { return "Node"; }
    static const Shape& shape(){
        using forge_test::Node;
        static const Shape s = StructShape<Node>(name())
                                   .field("value", &Node::value)
                                   .field("children", &Node::children, FieldHasDefault)
                                   .finish();
        return s;
    }
};

namespace detail {

inline const SliceBuilderOps int_slice_ops = {
    []() -> void* { return new std::vector<int32_t>(); },
    [](void* b, void* item){ static_cast<std::vector<int32_t>*>(b)->push_back(*static_cast<int32_t*>(item)); },
    [](void* b, void* ptr){
        std::unique_ptr<std::vector<int32_t>> v(static_cast<std::vector<int32_t>*>(b));
        auto* out = new (ptr) forge_test::IntSlice();
        out->len = v->size();
        out->data.reset(new int32_t[v->size()]);
        for(size_t i = 0; i < v->size(); ++i) out->data[i] = (*v)[i];
    },
    [](void* b){ delete static_cast<std::vector<int32_t>*>(b); },
};

} // namespace detail

template <>
struct ShapeOf<forge_test::IntSlice> {
    static std::string name() { return "Box<[i32]>"; }
    static const Shape& shape(){
        static const Shape s = []{
            Shape s = detail::make_shape<forge_test::IntSlice>(ShapeKind::Pointer, name());
            s.vtable.default_in_place = nullptr;
            s.inner = &shape_of<int32_t>;
            s.pointer.slice = &detail::int_slice_ops;
            s.pointer.borrow = [](const void* p) -> const void* {
                return static_cast<const forge_test::IntSlice*>(p)->data.get();
            };
            return s;
        }();
        return s;
    }
};

template <>
struct ShapeOf<forge_test::Celsius> {
    static std::string name() { return "Celsius"; }
    static const Shape& shape(){
        using forge_test::Celsius;
        static const Shape s = StructShape<Celsius>(name())
                                   .field("degrees", &Celsius::degrees)
                                   .try_from([](const Shape& src_shape, const void* src, void* dst, std::string& err){
                                       if(&src_shape != &shape_of<std::string>()) return false;
                                       const auto& text = *static_cast<const std::string*>(src);
                                       if(text.empty() || text.back() != 'C'){
                                           err = "missing 'C' suffix in '" + text + "'";
                                           return false;
                                       }
                                       char* end = nullptr;
                                       std::string num = text.substr(0, text.size() - 1);
                                       double v = std::strtod(num.c_str(), &end);
                                       if(num.empty() || *end != '\0'){
                                           err = "bad number in '" + text + "'";
                                           return false;
                                       }
                                       new (dst) Celsius{v};
                                       return true;
                                   })
                                   .finish();
        return s;
    }
};

template <>
struct ShapeOf<forge_test::Reading> {
    static std::string name() { return "Reading"; }
    static const Shape& shape(){
        using forge_test::Reading;
        static const Shape s = StructShape<Reading>(name())
                                   .field("temp", &Reading::temp)
                                   .proxy<std::string>()
                                   .field("sensor", &Reading::sensor)
                                   .finish();
        return s;
    }
};

template <>
struct ShapeOf<forge_test::UserId> {
    static std::string name() { return "UserId"; }
    static const Shape& shape(){
        static const Shape s = transparent_shape<forge_test::UserId, uint64_t>(name());
        return s;
    }
};

template <>
struct ShapeOf<forge_test::Account> {
    static std::string name() { return "Account"; }
    static const Shape& shape(){
        using forge_test::Account;
        static const Shape s = StructShape<Account>(name())
                                   .field("id", &Account::id)
                                   .field("profile", &Account::profile)
                                   .field("motto", &Account::motto)
                                   .finish();
        return s;
    }
};

template <>
struct ShapeOf<forge_test::Wide> {
    static std::string name() { return "Wide"; }
    static const Shape& shape(){
        using forge_test::Wide;
        static const Shape s = StructShape<Wide>(name())
                                   .field("f0", &Wide::f0).field("f1", &Wide::f1).field("f2", &Wide::f2)
                                   .field("f3", &Wide::f3).field("f4", &Wide::f4).field("f5", &Wide::f5)
                                   .field("f6", &Wide::f6).field("f7", &Wide::f7).field("f8", &Wide::f8)
                                   .field("f9", &Wide::f9)
                                   .finish();
        return s;
    }
};

} // namespace forge
