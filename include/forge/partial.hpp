// partial.hpp - incremental, type-erased value builder
#pragma once
#include <cstddef>
#include <exception>
#include <map>
#include <memory>
#include <new>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringRef.h>

#include "forge/arena.hpp"
#include "forge/env.hpp"
#include "forge/error.hpp"
#include "forge/frame.hpp"
#include "forge/heap_value.hpp"
#include "forge/shape.hpp"
#include "forge/std_shapes.hpp"
#include "forge/type_plan.hpp"

namespace forge {

// Field/variant names traversed since begin_deferred().
using KeyPath = std::vector<std::string>;

// Optional hint handed to begin_deferred(): the paths the driver expects to
// assign. Paths never touched are reported when tracing.
struct Resolution {
    std::vector<KeyPath> expected;
};

namespace detail {

// Holds a value in raw storage until the builder takes it. If the builder
// fails the value is still ours to destroy.
template <class T>
class Slot {
public:
    explicit Slot(T&& v) { new (&storage_) T(std::move(v)); }
    Slot(const Slot&) = delete;
    Slot& operator=(const Slot&) = delete;
    ~Slot() { if(live_) ptr()->~T(); }

    T* ptr() { return std::launder(reinterpret_cast<T*>(&storage_)); }
    void release() { live_ = false; }

private:
    std::aligned_storage_t<sizeof(T), alignof(T)> storage_;
    bool live_ = true;
};

} // namespace detail

// Builds one value of a runtime Shape through a stack of Frames.
//
// Every operation returns *this for chaining and throws build_error on
// failure. A failed operation poisons the builder: all later calls throw
// Poisoned, and destruction still releases everything that was initialized.
class Partial {
public:
    static Partial alloc(const Shape& shape);
    static Partial alloc(const Shape& shape, std::shared_ptr<const TypePlan> plan);
    template <class T>
    static Partial alloc() { return alloc(shape_of<T>()); }

    Partial(Partial&& o) noexcept;
    Partial& operator=(Partial&& o) noexcept;
    Partial(const Partial&) = delete;
    Partial& operator=(const Partial&) = delete;
    ~Partial();

    // --- struct, enum and array fields
    Partial& begin_field(std::string_view name);
    Partial& begin_nth_field(size_t idx);
    Partial& begin_field_as(std::string_view name, const Shape& proxy);
    Partial& begin_nth_element(size_t idx);
    Partial& set_field_move(std::string_view name, const Shape& shape, void* src);
    Partial& set_nth_field_move(size_t idx, const Shape& shape, void* src);
    Partial& set_field_default(std::string_view name);
    Partial& set_nth_field_default(size_t idx);
    std::optional<size_t> field_index(std::string_view name) const;
    bool is_field_set(size_t idx) const;

    template <class T>
    Partial& set_field(std::string_view name, T value){
        detail::Slot<T> slot(std::move(value));
        set_field_move(name, shape_of<T>(), slot.ptr());
        slot.release();
        return *this;
    }
    template <class T>
    Partial& set_nth_field(size_t idx, T value){
        detail::Slot<T> slot(std::move(value));
        set_nth_field_move(idx, shape_of<T>(), slot.ptr());
        slot.release();
        return *this;
    }

    // --- whole values
    // set_move relocates *src into the current frame. On failure *src is
    // left untouched and still belongs to the caller.
    Partial& set_move(const Shape& shape, void* src);
    Partial& set_copy(const Shape& shape, const void* src);
    Partial& set_default();
    Partial& parse_from_str(std::string_view text);

    template <class T>
    Partial& set(T value){
        detail::Slot<T> slot(std::move(value));
        set_move(shape_of<T>(), slot.ptr());
        slot.release();
        return *this;
    }

    // --- enums
    Partial& select_variant(size_t idx);
    Partial& select_variant_named(std::string_view name);
    std::optional<size_t> selected_variant() const;

    // --- wrappers
    Partial& begin_pointer_inner();
    Partial& begin_inner();
    Partial& begin_optional_payload();
    Partial& set_none();
    Partial& begin_left();
    Partial& begin_right();

    // --- lists, sets and slice pointers
    Partial& begin_list();
    Partial& begin_list_item();
    Partial& begin_set();
    Partial& begin_set_item();
    Partial& push_move(const Shape& shape, void* src);

    template <class T>
    Partial& push(T value){
        detail::Slot<T> slot(std::move(value));
        push_move(shape_of<T>(), slot.ptr());
        slot.release();
        return *this;
    }

    // --- maps
    Partial& begin_map();
    Partial& begin_key();
    Partial& begin_value();
    Partial& set_key_move(const Shape& shape, void* src);

    template <class K>
    Partial& set_key(K key){
        detail::Slot<K> slot(std::move(key));
        set_key_move(shape_of<K>(), slot.ptr());
        slot.release();
        return *this;
    }
    template <class K, class V>
    Partial& insert(K key, V value){
        set_key(std::move(key));
        begin_value();
        set(std::move(value));
        return end();
    }

    // --- completion
    Partial& end();
    HeapValue build();

    // --- deferred mode
    Partial& begin_deferred(Resolution resolution = {});
    Partial& finish_deferred();

    // --- queries
    const Shape& shape() const;
    const Shape& root_shape() const { return *root_shape_; }
    size_t frame_count() const { return stack_.size(); }
    std::string path() const;
    bool is_poisoned() const { return state_ == State::Poisoned; }
    bool is_built() const { return state_ == State::Built; }
    bool is_deferred() const { return deferred_.has_value(); }
    size_t stored_frame_count() const { return deferred_ ? deferred_->stored.size() : 0; }
    // Throws InvariantViolation if the frame stack is inconsistent.
    void check_invariants() const;

    const BuildEnv& env() const { return env_; }
    void set_env(BuildEnv e) { env_ = e; }

private:
    enum class State { Active, Built, Poisoned };

    struct DeferredState {
        size_t start_depth = 0; // stack size when begin_deferred was called
        Resolution resolution;
        std::map<KeyPath, FrameId> stored;
        std::set<KeyPath> touched;
    };

    Partial(const Shape& shape, std::shared_ptr<const TypePlan> plan);

    template <class F>
    auto guarded(const char* op, llvm::StringRef detail, F&& body) -> decltype(body());
    void ensure_active(const char* op) const;
    void trace(const char* op, llvm::StringRef detail) const;
    void poison(build_error& e);
    void poison_foreign(const char* op, const std::exception& e);
    [[noreturn]] void fail(ErrorKind kind, const std::string& message, std::string hint = {}) const;

    Frame& top();
    const Frame& top() const;
    FrameId top_id() const { return stack_.back(); }
    void push_frame(Frame f);
    PlanId child_plan(const Frame& parent, LinkKind link, size_t idx) const;

    // shared implementations
    size_t resolve_field(const Frame& f, std::string_view name) const;
    void open_slot(size_t idx, const Shape* proxy);
    void write_value(const Shape& dst_shape, void* dst, const Shape& src_shape, void* src);
    void overwrite_current();
    void fill_slot(size_t idx, const Shape* src_shape, void* src);
    void open_owned_child(const Shape& shape, LinkKind link, std::string segment);
    void require_kind(const Frame& f, ShapeKind kind, const char* op) const;
    void start_collection(Frame& f);
    void end_top();
    void splice(Frame& parent, Frame& child);

    // deferred bookkeeping
    bool storable_chain() const;
    KeyPath current_key() const;
    void discard_stored(const KeyPath& prefix, bool include_prefix);
    void reconcile_deferred();

    void teardown();

    Arena<Frame> frames_;
    llvm::SmallVector<FrameId, 8> stack_;
    const Shape* root_shape_ = nullptr;
    std::shared_ptr<const TypePlan> plan_;
    std::optional<DeferredState> deferred_;
    State state_ = State::Active;
    BuildEnv env_;
};

// Statically typed front end: build() hands back a T.
template <class T>
class TypedPartial {
public:
    TypedPartial() : inner_(Partial::alloc(shape_of<T>())) {}
    explicit TypedPartial(std::shared_ptr<const TypePlan> plan) : inner_(Partial::alloc(shape_of<T>(), std::move(plan))) {}

    Partial& inner() { return inner_; }
    Partial* operator->() { return &inner_; }

    T build() { return inner_.build().template materialize<T>(); }

private:
    Partial inner_;
};

} // namespace forge
