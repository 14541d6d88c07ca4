// frame.hpp - one in-progress (sub)value and its construction state
#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <llvm/ADT/BitVector.h>

#include "forge/arena.hpp"
#include "forge/shape.hpp"

namespace forge {

using FrameId = ArenaIdx;
using PlanId = ArenaIdx;

// Does tearing this frame down also release its memory region?
enum class FrameOwnership {
    Owned,            // fresh allocation, freed with the frame
    Field,            // aliases memory inside the parent value
    ManagedElsewhere  // allocation held by the parent's tracker (map keys/values)
};

// Relation through which a frame was produced from its parent.
enum class LinkKind {
    Root,
    StructField,
    EnumField,
    ArrayElem,
    ListItem,
    SetItem,
    SliceItem,
    MapKey,
    MapValue,
    OptionSome,
    EitherLeft,
    EitherRight,
    PointerInner,
    Inner
};

const char* link_name(LinkKind k);

struct ParentLink {
    LinkKind kind = LinkKind::Root;
    FrameId parent{};
    size_t index = 0;
};

struct UninitTracker {};
struct InitTracker {};
struct StructTracker {
    llvm::BitVector iset;
    std::optional<size_t> current_child;
};
struct EnumTracker {
    size_t variant = 0;
    llvm::BitVector data;
    std::optional<size_t> current_child;
};
struct ArrayTracker {
    llvm::BitVector iset;
    std::optional<size_t> current_child;
};
struct ListTracker {
    bool initialized = false;
    bool building_item = false;
};
struct SetTracker {
    bool initialized = false;
    bool building_item = false;
};

enum class MapInsertState { Idle, PushingKey, PushingValue };

struct MapTracker {
    bool initialized = false;
    MapInsertState state = MapInsertState::Idle;
    void* key = nullptr;   // owned by the tracker while an insertion is pending
    bool key_complete = false;
    void* value = nullptr; // owned by the tracker while PushingValue
};
struct OptionTracker {
    bool building_inner = false;
};
struct EitherTracker {
    bool left = true;
    bool building = false;
};
struct PointerTracker {
    bool building = false;
};
struct SliceBuilderTracker {
    void* builder = nullptr;
    bool building_item = false;
};

using Tracker = std::variant<UninitTracker, InitTracker, StructTracker, EnumTracker, ArrayTracker,
                             ListTracker, SetTracker, MapTracker, OptionTracker, EitherTracker,
                             PointerTracker, SliceBuilderTracker>;

const char* tracker_name(const Tracker& t);

// Region helpers. Zero-sized layouts get a dangling, aligned pointer that is
// never released. Both throw build_error (Unsized, AllocationFailed).
void* allocate_region(const Shape& shape);
void release_region(const Shape& shape, void* data);

struct Frame {
    void* data = nullptr;
    const Shape* shape = nullptr;
    Tracker tracker;
    ParentLink link;
    FrameOwnership ownership = FrameOwnership::Owned;
    PlanId plan{};                       // invalid when built without a TypePlan
    const Shape* convert_to = nullptr;   // proxy frames: declared shape of the destination slot
    void* convert_dest = nullptr;
    std::string segment;                 // path component, e.g. ".name" or "[3]"

    static Frame make(void* data, const Shape& shape, FrameOwnership ownership, ParentLink link = {});

    bool is_init() const { return std::holds_alternative<InitTracker>(tracker); }
    bool is_uninit() const { return std::holds_alternative<UninitTracker>(tracker); }

    // Drop whatever the tracker says is initialized and reset to Uninit.
    void uninit();
    void deinit() { uninit(); }

    // Field bookkeeping for struct, enum and array frames.
    const std::vector<Field>& active_fields() const;
    size_t slot_count() const;
    void* slot_ptr(size_t idx) const;
    const Shape& slot_shape(size_t idx) const;
    void ensure_slot_tracker();
    void prepare_field_for_overwrite(size_t idx);
    void mark_field_complete(size_t idx);
    bool is_field_set(size_t idx) const;
    void set_current_child(std::optional<size_t> idx);
    std::optional<size_t> current_child() const;

    // True when every required part is in place; defaults are not applied.
    bool is_complete() const;
    // Apply field defaults, and None for unset optional fields.
    void fill_defaults();
    // Turn a finished slice builder into the pointer value.
    void finalize();
    // Throws NotFullyInitialized naming what is missing.
    void require_full_initialization() const;
    std::vector<std::string> missing_parts() const;

    // Release the region if this frame owns it.
    void dealloc();
};

} // namespace forge
