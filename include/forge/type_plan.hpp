// type_plan.hpp - per-shape precomputation: plan tree, name lookups, cycle back-references
#pragma once
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "forge/arena.hpp"
#include "forge/env.hpp"
#include "forge/shape.hpp"

namespace forge {

using PlanId = ArenaIdx;

enum class PlanKind {
    Scalar,
    Struct,
    Enum,
    Option,
    Either,
    List,
    Map,
    Set,
    Array,
    Pointer,
    Transparent,
    BackRef
};

const char* plan_kind_name(PlanKind k);

// Name -> index table. Linear scan below the threshold, binary search over a
// sorted copy above it.
class NameLookup {
public:
    NameLookup() = default;
    NameLookup(std::vector<std::pair<std::string, size_t>> entries, size_t threshold);

    std::optional<size_t> find(std::string_view name) const;
    bool is_sorted() const { return sorted_; }
    size_t size() const { return entries_.size(); }

private:
    std::vector<std::pair<std::string, size_t>> entries_;
    bool sorted_ = false;
};

using FieldLookup = NameLookup;
using VariantLookup = NameLookup;

struct FieldPlan {
    std::string name;
    std::string alias;
    size_t offset = 0;
    bool has_default = false;
    bool is_required = true;
    PlanId child{};
};

struct VariantPlan {
    std::string name;
    int64_t discriminant = 0;
    std::vector<FieldPlan> fields;
    FieldLookup lookup;
};

struct PlanNode {
    PlanKind kind = PlanKind::Scalar;
    const Shape* shape = nullptr;

    std::vector<FieldPlan> fields;     // Struct
    FieldLookup lookup;                // Struct
    std::vector<VariantPlan> variants; // Enum
    VariantLookup variant_lookup;      // Enum

    PlanId elem{};   // List, Set, Array, Option, Pointer, Transparent
    PlanId key{};    // Map
    PlanId value{};  // Map
    PlanId left{};   // Either
    PlanId right{};  // Either
    PlanId target{}; // BackRef: the ancestor node for the same shape
};

class TypePlan {
public:
    // Switch point taken from detect_env() (FORGE_LOOKUP_THRESHOLD).
    static std::shared_ptr<const TypePlan> build(const Shape& shape);
    static std::shared_ptr<const TypePlan> build(const Shape& shape, size_t lookup_threshold);

    PlanId root() const { return root_; }
    const Shape& shape() const { return *node(root_).shape; }
    const PlanNode& node(PlanId id) const { return nodes_.get(id); }
    // Follows back-references to the node that carries the structure.
    PlanId resolve_id(PlanId id) const;
    const PlanNode& resolve(PlanId id) const { return nodes_.get(resolve_id(id)); }
    size_t node_count() const { return nodes_.size(); }
    size_t lookup_threshold() const { return threshold_; }

    std::string dump() const;

private:
    struct Key { explicit Key() = default; };
    friend class PlanBuilder;

public:
    explicit TypePlan(Key) {}

private:

    Arena<PlanNode> nodes_;
    PlanId root_{};
    size_t threshold_ = kLookupThreshold;
};

} // namespace forge
