#include "forge/type_plan.hpp"

#include <algorithm>

#include <llvm/ADT/DenseMap.h>
#include <llvm/Support/ErrorHandling.h>
#include <llvm/Support/raw_ostream.h>

namespace forge {

const char* plan_kind_name(PlanKind k){
    switch(k){
        case PlanKind::Scalar: return "scalar";
        case PlanKind::Struct: return "struct";
        case PlanKind::Enum: return "enum";
        case PlanKind::Option: return "option";
        case PlanKind::Either: return "either";
        case PlanKind::List: return "list";
        case PlanKind::Map: return "map";
        case PlanKind::Set: return "set";
        case PlanKind::Array: return "array";
        case PlanKind::Pointer: return "pointer";
        case PlanKind::Transparent: return "transparent";
        case PlanKind::BackRef: return "backref";
    }
    return "?";
}

NameLookup::NameLookup(std::vector<std::pair<std::string, size_t>> entries, size_t threshold)
    : entries_(std::move(entries)) {
    if(entries_.size() >= threshold){
        std::stable_sort(entries_.begin(), entries_.end(),
                         [](const auto& a, const auto& b){ return a.first < b.first; });
        sorted_ = true;
    }
}

std::optional<size_t> NameLookup::find(std::string_view name) const {
    if(!sorted_){
        for(const auto& e : entries_) if(e.first == name) return e.second;
        return std::nullopt;
    }
    auto it = std::lower_bound(entries_.begin(), entries_.end(), name,
                               [](const auto& e, std::string_view n){ return std::string_view(e.first) < n; });
    if(it != entries_.end() && it->first == name) return it->second;
    return std::nullopt;
}

static PlanKind plan_kind_for(ShapeKind k){
    switch(k){
        case ShapeKind::Scalar: return PlanKind::Scalar;
        case ShapeKind::Struct: return PlanKind::Struct;
        case ShapeKind::Enum: return PlanKind::Enum;
        case ShapeKind::List: return PlanKind::List;
        case ShapeKind::Map: return PlanKind::Map;
        case ShapeKind::Set: return PlanKind::Set;
        case ShapeKind::Option: return PlanKind::Option;
        case ShapeKind::Either: return PlanKind::Either;
        case ShapeKind::Pointer: return PlanKind::Pointer;
        case ShapeKind::Array: return PlanKind::Array;
        case ShapeKind::Transparent: return PlanKind::Transparent;
    }
    return PlanKind::Scalar;
}

// Walks a shape depth-first. Shapes currently on the walk path are recorded
// so that a recursive reference becomes a BackRef node instead of recursing.
class PlanBuilder {
public:
    PlanBuilder(TypePlan& plan, size_t threshold) : plan_(plan), threshold_(threshold) {}

    PlanId build(const Shape& shape){
        if(auto it = building_.find(&shape); it != building_.end()){
            PlanNode ref;
            ref.kind = PlanKind::BackRef;
            ref.shape = &shape;
            ref.target = it->second;
            return plan_.nodes_.alloc(std::move(ref));
        }

        PlanNode init;
        init.kind = plan_kind_for(shape.kind);
        init.shape = &shape;
        PlanId id = plan_.nodes_.alloc(std::move(init));
        building_[&shape] = id;

        switch(shape.kind){
            case ShapeKind::Struct: {
                auto fields = build_fields(shape.fields);
                FieldLookup lookup = make_lookup(shape.fields);
                PlanNode& n = plan_.nodes_.get(id);
                n.fields = std::move(fields);
                n.lookup = std::move(lookup);
                break;
            }
            case ShapeKind::Enum: {
                std::vector<VariantPlan> variants;
                std::vector<std::pair<std::string, size_t>> names;
                for(size_t i = 0; i < shape.variants.size(); ++i){
                    const Variant& v = shape.variants[i];
                    VariantPlan vp;
                    vp.name = v.name;
                    vp.discriminant = v.discriminant;
                    vp.fields = build_fields(v.fields);
                    vp.lookup = make_lookup(v.fields);
                    variants.push_back(std::move(vp));
                    names.emplace_back(v.name, i);
                }
                PlanNode& n = plan_.nodes_.get(id);
                n.variants = std::move(variants);
                n.variant_lookup = VariantLookup(std::move(names), threshold_);
                break;
            }
            case ShapeKind::List:
            case ShapeKind::Set:
            case ShapeKind::Array: {
                PlanId elem = build(shape.elem());
                plan_.nodes_.get(id).elem = elem;
                break;
            }
            case ShapeKind::Map: {
                PlanId k = build(shape.key());
                PlanId v = build(shape.value());
                PlanNode& n = plan_.nodes_.get(id);
                n.key = k;
                n.value = v;
                break;
            }
            case ShapeKind::Option:
            case ShapeKind::Transparent: {
                PlanId inner = build(shape.inner());
                plan_.nodes_.get(id).elem = inner;
                break;
            }
            case ShapeKind::Pointer: {
                const Shape& pointee = shape.pointer.build_via ? shape.pointer.build_via() : shape.inner();
                PlanId inner = build(pointee);
                plan_.nodes_.get(id).elem = inner;
                break;
            }
            case ShapeKind::Either: {
                PlanId l = build(shape.left());
                PlanId r = build(shape.right());
                PlanNode& n = plan_.nodes_.get(id);
                n.left = l;
                n.right = r;
                break;
            }
            case ShapeKind::Scalar:
                break;
        }

        building_.erase(&shape);
        return id;
    }

private:
    std::vector<FieldPlan> build_fields(const std::vector<Field>& fields){
        std::vector<FieldPlan> out;
        out.reserve(fields.size());
        for(const Field& f : fields){
            FieldPlan fp;
            fp.name = f.name;
            fp.alias = f.alias;
            fp.offset = f.offset;
            fp.has_default = f.has_default();
            fp.is_required = f.is_required();
            fp.child = build(f.type());
            out.push_back(std::move(fp));
        }
        return out;
    }

    FieldLookup make_lookup(const std::vector<Field>& fields) const {
        std::vector<std::pair<std::string, size_t>> names;
        for(size_t i = 0; i < fields.size(); ++i){
            names.emplace_back(fields[i].name, i);
            if(!fields[i].alias.empty()) names.emplace_back(fields[i].alias, i);
        }
        return FieldLookup(std::move(names), threshold_);
    }

    TypePlan& plan_;
    size_t threshold_;
    llvm::DenseMap<const Shape*, PlanId> building_;
};

std::shared_ptr<const TypePlan> TypePlan::build(const Shape& shape){
    return build(shape, detect_env().lookup_threshold);
}

std::shared_ptr<const TypePlan> TypePlan::build(const Shape& shape, size_t lookup_threshold){
    auto plan = std::make_shared<TypePlan>(Key{});
    plan->threshold_ = lookup_threshold;
    PlanBuilder b(*plan, lookup_threshold);
    plan->root_ = b.build(shape);
    return plan;
}

PlanId TypePlan::resolve_id(PlanId id) const {
    const PlanNode& n = nodes_.get(id);
    if(n.kind != PlanKind::BackRef) return id;
    const PlanNode& target = nodes_.get(n.target);
    if(target.kind == PlanKind::BackRef)
        llvm::report_fatal_error("forge: type plan back-reference points at another back-reference");
    return n.target;
}

static void dump_node(const TypePlan& plan, PlanId id, unsigned depth, llvm::raw_ostream& os){
    const PlanNode& n = plan.node(id);
    os.indent(depth * 2) << plan_kind_name(n.kind) << " " << n.shape->name;
    if(n.kind == PlanKind::BackRef){ os << " -> #" << n.target.slot << "\n"; return; }
    os << " #" << id.slot;
    if(n.lookup.is_sorted() || n.variant_lookup.is_sorted()) os << " [sorted]";
    os << "\n";
    for(const auto& f : n.fields){
        os.indent(depth * 2 + 2) << "." << f.name << (f.is_required ? "" : "?") << "\n";
        dump_node(plan, f.child, depth + 2, os);
    }
    for(const auto& v : n.variants){
        os.indent(depth * 2 + 2) << "::" << v.name << "\n";
        for(const auto& f : v.fields){
            os.indent(depth * 2 + 4) << "." << f.name << "\n";
            dump_node(plan, f.child, depth + 3, os);
        }
    }
    for(PlanId c : {n.elem, n.key, n.value, n.left, n.right})
        if(c.valid()) dump_node(plan, c, depth + 1, os);
}

std::string TypePlan::dump() const {
    std::string out;
    llvm::raw_string_ostream os(out);
    dump_node(*this, root_, 0, os);
    return os.str();
}

} // namespace forge
