#include "partial_internal.hpp"

namespace forge {

static std::optional<size_t> variant_of(const Frame& f){
    if(auto* et = std::get_if<EnumTracker>(&f.tracker)) return et->variant;
    if(f.is_init() && f.shape->is(ShapeKind::Enum)){
        size_t idx = 0;
        if(variant_for_discriminant(*f.shape, read_discriminant(*f.shape, f.data), &idx)) return idx;
    }
    return std::nullopt;
}

static std::optional<size_t> lookup_field(const Frame& f, const TypePlan* plan, std::string_view name){
    size_t variant = 0;
    if(f.shape->is(ShapeKind::Enum)){
        auto v = variant_of(f);
        if(!v) return std::nullopt;
        variant = *v;
    } else if(!f.shape->is(ShapeKind::Struct)){
        return std::nullopt;
    }
    if(plan && f.plan.valid()){
        const PlanNode& n = plan->resolve(f.plan);
        const FieldLookup& lk = f.shape->is(ShapeKind::Enum) ? n.variants[variant].lookup : n.lookup;
        return lk.find(name);
    }
    size_t idx = 0;
    if(find_field(fields_of(*f.shape, variant), name, idx)) return idx;
    return std::nullopt;
}

size_t Partial::resolve_field(const Frame& f, std::string_view name) const {
    if(!f.shape->is(ShapeKind::Struct) && !f.shape->is(ShapeKind::Enum))
        fail(ErrorKind::WrongKind, "cannot select field '" + std::string(name) + "' on " + kind_name(f.shape->kind) +
             " " + f.shape->name);
    if(f.shape->is(ShapeKind::Enum) && !variant_of(f))
        fail(ErrorKind::InvariantViolation, "no variant selected on enum " + f.shape->name,
             "call select_variant() first");
    if(auto idx = lookup_field(f, plan_.get(), name)) return *idx;

    std::string hint = "available:";
    for(const Field& fld : fields_of(*f.shape, f.shape->is(ShapeKind::Enum) ? *variant_of(f) : 0))
        hint += " " + fld.name;
    fail(ErrorKind::NoSuchField, "no field '" + std::string(name) + "' on " + f.shape->name, hint);
}

std::optional<size_t> Partial::field_index(std::string_view name) const {
    if(stack_.empty()) return std::nullopt;
    return lookup_field(top(), plan_.get(), name);
}

bool Partial::is_field_set(size_t idx) const {
    if(stack_.empty()) return false;
    return top().is_field_set(idx);
}

// Opens a child frame for slot idx of the struct, enum variant or array on
// top of the stack. In deferred mode a frame stored for the same path is
// restored instead of being recreated.
void Partial::open_slot(size_t idx, const Shape* proxy){
    FrameId pid = top_id();
    Frame& f = top();
    f.ensure_slot_tracker();
    bool is_array = f.shape->is(ShapeKind::Array);
    if(idx >= f.slot_count()){
        std::string msg = "index " + std::to_string(idx) + " is out of bounds for " + f.shape->name +
                          " with " + std::to_string(f.slot_count()) + (is_array ? " elements" : " fields");
        fail(is_array ? ErrorKind::ArrayIndexOutOfBounds : ErrorKind::FieldIndexOutOfBounds, msg);
    }

    LinkKind link = is_array ? LinkKind::ArrayElem
                  : f.shape->is(ShapeKind::Enum) ? LinkKind::EnumField : LinkKind::StructField;
    std::string name = is_array ? "[" + std::to_string(idx) + "]" : f.active_fields()[idx].name;
    const Shape& declared = f.slot_shape(idx);
    if(proxy && proxy != &declared && !is_array){
        const Field& field = f.active_fields()[idx];
        if(field.proxy && &field.proxy() != proxy)
            fail(ErrorKind::ShapeMismatch, "field " + name + " is built through " + field.proxy().name + ", got " + proxy->name);
    }

    std::optional<KeyPath> key;
    if(deferred_ && storable_chain()){
        key = current_key();
        key->push_back(name);
        deferred_->touched.insert(*key);
    }

    if(key && !proxy){
        if(auto it = deferred_->stored.find(*key); it != deferred_->stored.end()){
            FrameId cid = it->second;
            if(frames_.get(cid).link.parent != pid)
                fail(ErrorKind::InvariantViolation, "stored frame " + join_key(*key) + " belongs to another parent");
            deferred_->stored.erase(it);
            f.set_current_child(idx);
            stack_.push_back(cid);
            if(env_.trace) llvm::errs() << "[forge][defer] restored " << join_key(*key) << "\n";
            return;
        }
    }

    if(key) discard_stored(*key, true);
    f.prepare_field_for_overwrite(idx);
    void* slot = f.slot_ptr(idx);

    Frame child;
    if(proxy && proxy != &declared){
        if(!declared.vtable.try_from)
            fail(ErrorKind::ShapeMismatch, declared.name + " has no conversion from " + proxy->name);
        child = Frame::make(allocate_region(*proxy), *proxy, FrameOwnership::Owned, ParentLink{link, pid, idx});
        child.convert_to = &declared;
        child.convert_dest = slot;
    } else {
        child = Frame::make(slot, declared, FrameOwnership::Field, ParentLink{link, pid, idx});
        child.plan = child_plan(f, link, idx);
    }
    child.segment = is_array ? name : "." + name;
    f.set_current_child(idx);
    push_frame(std::move(child));
}

Partial& Partial::begin_field(std::string_view name){
    guarded("begin_field", as_ref(name), [&]{ open_slot(resolve_field(top(), name), nullptr); });
    return *this;
}

Partial& Partial::begin_nth_field(size_t idx){
    guarded("begin_nth_field", std::to_string(idx), [&]{ open_slot(idx, nullptr); });
    return *this;
}

Partial& Partial::begin_field_as(std::string_view name, const Shape& proxy){
    guarded("begin_field_as", as_ref(name), [&]{ open_slot(resolve_field(top(), name), &proxy); });
    return *this;
}

Partial& Partial::begin_nth_element(size_t idx){
    guarded("begin_nth_element", std::to_string(idx), [&]{
        require_kind(top(), ShapeKind::Array, "begin_nth_element");
        open_slot(idx, nullptr);
    });
    return *this;
}

void Partial::require_kind(const Frame& f, ShapeKind kind, const char* op) const {
    if(f.shape->is(kind)) return;
    fail(ErrorKind::WrongKind, std::string(op) + " needs a " + kind_name(kind) + ", found " +
         kind_name(f.shape->kind) + " " + f.shape->name);
}

// Relocates (or converts) src into dst. src is consumed on success and left
// untouched on failure.
void Partial::write_value(const Shape& dst_shape, void* dst, const Shape& src_shape, void* src){
    if(&dst_shape == &src_shape){
        relocate_value(dst_shape, src, dst);
        return;
    }
    if(dst_shape.is(ShapeKind::Transparent) && &dst_shape.inner() == &src_shape){
        relocate_value(src_shape, src, dst);
        return;
    }
    if(dst_shape.is(ShapeKind::Option) && &dst_shape.inner() == &src_shape){
        dst_shape.option.init_some(dst, src);
        return;
    }
    if(dst_shape.is(ShapeKind::Pointer) && !dst_shape.pointer.slice && &pointee_of(dst_shape) == &src_shape){
        dst_shape.pointer.wrap(dst, src);
        return;
    }
    if(dst_shape.vtable.try_from){
        std::string err;
        if(!dst_shape.vtable.try_from(src_shape, src, dst, err)){
            if(err.empty()) fail(ErrorKind::ShapeMismatch, "expected " + dst_shape.name + ", got " + src_shape.name);
            fail(ErrorKind::ConversionFailed, "cannot convert " + src_shape.name + " into " + dst_shape.name + ": " + err);
        }
        drop_value(src_shape, src);
        return;
    }
    fail(ErrorKind::ShapeMismatch, "expected " + dst_shape.name + ", got " + src_shape.name);
}

// Drops the current value (and, in deferred mode, anything stored beneath it)
// so the frame can be written from scratch.
void Partial::overwrite_current(){
    if(deferred_ && storable_chain()) discard_stored(current_key(), false);
    top().uninit();
}

void Partial::fill_slot(size_t idx, const Shape* src_shape, void* src){
    Frame& f = top();
    f.ensure_slot_tracker();
    bool is_array = f.shape->is(ShapeKind::Array);
    if(idx >= f.slot_count())
        fail(is_array ? ErrorKind::ArrayIndexOutOfBounds : ErrorKind::FieldIndexOutOfBounds,
             "index " + std::to_string(idx) + " is out of bounds for " + f.shape->name);
    const Shape& declared = f.slot_shape(idx);
    const Field* field = is_array ? nullptr : &f.active_fields()[idx];

    if(src_shape && !accepts(declared, *src_shape))
        fail(ErrorKind::ShapeMismatch, "field " + (field ? field->name : std::to_string(idx)) + " expects " +
             declared.name + ", got " + src_shape->name);
    if(!src_shape && !(field && field->default_fn) && !declared.has_default())
        fail(ErrorKind::NoDefault, declared.name + " has no default");

    if(deferred_ && storable_chain()){
        KeyPath key = current_key();
        key.push_back(field ? field->name : "[" + std::to_string(idx) + "]");
        deferred_->touched.insert(key);
        discard_stored(key, true);
    }
    f.prepare_field_for_overwrite(idx);
    void* slot = f.slot_ptr(idx);
    if(src_shape) write_value(declared, slot, *src_shape, src);
    else if(field && field->default_fn) field->default_fn(slot);
    else default_value(declared, slot);
    f.mark_field_complete(idx);
}

Partial& Partial::set_field_move(std::string_view name, const Shape& shape, void* src){
    guarded("set_field", as_ref(name), [&]{ fill_slot(resolve_field(top(), name), &shape, src); });
    return *this;
}

Partial& Partial::set_nth_field_move(size_t idx, const Shape& shape, void* src){
    guarded("set_nth_field", std::to_string(idx), [&]{ fill_slot(idx, &shape, src); });
    return *this;
}

Partial& Partial::set_field_default(std::string_view name){
    guarded("set_field_default", as_ref(name), [&]{ fill_slot(resolve_field(top(), name), nullptr, nullptr); });
    return *this;
}

Partial& Partial::set_nth_field_default(size_t idx){
    guarded("set_nth_field_default", std::to_string(idx), [&]{ fill_slot(idx, nullptr, nullptr); });
    return *this;
}

Partial& Partial::set_move(const Shape& shape, void* src){
    guarded("set", shape.name, [&]{
        Frame& f = top();
        if(!accepts(*f.shape, shape))
            fail(ErrorKind::ShapeMismatch, "expected " + f.shape->name + ", got " + shape.name);
        overwrite_current();
        write_value(*f.shape, f.data, shape, src);
        f.tracker = InitTracker{};
    });
    return *this;
}

Partial& Partial::set_copy(const Shape& shape, const void* src){
    guarded("set_copy", shape.name, [&]{
        Frame& f = top();
        if(&shape != f.shape)
            fail(ErrorKind::ShapeMismatch, "expected " + f.shape->name + ", got " + shape.name);
        if(!shape.vtable.clone_into)
            fail(ErrorKind::WrongKind, shape.name + " cannot be cloned", "use set() to move the value in");
        overwrite_current();
        shape.vtable.clone_into(src, f.data);
        f.tracker = InitTracker{};
    });
    return *this;
}

Partial& Partial::set_default(){
    guarded("set_default", "", [&]{
        Frame& f = top();
        // a field frame prefers the field's own default
        void (*field_default)(void*) = nullptr;
        if((f.link.kind == LinkKind::StructField || f.link.kind == LinkKind::EnumField) && !f.convert_to){
            const Frame& p = frames_.get(f.link.parent);
            field_default = p.active_fields()[f.link.index].default_fn;
        }
        if(!field_default && !f.shape->has_default())
            fail(ErrorKind::NoDefault, f.shape->name + " has no default");
        overwrite_current();
        if(field_default) field_default(f.data);
        else default_value(*f.shape, f.data);
        f.tracker = InitTracker{};
    });
    return *this;
}

Partial& Partial::parse_from_str(std::string_view text){
    guarded("parse_from_str", as_ref(text), [&]{
        Frame& f = top();
        if(!f.shape->vtable.parse)
            fail(ErrorKind::WrongKind, f.shape->name + " cannot be parsed from text");
        overwrite_current();
        std::string err;
        if(!f.shape->vtable.parse(text, f.data, err))
            fail(ErrorKind::ParseFailed, "cannot parse " + f.shape->name + ": " + err);
        f.tracker = InitTracker{};
    });
    return *this;
}

Partial& Partial::select_variant(size_t idx){
    guarded("select_variant", std::to_string(idx), [&]{
        Frame& f = top();
        require_kind(f, ShapeKind::Enum, "select_variant");
        if(idx >= f.shape->variants.size())
            fail(ErrorKind::VariantIndexOutOfBounds, "variant " + std::to_string(idx) + " is out of bounds for " +
                 f.shape->name + " with " + std::to_string(f.shape->variants.size()) + " variants");
        // reselecting the active variant keeps the fields built so far
        if(variant_of(f) == idx){
            f.ensure_slot_tracker();
            return;
        }
        overwrite_current();
        const Variant& v = f.shape->variants[idx];
        write_discriminant(*f.shape, f.data, v.discriminant);
        f.tracker = EnumTracker{idx, llvm::BitVector(v.fields.size()), std::nullopt};
    });
    return *this;
}

Partial& Partial::select_variant_named(std::string_view name){
    size_t idx = 0;
    guarded("select_variant_named", as_ref(name), [&]{
        const Frame& f = top();
        require_kind(f, ShapeKind::Enum, "select_variant_named");
        bool found = false;
        if(plan_ && f.plan.valid()){
            if(auto i = plan_->resolve(f.plan).variant_lookup.find(name)){ idx = *i; found = true; }
        } else {
            found = find_variant(*f.shape, name, idx);
        }
        if(!found){
            std::string hint = "available:";
            for(const Variant& v : f.shape->variants) hint += " " + v.name;
            fail(ErrorKind::NoSuchVariant, "no variant '" + std::string(name) + "' on " + f.shape->name, hint);
        }
    });
    return select_variant(idx);
}

std::optional<size_t> Partial::selected_variant() const {
    if(stack_.empty()) return std::nullopt;
    return variant_of(top());
}

} // namespace forge
