#include "forge/frame.hpp"
#include "forge/error.hpp"

#include <new>

#include <llvm/Support/raw_ostream.h>

namespace forge {

const char* link_name(LinkKind k){
    switch(k){
        case LinkKind::Root: return "root";
        case LinkKind::StructField: return "field";
        case LinkKind::EnumField: return "variant-field";
        case LinkKind::ArrayElem: return "array-elem";
        case LinkKind::ListItem: return "list-item";
        case LinkKind::SetItem: return "set-item";
        case LinkKind::SliceItem: return "slice-item";
        case LinkKind::MapKey: return "map-key";
        case LinkKind::MapValue: return "map-value";
        case LinkKind::OptionSome: return "some";
        case LinkKind::EitherLeft: return "left";
        case LinkKind::EitherRight: return "right";
        case LinkKind::PointerInner: return "pointee";
        case LinkKind::Inner: return "inner";
    }
    return "?";
}

const char* tracker_name(const Tracker& t){
    static const char* names[] = {"Uninit", "Init", "Struct", "Enum", "Array", "List",
                                  "Set", "Map", "Option", "Either", "Pointer", "SliceBuilder"};
    return names[t.index()];
}

void* allocate_region(const Shape& shape){
    if(!shape.layout.sized)
        throw build_error(ErrorKind::Unsized, "cannot allocate unsized shape " + shape.name);
    if(shape.layout.size == 0)
        return reinterpret_cast<void*>(shape.layout.align ? shape.layout.align : 1);
    void* p = ::operator new(shape.layout.size, std::align_val_t(shape.layout.align), std::nothrow);
    if(!p){
        std::string msg;
        llvm::raw_string_ostream os(msg);
        os << "allocating " << shape.layout.size << " bytes for " << shape.name;
        throw build_error(ErrorKind::AllocationFailed, os.str());
    }
    return p;
}

void release_region(const Shape& shape, void* data){
    if(!data || !shape.layout.sized || shape.layout.size == 0) return;
    ::operator delete(data, std::align_val_t(shape.layout.align));
}

Frame Frame::make(void* data, const Shape& shape, FrameOwnership ownership, ParentLink link){
    Frame f;
    f.data = data;
    f.shape = &shape;
    f.ownership = ownership;
    f.link = link;
    return f;
}

void Frame::uninit(){
    auto* base = static_cast<unsigned char*>(data);
    if(std::holds_alternative<InitTracker>(tracker)){
        drop_value(*shape, data);
    } else if(auto* st = std::get_if<StructTracker>(&tracker)){
        for(int i : st->iset.set_bits()){
            const Field& f = shape->fields[i];
            drop_value(f.type(), base + f.offset);
        }
    } else if(auto* et = std::get_if<EnumTracker>(&tracker)){
        const auto& fields = shape->variants[et->variant].fields;
        for(int i : et->data.set_bits())
            drop_value(fields[i].type(), base + fields[i].offset);
    } else if(auto* at = std::get_if<ArrayTracker>(&tracker)){
        const Shape& elem = shape->elem();
        for(int i : at->iset.set_bits())
            drop_value(elem, base + i * elem.layout.size);
    } else if(auto* lt = std::get_if<ListTracker>(&tracker)){
        if(lt->initialized) drop_value(*shape, data);
    } else if(auto* sett = std::get_if<SetTracker>(&tracker)){
        if(sett->initialized) drop_value(*shape, data);
    } else if(auto* mt = std::get_if<MapTracker>(&tracker)){
        // an open key/value frame has already dropped its own partial contents
        if(mt->key){
            if(mt->key_complete) drop_value(shape->key(), mt->key);
            release_region(shape->key(), mt->key);
        }
        if(mt->value) release_region(shape->value(), mt->value);
        if(mt->initialized) drop_value(*shape, data);
    } else if(auto* sb = std::get_if<SliceBuilderTracker>(&tracker)){
        if(sb->builder) shape->pointer.slice->free(sb->builder);
    }
    tracker = UninitTracker{};
}

const std::vector<Field>& Frame::active_fields() const {
    if(auto* et = std::get_if<EnumTracker>(&tracker)) return shape->variants[et->variant].fields;
    return shape->fields;
}

size_t Frame::slot_count() const {
    if(shape->is(ShapeKind::Array)) return shape->array_len;
    return active_fields().size();
}

void* Frame::slot_ptr(size_t idx) const {
    auto* base = static_cast<unsigned char*>(data);
    if(shape->is(ShapeKind::Array)) return base + idx * shape->elem().layout.size;
    return base + active_fields()[idx].offset;
}

const Shape& Frame::slot_shape(size_t idx) const {
    if(shape->is(ShapeKind::Array)) return shape->elem();
    return active_fields()[idx].type();
}

void Frame::ensure_slot_tracker(){
    switch(shape->kind){
        case ShapeKind::Struct:
            if(std::holds_alternative<StructTracker>(tracker)) return;
            if(is_init()){ tracker = StructTracker{llvm::BitVector(shape->fields.size(), true), std::nullopt}; return; }
            if(is_uninit()){ tracker = StructTracker{llvm::BitVector(shape->fields.size()), std::nullopt}; return; }
            break;
        case ShapeKind::Array:
            if(std::holds_alternative<ArrayTracker>(tracker)) return;
            if(is_init()){ tracker = ArrayTracker{llvm::BitVector(shape->array_len, true), std::nullopt}; return; }
            if(is_uninit()){ tracker = ArrayTracker{llvm::BitVector(shape->array_len), std::nullopt}; return; }
            break;
        case ShapeKind::Enum:
            if(std::holds_alternative<EnumTracker>(tracker)) return;
            if(is_init()){
                size_t idx = 0;
                int64_t disc = read_discriminant(*shape, data);
                if(!variant_for_discriminant(*shape, disc, &idx))
                    throw build_error(ErrorKind::InvariantViolation,
                                      "enum " + shape->name + " holds unknown discriminant " + std::to_string(disc));
                tracker = EnumTracker{idx, llvm::BitVector(shape->variants[idx].fields.size(), true), std::nullopt};
                return;
            }
            if(is_uninit())
                throw build_error(ErrorKind::InvariantViolation, "no variant selected on enum " + shape->name,
                                  "call select_variant() first");
            break;
        default:
            throw build_error(ErrorKind::WrongKind, std::string("shape ") + shape->name + " is a " +
                              kind_name(shape->kind) + ", not a struct, enum or array");
    }
    throw build_error(ErrorKind::InvariantViolation,
                      std::string("frame for ") + shape->name + " is in state " + tracker_name(tracker));
}

static llvm::BitVector* slot_bits(Tracker& t){
    if(auto* st = std::get_if<StructTracker>(&t)) return &st->iset;
    if(auto* et = std::get_if<EnumTracker>(&t)) return &et->data;
    if(auto* at = std::get_if<ArrayTracker>(&t)) return &at->iset;
    return nullptr;
}

static const llvm::BitVector* slot_bits(const Tracker& t){
    return slot_bits(const_cast<Tracker&>(t));
}

void Frame::prepare_field_for_overwrite(size_t idx){
    ensure_slot_tracker();
    llvm::BitVector* bits = slot_bits(tracker);
    if(bits->test(idx)){
        drop_value(slot_shape(idx), slot_ptr(idx));
        bits->reset(idx);
    }
}

void Frame::mark_field_complete(size_t idx){
    ensure_slot_tracker();
    slot_bits(tracker)->set(idx);
    if(current_child() == idx) set_current_child(std::nullopt);
}

bool Frame::is_field_set(size_t idx) const {
    if(is_init()) return true;
    const llvm::BitVector* bits = slot_bits(tracker);
    return bits && idx < bits->size() && bits->test(idx);
}

void Frame::set_current_child(std::optional<size_t> idx){
    if(auto* st = std::get_if<StructTracker>(&tracker)) st->current_child = idx;
    else if(auto* et = std::get_if<EnumTracker>(&tracker)) et->current_child = idx;
    else if(auto* at = std::get_if<ArrayTracker>(&tracker)) at->current_child = idx;
}

std::optional<size_t> Frame::current_child() const {
    if(auto* st = std::get_if<StructTracker>(&tracker)) return st->current_child;
    if(auto* et = std::get_if<EnumTracker>(&tracker)) return et->current_child;
    if(auto* at = std::get_if<ArrayTracker>(&tracker)) return at->current_child;
    return std::nullopt;
}

static bool required_fields_set(const std::vector<Field>& fields, const llvm::BitVector& bits){
    for(size_t i = 0; i < fields.size(); ++i)
        if(!bits.test(i) && fields[i].is_required()) return false;
    return true;
}

bool Frame::is_complete() const {
    if(is_init()) return true;
    if(is_uninit()){
        switch(shape->kind){
            case ShapeKind::Struct:
                for(const Field& f : shape->fields) if(f.is_required()) return false;
                return true;
            case ShapeKind::Array: return shape->array_len == 0;
            case ShapeKind::Option: return true; // defaults to None
            default: return false;
        }
    }
    if(auto* st = std::get_if<StructTracker>(&tracker))
        return !st->current_child && required_fields_set(shape->fields, st->iset);
    if(auto* et = std::get_if<EnumTracker>(&tracker))
        return !et->current_child && required_fields_set(shape->variants[et->variant].fields, et->data);
    if(auto* at = std::get_if<ArrayTracker>(&tracker))
        return !at->current_child && at->iset.all();
    if(auto* lt = std::get_if<ListTracker>(&tracker)) return lt->initialized && !lt->building_item;
    if(auto* sett = std::get_if<SetTracker>(&tracker)) return sett->initialized && !sett->building_item;
    if(auto* mt = std::get_if<MapTracker>(&tracker)) return mt->initialized && mt->state == MapInsertState::Idle;
    if(auto* sb = std::get_if<SliceBuilderTracker>(&tracker)) return !sb->building_item;
    // option, either and pointer trackers only exist while their payload is open
    return false;
}

void Frame::fill_defaults(){
    if(is_uninit()){
        if(shape->is(ShapeKind::Option)){
            shape->option.init_none(data);
            tracker = InitTracker{};
            return;
        }
        if(shape->is(ShapeKind::Struct) || (shape->is(ShapeKind::Array) && shape->array_len == 0))
            ensure_slot_tracker();
        else
            return;
    }
    llvm::BitVector* bits = slot_bits(tracker);
    if(!bits || shape->is(ShapeKind::Array)) return;
    const auto& fields = active_fields();
    auto* base = static_cast<unsigned char*>(data);
    for(size_t i = 0; i < fields.size(); ++i){
        if(bits->test(i)) continue;
        const Field& f = fields[i];
        void* slot = base + f.offset;
        if(f.has_default()){
            if(f.default_fn) f.default_fn(slot);
            else if(!default_value(f.type(), slot))
                throw build_error(ErrorKind::NoDefault, "field '" + f.name + "' is marked default but " +
                                  f.type().name + " has no default");
        } else if(f.type().is(ShapeKind::Option)){
            f.type().option.init_none(slot);
        } else {
            continue;
        }
        bits->set(i);
    }
}

void Frame::finalize(){
    if(auto* sb = std::get_if<SliceBuilderTracker>(&tracker)){
        if(sb->building_item || !sb->builder) return;
        void* builder = sb->builder;
        sb->builder = nullptr;
        shape->pointer.slice->finish(builder, data);
        tracker = InitTracker{};
    }
}

std::vector<std::string> Frame::missing_parts() const {
    std::vector<std::string> out;
    if(is_init()) return out;
    if(is_uninit()){
        if(shape->is(ShapeKind::Struct)){
            for(const Field& f : shape->fields) out.push_back(f.name);
            return out;
        }
        if(shape->is(ShapeKind::Array) && shape->array_len == 0) return out;
        if(shape->is(ShapeKind::List) || shape->is(ShapeKind::Set) || shape->is(ShapeKind::Map))
            out.push_back(std::string(kind_name(shape->kind)) + " never begun");
        else
            out.push_back("value of " + shape->name);
        return out;
    }
    auto collect = [&](const std::vector<Field>& fields, const llvm::BitVector& bits){
        for(size_t i = 0; i < fields.size(); ++i) if(!bits.test(i)) out.push_back(fields[i].name);
    };
    if(auto* st = std::get_if<StructTracker>(&tracker)){
        collect(shape->fields, st->iset);
        if(st->current_child) out.push_back("open field " + shape->fields[*st->current_child].name);
    } else if(auto* et = std::get_if<EnumTracker>(&tracker)){
        collect(shape->variants[et->variant].fields, et->data);
        if(et->current_child) out.push_back("open field " + shape->variants[et->variant].fields[*et->current_child].name);
    } else if(auto* at = std::get_if<ArrayTracker>(&tracker)){
        for(size_t i = 0; i < at->iset.size(); ++i) if(!at->iset.test(i)) out.push_back("[" + std::to_string(i) + "]");
    } else if(auto* lt = std::get_if<ListTracker>(&tracker)){
        if(lt->building_item) out.push_back("list item in progress");
    } else if(auto* sett = std::get_if<SetTracker>(&tracker)){
        if(sett->building_item) out.push_back("set item in progress");
    } else if(auto* mt = std::get_if<MapTracker>(&tracker)){
        if(mt->state == MapInsertState::PushingKey) out.push_back(mt->key_complete ? "value for pending key" : "key in progress");
        else if(mt->state == MapInsertState::PushingValue) out.push_back("value in progress");
    } else if(auto* sb = std::get_if<SliceBuilderTracker>(&tracker)){
        out.push_back(sb->building_item ? "slice item in progress" : "unfinished slice");
    } else {
        out.push_back("payload in progress");
    }
    return out;
}

void Frame::require_full_initialization() const {
    auto missing = missing_parts();
    if(missing.empty()) return;
    std::string msg;
    llvm::raw_string_ostream os(msg);
    os << shape->name << " is not fully initialized; missing: ";
    for(size_t i = 0; i < missing.size(); ++i){ if(i) os << ", "; os << missing[i]; }
    throw build_error(ErrorKind::NotFullyInitialized, os.str());
}

void Frame::dealloc(){
    if(ownership == FrameOwnership::Owned) release_region(*shape, data);
    data = nullptr;
}

} // namespace forge
