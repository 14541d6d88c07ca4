#include "partial_internal.hpp"

namespace forge {

static bool is_slice(const Shape& s){
    return s.is(ShapeKind::Pointer) && s.pointer.slice != nullptr;
}

void Partial::open_owned_child(const Shape& shape, LinkKind link, std::string segment){
    FrameId pid = top_id();
    Frame child = Frame::make(allocate_region(shape), shape, FrameOwnership::Owned, ParentLink{link, pid, 0});
    child.plan = child_plan(frames_.get(pid), link, 0);
    child.segment = std::move(segment);
    push_frame(std::move(child));
}

// Puts a list, set, map or slice-pointer frame into its collection state,
// initializing an empty container if the frame holds nothing yet.
void Partial::start_collection(Frame& f){
    switch(f.shape->kind){
        case ShapeKind::List:
            if(std::holds_alternative<ListTracker>(f.tracker)) return;
            if(!f.is_init()){
                overwrite_current();
                f.shape->list.init_with_capacity(f.data, 0);
            }
            f.tracker = ListTracker{true, false};
            return;
        case ShapeKind::Set:
            if(std::holds_alternative<SetTracker>(f.tracker)) return;
            if(!f.is_init()){
                overwrite_current();
                f.shape->set.init(f.data);
            }
            f.tracker = SetTracker{true, false};
            return;
        case ShapeKind::Map:
            if(std::holds_alternative<MapTracker>(f.tracker)) return;
            if(!f.is_init()){
                overwrite_current();
                f.shape->map.init(f.data);
            }
            f.tracker = MapTracker{true, MapInsertState::Idle, nullptr, false, nullptr};
            return;
        case ShapeKind::Pointer:
            if(is_slice(*f.shape)){
                if(std::holds_alternative<SliceBuilderTracker>(f.tracker)) return;
                overwrite_current();
                f.tracker = SliceBuilderTracker{f.shape->pointer.slice->new_builder(), false};
                return;
            }
            break;
        default:
            break;
    }
    fail(ErrorKind::WrongKind, f.shape->name + " is a " + kind_name(f.shape->kind) + ", not a collection");
}

Partial& Partial::begin_list(){
    guarded("begin_list", "", [&]{
        Frame& f = top();
        if(!is_slice(*f.shape)) require_kind(f, ShapeKind::List, "begin_list");
        start_collection(f);
    });
    return *this;
}

Partial& Partial::begin_set(){
    guarded("begin_set", "", [&]{
        Frame& f = top();
        require_kind(f, ShapeKind::Set, "begin_set");
        start_collection(f);
    });
    return *this;
}

Partial& Partial::begin_map(){
    guarded("begin_map", "", [&]{
        Frame& f = top();
        require_kind(f, ShapeKind::Map, "begin_map");
        start_collection(f);
    });
    return *this;
}

static void item_already_open(const Shape& s){
    throw build_error(ErrorKind::InvariantViolation, "an item of " + s.name + " is still being built",
                      "end() it before starting the next one");
}

Partial& Partial::begin_list_item(){
    guarded("begin_list_item", "", [&]{
        Frame& f = top();
        if(is_slice(*f.shape)){
            start_collection(f);
            if(std::get<SliceBuilderTracker>(f.tracker).building_item) item_already_open(*f.shape);
            open_owned_child(f.shape->inner(), LinkKind::SliceItem, "[]");
            std::get<SliceBuilderTracker>(f.tracker).building_item = true;
            return;
        }
        require_kind(f, ShapeKind::List, "begin_list_item");
        start_collection(f);
        if(std::get<ListTracker>(f.tracker).building_item) item_already_open(*f.shape);
        size_t len = f.shape->list.len(f.data);
        open_owned_child(f.shape->elem(), LinkKind::ListItem, "[" + std::to_string(len) + "]");
        std::get<ListTracker>(f.tracker).building_item = true;
    });
    return *this;
}

Partial& Partial::begin_set_item(){
    guarded("begin_set_item", "", [&]{
        Frame& f = top();
        require_kind(f, ShapeKind::Set, "begin_set_item");
        start_collection(f);
        if(std::get<SetTracker>(f.tracker).building_item) item_already_open(*f.shape);
        open_owned_child(f.shape->elem(), LinkKind::SetItem, "{}");
        std::get<SetTracker>(f.tracker).building_item = true;
    });
    return *this;
}

Partial& Partial::push_move(const Shape& shape, void* src){
    guarded("push", shape.name, [&]{
        Frame& f = top();
        bool slice = is_slice(*f.shape);
        if(!slice && !f.shape->is(ShapeKind::List) && !f.shape->is(ShapeKind::Set))
            fail(ErrorKind::WrongKind, "push needs a list, set or slice pointer, found " +
                 std::string(kind_name(f.shape->kind)) + " " + f.shape->name);
        const Shape& elem = slice ? f.shape->inner() : f.shape->elem();
        if(!accepts(elem, shape))
            fail(ErrorKind::ShapeMismatch, f.shape->name + " holds " + elem.name + ", got " + shape.name);
        start_collection(f);

        auto insert = [&](void* item){
            if(auto* sb = std::get_if<SliceBuilderTracker>(&f.tracker)){
                if(sb->building_item) item_already_open(*f.shape);
                f.shape->pointer.slice->push(sb->builder, item);
            } else if(auto* lt = std::get_if<ListTracker>(&f.tracker)){
                if(lt->building_item) item_already_open(*f.shape);
                f.shape->list.push(f.data, item);
            } else if(auto* st = std::get_if<SetTracker>(&f.tracker)){
                if(st->building_item) item_already_open(*f.shape);
                f.shape->set.insert(f.data, item);
            }
        };

        if(&elem == &shape){
            insert(src);
            return;
        }
        // convert into a scratch element first
        void* tmp = allocate_region(elem);
        try {
            write_value(elem, tmp, shape, src);
        } catch (...) {
            release_region(elem, tmp);
            throw;
        }
        try {
            insert(tmp);
        } catch (...) {
            drop_value(elem, tmp);
            release_region(elem, tmp);
            throw;
        }
        release_region(elem, tmp);
    });
    return *this;
}

static MapTracker& idle_map(Frame& f){
    auto& mt = std::get<MapTracker>(f.tracker);
    if(mt.state != MapInsertState::Idle)
        throw build_error(ErrorKind::InvariantViolation, "an entry of " + f.shape->name + " is still pending",
                          "finish it with begin_value() ... end() first");
    return mt;
}

Partial& Partial::begin_key(){
    guarded("begin_key", "", [&]{
        Frame& f = top();
        require_kind(f, ShapeKind::Map, "begin_key");
        start_collection(f);
        MapTracker& mt = idle_map(f);
        const Shape& ks = f.shape->key();
        void* key = allocate_region(ks);
        mt.state = MapInsertState::PushingKey;
        mt.key = key;
        mt.key_complete = false;

        Frame child = Frame::make(key, ks, FrameOwnership::ManagedElsewhere, ParentLink{LinkKind::MapKey, top_id(), 0});
        child.plan = child_plan(f, LinkKind::MapKey, 0);
        child.segment = "{key}";
        push_frame(std::move(child));
    });
    return *this;
}

Partial& Partial::set_key_move(const Shape& shape, void* src){
    guarded("set_key", shape.name, [&]{
        Frame& f = top();
        require_kind(f, ShapeKind::Map, "set_key");
        const Shape& ks = f.shape->key();
        if(!accepts(ks, shape))
            fail(ErrorKind::ShapeMismatch, f.shape->name + " has " + ks.name + " keys, got " + shape.name);
        start_collection(f);
        MapTracker& mt = idle_map(f);
        void* key = allocate_region(ks);
        try {
            write_value(ks, key, shape, src);
        } catch (...) {
            release_region(ks, key);
            throw;
        }
        mt.state = MapInsertState::PushingKey;
        mt.key = key;
        mt.key_complete = true;
    });
    return *this;
}

Partial& Partial::begin_value(){
    guarded("begin_value", "", [&]{
        Frame& f = top();
        require_kind(f, ShapeKind::Map, "begin_value");
        auto* mt = std::get_if<MapTracker>(&f.tracker);
        if(!mt || mt->state != MapInsertState::PushingKey || !mt->key_complete)
            fail(ErrorKind::InvariantViolation, "begin_value() needs a finished key",
                 "call set_key() or begin_key() ... end() first");
        const Shape& vs = f.shape->value();
        void* value = allocate_region(vs);
        mt->value = value;
        mt->state = MapInsertState::PushingValue;

        Frame child = Frame::make(value, vs, FrameOwnership::ManagedElsewhere, ParentLink{LinkKind::MapValue, top_id(), 0});
        child.plan = child_plan(f, LinkKind::MapValue, 0);
        child.segment = "{value}";
        push_frame(std::move(child));
    });
    return *this;
}

Partial& Partial::begin_optional_payload(){
    guarded("begin_optional_payload", "", [&]{
        Frame& f = top();
        require_kind(f, ShapeKind::Option, "begin_optional_payload");
        overwrite_current();
        open_owned_child(f.shape->inner(), LinkKind::OptionSome, "?");
        f.tracker = OptionTracker{true};
    });
    return *this;
}

Partial& Partial::set_none(){
    guarded("set_none", "", [&]{
        Frame& f = top();
        require_kind(f, ShapeKind::Option, "set_none");
        overwrite_current();
        f.shape->option.init_none(f.data);
        f.tracker = InitTracker{};
    });
    return *this;
}

Partial& Partial::begin_left(){
    guarded("begin_left", "", [&]{
        Frame& f = top();
        require_kind(f, ShapeKind::Either, "begin_left");
        overwrite_current();
        open_owned_child(f.shape->left(), LinkKind::EitherLeft, ".left");
        f.tracker = EitherTracker{true, true};
    });
    return *this;
}

Partial& Partial::begin_right(){
    guarded("begin_right", "", [&]{
        Frame& f = top();
        require_kind(f, ShapeKind::Either, "begin_right");
        overwrite_current();
        open_owned_child(f.shape->right(), LinkKind::EitherRight, ".right");
        f.tracker = EitherTracker{false, true};
    });
    return *this;
}

Partial& Partial::begin_pointer_inner(){
    guarded("begin_pointer_inner", "", [&]{
        Frame& f = top();
        require_kind(f, ShapeKind::Pointer, "begin_pointer_inner");
        if(is_slice(*f.shape))
            fail(ErrorKind::WrongKind, f.shape->name + " points at a slice", "use begin_list() to push its items");
        const Shape& pointee = pointee_of(*f.shape);
        if(!pointee.layout.sized)
            fail(ErrorKind::Unsized, "cannot build the unsized pointee " + pointee.name + " of " + f.shape->name);
        overwrite_current();
        open_owned_child(pointee, LinkKind::PointerInner, "*");
        f.tracker = PointerTracker{true};
    });
    return *this;
}

Partial& Partial::begin_inner(){
    guarded("begin_inner", "", [&]{
        Frame& f = top();
        require_kind(f, ShapeKind::Transparent, "begin_inner");
        overwrite_current();
        Frame child = Frame::make(f.data, f.shape->inner(), FrameOwnership::Field, ParentLink{LinkKind::Inner, top_id(), 0});
        child.plan = child_plan(f, LinkKind::Inner, 0);
        child.segment = ".0";
        push_frame(std::move(child));
    });
    return *this;
}

} // namespace forge
