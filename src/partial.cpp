#include "partial_internal.hpp"

#include <algorithm>

namespace forge {

std::string join_key(const KeyPath& key){
    std::string out;
    for(const auto& k : key){
        if(!out.empty() && k.front() != '[') out += '.';
        out += k;
    }
    return out;
}

Partial::Partial(const Shape& shape, std::shared_ptr<const TypePlan> plan)
    : root_shape_(&shape), plan_(std::move(plan)), env_(detect_env()) {}

Partial Partial::alloc(const Shape& shape){
    return alloc(shape, nullptr);
}

Partial Partial::alloc(const Shape& shape, std::shared_ptr<const TypePlan> plan){
    if(plan && &plan->shape() != &shape)
        throw build_error(ErrorKind::ShapeMismatch, "type plan was built for " + plan->shape().name +
                          ", not " + shape.name);
    Partial p(shape, std::move(plan));
    install_fatal_handler_if_requested(p.env_);
    Frame root = Frame::make(allocate_region(shape), shape, FrameOwnership::Owned);
    root.segment = shape.name;
    if(p.plan_) root.plan = p.plan_->root();
    p.push_frame(std::move(root));
    p.trace("alloc", shape.name);
    return p;
}

Partial::Partial(Partial&& o) noexcept
    : frames_(std::move(o.frames_)),
      stack_(std::move(o.stack_)),
      root_shape_(o.root_shape_),
      plan_(std::move(o.plan_)),
      deferred_(std::move(o.deferred_)),
      state_(o.state_),
      env_(o.env_) {
    o.stack_.clear();
    o.deferred_.reset();
    o.state_ = State::Built;
}

Partial& Partial::operator=(Partial&& o) noexcept {
    if(this == &o) return *this;
    teardown();
    frames_ = std::move(o.frames_);
    stack_ = std::move(o.stack_);
    root_shape_ = o.root_shape_;
    plan_ = std::move(o.plan_);
    deferred_ = std::move(o.deferred_);
    state_ = o.state_;
    env_ = o.env_;
    o.stack_.clear();
    o.deferred_.reset();
    o.state_ = State::Built;
    return *this;
}

Partial::~Partial(){
    teardown();
}

void Partial::ensure_active(const char* op) const {
    if(state_ == State::Poisoned)
        throw build_error(ErrorKind::Poisoned, std::string(op) + " called on a poisoned builder",
                          "an earlier operation failed; discard this Partial");
    if(state_ == State::Built)
        throw build_error(ErrorKind::InvariantViolation, std::string(op) + " called after build()");
}

void Partial::trace(const char* op, llvm::StringRef detail) const {
    if(!env_.trace) return;
    llvm::errs() << "[forge][" << op << "] depth=" << stack_.size() << " path=" << path();
    if(!detail.empty()) llvm::errs() << " " << detail;
    llvm::errs() << "\n";
}

void Partial::poison(build_error& e){
    if(e.path.empty()) e.set_path(path());
    state_ = State::Poisoned;
    if(env_.trace) llvm::errs() << "[forge][poison] " << e.what() << "\n";
    maybe_print_json(e, env_);
}

void Partial::poison_foreign(const char* op, const std::exception& e){
    state_ = State::Poisoned;
    if(env_.trace) llvm::errs() << "[forge][poison] " << op << " at " << path() << ": " << e.what() << "\n";
}

void Partial::fail(ErrorKind kind, const std::string& message, std::string hint) const {
    throw build_error(kind, message, std::move(hint));
}

Frame& Partial::top(){
    if(stack_.empty()) fail(ErrorKind::InvariantViolation, "builder has no live frames");
    return frames_.get(stack_.back());
}

const Frame& Partial::top() const {
    if(stack_.empty()) fail(ErrorKind::InvariantViolation, "builder has no live frames");
    return frames_.get(stack_.back());
}

void Partial::push_frame(Frame f){
    stack_.push_back(frames_.alloc(std::move(f)));
}

PlanId Partial::child_plan(const Frame& parent, LinkKind link, size_t idx) const {
    if(!plan_ || !parent.plan.valid()) return PlanId{};
    const PlanNode& n = plan_->resolve(parent.plan);
    switch(link){
        case LinkKind::StructField:
            return idx < n.fields.size() ? n.fields[idx].child : PlanId{};
        case LinkKind::EnumField:
            if(auto* et = std::get_if<EnumTracker>(&parent.tracker)){
                const auto& fields = n.variants[et->variant].fields;
                return idx < fields.size() ? fields[idx].child : PlanId{};
            }
            return PlanId{};
        case LinkKind::ArrayElem:
        case LinkKind::ListItem:
        case LinkKind::SetItem:
        case LinkKind::SliceItem:
        case LinkKind::OptionSome:
        case LinkKind::PointerInner:
        case LinkKind::Inner:
            return n.elem;
        case LinkKind::MapKey: return n.key;
        case LinkKind::MapValue: return n.value;
        case LinkKind::EitherLeft: return n.left;
        case LinkKind::EitherRight: return n.right;
        case LinkKind::Root: break;
    }
    return PlanId{};
}

const Shape& Partial::shape() const {
    if(stack_.empty()) return *root_shape_;
    return *top().shape;
}

std::string Partial::path() const {
    std::string out;
    for(FrameId id : stack_){
        if(frames_.contains(id)) out += frames_.get(id).segment;
    }
    return out;
}

static void throw_incomplete(const Frame& f){
    auto missing = f.missing_parts();
    std::string msg;
    llvm::raw_string_ostream os(msg);
    os << "cannot finish " << f.shape->name << "; missing: ";
    for(size_t i = 0; i < missing.size(); ++i){ if(i) os << ", "; os << missing[i]; }
    throw build_error(ErrorKind::NotFullyInitialized, os.str());
}

Partial& Partial::end(){
    guarded("end", "", [&]{ end_top(); });
    return *this;
}

void Partial::end_top(){
    if(stack_.size() < 2)
        fail(ErrorKind::InvariantViolation, "cannot end the root frame", "call build() to take the value");
    if(deferred_ && stack_.size() == deferred_->start_depth)
        fail(ErrorKind::InvariantViolation, "end() would leave the deferred scope", "call finish_deferred() first");

    FrameId cid = top_id();
    Frame& child = frames_.get(cid);
    Frame& parent = frames_.get(stack_[stack_.size() - 2]);

    if(deferred_ && storable_chain()){
        KeyPath key = current_key();
        stack_.pop_back();
        parent.set_current_child(std::nullopt);
        deferred_->stored[key] = cid;
        if(env_.trace) llvm::errs() << "[forge][defer] stored " << join_key(key) << "\n";
        return;
    }

    if(!child.is_complete()) throw_incomplete(child);
    child.fill_defaults();
    child.finalize();
    child.require_full_initialization();
    splice(parent, child);
    stack_.pop_back();
    frames_.free(cid);
}

// Moves a finished child into its parent. On success the child holds no
// value and no region; the caller frees its arena slot.
void Partial::splice(Frame& parent, Frame& child){
    const Shape& ps = *parent.shape;
    auto consumed = [&]{
        child.tracker = UninitTracker{};
        child.dealloc();
    };
    switch(child.link.kind){
        case LinkKind::StructField:
        case LinkKind::EnumField:
        case LinkKind::ArrayElem: {
            if(child.convert_to){
                std::string err;
                const Shape& target = *child.convert_to;
                if(!target.vtable.try_from(*child.shape, child.data, child.convert_dest, err)){
                    if(err.empty()) fail(ErrorKind::ShapeMismatch, target.name + " cannot be built from " + child.shape->name);
                    fail(ErrorKind::ConversionFailed, "cannot convert " + child.shape->name + " into " +
                         target.name + ": " + err);
                }
                drop_value(*child.shape, child.data);
                consumed();
            }
            parent.mark_field_complete(child.link.index);
            return;
        }
        case LinkKind::Inner:
            parent.tracker = InitTracker{};
            return;
        case LinkKind::ListItem: {
            auto* lt = std::get_if<ListTracker>(&parent.tracker);
            if(!lt) break;
            ps.list.push(parent.data, child.data);
            consumed();
            lt->building_item = false;
            return;
        }
        case LinkKind::SetItem: {
            auto* st = std::get_if<SetTracker>(&parent.tracker);
            if(!st) break;
            ps.set.insert(parent.data, child.data);
            consumed();
            st->building_item = false;
            return;
        }
        case LinkKind::SliceItem: {
            auto* sb = std::get_if<SliceBuilderTracker>(&parent.tracker);
            if(!sb) break;
            ps.pointer.slice->push(sb->builder, child.data);
            consumed();
            sb->building_item = false;
            return;
        }
        case LinkKind::MapKey: {
            auto* mt = std::get_if<MapTracker>(&parent.tracker);
            if(!mt || mt->key != child.data) break;
            mt->key_complete = true; // region stays with the tracker
            child.tracker = UninitTracker{};
            return;
        }
        case LinkKind::MapValue: {
            auto* mt = std::get_if<MapTracker>(&parent.tracker);
            if(!mt || mt->value != child.data || !mt->key_complete) break;
            ps.map.insert(parent.data, mt->key, mt->value);
            release_region(ps.key(), mt->key);
            release_region(ps.value(), mt->value);
            child.tracker = UninitTracker{};
            *mt = MapTracker{true, MapInsertState::Idle, nullptr, false, nullptr};
            return;
        }
        case LinkKind::OptionSome:
            ps.option.init_some(parent.data, child.data);
            consumed();
            parent.tracker = InitTracker{};
            return;
        case LinkKind::EitherLeft:
            ps.either.init_left(parent.data, child.data);
            consumed();
            parent.tracker = InitTracker{};
            return;
        case LinkKind::EitherRight:
            ps.either.init_right(parent.data, child.data);
            consumed();
            parent.tracker = InitTracker{};
            return;
        case LinkKind::PointerInner:
            ps.pointer.wrap(parent.data, child.data);
            consumed();
            parent.tracker = InitTracker{};
            return;
        case LinkKind::Root:
            break;
    }
    fail(ErrorKind::InvariantViolation, std::string("parent ") + ps.name + " is in state " +
         tracker_name(parent.tracker) + " and cannot accept a " + link_name(child.link.kind) + " child");
}

HeapValue Partial::build(){
    return guarded("build", root_shape_->name, [&]() -> HeapValue {
        if(deferred_)
            fail(ErrorKind::InvariantViolation, "build() called while deferred mode is active",
                 "call finish_deferred() first");
        while(stack_.size() > 1) end_top();

        Frame& root = top();
        if(!root.is_complete()) throw_incomplete(root);
        root.fill_defaults();
        root.finalize();
        root.require_full_initialization();

        Frame done = frames_.free(stack_.back());
        stack_.clear();
        state_ = State::Built;
        return HeapValue(*done.shape, done.data, done.ownership == FrameOwnership::Owned);
    });
}

void Partial::check_invariants() const {
    auto violation = [this](size_t depth, const std::string& what){
        std::string msg;
        llvm::raw_string_ostream os(msg);
        os << "frame " << depth << ": " << what;
        fail(ErrorKind::InvariantViolation, os.str());
    };

    for(size_t i = 0; i < stack_.size(); ++i){
        if(!frames_.contains(stack_[i])) violation(i, "stale frame index on the stack");
        const Frame& f = frames_.get(stack_[i]);
        if(i == 0){
            if(f.link.kind != LinkKind::Root) violation(i, "bottom frame is not a root frame");
            continue;
        }
        if(f.link.parent != stack_[i - 1]) violation(i, "not linked to the frame below it");
        const Frame& p = frames_.get(stack_[i - 1]);
        bool ok = true;
        switch(f.link.kind){
            case LinkKind::StructField:
            case LinkKind::EnumField:
            case LinkKind::ArrayElem:
                ok = p.current_child() == f.link.index && !p.is_field_set(f.link.index);
                break;
            case LinkKind::ListItem: {
                auto* lt = std::get_if<ListTracker>(&p.tracker);
                ok = lt && lt->building_item && f.ownership == FrameOwnership::Owned;
                break;
            }
            case LinkKind::SetItem: {
                auto* st = std::get_if<SetTracker>(&p.tracker);
                ok = st && st->building_item && f.ownership == FrameOwnership::Owned;
                break;
            }
            case LinkKind::SliceItem: {
                auto* sb = std::get_if<SliceBuilderTracker>(&p.tracker);
                ok = sb && sb->building_item && f.ownership == FrameOwnership::Owned;
                break;
            }
            case LinkKind::MapKey: {
                auto* mt = std::get_if<MapTracker>(&p.tracker);
                ok = mt && mt->state == MapInsertState::PushingKey && !mt->key_complete && mt->key == f.data &&
                     f.ownership == FrameOwnership::ManagedElsewhere;
                break;
            }
            case LinkKind::MapValue: {
                auto* mt = std::get_if<MapTracker>(&p.tracker);
                ok = mt && mt->state == MapInsertState::PushingValue && mt->value == f.data &&
                     f.ownership == FrameOwnership::ManagedElsewhere;
                break;
            }
            case LinkKind::OptionSome: {
                auto* ot = std::get_if<OptionTracker>(&p.tracker);
                ok = ot && ot->building_inner;
                break;
            }
            case LinkKind::EitherLeft:
            case LinkKind::EitherRight: {
                auto* et = std::get_if<EitherTracker>(&p.tracker);
                ok = et && et->building && et->left == (f.link.kind == LinkKind::EitherLeft);
                break;
            }
            case LinkKind::PointerInner: {
                auto* pt = std::get_if<PointerTracker>(&p.tracker);
                ok = pt && pt->building;
                break;
            }
            case LinkKind::Inner:
                ok = p.is_uninit() && p.data == f.data;
                break;
            case LinkKind::Root:
                ok = false;
                break;
        }
        if(!ok) violation(i, std::string(link_name(f.link.kind)) + " child does not match parent state " +
                          tracker_name(p.tracker));
    }
    if(!stack_.empty() && top().current_child())
        violation(stack_.size() - 1, "top frame records an open child");

    if(deferred_){
        for(const auto& [key, id] : deferred_->stored){
            if(!frames_.contains(id) || !frames_.contains(frames_.get(id).link.parent)){
                fail(ErrorKind::InvariantViolation, "stored frame " + join_key(key) + " is detached");
            }
            const Frame& f = frames_.get(id);
            if(frames_.get(f.link.parent).is_field_set(f.link.index))
                fail(ErrorKind::InvariantViolation, "stored frame " + join_key(key) + " is also marked set in its parent");
        }
    }
}

void Partial::teardown(){
    if(deferred_){
        // stored frames alias regions owned further down the stack: release them first
        std::vector<std::pair<KeyPath, FrameId>> stored(deferred_->stored.begin(), deferred_->stored.end());
        std::stable_sort(stored.begin(), stored.end(),
                         [](const auto& a, const auto& b){ return a.first.size() > b.first.size(); });
        for(auto& entry : stored){
            Frame f = frames_.free(entry.second);
            f.uninit();
            f.dealloc();
        }
        deferred_.reset();
    }
    while(!stack_.empty()){
        Frame f = frames_.free(stack_.back());
        stack_.pop_back();
        f.uninit();
        f.dealloc();
    }
}

} // namespace forge
