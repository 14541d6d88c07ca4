#include "partial_internal.hpp"

#include <algorithm>

namespace forge {

static bool is_named_link(const Frame& f){
    switch(f.link.kind){
        case LinkKind::StructField:
        case LinkKind::EnumField:
        case LinkKind::ArrayElem:
            return f.convert_to == nullptr;
        default:
            return false;
    }
}

// True when every frame above the deferred start was reached by name, so the
// top of the stack has a stable key path.
bool Partial::storable_chain() const {
    if(!deferred_) return false;
    for(size_t i = deferred_->start_depth; i < stack_.size(); ++i)
        if(!is_named_link(frames_.get(stack_[i]))) return false;
    return true;
}

KeyPath Partial::current_key() const {
    KeyPath key;
    for(size_t i = deferred_->start_depth; i < stack_.size(); ++i){
        const std::string& seg = frames_.get(stack_[i]).segment;
        key.push_back(!seg.empty() && seg.front() == '.' ? seg.substr(1) : seg);
    }
    return key;
}

static bool has_prefix(const KeyPath& key, const KeyPath& prefix){
    return key.size() >= prefix.size() && std::equal(prefix.begin(), prefix.end(), key.begin());
}

static void deepest_first(std::vector<std::pair<KeyPath, FrameId>>& v){
    std::stable_sort(v.begin(), v.end(), [](const auto& a, const auto& b){ return a.first.size() > b.first.size(); });
}

// Drops stored frames under prefix. The prefix itself is dropped only when
// include_prefix is set.
void Partial::discard_stored(const KeyPath& prefix, bool include_prefix){
    std::vector<std::pair<KeyPath, FrameId>> doomed;
    for(const auto& [key, id] : deferred_->stored){
        if(!has_prefix(key, prefix)) continue;
        if(!include_prefix && key.size() == prefix.size()) continue;
        doomed.emplace_back(key, id);
    }
    deepest_first(doomed);
    for(auto& [key, id] : doomed){
        Frame f = frames_.free(id);
        f.deinit();
        f.dealloc();
        deferred_->stored.erase(key);
        if(env_.trace) llvm::errs() << "[forge][defer] discarded " << join_key(key) << "\n";
    }
}

Partial& Partial::begin_deferred(Resolution resolution){
    guarded("begin_deferred", "", [&]{
        if(deferred_)
            fail(ErrorKind::InvariantViolation, "deferred mode is already active",
                 "call finish_deferred() before starting another session");
        DeferredState st;
        st.start_depth = stack_.size();
        st.resolution = std::move(resolution);
        deferred_ = std::move(st);
    });
    return *this;
}

Partial& Partial::finish_deferred(){
    guarded("finish_deferred", "", [&]{
        if(!deferred_)
            fail(ErrorKind::InvariantViolation, "finish_deferred() called outside deferred mode");
        if(stack_.size() != deferred_->start_depth){
            std::string msg;
            llvm::raw_string_ostream os(msg);
            os << "finish_deferred() with " << stack_.size() - deferred_->start_depth
               << " frame(s) still open above the deferred scope";
            fail(ErrorKind::InvariantViolation, os.str(), "end() them first");
        }
        try {
            reconcile_deferred();
        } catch (build_error& e) {
            if(e.path.empty()) e.set_path(path());
            teardown();
            throw;
        }
        if(env_.trace){
            for(const KeyPath& want : deferred_->resolution.expected)
                if(!deferred_->touched.count(want))
                    llvm::errs() << "[forge][defer] expected path never assigned: " << join_key(want) << "\n";
        }
        deferred_.reset();
    });
    return *this;
}

void Partial::reconcile_deferred(){
    std::vector<std::pair<KeyPath, FrameId>> pending(deferred_->stored.begin(), deferred_->stored.end());
    deepest_first(pending);
    std::string base = path();

    for(auto& [key, id] : pending){
        Frame& f = frames_.get(id);
        try {
            f.fill_defaults();
            f.finalize();
            f.require_full_initialization();
        } catch (build_error& e) {
            std::string joined = join_key(key);
            e.set_path(base + (joined.front() == '[' ? "" : ".") + joined);
            throw;
        }
        if(!frames_.contains(f.link.parent))
            fail(ErrorKind::InvariantViolation, "stored frame " + join_key(key) + " lost its parent");
        frames_.get(f.link.parent).mark_field_complete(f.link.index);
        deferred_->stored.erase(key);
        frames_.free(id);
        if(env_.trace) llvm::errs() << "[forge][defer] reconciled " << join_key(key) << "\n";
    }

    Frame& start = frames_.get(stack_[deferred_->start_depth - 1]);
    start.fill_defaults();
    start.finalize();
    start.require_full_initialization();
}

} // namespace forge
