// arena.hpp - index-addressed store with generation-checked handles
#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace forge {

// Opaque handle into an Arena. A handle stays valid from alloc() until the
// matching free(); after that its generation no longer matches the slot.
struct ArenaIdx {
    uint32_t slot = UINT32_MAX;
    uint32_t gen = 0;

    bool valid() const { return slot != UINT32_MAX; }
    friend bool operator==(ArenaIdx a, ArenaIdx b) { return a.slot == b.slot && a.gen == b.gen; }
    friend bool operator!=(ArenaIdx a, ArenaIdx b) { return !(a == b); }
};

template <class T>
class Arena {
public:
    ArenaIdx alloc(T value){
        ++live_;
        if(!free_.empty()){
            uint32_t s = free_.back();
            free_.pop_back();
            Entry& e = slots_[s];
            e.value.emplace(std::move(value));
            return ArenaIdx{s, e.gen};
        }
        slots_.push_back(Entry{std::optional<T>(std::move(value)), 0});
        return ArenaIdx{static_cast<uint32_t>(slots_.size() - 1), 0};
    }

    // Removes the value and hands it back; the caller finalizes it.
    T free(ArenaIdx idx){
        Entry& e = entry(idx);
        T out = std::move(*e.value);
        e.value.reset();
        ++e.gen;
        free_.push_back(idx.slot);
        --live_;
        return out;
    }

    T& get(ArenaIdx idx) { return *entry(idx).value; }
    const T& get(ArenaIdx idx) const { return *entry(idx).value; }

    bool contains(ArenaIdx idx) const {
        if(!idx.valid() || idx.slot >= slots_.size()) return false;
        const Entry& e = slots_[idx.slot];
        return e.gen == idx.gen && e.value.has_value();
    }

    size_t size() const { return live_; }
    bool empty() const { return live_ == 0; }

private:
    struct Entry {
        std::optional<T> value;
        uint32_t gen = 0;
    };

    Entry& entry(ArenaIdx idx){
        if(!contains(idx)) throw std::out_of_range("forge::Arena: stale or invalid index");
        return slots_[idx.slot];
    }
    const Entry& entry(ArenaIdx idx) const {
        if(!contains(idx)) throw std::out_of_range("forge::Arena: stale or invalid index");
        return slots_[idx.slot];
    }

    // deque keeps references returned by get() stable across alloc()
    std::deque<Entry> slots_;
    std::vector<uint32_t> free_;
    size_t live_ = 0;
};

} // namespace forge
