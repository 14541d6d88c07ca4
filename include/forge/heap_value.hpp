// heap_value.hpp - a finished value produced by Partial::build()
#pragma once
#include <utility>

#include "forge/error.hpp"
#include "forge/std_shapes.hpp"

namespace forge {

// Owns a fully initialized value in its own region. Dropping the HeapValue
// drops the value and releases the region.
class HeapValue {
public:
    HeapValue(const Shape& shape, void* data, bool owns_region)
        : shape_(&shape), data_(data), owns_(owns_region) {}
    HeapValue(HeapValue&& o) noexcept
        : shape_(o.shape_), data_(std::exchange(o.data_, nullptr)), owns_(o.owns_) {}
    HeapValue& operator=(HeapValue&& o) noexcept {
        if(this != &o){
            reset();
            shape_ = o.shape_;
            data_ = std::exchange(o.data_, nullptr);
            owns_ = o.owns_;
        }
        return *this;
    }
    HeapValue(const HeapValue&) = delete;
    HeapValue& operator=(const HeapValue&) = delete;
    ~HeapValue() { reset(); }

    const Shape& shape() const { return *shape_; }
    const void* data() const { return data_; }
    bool empty() const { return data_ == nullptr; }

    // Borrow the value as T; throws ShapeMismatch if T is not the built shape.
    template <class T>
    const T& get() const {
        check<T>();
        return *static_cast<const T*>(data_);
    }

    // Move the value out as T and release the region.
    template <class T>
    T materialize() && {
        check<T>();
        T* p = static_cast<T*>(data_);
        T out(std::move(*p));
        p->~T();
        release();
        return out;
    }

private:
    template <class T>
    void check() const {
        if(!data_) throw build_error(ErrorKind::InvariantViolation, "value has already been moved out");
        if(&shape_of<T>() != shape_)
            throw build_error(ErrorKind::ShapeMismatch, "value has shape " + shape_->name +
                              ", requested " + shape_of<T>().name);
    }
    void reset();
    void release();

    const Shape* shape_;
    void* data_;
    bool owns_;
};

} // namespace forge
