#include "forge/heap_value.hpp"
#include "forge/frame.hpp"

namespace forge {

void HeapValue::reset(){
    if(!data_) return;
    drop_value(*shape_, data_);
    release();
}

void HeapValue::release(){
    if(owns_) release_region(*shape_, data_);
    data_ = nullptr;
}

} // namespace forge
