#include "forge/shape.hpp"

#include <cstring>

#include <llvm/Support/ErrorHandling.h>
#include <llvm/Support/raw_ostream.h>

namespace forge {

const char* kind_name(ShapeKind k){
    switch(k){
        case ShapeKind::Scalar: return "scalar";
        case ShapeKind::Struct: return "struct";
        case ShapeKind::Enum: return "enum";
        case ShapeKind::List: return "list";
        case ShapeKind::Map: return "map";
        case ShapeKind::Set: return "set";
        case ShapeKind::Option: return "option";
        case ShapeKind::Either: return "either";
        case ShapeKind::Pointer: return "pointer";
        case ShapeKind::Array: return "array";
        case ShapeKind::Transparent: return "transparent";
    }
    return "?";
}

bool Field::is_required() const {
    if(has_default()) return false;
    return !shape().is(ShapeKind::Option);
}

void drop_value(const Shape& shape, void* value){
    if(shape.vtable.drop_in_place) shape.vtable.drop_in_place(value);
}

void relocate_value(const Shape& shape, void* src, void* dst){
    if(shape.vtable.move_into){ shape.vtable.move_into(src, dst); return; }
    if(shape.layout.size) std::memcpy(dst, src, shape.layout.size);
}

bool default_value(const Shape& shape, void* dst){
    if(!shape.vtable.default_in_place) return false;
    shape.vtable.default_in_place(dst);
    return true;
}

static void check_tag_size(const Shape& shape){
    switch(shape.repr.tag_size){
        case 1: case 2: case 4: case 8: return;
        default: break;
    }
    std::string msg;
    llvm::raw_string_ostream os(msg);
    os << "forge: enum shape '" << shape.name << "' declares unsupported tag size " << shape.repr.tag_size;
    llvm::report_fatal_error(llvm::StringRef(os.str()));
}

int64_t read_discriminant(const Shape& shape, const void* value){
    check_tag_size(shape);
    const auto* p = static_cast<const unsigned char*>(value) + shape.repr.tag_offset;
    switch(shape.repr.tag_size){
        case 1: { int8_t v; std::memcpy(&v, p, 1); return v; }
        case 2: { int16_t v; std::memcpy(&v, p, 2); return v; }
        case 4: { int32_t v; std::memcpy(&v, p, 4); return v; }
        default: { int64_t v; std::memcpy(&v, p, 8); return v; }
    }
}

void write_discriminant(const Shape& shape, void* value, int64_t discriminant){
    check_tag_size(shape);
    auto* p = static_cast<unsigned char*>(value) + shape.repr.tag_offset;
    switch(shape.repr.tag_size){
        case 1: { auto v = static_cast<int8_t>(discriminant); std::memcpy(p, &v, 1); break; }
        case 2: { auto v = static_cast<int16_t>(discriminant); std::memcpy(p, &v, 2); break; }
        case 4: { auto v = static_cast<int32_t>(discriminant); std::memcpy(p, &v, 4); break; }
        default: std::memcpy(p, &discriminant, 8); break;
    }
}

const Variant* variant_for_discriminant(const Shape& shape, int64_t discriminant, size_t* index){
    for(size_t i = 0; i < shape.variants.size(); ++i){
        if(shape.variants[i].discriminant == discriminant){
            if(index) *index = i;
            return &shape.variants[i];
        }
    }
    return nullptr;
}

const std::vector<Field>& fields_of(const Shape& shape, size_t variant){
    if(shape.is(ShapeKind::Enum)) return shape.variants.at(variant).fields;
    return shape.fields;
}

bool find_field(const std::vector<Field>& fields, std::string_view name, size_t& index){
    for(size_t i = 0; i < fields.size(); ++i){
        if(fields[i].name == name || (!fields[i].alias.empty() && fields[i].alias == name)){
            index = i;
            return true;
        }
    }
    return false;
}

bool find_variant(const Shape& shape, std::string_view name, size_t& index){
    for(size_t i = 0; i < shape.variants.size(); ++i){
        if(shape.variants[i].name == name){ index = i; return true; }
    }
    return false;
}

std::string describe(const Shape& shape){
    std::string out;
    llvm::raw_string_ostream os(out);
    os << shape.name << " (" << kind_name(shape.kind);
    if(shape.layout.sized) os << ", size " << shape.layout.size << ", align " << shape.layout.align;
    else os << ", unsized";
    os << ")";
    return os.str();
}

} // namespace forge
