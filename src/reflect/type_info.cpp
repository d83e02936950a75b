#include "reflect/type_info.hpp"

#include <cstdlib>
#include <cxxabi.h>
#include <memory>

namespace deepclone::reflect {

const char* kind_name(TypeKind kind) {
    switch (kind) {
    case TypeKind::Null:
        return "null";
    case TypeKind::Primitive:
        return "primitive";
    case TypeKind::String:
        return "string";
    case TypeKind::Delegate:
        return "delegate";
    case TypeKind::Reference:
        return "reference";
    case TypeKind::Array:
        return "array";
    case TypeKind::Struct:
        return "struct";
    case TypeKind::Sequence:
        return "sequence";
    case TypeKind::Optional:
        return "optional";
    case TypeKind::Container:
        return "container";
    case TypeKind::Class:
        return "class";
    }
    return "unknown";
}

const FieldInfo* TypeInfo::find_field(std::string_view field_name) const {
    for (const auto& field : fields) {
        if (field.name == field_name) {
            return &field;
        }
    }
    return nullptr;
}

std::string demangle(const char* mangled) {
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> result(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
    if (status != 0 || !result) {
        return mangled;
    }
    return result.get();
}

} // namespace deepclone::reflect
