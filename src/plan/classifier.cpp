#include "plan/classifier.hpp"

#include "cache/concurrent_map.hpp"
#include "reflect/type_registry.hpp"
#include "runtime/delegate.hpp"

#include <algorithm>
#include <initializer_list>
#include <vector>

namespace deepclone::plan {

using reflect::TypeInfo;
using reflect::TypeKind;

namespace {

using DeepCopyMemo = cache::ConcurrentMap<const TypeInfo*, bool>;

DeepCopyMemo& deep_copy_memo() {
    static DeepCopyMemo memo;
    return memo;
}

struct Probe {
    bool needs = false;
    bool cyclic = false; ///< Reached a value type still being examined
};

Probe probe(const TypeInfo& type, std::vector<const TypeInfo*>& in_progress) {
    switch (type.kind) {
    case TypeKind::Null:
    case TypeKind::Primitive:
    case TypeKind::String:
        return {};
    case TypeKind::Delegate:
    case TypeKind::Reference:
    case TypeKind::Array:
    case TypeKind::Class:
        return {true, false};
    case TypeKind::Struct:
    case TypeKind::Sequence:
    case TypeKind::Optional:
    case TypeKind::Container:
        break;
    }

    if (auto known = deep_copy_memo().find(&type)) {
        return {*known, false};
    }

    // A value type containing itself (through a sequence) adds nothing new.
    if (std::find(in_progress.begin(), in_progress.end(), &type) != in_progress.end()) {
        return {false, true};
    }

    in_progress.push_back(&type);
    Probe result;
    if (type.kind == TypeKind::Struct) {
        for (const auto& field : type.fields) {
            Probe inner = probe(field.field_type(), in_progress);
            result.cyclic = result.cyclic || inner.cyclic;
            if (inner.needs) {
                result.needs = true;
                break;
            }
        }
    } else {
        for (const TypeInfo* part : {type.key_type(), type.element_type()}) {
            if (!part) {
                continue;
            }
            Probe inner = probe(*part, in_progress);
            result.cyclic = result.cyclic || inner.cyclic;
            if (inner.needs) {
                result.needs = true;
                break;
            }
        }
    }
    in_progress.pop_back();

    // Answers that depended on an unfinished ancestor are only final at the root.
    if (result.needs || !result.cyclic || in_progress.empty()) {
        deep_copy_memo().insert_or_assign(&type, result.needs);
    }
    return result;
}

} // namespace

bool needs_deep_copy(const TypeInfo& type) {
    std::vector<const TypeInfo*> in_progress;
    return probe(type, in_progress).needs;
}

TypeKind classify(const TypeInfo& type) {
    switch (type.kind) {
    case TypeKind::Struct:
    case TypeKind::Sequence:
    case TypeKind::Optional:
    case TypeKind::Container:
        return needs_deep_copy(type) ? type.kind : TypeKind::Primitive;
    default:
        return type.kind;
    }
}

TypeKind classify(const Ref<Object>& value) {
    if (!value) {
        return TypeKind::Null;
    }
    if (is_delegate(*value)) {
        return TypeKind::Delegate;
    }
    return reflect::runtime_type_of(*value).kind;
}

bool is_delegate(const Object& object) {
    return dynamic_cast<const DelegateBase*>(&object) != nullptr;
}

void reset_classifier_memo() {
    deep_copy_memo().clear();
}

} // namespace deepclone::plan
