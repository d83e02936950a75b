#include "core/errors.hpp"

#include <utility>

namespace deepclone {

CloneError::CloneError(std::string type_name, const std::string& message)
    : std::runtime_error("cannot clone '" + type_name + "': " + message),
      type_name_(std::move(type_name)) {}

UnknownTypeError::UnknownTypeError(std::string type_name)
    : CloneError(std::move(type_name),
                 "runtime type is not registered (call reflect::register_type<T>() first)") {}

MemberAccessError::MemberAccessError(std::string type_name, std::string field_name,
                                     const std::string& reason)
    : CloneError(std::move(type_name),
                 field_name.empty() ? reason : "field '" + field_name + "': " + reason),
      field_name_(std::move(field_name)) {}

} // namespace deepclone
