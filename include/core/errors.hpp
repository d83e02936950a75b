//! # Clone Errors
//!
//! Every failure raised by deepclone derives from `CloneError` and names the
//! type that could not be cloned. Errors always propagate to the caller; a
//! failed clone never returns a partial graph.

#ifndef DEEPCLONE_CORE_ERRORS_HPP
#define DEEPCLONE_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace deepclone {

/// Base class of all clone failures.
class CloneError : public std::runtime_error {
public:
    CloneError(std::string type_name, const std::string& message);

    /// Demangled name of the offending type.
    const std::string& type_name() const noexcept {
        return type_name_;
    }

private:
    std::string type_name_;
};

/// The type has no clone strategy: a delegate at the root, a plan requested
/// for a delegate type, or a class with no way to construct an instance.
class UnsupportedTypeError : public CloneError {
public:
    using CloneError::CloneError;
};

/// A runtime type reached through a reference has never been registered.
class UnknownTypeError : public CloneError {
public:
    explicit UnknownTypeError(std::string type_name);
};

/// A storage location could not be read or written.
class MemberAccessError : public CloneError {
public:
    MemberAccessError(std::string type_name, std::string field_name, const std::string& reason);

    const std::string& field_name() const noexcept {
        return field_name_;
    }

private:
    std::string field_name_;
};

} // namespace deepclone

#endif // DEEPCLONE_CORE_ERRORS_HPP
