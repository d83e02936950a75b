//! # Delegates
//!
//! A `Delegate<R(Args...)>` is a reference-typed closure. Closures carry
//! executable state that cannot be duplicated, so a delegate nested inside a
//! cloned graph comes out null, and cloning one directly is an error.

#pragma once

#include "runtime/object.hpp"

#include <functional>
#include <utility>

namespace deepclone {

/// Common base of every `Delegate<Sig>`, used to recognize delegates at runtime.
class DelegateBase : public Object {
public:
    [[nodiscard]] virtual bool empty() const noexcept = 0;
};

template <typename Signature> class Delegate;

template <typename R, typename... Args> class Delegate<R(Args...)> final : public DelegateBase {
public:
    using function_type = std::function<R(Args...)>;

    Delegate() = default;

    explicit Delegate(function_type fn) : fn_(std::move(fn)) {}

    R operator()(Args... args) const {
        return fn_(std::forward<Args>(args)...);
    }

    [[nodiscard]] bool empty() const noexcept override {
        return !fn_;
    }

    const function_type& function() const {
        return fn_;
    }

private:
    function_type fn_;
};

} // namespace deepclone
