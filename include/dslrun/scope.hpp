#pragma once

#include <map>
#include <string>

#include <dslrun/value.hpp>

namespace dslrun {

using Bindings = std::map<std::string, Value>;

/// One lexical scope. Child scopes are independent copies, never live views
/// of their parent.
class Scope {
public:
    Scope() = default;
    explicit Scope(Bindings initial) : bindings_(std::move(initial)) {}

    /// Snapshot of the current bindings overlaid with `overlay` (overlay wins).
    Scope child(const Bindings& overlay) const;

    /// Bound value for `name`, or nullptr.
    const Value* find(const std::string& name) const;

    Maybe lookup(const std::string& name) const;

    /// Inserts or replaces `name` in this scope only.
    void bind(const std::string& name, Value v);

    const Bindings& bindings() const noexcept { return bindings_; }

private:
    Bindings bindings_;
};

} // namespace dslrun
