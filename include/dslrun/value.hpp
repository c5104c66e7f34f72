#pragma once

#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace dslrun {

struct Value;

/// Result of an Array node: defined elements only, in evaluation order.
using Sequence = std::vector<Value>;

/// Absent means "produced no value"; distinct from every Value, including 0.
using Maybe = std::optional<Value>;

/// Callable injected by the host through bindings. Missing arguments arrive empty.
using HostOperation = std::function<Maybe(const Maybe&, const Maybe&)>;

struct Value {
    std::variant<double, Sequence, HostOperation> data;

    Value() : data(0.0) {}
    Value(double x) : data(x) {}
    Value(Sequence s) : data(std::move(s)) {}
    Value(HostOperation op) : data(std::move(op)) {}

    bool is_number() const noexcept { return std::holds_alternative<double>(data); }
    bool is_sequence() const noexcept { return std::holds_alternative<Sequence>(data); }
    bool is_operation() const noexcept { return std::holds_alternative<HostOperation>(data); }

    double number() const { return std::get<double>(data); }
    const Sequence& sequence() const { return std::get<Sequence>(data); }
    const HostOperation& operation() const { return std::get<HostOperation>(data); }
};

/// Numbers and sequences compare by content; operations never compare equal.
bool operator==(const Value& a, const Value& b);
inline bool operator!=(const Value& a, const Value& b) { return !(a == b); }

/// Human-readable rendering: `5`, `[1, 3]`, `<operation>`.
std::string format_value(const Value& v);

std::ostream& operator<<(std::ostream& os, const Value& v);

} // namespace dslrun
