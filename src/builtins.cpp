#include <dslrun/builtins.hpp>

#include <stdexcept>

#include <fmt/format.h>

namespace dslrun {

static double operand(const char* op, const Maybe& v, int position) {
    if (!v) throw std::invalid_argument(fmt::format("{}: missing operand {}", op, position));
    if (!v->is_number()) {
        throw std::invalid_argument(fmt::format("{}: operand {} is not a number ({})",
                                                op, position, format_value(*v)));
    }
    return v->number();
}

static Value binary(const char* op, double (*f)(double, double)) {
    return HostOperation{[op, f](const Maybe& a, const Maybe& b) -> Maybe {
        return f(operand(op, a, 1), operand(op, b, 2));
    }};
}

Bindings arithmetic_bindings() {
    Bindings b;
    b["add"]      = binary("add",      [](double x, double y) { return x + y; });
    b["subtract"] = binary("subtract", [](double x, double y) { return x - y; });
    b["multiply"] = binary("multiply", [](double x, double y) { return x * y; });
    b["divide"]   = binary("divide",   [](double x, double y) { return x / y; });
    return b;
}

} // namespace dslrun
