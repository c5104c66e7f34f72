#pragma once

#include <dslrun/scope.hpp>

namespace dslrun {

/// `add`, `subtract`, `multiply`, `divide` over two numbers.
/// Non-numeric or missing operands throw std::invalid_argument.
Bindings arithmetic_bindings();

} // namespace dslrun
