#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace dslrun {

enum class ErrorKind {
    TypeMismatch,    // literal value is not numeric
    InvalidPosition, // assignment outside a block
    NotAFunction,    // callee does not resolve to a host operation
    OperationError,  // host operation threw
    MalformedNode,   // required child node missing
};

const char* to_string(ErrorKind kind) noexcept;

struct EvalError : std::runtime_error {
    EvalError(ErrorKind k, std::string node, const std::string& cause)
        : std::runtime_error(cause), kind(k), node_id(std::move(node)) {}

    ErrorKind kind;
    std::string node_id;
};

/// Either the rule's value or the error that stopped it.
template <class T>
using Result = std::variant<T, EvalError>;

template <class T>
bool failed(const Result<T>& r) noexcept { return std::holds_alternative<EvalError>(r); }

} // namespace dslrun
