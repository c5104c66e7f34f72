#pragma once

#include <functional>
#include <string>

#include <dslrun/error.hpp>
#include <dslrun/node.hpp>
#include <dslrun/scope.hpp>
#include <dslrun/value.hpp>

namespace dslrun {

/// Receives one formatted diagnostic line per contained failure.
using Logger = std::function<void(const std::string&)>;

/// Writes diagnostics to stderr.
Logger stderr_logger();

struct Options {
    Logger logger{}; // empty selects stderr_logger()
};

/// Tree-walking evaluator. `evaluate` is the failure boundary: rule errors are
/// logged and become "no value", they never reach the caller.
class Evaluator {
public:
    explicit Evaluator(Options options = {});

    /// `parent` is the node containing `node`; only its shape is consulted.
    Maybe evaluate(const Node& node, const Node& parent, Scope& scope) const;

    Result<double> eval_literal(const Node& node, const Literal& literal) const;
    Maybe eval_identifier(const Identifier& identifier, const Scope& scope) const;
    Result<Maybe> eval_assignment(const Node& node, const Assignment& assignment,
                                  const Node& parent, Scope& scope) const;
    Result<Maybe> eval_function(const Node& node, const Function& function, Scope& scope) const;
    Value eval_block(const Node& node, const Block& block, const Scope& scope) const;
    Sequence eval_array(const Node& node, const Array& array, Scope& scope) const;

private:
    void report(const Node& node, const EvalError& err) const;

    Options options_;
};

} // namespace dslrun
