#include <dslrun/evaluator.hpp>

#include <cstdio>
#include <exception>
#include <utility>

#include <fmt/format.h>

namespace dslrun {

// -----------------------------
// Diagnostics
// -----------------------------
Logger stderr_logger() {
    return [](const std::string& line) { fmt::print(stderr, "[dslrun] error: {}\n", line); };
}

static std::string display_id(const std::string& id) {
    return id.empty() ? "<anonymous>" : id;
}

// Name a Function node's callee resolves through. Assignments expose their
// target name as well.
static const std::string* callee_name(const Node& callee) {
    if (auto* ident = std::get_if<Identifier>(&callee.shape)) return &ident->name;
    if (auto* asg = std::get_if<Assignment>(&callee.shape)) return &asg->name;
    return nullptr;
}

// -----------------------------
// Dispatch
// -----------------------------
namespace {

struct Dispatch {
    const Evaluator& ev;
    const Node& node;
    const Node& parent;
    Scope& scope;

    Result<Maybe> operator()(const Literal& l) const {
        Result<double> r = ev.eval_literal(node, l);
        if (failed(r)) return std::get<EvalError>(std::move(r));
        return Maybe{std::get<double>(r)};
    }
    Result<Maybe> operator()(const Identifier& i) const { return ev.eval_identifier(i, scope); }
    Result<Maybe> operator()(const Assignment& a) const { return ev.eval_assignment(node, a, parent, scope); }
    Result<Maybe> operator()(const Function& f) const { return ev.eval_function(node, f, scope); }
    Result<Maybe> operator()(const Block& b) const { return Maybe{ev.eval_block(node, b, scope)}; }
    Result<Maybe> operator()(const Array& a) const { return Maybe{Value{ev.eval_array(node, a, scope)}}; }
    Result<Maybe> operator()(const Unrecognized&) const { return Maybe{}; }
};

} // namespace

Evaluator::Evaluator(Options options) : options_(std::move(options)) {
    if (!options_.logger) options_.logger = stderr_logger();
}

Maybe Evaluator::evaluate(const Node& node, const Node& parent, Scope& scope) const {
    Result<Maybe> r = std::visit(Dispatch{*this, node, parent, scope}, node.shape);
    if (failed(r)) {
        report(node, std::get<EvalError>(r));
        return std::nullopt;
    }
    return std::get<Maybe>(std::move(r));
}

void Evaluator::report(const Node& node, const EvalError& err) const {
    options_.logger(fmt::format("node {} ({}): {}: {}",
                                display_id(err.node_id), shape_name(node),
                                to_string(err.kind), err.what()));
}

// -----------------------------
// Rules
// -----------------------------
Result<double> Evaluator::eval_literal(const Node& node, const Literal& literal) const {
    if (auto* x = std::get_if<double>(&literal.value)) return *x;
    return EvalError(ErrorKind::TypeMismatch, node.id, "value is not numeric");
}

Maybe Evaluator::eval_identifier(const Identifier& identifier, const Scope& scope) const {
    return scope.lookup(identifier.name);
}

Result<Maybe> Evaluator::eval_assignment(const Node& node, const Assignment& assignment,
                                         const Node& parent, Scope& scope) const {
    if (!is_block(parent)) {
        return EvalError(ErrorKind::InvalidPosition, node.id,
                         fmt::format("assignment to '{}' is only allowed directly inside a block",
                                     assignment.name));
    }
    if (!assignment.value) {
        return EvalError(ErrorKind::MalformedNode, node.id,
                         fmt::format("assignment to '{}' has no value", assignment.name));
    }

    Maybe v = evaluate(*assignment.value, node, scope);
    if (v) scope.bind(assignment.name, std::move(*v));
    return scope.lookup(assignment.name);
}

Result<Maybe> Evaluator::eval_function(const Node& node, const Function& function, Scope& scope) const {
    // Arguments first, left to right, in the caller's scope.
    std::vector<Maybe> args;
    args.reserve(function.args.size());
    for (const auto& arg : function.args) {
        args.push_back(evaluate(arg, node, scope));
    }

    const std::string* name = function.callee ? callee_name(*function.callee) : nullptr;
    if (!name) {
        return EvalError(ErrorKind::NotAFunction, node.id, "callee has no name");
    }
    const Value* target = scope.find(*name);
    if (!target || !target->is_operation() || !target->operation()) {
        return EvalError(ErrorKind::NotAFunction, node.id,
                         fmt::format("'{}' is not a function", *name));
    }

    // Binary application: extra arguments are ignored, missing ones arrive empty.
    const Maybe none{};
    const Maybe& a = args.size() > 0 ? args[0] : none;
    const Maybe& b = args.size() > 1 ? args[1] : none;
    try {
        return target->operation()(a, b);
    } catch (const std::exception& e) {
        return EvalError(ErrorKind::OperationError, node.id,
                         fmt::format("'{}' failed: {}", *name, e.what()));
    } catch (...) {
        return EvalError(ErrorKind::OperationError, node.id,
                         fmt::format("'{}' failed: unknown exception", *name));
    }
}

Value Evaluator::eval_block(const Node& node, const Block& block, const Scope& scope) const {
    Scope inner = scope.child(block.bindings);

    Value last{0.0};
    for (const auto& child : block.nodes) {
        Maybe v = evaluate(child, node, inner);
        if (v) last = std::move(*v);
    }
    return last;
}

Sequence Evaluator::eval_array(const Node& node, const Array& array, Scope& scope) const {
    Sequence out;
    out.reserve(array.nodes.size());
    for (const auto& child : array.nodes) {
        Maybe v = evaluate(child, node, scope);
        if (v) out.push_back(std::move(*v));
    }
    return out;
}

} // namespace dslrun
