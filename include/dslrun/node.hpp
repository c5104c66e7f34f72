#pragma once

#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <dslrun/scope.hpp>

namespace dslrun {

struct Node;
using NodePtr = std::shared_ptr<const Node>;

/// Literal payload as delivered by the tree producer; only `double` is numeric.
using Scalar = std::variant<std::monostate, bool, double, std::string>;

struct Literal {
    Scalar value{};
};

struct Identifier {
    std::string name;
};

struct Assignment {
    std::string name;
    NodePtr value{};
};

struct Function {
    NodePtr callee{};        // its name selects the host operation
    std::vector<Node> args;
};

struct Array {
    std::vector<Node> nodes;
};

struct Block {
    std::vector<Node> nodes;
    Bindings bindings;       // layered over the enclosing scope
};

/// Shape tag the producer could not map; evaluates to no value.
struct Unrecognized {
    std::string shape;
};

using Shape = std::variant<Literal, Identifier, Assignment, Function, Array, Block, Unrecognized>;

struct Node {
    std::string id{};
    Shape shape{};
};

/// Shape tag as text ("Literal", "Block", ... or the unrecognized tag).
std::string shape_name(const Node& node);

bool is_block(const Node& node) noexcept;

// Builders for hand-written trees (tests, embedding hosts).
Node literal(double value, std::string id = {});
Node literal(std::string value, std::string id = {});
Node literal(const char* value, std::string id = {});
Node identifier(std::string name, std::string id = {});
Node assign(std::string name, Node value, std::string id = {});
Node call(std::string callee, std::vector<Node> args, std::string id = {});
Node array(std::vector<Node> nodes, std::string id = {});
Node block(std::vector<Node> nodes, Bindings bindings = {}, std::string id = {});

} // namespace dslrun
