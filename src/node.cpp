#include <dslrun/node.hpp>

#include <utility>

namespace dslrun {

namespace {

struct ShapeName {
    std::string operator()(const Literal&) const { return "Literal"; }
    std::string operator()(const Identifier&) const { return "Identifier"; }
    std::string operator()(const Assignment&) const { return "Assignment"; }
    std::string operator()(const Function&) const { return "Function"; }
    std::string operator()(const Array&) const { return "Array"; }
    std::string operator()(const Block&) const { return "Block"; }
    std::string operator()(const Unrecognized& u) const { return u.shape; }
};

NodePtr share(Node n) {
    return std::make_shared<const Node>(std::move(n));
}

} // namespace

std::string shape_name(const Node& node) {
    return std::visit(ShapeName{}, node.shape);
}

bool is_block(const Node& node) noexcept {
    return std::holds_alternative<Block>(node.shape);
}

Node literal(double value, std::string id) {
    return Node{std::move(id), Literal{Scalar{value}}};
}

Node literal(std::string value, std::string id) {
    return Node{std::move(id), Literal{Scalar{std::move(value)}}};
}

Node literal(const char* value, std::string id) {
    return literal(std::string(value), std::move(id));
}

Node identifier(std::string name, std::string id) {
    return Node{std::move(id), Identifier{std::move(name)}};
}

Node assign(std::string name, Node value, std::string id) {
    return Node{std::move(id), Assignment{std::move(name), share(std::move(value))}};
}

Node call(std::string callee, std::vector<Node> args, std::string id) {
    return Node{std::move(id), Function{share(identifier(std::move(callee))), std::move(args)}};
}

Node array(std::vector<Node> nodes, std::string id) {
    return Node{std::move(id), Array{std::move(nodes)}};
}

Node block(std::vector<Node> nodes, Bindings bindings, std::string id) {
    return Node{std::move(id), Block{std::move(nodes), std::move(bindings)}};
}

} // namespace dslrun
