#include <dslrun/run.hpp>

#include <algorithm>
#include <utility>

namespace dslrun {

ResultMap run(const Program& program, const std::vector<std::string>& interest_ids,
              const Options& options) {
    Evaluator ev(options);
    Scope root_scope(program.bindings);

    // Top-level nodes sit directly in the program, which behaves like a block.
    const Node root{"", Block{}};

    ResultMap out;
    for (const auto& node : program.nodes) {
        Maybe v = ev.evaluate(node, root, root_scope);
        if (!v) continue;
        if (std::find(interest_ids.begin(), interest_ids.end(), node.id) == interest_ids.end()) continue;
        out.insert_or_assign(node.id, std::move(*v));
    }
    return out;
}

} // namespace dslrun
