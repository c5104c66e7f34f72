#pragma once

#include <map>
#include <string>
#include <vector>

#include <dslrun/evaluator.hpp>
#include <dslrun/node.hpp>
#include <dslrun/scope.hpp>

namespace dslrun {

/// Root of a tree: top-level nodes plus the host-provided bindings.
struct Program {
    std::vector<Node> nodes;
    Bindings bindings;
};

using ResultMap = std::map<std::string, Value>;

/// Evaluate every top-level node in order against one shared root scope and
/// collect the defined results of the requested ids.
/// Evaluation failures are logged through `options.logger`, never thrown.
/// `program` itself is not modified.
ResultMap run(const Program& program, const std::vector<std::string>& interest_ids,
              const Options& options = {});

} // namespace dslrun
