#include <dslrun/builtins.hpp>
#include <dslrun/run.hpp>

#include <fmt/format.h>

using namespace dslrun;

int main() {
    Program program;
    program.bindings = arithmetic_bindings();

    // 1) a = 2; add(a, 3)
    program.nodes.push_back(assign("a", literal(2.0), "1"));
    program.nodes.push_back(call("add", {identifier("a"), literal(3.0)}, "2"));

    // 2) block with its own binding; `b` does not leak out
    program.nodes.push_back(block({
        assign("b", call("multiply", {identifier("a"), identifier("k")})),
        call("subtract", {identifier("b"), literal(1.0)}),
    }, Bindings{{"k", Value{10.0}}}, "3"));
    program.nodes.push_back(identifier("b", "4"));

    // 3) array drops the failing literal (one diagnostic on stderr)
    program.nodes.push_back(array({literal(1.0), literal("x"), identifier("a")}, "5"));

    ResultMap results = run(program, {"2", "3", "4", "5"});
    for (const auto& [id, value] : results) {
        fmt::print("{} = {}\n", id, format_value(value)); // 2 = 5, 3 = 19, 5 = [1, 2]
    }
    return 0;
}
