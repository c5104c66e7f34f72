#include <gtest/gtest.h>
#include <dslrun/builtins.hpp>
#include <dslrun/run.hpp>

#include <cmath>
#include <string>
#include <vector>

namespace {

using namespace dslrun;

struct RunTest : ::testing::Test {
    std::vector<std::string> logs;
    Options opts{[this](const std::string& line) { logs.push_back(line); }};
};

TEST_F(RunTest, AssignThenCall) {
    Program p;
    p.bindings = arithmetic_bindings();
    p.nodes.push_back(assign("a", literal(2.0), "1"));
    p.nodes.push_back(call("add", {identifier("a"), literal(3.0)}, "2"));

    ResultMap r = run(p, {"2"}, opts);
    ASSERT_EQ(r.size(), 1u);
    EXPECT_EQ(r.at("2"), Value{5.0});
    EXPECT_TRUE(logs.empty());
}

TEST_F(RunTest, NonNumericLiteralYieldsEmptyResult) {
    Program p;
    p.nodes.push_back(literal("x", "1"));

    ResultMap r = run(p, {"1"}, opts);
    EXPECT_TRUE(r.empty());
    EXPECT_EQ(logs.size(), 1u);
}

TEST_F(RunTest, OnlyRequestedIdsAreReported) {
    Program p;
    p.nodes.push_back(literal(1.0, "a"));
    p.nodes.push_back(literal(2.0, "b"));
    p.nodes.push_back(literal(3.0, "c"));

    ResultMap r = run(p, {"a", "c", "zzz"}, opts);
    ASSERT_EQ(r.size(), 2u);
    EXPECT_EQ(r.at("a"), Value{1.0});
    EXPECT_EQ(r.at("c"), Value{3.0});
}

TEST_F(RunTest, RepeatedIdKeepsLastDefinedValue) {
    Program p;
    p.nodes.push_back(literal(1.0, "dup"));
    p.nodes.push_back(literal(2.0, "dup"));
    p.nodes.push_back(identifier("missing", "dup"));

    ResultMap r = run(p, {"dup"}, opts);
    EXPECT_EQ(r.at("dup"), Value{2.0});
}

TEST_F(RunTest, NestedBlockBindingDoesNotLeak) {
    Program p;
    p.nodes.push_back(block({assign("x", literal(1.0))}, {}, "blk"));
    p.nodes.push_back(identifier("x", "after"));

    ResultMap r = run(p, {"blk", "after"}, opts);
    EXPECT_EQ(r.at("blk"), Value{1.0});
    EXPECT_EQ(r.count("after"), 0u);
}

TEST_F(RunTest, AssignmentAsArgumentNeverEscapesRun) {
    Program p;
    p.bindings = arithmetic_bindings();
    p.nodes.push_back(call("add", {assign("a", literal(1.0)), literal(2.0)}, "1"));
    p.nodes.push_back(identifier("a", "2"));

    ResultMap r = run(p, {"1", "2"}, opts);
    EXPECT_TRUE(r.empty());
    ASSERT_EQ(logs.size(), 2u);
    EXPECT_NE(logs[0].find("InvalidPosition"), std::string::npos);
    EXPECT_NE(logs[1].find("OperationError"), std::string::npos);
}

TEST_F(RunTest, ForeignHostExceptionNeverEscapesRun) {
    Program p;
    p.bindings["raw"] = Value{HostOperation{[](const Maybe&, const Maybe&) -> Maybe {
        throw 42;
    }}};
    p.nodes.push_back(call("raw", {literal(1.0), literal(2.0)}, "r"));

    ResultMap r;
    EXPECT_NO_THROW(r = run(p, {"r"}, opts));
    EXPECT_TRUE(r.empty());
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_NE(logs[0].find("OperationError"), std::string::npos);
}

TEST_F(RunTest, ProgramBindingsAreNotModified) {
    Program p;
    p.nodes.push_back(assign("a", literal(2.0), "1"));

    run(p, {"1"}, opts);
    EXPECT_TRUE(p.bindings.empty());
}

TEST_F(RunTest, ArraysAndBlocksCompose) {
    Program p;
    p.bindings = arithmetic_bindings();
    p.nodes.push_back(assign("k", literal(3.0)));
    p.nodes.push_back(array({
        call("multiply", {identifier("k"), literal(2.0)}),
        call("nope", {}),
        block({assign("k", literal(7.0)), identifier("k")}),
        identifier("k"),
    }, "arr"));

    ResultMap r = run(p, {"arr"}, opts);
    EXPECT_EQ(r.at("arr"), Value(Sequence{Value{6.0}, Value{7.0}, Value{3.0}}));
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_NE(logs[0].find("NotAFunction"), std::string::npos);
}

TEST_F(RunTest, ArithmeticBuiltins) {
    Program p;
    p.bindings = arithmetic_bindings();
    p.nodes.push_back(call("subtract", {literal(10.0), literal(4.0)}, "sub"));
    p.nodes.push_back(call("multiply", {literal(2.0), literal(4.0)}, "mul"));
    p.nodes.push_back(call("divide", {literal(9.0), literal(2.0)}, "div"));
    p.nodes.push_back(call("divide", {literal(1.0), literal(0.0)}, "inf"));

    ResultMap r = run(p, {"sub", "mul", "div", "inf"}, opts);
    EXPECT_EQ(r.at("sub"), Value{6.0});
    EXPECT_EQ(r.at("mul"), Value{8.0});
    EXPECT_EQ(r.at("div"), Value{4.5});
    EXPECT_TRUE(std::isinf(r.at("inf").number()));
    EXPECT_TRUE(logs.empty());
}

TEST_F(RunTest, BuiltinRejectsNonNumericOperand) {
    Program p;
    p.bindings = arithmetic_bindings();
    p.nodes.push_back(call("add", {array({}), literal(1.0)}, "1"));

    ResultMap r = run(p, {"1"}, opts);
    EXPECT_TRUE(r.empty());
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_NE(logs[0].find("not a number"), std::string::npos);
}

TEST(ValueFormat, NumbersSequencesOperations) {
    EXPECT_EQ(format_value(Value{5.0}), "5");
    EXPECT_EQ(format_value(Value{2.5}), "2.5");
    EXPECT_EQ(format_value(Value(Sequence{Value{1.0}, Value(Sequence{})})), "[1, []]");
    EXPECT_EQ(format_value(arithmetic_bindings().at("add")), "<operation>");
}

} // namespace
