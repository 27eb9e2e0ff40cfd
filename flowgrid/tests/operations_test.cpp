#include <flowgrid/errors.hpp>
#include <flowgrid/operations.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace flowgrid;
using nlohmann::json;

namespace {

Step make_step(const std::string& name, std::vector<std::string> lines) {
  return Step{name, OpKeyword::Unknown, std::move(lines), 1};
}

AnalyzedStep analyze(const std::string& name, std::vector<std::string> lines, std::string previous = {},
                     std::vector<std::string> steps = {}) {
  return analyze_step(make_step(name, std::move(lines)), AnalyzeContext{std::move(previous), std::move(steps)});
}

}  // namespace

TEST(OperationsTest, LoadOperationsHaveNoDependencies) {
  auto csv = analyze("load", {"LOAD CSV FROM sales"});
  ASSERT_TRUE(std::holds_alternative<LoadCsvOp>(csv.op));
  EXPECT_EQ(std::get<LoadCsvOp>(csv.op).source, "sales");
  EXPECT_TRUE(csv.dependencies.empty());

  auto quoted = analyze("t", {"LOAD TABLE \"orders\""});
  EXPECT_EQ(std::get<LoadTableOp>(quoted.op).table, "orders");
  auto bare = analyze("t", {"load table orders"});
  EXPECT_EQ(std::get<LoadTableOp>(bare.op).table, "orders");
  EXPECT_TRUE(bare.dependencies.empty());
}

TEST(OperationsTest, FilterCondition) {
  auto step = analyze("valid", {"FILTER load WHERE amount > 0"});
  const auto& op = std::get<FilterOp>(step.op);
  EXPECT_EQ(op.source, "load");
  EXPECT_EQ(op.condition.field, "amount");
  EXPECT_EQ(op.condition.op, CompareOp::Gt);
  EXPECT_EQ(op.condition.value, 0);
  EXPECT_EQ(step.dependencies, std::vector<std::string>{"load"});

  auto text = analyze("f", {"FILTER rows WHERE meta.region == \"north\""});
  const auto& eq = std::get<FilterOp>(text.op);
  EXPECT_EQ(eq.condition.field, "meta.region");
  EXPECT_EQ(eq.condition.op, CompareOp::Eq);
  EXPECT_EQ(eq.condition.value, "north");

  auto real = analyze("f", {"FILTER rows WHERE score <= 2.5"});
  EXPECT_EQ(std::get<FilterOp>(real.op).condition.op, CompareOp::Le);
  EXPECT_DOUBLE_EQ(std::get<FilterOp>(real.op).condition.value.get<double>(), 2.5);
}

TEST(OperationsTest, FilterErrorsNameTheStep) {
  try {
    analyze("bad_filter", {"FILTER load WHERE amount ~ 3"});
    FAIL() << "expected OperationSyntaxError";
  } catch (const OperationSyntaxError& e) {
    EXPECT_EQ(e.step_name(), "bad_filter");
    EXPECT_NE(std::string(e.what()).find("bad_filter"), std::string::npos);
  }
  EXPECT_THROW(analyze("f", {"FILTER load amount > 3"}), OperationSyntaxError);
  EXPECT_THROW(analyze("f", {"FILTER load WHERE amount >"}), OperationSyntaxError);
}

TEST(OperationsTest, GroupAggregations) {
  auto step = analyze("g", {"GROUP valid BY region", "  AGG sum(amount) AS total", "AGG count(*) AS n",
                            "AGG price AS revenue"});
  const auto& op = std::get<GroupAggregateOp>(step.op);
  EXPECT_EQ(op.source, "valid");
  EXPECT_EQ(op.group_by, "region");
  ASSERT_EQ(op.aggregations.size(), 3u);
  EXPECT_EQ(op.aggregations[0].fn, AggregateFn::Sum);
  EXPECT_EQ(*op.aggregations[0].field, "amount");
  EXPECT_EQ(op.aggregations[0].alias, "total");
  EXPECT_EQ(op.aggregations[1].fn, AggregateFn::Count);
  EXPECT_FALSE(op.aggregations[1].field);
  EXPECT_EQ(op.aggregations[2].fn, AggregateFn::Sum);
  EXPECT_EQ(*op.aggregations[2].field, "price");
  EXPECT_EQ(step.dependencies, std::vector<std::string>{"valid"});
}

TEST(OperationsTest, GroupRequiresAggregations) {
  EXPECT_THROW(analyze("g", {"GROUP valid BY region"}), OperationSyntaxError);
  EXPECT_THROW(analyze("g", {"GROUP valid BY region", "SUM amount"}), OperationSyntaxError);
  EXPECT_THROW(analyze("g", {"GROUP valid BY region", "AGG amount"}), OperationSyntaxError);
}

TEST(OperationsTest, SortWithLimit) {
  auto step = analyze("s", {"SORT g BY total DESC", "TAKE 3"});
  const auto& op = std::get<SortOp>(step.op);
  EXPECT_EQ(op.field, "total");
  EXPECT_EQ(op.direction, SortDirection::Desc);
  ASSERT_TRUE(op.limit);
  EXPECT_EQ(*op.limit, 3u);

  auto asc = analyze("s", {"SORT g BY name"});
  EXPECT_EQ(std::get<SortOp>(asc.op).direction, SortDirection::Asc);
  EXPECT_FALSE(std::get<SortOp>(asc.op).limit);

  EXPECT_THROW(analyze("s", {"SORT g BY total", "TAKE 1", "TAKE 2"}), OperationSyntaxError);
}

TEST(OperationsTest, TakeWithoutFromUsesPreviousStep) {
  auto step = analyze("top", {"TAKE 5"}, "sorted");
  const auto& op = std::get<TakeOp>(step.op);
  EXPECT_EQ(op.source, "sorted");
  EXPECT_EQ(op.count, 5u);
  EXPECT_TRUE(op.implicit_source);
  EXPECT_EQ(step.dependencies, std::vector<std::string>{"sorted"});

  auto explicit_source = analyze("top", {"TAKE 2 FROM rows"}, "sorted");
  EXPECT_EQ(std::get<TakeOp>(explicit_source.op).source, "rows");
  EXPECT_FALSE(std::get<TakeOp>(explicit_source.op).implicit_source);

  EXPECT_THROW(analyze("top", {"TAKE 5"}), OperationSyntaxError);
  EXPECT_THROW(analyze("top", {"TAKE many FROM rows"}), OperationSyntaxError);
}

TEST(OperationsTest, RunAgentInfersPayloadDependencies) {
  auto step = analyze("ask", {"RUN AGENT \"analyst\" WITH { prompt: \"hi\", rows: ranked, first: load.rows[0] }"},
                      "ranked", {"load", "ranked", "ask"});
  const auto& op = std::get<RunAgentOp>(step.op);
  EXPECT_EQ(op.agent, "analyst");
  EXPECT_EQ(op.payload["prompt"], "hi");
  // object keys iterate sorted: first, prompt, rows
  EXPECT_EQ(step.dependencies, (std::vector<std::string>{"load", "ranked"}));

  auto bare = analyze("ask", {"RUN AGENT \"analyst\""});
  EXPECT_EQ(std::get<RunAgentOp>(bare.op).payload, json::object());
}

TEST(OperationsTest, WithClauseOnFollowingLines) {
  auto step = analyze("exec", {"APX_EXEC \"cluster.restart\"", "WITH {", "  node: \"a\",", "  force: true", "}"});
  const auto& op = std::get<ApxExecOp>(step.op);
  EXPECT_EQ(op.target, "cluster.restart");
  EXPECT_EQ(op.payload, (json{{"node", "a"}, {"force", true}}));
}

TEST(OperationsTest, WithIsRequiredWhereDeclared) {
  EXPECT_THROW(analyze("x", {"APX_EXEC \"t\""}), OperationSyntaxError);
  EXPECT_THROW(analyze("x", {"RUN VASM \"prog\""}), OperationSyntaxError);
  EXPECT_THROW(analyze("x", {"CALL FLOW \"sub.flow\""}), OperationSyntaxError);
  EXPECT_THROW(analyze("x", {"RUN VASM \"prog\" WITH [1, 2]"}), OperationSyntaxError);
  EXPECT_THROW(analyze("x", {"RUN AGENT \"a\" WITH { broken"}), OperationSyntaxError);
}

TEST(OperationsTest, PackageOperations) {
  auto build = analyze("pkg", {"BUILD_VPKG manifest.spec"}, "", {"manifest", "pkg"});
  EXPECT_EQ(std::get<BuildVpkgOp>(build.op).manifest_ref, "manifest.spec");
  EXPECT_EQ(build.dependencies, std::vector<std::string>{"manifest"});

  auto literal = analyze("pkg", {"BUILD_VPKG \"apps/web.yaml\""});
  EXPECT_EQ(std::get<BuildVpkgOp>(literal.op).manifest_ref, "apps/web.yaml");
  EXPECT_TRUE(literal.dependencies.empty());

  auto deploy = analyze("ship", {"DEPLOY_SERVICE pkg \"web\""});
  const auto& op = std::get<DeployServiceOp>(deploy.op);
  EXPECT_EQ(op.vpkg_ref, "pkg");
  EXPECT_EQ(op.service_name, "web");
  EXPECT_EQ(deploy.dependencies, std::vector<std::string>{"pkg"});
}

TEST(OperationsTest, CallFlowAndVasm) {
  auto call = analyze("sub", {"CALL FLOW \"flows/child.flow\" WITH { rows: load }"}, "", {"load", "sub"});
  EXPECT_EQ(std::get<CallFlowOp>(call.op).path, "flows/child.flow");
  EXPECT_EQ(call.dependencies, std::vector<std::string>{"load"});

  auto vasm = analyze("calc", {"RUN VASM \"fib.vasm\" WITH n = 10"});
  EXPECT_EQ(std::get<RunVasmOp>(vasm.op).program, "fib.vasm");
  EXPECT_EQ(std::get<RunVasmOp>(vasm.op).payload, (json{{"n", 10}}));
}

TEST(OperationsTest, OutputLabels) {
  auto labelled = analyze("out", {"OUTPUT valid AS \"r\""});
  EXPECT_EQ(std::get<OutputOp>(labelled.op).label, "r");
  EXPECT_EQ(labelled.dependencies, std::vector<std::string>{"valid"});

  auto defaulted = analyze("out", {"OUTPUT valid"});
  EXPECT_EQ(std::get<OutputOp>(defaulted.op).label, "out");

  auto text = analyze("msg", {"OUTPUT_TEXT { summary: ask.completion }"}, "", {"ask", "msg"});
  EXPECT_EQ(std::get<OutputTextOp>(text.op).value["summary"], "ask.completion");
  EXPECT_EQ(text.dependencies, std::vector<std::string>{"ask"});

  EXPECT_THROW(analyze("msg", {"OUTPUT_TEXT"}), OperationSyntaxError);
  EXPECT_THROW(analyze("out", {"OUTPUT valid AS r"}), OperationSyntaxError);
}

TEST(OperationsTest, UnknownOperation) {
  try {
    analyze("m", {"MAP rows WITH x"});
    FAIL() << "expected OperationSyntaxError";
  } catch (const OperationSyntaxError& e) {
    EXPECT_NE(std::string(e.what()).find("unsupported operation 'MAP'"), std::string::npos);
  }
  EXPECT_THROW(analyze("e", {}), OperationSyntaxError);
}

TEST(OperationsTest, DependenciesAreDeduplicated) {
  auto step = analyze("ask", {"RUN AGENT \"a\" WITH { x: load, y: load.total, z: [load] }"}, "", {"load", "ask"});
  EXPECT_EQ(step.dependencies, std::vector<std::string>{"load"});
}

TEST(OperationsTest, NamesAndJson) {
  auto step = analyze("valid", {"FILTER load WHERE amount > 0"});
  EXPECT_STREQ(operation_name(step.op), "FILTER");
  auto j = to_json(step.op);
  EXPECT_EQ(j["kind"], "FILTER");
  EXPECT_EQ(j["condition"]["operator"], ">");
  EXPECT_EQ(reference_head("sales.rows[0].amount"), "sales");
  EXPECT_EQ(reference_head("items[2]"), "items");
}
