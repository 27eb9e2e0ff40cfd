#include <flowgrid/errors.hpp>
#include <flowgrid/parser.hpp>
#include <flowgrid/plan.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <sstream>
#include <string>

using namespace flowgrid;

namespace {

PlanGraph plan_of(const std::string& source) {
  return build_plan(parse_flow_strict(source));
}

constexpr const char* kFilterFlow =
    "FLOW \"t\"\n"
    "INPUTS\n"
    "  table sales\n"
    "END INPUTS\n"
    "STEP load =\n"
    "  LOAD CSV FROM sales\n"
    "STEP valid =\n"
    "  FILTER load WHERE amount > 0\n"
    "STEP out =\n"
    "  OUTPUT valid AS \"r\"\n"
    "END FLOW\n";

}  // namespace

TEST(PlanTest, LinearFlowHasOneEdgePerDependency) {
  auto graph = plan_of(kFilterFlow);
  EXPECT_EQ(graph.name, "t");
  ASSERT_EQ(graph.nodes.size(), 3u);
  ASSERT_EQ(graph.edges.size(), 2u);
  EXPECT_EQ(graph.edges[0], (PlanEdge{"step:load", "step:valid", "load"}));
  EXPECT_EQ(graph.edges[1], (PlanEdge{"step:valid", "step:out", "valid"}));

  const auto* load = graph.node_for_step("load");
  ASSERT_NE(load, nullptr);
  EXPECT_EQ(load->kind, NodeKind::DataOp);
  EXPECT_EQ(load->meta.op, "LOAD_CSV@1.0");
  EXPECT_EQ(load->meta.start_line, 5u);
  EXPECT_TRUE(load->inputs.empty());
  EXPECT_EQ(load->outputs, std::vector<std::string>{"step:valid"});
  EXPECT_EQ(graph.find("step:out")->inputs, std::vector<std::string>{"step:valid"});
}

TEST(PlanTest, NodeKinds) {
  auto graph = plan_of(
      "FLOW \"k\"\n"
      "STEP ask =\n  RUN AGENT \"a\"\n"
      "STEP calc =\n  RUN VASM \"p.vasm\" WITH { n: 1 }\n"
      "STEP pkg =\n  BUILD_VPKG \"m.yaml\"\n"
      "STEP ship =\n  DEPLOY_SERVICE pkg \"web\"\n"
      "END FLOW\n");
  EXPECT_EQ(graph.node_for_step("ask")->kind, NodeKind::JobOp);
  EXPECT_EQ(graph.node_for_step("calc")->kind, NodeKind::BytecodeOp);
  EXPECT_EQ(graph.node_for_step("pkg")->kind, NodeKind::JobOp);
  EXPECT_EQ(graph.node_for_step("ship")->kind, NodeKind::JobOp);
  ASSERT_EQ(graph.edges.size(), 1u);
  EXPECT_EQ(graph.edges[0].via, "pkg");
}

TEST(PlanTest, DeclaredInputsAreExternal) {
  auto graph = plan_of(kFilterFlow);
  const auto* load = graph.node_for_step("load");
  EXPECT_TRUE(load->external_inputs.empty());

  auto direct = plan_of(
      "FLOW \"d\"\nINPUTS\n  table rows\nEND INPUTS\nSTEP top =\n  TAKE 2 FROM rows\nEND FLOW\n");
  const auto* top = direct.node_for_step("top");
  EXPECT_EQ(top->external_inputs, std::vector<std::string>{"rows"});
  EXPECT_TRUE(top->inputs.empty());
  EXPECT_TRUE(direct.edges.empty());
}

TEST(PlanTest, UnknownDependencyIsGraphError) {
  try {
    plan_of("FLOW \"u\"\nSTEP a =\n  TAKE 1 FROM ghost\nEND FLOW\n");
    FAIL() << "expected GraphError";
  } catch (const GraphError& e) {
    EXPECT_NE(std::string(e.what()).find("unknown step 'ghost'"), std::string::npos);
    EXPECT_EQ(e.nodes(), (std::vector<std::string>{"a", "ghost"}));
  }
}

TEST(PlanTest, CycleIsGraphError) {
  try {
    plan_of("FLOW \"c\"\nSTEP a =\n  TAKE 1 FROM b\nSTEP b =\n  TAKE 1 FROM a\nEND FLOW\n");
    FAIL() << "expected GraphError";
  } catch (const GraphError& e) {
    EXPECT_NE(std::string(e.what()).find("cycle detected"), std::string::npos);
    EXPECT_NE(std::find(e.nodes().begin(), e.nodes().end(), "a"), e.nodes().end());
    EXPECT_NE(std::find(e.nodes().begin(), e.nodes().end(), "b"), e.nodes().end());
  }
  EXPECT_THROW(plan_of("FLOW \"s\"\nSTEP a =\n  TAKE 1 FROM a\nEND FLOW\n"), GraphError);
}

TEST(PlanTest, DuplicateStepIsGraphError) {
  EXPECT_THROW(plan_of("FLOW \"d\"\nSTEP a =\n  LOAD TABLE t\nSTEP a =\n  LOAD TABLE u\nEND FLOW\n"),
               GraphError);
}

TEST(PlanTest, InvalidStepBodyPropagates) {
  EXPECT_THROW(plan_of("FLOW \"x\"\nSTEP a =\n  FILTER b\nEND FLOW\n"), OperationSyntaxError);
}

TEST(PlanTest, ImplicitTakeSourceCarriesWarning) {
  auto graph = plan_of(
      "FLOW \"w\"\nSTEP s =\n  SORT t BY x\nSTEP t =\n  LOAD TABLE rows\nSTEP top =\n  TAKE 1\nEND FLOW\n");
  const auto* top = graph.node_for_step("top");
  ASSERT_EQ(top->meta.warnings.size(), 1u);
  EXPECT_NE(top->meta.warnings[0].find("preceding step 't'"), std::string::npos);
  EXPECT_EQ(top->inputs, std::vector<std::string>{"step:t"});
}

TEST(PlanTest, TopologicalOrderRespectsEdges) {
  auto graph = plan_of(
      "FLOW \"o\"\n"
      "STEP report =\n  OUTPUT merged AS \"r\"\n"
      "STEP merged =\n  RUN AGENT \"m\" WITH { a: left, b: right }\n"
      "STEP left =\n  LOAD TABLE l\n"
      "STEP right =\n  LOAD TABLE r\n"
      "END FLOW\n");
  auto order = graph.topological_order();
  ASSERT_EQ(order.size(), graph.nodes.size());
  auto position = [&](const std::string& id) {
    return std::find(order.begin(), order.end(), id) - order.begin();
  };
  for (const auto& edge : graph.edges) {
    EXPECT_LT(position(edge.from), position(edge.to)) << edge.from << " -> " << edge.to;
  }
  EXPECT_EQ(order.front(), "step:left");
  EXPECT_EQ(order.back(), "step:report");
}

TEST(PlanTest, EveryEdgeMatchesADependency) {
  auto graph = plan_of(kFilterFlow);
  for (const auto& edge : graph.edges) {
    const auto* from = graph.find(edge.from);
    const auto* to = graph.find(edge.to);
    ASSERT_NE(from, nullptr);
    ASSERT_NE(to, nullptr);
    EXPECT_EQ(from->meta.step_name, edge.via);
    EXPECT_NE(std::find(to->inputs.begin(), to->inputs.end(), edge.from), to->inputs.end());
  }
}

TEST(PlanTest, JsonAndDot) {
  auto graph = plan_of(kFilterFlow);
  auto j = to_json(graph);
  EXPECT_EQ(j["name"], "t");
  ASSERT_EQ(j["nodes"].size(), 3u);
  EXPECT_EQ(j["nodes"][1]["config"]["kind"], "FILTER");
  EXPECT_EQ(j["nodes"][1]["op"], "FILTER@1.0");
  EXPECT_EQ(j["edges"][0]["via"], "load");

  std::ostringstream dot;
  graph.dump(dot);
  EXPECT_NE(dot.str().find("\"step:load\" -> \"step:valid\""), std::string::npos);
}

TEST(PlanTest, BuildingIsDeterministic) {
  auto first = to_json(plan_of(kFilterFlow));
  auto second = to_json(plan_of(kFilterFlow));
  EXPECT_EQ(first, second);
}
