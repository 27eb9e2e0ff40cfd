#include <flowgrid/errors.hpp>
#include <flowgrid/table.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

using namespace flowgrid;
using nlohmann::json;

namespace {

const json kSales = json::array({
  {{"region", "north"}, {"amount", 120}, {"rep", "ann"}},
  {{"region", "south"}, {"amount", -5}, {"rep", "bo"}},
  {{"region", "north"}, {"amount", 30}, {"rep", "cy"}},
  {{"region", "east"}, {"amount", 0}, {"rep", "di"}},
  {{"region", "south"}, {"amount", 75}, {"rep", "ed"}},
});

Condition where(const std::string& field, CompareOp op, json value) {
  return Condition{field, op, std::move(value)};
}

}  // namespace

TEST(TableTest, ParseCsvInfersTypes) {
  auto rows = table::parse_csv("region, amount, note\nnorth, 10, \"big deal\"\nsouth, 2.5,\n\n");
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0]["region"], "north");
  EXPECT_TRUE(rows[0]["amount"].is_number_integer());
  EXPECT_EQ(rows[0]["note"], "big deal");
  EXPECT_DOUBLE_EQ(rows[1]["amount"].get<double>(), 2.5);
  EXPECT_TRUE(rows[1]["note"].is_null());

  EXPECT_EQ(table::parse_csv(""), json::array());
  EXPECT_EQ(table::parse_csv("only,header\n"), json::array());
}

TEST(TableTest, EnsureTable) {
  EXPECT_EQ(table::ensure_table(kSales, "sales"), kSales);
  EXPECT_EQ(table::ensure_table("a\n1\n", "csv").size(), 1u);
  EXPECT_THROW(table::ensure_table(42, "n"), FlowError);
  EXPECT_THROW(table::ensure_table(json::array({1, 2}), "n"), FlowError);
}

TEST(TableTest, FilterKeepsMatchingRowsInOrder) {
  auto positive = table::filter(kSales, where("amount", CompareOp::Gt, 0));
  ASSERT_EQ(positive.size(), 3u);
  EXPECT_EQ(positive[0]["rep"], "ann");
  EXPECT_EQ(positive[1]["rep"], "cy");
  EXPECT_EQ(positive[2]["rep"], "ed");

  EXPECT_EQ(table::filter(kSales, where("amount", CompareOp::Ge, 0)).size(), 4u);
  EXPECT_EQ(table::filter(kSales, where("amount", CompareOp::Lt, 0)).size(), 1u);
  EXPECT_EQ(table::filter(kSales, where("region", CompareOp::Eq, "north")).size(), 2u);
  EXPECT_EQ(table::filter(kSales, where("region", CompareOp::Ne, "north")).size(), 3u);
  EXPECT_TRUE(table::filter(kSales, where("missing", CompareOp::Gt, 0)).empty());
}

TEST(TableTest, FilterComparesNumbersLoosely) {
  auto rows = json::array({{{"v", "10"}}, {{"v", 10.0}}, {{"v", "ten"}}});
  EXPECT_EQ(table::filter(rows, where("v", CompareOp::Eq, 10)).size(), 1u);
  EXPECT_EQ(table::filter(rows, where("v", CompareOp::Ge, 10)).size(), 2u);
  EXPECT_EQ(table::filter(rows, where("v", CompareOp::Eq, "10")).size(), 1u);
}

TEST(TableTest, NestedFieldPaths) {
  auto row = json{{"meta", {{"region", "west"}}}};
  EXPECT_EQ(table::field_value(row, "meta.region"), "west");
  EXPECT_TRUE(table::field_value(row, "meta.zone").is_null());
  EXPECT_TRUE(table::field_value(row, "meta.region.x").is_null());
}

TEST(TableTest, GroupAggregateInFirstSeenOrder) {
  std::vector<Aggregation> aggs{
    Aggregation{std::string("amount"), "total", AggregateFn::Sum},
    Aggregation{std::nullopt, "orders", AggregateFn::Count},
  };
  auto groups = table::group_aggregate(kSales, "region", aggs);
  ASSERT_EQ(groups.size(), 3u);
  EXPECT_EQ(groups[0], (json{{"region", "north"}, {"total", 150}, {"orders", 2}}));
  EXPECT_EQ(groups[1], (json{{"region", "south"}, {"total", 70}, {"orders", 2}}));
  EXPECT_EQ(groups[2], (json{{"region", "east"}, {"total", 0}, {"orders", 1}}));
  EXPECT_TRUE(groups[0]["total"].is_number_integer());
}

TEST(TableTest, GroupSumsTurnRealWithFractions) {
  auto rows = json::array({{{"k", 1}, {"v", 1}}, {{"k", 1}, {"v", 0.5}}, {{"k", 1}, {"v", nullptr}}});
  auto groups = table::group_aggregate(rows, "k", {Aggregation{std::string("v"), "s", AggregateFn::Sum}});
  ASSERT_EQ(groups.size(), 1u);
  EXPECT_EQ(groups[0]["k"], 1);
  EXPECT_DOUBLE_EQ(groups[0]["s"].get<double>(), 1.5);

  auto bad = json::array({{{"k", 1}, {"v", "x"}}});
  EXPECT_THROW(table::group_aggregate(bad, "k", {Aggregation{std::string("v"), "s", AggregateFn::Sum}}),
               FlowError);
}

TEST(TableTest, GroupSumsLeavingInt64BecomeReal) {
  constexpr auto max = std::numeric_limits<std::int64_t>::max();
  auto rows = json::array({{{"k", "a"}, {"v", max}}, {{"k", "a"}, {"v", 1}},
                           {{"k", "b"}, {"v", std::numeric_limits<std::int64_t>::min()}}, {{"k", "b"}, {"v", -1}},
                           {{"k", "c"}, {"v", std::numeric_limits<std::uint64_t>::max()}},
                           {{"k", "d"}, {"v", max}}, {{"k", "d"}, {"v", -1}}});
  auto groups = table::group_aggregate(rows, "k", {Aggregation{std::string("v"), "t", AggregateFn::Sum}});
  ASSERT_EQ(groups.size(), 4u);

  EXPECT_TRUE(groups[0]["t"].is_number_float());
  EXPECT_DOUBLE_EQ(groups[0]["t"].get<double>(), 9223372036854775808.0);
  EXPECT_TRUE(groups[1]["t"].is_number_float());
  EXPECT_DOUBLE_EQ(groups[1]["t"].get<double>(), -9223372036854775809.0);
  EXPECT_TRUE(groups[2]["t"].is_number_float());
  EXPECT_DOUBLE_EQ(groups[2]["t"].get<double>(), 18446744073709551615.0);

  EXPECT_TRUE(groups[3]["t"].is_number_integer());
  EXPECT_EQ(groups[3]["t"].get<std::int64_t>(), max - 1);
}

TEST(TableTest, SortIsStable) {
  auto asc = table::sort(kSales, "region", SortDirection::Asc);
  ASSERT_EQ(asc.size(), 5u);
  EXPECT_EQ(asc[0]["rep"], "di");
  EXPECT_EQ(asc[1]["rep"], "ann");
  EXPECT_EQ(asc[2]["rep"], "cy");

  auto desc = table::sort(kSales, "amount", SortDirection::Desc, 2);
  ASSERT_EQ(desc.size(), 2u);
  EXPECT_EQ(desc[0]["amount"], 120);
  EXPECT_EQ(desc[1]["amount"], 75);

  auto ties = table::sort(kSales, "region", SortDirection::Desc);
  EXPECT_EQ(ties[0]["rep"], "bo");
  EXPECT_EQ(ties[1]["rep"], "ed");
}

TEST(TableTest, SortOnMixedColumnDoesNotDependOnInputOrder) {
  const json ten{{"v", 10}};
  const json text{{"v", "2x"}};
  const json three{{"v", 3}};
  const json none{{"id", "no-v"}};
  const auto expected = json::array({none, three, ten, text});

  for (const auto& rows : {json::array({ten, text, three, none}), json::array({text, none, three, ten}),
                           json::array({three, ten, none, text})}) {
    EXPECT_EQ(table::sort(rows, "v", SortDirection::Asc), expected) << rows.dump();
    EXPECT_EQ(table::sort(rows, "v", SortDirection::Desc), json::array({text, ten, three, none})) << rows.dump();
  }
}

TEST(TableTest, Take) {
  EXPECT_EQ(table::take(kSales, 2).size(), 2u);
  EXPECT_EQ(table::take(kSales, 10).size(), 5u);
  EXPECT_TRUE(table::take(kSales, 0).empty());
}

TEST(TableTest, ResolveReference) {
  json state{{"load", kSales}, {"ask", {{"completion", "ok"}}}};
  json inputs{{"threshold", 5}, {"sales.csv", "a\n1\n"}};

  EXPECT_EQ(*resolve_reference("ask.completion", state, inputs), "ok");
  EXPECT_EQ(*resolve_reference("load[1].rep", state, inputs), "bo");
  EXPECT_EQ(*resolve_reference("threshold", state, inputs), 5);
  EXPECT_EQ(*resolve_reference("sales.csv", state, inputs), "a\n1\n");
  EXPECT_FALSE(resolve_reference("load[9]", state, inputs));
  EXPECT_FALSE(resolve_reference("nothing", state, inputs));
  EXPECT_FALSE(resolve_reference("ask.missing", state, inputs));
}

TEST(TableTest, ResolveLiteral) {
  json state{{"ask", {{"completion", "ok"}}}};
  json value{{"text", "ask.completion"}, {"fixed", "plain words"}, {"list", {"ask", 3}}};
  auto resolved = resolve_literal(value, state, json::object());
  EXPECT_EQ(resolved["text"], "ok");
  EXPECT_EQ(resolved["fixed"], "plain words");
  EXPECT_EQ(resolved["list"][0], (json{{"completion", "ok"}}));
  EXPECT_EQ(resolved["list"][1], 3);
}

TEST(TableTest, ResolveDataset) {
  json state{{"load", kSales}};
  json inputs{{"sales", "region,amount\nnorth,1\n"}};
  EXPECT_EQ(resolve_dataset("load", state, inputs).size(), 5u);
  EXPECT_EQ(resolve_dataset("sales", state, inputs)[0]["amount"], 1);
  EXPECT_THROW(resolve_dataset("ghost", state, inputs), FlowError);

  json nested{{"fetch", {{"rows", json::array({{{"x", 1}}, {{"x", 2}}})}}}};
  EXPECT_EQ(resolve_dataset("fetch.rows", nested, json::object()).size(), 2u);
  EXPECT_THROW(resolve_dataset("fetch.missing", nested, json::object()), FlowError);
}
