#include <flowgrid/errors.hpp>
#include <flowgrid/payload.hpp>

#include <gtest/gtest.h>

using flowgrid::parse_payload;
using flowgrid::PayloadError;
using nlohmann::json;

TEST(PayloadTest, EmptyTextIsEmptyObject) {
  EXPECT_EQ(parse_payload(""), json::object());
  EXPECT_EQ(parse_payload("   \n\t"), json::object());
  EXPECT_EQ(parse_payload("// nothing here\n"), json::object());
}

TEST(PayloadTest, ObjectWithMixedValues) {
  auto value = parse_payload(R"({ name: "sales", 'quoted key': 'x', count: 3, ratio: 0.25,
                                 flags: [true, false, null], nested: { depth: -2 } })");
  ASSERT_TRUE(value.is_object());
  EXPECT_EQ(value["name"], "sales");
  EXPECT_EQ(value["quoted key"], "x");
  EXPECT_TRUE(value["count"].is_number_integer());
  EXPECT_EQ(value["count"].get<std::int64_t>(), 3);
  EXPECT_TRUE(value["ratio"].is_number_float());
  EXPECT_DOUBLE_EQ(value["ratio"].get<double>(), 0.25);
  EXPECT_EQ(value["flags"], json::array({true, false, nullptr}));
  EXPECT_EQ(value["nested"]["depth"].get<std::int64_t>(), -2);
}

TEST(PayloadTest, BareIdentifiersBecomeStrings) {
  auto value = parse_payload("{ rows: sales.rows[0], mode: fast-path }");
  EXPECT_EQ(value["rows"], "sales.rows[0]");
  EXPECT_EQ(value["mode"], "fast-path");
}

TEST(PayloadTest, TopLevelAssignmentList) {
  auto value = parse_payload("prompt = \"hello\", limit = 10,");
  EXPECT_EQ(value, (json{{"prompt", "hello"}, {"limit", 10}}));
}

TEST(PayloadTest, CommentsAndTrailingCommas) {
  auto value = parse_payload("{\n  a: 1, // first\n  b: [1, 2,],\n}");
  EXPECT_EQ(value["a"], 1);
  EXPECT_EQ(value["b"], json::array({1, 2}));
}

TEST(PayloadTest, StringEscapes) {
  auto value = parse_payload(R"("line\nnext\ttab \"quoted\" \\")");
  EXPECT_EQ(value, "line\nnext\ttab \"quoted\" \\");
}

TEST(PayloadTest, ScalarDocument) {
  EXPECT_EQ(parse_payload("42"), 42);
  EXPECT_EQ(parse_payload("'text'"), "text");
  EXPECT_EQ(parse_payload("[1, \"two\"]"), json::array({1, "two"}));
}

TEST(PayloadTest, UnterminatedLiteralsAreErrors) {
  EXPECT_THROW(parse_payload("{ a: 1"), PayloadError);
  EXPECT_THROW(parse_payload("[1, 2"), PayloadError);
  EXPECT_THROW(parse_payload("\"open"), PayloadError);
}

TEST(PayloadTest, SyntaxErrors) {
  EXPECT_THROW(parse_payload("{ a 1 }"), PayloadError);
  EXPECT_THROW(parse_payload("a = "), PayloadError);
  EXPECT_THROW(parse_payload("{ a: 1 } extra"), PayloadError);
  EXPECT_THROW(parse_payload("@"), PayloadError);
  EXPECT_THROW(parse_payload("{ 1: 2 }"), PayloadError);
}

TEST(PayloadTest, ErrorCarriesPosition) {
  try {
    parse_payload("{ a: 1");
    FAIL() << "expected PayloadError";
  } catch (const PayloadError& e) {
    EXPECT_EQ(e.position(), 0u);
    EXPECT_NE(std::string(e.what()).find("unterminated object"), std::string::npos);
  }
}

TEST(PayloadTest, Deterministic) {
  const char* text = "{ b: [1, {c: 'x'}], a: y.z }";
  EXPECT_EQ(parse_payload(text).dump(), parse_payload(text).dump());
}
