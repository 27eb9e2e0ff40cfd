// Implementation file for operations.hpp

#include <flowgrid/operations.hpp>
#include <flowgrid/errors.hpp>
#include <flowgrid/parser.hpp>
#include <flowgrid/payload.hpp>
#include <flowgrid/text.hpp>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <type_traits>
#include <utility>

namespace flowgrid {

namespace {

bool is_word_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_path_char(char c) {
  return is_word_char(c) || c == '.';
}

// ============================================================================
// Line cursor used by the per-operation micro-grammars
// ============================================================================

class StepCursor {
 public:
  StepCursor(const Step& step, std::string_view line) : step_(step), rest_(text::trim(line)) {}

  [[noreturn]] void fail(const std::string& message) const {
    throw OperationSyntaxError(step_.name, message);
  }

  bool empty() const { return rest_.empty(); }
  std::string_view rest() const { return rest_; }

  void keyword(std::string_view kw) {
    std::string_view after;
    if (!text::match_keyword(rest_, kw, &after)) {
      fail("expected " + std::string(kw) + " in '" + std::string(rest_) + "'");
    }
    rest_ = after;
  }

  bool try_keyword(std::string_view kw) {
    std::string_view after;
    if (!text::match_keyword(rest_, kw, &after)) {
      return false;
    }
    rest_ = after;
    return true;
  }

  std::string word(const char* what) {
    return take_while(is_word_char, what);
  }

  std::string path(const char* what) {
    return take_while(is_path_char, what);
  }

  std::size_t count(const char* what) {
    std::string digits = take_while([](char c) { return c >= '0' && c <= '9'; }, what);
    std::size_t value = 0;
    auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc() || end != digits.data() + digits.size()) {
      fail(std::string("invalid ") + what + " '" + digits + "'");
    }
    return value;
  }

  std::string quoted(const char* what) {
    if (rest_.empty() || rest_.front() != '"') {
      fail(std::string("expected quoted ") + what);
    }
    std::size_t close = rest_.find('"', 1);
    if (close == std::string_view::npos) {
      fail(std::string("unterminated quoted ") + what);
    }
    std::string value(rest_.substr(1, close - 1));
    if (value.empty()) {
      fail(std::string("empty ") + what);
    }
    rest_ = text::trim(rest_.substr(close + 1));
    return value;
  }

  void done() const {
    if (!rest_.empty()) {
      fail("unexpected trailing text '" + std::string(rest_) + "'");
    }
  }

 private:
  template <typename Pred>
  std::string take_while(Pred pred, const char* what) {
    std::size_t n = 0;
    while (n < rest_.size() && pred(rest_[n])) ++n;
    if (n == 0) {
      fail(std::string("expected ") + what);
    }
    std::string value(rest_.substr(0, n));
    rest_ = text::trim(rest_.substr(n));
    return value;
  }

  const Step& step_;
  std::string_view rest_;
};

// Number if the whole text is numeric, else the text itself
nlohmann::json literal_value(std::string_view raw) {
  if (raw.size() >= 2 && (raw.front() == '"' || raw.front() == '\'') && raw.back() == raw.front()) {
    return std::string(raw.substr(1, raw.size() - 2));
  }
  if (!raw.empty() && (std::isdigit(static_cast<unsigned char>(raw.front())) || raw.front() == '-' || raw.front() == '.')) {
    std::int64_t integer = 0;
    auto [end, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), integer);
    if (ec == std::errc() && end == raw.data() + raw.size()) {
      return integer;
    }
    std::string copy(raw);
    char* stop = nullptr;
    double real = std::strtod(copy.c_str(), &stop);
    if (stop == copy.c_str() + copy.size()) {
      return real;
    }
  }
  return std::string(raw);
}

Condition parse_condition(StepCursor& cursor) {
  Condition condition;
  condition.field = cursor.path("condition field");
  std::string_view rest = cursor.rest();
  static constexpr std::pair<std::string_view, CompareOp> kOps[] = {
    {"==", CompareOp::Eq}, {"!=", CompareOp::Ne}, {">=", CompareOp::Ge},
    {"<=", CompareOp::Le}, {">", CompareOp::Gt}, {"<", CompareOp::Lt},
  };
  for (const auto& [symbol, op] : kOps) {
    if (rest.substr(0, symbol.size()) == symbol) {
      auto value = text::trim(rest.substr(symbol.size()));
      if (value.empty()) {
        cursor.fail("condition is missing a value");
      }
      condition.op = op;
      condition.value = literal_value(value);
      return condition;
    }
  }
  cursor.fail("unsupported condition operator in '" + std::string(rest) + "'");
}

Aggregation parse_aggregation(const Step& step, std::string_view line) {
  std::string_view rest;
  text::match_keyword(line, "AGG", &rest);
  auto parts = text::split_ws(rest);
  std::size_t as = parts.size();
  for (std::size_t i = 1; i < parts.size(); ++i) {
    if (text::iequals(parts[i], "AS")) {
      as = i;
      break;
    }
  }
  if (as == parts.size() || as + 2 != parts.size() ||
      !std::all_of(parts[as + 1].begin(), parts[as + 1].end(), is_word_char)) {
    throw OperationSyntaxError(step.name, "invalid AGG line '" + std::string(text::trim(line)) + "'");
  }
  std::string expr;
  for (std::size_t i = 0; i < as; ++i) {
    expr += parts[i];
  }
  Aggregation agg;
  agg.alias = parts[as + 1];
  std::string lowered = text::to_lower(expr);
  if (lowered.rfind("count(", 0) == 0 && lowered.back() == ')') {
    agg.fn = AggregateFn::Count;
    return agg;
  }
  agg.fn = AggregateFn::Sum;
  if (lowered.rfind("sum(", 0) == 0 && lowered.back() == ')') {
    expr = expr.substr(4, expr.size() - 5);
  }
  if (expr.empty() || !std::all_of(expr.begin(), expr.end(), is_path_char)) {
    throw OperationSyntaxError(step.name, "invalid AGG field '" + expr + "'");
  }
  agg.field = expr;
  return agg;
}

// Collect the payload text of a `WITH` clause, inline or on following lines
std::optional<std::string> with_clause(const Step& step, StepCursor& head, bool required) {
  std::optional<std::string> payload;
  if (!head.empty()) {
    if (!head.try_keyword("WITH")) {
      head.done();
    }
    payload = std::string(head.rest());
  }
  for (std::size_t i = 1; i < step.body_lines.size(); ++i) {
    const auto& line = step.body_lines[i];
    if (!payload) {
      std::string_view after;
      if (!text::match_keyword(line, "WITH", &after)) {
        throw OperationSyntaxError(step.name, "expected WITH, found '" + std::string(text::trim(line)) + "'");
      }
      payload = std::string(after);
      continue;
    }
    *payload += '\n';
    *payload += line;
  }
  if (!payload && required) {
    throw OperationSyntaxError(step.name, "missing WITH payload");
  }
  return payload;
}

nlohmann::json parse_with(const Step& step, const std::optional<std::string>& raw, bool require_object) {
  if (!raw) {
    return nlohmann::json::object();
  }
  nlohmann::json value;
  try {
    value = parse_payload(*raw);
  } catch (const PayloadError& e) {
    throw OperationSyntaxError(step.name, std::string("invalid payload: ") + e.what());
  }
  if (require_object && !value.is_object()) {
    throw OperationSyntaxError(step.name, "payload must be an object literal");
  }
  return value;
}

void only_line(const Step& step) {
  if (step.body_lines.size() > 1) {
    throw OperationSyntaxError(step.name, "unexpected line '" + std::string(text::trim(step.body_lines[1])) + "'");
  }
}

void collect_references(const nlohmann::json& value, const std::vector<std::string>& step_names,
                        const std::string& self, std::vector<std::string>& deps) {
  if (value.is_string()) {
    auto head = reference_head(value.get<std::string>());
    if (head != self && std::find(step_names.begin(), step_names.end(), head) != step_names.end()) {
      deps.push_back(head);
    }
  } else if (value.is_object() || value.is_array()) {
    for (const auto& item : value) {
      collect_references(item, step_names, self, deps);
    }
  }
}

std::vector<std::string> unique(std::vector<std::string> names) {
  std::vector<std::string> out;
  for (auto& name : names) {
    if (std::find(out.begin(), out.end(), name) == out.end()) {
      out.push_back(std::move(name));
    }
  }
  return out;
}

}  // namespace

std::string reference_head(std::string_view reference) {
  auto trimmed = text::trim(reference);
  std::size_t end = trimmed.find_first_of(".[");
  return std::string(trimmed.substr(0, end));
}

// ============================================================================
// analyze_step
// ============================================================================

AnalyzedStep analyze_step(const Step& step, const AnalyzeContext& context) {
  if (step.body_lines.empty()) {
    throw OperationSyntaxError(step.name, "empty step body");
  }
  const std::string& first = step.body_lines.front();
  OpKeyword keyword = infer_keyword(first);
  StepCursor cursor(step, first);
  std::vector<std::string> deps;

  auto finish = [&](Operation op) {
    return AnalyzedStep{std::move(op), unique(std::move(deps))};
  };

  switch (keyword) {
    case OpKeyword::LoadTable: {
      cursor.keyword("LOAD TABLE");
      std::string table = cursor.rest().substr(0, 1) == "\"" ? cursor.quoted("table name") : cursor.word("table name");
      cursor.done();
      only_line(step);
      return finish(LoadTableOp{table});
    }
    case OpKeyword::LoadCsv: {
      cursor.keyword("LOAD CSV");
      cursor.keyword("FROM");
      std::string source = cursor.word("CSV input name");
      cursor.done();
      only_line(step);
      return finish(LoadCsvOp{source});
    }
    case OpKeyword::Filter: {
      cursor.keyword("FILTER");
      FilterOp op;
      op.source = cursor.word("FILTER source");
      cursor.keyword("WHERE");
      op.condition = parse_condition(cursor);
      only_line(step);
      deps.push_back(op.source);
      return finish(std::move(op));
    }
    case OpKeyword::GroupAggregate: {
      cursor.keyword("GROUP");
      GroupAggregateOp op;
      op.source = cursor.word("GROUP source");
      cursor.keyword("BY");
      op.group_by = cursor.path("GROUP key");
      cursor.done();
      for (std::size_t i = 1; i < step.body_lines.size(); ++i) {
        const auto& line = step.body_lines[i];
        if (!text::match_keyword(line, "AGG")) {
          cursor.fail("expected AGG, found '" + std::string(text::trim(line)) + "'");
        }
        op.aggregations.push_back(parse_aggregation(step, line));
      }
      if (op.aggregations.empty()) {
        cursor.fail("GROUP requires at least one AGG line");
      }
      deps.push_back(op.source);
      return finish(std::move(op));
    }
    case OpKeyword::Sort: {
      cursor.keyword("SORT");
      SortOp op;
      op.source = cursor.word("SORT source");
      cursor.keyword("BY");
      op.field = cursor.path("SORT field");
      if (cursor.try_keyword("DESC")) {
        op.direction = SortDirection::Desc;
      } else {
        cursor.try_keyword("ASC");
      }
      cursor.done();
      for (std::size_t i = 1; i < step.body_lines.size(); ++i) {
        StepCursor limit(step, step.body_lines[i]);
        if (op.limit || !limit.try_keyword("TAKE")) {
          limit.fail("unexpected line '" + std::string(text::trim(step.body_lines[i])) + "'");
        }
        op.limit = limit.count("TAKE count");
        limit.done();
      }
      deps.push_back(op.source);
      return finish(std::move(op));
    }
    case OpKeyword::Take: {
      cursor.keyword("TAKE");
      TakeOp op;
      op.count = cursor.count("TAKE count");
      if (cursor.try_keyword("FROM")) {
        op.source = cursor.word("TAKE source");
      } else {
        if (context.previous_step.empty()) {
          cursor.fail("TAKE without FROM has no preceding step");
        }
        op.source = context.previous_step;
        op.implicit_source = true;
      }
      cursor.done();
      only_line(step);
      deps.push_back(op.source);
      return finish(std::move(op));
    }
    case OpKeyword::RunAgent: {
      cursor.keyword("RUN AGENT");
      RunAgentOp op;
      op.agent = cursor.quoted("agent name");
      op.payload = parse_with(step, with_clause(step, cursor, false), true);
      collect_references(op.payload, context.step_names, step.name, deps);
      return finish(std::move(op));
    }
    case OpKeyword::ApxExec: {
      cursor.keyword("APX_EXEC");
      ApxExecOp op;
      op.target = cursor.quoted("APX target");
      op.payload = parse_with(step, with_clause(step, cursor, true), false);
      collect_references(op.payload, context.step_names, step.name, deps);
      return finish(std::move(op));
    }
    case OpKeyword::BuildVpkg: {
      cursor.keyword("BUILD_VPKG");
      BuildVpkgOp op;
      if (cursor.rest().substr(0, 1) == "\"") {
        op.manifest_ref = cursor.quoted("manifest reference");
      } else {
        op.manifest_ref = cursor.path("manifest reference");
        deps.push_back(reference_head(op.manifest_ref));
      }
      cursor.done();
      only_line(step);
      return finish(std::move(op));
    }
    case OpKeyword::DeployService: {
      cursor.keyword("DEPLOY_SERVICE");
      DeployServiceOp op;
      op.vpkg_ref = cursor.path("package reference");
      deps.push_back(reference_head(op.vpkg_ref));
      op.service_name = cursor.quoted("service name");
      cursor.done();
      only_line(step);
      return finish(std::move(op));
    }
    case OpKeyword::RunVasm: {
      cursor.keyword("RUN VASM");
      RunVasmOp op;
      op.program = cursor.quoted("program");
      op.payload = parse_with(step, with_clause(step, cursor, true), true);
      collect_references(op.payload, context.step_names, step.name, deps);
      return finish(std::move(op));
    }
    case OpKeyword::CallFlow: {
      cursor.keyword("CALL FLOW");
      CallFlowOp op;
      op.path = cursor.quoted("flow path");
      op.payload = parse_with(step, with_clause(step, cursor, true), true);
      collect_references(op.payload, context.step_names, step.name, deps);
      return finish(std::move(op));
    }
    case OpKeyword::Output: {
      cursor.keyword("OUTPUT");
      OutputOp op;
      op.source = cursor.word("OUTPUT source");
      op.label = step.name;
      if (cursor.try_keyword("AS")) {
        op.label = cursor.quoted("output label");
      }
      cursor.done();
      only_line(step);
      deps.push_back(op.source);
      return finish(std::move(op));
    }
    case OpKeyword::OutputText: {
      cursor.keyword("OUTPUT_TEXT");
      std::string raw(cursor.rest());
      for (std::size_t i = 1; i < step.body_lines.size(); ++i) {
        raw += '\n';
        raw += step.body_lines[i];
      }
      if (text::trim(raw).empty()) {
        cursor.fail("OUTPUT_TEXT requires a value");
      }
      OutputTextOp op;
      try {
        op.value = parse_payload(raw);
      } catch (const PayloadError& e) {
        cursor.fail(std::string("invalid OUTPUT_TEXT value: ") + e.what());
      }
      collect_references(op.value, context.step_names, step.name, deps);
      return finish(std::move(op));
    }
    case OpKeyword::Unknown:
      break;
  }
  auto words = text::split_ws(first);
  cursor.fail("unsupported operation '" + (words.empty() ? std::string() : words.front()) + "'");
}

// ============================================================================
// Names and JSON views
// ============================================================================

namespace {

template <typename T>
constexpr const char* name_of() {
  if constexpr (std::is_same_v<T, LoadTableOp>) return "LOAD_TABLE";
  else if constexpr (std::is_same_v<T, LoadCsvOp>) return "LOAD_CSV";
  else if constexpr (std::is_same_v<T, FilterOp>) return "FILTER";
  else if constexpr (std::is_same_v<T, GroupAggregateOp>) return "GROUP_AGG";
  else if constexpr (std::is_same_v<T, SortOp>) return "SORT";
  else if constexpr (std::is_same_v<T, TakeOp>) return "TAKE";
  else if constexpr (std::is_same_v<T, RunAgentOp>) return "RUN_AGENT";
  else if constexpr (std::is_same_v<T, ApxExecOp>) return "APX_EXEC";
  else if constexpr (std::is_same_v<T, BuildVpkgOp>) return "BUILD_VPKG";
  else if constexpr (std::is_same_v<T, DeployServiceOp>) return "DEPLOY_SERVICE";
  else if constexpr (std::is_same_v<T, RunVasmOp>) return "RUN_VASM";
  else if constexpr (std::is_same_v<T, CallFlowOp>) return "CALL_FLOW";
  else if constexpr (std::is_same_v<T, OutputOp>) return "OUTPUT";
  else return "OUTPUT_TEXT";
}

}  // namespace

const char* operation_name(const Operation& op) {
  return std::visit([](const auto& v) { return name_of<std::decay_t<decltype(v)>>(); }, op);
}

const char* to_string(CompareOp op) {
  switch (op) {
    case CompareOp::Gt: return ">";
    case CompareOp::Ge: return ">=";
    case CompareOp::Lt: return "<";
    case CompareOp::Le: return "<=";
    case CompareOp::Eq: return "==";
    case CompareOp::Ne: return "!=";
  }
  return "==";
}

const char* to_string(AggregateFn fn) {
  return fn == AggregateFn::Count ? "count" : "sum";
}

const char* to_string(SortDirection direction) {
  return direction == SortDirection::Desc ? "DESC" : "ASC";
}

nlohmann::json to_json(const Operation& op) {
  return std::visit([](const auto& v) -> nlohmann::json {
    using T = std::decay_t<decltype(v)>;
    nlohmann::json j{{"kind", name_of<T>()}};
    if constexpr (std::is_same_v<T, LoadTableOp>) {
      j["table"] = v.table;
    } else if constexpr (std::is_same_v<T, LoadCsvOp>) {
      j["source"] = v.source;
    } else if constexpr (std::is_same_v<T, FilterOp>) {
      j["source"] = v.source;
      j["condition"] = {{"field", v.condition.field}, {"operator", to_string(v.condition.op)},
                        {"value", v.condition.value}};
    } else if constexpr (std::is_same_v<T, GroupAggregateOp>) {
      j["source"] = v.source;
      j["groupBy"] = v.group_by;
      auto aggs = nlohmann::json::array();
      for (const auto& agg : v.aggregations) {
        aggs.push_back({{"field", agg.field ? nlohmann::json(*agg.field) : nlohmann::json(nullptr)},
                        {"alias", agg.alias}, {"fn", to_string(agg.fn)}});
      }
      j["aggregations"] = aggs;
    } else if constexpr (std::is_same_v<T, SortOp>) {
      j["source"] = v.source;
      j["field"] = v.field;
      j["direction"] = to_string(v.direction);
      if (v.limit) j["limit"] = *v.limit;
    } else if constexpr (std::is_same_v<T, TakeOp>) {
      j["source"] = v.source;
      j["count"] = v.count;
    } else if constexpr (std::is_same_v<T, RunAgentOp>) {
      j["agent"] = v.agent;
      j["payload"] = v.payload;
    } else if constexpr (std::is_same_v<T, ApxExecOp>) {
      j["target"] = v.target;
      j["payload"] = v.payload;
    } else if constexpr (std::is_same_v<T, BuildVpkgOp>) {
      j["manifestRef"] = v.manifest_ref;
    } else if constexpr (std::is_same_v<T, DeployServiceOp>) {
      j["vpkgRef"] = v.vpkg_ref;
      j["service"] = v.service_name;
    } else if constexpr (std::is_same_v<T, RunVasmOp>) {
      j["program"] = v.program;
      j["payload"] = v.payload;
    } else if constexpr (std::is_same_v<T, CallFlowOp>) {
      j["path"] = v.path;
      j["payload"] = v.payload;
    } else if constexpr (std::is_same_v<T, OutputOp>) {
      j["source"] = v.source;
      j["label"] = v.label;
    } else {
      j["value"] = v.value;
    }
    return j;
  }, op);
}

}  // namespace flowgrid
