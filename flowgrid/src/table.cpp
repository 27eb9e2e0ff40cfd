// Implementation file for table.hpp

#include <flowgrid/table.hpp>
#include <flowgrid/errors.hpp>
#include <flowgrid/text.hpp>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <unordered_map>
#include <variant>

namespace flowgrid {

namespace {

std::optional<nlohmann::json> parse_number(std::string_view token) {
  if (token.empty()) return std::nullopt;
  char first = token.front();
  if (!(std::isdigit(static_cast<unsigned char>(first)) || first == '-' || first == '+' || first == '.')) {
    return std::nullopt;
  }
  std::int64_t integer = 0;
  auto [end, ec] = std::from_chars(token.data(), token.data() + token.size(), integer);
  if (ec == std::errc() && end == token.data() + token.size()) {
    return nlohmann::json(integer);
  }
  std::string copy(token);
  char* stop = nullptr;
  double real = std::strtod(copy.c_str(), &stop);
  if (stop == copy.c_str() + copy.size()) {
    return nlohmann::json(real);
  }
  return std::nullopt;
}

std::optional<double> as_number(const nlohmann::json& value) {
  if (value.is_number()) return value.get<double>();
  if (value.is_boolean()) return value.get<bool>() ? 1.0 : 0.0;
  if (value.is_string()) {
    if (auto n = parse_number(text::trim(value.get<std::string>()))) {
      return n->get<double>();
    }
  }
  return std::nullopt;
}

std::string display(const nlohmann::json& value) {
  if (value.is_string()) return value.get<std::string>();
  if (value.is_null()) return "";
  return value.dump();
}

bool loosely_equal(const nlohmann::json& left, const nlohmann::json& right) {
  if (left.is_number() && right.is_number()) {
    if (left.is_number_integer() && right.is_number_integer()) {
      return left.get<std::int64_t>() == right.get<std::int64_t>();
    }
    return left.get<double>() == right.get<double>();
  }
  if (left.is_number() || right.is_number() || left.is_boolean() || right.is_boolean() ||
      left.is_null() || right.is_null()) {
    return left == right;
  }
  return display(left) == display(right);
}

// Mixed-type columns sort as null, then numbers, then everything else by text
enum class SortRank { Null, Number, Text };

SortRank sort_rank(const nlohmann::json& value) {
  if (value.is_null()) return SortRank::Null;
  if (value.is_number()) return SortRank::Number;
  return SortRank::Text;
}

// Adds an integer JSON value to `sum`; false when the result leaves the int64 range
bool add_checked(std::int64_t& sum, const nlohmann::json& value) {
  constexpr auto max = std::numeric_limits<std::int64_t>::max();
  constexpr auto min = std::numeric_limits<std::int64_t>::min();
  if (value.is_number_unsigned() && value.get<std::uint64_t>() > static_cast<std::uint64_t>(max)) {
    return false;
  }
  auto addend = value.get<std::int64_t>();
  if ((addend > 0 && sum > max - addend) || (addend < 0 && sum < min - addend)) {
    return false;
  }
  sum += addend;
  return true;
}

using Segment = std::variant<std::string, std::size_t>;

std::vector<Segment> reference_segments(std::string_view token) {
  std::vector<Segment> segments;
  std::string buffer;
  for (std::size_t i = 0; i < token.size(); ++i) {
    char c = token[i];
    if (c == '.') {
      if (!buffer.empty()) segments.emplace_back(std::move(buffer));
      buffer.clear();
      continue;
    }
    if (c == '[') {
      if (!buffer.empty()) segments.emplace_back(std::move(buffer));
      buffer.clear();
      std::size_t close = token.find(']', i);
      if (close == std::string_view::npos) close = token.size();
      auto inner = token.substr(i + 1, close - i - 1);
      std::size_t index = 0;
      auto [end, ec] = std::from_chars(inner.data(), inner.data() + inner.size(), index);
      if (!inner.empty() && ec == std::errc() && end == inner.data() + inner.size()) {
        segments.emplace_back(index);
      } else if (!inner.empty()) {
        segments.emplace_back(std::string(inner));
      }
      i = close;
      continue;
    }
    buffer += c;
  }
  if (!buffer.empty()) segments.emplace_back(std::move(buffer));
  return segments;
}

}  // namespace

namespace table {

// ============================================================================
// Loading
// ============================================================================

nlohmann::json parse_csv(std::string_view csv) {
  std::vector<std::string_view> lines;
  std::size_t start = 0;
  while (start <= csv.size()) {
    std::size_t nl = csv.find('\n', start);
    auto line = text::trim(csv.substr(start, nl == std::string_view::npos ? std::string_view::npos : nl - start));
    if (!line.empty()) lines.push_back(line);
    if (nl == std::string_view::npos) break;
    start = nl + 1;
  }
  auto rows = nlohmann::json::array();
  if (lines.empty()) return rows;

  auto split = [](std::string_view line) {
    std::vector<std::string_view> cells;
    std::size_t from = 0;
    while (true) {
      std::size_t comma = line.find(',', from);
      cells.push_back(text::trim(line.substr(from, comma == std::string_view::npos ? std::string_view::npos : comma - from)));
      if (comma == std::string_view::npos) break;
      from = comma + 1;
    }
    return cells;
  };

  auto headers = split(lines.front());
  for (std::size_t i = 1; i < lines.size(); ++i) {
    auto cells = split(lines[i]);
    auto row = nlohmann::json::object();
    for (std::size_t h = 0; h < headers.size(); ++h) {
      std::string key(headers[h]);
      if (h >= cells.size() || cells[h].empty()) {
        row[key] = nullptr;
        continue;
      }
      auto cell = cells[h];
      if (auto number = parse_number(cell)) {
        row[key] = *number;
      } else if (cell.size() >= 2 && (cell.front() == '"' || cell.front() == '\'') && cell.back() == cell.front()) {
        row[key] = std::string(cell.substr(1, cell.size() - 2));
      } else {
        row[key] = std::string(cell);
      }
    }
    rows.push_back(std::move(row));
  }
  return rows;
}

nlohmann::json ensure_table(const nlohmann::json& value, const std::string& label) {
  if (value.is_array()) {
    for (const auto& row : value) {
      if (!row.is_object()) {
        throw FlowError("expected rows of objects for " + label);
      }
    }
    return value;
  }
  if (value.is_string()) {
    return parse_csv(value.get<std::string>());
  }
  throw FlowError("expected tabular data for " + label);
}

nlohmann::json field_value(const nlohmann::json& row, std::string_view path) {
  const nlohmann::json* current = &row;
  std::size_t start = 0;
  while (start <= path.size()) {
    std::size_t dot = path.find('.', start);
    std::string key(path.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start));
    if (!current->is_object()) return nullptr;
    auto it = current->find(key);
    if (it == current->end()) return nullptr;
    current = &*it;
    if (dot == std::string_view::npos) break;
    start = dot + 1;
  }
  return *current;
}

// ============================================================================
// Row operations
// ============================================================================

bool matches(const nlohmann::json& row, const Condition& condition) {
  auto left = field_value(row, condition.field);
  const auto& right = condition.value;
  switch (condition.op) {
    case CompareOp::Eq:
      return loosely_equal(left, right);
    case CompareOp::Ne:
      return !loosely_equal(left, right);
    default:
      break;
  }
  auto l = as_number(left);
  auto r = as_number(right);
  if (!l || !r) return false;
  switch (condition.op) {
    case CompareOp::Gt: return *l > *r;
    case CompareOp::Ge: return *l >= *r;
    case CompareOp::Lt: return *l < *r;
    case CompareOp::Le: return *l <= *r;
    default: return false;
  }
}

nlohmann::json filter(const nlohmann::json& rows, const Condition& condition) {
  auto out = nlohmann::json::array();
  for (const auto& row : rows) {
    if (matches(row, condition)) {
      out.push_back(row);
    }
  }
  return out;
}

nlohmann::json group_aggregate(const nlohmann::json& rows, const std::string& group_by,
                               const std::vector<Aggregation>& aggregations) {
  std::vector<std::string> order;
  std::unordered_map<std::string, std::vector<const nlohmann::json*>> buckets;
  std::unordered_map<std::string, nlohmann::json> keys;
  for (const auto& row : rows) {
    auto key_value = field_value(row, group_by);
    auto key = display(key_value);
    auto [it, inserted] = buckets.try_emplace(key);
    if (inserted) {
      order.push_back(key);
      keys[key] = key_value;
    }
    it->second.push_back(&row);
  }

  auto out = nlohmann::json::array();
  for (const auto& key : order) {
    const auto& bucket = buckets[key];
    auto result = nlohmann::json::object();
    result[group_by] = keys[key];
    for (const auto& agg : aggregations) {
      if (agg.fn == AggregateFn::Count) {
        result[agg.alias] = bucket.size();
        continue;
      }
      bool integral = true;
      std::int64_t int_sum = 0;
      double real_sum = 0.0;
      for (const auto* row : bucket) {
        auto value = field_value(*row, *agg.field);
        if (value.is_null()) continue;
        if (value.is_number_integer()) {
          real_sum += value.get<double>();
          if (integral && !add_checked(int_sum, value)) {
            // Out of int64 range: the total continues as a double
            integral = false;
          }
          continue;
        }
        auto number = as_number(value);
        if (!number) {
          throw FlowError("cannot sum non-numeric value " + value.dump() + " in field '" + *agg.field + "'");
        }
        integral = false;
        real_sum += *number;
      }
      if (integral) {
        result[agg.alias] = int_sum;
      } else {
        result[agg.alias] = real_sum;
      }
    }
    out.push_back(std::move(result));
  }
  return out;
}

nlohmann::json sort(const nlohmann::json& rows, const std::string& field, SortDirection direction,
                    std::optional<std::size_t> limit) {
  std::vector<nlohmann::json> sorted(rows.begin(), rows.end());
  std::stable_sort(sorted.begin(), sorted.end(), [&](const nlohmann::json& a, const nlohmann::json& b) {
    auto left = field_value(a, field);
    auto right = field_value(b, field);
    if (direction == SortDirection::Desc) std::swap(left, right);
    auto left_rank = sort_rank(left);
    auto right_rank = sort_rank(right);
    if (left_rank != right_rank) {
      return left_rank < right_rank;
    }
    if (left_rank == SortRank::Number) {
      return left.get<double>() < right.get<double>();
    }
    return display(left) < display(right);
  });
  if (limit && sorted.size() > *limit) {
    sorted.resize(*limit);
  }
  return nlohmann::json(std::move(sorted));
}

nlohmann::json take(const nlohmann::json& rows, std::size_t count) {
  auto out = nlohmann::json::array();
  for (std::size_t i = 0; i < rows.size() && i < count; ++i) {
    out.push_back(rows[i]);
  }
  return out;
}

}  // namespace table

// ============================================================================
// References
// ============================================================================

std::optional<nlohmann::json> resolve_reference(std::string_view token, const nlohmann::json& state,
                                                const nlohmann::json& inputs) {
  std::string whole(token);
  if (state.contains(whole)) return state[whole];
  if (inputs.is_object() && inputs.contains(whole)) return inputs[whole];

  auto segments = reference_segments(token);
  if (segments.empty() || !std::holds_alternative<std::string>(segments.front())) {
    return std::nullopt;
  }
  const auto& head = std::get<std::string>(segments.front());
  const nlohmann::json* current = nullptr;
  if (state.contains(head)) {
    current = &state[head];
  } else if (inputs.is_object() && inputs.contains(head)) {
    current = &inputs[head];
  } else {
    return std::nullopt;
  }
  for (std::size_t i = 1; i < segments.size(); ++i) {
    if (const auto* index = std::get_if<std::size_t>(&segments[i])) {
      if (!current->is_array() || *index >= current->size()) return std::nullopt;
      current = &(*current)[*index];
    } else {
      const auto& key = std::get<std::string>(segments[i]);
      if (!current->is_object()) return std::nullopt;
      auto it = current->find(key);
      if (it == current->end()) return std::nullopt;
      current = &*it;
    }
  }
  return *current;
}

nlohmann::json resolve_literal(const nlohmann::json& value, const nlohmann::json& state,
                               const nlohmann::json& inputs) {
  if (value.is_array()) {
    auto out = nlohmann::json::array();
    for (const auto& item : value) {
      out.push_back(resolve_literal(item, state, inputs));
    }
    return out;
  }
  if (value.is_object()) {
    auto out = nlohmann::json::object();
    for (auto it = value.begin(); it != value.end(); ++it) {
      out[it.key()] = resolve_literal(it.value(), state, inputs);
    }
    return out;
  }
  if (value.is_string()) {
    if (auto resolved = resolve_reference(value.get<std::string>(), state, inputs)) {
      return *resolved;
    }
  }
  return value;
}

nlohmann::json resolve_dataset(const std::string& name, const nlohmann::json& state,
                               const nlohmann::json& inputs) {
  auto value = resolve_reference(name, state, inputs);
  if (!value) {
    throw FlowError("missing dataset '" + name + "'");
  }
  return table::ensure_table(*value, name);
}

}  // namespace flowgrid
