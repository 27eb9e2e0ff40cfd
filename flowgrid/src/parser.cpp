// Implementation file for parser.hpp

#include <flowgrid/parser.hpp>
#include <flowgrid/errors.hpp>
#include <flowgrid/text.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace flowgrid {

namespace {

// Priority order: longer keywords sharing a prefix come first
struct KeywordEntry {
  const char* text;
  OpKeyword keyword;
};

constexpr KeywordEntry kKeywords[] = {
  {"OUTPUT_TEXT", OpKeyword::OutputText},
  {"OUTPUT", OpKeyword::Output},
  {"LOAD TABLE", OpKeyword::LoadTable},
  {"LOAD CSV", OpKeyword::LoadCsv},
  {"FILTER", OpKeyword::Filter},
  {"GROUP", OpKeyword::GroupAggregate},
  {"SORT", OpKeyword::Sort},
  {"TAKE", OpKeyword::Take},
  {"RUN AGENT", OpKeyword::RunAgent},
  {"RUN VASM", OpKeyword::RunVasm},
  {"APX_EXEC", OpKeyword::ApxExec},
  {"BUILD_VPKG", OpKeyword::BuildVpkg},
  {"DEPLOY_SERVICE", OpKeyword::DeployService},
  {"CALL FLOW", OpKeyword::CallFlow},
};

std::vector<std::string> split_lines(std::string_view source) {
  std::string normalized;
  normalized.reserve(source.size());
  for (char c : source) {
    if (c != '\r') normalized += c;
  }
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (true) {
    std::size_t nl = normalized.find('\n', start);
    if (nl == std::string::npos) {
      lines.push_back(normalized.substr(start));
      break;
    }
    lines.push_back(normalized.substr(start, nl - start));
    start = nl + 1;
  }
  return lines;
}

// FLOW "<name>"
std::optional<std::string> match_header(std::string_view line) {
  std::string_view rest;
  if (!text::match_keyword(line, "FLOW", &rest)) return std::nullopt;
  if (rest.size() < 2 || rest.front() != '"') return std::nullopt;
  std::size_t close = rest.find('"', 1);
  if (close == std::string_view::npos || close == 1) return std::nullopt;
  if (!text::trim(rest.substr(close + 1)).empty()) return std::nullopt;
  return std::string(text::trim(rest.substr(1, close - 1)));
}

struct StepDecl {
  std::string name;
  std::string inline_body;
};

// STEP <identifier> = [body]
std::optional<StepDecl> match_step(std::string_view line) {
  std::string_view rest;
  if (!text::match_keyword(line, "STEP", &rest)) return std::nullopt;
  std::size_t i = 0;
  auto ident_start = [](char c) { return std::isalpha(static_cast<unsigned char>(c)) || c == '_'; };
  auto ident_char = [](char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; };
  if (rest.empty() || !ident_start(rest[0])) return std::nullopt;
  while (i < rest.size() && ident_char(rest[i])) ++i;
  StepDecl decl;
  decl.name = std::string(rest.substr(0, i));
  while (i < rest.size() && text::is_space(rest[i])) ++i;
  if (i >= rest.size() || rest[i] != '=') return std::nullopt;
  decl.inline_body = std::string(text::trim(rest.substr(i + 1)));
  return decl;
}

std::string strip_indent(std::string_view line) {
  if (line.substr(0, 2) == "  ") {
    line.remove_prefix(2);
  } else if (!line.empty() && line.front() == '\t') {
    line.remove_prefix(1);
  }
  return std::string(text::rtrim(line));
}

std::string line_ref(std::size_t index) {
  return "line " + std::to_string(index + 1);
}

// Parses the INPUTS block when present; returns the index range it occupies
std::pair<std::size_t, std::size_t> parse_inputs(const std::vector<std::string>& lines,
                                                 std::size_t from,
                                                 std::vector<InputDecl>& inputs,
                                                 std::vector<std::string>& warnings) {
  std::size_t start = lines.size();
  for (std::size_t i = from; i < lines.size(); ++i) {
    auto trimmed = text::trim(lines[i]);
    if (text::iequals(trimmed, "INPUTS")) {
      start = i;
      break;
    }
    if (match_step(trimmed)) {
      break;
    }
  }
  if (start == lines.size()) {
    return {lines.size(), lines.size()};
  }

  std::size_t end = lines.size();
  for (std::size_t i = start + 1; i < lines.size(); ++i) {
    if (text::match_keyword(lines[i], "END INPUTS") && text::split_ws(lines[i]).size() == 2) {
      end = i;
      break;
    }
  }
  if (end == lines.size()) {
    warnings.push_back("INPUTS block at " + line_ref(start) + " is missing END INPUTS");
    return {start, start + 1};
  }

  for (std::size_t i = start + 1; i < end; ++i) {
    auto trimmed = text::trim(lines[i]);
    if (trimmed.empty() || trimmed.front() == '#') continue;
    auto parts = text::split_ws(trimmed);
    if (parts.size() < 2) {
      warnings.push_back("malformed input declaration at " + line_ref(i) + ": " + std::string(trimmed));
      continue;
    }
    InputDecl decl;
    decl.name = parts[1];
    if (auto type = input_type_from_string(parts[0])) {
      decl.type = *type;
    } else {
      warnings.push_back("unknown input type '" + parts[0] + "' at " + line_ref(i) + ", using text");
    }
    for (std::size_t k = 2; k < parts.size(); ++k) {
      if (text::to_lower(parts[k]).find("optional") != std::string::npos) {
        decl.optional = true;
      }
    }
    inputs.push_back(std::move(decl));
  }
  return {start, end + 1};
}

}  // namespace

// ============================================================================
// Keyword and type names
// ============================================================================

const char* to_string(OpKeyword keyword) {
  switch (keyword) {
    case OpKeyword::LoadTable: return "LOAD_TABLE";
    case OpKeyword::LoadCsv: return "LOAD_CSV";
    case OpKeyword::Filter: return "FILTER";
    case OpKeyword::GroupAggregate: return "GROUP_AGG";
    case OpKeyword::Sort: return "SORT";
    case OpKeyword::Take: return "TAKE";
    case OpKeyword::RunAgent: return "RUN_AGENT";
    case OpKeyword::ApxExec: return "APX_EXEC";
    case OpKeyword::BuildVpkg: return "BUILD_VPKG";
    case OpKeyword::DeployService: return "DEPLOY_SERVICE";
    case OpKeyword::RunVasm: return "RUN_VASM";
    case OpKeyword::CallFlow: return "CALL_FLOW";
    case OpKeyword::Output: return "OUTPUT";
    case OpKeyword::OutputText: return "OUTPUT_TEXT";
    case OpKeyword::Unknown: break;
  }
  return "UNKNOWN";
}

const char* to_string(InputType type) {
  switch (type) {
    case InputType::File: return "file";
    case InputType::Table: return "table";
    case InputType::Text: return "text";
    case InputType::Json: return "json";
    case InputType::Number: return "number";
    case InputType::Bool: return "bool";
    case InputType::Blob: return "blob";
  }
  return "text";
}

std::optional<InputType> input_type_from_string(std::string_view name) {
  static constexpr InputType kTypes[] = {InputType::File, InputType::Table, InputType::Text, InputType::Json,
                                         InputType::Number, InputType::Bool, InputType::Blob};
  for (auto type : kTypes) {
    if (text::iequals(name, to_string(type))) return type;
  }
  return std::nullopt;
}

OpKeyword infer_keyword(std::string_view line) {
  for (const auto& entry : kKeywords) {
    if (text::match_keyword(line, entry.text)) {
      return entry.keyword;
    }
  }
  return OpKeyword::Unknown;
}

// ============================================================================
// parse_flow
// ============================================================================

CompileResult parse_flow(std::string_view source, const ParseOptions& options) {
  CompileResult result;
  auto lines = split_lines(source);

  std::size_t header = lines.size();
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (!text::trim(lines[i]).empty()) {
      header = i;
      break;
    }
  }
  std::optional<std::string> name;
  if (header < lines.size()) {
    name = match_header(lines[header]);
  }
  if (!name) {
    result.errors.push_back("FLOW header missing (expected FLOW \"Name\")");
    return result;
  }

  WorkflowAst ast;
  ast.name = *name;
  ast.source = std::string(source);

  auto [inputs_begin, inputs_end] = parse_inputs(lines, header + 1, ast.inputs, result.warnings);

  bool terminated = false;
  Step* current = nullptr;
  auto append_body = [&](std::string body) {
    if (current->body_lines.empty()) {
      current->keyword = infer_keyword(body);
    }
    current->body_lines.push_back(std::move(body));
  };

  for (std::size_t i = header + 1; i < lines.size(); ++i) {
    if (i >= inputs_begin && i < inputs_end) continue;
    auto trimmed = text::trim(lines[i]);
    if (trimmed.empty()) continue;
    if (text::match_keyword(trimmed, "END FLOW") && text::split_ws(trimmed).size() == 2) {
      terminated = true;
      break;
    }
    if (auto decl = match_step(trimmed)) {
      ast.steps.push_back(Step{decl->name, OpKeyword::Unknown, {}, i + 1});
      current = &ast.steps.back();
      if (!decl->inline_body.empty()) {
        append_body(decl->inline_body);
      }
      continue;
    }
    if (!current) {
      result.warnings.push_back("ignoring text outside of any STEP at " + line_ref(i));
      continue;
    }
    append_body(strip_indent(lines[i]));
  }

  if (!terminated) {
    result.warnings.push_back("missing END FLOW terminator");
  }

  if (ast.steps.empty()) {
    if (options.strict) {
      result.errors.push_back("no STEP definitions found");
      return result;
    }
    result.warnings.push_back("no STEP definitions found");
  }

  for (const auto& warning : result.warnings) {
    spdlog::debug("flow '{}': {}", ast.name, warning);
  }

  result.ast = std::move(ast);
  result.ok = result.errors.empty();
  return result;
}

WorkflowAst parse_flow_strict(std::string_view source) {
  auto result = parse_flow(source, ParseOptions{true});
  if (!result.ok || !result.ast) {
    throw ParseError(result.errors);
  }
  return std::move(*result.ast);
}

}  // namespace flowgrid
