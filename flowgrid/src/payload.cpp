// Implementation file for payload.hpp

#include <flowgrid/payload.hpp>
#include <flowgrid/errors.hpp>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <string>

namespace flowgrid {

bool is_identifier_start(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_';
}

bool is_identifier_char(char c) {
  return is_identifier_start(c) || (c >= '0' && c <= '9') ||
         c == '-' || c == '.' || c == '[' || c == ']';
}

namespace {

bool is_digit(char c) { return c >= '0' && c <= '9'; }

// ============================================================================
// Recursive-descent cursor over the literal text
// ============================================================================

class LiteralReader {
 public:
  explicit LiteralReader(std::string_view text) : text_(text) {}

  nlohmann::json parse_document() {
    skip_blank();
    if (at_end()) {
      return nlohmann::json::object();
    }
    nlohmann::json result;
    if (starts_assignment()) {
      result = parse_assignments();
    } else {
      result = parse_value();
    }
    skip_blank();
    if (!at_end()) {
      fail(std::string("unexpected trailing content '") + peek() + "'");
    }
    return result;
  }

 private:
  bool at_end() const { return pos_ >= text_.size(); }
  char peek(std::size_t ahead = 0) const {
    return pos_ + ahead < text_.size() ? text_[pos_ + ahead] : '\0';
  }

  [[noreturn]] void fail(const std::string& message) const {
    throw PayloadError(message, pos_);
  }

  void skip_blank() {
    while (!at_end()) {
      char c = peek();
      if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
        ++pos_;
      } else if (c == '/' && peek(1) == '/') {
        while (!at_end() && peek() != '\n') {
          ++pos_;
        }
      } else {
        break;
      }
    }
  }

  void expect(char c, const char* what) {
    skip_blank();
    if (peek() != c) {
      fail(std::string("expected ") + what);
    }
    ++pos_;
  }

  // `name = ...` at top level selects the assignment-list form
  bool starts_assignment() {
    if (!is_identifier_start(peek())) {
      return false;
    }
    std::size_t saved = pos_;
    read_identifier();
    skip_blank();
    bool assign = peek() == '=';
    pos_ = saved;
    return assign;
  }

  nlohmann::json parse_assignments() {
    auto result = nlohmann::json::object();
    while (true) {
      skip_blank();
      if (!is_identifier_start(peek())) {
        fail("expected assignment name");
      }
      std::string key = read_identifier();
      expect('=', "'=' in assignment");
      result[key] = parse_value();
      skip_blank();
      if (peek() != ',') {
        break;
      }
      ++pos_;
      skip_blank();
      if (at_end()) {
        break;
      }
    }
    return result;
  }

  nlohmann::json parse_value() {
    skip_blank();
    if (at_end()) {
      fail("unexpected end of payload");
    }
    char c = peek();
    if (c == '{') {
      return parse_object();
    }
    if (c == '[') {
      return parse_array();
    }
    if (c == '"' || c == '\'') {
      return read_string();
    }
    if (is_digit(c) || (c == '-' && is_digit(peek(1)))) {
      return read_number();
    }
    if (is_identifier_start(c)) {
      std::string word = read_identifier();
      if (word == "true") return true;
      if (word == "false") return false;
      if (word == "null") return nullptr;
      return word;
    }
    fail(std::string("unexpected character '") + c + "'");
  }

  nlohmann::json parse_object() {
    std::size_t open = pos_++;
    auto result = nlohmann::json::object();
    while (true) {
      skip_blank();
      if (at_end()) {
        throw PayloadError("unterminated object literal", open);
      }
      if (peek() == '}') {
        ++pos_;
        return result;
      }
      std::string key;
      if (peek() == '"' || peek() == '\'') {
        key = read_string();
      } else if (is_identifier_start(peek())) {
        key = read_identifier();
      } else {
        fail("object keys must be identifiers or string literals");
      }
      expect(':', "':' after object key");
      result[key] = parse_value();
      skip_blank();
      if (at_end()) {
        throw PayloadError("unterminated object literal", open);
      }
      if (peek() == ',') {
        ++pos_;
      } else if (peek() != '}') {
        fail("expected ',' or '}' in object literal");
      }
    }
  }

  nlohmann::json parse_array() {
    std::size_t open = pos_++;
    auto result = nlohmann::json::array();
    while (true) {
      skip_blank();
      if (at_end()) {
        throw PayloadError("unterminated array literal", open);
      }
      if (peek() == ']') {
        ++pos_;
        return result;
      }
      result.push_back(parse_value());
      skip_blank();
      if (at_end()) {
        throw PayloadError("unterminated array literal", open);
      }
      if (peek() == ',') {
        ++pos_;
      } else if (peek() != ']') {
        fail("expected ',' or ']' in array literal");
      }
    }
  }

  std::string read_string() {
    std::size_t open = pos_;
    char quote = text_[pos_++];
    std::string value;
    while (!at_end()) {
      char c = text_[pos_];
      if (c == '\\' && pos_ + 1 < text_.size()) {
        char escaped = text_[pos_ + 1];
        switch (escaped) {
          case 'n': value += '\n'; break;
          case 't': value += '\t'; break;
          case 'r': value += '\r'; break;
          default: value += escaped; break;
        }
        pos_ += 2;
        continue;
      }
      ++pos_;
      if (c == quote) {
        return value;
      }
      value += c;
    }
    throw PayloadError("unterminated string literal", open);
  }

  nlohmann::json read_number() {
    std::size_t start = pos_;
    if (peek() == '-') {
      ++pos_;
    }
    while (is_digit(peek())) {
      ++pos_;
    }
    bool fractional = false;
    if (peek() == '.' && is_digit(peek(1))) {
      fractional = true;
      ++pos_;
      while (is_digit(peek())) {
        ++pos_;
      }
    }
    std::string raw(text_.substr(start, pos_ - start));
    if (!fractional) {
      std::int64_t value = 0;
      auto [end, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
      if (ec == std::errc() && end == raw.data() + raw.size()) {
        return value;
      }
    }
    return std::strtod(raw.c_str(), nullptr);
  }

  std::string read_identifier() {
    std::size_t start = pos_++;
    while (!at_end() && is_identifier_char(peek())) {
      ++pos_;
    }
    return std::string(text_.substr(start, pos_ - start));
  }

  std::string_view text_;
  std::size_t pos_ = 0;
};

}  // namespace

nlohmann::json parse_payload(std::string_view text) {
  LiteralReader reader(text);
  return reader.parse_document();
}

}  // namespace flowgrid
