#ifndef PLUGEVAL_CORE_JSON_DOM_HPP_
#define PLUGEVAL_CORE_JSON_DOM_HPP_

#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace plugeval::core::json {

// Minimal DOM shared by scenario loading, remote responses and result documents.
// Objects keep keys ordered so serialized artifacts are byte-stable across runs.
struct Value {
  enum class Type {
    kObject,
    kArray,
    kString,
    kNumber,
    kBool,
    kNull,
  };

  using Object = std::map<std::string, Value>;
  using Array = std::vector<Value>;

  Type type = Type::kNull;
  Object object_value;
  Array array_value;
  std::string string_value;
  double number_value = 0.0;
  bool bool_value = false;

  bool IsObject() const {
    return type == Type::kObject;
  }
  bool IsArray() const {
    return type == Type::kArray;
  }
  bool IsString() const {
    return type == Type::kString;
  }
  bool IsNumber() const {
    return type == Type::kNumber;
  }
  bool IsBool() const {
    return type == Type::kBool;
  }
  bool IsNull() const {
    return type == Type::kNull;
  }

  // Returns the member for `key` or nullptr when this is not an object or the
  // key is absent.
  const Value* Find(std::string_view key) const {
    if (type != Type::kObject) {
      return nullptr;
    }
    const auto it = object_value.find(std::string(key));
    if (it == object_value.end()) {
      return nullptr;
    }
    return &it->second;
  }

  // Inserts or replaces `key`. Promotes a null value to an empty object.
  Value& Set(std::string key, Value value) {
    if (type == Type::kNull) {
      type = Type::kObject;
    }
    Value& slot = object_value[std::move(key)];
    slot = std::move(value);
    return slot;
  }

  void Push(Value value) {
    if (type == Type::kNull) {
      type = Type::kArray;
    }
    array_value.push_back(std::move(value));
  }
};

inline Value MakeNull() {
  return Value{};
}

inline Value MakeObject() {
  Value value;
  value.type = Value::Type::kObject;
  return value;
}

inline Value MakeArray() {
  Value value;
  value.type = Value::Type::kArray;
  return value;
}

inline Value MakeString(std::string text) {
  Value value;
  value.type = Value::Type::kString;
  value.string_value = std::move(text);
  return value;
}

inline Value MakeNumber(double number) {
  Value value;
  value.type = Value::Type::kNumber;
  value.number_value = number;
  return value;
}

inline Value MakeBool(bool flag) {
  Value value;
  value.type = Value::Type::kBool;
  value.bool_value = flag;
  return value;
}

inline Value MakeStringArray(const std::vector<std::string>& items) {
  Value value = MakeArray();
  for (const auto& item : items) {
    value.Push(MakeString(item));
  }
  return value;
}

// Walks nested object members. Returns nullptr on the first missing hop.
inline const Value* FindPath(const Value& root, std::initializer_list<std::string_view> path) {
  const Value* cursor = &root;
  for (const std::string_view key : path) {
    cursor = cursor->Find(key);
    if (cursor == nullptr) {
      return nullptr;
    }
  }
  return cursor;
}

inline std::optional<std::string> GetString(const Value& object, std::string_view key) {
  const Value* member = object.Find(key);
  if (member == nullptr || !member->IsString()) {
    return std::nullopt;
  }
  return member->string_value;
}

inline std::optional<double> GetNumber(const Value& object, std::string_view key) {
  const Value* member = object.Find(key);
  if (member == nullptr || !member->IsNumber() || !std::isfinite(member->number_value)) {
    return std::nullopt;
  }
  return member->number_value;
}

inline std::optional<bool> GetBool(const Value& object, std::string_view key) {
  const Value* member = object.Find(key);
  if (member == nullptr || !member->IsBool()) {
    return std::nullopt;
  }
  return member->bool_value;
}

// Lightweight JSON parser with deterministic diagnostics.
// Errors report line/column so malformed fixtures and remote payloads are
// actionable without a debugger.
class Parser {
public:
  // Remote bodies are untrusted; recursion is bounded so hostile nesting
  // fails as a parse error instead of exhausting the stack.
  static constexpr std::size_t kMaxDepth = 256;

  explicit Parser(std::string_view input) : input_(input) {}

  bool Parse(Value& root, std::string& error) {
    SkipWhitespace();
    if (!ParseValue(root, error)) {
      return false;
    }
    SkipWhitespace();
    if (!AtEnd()) {
      return Fail("unexpected trailing content after JSON value", error);
    }
    return true;
  }

private:
  bool ParseValue(Value& value, std::string& error) {
    if (AtEnd()) {
      return Fail("unexpected end of input while parsing value", error);
    }

    const char c = Peek();
    if (c == '{') {
      return ParseObject(value, error);
    }
    if (c == '[') {
      return ParseArray(value, error);
    }
    if (c == '"') {
      value = Value{};
      value.type = Value::Type::kString;
      return ParseString(value.string_value, error);
    }
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) {
      value = Value{};
      value.type = Value::Type::kNumber;
      return ParseNumber(value.number_value, error);
    }
    if (StartsWith("true")) {
      value = MakeBool(true);
      AdvanceN(4);
      return true;
    }
    if (StartsWith("false")) {
      value = MakeBool(false);
      AdvanceN(5);
      return true;
    }
    if (StartsWith("null")) {
      value = MakeNull();
      AdvanceN(4);
      return true;
    }

    return Fail("expected JSON value", error);
  }

  bool ParseObject(Value& value, std::string& error) {
    value = MakeObject();
    DepthGuard guard(depth_);
    if (depth_ > kMaxDepth) {
      return Fail("nesting too deep", error);
    }

    if (!ConsumeChar('{', "expected '{' to start object", error)) {
      return false;
    }
    SkipWhitespace();

    if (Match('}')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      std::string key;
      if (!ParseString(key, error)) {
        return false;
      }

      SkipWhitespace();
      if (!ConsumeChar(':', "expected ':' after object key", error)) {
        return false;
      }

      SkipWhitespace();
      Value item;
      if (!ParseValue(item, error)) {
        return false;
      }
      value.object_value[key] = std::move(item);

      SkipWhitespace();
      if (Match('}')) {
        break;
      }
      if (!ConsumeChar(',', "expected ',' between object entries", error)) {
        return false;
      }
    }

    return true;
  }

  bool ParseArray(Value& value, std::string& error) {
    value = MakeArray();
    DepthGuard guard(depth_);
    if (depth_ > kMaxDepth) {
      return Fail("nesting too deep", error);
    }

    if (!ConsumeChar('[', "expected '[' to start array", error)) {
      return false;
    }
    SkipWhitespace();

    if (Match(']')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      Value item;
      if (!ParseValue(item, error)) {
        return false;
      }
      value.array_value.push_back(std::move(item));

      SkipWhitespace();
      if (Match(']')) {
        break;
      }
      if (!ConsumeChar(',', "expected ',' between array items", error)) {
        return false;
      }
    }

    return true;
  }

  bool ParseHexQuad(std::uint32_t& code_unit, std::string& error) {
    code_unit = 0;
    for (int i = 0; i < 4; ++i) {
      if (AtEnd()) {
        return Fail("truncated \\u escape in string", error);
      }
      const char h = Advance();
      code_unit <<= 4U;
      if (h >= '0' && h <= '9') {
        code_unit |= static_cast<std::uint32_t>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        code_unit |= static_cast<std::uint32_t>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        code_unit |= static_cast<std::uint32_t>(h - 'A' + 10);
      } else {
        return Fail("invalid hex digit in \\u escape", error);
      }
    }
    return true;
  }

  static void AppendUtf8(std::uint32_t code_point, std::string& output) {
    if (code_point < 0x80U) {
      output.push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800U) {
      output.push_back(static_cast<char>(0xC0U | (code_point >> 6U)));
      output.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    } else if (code_point < 0x10000U) {
      output.push_back(static_cast<char>(0xE0U | (code_point >> 12U)));
      output.push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    } else {
      output.push_back(static_cast<char>(0xF0U | (code_point >> 18U)));
      output.push_back(static_cast<char>(0x80U | ((code_point >> 12U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    }
  }

  bool ParseUnicodeEscape(std::string& output, std::string& error) {
    std::uint32_t code_unit = 0;
    if (!ParseHexQuad(code_unit, error)) {
      return false;
    }

    if (code_unit >= 0xD800U && code_unit <= 0xDBFFU) {
      if (!StartsWith("\\u")) {
        return Fail("unpaired high surrogate in \\u escape", error);
      }
      AdvanceN(2);
      std::uint32_t low = 0;
      if (!ParseHexQuad(low, error)) {
        return false;
      }
      if (low < 0xDC00U || low > 0xDFFFU) {
        return Fail("invalid low surrogate in \\u escape", error);
      }
      code_unit = 0x10000U + ((code_unit - 0xD800U) << 10U) + (low - 0xDC00U);
    } else if (code_unit >= 0xDC00U && code_unit <= 0xDFFFU) {
      return Fail("unpaired low surrogate in \\u escape", error);
    }

    AppendUtf8(code_unit, output);
    return true;
  }

  bool ParseString(std::string& output, std::string& error) {
    output.clear();
    if (!ConsumeChar('"', "expected '\"' to start string", error)) {
      return false;
    }

    while (!AtEnd()) {
      const char c = Advance();
      if (c == '"') {
        return true;
      }
      if (c == '\\') {
        if (AtEnd()) {
          return Fail("unterminated escape sequence in string", error);
        }
        const char esc = Advance();
        switch (esc) {
        case '"':
        case '\\':
        case '/':
          output.push_back(esc);
          break;
        case 'b':
          output.push_back('\b');
          break;
        case 'f':
          output.push_back('\f');
          break;
        case 'n':
          output.push_back('\n');
          break;
        case 'r':
          output.push_back('\r');
          break;
        case 't':
          output.push_back('\t');
          break;
        case 'u':
          if (!ParseUnicodeEscape(output, error)) {
            return false;
          }
          break;
        default:
          return Fail("invalid escape sequence in string", error);
        }
        continue;
      }

      if (static_cast<unsigned char>(c) < 0x20U) {
        return Fail("control character in string is not allowed", error);
      }
      output.push_back(c);
    }

    return Fail("unterminated string literal", error);
  }

  bool ParseNumber(double& output, std::string& error) {
    const std::size_t start = pos_;

    if (Match('-')) {
      // optional sign
    }

    if (Match('0')) {
      // single leading zero
    } else {
      if (!ConsumeDigits()) {
        return Fail("expected digits in number", error);
      }
    }

    if (Match('.')) {
      if (!ConsumeDigits()) {
        return Fail("expected digits after decimal point", error);
      }
    }

    if (Match('e') || Match('E')) {
      if (Match('+') || Match('-')) {
        // exponent sign
      }
      if (!ConsumeDigits()) {
        return Fail("expected exponent digits", error);
      }
    }

    const std::string text(input_.substr(start, pos_ - start));
    char* parse_end = nullptr;
    output = std::strtod(text.c_str(), &parse_end);
    if (parse_end == nullptr || *parse_end != '\0') {
      return Fail("invalid number token", error);
    }

    return true;
  }

  void SkipWhitespace() {
    while (!AtEnd() && std::isspace(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
    }
  }

  bool ConsumeDigits() {
    std::size_t count = 0;
    while (!AtEnd() && std::isdigit(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
      ++count;
    }
    return count > 0U;
  }

  bool ConsumeChar(char expected, std::string_view message, std::string& error) {
    if (AtEnd() || Peek() != expected) {
      return Fail(message, error);
    }
    Advance();
    return true;
  }

  bool Match(char expected) {
    if (AtEnd() || Peek() != expected) {
      return false;
    }
    Advance();
    return true;
  }

  bool StartsWith(std::string_view token) const {
    if (pos_ + token.size() > input_.size()) {
      return false;
    }
    return input_.substr(pos_, token.size()) == token;
  }

  void AdvanceN(std::size_t n) {
    for (std::size_t i = 0; i < n; ++i) {
      Advance();
    }
  }

  char Peek() const {
    return input_[pos_];
  }

  char Advance() {
    const char c = input_[pos_++];
    if (c == '\n') {
      ++line_;
      col_ = 1;
    } else {
      ++col_;
    }
    return c;
  }

  bool AtEnd() const {
    return pos_ >= input_.size();
  }

  bool Fail(std::string_view message, std::string& error) const {
    error = "parse error at line " + std::to_string(line_) + ", col " + std::to_string(col_) +
            ": " + std::string(message);
    return false;
  }

  class DepthGuard {
  public:
    explicit DepthGuard(std::size_t& depth) : depth_(depth) {
      ++depth_;
    }
    ~DepthGuard() {
      --depth_;
    }
    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

  private:
    std::size_t& depth_;
  };

  std::string_view input_;
  std::size_t pos_ = 0;
  std::size_t line_ = 1;
  std::size_t col_ = 1;
  std::size_t depth_ = 0;
};

inline bool Parse(std::string_view input, Value& root, std::string& error) {
  Parser parser(input);
  return parser.Parse(root, error);
}

// Shortest round-trip text for a finite number. Integral values print without
// a fraction so point totals read naturally; non-finite values become null.
inline std::string FormatNumber(double number) {
  if (!std::isfinite(number)) {
    return "null";
  }
  if (number == 0.0) {
    return "0";
  }
  std::array<char, 64> buffer{};
  const auto result = std::to_chars(buffer.data(), buffer.data() + buffer.size(), number);
  if (result.ec != std::errc()) {
    return "null";
  }
  return std::string(buffer.data(), result.ptr);
}

inline void AppendQuoted(std::string_view raw, std::string& out) {
  static constexpr char kHex[] = "0123456789abcdef";
  out.push_back('"');
  for (const char ch : raw) {
    switch (ch) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default: {
      const auto as_unsigned = static_cast<unsigned char>(ch);
      if (as_unsigned < 0x20U) {
        out += "\\u00";
        out.push_back(kHex[(as_unsigned >> 4U) & 0x0FU]);
        out.push_back(kHex[as_unsigned & 0x0FU]);
      } else {
        out.push_back(ch);
      }
      break;
    }
    }
  }
  out.push_back('"');
}

namespace detail {

inline void AppendIndent(std::size_t depth, int indent, std::string& out) {
  if (indent <= 0) {
    return;
  }
  out.push_back('\n');
  out.append(depth * static_cast<std::size_t>(indent), ' ');
}

inline void SerializeInto(const Value& value, int indent, std::size_t depth, std::string& out) {
  switch (value.type) {
  case Value::Type::kNull:
    out += "null";
    return;
  case Value::Type::kBool:
    out += value.bool_value ? "true" : "false";
    return;
  case Value::Type::kNumber:
    out += FormatNumber(value.number_value);
    return;
  case Value::Type::kString:
    AppendQuoted(value.string_value, out);
    return;
  case Value::Type::kArray: {
    if (value.array_value.empty()) {
      out += "[]";
      return;
    }
    out.push_back('[');
    bool first = true;
    for (const auto& item : value.array_value) {
      if (!first) {
        out.push_back(',');
      }
      first = false;
      AppendIndent(depth + 1U, indent, out);
      SerializeInto(item, indent, depth + 1U, out);
    }
    AppendIndent(depth, indent, out);
    out.push_back(']');
    return;
  }
  case Value::Type::kObject: {
    if (value.object_value.empty()) {
      out += "{}";
      return;
    }
    out.push_back('{');
    bool first = true;
    for (const auto& [key, item] : value.object_value) {
      if (!first) {
        out.push_back(',');
      }
      first = false;
      AppendIndent(depth + 1U, indent, out);
      AppendQuoted(key, out);
      out += indent > 0 ? ": " : ":";
      SerializeInto(item, indent, depth + 1U, out);
    }
    AppendIndent(depth, indent, out);
    out.push_back('}');
    return;
  }
  }
}

} // namespace detail

// Serializes `value`. `indent` of 0 yields compact single-line output.
inline std::string Serialize(const Value& value, int indent = 2) {
  std::string out;
  detail::SerializeInto(value, indent, 0U, out);
  return out;
}

} // namespace plugeval::core::json

#endif // PLUGEVAL_CORE_JSON_DOM_HPP_
