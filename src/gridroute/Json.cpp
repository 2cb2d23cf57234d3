#include "gridroute/Json.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <utility>

namespace gridroute {

JsonValue JsonValue::MakeNull()
{
  return JsonValue{};
}

JsonValue JsonValue::MakeBool(bool b)
{
  JsonValue v;
  v.type = Type::Bool;
  v.boolValue = b;
  return v;
}

JsonValue JsonValue::MakeNumber(double n)
{
  JsonValue v;
  v.type = Type::Number;
  v.numberValue = n;
  return v;
}

JsonValue JsonValue::MakeString(std::string s)
{
  JsonValue v;
  v.type = Type::String;
  v.stringValue = std::move(s);
  return v;
}

JsonValue JsonValue::MakeArray()
{
  JsonValue v;
  v.type = Type::Array;
  return v;
}

JsonValue JsonValue::MakeObject()
{
  JsonValue v;
  v.type = Type::Object;
  return v;
}

const char* JsonTypeName(JsonValue::Type t)
{
  switch (t) {
  case JsonValue::Type::Null: return "null";
  case JsonValue::Type::Bool: return "boolean";
  case JsonValue::Type::Number: return "number";
  case JsonValue::Type::String: return "string";
  case JsonValue::Type::Array: return "array";
  case JsonValue::Type::Object: return "object";
  }
  return "unknown";
}

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key)
{
  if (!obj.isObject()) return nullptr;
  for (const auto& kv : obj.objectValue) {
    if (kv.first == key) return &kv.second;
  }
  return nullptr;
}

std::string JsonEscape(const std::string& s)
{
  std::string out;
  out.reserve(s.size() + 2);
  for (const unsigned char ch : s) {
    switch (ch) {
    case '"': out += "\\\""; break;
    case '\\': out += "\\\\"; break;
    case '\b': out += "\\b"; break;
    case '\f': out += "\\f"; break;
    case '\n': out += "\\n"; break;
    case '\r': out += "\\r"; break;
    case '\t': out += "\\t"; break;
    default:
      if (ch < 0x20) {
        static const char* hex = "0123456789abcdef";
        out += "\\u00";
        out.push_back(hex[(ch >> 4) & 0xF]);
        out.push_back(hex[ch & 0xF]);
      } else {
        out.push_back(static_cast<char>(ch));
      }
      break;
    }
  }
  return out;
}

namespace {

void AppendUtf8(std::string& out, unsigned int cp)
{
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

// Recursive-descent reader over an in-memory document.
class JsonReader {
public:
  explicit JsonReader(const std::string& text) : m_s(text) {}

  bool readDocument(JsonValue& out)
  {
    if (!readValue(out, 0)) return false;
    skipWs();
    if (m_pos != m_s.size()) return fail("trailing characters");
    return true;
  }

  const std::string& error() const { return m_err; }

private:
  static constexpr int kMaxDepth = 256;

  bool fail(const std::string& msg)
  {
    if (m_err.empty()) m_err = "JSON parse error @" + std::to_string(m_pos) + ": " + msg;
    return false;
  }

  void skipWs()
  {
    while (m_pos < m_s.size()) {
      const char c = m_s[m_pos];
      if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
      ++m_pos;
    }
  }

  char peek() const { return m_pos < m_s.size() ? m_s[m_pos] : '\0'; }

  bool eat(char c)
  {
    if (peek() != c) return false;
    ++m_pos;
    return true;
  }

  bool literal(const char* word)
  {
    const std::string w(word);
    if (m_s.compare(m_pos, w.size(), w) != 0) return false;
    m_pos += w.size();
    return true;
  }

  static bool IsDigit(char c) { return c >= '0' && c <= '9'; }

  bool readValue(JsonValue& out, int depth)
  {
    if (depth > kMaxDepth) return fail("nesting too deep");

    skipWs();
    const char c = peek();
    switch (c) {
    case '\0': return fail("unexpected end of input");
    case '{': return readObject(out, depth);
    case '[': return readArray(out, depth);
    case '"': {
      std::string s;
      if (!readString(s)) return false;
      out = JsonValue::MakeString(std::move(s));
      return true;
    }
    case 't':
      if (!literal("true")) return fail("expected 'true'");
      out = JsonValue::MakeBool(true);
      return true;
    case 'f':
      if (!literal("false")) return fail("expected 'false'");
      out = JsonValue::MakeBool(false);
      return true;
    case 'n':
      if (!literal("null")) return fail("expected 'null'");
      out = JsonValue::MakeNull();
      return true;
    default: break;
    }

    if (c == '-' || IsDigit(c)) return readNumber(out);
    return fail(std::string("unexpected character '") + c + "'");
  }

  bool readNumber(JsonValue& out)
  {
    const std::size_t start = m_pos;
    eat('-');

    if (eat('0')) {
      // A leading zero may not be followed by more digits.
      if (IsDigit(peek())) return fail("leading zeros are not allowed");
    } else {
      if (!IsDigit(peek())) return fail("expected digit");
      while (IsDigit(peek())) ++m_pos;
    }

    if (eat('.')) {
      if (!IsDigit(peek())) return fail("expected digit after '.'");
      while (IsDigit(peek())) ++m_pos;
    }

    if (peek() == 'e' || peek() == 'E') {
      ++m_pos;
      if (peek() == '+' || peek() == '-') ++m_pos;
      if (!IsDigit(peek())) return fail("expected exponent digits");
      while (IsDigit(peek())) ++m_pos;
    }

    const std::string token = m_s.substr(start, m_pos - start);
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(token.c_str(), &end);
    if (errno == ERANGE || end != token.c_str() + token.size()) return fail("invalid number '" + token + "'");

    out = JsonValue::MakeNumber(v);
    return true;
  }

  bool readHex4(unsigned int& out)
  {
    if (m_pos + 4 > m_s.size()) return fail("truncated \\u escape");
    unsigned int v = 0;
    for (int k = 0; k < 4; ++k) {
      const char h = m_s[m_pos++];
      v <<= 4;
      if (h >= '0' && h <= '9') v |= static_cast<unsigned int>(h - '0');
      else if (h >= 'a' && h <= 'f') v |= static_cast<unsigned int>(h - 'a' + 10);
      else if (h >= 'A' && h <= 'F') v |= static_cast<unsigned int>(h - 'A' + 10);
      else return fail("invalid hex digit in \\u escape");
    }
    out = v;
    return true;
  }

  bool readString(std::string& out)
  {
    if (!eat('"')) return fail("expected string");

    out.clear();
    while (m_pos < m_s.size()) {
      const char c = m_s[m_pos++];
      if (c == '"') return true;
      if (static_cast<unsigned char>(c) < 0x20) return fail("control character in string");
      if (c != '\\') {
        out.push_back(c);
        continue;
      }

      if (m_pos >= m_s.size()) break;
      const char e = m_s[m_pos++];
      switch (e) {
      case '"': out.push_back('"'); break;
      case '\\': out.push_back('\\'); break;
      case '/': out.push_back('/'); break;
      case 'b': out.push_back('\b'); break;
      case 'f': out.push_back('\f'); break;
      case 'n': out.push_back('\n'); break;
      case 'r': out.push_back('\r'); break;
      case 't': out.push_back('\t'); break;
      case 'u': {
        unsigned int cp = 0;
        if (!readHex4(cp)) return false;
        if (cp >= 0xD800 && cp <= 0xDBFF) {
          unsigned int lo = 0;
          if (!literal("\\u") || !readHex4(lo) || lo < 0xDC00 || lo > 0xDFFF) {
            return fail("unpaired surrogate in \\u escape");
          }
          cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
        } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
          return fail("unpaired surrogate in \\u escape");
        }
        AppendUtf8(out, cp);
        break;
      }
      default: return fail(std::string("unknown escape '\\") + e + "'");
      }
    }

    return fail("unterminated string");
  }

  bool readArray(JsonValue& out, int depth)
  {
    eat('[');
    JsonValue arr = JsonValue::MakeArray();

    skipWs();
    if (!eat(']')) {
      while (true) {
        JsonValue item;
        if (!readValue(item, depth + 1)) return false;
        arr.arrayValue.push_back(std::move(item));

        skipWs();
        if (eat(']')) break;
        if (!eat(',')) return fail("expected ',' or ']'");
      }
    }

    out = std::move(arr);
    return true;
  }

  bool readObject(JsonValue& out, int depth)
  {
    eat('{');
    JsonValue obj = JsonValue::MakeObject();

    skipWs();
    if (!eat('}')) {
      while (true) {
        skipWs();
        std::string key;
        if (!readString(key)) return false;

        skipWs();
        if (!eat(':')) return fail("expected ':' after object key");

        JsonValue val;
        if (!readValue(val, depth + 1)) return false;
        obj.objectValue.emplace_back(std::move(key), std::move(val));

        skipWs();
        if (eat('}')) break;
        if (!eat(',')) return fail("expected ',' or '}'");
      }
    }

    out = std::move(obj);
    return true;
  }

  const std::string& m_s;
  std::size_t m_pos = 0;
  std::string m_err;
};

std::string FormatNumber(double n)
{
  if (n == std::floor(n) && std::fabs(n) < 1e15) {
    std::ostringstream oss;
    oss << static_cast<long long>(n);
    return oss.str();
  }
  std::ostringstream oss;
  oss << std::setprecision(15) << n;
  return oss.str();
}

} // namespace

bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError)
{
  JsonReader reader(text);
  JsonValue v;
  if (!reader.readDocument(v)) {
    outError = reader.error();
    return false;
  }
  outValue = std::move(v);
  outError.clear();
  return true;
}

bool LoadJsonFile(const std::string& path, JsonValue& outValue, std::string& outError)
{
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open '" + path + "'";
    return false;
  }

  std::ostringstream oss;
  oss << f.rdbuf();
  if (f.bad()) {
    outError = "failed to read '" + path + "'";
    return false;
  }

  if (!ParseJson(oss.str(), outValue, outError)) {
    outError = path + ": " + outError;
    return false;
  }
  return true;
}

JsonWriter::JsonWriter(std::ostream& os, JsonWriteOptions opt)
    : m_os(&os)
    , m_opt(opt)
{
}

bool JsonWriter::setError(std::string msg)
{
  if (m_error.empty()) m_error = std::move(msg);
  return false;
}

bool JsonWriter::writeRaw(const std::string& s)
{
  (*m_os) << s;
  if (!(*m_os)) return setError("stream write failed");
  return true;
}

void JsonWriter::newlineIndent(std::size_t depth)
{
  if (!m_opt.pretty) return;
  (*m_os) << '\n';
  for (std::size_t i = 0; i < depth * static_cast<std::size_t>(std::max(0, m_opt.indent)); ++i) (*m_os) << ' ';
}

bool JsonWriter::prepareValue()
{
  if (!ok()) return false;
  if (m_finished) return setError("JsonWriter: value after top-level value completed");
  if (m_stack.empty()) return true;

  Frame& f = m_stack.back();
  if (f.kind == Frame::Kind::Object) {
    if (f.expectingKey) return setError("JsonWriter: object value without key");
    return true;
  }

  if (!f.first) (*m_os) << ',';
  newlineIndent(m_stack.size());
  f.first = false;
  return true;
}

bool JsonWriter::finishValue()
{
  if (m_stack.empty()) {
    m_finished = true;
    return ok();
  }
  Frame& f = m_stack.back();
  if (f.kind == Frame::Kind::Object) f.expectingKey = true;
  return ok();
}

bool JsonWriter::beginContainer(Frame::Kind kind, char openChar)
{
  if (!prepareValue()) return false;
  (*m_os) << openChar;
  Frame f;
  f.kind = kind;
  m_stack.push_back(f);
  return ok();
}

bool JsonWriter::endContainer(Frame::Kind kind, char closeChar)
{
  if (!ok()) return false;
  if (m_stack.empty() || m_stack.back().kind != kind) return setError("JsonWriter: unbalanced container end");

  const Frame f = m_stack.back();
  if (kind == Frame::Kind::Object && !f.expectingKey) return setError("JsonWriter: key without value");

  m_stack.pop_back();
  if (!f.first) newlineIndent(m_stack.size());
  (*m_os) << closeChar;
  return finishValue();
}

bool JsonWriter::beginObject() { return beginContainer(Frame::Kind::Object, '{'); }
bool JsonWriter::endObject() { return endContainer(Frame::Kind::Object, '}'); }
bool JsonWriter::beginArray() { return beginContainer(Frame::Kind::Array, '['); }
bool JsonWriter::endArray() { return endContainer(Frame::Kind::Array, ']'); }

bool JsonWriter::key(const std::string& k)
{
  if (!ok()) return false;
  if (m_stack.empty() || m_stack.back().kind != Frame::Kind::Object) return setError("JsonWriter: key outside object");

  Frame& f = m_stack.back();
  if (!f.expectingKey) return setError("JsonWriter: two keys in a row");

  if (!f.first) (*m_os) << ',';
  newlineIndent(m_stack.size());
  f.first = false;
  f.expectingKey = false;

  return writeRaw("\"" + JsonEscape(k) + (m_opt.pretty ? "\": " : "\":"));
}

bool JsonWriter::nullValue()
{
  if (!prepareValue()) return false;
  if (!writeRaw("null")) return false;
  return finishValue();
}

bool JsonWriter::boolValue(bool b)
{
  if (!prepareValue()) return false;
  if (!writeRaw(b ? "true" : "false")) return false;
  return finishValue();
}

bool JsonWriter::numberValue(double n)
{
  if (!std::isfinite(n)) return setError("JsonWriter: non-finite number");
  if (!prepareValue()) return false;
  if (!writeRaw(FormatNumber(n))) return false;
  return finishValue();
}

bool JsonWriter::intValue(std::int64_t n)
{
  if (!prepareValue()) return false;
  if (!writeRaw(std::to_string(n))) return false;
  return finishValue();
}

bool JsonWriter::stringValue(const std::string& s)
{
  if (!prepareValue()) return false;
  if (!writeRaw("\"" + JsonEscape(s) + "\"")) return false;
  return finishValue();
}

bool JsonWriter::value(const JsonValue& v)
{
  switch (v.type) {
  case JsonValue::Type::Null: return nullValue();
  case JsonValue::Type::Bool: return boolValue(v.boolValue);
  case JsonValue::Type::Number: return numberValue(v.numberValue);
  case JsonValue::Type::String: return stringValue(v.stringValue);
  case JsonValue::Type::Array:
    if (!beginArray()) return false;
    for (const JsonValue& item : v.arrayValue) {
      if (!value(item)) return false;
    }
    return endArray();
  case JsonValue::Type::Object:
    if (!beginObject()) return false;
    for (const auto& kv : v.objectValue) {
      if (!key(kv.first) || !value(kv.second)) return false;
    }
    return endObject();
  }
  return setError("JsonWriter: unknown value type");
}

} // namespace gridroute
