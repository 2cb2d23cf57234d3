#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace gridroute {

// Minimal JSON value representation and parser.
//
// Used for delivery configuration files and route exports so the tools stay
// dependency-free.
//
// Notes:
//  - Strict JSON: no comments, no trailing commas.
//  - Numbers are parsed as double.
//  - Objects are stored as an ordered list of key/value pairs (first match wins on lookup).
struct JsonValue {
  enum class Type : std::uint8_t {
    Null,
    Bool,
    Number,
    String,
    Array,
    Object,
  };

  Type type = Type::Null;

  bool boolValue = false;
  double numberValue = 0.0;
  std::string stringValue;
  std::vector<JsonValue> arrayValue;
  std::vector<std::pair<std::string, JsonValue>> objectValue;

  static JsonValue MakeNull();
  static JsonValue MakeBool(bool b);
  static JsonValue MakeNumber(double n);
  static JsonValue MakeString(std::string s);
  static JsonValue MakeArray();
  static JsonValue MakeObject();

  bool isNull() const { return type == Type::Null; }
  bool isBool() const { return type == Type::Bool; }
  bool isNumber() const { return type == Type::Number; }
  bool isString() const { return type == Type::String; }
  bool isArray() const { return type == Type::Array; }
  bool isObject() const { return type == Type::Object; }
};

const char* JsonTypeName(JsonValue::Type t);

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key);

// Parse a complete JSON document. On failure outError reads "JSON parse error @<offset>: ...".
bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError);

// Read + parse a file.
bool LoadJsonFile(const std::string& path, JsonValue& outValue, std::string& outError);

// Escape a string to be used inside a JSON string literal (without surrounding quotes).
std::string JsonEscape(const std::string& s);

struct JsonWriteOptions {
  // Pretty-print with newlines + indentation.
  bool pretty = true;

  // Spaces per indentation level when pretty-printing.
  int indent = 2;
};

// -----------------------------------------------------------------------------------------------
// JsonWriter
//
// Streaming writer: callers emit keys/values in order and the writer handles commas,
// escaping and indentation. On misuse (value without key inside an object, unbalanced
// end*, non-finite number) it records an error and every later call returns false.
// -----------------------------------------------------------------------------------------------
class JsonWriter {
public:
  explicit JsonWriter(std::ostream& os, JsonWriteOptions opt = {});

  bool ok() const { return m_error.empty(); }
  const std::string& error() const { return m_error; }

  bool beginObject();
  bool endObject();
  bool beginArray();
  bool endArray();

  // Object member key (must be inside an object).
  bool key(const std::string& k);

  bool nullValue();
  bool boolValue(bool b);
  bool numberValue(double n);
  bool intValue(std::int64_t n);
  bool stringValue(const std::string& s);

  // Serialize a JsonValue subtree in the current context.
  bool value(const JsonValue& v);

  // True once the top-level value has been completed.
  bool finished() const { return m_finished; }

private:
  struct Frame {
    enum class Kind : std::uint8_t {
      Object,
      Array,
    };

    Kind kind = Kind::Object;
    bool first = true;
    bool expectingKey = true;
  };

  bool setError(std::string msg);
  bool writeRaw(const std::string& s);
  void newlineIndent(std::size_t depth);

  bool prepareValue();
  bool finishValue();

  bool beginContainer(Frame::Kind kind, char openChar);
  bool endContainer(Frame::Kind kind, char closeChar);

  std::ostream* m_os = nullptr;
  JsonWriteOptions m_opt{};
  std::vector<Frame> m_stack;
  bool m_finished = false;
  std::string m_error;
};

} // namespace gridroute
