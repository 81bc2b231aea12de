#include "geocity/Json.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace geocity {

JsonValue JsonValue::MakeNull() { return JsonValue{}; }

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

void JsonValue::set(const std::string& key, JsonValue v)
{
  if (!isObject()) return;
  if (JsonValue* existing = FindJsonMember(*this, key)) {
    *existing = std::move(v);
    return;
  }
  objectValue.emplace_back(key, std::move(v));
}

const char* JsonTypeName(JsonValue::Type t)
{
  switch (t) {
  case JsonValue::Type::Null: return "null";
  case JsonValue::Type::Bool: return "bool";
  case JsonValue::Type::Number: return "number";
  case JsonValue::Type::String: return "string";
  case JsonValue::Type::Array: return "array";
  case JsonValue::Type::Object: return "object";
  default: return "unknown";
  }
}

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key)
{
  if (!obj.isObject()) return nullptr;
  for (const auto& kv : obj.objectValue) {
    if (kv.first == key) return &kv.second;
  }
  return nullptr;
}

JsonValue* FindJsonMember(JsonValue& obj, const std::string& key)
{
  if (!obj.isObject()) return nullptr;
  for (auto& kv : obj.objectValue) {
    if (kv.first == key) return &kv.second;
  }
  return nullptr;
}

std::string JsonEscape(const std::string& s)
{
  static const char* kHex = "0123456789abcdef";

  std::string out;
  out.reserve(s.size() + 2);
  for (unsigned char ch : s) {
    switch (ch) {
    case '\\': out += "\\\\"; break;
    case '"': out += "\\\""; break;
    case '\b': out += "\\b"; break;
    case '\f': out += "\\f"; break;
    case '\n': out += "\\n"; break;
    case '\r': out += "\\r"; break;
    case '\t': out += "\\t"; break;
    default:
      if (ch < 0x20) {
        out += "\\u00";
        out.push_back(kHex[(ch >> 4) & 0xF]);
        out.push_back(kHex[ch & 0xF]);
      } else {
        out.push_back(static_cast<char>(ch));
      }
      break;
    }
  }
  return out;
}

namespace {

constexpr int kMaxDepth = 128;

class Reader {
public:
  explicit Reader(const std::string& text) : m_s(text) {}

  bool document(JsonValue& out)
  {
    if (!value(out, 0)) return false;
    skipWs();
    if (m_pos != m_s.size()) return fail("trailing characters");
    return true;
  }

  const std::string& error() const { return m_err; }

private:
  void skipWs()
  {
    while (m_pos < m_s.size() && std::isspace(static_cast<unsigned char>(m_s[m_pos])) != 0) ++m_pos;
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

  bool fail(const std::string& msg)
  {
    if (m_err.empty()) {
      std::ostringstream oss;
      oss << "JSON parse error @" << m_pos << ": " << msg;
      m_err = oss.str();
    }
    return false;
  }

  bool value(JsonValue& out, int depth)
  {
    if (depth > kMaxDepth) return fail("nesting too deep");
    skipWs();

    switch (peek()) {
    case '\0': return fail("unexpected end of input");
    case 'n':
      if (!literal("null")) return fail("expected 'null'");
      out = JsonValue::MakeNull();
      return true;
    case 't':
      if (!literal("true")) return fail("expected 'true'");
      out = JsonValue::MakeBool(true);
      return true;
    case 'f':
      if (!literal("false")) return fail("expected 'false'");
      out = JsonValue::MakeBool(false);
      return true;
    case '"': {
      std::string s;
      if (!string(s)) return false;
      out = JsonValue::MakeString(std::move(s));
      return true;
    }
    case '[': return array(out, depth);
    case '{': return object(out, depth);
    default: break;
    }

    if (peek() == '-' || std::isdigit(static_cast<unsigned char>(peek())) != 0) return number(out);
    return fail(std::string("unexpected character '") + peek() + "'");
  }

  bool digits()
  {
    if (std::isdigit(static_cast<unsigned char>(peek())) == 0) return false;
    while (std::isdigit(static_cast<unsigned char>(peek())) != 0) ++m_pos;
    return true;
  }

  bool number(JsonValue& out)
  {
    const std::size_t start = m_pos;
    eat('-');
    if (!eat('0') && !digits()) return fail("expected digit");
    if (eat('.') && !digits()) return fail("expected digit after '.'");
    if (peek() == 'e' || peek() == 'E') {
      ++m_pos;
      if (!eat('+')) eat('-');
      if (!digits()) return fail("expected exponent digits");
    }

    const std::string text = m_s.substr(start, m_pos - start);
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(text.c_str(), &end);
    if (errno == ERANGE || end != text.c_str() + text.size()) return fail("invalid number '" + text + "'");

    out = JsonValue::MakeNumber(v);
    return true;
  }

  static void AppendUtf8(std::string& out, unsigned int cp)
  {
    if (cp < 0x80) {
      out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
      out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }

  bool hex4(unsigned int& cp)
  {
    if (m_pos + 4 > m_s.size()) return fail("truncated \\u escape");
    cp = 0;
    for (int k = 0; k < 4; ++k) {
      const char h = m_s[m_pos++];
      cp <<= 4;
      if (h >= '0' && h <= '9') cp |= static_cast<unsigned int>(h - '0');
      else if (h >= 'a' && h <= 'f') cp |= static_cast<unsigned int>(h - 'a' + 10);
      else if (h >= 'A' && h <= 'F') cp |= static_cast<unsigned int>(h - 'A' + 10);
      else return fail("invalid hex digit in \\u escape");
    }
    return true;
  }

  bool string(std::string& out)
  {
    if (!eat('"')) return fail("expected string");

    std::string result;
    while (m_pos < m_s.size()) {
      const char c = m_s[m_pos++];
      if (c == '"') {
        out = std::move(result);
        return true;
      }
      if (static_cast<unsigned char>(c) < 0x20) return fail("control character in string");
      if (c != '\\') {
        result.push_back(c);
        continue;
      }

      if (m_pos >= m_s.size()) break;
      const char e = m_s[m_pos++];
      switch (e) {
      case '"': result.push_back('"'); break;
      case '\\': result.push_back('\\'); break;
      case '/': result.push_back('/'); break;
      case 'b': result.push_back('\b'); break;
      case 'f': result.push_back('\f'); break;
      case 'n': result.push_back('\n'); break;
      case 'r': result.push_back('\r'); break;
      case 't': result.push_back('\t'); break;
      case 'u': {
        unsigned int cp = 0;
        if (!hex4(cp)) return false;
        // Surrogate pairs are outside what configs carry; keep the BMP.
        if (cp >= 0xD800 && cp <= 0xDFFF) cp = '?';
        AppendUtf8(result, cp);
        break;
      }
      default: return fail(std::string("unknown escape '\\") + e + "'");
      }
    }

    return fail("unterminated string");
  }

  bool array(JsonValue& out, int depth)
  {
    eat('[');
    JsonValue arr = JsonValue::MakeArray();

    skipWs();
    if (!eat(']')) {
      while (true) {
        JsonValue v;
        if (!value(v, depth + 1)) return false;
        arr.arrayValue.push_back(std::move(v));
        skipWs();
        if (eat(']')) break;
        if (!eat(',')) return fail("expected ',' or ']'");
      }
    }

    out = std::move(arr);
    return true;
  }

  bool object(JsonValue& out, int depth)
  {
    eat('{');
    JsonValue obj = JsonValue::MakeObject();

    skipWs();
    if (!eat('}')) {
      while (true) {
        skipWs();
        std::string key;
        if (!string(key)) return false;
        skipWs();
        if (!eat(':')) return fail("expected ':'");

        JsonValue v;
        if (!value(v, depth + 1)) return false;
        obj.objectValue.emplace_back(std::move(key), std::move(v));

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

bool FormatNumber(double v, std::string& out)
{
  if (!std::isfinite(v)) return false;

  char buf[40];
  if (v == std::floor(v) && std::fabs(v) <= 9007199254740992.0) {
    std::snprintf(buf, sizeof(buf), "%.0f", v);
  } else {
    std::snprintf(buf, sizeof(buf), "%.9g", v);
  }
  out = buf;
  return true;
}

class Emitter {
public:
  Emitter(std::ostream& os, const JsonWriteOptions& opt) : m_os(os), m_opt(opt) {}

  bool emit(const JsonValue& v, int depth)
  {
    switch (v.type) {
    case JsonValue::Type::Null: m_os << "null"; break;
    case JsonValue::Type::Bool: m_os << (v.boolValue ? "true" : "false"); break;
    case JsonValue::Type::Number: {
      std::string num;
      if (!FormatNumber(v.numberValue, num)) {
        m_err = "cannot write non-finite number";
        return false;
      }
      m_os << num;
      break;
    }
    case JsonValue::Type::String: m_os << '"' << JsonEscape(v.stringValue) << '"'; break;
    case JsonValue::Type::Array: {
      if (v.arrayValue.empty()) {
        m_os << "[]";
        break;
      }
      m_os << '[';
      for (std::size_t i = 0; i < v.arrayValue.size(); ++i) {
        if (i) m_os << ',';
        newline(depth + 1);
        if (!emit(v.arrayValue[i], depth + 1)) return false;
      }
      newline(depth);
      m_os << ']';
      break;
    }
    case JsonValue::Type::Object: {
      if (v.objectValue.empty()) {
        m_os << "{}";
        break;
      }
      m_os << '{';
      for (std::size_t i = 0; i < v.objectValue.size(); ++i) {
        if (i) m_os << ',';
        newline(depth + 1);
        m_os << '"' << JsonEscape(v.objectValue[i].first) << "\":";
        if (m_opt.pretty) m_os << ' ';
        if (!emit(v.objectValue[i].second, depth + 1)) return false;
      }
      newline(depth);
      m_os << '}';
      break;
    }
    }
    return true;
  }

  const std::string& error() const { return m_err; }

private:
  void newline(int depth)
  {
    if (!m_opt.pretty) return;
    m_os << '\n';
    for (int i = 0; i < depth * m_opt.indent; ++i) m_os << ' ';
  }

  std::ostream& m_os;
  const JsonWriteOptions& m_opt;
  std::string m_err;
};

} // namespace

bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError)
{
  Reader r(text);
  JsonValue v;
  if (!r.document(v)) {
    outError = r.error();
    return false;
  }
  outValue = std::move(v);
  outError.clear();
  return true;
}

bool ReadJsonFile(const std::string& path, JsonValue& outValue, std::string& outError)
{
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open " + path;
    return false;
  }
  std::ostringstream ss;
  ss << f.rdbuf();
  if (!ParseJson(ss.str(), outValue, outError)) {
    outError = path + ": " + outError;
    return false;
  }
  return true;
}

bool WriteJson(std::ostream& os, const JsonValue& value, std::string& outError, const JsonWriteOptions& opt)
{
  Emitter e(os, opt);
  if (!e.emit(value, 0)) {
    outError = e.error();
    return false;
  }
  if (opt.pretty) os << '\n';
  if (!os) {
    outError = "stream write failed";
    return false;
  }
  return true;
}

std::string JsonStringify(const JsonValue& value, const JsonWriteOptions& opt)
{
  std::ostringstream oss;
  std::string err;
  if (!WriteJson(oss, value, err, opt)) return std::string();
  return oss.str();
}

bool WriteJsonFile(const std::string& path, const JsonValue& value, std::string& outError, const JsonWriteOptions& opt)
{
  std::ofstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open " + path + " for writing";
    return false;
  }
  return WriteJson(f, value, outError, opt);
}

} // namespace geocity
