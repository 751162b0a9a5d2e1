#include "json.hpp"
#include <mongoose.h>
#include <charconv>
#include <cmath>
#include <cstdint>

namespace meridian::json
{

  namespace
  {
    mg_str to_mg(std::string_view s)
    {
      return mg_str_n(s.data(), s.size());
    }

    bool isSpace(char c)
    {
      return c == ' ' || c == '\t' || c == '\r' || c == '\n';
    }

    std::string_view trim(std::string_view s)
    {
      while (!s.empty() && isSpace(s.front()))
        s.remove_prefix(1);
      while (!s.empty() && isSpace(s.back()))
        s.remove_suffix(1);
      return s;
    }

    int hexValue(char c)
    {
      if (c >= '0' && c <= '9')
        return c - '0';
      if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
      if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
      return -1;
    }

    // Four hex digits starting at s[i]; -1 when malformed.
    long readHex4(std::string_view s, size_t i)
    {
      if (i + 4 > s.size())
        return -1;
      long cp = 0;
      for (size_t k = i; k < i + 4; ++k)
      {
        int h = hexValue(s[k]);
        if (h < 0)
          return -1;
        cp = cp * 16 + h;
      }
      return cp;
    }

    void appendUtf8(std::string &out, uint32_t cp)
    {
      if (cp < 0x80)
      {
        out.push_back(static_cast<char>(cp));
      }
      else if (cp < 0x800)
      {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
      }
      else if (cp < 0x10000)
      {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
      }
      else
      {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
      }
    }

    // Body of a string token, quotes stripped. Surrogate pairs combine; a lone
    // surrogate, a bad escape or a raw control character fails.
    std::optional<std::string> unescape(std::string_view body)
    {
      std::string out;
      out.reserve(body.size());
      for (size_t i = 0; i < body.size(); ++i)
      {
        char c = body[i];
        if (static_cast<unsigned char>(c) < 0x20)
          return std::nullopt;
        if (c != '\\')
        {
          out.push_back(c);
          continue;
        }
        if (++i >= body.size())
          return std::nullopt;
        switch (body[i])
        {
        case '"':
          out.push_back('"');
          break;
        case '\\':
          out.push_back('\\');
          break;
        case '/':
          out.push_back('/');
          break;
        case 'b':
          out.push_back('\b');
          break;
        case 'f':
          out.push_back('\f');
          break;
        case 'n':
          out.push_back('\n');
          break;
        case 'r':
          out.push_back('\r');
          break;
        case 't':
          out.push_back('\t');
          break;
        case 'u':
        {
          long hi = readHex4(body, i + 1);
          if (hi < 0)
            return std::nullopt;
          i += 4;
          uint32_t cp = static_cast<uint32_t>(hi);
          if (cp >= 0xDC00 && cp <= 0xDFFF)
            return std::nullopt;
          if (cp >= 0xD800 && cp <= 0xDBFF)
          {
            if (i + 2 >= body.size() || body[i + 1] != '\\' || body[i + 2] != 'u')
              return std::nullopt;
            long lo = readHex4(body, i + 3);
            if (lo < 0xDC00 || lo > 0xDFFF)
              return std::nullopt;
            i += 6;
            cp = 0x10000 + ((cp - 0xD800) << 10) + (static_cast<uint32_t>(lo) - 0xDC00);
          }
          appendUtf8(out, cp);
          break;
        }
        default:
          return std::nullopt;
        }
      }
      return out;
    }
  } // namespace

  DecodeError::DecodeError(const std::string &what) : std::runtime_error(what) {}

  Kind Node::kind() const
  {
    if (raw_.empty())
      return Kind::Null;
    switch (raw_.front())
    {
    case 'n':
      return Kind::Null;
    case 't':
    case 'f':
      return Kind::Bool;
    case '"':
      return Kind::String;
    case '[':
      return Kind::Array;
    case '{':
      return Kind::Object;
    default:
      return Kind::Number;
    }
  }

  std::optional<std::string> Node::asString() const
  {
    if (kind() != Kind::String || raw_.size() < 2 || raw_.back() != '"')
      return std::nullopt;
    return unescape(raw_.substr(1, raw_.size() - 2));
  }

  std::optional<bool> Node::asBool() const
  {
    bool b = false;
    if (kind() != Kind::Bool || !mg_json_get_bool(to_mg(raw_), "$", &b))
      return std::nullopt;
    return b;
  }

  std::optional<double> Node::asNumber() const
  {
    double d = 0;
    if (kind() != Kind::Number || !mg_json_get_num(to_mg(raw_), "$", &d))
      return std::nullopt;
    return d;
  }

  std::optional<int64_t> Node::asInteger() const
  {
    if (kind() != Kind::Number || raw_.find_first_of(".eE") != std::string_view::npos)
      return std::nullopt;
    int64_t x = 0;
    auto res = std::from_chars(raw_.data(), raw_.data() + raw_.size(), x);
    if (res.ec != std::errc{} || res.ptr != raw_.data() + raw_.size())
      return std::nullopt;
    return x;
  }

  Value Node::asValue() const
  {
    switch (kind())
    {
    case Kind::Bool:
      return asBool().value_or(false);
    case Kind::Number:
      if (auto i = asInteger())
        return *i;
      return asNumber().value_or(0.0);
    case Kind::String:
    {
      auto s = asString();
      if (!s)
        throw DecodeError("invalid string " + std::string(raw_));
      return std::move(*s);
    }
    case Kind::Array:
    case Kind::Object:
      return JsonText{std::string(raw_)};
    case Kind::Null:
    default:
      return std::monostate{};
    }
  }

  void Node::forEachMember(const std::function<void(const std::string &, const Node &)> &fn) const
  {
    if (kind() != Kind::Object)
      return;
    mg_str obj = to_mg(raw_), key{}, val{};
    size_t ofs = 0;
    while ((ofs = mg_json_next(obj, ofs, &key, &val)) > 0)
    {
      auto name = Node(std::string_view(key.buf, key.len)).asString();
      if (!name)
        throw DecodeError("invalid object key " + std::string(key.buf, key.len));
      fn(*name, Node(std::string_view(val.buf, val.len)));
    }
  }

  void Node::forEachElement(const std::function<void(const Node &)> &fn) const
  {
    if (kind() != Kind::Array)
      return;
    mg_str arr = to_mg(raw_), val{};
    size_t ofs = 0;
    while ((ofs = mg_json_next(arr, ofs, nullptr, &val)) > 0)
      fn(Node(std::string_view(val.buf, val.len)));
  }

  std::optional<Node> parseDocument(std::string_view text)
  {
    std::string_view body = trim(text);
    if (body.empty())
      return std::nullopt;
    int len = 0;
    int off = mg_json_get(to_mg(body), "$", &len);
    if (off != 0 || len <= 0 || static_cast<size_t>(len) != body.size())
      return std::nullopt;
    return Node(body);
  }

  std::string quote(std::string_view s)
  {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (char c : s)
    {
      switch (c)
      {
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
      default:
        if (static_cast<unsigned char>(c) < 0x20)
        {
          static constexpr char kHex[] = "0123456789abcdef";
          out += "\\u00";
          out.push_back(kHex[(c >> 4) & 0xF]);
          out.push_back(kHex[c & 0xF]);
        }
        else
        {
          out.push_back(c);
        }
      }
    }
    out.push_back('"');
    return out;
  }

  std::string encodeValue(const Value &v)
  {
    if (std::holds_alternative<int64_t>(v))
      return std::to_string(std::get<int64_t>(v));
    if (std::holds_alternative<double>(v))
    {
      double d = std::get<double>(v);
      if (!std::isfinite(d))
        return "null";
      char buf[32];
      auto res = std::to_chars(buf, buf + sizeof(buf), d);
      return std::string(buf, res.ptr);
    }
    if (std::holds_alternative<bool>(v))
      return std::get<bool>(v) ? "true" : "false";
    if (std::holds_alternative<JsonText>(v))
      return std::get<JsonText>(v).raw;
    if (std::holds_alternative<std::string>(v))
      return quote(std::get<std::string>(v));
    return "null";
  }

} // namespace meridian::json
