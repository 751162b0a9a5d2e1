#include "parser.hpp"
#include "json.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <utility>
#include <vector>

namespace meridian
{

  namespace
  {
    std::string_view trimLine(std::string_view s)
    {
      while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
      while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
      return s;
    }

    constexpr std::array<std::string_view, 8> kDefineFields = {"op", "type", "label", "description", "example_file_path",
                                                                "example_in_file_path", "required_properties", "optional_properties"};
    constexpr std::array<std::string_view, 7> kCreateFields = {"op", "type", "id", "label", "set_properties", "start_id", "end_id"};
    constexpr std::array<std::string_view, 5> kUpdateFields = {"op", "type", "id", "set_properties", "remove_properties"};
    constexpr std::array<std::string_view, 3> kDeleteFields = {"op", "type", "id"};

    template <size_t N>
    bool contains(const std::array<std::string_view, N> &fields, std::string_view name)
    {
      return std::find(fields.begin(), fields.end(), name) != fields.end();
    }

    // Members of one record object; a repeated key keeps its last value.
    class Record
    {
    public:
      Record(const json::Node &obj, uint32_t line) : line_(line)
      {
        try
        {
          obj.forEachMember([this](const std::string &key, const json::Node &val)
                            {
                              for (auto &m : members_)
                              {
                                if (m.first == key)
                                {
                                  m.second = val;
                                  return;
                                }
                              }
                              members_.emplace_back(key, val); });
        }
        catch (const json::DecodeError &e)
        {
          throw ParseError(line_, e.what());
        }
      }

      const std::vector<std::pair<std::string, json::Node>> &members() const { return members_; }

      // null counts as absent
      std::optional<json::Node> find(std::string_view name) const
      {
        for (const auto &m : members_)
        {
          if (m.first == name && m.second.kind() != json::Kind::Null)
            return m.second;
        }
        return std::nullopt;
      }

      std::optional<std::string> str(std::string_view name) const
      {
        auto n = find(name);
        if (!n)
          return std::nullopt;
        if (n->kind() != json::Kind::String)
          throw ParseError(line_, "field '" + std::string(name) + "' must be a string");
        auto s = n->asString();
        if (!s)
          throw ParseError(line_, "field '" + std::string(name) + "' holds an invalid string");
        return s;
      }

      std::optional<std::vector<std::string>> strList(std::string_view name) const
      {
        auto n = find(name);
        if (!n)
          return std::nullopt;
        if (n->kind() != json::Kind::Array)
          throw ParseError(line_, "field '" + std::string(name) + "' must be a list of strings");
        std::vector<std::string> out;
        bool bad = false;
        n->forEachElement([&](const json::Node &el)
                          {
                            auto s = el.asString();
                            if (!s)
                              bad = true;
                            else
                              out.push_back(std::move(*s)); });
        if (bad)
          throw ParseError(line_, "field '" + std::string(name) + "' must be a list of strings");
        return out;
      }

      std::optional<PropertyMap> props(std::string_view name) const
      {
        auto n = find(name);
        if (!n)
          return std::nullopt;
        if (n->kind() != json::Kind::Object)
          throw ParseError(line_, "field '" + std::string(name) + "' must be an object");
        PropertyMap out;
        try
        {
          n->forEachMember([&](const std::string &key, const json::Node &val)
                           { setProperty(out, key, val.asValue()); });
        }
        catch (const json::DecodeError &e)
        {
          throw ParseError(line_, "field '" + std::string(name) + "': " + e.what());
        }
        return out;
      }

    private:
      uint32_t line_{0};
      std::vector<std::pair<std::string, json::Node>> members_;
    };

    EntityKind parseEntityKind(const Record &rec, uint32_t line)
    {
      auto t = rec.str("type");
      if (!t)
        throw ParseError(line, "missing 'type'");
      if (*t == "node")
        return EntityKind::Node;
      if (*t == "edge")
        return EntityKind::Edge;
      throw ParseError(line, "'type' must be \"node\" or \"edge\", got '" + *t + "'");
    }

  } // namespace

  ParseError::ParseError(uint32_t line, const std::string &detail)
      : std::runtime_error("Line " + std::to_string(line) + ": " + detail), line_(line)
  {
  }

  void forEachRecordLine(std::string_view text, const std::function<void(uint32_t, std::string_view)> &fn)
  {
    uint32_t lineNumber = 0;
    size_t pos = 0;
    while (pos <= text.size())
    {
      size_t nl = text.find('\n', pos);
      size_t stop = nl == std::string_view::npos ? text.size() : nl;
      ++lineNumber;
      std::string_view line = trimLine(text.substr(pos, stop - pos));
      if (!line.empty() && line.rfind("//", 0) != 0 && line.front() != '#')
        fn(lineNumber, line);
      if (nl == std::string_view::npos)
        break;
      pos = nl + 1;
    }
  }

  Operation decodeRecord(std::string_view line, uint32_t lineNumber, uint32_t index)
  {
    auto doc = json::parseDocument(line);
    if (!doc || doc->kind() != json::Kind::Object)
      throw ParseError(lineNumber, "invalid syntax");
    Record rec(*doc, lineNumber);

    auto opName = rec.str("op");
    if (!opName)
      throw ParseError(lineNumber, "missing 'op'");
    const std::string &op = *opName;

    Operation out{};
    out.index = index;
    out.span = LineSpan{lineNumber, lineNumber};
    EntityKind kind = parseEntityKind(rec, lineNumber);

    if (op == "DEFINE")
    {
      DefineOp d{};
      d.kind = kind;
      d.label = rec.str("label");
      d.description = rec.str("description");
      d.exampleFilePath = rec.str("example_file_path");
      d.exampleInFilePath = rec.str("example_in_file_path");
      d.requiredProperties = rec.strList("required_properties").value_or(std::vector<std::string>{});
      d.optionalProperties = rec.strList("optional_properties").value_or(std::vector<std::string>{});
      out.body = std::move(d);
    }
    else if (op == "CREATE")
    {
      CreateOp c{};
      c.kind = kind;
      c.id = rec.str("id");
      c.label = rec.str("label");
      c.startId = rec.str("start_id");
      c.endId = rec.str("end_id");
      c.setProperties = rec.props("set_properties");
      out.body = std::move(c);
    }
    else if (op == "UPDATE")
    {
      UpdateOp u{};
      u.kind = kind;
      u.id = rec.str("id");
      u.setProperties = rec.props("set_properties");
      u.removeProperties = rec.strList("remove_properties");
      out.body = std::move(u);
    }
    else if (op == "DELETE")
    {
      DeleteOp d{};
      d.kind = kind;
      d.id = rec.str("id");
      out.body = std::move(d);
    }
    else
    {
      throw ParseError(lineNumber, "unknown op '" + *opName + "'");
    }

    for (const auto &m : rec.members())
    {
      bool known = false;
      switch (out.opKind())
      {
      case OpKind::Define:
        known = contains(kDefineFields, m.first);
        break;
      case OpKind::Create:
        known = contains(kCreateFields, m.first);
        break;
      case OpKind::Update:
        known = contains(kUpdateFields, m.first);
        break;
      case OpKind::Delete:
        known = contains(kDeleteFields, m.first);
        break;
      }
      if (!known)
        out.unknownFields.push_back(m.first);
    }
    return out;
  }

  ParsedBatch parseBatch(std::string_view text)
  {
    ParsedBatch out{};
    uint32_t index = 0;
    forEachRecordLine(text, [&](uint32_t lineNumber, std::string_view line)
                      {
                        try
                        {
                          out.operations.push_back(ParsedOperation{decodeRecord(line, lineNumber, index), {}});
                          ++index;
                        }
                        catch (const ParseError &e)
                        {
                          out.errors.push_back(BatchError{ErrorKind::Parse, e.line(), std::nullopt, e.what()});
                        } });
    return out;
  }

} // namespace meridian
