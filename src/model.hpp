#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace meridian
{

  enum class EntityKind : uint8_t
  {
    Node = 0,
    Edge = 1
  };

  inline const char *entityKindName(EntityKind k)
  {
    return k == EntityKind::Node ? "node" : "edge";
  }

  // Arrays and objects are kept as their JSON source text.
  struct JsonText
  {
    std::string raw;

    bool operator==(const JsonText &other) const { return raw == other.raw; }
  };

  using Value = std::variant<int64_t, double, bool, JsonText, std::string, std::monostate>;

  struct Property
  {
    std::string key{};
    Value val{};
  };

  // Insertion ordered, keys unique.
  using PropertyMap = std::vector<Property>;

  inline const Property *findProperty(const PropertyMap &props, std::string_view key)
  {
    for (const auto &p : props)
    {
      if (p.key == key)
        return &p;
    }
    return nullptr;
  }

  inline void setProperty(PropertyMap &props, std::string key, Value val)
  {
    for (auto &p : props)
    {
      if (p.key == key)
      {
        p.val = std::move(val);
        return;
      }
    }
    props.push_back(Property{std::move(key), std::move(val)});
  }

  struct TypeDefinition
  {
    EntityKind kind{EntityKind::Node};
    std::string label{};
    std::string description{};
    std::vector<std::string> requiredProperties{};
    std::vector<std::string> optionalProperties{};
    // where the producer first saw an instance, and that instance as written there
    std::string exampleFilePath{};
    std::string exampleInFilePath{};
  };

  // provenance keys every CREATE must carry in set_properties
  inline constexpr std::string_view kDataSourceKey = "data_source_id";
  inline constexpr std::string_view kSourcePathKey = "source_path";

} // namespace meridian
