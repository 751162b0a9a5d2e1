#pragma once
#include "model.hpp"
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace meridian
{

  class Store;

  // Declared type definitions keyed by (kind, label). Safe for concurrent readers.
  class SchemaRegistry
  {
  public:
    SchemaRegistry() = default;
    SchemaRegistry(const SchemaRegistry &) = delete;
    SchemaRegistry &operator=(const SchemaRegistry &) = delete;

    // Last write wins.
    void upsert(TypeDefinition def);
    std::optional<TypeDefinition> find(EntityKind kind, std::string_view label) const;
    bool contains(EntityKind kind, std::string_view label) const;
    // All definitions, or only those of one kind, ordered by label.
    std::vector<TypeDefinition> list(std::optional<EntityKind> kind = std::nullopt) const;
    // Labels of one kind starting with prefix, for autocomplete.
    std::vector<std::string> labels(EntityKind kind, std::string_view prefix = {}) const;
    size_t size() const;
    // Independent copy of the current definitions.
    std::shared_ptr<const SchemaRegistry> snapshot() const;

    // Replaces the contents with the definitions persisted in the store.
    size_t loadFrom(Store &store);

  private:
    using Key = std::pair<EntityKind, std::string>;

    mutable std::shared_mutex mu_;
    std::map<Key, TypeDefinition> defs_;
  };

} // namespace meridian
