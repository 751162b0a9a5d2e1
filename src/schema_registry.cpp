#include "schema_registry.hpp"
#include "store.hpp"
#include <mutex>

namespace meridian
{

  void SchemaRegistry::upsert(TypeDefinition def)
  {
    std::unique_lock lock(mu_);
    Key key{def.kind, def.label};
    defs_[std::move(key)] = std::move(def);
  }

  std::optional<TypeDefinition> SchemaRegistry::find(EntityKind kind, std::string_view label) const
  {
    std::shared_lock lock(mu_);
    auto it = defs_.find(Key{kind, std::string(label)});
    if (it == defs_.end())
      return std::nullopt;
    return it->second;
  }

  bool SchemaRegistry::contains(EntityKind kind, std::string_view label) const
  {
    std::shared_lock lock(mu_);
    return defs_.count(Key{kind, std::string(label)}) != 0;
  }

  std::vector<TypeDefinition> SchemaRegistry::list(std::optional<EntityKind> kind) const
  {
    std::shared_lock lock(mu_);
    std::vector<TypeDefinition> out;
    for (const auto &[key, def] : defs_)
    {
      if (!kind || key.first == *kind)
        out.push_back(def);
    }
    return out;
  }

  std::vector<std::string> SchemaRegistry::labels(EntityKind kind, std::string_view prefix) const
  {
    std::shared_lock lock(mu_);
    std::vector<std::string> out;
    for (auto it = defs_.lower_bound(Key{kind, std::string(prefix)}); it != defs_.end(); ++it)
    {
      if (it->first.first != kind || it->first.second.compare(0, prefix.size(), prefix) != 0)
        break;
      out.push_back(it->first.second);
    }
    return out;
  }

  size_t SchemaRegistry::size() const
  {
    std::shared_lock lock(mu_);
    return defs_.size();
  }

  std::shared_ptr<const SchemaRegistry> SchemaRegistry::snapshot() const
  {
    auto copy = std::make_shared<SchemaRegistry>();
    std::shared_lock lock(mu_);
    copy->defs_ = defs_;
    return copy;
  }

  size_t SchemaRegistry::loadFrom(Store &store)
  {
    auto defs = store.loadTypeDefinitions();
    std::unique_lock lock(mu_);
    defs_.clear();
    for (auto &def : defs)
    {
      Key key{def.kind, def.label};
      defs_[std::move(key)] = std::move(def);
    }
    return defs_.size();
  }

} // namespace meridian
