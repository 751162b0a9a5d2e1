#include "validator.hpp"
#include "schema_registry.hpp"
#include <algorithm>
#include <map>
#include <optional>
#include <utility>

namespace meridian
{

  namespace
  {
    using DefineKey = std::pair<EntityKind, std::string>;

    bool isIdChar(char c)
    {
      return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
    }

    bool isHexDigit(char c)
    {
      return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    }

    std::string quoted(std::string_view s)
    {
      return "'" + std::string(s) + "'";
    }

    std::string present(const std::optional<std::string> &s)
    {
      return s ? *s : std::string();
    }

    void checkIdShape(std::vector<std::string> &warnings, const char *field, const std::optional<std::string> &id)
    {
      if (id && !id->empty() && !isCanonicalId(*id))
        warnings.push_back(std::string(field) + " " + quoted(*id) + " is not in canonical form '<label>:<16 hex digits>'");
    }

    class WarningCheck
    {
    public:
      WarningCheck(const std::map<DefineKey, const DefineOp *> &batchDefs, const SchemaRegistry *registry,
                   std::vector<std::string> &out)
          : batchDefs_(batchDefs), registry_(registry), out_(out)
      {
      }

      void operator()(const DefineOp &d) const
      {
        if (!d.description || d.description->empty())
          out_.push_back("DEFINE has no description");
      }

      void operator()(const CreateOp &c) const
      {
        checkIdShape(out_, "id", c.id);
        if (c.id && c.label && isCanonicalId(*c.id) && idPrefix(*c.id) != *c.label)
          out_.push_back("id prefix " + quoted(idPrefix(*c.id)) + " does not match label " + quoted(*c.label));
        if (c.kind == EntityKind::Edge)
        {
          checkIdShape(out_, "start_id", c.startId);
          checkIdShape(out_, "end_id", c.endId);
        }
        else if (c.startId || c.endId)
        {
          out_.push_back("start_id/end_id are ignored for nodes");
        }

        if (!c.label || c.label->empty())
          return;
        std::optional<TypeDefinition> def;
        auto it = batchDefs_.find(DefineKey{c.kind, *c.label});
        if (it != batchDefs_.end())
        {
          const DefineOp &d = *it->second;
          def = TypeDefinition{d.kind, present(d.label), present(d.description), d.requiredProperties, d.optionalProperties,
                               present(d.exampleFilePath), present(d.exampleInFilePath)};
        }
        else if (registry_ != nullptr)
        {
          def = registry_->find(c.kind, *c.label);
          if (!def)
            out_.push_back("label " + quoted(*c.label) + " undefined");
        }
        if (!def)
          return;
        for (const auto &req : def->requiredProperties)
        {
          if (!c.setProperties || findProperty(*c.setProperties, req) == nullptr)
            out_.push_back("missing required property " + quoted(req) + " for " + entityKindName(c.kind) + " " + quoted(*c.label));
        }
      }

      void operator()(const UpdateOp &u) const
      {
        checkIdShape(out_, "id", u.id);
        bool hasSet = u.setProperties && !u.setProperties->empty();
        bool hasRemove = u.removeProperties && !u.removeProperties->empty();
        if (!hasSet && !hasRemove)
        {
          out_.push_back("UPDATE has no set_properties or remove_properties");
          return;
        }
        if (hasSet && hasRemove)
        {
          for (const auto &key : *u.removeProperties)
          {
            if (findProperty(*u.setProperties, key) != nullptr)
              out_.push_back("property " + quoted(key) + " is both set and removed; remove wins");
          }
        }
      }

      void operator()(const DeleteOp &d) const
      {
        checkIdShape(out_, "id", d.id);
      }

    private:
      const std::map<DefineKey, const DefineOp *> &batchDefs_;
      const SchemaRegistry *registry_;
      std::vector<std::string> &out_;
    };

    class StructuralCheck
    {
    public:
      explicit StructuralCheck(std::vector<std::string> &out) : out_(out) {}

      void operator()(const DefineOp &d) const
      {
        if (!d.label || d.label->empty())
          out_.push_back("DEFINE is missing 'label'");
      }

      void operator()(const CreateOp &c) const
      {
        if (!c.id || c.id->empty())
          out_.push_back("CREATE is missing 'id'");
        if (!c.label || c.label->empty())
          out_.push_back("CREATE is missing 'label'");
        if (c.kind == EntityKind::Edge && (!c.startId || c.startId->empty() || !c.endId || c.endId->empty()))
          out_.push_back("CREATE edge requires 'start_id' and 'end_id'");
        if (!c.setProperties)
        {
          out_.push_back("CREATE is missing 'set_properties' with '" + std::string(kDataSourceKey) + "' and '" +
                         std::string(kSourcePathKey) + "'");
          return;
        }
        for (auto key : {kDataSourceKey, kSourcePathKey})
        {
          if (findProperty(*c.setProperties, key) == nullptr)
            out_.push_back("CREATE set_properties is missing '" + std::string(key) + "'");
        }
      }

      void operator()(const UpdateOp &u) const
      {
        if (!u.id || u.id->empty())
          out_.push_back("UPDATE is missing 'id'");
      }

      void operator()(const DeleteOp &d) const
      {
        if (!d.id || d.id->empty())
          out_.push_back("DELETE is missing 'id'");
      }

    private:
      std::vector<std::string> &out_;
    };

  } // namespace

  bool isCanonicalId(std::string_view id)
  {
    size_t colon = id.find(':');
    if (colon == std::string_view::npos || colon == 0)
      return false;
    std::string_view prefix = id.substr(0, colon);
    std::string_view hex = id.substr(colon + 1);
    if (hex.size() != 16)
      return false;
    return std::all_of(prefix.begin(), prefix.end(), isIdChar) && std::all_of(hex.begin(), hex.end(), isHexDigit);
  }

  std::string_view idPrefix(std::string_view id)
  {
    size_t colon = id.find(':');
    return colon == std::string_view::npos ? id : id.substr(0, colon);
  }

  std::vector<std::string> structuralProblems(const Operation &op)
  {
    std::vector<std::string> out;
    std::visit(StructuralCheck(out), op.body);
    return out;
  }

  void validate(ParsedBatch &batch, const SchemaRegistry *registry)
  {
    batch.errors.erase(std::remove_if(batch.errors.begin(), batch.errors.end(), [](const BatchError &e)
                                      { return e.kind == ErrorKind::Structural; }),
                       batch.errors.end());

    // in-batch defines take precedence over the registry; the last one wins
    std::map<DefineKey, const DefineOp *> batchDefs;
    for (const auto &po : batch.operations)
    {
      if (auto *d = std::get_if<DefineOp>(&po.op.body); d && d->label && !d->label->empty())
        batchDefs[DefineKey{d->kind, *d->label}] = d;
    }

    for (auto &po : batch.operations)
    {
      const Operation &op = po.op;
      for (auto &problem : structuralProblems(op))
      {
        std::string msg = "Line " + std::to_string(op.span.first) + " (operation " + std::to_string(op.index) + "): " + problem;
        batch.errors.push_back(BatchError{ErrorKind::Structural, op.span.first, op.index, std::move(msg)});
      }

      po.warnings.clear();
      std::visit(WarningCheck(batchDefs, registry, po.warnings), op.body);
      for (const auto &field : op.unknownFields)
        po.warnings.push_back("unknown field " + quoted(field) + " for " + opKindName(op.opKind()));
    }

    std::stable_sort(batch.errors.begin(), batch.errors.end(), [](const BatchError &a, const BatchError &b)
                     { return a.line < b.line; });
  }

} // namespace meridian
