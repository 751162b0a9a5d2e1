#include "applier.hpp"
#include "lint.hpp"
#include "schema_registry.hpp"
#include "sorter.hpp"
#include "validator.hpp"
#include <chrono>
#include <kj/debug.h>

namespace meridian
{

  ApplyError::ApplyError(const Operation &op, const std::string &reason)
      : std::runtime_error("Operation " + std::to_string(op.index) + " (line " + std::to_string(op.span.first) + "): " + reason),
        index_(op.index),
        line_(op.span.first)
  {
  }

  MutationResult MutationApplier::apply(std::string_view text)
  {
    return apply(lintText(text, &registry_));
  }

  MutationResult MutationApplier::apply(ParsedBatch batch)
  {
    auto started = std::chrono::steady_clock::now();
    validate(batch, &registry_);

    MutationResult out{};
    if (!batch.ok())
    {
      for (const auto &e : batch.errors)
        out.errors.push_back(e.message);
      KJ_LOG(WARNING, "batch rejected", batch.errors.size(), batch.operations.size());
      return out;
    }

    auto ordered = sortForExecution(std::move(batch.operations));
    if (ordered.empty())
    {
      out.success = true;
      return out;
    }

    std::vector<TypeDefinition> defined;
    try
    {
      Txn tx = store_.beginWrite();
      for (const auto &po : ordered)
      {
        try
        {
          execute(tx, po.op, defined);
        }
        catch (const StoreError &e)
        {
          throw ApplyError(po.op, e.what());
        }
        catch (const MdbError &e)
        {
          throw ApplyError(po.op, std::string("storage error: ") + e.what());
        }
      }
      store_.recordBatch(tx);
      tx.commit();
    }
    catch (const ApplyError &e)
    {
      KJ_LOG(WARNING, "batch aborted", e.what());
      out.errors.push_back(e.what());
      return out;
    }
    catch (const MdbError &e)
    {
      KJ_LOG(ERROR, "batch commit failed", e.what());
      out.errors.push_back(std::string("storage error: ") + e.what());
      return out;
    }

    // registry only reflects committed definitions
    for (auto &def : defined)
      registry_.upsert(std::move(def));

    out.success = true;
    out.operationsApplied = ordered.size();
    auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();
    KJ_LOG(INFO, "batch applied", out.operationsApplied, elapsedMs);
    return out;
  }

  void MutationApplier::execute(Txn &tx, const Operation &op, std::vector<TypeDefinition> &defined)
  {
    switch (op.opKind())
    {
    case OpKind::Define:
    {
      const auto &d = std::get<DefineOp>(op.body);
      TypeDefinition def{};
      def.kind = d.kind;
      def.label = d.label.value_or(std::string());
      def.description = d.description.value_or(std::string());
      def.requiredProperties = d.requiredProperties;
      def.optionalProperties = d.optionalProperties;
      def.exampleFilePath = d.exampleFilePath.value_or(std::string());
      def.exampleInFilePath = d.exampleInFilePath.value_or(std::string());
      store_.putTypeDefinition(tx, def);
      defined.push_back(std::move(def));
      break;
    }
    case OpKind::Create:
    {
      const auto &c = std::get<CreateOp>(op.body);
      UpsertEntityParams in{};
      in.id = c.id.value_or(std::string());
      in.kind = c.kind;
      in.label = c.label.value_or(std::string());
      if (c.kind == EntityKind::Edge)
      {
        in.startId = c.startId.value_or(std::string());
        in.endId = c.endId.value_or(std::string());
      }
      if (c.setProperties)
        in.setProps = *c.setProperties;
      (void)store_.upsertEntity(tx, in);
      break;
    }
    case OpKind::Update:
    {
      const auto &u = std::get<UpdateOp>(op.body);
      UpdatePropsParams in{};
      in.id = u.id.value_or(std::string());
      in.kind = u.kind;
      if (u.setProperties)
        in.setProps = *u.setProperties;
      // removal runs after the sets, so a key in both ends up absent
      if (u.removeProperties)
        in.removeKeys = *u.removeProperties;
      store_.updateProps(tx, in);
      break;
    }
    case OpKind::Delete:
    {
      const auto &d = std::get<DeleteOp>(op.body);
      auto res = store_.deleteEntity(tx, DeleteEntityParams{d.id.value_or(std::string()), d.kind});
      if (res.cascadedEdges > 0)
        KJ_LOG(INFO, "cascaded delete", op.subject().c_str(), res.cascadedEdges);
      break;
    }
    }
  }

} // namespace meridian
