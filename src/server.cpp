#include "server.hpp"
#include "lint.hpp"
#include <kj/debug.h>
#include <algorithm>
#include <string>
#include <string_view>

namespace meridian::rpc
{

  namespace
  {

    std::string_view textView(capnp::Text::Reader t)
    {
      return std::string_view(t.begin(), t.size());
    }

    meridian::EntityKind fromRpcKind(EntityKind k)
    {
      return k == EntityKind::EDGE ? meridian::EntityKind::Edge : meridian::EntityKind::Node;
    }

    EntityKind toRpcKind(meridian::EntityKind k)
    {
      return k == meridian::EntityKind::Edge ? EntityKind::EDGE : EntityKind::NODE;
    }

    OpKind toRpcOpKind(meridian::OpKind k)
    {
      switch (k)
      {
      case meridian::OpKind::Define:
        return OpKind::DEFINE;
      case meridian::OpKind::Create:
        return OpKind::CREATE;
      case meridian::OpKind::Update:
        return OpKind::UPDATE;
      case meridian::OpKind::Delete:
      default:
        return OpKind::DELETE;
      }
    }

    LintMode toRpcMode(meridian::LintMode m)
    {
      switch (m)
      {
      case meridian::LintMode::Background:
        return LintMode::BACKGROUND;
      case meridian::LintMode::Summary:
        return LintMode::SUMMARY;
      case meridian::LintMode::Inline:
      default:
        return LintMode::INLINE;
      }
    }

    meridian::Direction fromRpcDirection(Direction d)
    {
      switch (d)
      {
      case Direction::OUT:
        return meridian::Direction::Out;
      case Direction::IN:
        return meridian::Direction::In;
      case Direction::BOTH:
      default:
        return meridian::Direction::Both;
      }
    }

    Direction toRpcDirection(meridian::Direction d)
    {
      switch (d)
      {
      case meridian::Direction::Out:
        return Direction::OUT;
      case meridian::Direction::In:
        return Direction::IN;
      case meridian::Direction::Both:
      default:
        return Direction::BOTH;
      }
    }

    void toRpcValue(Value::Builder b, const meridian::Value &v)
    {
      if (std::holds_alternative<int64_t>(v))
      {
        b.setI64(std::get<int64_t>(v));
        return;
      }
      if (std::holds_alternative<double>(v))
      {
        b.setF64(std::get<double>(v));
        return;
      }
      if (std::holds_alternative<bool>(v))
      {
        b.setBoolv(std::get<bool>(v));
        return;
      }
      if (std::holds_alternative<meridian::JsonText>(v))
      {
        b.setJson(std::get<meridian::JsonText>(v).raw);
        return;
      }
      if (std::holds_alternative<std::string>(v))
      {
        b.setText(std::get<std::string>(v));
        return;
      }
      b.setNullv();
    }

    void toRpcTypeDefinition(TypeDefinition::Builder b, const meridian::TypeDefinition &d)
    {
      b.setKind(toRpcKind(d.kind));
      b.setLabel(d.label);
      b.setDescription(d.description);
      b.setExampleFilePath(d.exampleFilePath);
      b.setExampleInFilePath(d.exampleInFilePath);
      auto req = b.initRequiredProperties(d.requiredProperties.size());
      for (uint32_t i = 0; i < d.requiredProperties.size(); ++i)
        req.set(i, d.requiredProperties[i]);
      auto opt = b.initOptionalProperties(d.optionalProperties.size());
      for (uint32_t i = 0; i < d.optionalProperties.size(); ++i)
        opt.set(i, d.optionalProperties[i]);
    }

    void toRpcMutationResult(MutationResult::Builder b, const meridian::MutationResult &r)
    {
      b.setSuccess(r.success);
      b.setOperationsApplied(r.operationsApplied);
      auto errs = b.initErrors(r.errors.size());
      for (uint32_t i = 0; i < r.errors.size(); ++i)
        errs.set(i, r.errors[i]);
    }

    void toRpcBreakdown(Breakdown::Builder b, const meridian::OpBreakdown &bd)
    {
      b.setDefines(bd.defines);
      b.setCreates(bd.creates);
      b.setUpdates(bd.updates);
      b.setDeletes(bd.deletes);
      b.setUnknown(bd.unknown);
    }

    void toRpcDiagnostic(Diagnostic::Builder b, const meridian::BatchError &e)
    {
      b.setSeverity(e.kind == meridian::ErrorKind::Parse ? Severity::PARSE_ERROR : Severity::STRUCTURAL_ERROR);
      b.setLine(e.line);
      b.setIndex(e.index ? int64_t(*e.index) : -1);
      b.setMessage(e.message);
    }

    void toRpcPreview(OperationPreview::Builder b, const meridian::OperationPreview &p)
    {
      b.setLine(p.line);
      b.setOp(toRpcOpKind(p.op));
      b.setKind(toRpcKind(p.kind));
      b.setLabel(p.label);
      b.setId(p.id);
    }

    void toRpcLintReport(LintReport::Builder b, const meridian::LintOutcome &o, size_t previewLimit)
    {
      b.setSeq(o.seq);
      b.setMode(toRpcMode(o.mode));
      b.setElapsedMicros(uint64_t(o.elapsed.count()));

      if (o.mode == meridian::LintMode::Summary)
      {
        const auto &s = o.summary;
        b.setOperationCount(s.breakdown.total() - s.breakdown.unknown);
        b.setErrorCount(s.totalErrors);
        b.setSubmittable(false);
        toRpcBreakdown(b.initBreakdown(), s.breakdown);
        auto diags = b.initDiagnostics(s.errors.size());
        for (uint32_t i = 0; i < s.errors.size(); ++i)
          toRpcDiagnostic(diags[i], s.errors[i]);
        auto previews = b.initPreviews(s.previews.size());
        for (uint32_t i = 0; i < s.previews.size(); ++i)
          toRpcPreview(previews[i], s.previews[i]);
        return;
      }

      const auto &batch = o.batch;
      size_t warnings = batch.warningCount();
      b.setOperationCount(batch.operations.size());
      b.setWarningCount(warnings);
      b.setErrorCount(batch.errors.size());
      b.setSubmittable(batch.ok());
      toRpcBreakdown(b.initBreakdown(), meridian::breakdownOf(batch));

      auto diags = b.initDiagnostics(batch.errors.size() + warnings);
      uint32_t n = 0;
      for (const auto &e : batch.errors)
        toRpcDiagnostic(diags[n++], e);
      for (const auto &po : batch.operations)
      {
        for (const auto &w : po.warnings)
        {
          auto d = diags[n++];
          d.setSeverity(Severity::WARNING);
          d.setLine(po.op.span.first);
          d.setIndex(po.op.index);
          d.setMessage(w);
        }
      }

      size_t count = std::min(previewLimit, batch.operations.size());
      auto previews = b.initPreviews(count);
      for (uint32_t i = 0; i < count; ++i)
        toRpcPreview(previews[i], meridian::previewOf(batch.operations[i].op));
    }

  } // namespace

  // -------------------- lint session ---------------------------

  LintSessionImpl::LintSessionImpl(const meridian::SchemaRegistry &registry, kj::Timer &timer,
                                   meridian::DispatcherConfig config)
      : timer_(timer), dispatcher_(&registry, config)
  {
  }

  kj::Promise<void> LintSessionImpl::update(UpdateContext ctx)
  {
    auto text = ctx.getParams().getText();
    auto outcome = dispatcher_.request(std::string(textView(text)));
    auto res = ctx.getResults();
    res.setReady(outcome.has_value());
    if (outcome)
      toRpcLintReport(res.initReport(), *outcome, dispatcher_.config().summary.previewLimit);
    else
      res.initReport().setSeq(dispatcher_.latestSeq());
    return kj::READY_NOW;
  }

  kj::Promise<void> LintSessionImpl::poll(PollContext ctx)
  {
    auto deadline = timer_.now() + int64_t(ctx.getParams().getWaitMs()) * kj::MILLISECONDS;
    return pollUntil(ctx, deadline);
  }

  kj::Promise<void> LintSessionImpl::pollUntil(PollContext ctx, kj::TimePoint deadline)
  {
    // never block the event loop; check the inbox and re-arm a short timer instead
    auto outcome = dispatcher_.poll(std::chrono::milliseconds(0));
    if (outcome || timer_.now() >= deadline)
    {
      auto res = ctx.getResults();
      res.setReady(outcome.has_value());
      if (outcome)
        toRpcLintReport(res.initReport(), *outcome, dispatcher_.config().summary.previewLimit);
      else
        res.initReport().setSeq(dispatcher_.latestSeq());
      return kj::READY_NOW;
    }
    return timer_.afterDelay(10 * kj::MILLISECONDS).then([this, ctx, deadline]() mutable
                                                         { return pollUntil(ctx, deadline); });
  }

  // -------------------- meridian ---------------------------

  MeridianImpl::MeridianImpl(meridian::Store &s, meridian::SchemaRegistry &registry, meridian::DispatcherConfig config)
      : store_(s), registry_(registry), config_(config), applier_(s, registry)
  {
  }

  kj::Promise<void> MeridianImpl::applyBatch(ApplyBatchContext ctx)
  {
    auto text = ctx.getParams().getText();
    KJ_LOG(INFO, "applyBatch", text.size());
    auto result = applier_.apply(textView(text));
    toRpcMutationResult(ctx.getResults().initResult(), result);
    return kj::READY_NOW;
  }

  kj::Promise<void> MeridianImpl::lint(LintContext ctx)
  {
    auto text = ctx.getParams().getText();
    meridian::LintOutcome outcome{};
    auto started = std::chrono::steady_clock::now();
    outcome.batch = meridian::lintText(textView(text), &registry_);
    outcome.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started);
    toRpcLintReport(ctx.getResults().initReport(), outcome, config_.summary.previewLimit);
    return kj::READY_NOW;
  }

  kj::Promise<void> MeridianImpl::openLintSession(OpenLintSessionContext ctx)
  {
    KJ_REQUIRE(timer_ != nullptr, "lint sessions are unavailable without a timer");
    ctx.getResults().setSession(kj::heap<LintSessionImpl>(registry_, *timer_, config_));
    return kj::READY_NOW;
  }

  kj::Promise<void> MeridianImpl::listTypes(ListTypesContext ctx)
  {
    auto p = ctx.getParams();
    std::optional<meridian::EntityKind> kind;
    if (!p.getAllKinds())
      kind = fromRpcKind(p.getKind());
    auto defs = registry_.list(kind);
    auto out = ctx.getResults().initTypes(defs.size());
    for (uint32_t i = 0; i < defs.size(); ++i)
      toRpcTypeDefinition(out[i], defs[i]);
    return kj::READY_NOW;
  }

  kj::Promise<void> MeridianImpl::getType(GetTypeContext ctx)
  {
    auto p = ctx.getParams();
    auto def = registry_.find(fromRpcKind(p.getKind()), textView(p.getLabel()));
    auto res = ctx.getResults();
    res.setFound(def.has_value());
    if (def)
      toRpcTypeDefinition(res.initDefinition(), *def);
    return kj::READY_NOW;
  }

  kj::Promise<void> MeridianImpl::listLabels(ListLabelsContext ctx)
  {
    auto p = ctx.getParams();
    auto labels = registry_.labels(fromRpcKind(p.getKind()), textView(p.getPrefix()));
    auto out = ctx.getResults().initLabels(labels.size());
    for (uint32_t i = 0; i < labels.size(); ++i)
      out.set(i, labels[i]);
    return kj::READY_NOW;
  }

  kj::Promise<void> MeridianImpl::getEntity(GetEntityContext ctx)
  {
    auto entity = store_.getEntity(std::string(textView(ctx.getParams().getId())));
    auto res = ctx.getResults();
    res.setFound(entity.has_value());
    if (!entity)
      return kj::READY_NOW;
    auto b = res.initEntity();
    b.setId(entity->id);
    b.setKind(toRpcKind(entity->header.kind));
    b.setLabel(entity->header.label);
    b.setStartId(entity->header.startId);
    b.setEndId(entity->header.endId);
    auto props = b.initProps(entity->props.size());
    for (uint32_t i = 0; i < entity->props.size(); ++i)
    {
      props[i].setKey(entity->props[i].key);
      toRpcValue(props[i].initVal(), entity->props[i].val);
    }
    return kj::READY_NOW;
  }

  kj::Promise<void> MeridianImpl::listIncident(ListIncidentContext ctx)
  {
    auto p = ctx.getParams();
    meridian::ListIncidentParams in{};
    in.node = std::string(textView(p.getId()));
    in.direction = fromRpcDirection(p.getDirection());
    in.limit = p.getLimit();
    auto edges = store_.listIncident(in);
    auto out = ctx.getResults().initEdges(edges.size());
    for (uint32_t i = 0; i < edges.size(); ++i)
    {
      out[i].setEdgeId(edges[i].edgeId);
      out[i].setNeighborId(edges[i].neighborId);
      out[i].setLabel(edges[i].label);
      out[i].setDirection(toRpcDirection(edges[i].direction));
    }
    return kj::READY_NOW;
  }

  kj::Promise<void> MeridianImpl::scanByLabel(ScanByLabelContext ctx)
  {
    auto p = ctx.getParams();
    meridian::ScanByLabelParams in{};
    in.kind = fromRpcKind(p.getKind());
    in.label = std::string(textView(p.getLabel()));
    in.limit = p.getLimit();
    auto ids = store_.scanByLabel(in);
    auto out = ctx.getResults().initIds(ids.size());
    for (uint32_t i = 0; i < ids.size(); ++i)
      out.set(i, ids[i]);
    return kj::READY_NOW;
  }

  kj::Promise<void> MeridianImpl::stats(StatsContext ctx)
  {
    auto c = store_.counts();
    auto b = ctx.getResults().initStats();
    b.setNodes(c.nodes);
    b.setEdges(c.edges);
    b.setTypeDefinitions(c.typeDefinitions);
    b.setBatches(c.batches);
    return kj::READY_NOW;
  }

} // namespace meridian::rpc
