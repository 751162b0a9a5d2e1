#pragma once
#include "applier.hpp"
#include "dispatcher.hpp"
#include "schema_registry.hpp"
#include "store.hpp"
#include "schemas/meridian.capnp.h"
#include <capnp/ez-rpc.h>
#include <kj/async-io.h>
#include <kj/timer.h>

namespace meridian::rpc
{

  class LintSessionImpl final : public LintSession::Server
  {
  public:
    LintSessionImpl(const meridian::SchemaRegistry &registry, kj::Timer &timer, meridian::DispatcherConfig config);

    kj::Promise<void> update(UpdateContext ctx) override;
    kj::Promise<void> poll(PollContext ctx) override;

  private:
    kj::Promise<void> pollUntil(PollContext ctx, kj::TimePoint deadline);

    kj::Timer &timer_;
    meridian::ParseDispatcher dispatcher_;
  };

  class MeridianImpl final : public Meridian::Server
  {
  public:
    MeridianImpl(meridian::Store &s, meridian::SchemaRegistry &registry, meridian::DispatcherConfig config = {});

    // Lint sessions need the server's timer, which exists only once the server does.
    void attachTimer(kj::Timer &timer) { timer_ = &timer; }

    kj::Promise<void> applyBatch(ApplyBatchContext ctx) override;
    kj::Promise<void> lint(LintContext ctx) override;
    kj::Promise<void> openLintSession(OpenLintSessionContext ctx) override;

    kj::Promise<void> listTypes(ListTypesContext ctx) override;
    kj::Promise<void> getType(GetTypeContext ctx) override;
    kj::Promise<void> listLabels(ListLabelsContext ctx) override;

    kj::Promise<void> getEntity(GetEntityContext ctx) override;
    kj::Promise<void> listIncident(ListIncidentContext ctx) override;
    kj::Promise<void> scanByLabel(ScanByLabelContext ctx) override;
    kj::Promise<void> stats(StatsContext ctx) override;

  private:
    meridian::Store &store_;
    meridian::SchemaRegistry &registry_;
    kj::Timer *timer_{nullptr};
    meridian::DispatcherConfig config_;
    meridian::MutationApplier applier_;
  };

} // namespace meridian::rpc
