#include "dispatcher.hpp"
#include "schema_registry.hpp"
#include <algorithm>
#include <kj/debug.h>
#include <thread>

namespace meridian
{

  ParseDispatcher::ParseDispatcher(const SchemaRegistry *registry, DispatcherConfig config)
      : registry_(registry), config_(config), ch_(std::make_shared<Channel>())
  {
    std::thread(workerLoop, ch_, config_.summary).detach();
  }

  ParseDispatcher::~ParseDispatcher()
  {
    {
      std::lock_guard lock(ch_->mu);
      ch_->stopping = true;
      ch_->pending.reset();
      ch_->inbox.clear();
    }
    ch_->jobCv.notify_all();
    ch_->resultCv.notify_all();
  }

  LintMode ParseDispatcher::modeFor(size_t bytes) const
  {
    if (bytes > config_.summaryThreshold)
      return LintMode::Summary;
    if (bytes > config_.backgroundThreshold)
      return LintMode::Background;
    return LintMode::Inline;
  }

  std::chrono::milliseconds ParseDispatcher::debounceFor(size_t bytes) const
  {
    if (bytes > config_.hugeInputBytes)
      return config_.debounceHuge;
    if (bytes > config_.largeInputBytes)
      return config_.debounceLarge;
    return config_.debounce;
  }

  std::optional<LintOutcome> ParseDispatcher::request(std::string text)
  {
    LintMode mode = modeFor(text.size());
    std::unique_lock lock(ch_->mu);
    if (ch_->seq != 0 && delivered_.count(ch_->seq) == 0)
    {
      ++superseded_;
      KJ_LOG(INFO, "lint request superseded", ch_->seq);
    }
    uint64_t seq = ++ch_->seq;
    ch_->pending.reset();

    if (mode == LintMode::Inline)
    {
      lock.unlock();
      LintOutcome outcome = run(seq, mode, text, registry_, config_.summary);
      lock.lock();
      if (seq != ch_->seq)
        return std::nullopt;
      delivered_.insert(seq);
      return outcome;
    }

    // the worker lints against a copy so it never reaches back into the live registry
    std::shared_ptr<const SchemaRegistry> schema;
    if (registry_ != nullptr && mode == LintMode::Background)
      schema = registry_->snapshot();
    auto delay = debounceFor(text.size());
    ch_->pending = Job{seq, mode, std::make_shared<const std::string>(std::move(text)), std::move(schema),
                       std::chrono::steady_clock::now() + delay};
    lock.unlock();
    ch_->jobCv.notify_one();
    return std::nullopt;
  }

  std::optional<LintOutcome> ParseDispatcher::poll(std::chrono::milliseconds wait)
  {
    std::unique_lock lock(ch_->mu);
    auto hasLatest = [this]()
    {
      return std::any_of(ch_->inbox.begin(), ch_->inbox.end(), [this](const LintOutcome &o)
                         { return o.seq == ch_->seq; });
    };
    ch_->resultCv.wait_for(lock, wait, [&]()
                           { return ch_->stopping || hasLatest(); });

    // an outcome can go stale after it arrived, when a newer request follows it
    std::optional<LintOutcome> ready;
    while (!ch_->inbox.empty())
    {
      if (ch_->inbox.front().seq == ch_->seq)
        ready = std::move(ch_->inbox.front());
      ch_->inbox.pop_front();
    }
    if (ready)
      delivered_.insert(ready->seq);
    return ready;
  }

  uint64_t ParseDispatcher::latestSeq() const
  {
    std::lock_guard lock(ch_->mu);
    return ch_->seq;
  }

  RequestState ParseDispatcher::stateOf(uint64_t seq) const
  {
    std::lock_guard lock(ch_->mu);
    if (seq == 0 || seq > ch_->seq)
      return RequestState::Idle;
    if (delivered_.count(seq) != 0)
      return RequestState::Ready;
    if (seq < ch_->seq)
      return RequestState::Superseded;
    return RequestState::Parsing;
  }

  uint64_t ParseDispatcher::supersededCount() const
  {
    std::lock_guard lock(ch_->mu);
    return superseded_;
  }

  uint64_t ParseDispatcher::droppedCount() const
  {
    std::lock_guard lock(ch_->mu);
    return ch_->dropped;
  }

  void ParseDispatcher::workerLoop(std::shared_ptr<Channel> ch, SummaryLimits limits)
  {
    std::unique_lock lock(ch->mu);
    for (;;)
    {
      ch->jobCv.wait(lock, [&]()
                     { return ch->stopping || ch->pending.has_value(); });
      if (ch->stopping)
        return;

      // debounce; a newer request restarts the wait with its own deadline
      uint64_t seq = ch->pending->seq;
      auto deadline = ch->pending->notBefore;
      bool changed = ch->jobCv.wait_until(lock, deadline, [&]()
                                          { return ch->stopping || !ch->pending || ch->pending->seq != seq; });
      if (changed)
        continue;

      Job job = std::move(*ch->pending);
      ch->pending.reset();
      lock.unlock();

      LintOutcome outcome{};
      try
      {
        outcome = run(job.seq, job.mode, *job.text, job.schema.get(), limits);
      }
      catch (const std::exception &e)
      {
        KJ_LOG(ERROR, "lint worker failed", job.seq, e.what());
        outcome.seq = job.seq;
        outcome.mode = job.mode;
        outcome.batch.errors.push_back(BatchError{ErrorKind::Parse, 0, std::nullopt, std::string("lint failed: ") + e.what()});
      }

      lock.lock();
      if (ch->stopping)
        return;
      if (outcome.seq != ch->seq)
      {
        ++ch->dropped;
        KJ_LOG(INFO, "stale lint result dropped", outcome.seq, ch->seq);
        continue;
      }
      ch->inbox.push_back(std::move(outcome));
      ch->resultCv.notify_all();
    }
  }

  LintOutcome ParseDispatcher::run(uint64_t seq, LintMode mode, const std::string &text,
                                   const SchemaRegistry *schema, const SummaryLimits &limits)
  {
    auto started = std::chrono::steady_clock::now();
    LintOutcome out{};
    out.seq = seq;
    out.mode = mode;
    if (mode == LintMode::Summary)
      out.summary = summarizeText(text, limits);
    else
      out.batch = lintText(text, schema);
    out.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started);
    return out;
  }

} // namespace meridian
