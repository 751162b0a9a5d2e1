#pragma once
#include "lint.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace meridian
{

  class SchemaRegistry;

  enum class LintMode : uint8_t
  {
    Inline = 0,     // linted on the caller's thread
    Background = 1, // full lint on the worker
    Summary = 2     // breakdown only, on the worker
  };

  enum class RequestState : uint8_t
  {
    Idle = 0,
    Parsing = 1,
    Ready = 2,
    Superseded = 3
  };

  struct DispatcherConfig
  {
    size_t backgroundThreshold{100000};
    size_t summaryThreshold{10000000};
    size_t largeInputBytes{1000000};
    size_t hugeInputBytes{10000000};
    std::chrono::milliseconds debounce{300};
    std::chrono::milliseconds debounceLarge{500};
    std::chrono::milliseconds debounceHuge{1000};
    SummaryLimits summary{};
  };

  struct LintOutcome
  {
    uint64_t seq{0};
    LintMode mode{LintMode::Inline};
    ParsedBatch batch{};    // Inline and Background
    BatchSummary summary{}; // Summary
    std::chrono::microseconds elapsed{0};
  };

  // Live lint feedback for one editing session. Requests carry a sequence number; only the
  // newest request's result is ever handed out, older ones are dropped when they arrive.
  // Work already running is abandoned, not interrupted: destruction detaches the worker,
  // which finishes its current job against its own copies of the text and schema and exits.
  class ParseDispatcher
  {
  public:
    explicit ParseDispatcher(const SchemaRegistry *registry, DispatcherConfig config = {});
    ~ParseDispatcher();
    ParseDispatcher(const ParseDispatcher &) = delete;
    ParseDispatcher &operator=(const ParseDispatcher &) = delete;

    LintMode modeFor(size_t bytes) const;
    std::chrono::milliseconds debounceFor(size_t bytes) const;

    // Inline-sized text is linted immediately and the outcome returned. Larger text is queued
    // for the worker after its debounce delay and nullopt returned; collect it with poll().
    std::optional<LintOutcome> request(std::string text);
    // Waits up to `wait` for the newest request's outcome.
    std::optional<LintOutcome> poll(std::chrono::milliseconds wait);

    uint64_t latestSeq() const;
    RequestState stateOf(uint64_t seq) const;
    uint64_t supersededCount() const;
    // Worker results thrown away on arrival because a newer request had been made.
    uint64_t droppedCount() const;
    const DispatcherConfig &config() const { return config_; }

  private:
    struct Job
    {
      uint64_t seq{0};
      LintMode mode{LintMode::Background};
      std::shared_ptr<const std::string> text{};
      std::shared_ptr<const SchemaRegistry> schema{};
      std::chrono::steady_clock::time_point notBefore{};
    };

    // Everything the worker touches; the worker holds its own reference.
    struct Channel
    {
      std::mutex mu;
      std::condition_variable jobCv;
      std::condition_variable resultCv;
      std::optional<Job> pending;
      std::deque<LintOutcome> inbox;
      uint64_t seq{0};
      uint64_t dropped{0};
      bool stopping{false};
    };

    static void workerLoop(std::shared_ptr<Channel> ch, SummaryLimits limits);
    static LintOutcome run(uint64_t seq, LintMode mode, const std::string &text,
                           const SchemaRegistry *schema, const SummaryLimits &limits);

    const SchemaRegistry *registry_;
    DispatcherConfig config_;
    std::shared_ptr<Channel> ch_;
    std::set<uint64_t> delivered_; // guarded by ch_->mu
    uint64_t superseded_{0};       // guarded by ch_->mu
  };

} // namespace meridian
