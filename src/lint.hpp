#pragma once
#include "operation.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace meridian
{

  class SchemaRegistry;

  struct OpBreakdown
  {
    uint64_t defines{0};
    uint64_t creates{0};
    uint64_t updates{0};
    uint64_t deletes{0};
    uint64_t unknown{0}; // record lines that did not decode

    uint64_t total() const { return defines + creates + updates + deletes + unknown; }
  };

  struct OperationPreview
  {
    uint32_t line{0};
    OpKind op{OpKind::Create};
    EntityKind kind{EntityKind::Node};
    std::string label{};
    std::string id{};
  };

  struct SummaryLimits
  {
    size_t errorLimit{50};
    size_t previewLimit{200};
  };

  // Read-only overview of a batch too large for full linting.
  struct BatchSummary
  {
    uint64_t recordLines{0};
    OpBreakdown breakdown{};
    std::vector<BatchError> errors{}; // first errorLimit parse errors
    uint64_t totalErrors{0};
    std::vector<OperationPreview> previews{}; // first previewLimit operations
  };

  // Parse + validate. The one validation path shared by previews, lint endpoints and the applier.
  ParsedBatch lintText(std::string_view text, const SchemaRegistry *registry);

  OpBreakdown breakdownOf(const ParsedBatch &batch);
  OperationPreview previewOf(const Operation &op);
  BatchSummary summarizeText(std::string_view text, const SummaryLimits &limits);

} // namespace meridian
