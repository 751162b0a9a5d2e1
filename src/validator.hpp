#pragma once
#include "operation.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace meridian
{

  class SchemaRegistry;

  // <lowercase alnum or _>:<16 lowercase hex>
  bool isCanonicalId(std::string_view id);
  // Text before the first ':'; the whole id when there is none.
  std::string_view idPrefix(std::string_view id);

  // Reasons this operation can never be applied; empty when it is well formed.
  std::vector<std::string> structuralProblems(const Operation &op);

  // Recomputes structural errors and per-operation warnings in place; parse errors are kept.
  // Running it again on the same batch gives the same result. Without a registry, the
  // structural pass is complete and only registry-backed warnings are skipped.
  void validate(ParsedBatch &batch, const SchemaRegistry *registry);

} // namespace meridian
