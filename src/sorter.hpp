#pragma once
#include "operation.hpp"
#include <vector>

namespace meridian
{

  // Execution order: every DEFINE first, then everything else, each group in file order.
  // No dependency analysis beyond that.
  std::vector<ParsedOperation> sortForExecution(std::vector<ParsedOperation> ops);

} // namespace meridian
