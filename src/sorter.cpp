#include "sorter.hpp"
#include <algorithm>

namespace meridian
{

  std::vector<ParsedOperation> sortForExecution(std::vector<ParsedOperation> ops)
  {
    std::stable_partition(ops.begin(), ops.end(), [](const ParsedOperation &po)
                          { return po.op.opKind() == OpKind::Define; });
    return ops;
  }

} // namespace meridian
