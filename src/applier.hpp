#pragma once
#include "operation.hpp"
#include "store.hpp"
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace meridian
{

  class SchemaRegistry;

  // Apply-time failure of one operation. what() reads "Operation <i> (line <n>): <reason>".
  class ApplyError : public std::runtime_error
  {
  public:
    ApplyError(const Operation &op, const std::string &reason);
    uint32_t index() const { return index_; }
    uint32_t line() const { return line_; }

  private:
    uint32_t index_{0};
    uint32_t line_{0};
  };

  // Runs a whole batch as one store transaction: either every operation takes effect or none does.
  class MutationApplier
  {
  public:
    MutationApplier(Store &store, SchemaRegistry &registry) : store_(store), registry_(registry) {}

    MutationResult apply(std::string_view text);
    // The batch is always validated again here before anything is written.
    MutationResult apply(ParsedBatch batch);

  private:
    void execute(Txn &tx, const Operation &op, std::vector<TypeDefinition> &defined);

    Store &store_;
    SchemaRegistry &registry_;
  };

} // namespace meridian
