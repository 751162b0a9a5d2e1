#include "operation.hpp"
#include <type_traits>

namespace meridian
{

  EntityKind Operation::entityKind() const
  {
    return std::visit([](const auto &b)
                      { return b.kind; },
                      body);
  }

  std::string Operation::subject() const
  {
    return std::visit([](const auto &b) -> std::string
                      {
                        using T = std::decay_t<decltype(b)>;
                        if constexpr (std::is_same_v<T, DefineOp>)
                          return b.label.value_or(std::string());
                        else
                          return b.id.value_or(std::string()); },
                      body);
  }

  std::string Operation::label() const
  {
    if (auto *d = std::get_if<DefineOp>(&body))
      return d->label.value_or(std::string());
    if (auto *c = std::get_if<CreateOp>(&body))
      return c->label.value_or(std::string());
    return std::string();
  }

  size_t ParsedBatch::warningCount() const
  {
    size_t n = 0;
    for (const auto &po : operations)
      n += po.warnings.size();
    return n;
  }

} // namespace meridian
