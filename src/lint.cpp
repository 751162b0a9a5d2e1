#include "lint.hpp"
#include "parser.hpp"
#include "schema_registry.hpp"
#include "validator.hpp"

namespace meridian
{

  namespace
  {
    void count(OpBreakdown &b, OpKind k)
    {
      switch (k)
      {
      case OpKind::Define:
        ++b.defines;
        break;
      case OpKind::Create:
        ++b.creates;
        break;
      case OpKind::Update:
        ++b.updates;
        break;
      case OpKind::Delete:
        ++b.deletes;
        break;
      }
    }
  } // namespace

  ParsedBatch lintText(std::string_view text, const SchemaRegistry *registry)
  {
    ParsedBatch batch = parseBatch(text);
    validate(batch, registry);
    return batch;
  }

  OpBreakdown breakdownOf(const ParsedBatch &batch)
  {
    OpBreakdown out{};
    for (const auto &po : batch.operations)
      count(out, po.op.opKind());
    for (const auto &e : batch.errors)
    {
      if (e.kind == ErrorKind::Parse)
        ++out.unknown;
    }
    return out;
  }

  OperationPreview previewOf(const Operation &op)
  {
    OperationPreview p{};
    p.line = op.span.first;
    p.op = op.opKind();
    p.kind = op.entityKind();
    p.label = op.label();
    if (p.op != OpKind::Define)
      p.id = op.subject();
    return p;
  }

  BatchSummary summarizeText(std::string_view text, const SummaryLimits &limits)
  {
    BatchSummary out{};
    uint32_t index = 0;
    forEachRecordLine(text, [&](uint32_t lineNumber, std::string_view line)
                      {
                        ++out.recordLines;
                        try
                        {
                          Operation op = decodeRecord(line, lineNumber, index++);
                          count(out.breakdown, op.opKind());
                          if (out.previews.size() < limits.previewLimit)
                            out.previews.push_back(previewOf(op));
                        }
                        catch (const ParseError &e)
                        {
                          --index;
                          ++out.breakdown.unknown;
                          ++out.totalErrors;
                          if (out.errors.size() < limits.errorLimit)
                            out.errors.push_back(BatchError{ErrorKind::Parse, e.line(), std::nullopt, e.what()});
                        } });
    return out;
  }

} // namespace meridian
