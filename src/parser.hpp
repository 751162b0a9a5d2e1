#pragma once
#include "operation.hpp"
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace meridian
{

  // A line that could not be turned into an operation. what() reads "Line <n>: <detail>".
  class ParseError : public std::runtime_error
  {
  public:
    ParseError(uint32_t line, const std::string &detail);
    uint32_t line() const { return line_; }

  private:
    uint32_t line_{0};
  };

  // Calls fn(lineNumber, line) for every line holding a record. Blank lines and lines
  // starting with "//" or "#" are skipped; line numbers are 1-based physical lines.
  void forEachRecordLine(std::string_view text, const std::function<void(uint32_t, std::string_view)> &fn);

  // Decodes one record line. Throws ParseError.
  Operation decodeRecord(std::string_view line, uint32_t lineNumber, uint32_t index);

  // Decodes every record line, collecting parse errors instead of stopping at the first.
  ParsedBatch parseBatch(std::string_view text);

} // namespace meridian
