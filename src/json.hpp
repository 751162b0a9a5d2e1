#pragma once
#include "model.hpp"
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace meridian::json
{

  enum class Kind : uint8_t
  {
    Null,
    Bool,
    Number,
    String,
    Array,
    Object
  };

  // A string or key whose escapes cannot be decoded.
  class DecodeError : public std::runtime_error
  {
  public:
    explicit DecodeError(const std::string &what);
  };

  // A view over one JSON value inside a larger buffer. The buffer must outlive it.
  class Node
  {
  public:
    explicit Node(std::string_view raw) : raw_(raw) {}

    Kind kind() const;
    std::string_view raw() const { return raw_; }

    std::optional<std::string> asString() const;
    std::optional<bool> asBool() const;
    std::optional<double> asNumber() const;
    std::optional<int64_t> asInteger() const;

    // Property value as stored: arrays and objects keep their source text.
    // Throws DecodeError for an undecodable string.
    Value asValue() const;

    // Visits object members in document order; keys are unescaped. Throws DecodeError.
    void forEachMember(const std::function<void(const std::string &, const Node &)> &fn) const;
    void forEachElement(const std::function<void(const Node &)> &fn) const;

  private:
    std::string_view raw_;
  };

  // Parses text that must hold exactly one JSON value (surrounding whitespace allowed).
  std::optional<Node> parseDocument(std::string_view text);

  // Double-quoted, escaped JSON string literal.
  std::string quote(std::string_view s);

  // JSON text for a stored property value.
  std::string encodeValue(const Value &v);

} // namespace meridian::json
