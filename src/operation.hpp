#pragma once
#include "model.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace meridian
{

  enum class OpKind : uint8_t
  {
    Define = 0,
    Create = 1,
    Update = 2,
    Delete = 3
  };

  inline const char *opKindName(OpKind k)
  {
    switch (k)
    {
    case OpKind::Define:
      return "DEFINE";
    case OpKind::Create:
      return "CREATE";
    case OpKind::Update:
      return "UPDATE";
    case OpKind::Delete:
    default:
      return "DELETE";
    }
  }

  // Fields are optional where the wire shape lets them be absent; the validator decides what is fatal.
  struct DefineOp
  {
    EntityKind kind{EntityKind::Node};
    std::optional<std::string> label{};
    std::optional<std::string> description{};
    std::vector<std::string> requiredProperties{};
    std::vector<std::string> optionalProperties{};
    std::optional<std::string> exampleFilePath{};
    std::optional<std::string> exampleInFilePath{};
  };

  struct CreateOp
  {
    EntityKind kind{EntityKind::Node};
    std::optional<std::string> id{};
    std::optional<std::string> label{};
    std::optional<std::string> startId{};
    std::optional<std::string> endId{};
    std::optional<PropertyMap> setProperties{};
  };

  struct UpdateOp
  {
    EntityKind kind{EntityKind::Node};
    std::optional<std::string> id{};
    std::optional<PropertyMap> setProperties{};
    std::optional<std::vector<std::string>> removeProperties{};
  };

  struct DeleteOp
  {
    EntityKind kind{EntityKind::Node};
    std::optional<std::string> id{};
  };

  using OperationBody = std::variant<DefineOp, CreateOp, UpdateOp, DeleteOp>;

  // 1-based physical lines of the source text
  struct LineSpan
  {
    uint32_t first{0};
    uint32_t last{0};
  };

  struct Operation
  {
    uint32_t index{0};
    LineSpan span{};
    OperationBody body{};
    std::vector<std::string> unknownFields{};

    OpKind opKind() const { return static_cast<OpKind>(body.index()); }
    EntityKind entityKind() const;
    // id for CREATE/UPDATE/DELETE, label for DEFINE; empty when absent
    std::string subject() const;
    std::string label() const;
  };

  struct ParsedOperation
  {
    Operation op{};
    std::vector<std::string> warnings{};
  };

  enum class ErrorKind : uint8_t
  {
    Parse = 0,
    Structural = 1
  };

  struct BatchError
  {
    ErrorKind kind{ErrorKind::Parse};
    uint32_t line{0};
    std::optional<uint32_t> index{}; // set for structural errors
    std::string message{};
  };

  struct ParsedBatch
  {
    std::vector<ParsedOperation> operations{};
    std::vector<BatchError> errors{};

    bool ok() const { return errors.empty(); }
    size_t warningCount() const;
  };

  struct MutationResult
  {
    bool success{false};
    uint64_t operationsApplied{0};
    std::vector<std::string> errors{};
  };

} // namespace meridian
