#pragma once
#include "env.hpp"
#include "model.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace meridian
{

  // Failures caused by the operation rather than by storage.
  struct StoreError : std::runtime_error
  {
    using std::runtime_error::runtime_error;
  };

  struct EntityNotFound : StoreError
  {
    using StoreError::StoreError;
  };

  struct KindMismatch : StoreError
  {
    using StoreError::StoreError;
  };

  enum class Direction : uint8_t
  {
    Out = 0,
    In = 1,
    Both = 2
  };

  // -------------------- entity data ---------------------------

  struct EntityHeader
  {
    EntityKind kind{EntityKind::Node};
    std::string label{};
    std::string startId{}; // edges only
    std::string endId{};   // edges only
  };

  struct Entity
  {
    std::string id{};
    EntityHeader header{};
    PropertyMap props{};
  };

  struct IncidentEdge
  {
    std::string edgeId{};
    std::string neighborId{};
    std::string label{};
    Direction direction{Direction::Out};
  };

  // -------------------- params / results ---------------------------

  struct UpsertEntityParams
  {
    std::string id{};
    EntityKind kind{EntityKind::Node};
    std::string label{};
    std::string startId{};
    std::string endId{};
    PropertyMap setProps{};
  };
  struct UpsertEntityResult
  {
    bool created{false};
  };

  struct UpdatePropsParams
  {
    std::string id{};
    EntityKind kind{EntityKind::Node};
    PropertyMap setProps{};
    std::vector<std::string> removeKeys{};
  };

  struct DeleteEntityParams
  {
    std::string id{};
    EntityKind kind{EntityKind::Node};
  };
  struct DeleteEntityResult
  {
    uint64_t cascadedEdges{0};
  };

  struct ListIncidentParams
  {
    std::string node{};
    Direction direction{Direction::Both};
    uint32_t limit{0};
  };

  struct ScanByLabelParams
  {
    EntityKind kind{EntityKind::Node};
    std::string label{};
    uint32_t limit{0};
  };

  struct StoreCounts
  {
    uint64_t nodes{0};
    uint64_t edges{0};
    uint64_t typeDefinitions{0};
    uint64_t batches{0};
  };

  class Store
  {
  public:
    explicit Store(Env &e) : env_(e) {}

    Txn beginWrite();

    // writes, all inside the caller's transaction
    UpsertEntityResult upsertEntity(Txn &tx, const UpsertEntityParams &params);
    void updateProps(Txn &tx, const UpdatePropsParams &params);
    DeleteEntityResult deleteEntity(Txn &tx, const DeleteEntityParams &params);
    void putTypeDefinition(Txn &tx, const TypeDefinition &def);
    uint64_t recordBatch(Txn &tx);

    // reads / queries
    std::optional<Entity> getEntity(const std::string &id);
    std::vector<IncidentEdge> listIncident(const ListIncidentParams &params);
    std::vector<std::string> scanByLabel(const ScanByLabelParams &params);
    std::vector<TypeDefinition> loadTypeDefinitions();
    StoreCounts counts();

  private:
    Env &env_;
  };

} // namespace meridian
