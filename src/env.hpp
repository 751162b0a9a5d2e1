#pragma once
#include <array>
#include <cstdint>
#include <filesystem>
#include <stdexcept>

struct MDB_env;
struct MDB_txn;
using DbHandle = unsigned int;

namespace meridian
{

  struct MdbError : std::runtime_error
  {
    using std::runtime_error::runtime_error;
  };

  // Read or write transaction; aborted on destruction unless committed.
  class Txn
  {
  public:
    Txn(MDB_env *env, bool rw);
    ~Txn() noexcept;
    Txn(const Txn &) = delete;
    Txn &operator=(const Txn &) = delete;
    Txn(Txn &&other) noexcept;
    Txn &operator=(Txn &&other) noexcept;

    MDB_txn *get() const { return txn_; }
    bool writable() const { return rw_; }
    void commit();
    void abort() noexcept;

  private:
    MDB_txn *txn_{};
    bool rw_{};
  };

  // Named databases inside the environment.
  enum class Db : uint8_t
  {
    Entities = 0,     // id -> header (kind, label, endpoints)
    EntityProps = 1,  // (id, key) -> tagged value
    EdgesByStart = 2, // (start node, edge id) -> ""
    EdgesByEnd = 3,   // (end node, edge id) -> ""
    LabelIndex = 4,   // (kind, label, id) -> ""
    TypeDefs = 5,     // (kind, label) -> definition
    Meta = 6,         // string keys
    Count = 7
  };

  // On-disk layout version kept under the meta key "schemaVersion". A fresh
  // environment is stamped with it; opening one stamped differently fails.
  inline constexpr uint32_t kStoreFormatVersion = 1;

  class Env
  {
  public:
    Env(const std::filesystem::path &path, size_t mapSizeBytes = size_t(16ull << 30));
    ~Env() noexcept;
    Env(const Env &) = delete;
    Env &operator=(const Env &) = delete;
    Env(Env &&other) noexcept;
    Env &operator=(Env &&other) noexcept;

    MDB_env *raw() const { return env_; }
    DbHandle db(Db which) const { return dbis_[static_cast<size_t>(which)]; }

    DbHandle entities() const { return db(Db::Entities); }
    DbHandle entityProps() const { return db(Db::EntityProps); }
    DbHandle edgesByStart() const { return db(Db::EdgesByStart); }
    DbHandle edgesByEnd() const { return db(Db::EdgesByEnd); }
    DbHandle labelIndex() const { return db(Db::LabelIndex); }
    DbHandle typeDefs() const { return db(Db::TypeDefs); }
    DbHandle meta() const { return db(Db::Meta); }

  private:
    void close() noexcept;
    void checkFormatVersion(MDB_txn *tx);

    MDB_env *env_{};
    std::array<DbHandle, static_cast<size_t>(Db::Count)> dbis_{};
  };

} // namespace meridian
