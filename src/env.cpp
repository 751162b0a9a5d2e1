#include "env.hpp"
#include "encode.hpp"
#include <lmdb.h>
#include <cstring>
#include <string>
#include <utility>

namespace meridian
{

  namespace
  {
    constexpr std::array<const char *, static_cast<size_t>(Db::Count)> kDbNames = {
        "entities", "entityProps", "edgesByStart", "edgesByEnd", "labelIndex", "typeDefs", "meta"};

    void check(int rc)
    {
      if (rc)
        throw MdbError(mdb_strerror(rc));
    }
  } // namespace

  // -------------------- txn --------------------

  Txn::Txn(MDB_env *env, bool rw) : rw_(rw)
  {
    check(mdb_txn_begin(env, nullptr, rw_ ? 0 : MDB_RDONLY, &txn_));
  }

  Txn::~Txn() noexcept
  {
    abort();
  }

  Txn::Txn(Txn &&other) noexcept
      : txn_(std::exchange(other.txn_, nullptr)), rw_(other.rw_)
  {
  }

  Txn &Txn::operator=(Txn &&other) noexcept
  {
    if (this != &other)
    {
      abort();
      txn_ = std::exchange(other.txn_, nullptr);
      rw_ = other.rw_;
    }
    return *this;
  }

  void Txn::commit()
  {
    if (!txn_)
      throw MdbError("transaction already finished");
    // the handle is freed by commit whether or not it succeeds
    check(mdb_txn_commit(std::exchange(txn_, nullptr)));
  }

  void Txn::abort() noexcept
  {
    if (txn_)
      mdb_txn_abort(std::exchange(txn_, nullptr));
  }

  // -------------------- env --------------------

  Env::Env(const std::filesystem::path &path, size_t mapSizeBytes)
  {
    check(mdb_env_create(&env_));
    try
    {
      check(mdb_env_set_maxdbs(env_, static_cast<MDB_dbi>(Db::Count) + 1));
      check(mdb_env_set_mapsize(env_, mapSizeBytes));
      check(mdb_env_open(env_, path.c_str(), 0, 0664));

      Txn tx(env_, true);
      for (size_t i = 0; i < kDbNames.size(); ++i)
        check(mdb_dbi_open(tx.get(), kDbNames[i], MDB_CREATE, &dbis_[i]));
      checkFormatVersion(tx.get());
      tx.commit();
    }
    catch (const MdbError &)
    {
      close();
      throw;
    }
  }

  Env::~Env() noexcept
  {
    close();
  }

  Env::Env(Env &&other) noexcept
      : env_(std::exchange(other.env_, nullptr)), dbis_(other.dbis_)
  {
  }

  Env &Env::operator=(Env &&other) noexcept
  {
    if (this != &other)
    {
      close();
      env_ = std::exchange(other.env_, nullptr);
      dbis_ = other.dbis_;
    }
    return *this;
  }

  void Env::checkFormatVersion(MDB_txn *tx)
  {
    std::string key = key_meta_schema_version();
    MDB_val k{key.size(), key.data()}, v{};
    int rc = mdb_get(tx, meta(), &k, &v);
    if (rc == MDB_NOTFOUND)
    {
      uint32_t version = kStoreFormatVersion;
      MDB_val nv{sizeof(version), &version};
      check(mdb_put(tx, meta(), &k, &nv, 0));
      return;
    }
    check(rc);
    uint32_t found = 0;
    if (v.mv_size != sizeof(found))
      throw MdbError("corrupt store format version");
    std::memcpy(&found, v.mv_data, sizeof(found));
    if (found != kStoreFormatVersion)
      throw MdbError("store format version " + std::to_string(found) + " is not supported (expected " +
                     std::to_string(kStoreFormatVersion) + ")");
  }

  void Env::close() noexcept
  {
    if (env_)
      mdb_env_close(std::exchange(env_, nullptr));
  }

} // namespace meridian
