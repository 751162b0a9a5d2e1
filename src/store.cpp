#include "store.hpp"
#include "encode.hpp"
#include <lmdb.h>
#include <cstring>
#include <set>
#include <string_view>

namespace meridian
{
  // -------------------- lmdb helpers --------------------

  static inline MDB_val make_val(std::string_view s)
  {
    return MDB_val{s.size(), const_cast<char *>(s.data())};
  }

  static inline std::string_view view_of(const MDB_val &v)
  {
    return std::string_view(static_cast<const char *>(v.mv_data), v.mv_size);
  }

  static bool mdb_get_val(MDB_txn *tx, DbHandle dbi, std::string_view key, MDB_val &out)
  {
    MDB_val k = make_val(key);
    int rc = mdb_get(tx, dbi, &k, &out);
    if (rc == MDB_NOTFOUND)
      return false;
    if (rc)
      throw MdbError(mdb_strerror(rc));
    return true;
  }

  static void mdb_put_val(MDB_txn *tx, DbHandle dbi, std::string_view key, std::string_view value)
  {
    MDB_val k = make_val(key);
    MDB_val v = make_val(value);
    int rc = mdb_put(tx, dbi, &k, &v, 0);
    if (rc)
      throw MdbError(mdb_strerror(rc));
  }

  static void mdb_del_key(MDB_txn *tx, DbHandle dbi, std::string_view key)
  {
    MDB_val k = make_val(key);
    int rc = mdb_del(tx, dbi, &k, nullptr);
    if (rc != 0 && rc != MDB_NOTFOUND)
      throw MdbError(mdb_strerror(rc));
  }

  // Closes the cursor however the scan ends.
  struct CursorGuard
  {
    MDB_cursor *cur{};
    ~CursorGuard()
    {
      if (cur)
        mdb_cursor_close(cur);
    }
  };

  // Calls fn(key, value) for every record whose key starts with prefix; stops early when fn returns false.
  template <typename Fn>
  static void scan_prefix(MDB_txn *tx, DbHandle dbi, std::string_view prefix, Fn &&fn)
  {
    CursorGuard guard;
    int rc = mdb_cursor_open(tx, dbi, &guard.cur);
    if (rc)
      throw MdbError(mdb_strerror(rc));
    MDB_val k = make_val(prefix), v{};
    rc = mdb_cursor_get(guard.cur, &k, &v, prefix.empty() ? MDB_FIRST : MDB_SET_RANGE);
    while (rc == 0)
    {
      std::string_view key = view_of(k);
      if (!has_prefix(key, prefix) || !fn(key, view_of(v)))
        return;
      rc = mdb_cursor_get(guard.cur, &k, &v, MDB_NEXT);
    }
    if (rc != MDB_NOTFOUND)
      throw MdbError(mdb_strerror(rc));
  }

  static uint64_t read_u64_or(MDB_txn *tx, DbHandle dbi, std::string_view key, uint64_t fallback)
  {
    MDB_val v{};
    if (!mdb_get_val(tx, dbi, key, v) || v.mv_size != 8)
      return fallback;
    uint64_t x = 0;
    std::memcpy(&x, v.mv_data, 8);
    return x;
  }

  static void write_u64(MDB_txn *tx, DbHandle dbi, std::string_view key, uint64_t value)
  {
    MDB_val k = make_val(key);
    MDB_val v{8, &value};
    int rc = mdb_put(tx, dbi, &k, &v, 0);
    if (rc)
      throw MdbError(mdb_strerror(rc));
  }

  static uint64_t incr_meta_seq(Txn &tx, Env &env, const std::string &key)
  {
    uint64_t next = read_u64_or(tx.get(), env.meta(), key, 0) + 1;
    write_u64(tx.get(), env.meta(), key, next);
    return next;
  }

  // -------------------- value/header encoding --------------------

  enum class ValueTag : uint8_t
  {
    I64 = 0,
    F64 = 1,
    Bool = 2,
    Json = 3,
    Text = 4,
    Null = 5
  };

  static std::string encode_value(const Value &v)
  {
    std::string out;
    if (std::holds_alternative<int64_t>(v))
    {
      out.push_back(char(ValueTag::I64));
      put_be64(out, static_cast<uint64_t>(std::get<int64_t>(v)));
      return out;
    }
    if (std::holds_alternative<double>(v))
    {
      out.push_back(char(ValueTag::F64));
      double d = std::get<double>(v);
      static_assert(sizeof(double) == 8, "double not 8 bytes");
      uint64_t ux;
      std::memcpy(&ux, &d, 8);
      put_be64(out, ux);
      return out;
    }
    if (std::holds_alternative<bool>(v))
    {
      out.push_back(char(ValueTag::Bool));
      out.push_back(std::get<bool>(v) ? 1 : 0);
      return out;
    }
    if (std::holds_alternative<JsonText>(v))
    {
      out.push_back(char(ValueTag::Json));
      put_str(out, std::get<JsonText>(v).raw);
      return out;
    }
    if (std::holds_alternative<std::string>(v))
    {
      out.push_back(char(ValueTag::Text));
      put_str(out, std::get<std::string>(v));
      return out;
    }
    out.push_back(char(ValueTag::Null));
    return out;
  }

  static Value decode_value(std::string_view bytes)
  {
    const unsigned char *p = reinterpret_cast<const unsigned char *>(bytes.data());
    const unsigned char *end = p + bytes.size();
    if (p >= end)
      throw MdbError("corrupt value: empty");
    auto tag = static_cast<ValueTag>(*p++);
    switch (tag)
    {
    case ValueTag::I64:
      if (end - p < 8)
        throw MdbError("corrupt i64");
      return static_cast<int64_t>(read_be64(p));
    case ValueTag::F64:
    {
      if (end - p < 8)
        throw MdbError("corrupt f64");
      uint64_t ux = read_be64(p);
      double d;
      std::memcpy(&d, &ux, 8);
      return d;
    }
    case ValueTag::Bool:
      if (end - p < 1)
        throw MdbError("corrupt bool");
      return bool(*p != 0);
    case ValueTag::Json:
    {
      std::string_view s;
      if (!read_str(p, end, s))
        throw MdbError("corrupt json value");
      return JsonText{std::string(s)};
    }
    case ValueTag::Text:
    {
      std::string_view s;
      if (!read_str(p, end, s))
        throw MdbError("corrupt text value");
      return std::string(s);
    }
    case ValueTag::Null:
      return std::monostate{};
    default:
      throw MdbError("unknown value tag");
    }
  }

  // <u8 kind><str label><str start><str end>
  static std::string encode_header(const EntityHeader &h)
  {
    std::string s;
    s.reserve(1 + 12 + h.label.size() + h.startId.size() + h.endId.size());
    s.push_back(char(h.kind));
    put_str(s, h.label);
    put_str(s, h.startId);
    put_str(s, h.endId);
    return s;
  }

  static EntityHeader decode_header(std::string_view bytes)
  {
    const unsigned char *p = reinterpret_cast<const unsigned char *>(bytes.data());
    const unsigned char *end = p + bytes.size();
    if (p >= end)
      throw MdbError("corrupt entity header");
    EntityHeader h{};
    h.kind = static_cast<EntityKind>(*p++);
    std::string_view label, start, stop;
    if (!read_str(p, end, label) || !read_str(p, end, start) || !read_str(p, end, stop))
      throw MdbError("corrupt entity header");
    if (p != end)
      throw MdbError("trailing data in entity header");
    h.label = std::string(label);
    h.startId = std::string(start);
    h.endId = std::string(stop);
    return h;
  }

  static void put_str_list(std::string &s, const std::vector<std::string> &items)
  {
    put_be32(s, static_cast<uint32_t>(items.size()));
    for (const auto &item : items)
      put_str(s, item);
  }

  static bool read_str_list(const unsigned char *&p, const unsigned char *end, std::vector<std::string> &out)
  {
    if (end - p < 4)
      return false;
    uint32_t n = read_be32(p);
    p += 4;
    out.clear();
    for (uint32_t i = 0; i < n; ++i)
    {
      std::string_view s;
      if (!read_str(p, end, s))
        return false;
      out.emplace_back(s);
    }
    return true;
  }

  // <str description><list required><list optional><str example file><str example>;
  // kind and label live in the key
  static std::string encode_type_def(const TypeDefinition &d)
  {
    std::string s;
    put_str(s, d.description);
    put_str_list(s, d.requiredProperties);
    put_str_list(s, d.optionalProperties);
    put_str(s, d.exampleFilePath);
    put_str(s, d.exampleInFilePath);
    return s;
  }

  static TypeDefinition decode_type_def(std::string_view key, std::string_view bytes)
  {
    if (key.empty())
      throw MdbError("corrupt type definition key");
    TypeDefinition d{};
    d.kind = static_cast<EntityKind>(static_cast<unsigned char>(key[0]));
    d.label = std::string(key.substr(1));
    const unsigned char *p = reinterpret_cast<const unsigned char *>(bytes.data());
    const unsigned char *end = p + bytes.size();
    std::string_view desc, file, example;
    if (!read_str(p, end, desc) || !read_str_list(p, end, d.requiredProperties) ||
        !read_str_list(p, end, d.optionalProperties) || !read_str(p, end, file) ||
        !read_str(p, end, example) || p != end)
      throw MdbError("corrupt type definition");
    d.description = std::string(desc);
    d.exampleFilePath = std::string(file);
    d.exampleInFilePath = std::string(example);
    return d;
  }

  static std::optional<EntityHeader> read_header(MDB_txn *tx, Env &env, std::string_view id)
  {
    MDB_val v{};
    if (!mdb_get_val(tx, env.entities(), key_entity(id), v))
      return std::nullopt;
    return decode_header(view_of(v));
  }

  static EntityHeader require_entity(MDB_txn *tx, Env &env, std::string_view id, EntityKind kind)
  {
    auto hdr = read_header(tx, env, id);
    if (!hdr)
      throw EntityNotFound("no " + std::string(entityKindName(kind)) + " with id '" + std::string(id) + "'");
    if (hdr->kind != kind)
      throw KindMismatch("'" + std::string(id) + "' is a " + entityKindName(hdr->kind) + ", expected " + entityKindName(kind));
    return *hdr;
  }

  static void put_props(MDB_txn *tx, Env &env, std::string_view id, const PropertyMap &props)
  {
    for (const auto &p : props)
      mdb_put_val(tx, env.entityProps(), key_entity_prop(id, p.key), encode_value(p.val));
  }

  static void delete_props(MDB_txn *tx, Env &env, std::string_view id)
  {
    std::vector<std::string> keys;
    scan_prefix(tx, env.entityProps(), key_entity_prop_prefix(id), [&](std::string_view k, std::string_view)
                {
                  keys.emplace_back(k);
                  return true; });
    for (const auto &k : keys)
      mdb_del_key(tx, env.entityProps(), k);
  }

  // Second component of an incident key: the edge id.
  static std::string_view incident_edge_id(std::string_view key)
  {
    const unsigned char *p = reinterpret_cast<const unsigned char *>(key.data());
    const unsigned char *end = p + key.size();
    std::string_view node, edge;
    if (!read_str(p, end, node) || !read_str(p, end, edge))
      throw MdbError("corrupt incident key");
    return edge;
  }

  static void delete_edge_record(MDB_txn *tx, Env &env, std::string_view edgeId, const EntityHeader &h)
  {
    delete_props(tx, env, edgeId);
    mdb_del_key(tx, env.labelIndex(), key_label_index(uint8_t(EntityKind::Edge), h.label, edgeId));
    mdb_del_key(tx, env.edgesByStart(), key_incident(h.startId, edgeId));
    mdb_del_key(tx, env.edgesByEnd(), key_incident(h.endId, edgeId));
    mdb_del_key(tx, env.entities(), key_entity(edgeId));
  }

  static void require_writable(const Txn &tx)
  {
    if (!tx.writable())
      throw MdbError("write attempted in a read-only transaction");
  }

  // -------------------- api ---------------------------

  Txn Store::beginWrite()
  {
    return Txn(env_.raw(), true);
  }

  UpsertEntityResult Store::upsertEntity(Txn &tx, const UpsertEntityParams &params)
  {
    require_writable(tx);
    UpsertEntityResult out{};
    auto existing = read_header(tx.get(), env_, params.id);
    if (existing)
    {
      if (existing->kind != params.kind)
        throw KindMismatch("'" + params.id + "' is a " + entityKindName(existing->kind) + ", expected " + entityKindName(params.kind));
      // label and endpoints are fixed at creation
      put_props(tx.get(), env_, params.id, params.setProps);
      return out;
    }

    EntityHeader hdr{};
    hdr.kind = params.kind;
    hdr.label = params.label;
    if (params.kind == EntityKind::Edge)
    {
      auto start = read_header(tx.get(), env_, params.startId);
      if (!start || start->kind != EntityKind::Node)
        throw EntityNotFound("start node '" + params.startId + "' does not exist");
      auto stop = read_header(tx.get(), env_, params.endId);
      if (!stop || stop->kind != EntityKind::Node)
        throw EntityNotFound("end node '" + params.endId + "' does not exist");
      hdr.startId = params.startId;
      hdr.endId = params.endId;
      mdb_put_val(tx.get(), env_.edgesByStart(), key_incident(hdr.startId, params.id), std::string_view{});
      mdb_put_val(tx.get(), env_.edgesByEnd(), key_incident(hdr.endId, params.id), std::string_view{});
    }
    mdb_put_val(tx.get(), env_.entities(), key_entity(params.id), encode_header(hdr));
    mdb_put_val(tx.get(), env_.labelIndex(), key_label_index(uint8_t(hdr.kind), hdr.label, params.id), std::string_view{});
    put_props(tx.get(), env_, params.id, params.setProps);
    out.created = true;
    return out;
  }

  void Store::updateProps(Txn &tx, const UpdatePropsParams &params)
  {
    require_writable(tx);
    require_entity(tx.get(), env_, params.id, params.kind);
    put_props(tx.get(), env_, params.id, params.setProps);
    for (const auto &key : params.removeKeys)
      mdb_del_key(tx.get(), env_.entityProps(), key_entity_prop(params.id, key));
  }

  DeleteEntityResult Store::deleteEntity(Txn &tx, const DeleteEntityParams &params)
  {
    require_writable(tx);
    DeleteEntityResult out{};
    EntityHeader hdr = require_entity(tx.get(), env_, params.id, params.kind);
    if (hdr.kind == EntityKind::Edge)
    {
      delete_edge_record(tx.get(), env_, params.id, hdr);
      return out;
    }

    // gather edges where node is start or end, then drop them with all their index entries
    std::set<std::string> edgeIds;
    auto collect = [&](std::string_view k, std::string_view)
    {
      edgeIds.emplace(incident_edge_id(k));
      return true;
    };
    std::string prefix = key_incident_prefix(params.id);
    scan_prefix(tx.get(), env_.edgesByStart(), prefix, collect);
    scan_prefix(tx.get(), env_.edgesByEnd(), prefix, collect);
    for (const auto &edgeId : edgeIds)
    {
      auto eh = read_header(tx.get(), env_, edgeId);
      if (!eh)
        throw MdbError("dangling edge index entry for '" + edgeId + "'");
      delete_edge_record(tx.get(), env_, edgeId, *eh);
    }
    out.cascadedEdges = edgeIds.size();

    delete_props(tx.get(), env_, params.id);
    mdb_del_key(tx.get(), env_.labelIndex(), key_label_index(uint8_t(EntityKind::Node), hdr.label, params.id));
    mdb_del_key(tx.get(), env_.entities(), key_entity(params.id));
    return out;
  }

  void Store::putTypeDefinition(Txn &tx, const TypeDefinition &def)
  {
    require_writable(tx);
    mdb_put_val(tx.get(), env_.typeDefs(), key_type_def(uint8_t(def.kind), def.label), encode_type_def(def));
  }

  uint64_t Store::recordBatch(Txn &tx)
  {
    require_writable(tx);
    return incr_meta_seq(tx, env_, key_meta_batch_seq());
  }

  std::optional<Entity> Store::getEntity(const std::string &id)
  {
    Txn tx(env_.raw(), false);
    auto hdr = read_header(tx.get(), env_, id);
    if (!hdr)
      return std::nullopt;
    Entity out{};
    out.id = id;
    out.header = std::move(*hdr);
    std::string prefix = key_entity_prop_prefix(id);
    scan_prefix(tx.get(), env_.entityProps(), prefix, [&](std::string_view k, std::string_view v)
                {
                  out.props.push_back(Property{std::string(k.substr(prefix.size())), decode_value(v)});
                  return true; });
    return out;
  }

  std::vector<IncidentEdge> Store::listIncident(const ListIncidentParams &params)
  {
    std::vector<IncidentEdge> out;
    Txn tx(env_.raw(), false);
    std::string prefix = key_incident_prefix(params.node);
    auto scanDir = [&](bool outgoing)
    {
      auto dbi = outgoing ? env_.edgesByStart() : env_.edgesByEnd();
      scan_prefix(tx.get(), dbi, prefix, [&](std::string_view k, std::string_view)
                  {
                    if (params.limit != 0 && out.size() >= params.limit)
                      return false;
                    std::string edgeId(incident_edge_id(k));
                    auto eh = read_header(tx.get(), env_, edgeId);
                    if (!eh)
                      throw MdbError("dangling edge index entry for '" + edgeId + "'");
                    IncidentEdge e{};
                    e.edgeId = std::move(edgeId);
                    e.neighborId = outgoing ? eh->endId : eh->startId;
                    e.label = eh->label;
                    e.direction = outgoing ? Direction::Out : Direction::In;
                    out.push_back(std::move(e));
                    return true; });
    };
    if (params.direction == Direction::Out || params.direction == Direction::Both)
      scanDir(true);
    if (params.direction == Direction::In || params.direction == Direction::Both)
      scanDir(false);
    return out;
  }

  std::vector<std::string> Store::scanByLabel(const ScanByLabelParams &params)
  {
    std::vector<std::string> out;
    Txn tx(env_.raw(), false);
    std::string prefix = key_label_index_prefix(uint8_t(params.kind), params.label);
    scan_prefix(tx.get(), env_.labelIndex(), prefix, [&](std::string_view k, std::string_view)
                {
                  if (params.limit != 0 && out.size() >= params.limit)
                    return false;
                  const unsigned char *p = reinterpret_cast<const unsigned char *>(k.data()) + prefix.size();
                  const unsigned char *end = reinterpret_cast<const unsigned char *>(k.data()) + k.size();
                  std::string_view id;
                  if (!read_str(p, end, id))
                    throw MdbError("corrupt label index key");
                  out.emplace_back(id);
                  return true; });
    return out;
  }

  std::vector<TypeDefinition> Store::loadTypeDefinitions()
  {
    std::vector<TypeDefinition> out;
    Txn tx(env_.raw(), false);
    scan_prefix(tx.get(), env_.typeDefs(), std::string_view{}, [&](std::string_view k, std::string_view v)
                {
                  out.push_back(decode_type_def(k, v));
                  return true; });
    return out;
  }

  StoreCounts Store::counts()
  {
    StoreCounts out{};
    Txn tx(env_.raw(), false);
    auto entries = [&](DbHandle dbi)
    {
      MDB_stat st{};
      int rc = mdb_stat(tx.get(), dbi, &st);
      if (rc)
        throw MdbError(mdb_strerror(rc));
      return uint64_t(st.ms_entries);
    };
    uint64_t entities = entries(env_.entities());
    out.edges = entries(env_.edgesByStart());
    out.nodes = entities - out.edges;
    out.typeDefinitions = entries(env_.typeDefs());
    out.batches = read_u64_or(tx.get(), env_.meta(), key_meta_batch_seq(), 0);
    return out;
  }

} // namespace meridian
