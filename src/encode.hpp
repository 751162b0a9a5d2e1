#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace meridian
{

  inline void put_be64(std::string &s, uint64_t x)
  {
    for (int i = 7; i >= 0; --i)
      s.push_back(char((x >> (i * 8)) & 0xff));
  }
  inline void put_be32(std::string &s, uint32_t x)
  {
    for (int i = 3; i >= 0; --i)
      s.push_back(char((x >> (i * 8)) & 0xff));
  }

  inline uint64_t read_be64(const unsigned char *p)
  {
    uint64_t x = 0;
    for (int i = 0; i < 8; ++i)
      x = (x << 8) | p[i];
    return x;
  }
  inline uint32_t read_be32(const unsigned char *p)
  {
    uint32_t x = 0;
    for (int i = 0; i < 4; ++i)
      x = (x << 8) | p[i];
    return x;
  }

  // <u32 len><bytes>
  inline void put_str(std::string &s, std::string_view v)
  {
    put_be32(s, static_cast<uint32_t>(v.size()));
    s.append(v.data(), v.size());
  }

  // Reads a length prefixed string, advancing p. Returns false on truncation.
  inline bool read_str(const unsigned char *&p, const unsigned char *end, std::string_view &out)
  {
    if (end - p < 4)
      return false;
    uint32_t len = read_be32(p);
    p += 4;
    if (end - p < static_cast<std::ptrdiff_t>(len))
      return false;
    out = std::string_view(reinterpret_cast<const char *>(p), len);
    p += len;
    return true;
  }

  // entities: raw id
  inline std::string key_entity(std::string_view id)
  {
    return std::string(id);
  }

  // entityProps: <str id>|<raw propKey>
  inline std::string key_entity_prop_prefix(std::string_view id)
  {
    std::string k;
    k.reserve(4 + id.size());
    put_str(k, id);
    return k;
  }

  inline std::string key_entity_prop(std::string_view id, std::string_view prop)
  {
    std::string k = key_entity_prop_prefix(id);
    k.append(prop.data(), prop.size());
    return k;
  }

  // edgesByStart / edgesByEnd: <str nodeId>|<str edgeId>
  inline std::string key_incident_prefix(std::string_view nodeId)
  {
    std::string k;
    k.reserve(4 + nodeId.size());
    put_str(k, nodeId);
    return k;
  }

  inline std::string key_incident(std::string_view nodeId, std::string_view edgeId)
  {
    std::string k = key_incident_prefix(nodeId);
    put_str(k, edgeId);
    return k;
  }

  // labelIndex: <u8 kind>|<str label>|<str id>
  inline std::string key_label_index_prefix(uint8_t kind, std::string_view label)
  {
    std::string k;
    k.reserve(1 + 4 + label.size());
    k.push_back(char(kind));
    put_str(k, label);
    return k;
  }

  inline std::string key_label_index(uint8_t kind, std::string_view label, std::string_view id)
  {
    std::string k = key_label_index_prefix(kind, label);
    put_str(k, id);
    return k;
  }

  // typeDefs: <u8 kind>|<raw label>
  inline std::string key_type_def(uint8_t kind, std::string_view label)
  {
    std::string k;
    k.reserve(1 + label.size());
    k.push_back(char(kind));
    k.append(label.data(), label.size());
    return k;
  }

  inline bool has_prefix(std::string_view key, std::string_view prefix)
  {
    return key.size() >= prefix.size() && key.compare(0, prefix.size(), prefix) == 0;
  }

  // meta bucket string keys
  inline std::string key_meta_schema_version() { return std::string("schemaVersion"); }
  inline std::string key_meta_batch_seq() { return std::string("batchSeq"); }

} // namespace meridian
