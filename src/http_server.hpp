#pragma once
#include "schema_registry.hpp"
#include "store.hpp"
#include <string>

namespace meridian::http
{

  // Starts a Mongoose HTTP server in a background thread.
  // The server exposes minimal endpoints:
  // - POST /api/mutations (body: batch text) -> { "success", "operations_applied", "errors" }
  // - POST /api/mutations/lint (body: batch text) -> { "submittable", "breakdown", "errors", "warnings" }
  // - GET  /api/schema/types?type=node|edge -> { "types": [...] }
  // - GET  /api/schema/labels?type=node|edge&prefix=<p> -> { "labels": [...] }
  // - GET  /api/entity?id=<id> -> entity with properties, 404 when absent
  // - GET  /api/health -> { "ok": true, counts... }
  // bind must be like "http://0.0.0.0:8080" or "http://127.0.0.1:0" (0 means ephemeral)
  void startHttpServer(meridian::Store &store, meridian::SchemaRegistry &registry, const std::string &bind);

} // namespace meridian::http
