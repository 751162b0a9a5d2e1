#include "http_server.hpp"
#include "applier.hpp"
#include "json.hpp"
#include "lint.hpp"

#include <mongoose.h>

#include <thread>
#include <cstring>
#include <vector>
#include <string>
#include <string_view>
#include <optional>
#include <utility>
#include <kj/debug.h>

namespace meridian::http
{

  namespace
  {
    struct ServerState
    {
      meridian::Store *store{nullptr};
      meridian::SchemaRegistry *registry{nullptr};
      meridian::MutationApplier *applier{nullptr};
    };

    // helpers -----------------------------------------------------------------
    static bool strEquals(const mg_str &s, const char *lit)
    {
      size_t n = strlen(lit);
      return s.len == n && memcmp(s.buf, lit, n) == 0;
    }

    static std::optional<std::string> queryVar(struct mg_http_message *hm, const char *name)
    {
      char buf[1024];
      int n = mg_http_get_var(&hm->query, name, buf, sizeof(buf));
      if (n <= 0)
        return std::nullopt;
      return std::string(buf, (size_t)n);
    }

    // missing -> nullopt, anything but node/edge -> false
    static bool parseKind(const std::optional<std::string> &s, std::optional<meridian::EntityKind> &out)
    {
      out.reset();
      if (!s)
        return true;
      if (*s == "node")
        out = meridian::EntityKind::Node;
      else if (*s == "edge")
        out = meridian::EntityKind::Edge;
      else
        return false;
      return true;
    }

    // JSON helpers -----------------------------------------------------------------
    static int print_str_array(mg_pfn_t out, void *arg, va_list *ap)
    {
      const std::vector<std::string> *items = va_arg(*ap, const std::vector<std::string> *);
      mg_xprintf(out, arg, "[");
      for (size_t i = 0; i < items->size(); ++i)
        mg_xprintf(out, arg, "%s%m", i ? "," : "", MG_ESC((*items)[i].c_str()));
      mg_xprintf(out, arg, "]");
      return 0;
    }

    static int print_props_object(mg_pfn_t out, void *arg, va_list *ap)
    {
      const meridian::PropertyMap *props = va_arg(*ap, const meridian::PropertyMap *);
      mg_xprintf(out, arg, "{");
      for (size_t i = 0; i < props->size(); ++i)
      {
        const auto &p = (*props)[i];
        std::string val = meridian::json::encodeValue(p.val);
        mg_xprintf(out, arg, "%s%m:%s", i ? "," : "", MG_ESC(p.key.c_str()), val.c_str());
      }
      mg_xprintf(out, arg, "}");
      return 0;
    }

    static int print_type_defs(mg_pfn_t out, void *arg, va_list *ap)
    {
      const std::vector<meridian::TypeDefinition> *defs = va_arg(*ap, const std::vector<meridian::TypeDefinition> *);
      mg_xprintf(out, arg, "[");
      for (size_t i = 0; i < defs->size(); ++i)
      {
        const auto &d = (*defs)[i];
        mg_xprintf(out, arg, "%s{%m:%m,%m:%m,%m:%m,%m:%m,%m:%m,%m:%M,%m:%M}", i ? "," : "",
                   MG_ESC("type"), MG_ESC(meridian::entityKindName(d.kind)),
                   MG_ESC("label"), MG_ESC(d.label.c_str()),
                   MG_ESC("description"), MG_ESC(d.description.c_str()),
                   MG_ESC("example_file_path"), MG_ESC(d.exampleFilePath.c_str()),
                   MG_ESC("example_in_file_path"), MG_ESC(d.exampleInFilePath.c_str()),
                   MG_ESC("required_properties"), print_str_array, &d.requiredProperties,
                   MG_ESC("optional_properties"), print_str_array, &d.optionalProperties);
      }
      mg_xprintf(out, arg, "]");
      return 0;
    }

    static int print_errors(mg_pfn_t out, void *arg, va_list *ap)
    {
      const std::vector<meridian::BatchError> *errors = va_arg(*ap, const std::vector<meridian::BatchError> *);
      mg_xprintf(out, arg, "[");
      for (size_t i = 0; i < errors->size(); ++i)
      {
        const auto &e = (*errors)[i];
        mg_xprintf(out, arg, "%s{%m:%m,%m:%u,%m:%ld,%m:%m}", i ? "," : "",
                   MG_ESC("kind"), MG_ESC(e.kind == meridian::ErrorKind::Parse ? "parse" : "structural"),
                   MG_ESC("line"), (unsigned)e.line,
                   MG_ESC("index"), e.index ? (long)*e.index : -1L,
                   MG_ESC("message"), MG_ESC(e.message.c_str()));
      }
      mg_xprintf(out, arg, "]");
      return 0;
    }

    static int print_warnings(mg_pfn_t out, void *arg, va_list *ap)
    {
      const std::vector<meridian::ParsedOperation> *ops = va_arg(*ap, const std::vector<meridian::ParsedOperation> *);
      mg_xprintf(out, arg, "[");
      bool first = true;
      for (const auto &po : *ops)
      {
        for (const auto &w : po.warnings)
        {
          mg_xprintf(out, arg, "%s{%m:%u,%m:%u,%m:%m}", first ? "" : ",",
                     MG_ESC("line"), (unsigned)po.op.span.first,
                     MG_ESC("index"), (unsigned)po.op.index,
                     MG_ESC("message"), MG_ESC(w.c_str()));
          first = false;
        }
      }
      mg_xprintf(out, arg, "]");
      return 0;
    }

    static int print_breakdown(mg_pfn_t out, void *arg, va_list *ap)
    {
      const meridian::OpBreakdown *b = va_arg(*ap, const meridian::OpBreakdown *);
      mg_xprintf(out, arg, "{%m:%llu,%m:%llu,%m:%llu,%m:%llu,%m:%llu}",
                 MG_ESC("DEFINE"), (unsigned long long)b->defines,
                 MG_ESC("CREATE"), (unsigned long long)b->creates,
                 MG_ESC("UPDATE"), (unsigned long long)b->updates,
                 MG_ESC("DELETE"), (unsigned long long)b->deletes,
                 MG_ESC("unknown"), (unsigned long long)b->unknown);
      return 0;
    }

    // Common reply helper that adds CORS headers to JSON responses
    template <typename... Args>
    static void reply_json(struct mg_connection *c, int code, const char *fmt, Args &&...args)
    {
      mg_http_reply(c, code,
                    "Content-Type: application/json\r\n"
                    "Access-Control-Allow-Origin: *\r\n"
                    "Access-Control-Allow-Methods: GET, POST, OPTIONS\r\n"
                    "Access-Control-Allow-Headers: Content-Type, Authorization, X-Requested-With\r\n",
                    fmt, std::forward<Args>(args)...);
    }

    // HTTP handlers -----------------------------------------------------------------
    static void handle_health(struct mg_connection *c, ServerState *st)
    {
      auto counts = st->store->counts();
      reply_json(c, 200, "{%m:true,%m:%llu,%m:%llu,%m:%llu,%m:%llu}\n",
                 MG_ESC("ok"),
                 MG_ESC("nodes"), (unsigned long long)counts.nodes,
                 MG_ESC("edges"), (unsigned long long)counts.edges,
                 MG_ESC("type_definitions"), (unsigned long long)counts.typeDefinitions,
                 MG_ESC("batches"), (unsigned long long)counts.batches);
    }

    static void handle_apply(struct mg_connection *c, ServerState *st, struct mg_http_message *hm)
    {
      std::string_view text(hm->body.buf, hm->body.len);
      auto result = st->applier->apply(text);
      reply_json(c, result.success ? 200 : 422, "{%m:%s,%m:%llu,%m:%M}\n",
                 MG_ESC("success"), result.success ? "true" : "false",
                 MG_ESC("operations_applied"), (unsigned long long)result.operationsApplied,
                 MG_ESC("errors"), print_str_array, &result.errors);
    }

    static void handle_lint(struct mg_connection *c, ServerState *st, struct mg_http_message *hm)
    {
      std::string_view text(hm->body.buf, hm->body.len);
      auto batch = meridian::lintText(text, st->registry);
      auto breakdown = meridian::breakdownOf(batch);
      reply_json(c, 200, "{%m:%s,%m:%llu,%m:%M,%m:%M,%m:%M}\n",
                 MG_ESC("submittable"), batch.ok() ? "true" : "false",
                 MG_ESC("operation_count"), (unsigned long long)batch.operations.size(),
                 MG_ESC("breakdown"), print_breakdown, &breakdown,
                 MG_ESC("errors"), print_errors, &batch.errors,
                 MG_ESC("warnings"), print_warnings, &batch.operations);
    }

    static void handle_schema_types(struct mg_connection *c, ServerState *st, struct mg_http_message *hm)
    {
      std::optional<meridian::EntityKind> kind;
      if (!parseKind(queryVar(hm, "type"), kind))
      {
        reply_json(c, 400, "{\"error\":\"type must be node or edge\"}\n");
        return;
      }
      auto defs = st->registry->list(kind);
      reply_json(c, 200, "{%m:%M}\n", MG_ESC("types"), print_type_defs, &defs);
    }

    static void handle_schema_labels(struct mg_connection *c, ServerState *st, struct mg_http_message *hm)
    {
      std::optional<meridian::EntityKind> kind;
      if (!parseKind(queryVar(hm, "type"), kind))
      {
        reply_json(c, 400, "{\"error\":\"type must be node or edge\"}\n");
        return;
      }
      std::string prefix = queryVar(hm, "prefix").value_or(std::string());
      auto labels = st->registry->labels(kind.value_or(meridian::EntityKind::Node), prefix);
      reply_json(c, 200, "{%m:%M}\n", MG_ESC("labels"), print_str_array, &labels);
    }

    static void handle_get_entity(struct mg_connection *c, ServerState *st, struct mg_http_message *hm)
    {
      auto id = queryVar(hm, "id");
      if (!id)
      {
        reply_json(c, 400, "{\"error\":\"missing id\"}\n");
        return;
      }
      auto entity = st->store->getEntity(*id);
      if (!entity)
      {
        reply_json(c, 404, "{\"error\":\"not found\"}\n");
        return;
      }
      const auto &h = entity->header;
      if (h.kind == meridian::EntityKind::Edge)
      {
        reply_json(c, 200, "{%m:%m,%m:%m,%m:%m,%m:%m,%m:%m,%m:%M}\n",
                   MG_ESC("id"), MG_ESC(entity->id.c_str()),
                   MG_ESC("type"), MG_ESC("edge"),
                   MG_ESC("label"), MG_ESC(h.label.c_str()),
                   MG_ESC("start_id"), MG_ESC(h.startId.c_str()),
                   MG_ESC("end_id"), MG_ESC(h.endId.c_str()),
                   MG_ESC("properties"), print_props_object, &entity->props);
        return;
      }
      reply_json(c, 200, "{%m:%m,%m:%m,%m:%m,%m:%M}\n",
                 MG_ESC("id"), MG_ESC(entity->id.c_str()),
                 MG_ESC("type"), MG_ESC("node"),
                 MG_ESC("label"), MG_ESC(h.label.c_str()),
                 MG_ESC("properties"), print_props_object, &entity->props);
    }

    static void dispatch(struct mg_connection *c, ServerState *st, struct mg_http_message *hm)
    {
      if (mg_match(hm->uri, mg_str("/api/health"), NULL))
      {
        handle_health(c, st);
        return;
      }
      if (strEquals(hm->method, "POST") && mg_match(hm->uri, mg_str("/api/mutations"), NULL))
      {
        KJ_LOG(INFO, "dispatch: /api/mutations POST", (size_t)hm->body.len);
        handle_apply(c, st, hm);
        return;
      }
      if (strEquals(hm->method, "POST") && mg_match(hm->uri, mg_str("/api/mutations/lint"), NULL))
      {
        KJ_LOG(INFO, "dispatch: /api/mutations/lint POST", (size_t)hm->body.len);
        handle_lint(c, st, hm);
        return;
      }
      if (strEquals(hm->method, "GET") && mg_match(hm->uri, mg_str("/api/schema/types"), NULL))
      {
        KJ_LOG(INFO, "dispatch: /api/schema/types GET");
        handle_schema_types(c, st, hm);
        return;
      }
      if (strEquals(hm->method, "GET") && mg_match(hm->uri, mg_str("/api/schema/labels"), NULL))
      {
        KJ_LOG(INFO, "dispatch: /api/schema/labels GET");
        handle_schema_labels(c, st, hm);
        return;
      }
      if (strEquals(hm->method, "GET") && mg_match(hm->uri, mg_str("/api/entity"), NULL))
      {
        KJ_LOG(INFO, "dispatch: /api/entity GET");
        handle_get_entity(c, st, hm);
        return;
      }
      KJ_LOG(WARNING, "dispatch: not found");
      reply_json(c, 404, "{\"error\":\"not found\"}\n");
    }

    static void ev_handler(struct mg_connection *c, int ev, void *ev_data)
    {
      if (ev != MG_EV_HTTP_MSG)
        return;
      auto *hm = (struct mg_http_message *)ev_data;
      auto *st = (ServerState *)c->fn_data;

      // Handle CORS preflight
      if (strEquals(hm->method, "OPTIONS"))
      {
        mg_http_reply(c, 204,
                      "Access-Control-Allow-Origin: *\r\n"
                      "Access-Control-Allow-Methods: GET, POST, OPTIONS\r\n"
                      "Access-Control-Allow-Headers: Content-Type, Authorization, X-Requested-With\r\n"
                      "Access-Control-Max-Age: 86400\r\n",
                      "");
        return;
      }

      try
      {
        dispatch(c, st, hm);
      }
      catch (const std::exception &e)
      {
        KJ_LOG(ERROR, "http handler failed", e.what());
        reply_json(c, 500, "{%m:%m}\n", MG_ESC("error"), MG_ESC(e.what()));
      }
    }

    void run_loop(struct mg_mgr *mgr)
    {
      for (;;)
      {
        mg_mgr_poll(mgr, 250);
      }
    }
  } // namespace

  void startHttpServer(meridian::Store &store, meridian::SchemaRegistry &registry, const std::string &bind)
  {
    std::thread([&store, &registry, bind]()
                {
      struct mg_mgr mgr{};
      mg_mgr_init(&mgr);

      meridian::MutationApplier applier(store, registry);
      ServerState st{.store = &store, .registry = &registry, .applier = &applier};
      struct mg_connection *c = mg_http_listen(&mgr, bind.c_str(), ev_handler, &st);
      if (c == nullptr)
      {
        KJ_LOG(ERROR, "http listen failed", bind.c_str());
        mg_mgr_free(&mgr);
        return;
      }
      run_loop(&mgr);
      mg_mgr_free(&mgr); })
        .detach();
  }

} // namespace meridian::http
