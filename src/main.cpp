#include "env.hpp"
#include "store.hpp"
#include "schema_registry.hpp"
#include "dispatcher.hpp"
#include "server.hpp"
#include "http_server.hpp"
#include <capnp/ez-rpc.h>
#include <kj/async-io.h>
#include <kj/main.h>
#include <kj/debug.h>
#include <charconv>
#include <filesystem>
#include <cstring>
#include <unistd.h>

class MeridiandApp
{
public:
  explicit MeridiandApp(kj::ProcessContext &context) : context_(context) {}

  kj::MainFunc getMain()
  {
    return kj::MainBuilder(context_, "0.1", "Meridian graph mutation server using capnproto RPC")
        .addOption({'v'}, KJ_BIND_METHOD(*this, optVerbose),
                   "increase logging verbosity (INFO)")
        .addOptionWithArg({'b', "bind"}, KJ_BIND_METHOD(*this, optBind),
                          "bind", "bind address (e.g., unix:/tmp/meridian.sock or 0.0.0.0:0)")
        .addOptionWithArg({'d', "data"}, KJ_BIND_METHOD(*this, optData),
                          "dir", "data directory for LMDB (default: data)")
        .addOptionWithArg({'H', "http"}, KJ_BIND_METHOD(*this, optHttp),
                          "http", "HTTP bind (e.g., http://0.0.0.0:8080, default: disabled)")
        .addOptionWithArg({'m', "map-size"}, KJ_BIND_METHOD(*this, optMapSize),
                          "mib", "LMDB map size in MiB (default: 16384)")
        .addOptionWithArg({"background-threshold"}, KJ_BIND_METHOD(*this, optBackgroundThreshold),
                          "bytes", "lint sessions parse larger input on a worker thread (default: 100000)")
        .addOptionWithArg({"summary-threshold"}, KJ_BIND_METHOD(*this, optSummaryThreshold),
                          "bytes", "lint sessions only summarize larger input (default: 10000000)")
        .callAfterParsing(KJ_BIND_METHOD(*this, run))
        .build();
  }

private:
  kj::ProcessContext &context_;
  kj::String bind_ = kj::heapString("unix:/tmp/meridian.sock");
  kj::String dataDir_ = kj::heapString("data");
  size_t mapSizeBytes_ = size_t(16ull << 30);
  kj::String httpBind_ = kj::heapString("");
  meridian::DispatcherConfig dispatcher_{};

  static bool parseSize(kj::StringPtr value, size_t &out)
  {
    const char *b = value.begin();
    const char *e = value.end();
    auto res = std::from_chars(b, e, out);
    return res.ec == std::errc{} && res.ptr == e;
  }

  kj::MainBuilder::Validity optVerbose()
  {
    context_.increaseLoggingVerbosity();
    return true;
  }

  kj::MainBuilder::Validity optBind(kj::StringPtr value)
  {
    bind_ = kj::heapString(value);
    return true;
  }

  kj::MainBuilder::Validity optData(kj::StringPtr value)
  {
    dataDir_ = kj::heapString(value);
    return true;
  }

  kj::MainBuilder::Validity optHttp(kj::StringPtr value)
  {
    httpBind_ = kj::heapString(value);
    return true;
  }

  kj::MainBuilder::Validity optMapSize(kj::StringPtr value)
  {
    size_t mib = 0;
    if (!parseSize(value, mib) || mib == 0)
      return "map size must be a positive integer (MiB)";
    mapSizeBytes_ = mib << 20;
    return true;
  }

  kj::MainBuilder::Validity optBackgroundThreshold(kj::StringPtr value)
  {
    if (!parseSize(value, dispatcher_.backgroundThreshold))
      return "background threshold must be a byte count";
    return true;
  }

  kj::MainBuilder::Validity optSummaryThreshold(kj::StringPtr value)
  {
    if (!parseSize(value, dispatcher_.summaryThreshold))
      return "summary threshold must be a byte count";
    return true;
  }

  kj::MainBuilder::Validity run()
  {
    if (dispatcher_.summaryThreshold < dispatcher_.backgroundThreshold)
      return "summary threshold must not be below the background threshold";
    try
    {
      std::filesystem::create_directories(std::filesystem::path(dataDir_.cStr()));

      meridian::Env env(std::filesystem::path(dataDir_.cStr()), mapSizeBytes_);
      meridian::Store store(env);
      meridian::SchemaRegistry registry;
      size_t loaded = registry.loadFrom(store);
      KJ_LOG(INFO, "type definitions loaded", loaded);

      const char *bindC = bind_.cStr();
      if (std::strncmp(bindC, "unix:", 5) == 0)
      {
        const char *path = bindC + 5;
        ::unlink(path);
      }

      if (httpBind_.size() > 0)
      {
        meridian::http::startHttpServer(store, registry, std::string(httpBind_.cStr()));
        KJ_LOG(INFO, "http server listening on ", httpBind_);
      }

      auto impl = kj::heap<meridian::rpc::MeridianImpl>(store, registry, dispatcher_);
      auto &implRef = *impl;
      capnp::EzRpcServer server(kj::mv(impl), bindC);
      implRef.attachTimer(server.getIoProvider().getTimer());
      auto &waitScope = server.getWaitScope();
      if (std::strncmp(bindC, "unix:", 5) == 0)
      {
        KJ_LOG(INFO, "meridiand listening on ", bindC);
      }
      else
      {
        auto addr = server.getPort().wait(waitScope);
        KJ_LOG(INFO, "meridiand listening on ", bindC, " (port ", addr, ")");
      }
      kj::NEVER_DONE.wait(waitScope);
    }
    catch (const std::exception &e)
    {
      KJ_LOG(ERROR, "fatal: ", e.what());
      return kj::MainBuilder::Validity("fatal error");
    }
    return true;
  }
};

KJ_MAIN(MeridiandApp);
