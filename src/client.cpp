#include "schemas/meridian.capnp.h"
#include <capnp/ez-rpc.h>
#include <kj/debug.h>
#include <fstream>
#include <iostream>
#include <sstream>
#include <cstring>
#include <string>

static const char *severityName(meridian::rpc::Severity s)
{
  switch (s)
  {
  case meridian::rpc::Severity::PARSE_ERROR:
    return "parse error";
  case meridian::rpc::Severity::STRUCTURAL_ERROR:
    return "error";
  case meridian::rpc::Severity::WARNING:
  default:
    return "warning";
  }
}

static int usage(const char *argv0)
{
  std::cerr << "usage: " << argv0 << " [--lint] <batch.jsonl> [bind]\n"
            << "  submits a mutation batch (or only lints it with --lint)\n"
            << "  bind defaults to unix:/tmp/meridian.sock\n";
  return 2;
}

int main(int argc, char **argv)
{
  int argi = 1;
  bool lintOnly = false;
  if (argi < argc && std::strcmp(argv[argi], "--lint") == 0)
  {
    lintOnly = true;
    ++argi;
  }
  if (argi >= argc)
    return usage(argv[0]);
  const char *path = argv[argi++];
  const char *addr = (argi < argc) ? argv[argi] : "unix:/tmp/meridian.sock";

  std::ifstream in(path, std::ios::binary);
  if (!in)
  {
    std::cerr << "cannot read " << path << "\n";
    return 1;
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  std::string text = buf.str();

  capnp::ReaderOptions opts;
  opts.traversalLimitInWords = 1ull << 30;
  capnp::EzRpcClient client(addr, 0, opts);
  auto cap = client.getMain<meridian::rpc::Meridian>();
  auto &ws = client.getWaitScope();

  if (lintOnly)
  {
    auto req = cap.lintRequest();
    req.setText(text);
    auto resp = req.send().wait(ws);
    auto report = resp.getReport();
    auto bd = report.getBreakdown();
    std::cout << "operations: " << report.getOperationCount()
              << " (DEFINE " << bd.getDefines() << ", CREATE " << bd.getCreates()
              << ", UPDATE " << bd.getUpdates() << ", DELETE " << bd.getDeletes() << ")\n";
    for (auto d : report.getDiagnostics())
      std::cout << "\tline " << d.getLine() << " " << severityName(d.getSeverity()) << ": " << d.getMessage().cStr() << "\n";
    std::cout << (report.getSubmittable() ? "submittable\n" : "blocked\n");
    return report.getSubmittable() ? 0 : 1;
  }

  auto req = cap.applyBatchRequest();
  req.setText(text);
  auto resp = req.send().wait(ws);
  auto result = resp.getResult();
  std::cout << "success=" << (result.getSuccess() ? "true" : "false")
            << " operations_applied=" << result.getOperationsApplied() << "\n";
  for (auto e : result.getErrors())
    std::cout << "\t" << e.cStr() << "\n";
  return result.getSuccess() ? 0 : 1;
}
