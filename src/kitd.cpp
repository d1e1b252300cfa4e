// kitd.cpp
//
// Long-running host: loads the kit configuration and script catalog, then
// serves the MCP JSON-RPC endpoint on loopback until SIGINT or SIGTERM.
// The catalog manifest is reloaded whenever its mtime changes.
//
// Usage:  build/kitd [catalog.json]

#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>

#include <csignal>
#include <cstdio>
#include <cstring>
#include <string>

#include "audit_log.h"
#include "kit_config.h"
#include "log.h"
#include "mcp_protocol.h"
#include "mcp_server.h"
#include "script_catalog.h"
#include "script_executor.h"
#include "slot_table.h"

namespace {

volatile sig_atomic_t g_stop = 0;

void on_signal(int) { g_stop = 1; }

long long file_mtime_ns(const std::string &path) {
  struct stat st;
  if (stat(path.c_str(), &st) != 0) return -1;
  return (long long)st.st_mtim.tv_sec * 1000000000LL + (long long)st.st_mtim.tv_nsec;
}

// A missing manifest is an empty catalog; a broken one keeps the old entries.
bool reload_catalog(const std::string &path, kitrun::ScriptCatalog *catalog) {
  kitrun::ScriptCatalog next;
  if (file_mtime_ns(path) < 0) {
    catalog->ReplaceFrom(next);
    kitrun::log_event("CATALOG_MISSING", 0, path);
    return true;
  }
  kitrun::KitError err;
  if (!kitrun::LoadCatalogFile(path, &next, &err)) {
    kitrun::log_event("CATALOG_LOAD_FAILED", 0, err.message);
    return false;
  }
  catalog->ReplaceFrom(next);
  return true;
}

}  // namespace

int main(int argc, char **argv) {
  kitrun::KitConfig config;
  kitrun::KitError err;
  if (!kitrun::LoadKitConfig(&config, &err)) {
    std::fprintf(stderr, "kitd: %s\n", err.message.c_str());
    return 1;
  }
  if (argc >= 2) config.catalog_path = argv[1];

  struct sigaction sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sa_handler = on_signal;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);

  kitrun::ScriptCatalog catalog;
  long long catalog_mtime = file_mtime_ns(config.catalog_path);
  if (!reload_catalog(config.catalog_path, &catalog)) {
    std::fprintf(stderr, "kitd: could not load catalog %s\n", config.catalog_path.c_str());
    return 1;
  }

  kitrun::ScriptExecutor executor(config);
  kitrun::SlotTable slots;
  kitrun::AuditLogger audit(config.audit_log_path);

  kitrun::McpContext ctx;
  ctx.catalog = &catalog;
  ctx.executor = &executor;
  ctx.slots = &slots;
  ctx.audit = &audit;
  ctx.tool_call_timeout_ms = config.tool_call_timeout_ms;
  kitrun::McpDispatcher dispatcher(ctx);

  kitrun::McpServer server(config, &dispatcher);
  if (!server.Start(&err)) {
    std::fprintf(stderr, "kitd: %s\n", err.message.c_str());
    return 1;
  }
  std::fprintf(stderr, "kitd: listening on %s (token in %s/agent-token)\n", server.url().c_str(),
               config.kit_path.c_str());

  while (!g_stop) {
    usleep(250 * 1000);
    const long long mt = file_mtime_ns(config.catalog_path);
    if (mt != catalog_mtime) {
      catalog_mtime = mt;
      reload_catalog(config.catalog_path, &catalog);
    }
  }

  kitrun::log_event("KITD_SHUTDOWN", 0);
  server.Stop();
  return 0;
}
