#include "kit_config.h"

#include <stdlib.h>

#include <cstdint>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>

#include "slot_table.h"

namespace {

bool require(bool cond, const char* msg) {
  if (cond) return true;
  std::cerr << "[kit_config_test] FAIL: " << msg << "\n";
  return false;
}

}  // namespace

int main() {
  bool ok = true;

  char tmpl[] = "/tmp/kitrun_config_XXXXXX";
  if (!mkdtemp(tmpl)) return 1;
  const std::string dir = tmpl;
  unsetenv("MCP_PORT");
  unsetenv("KITRUN_TOOL_TIMEOUT_MS");
  unsetenv("KITRUN_MALFORMED_BUDGET");
  setenv("SCRIPT_KIT_PATH", dir.c_str(), 1);

  {
    // Defaults with no kitrun.json.
    kitrun::KitConfig config;
    kitrun::KitError err;
    ok = ok && require(kitrun::LoadKitConfig(&config, &err), "defaults load");
    ok = ok && require(config.kit_path == dir, "kit path from SCRIPT_KIT_PATH");
    ok = ok && require(config.port == kitrun::kDefaultMcpPort, "default port");
    ok = ok && require(config.audit_log_path == dir + "/logs/mcp-audit.jsonl", "derived audit path");
    ok = ok && require(config.catalog_path == dir + "/catalog.json", "derived catalog path");
    ok = ok && require(config.malformed_budget_scope == kitrun::MalformedBudgetScope::Session, "session scope default");
  }

  {
    // File values, then environment on top.
    std::ofstream(dir + "/kitrun.json")
        << R"({"port":5000,"cancel_grace_ms":250,"malformed_budget":4,"malformed_budget_scope":"global"})";
    setenv("MCP_PORT", "6001", 1);
    kitrun::KitConfig config;
    kitrun::KitError err;
    ok = ok && require(kitrun::LoadKitConfig(&config, &err), "file config loads");
    ok = ok && require(config.port == 6001, "MCP_PORT wins over the file");
    ok = ok && require(config.cancel_grace_ms == 250, "grace from file");
    ok = ok && require(config.malformed_budget == 4, "budget from file");
    ok = ok && require(config.malformed_budget_scope == kitrun::MalformedBudgetScope::Global, "global scope");
    unsetenv("MCP_PORT");
  }

  {
    // Bad values are rejected with InvalidArgument.
    kitrun::KitError err;
    setenv("MCP_PORT", "seventy", 1);
    kitrun::KitConfig config;
    ok = ok && require(!kitrun::LoadKitConfig(&config, &err), "non-numeric MCP_PORT rejected");
    ok = ok && require(err.code == kitrun::KitErrorCode::InvalidArgument, "env error code");
    unsetenv("MCP_PORT");

    kitrun::KitConfig c2;
    ok = ok && require(!kitrun::ApplyKitConfigJson("{", &c2, &err), "broken json rejected");
    ok = ok && require(!kitrun::ApplyKitConfigJson(R"({"port":"80"})", &c2, &err), "string port rejected");
    ok = ok && require(!kitrun::ApplyKitConfigJson(R"({"port":70000})", &c2, &err), "port out of range");
    ok = ok && require(kitrun::ApplyKitConfigJson(R"({"port":0})", &c2, &err) && c2.port == 0,
                       "port 0 asks for an ephemeral port");
    setenv("MCP_PORT", "0", 1);
    kitrun::KitConfig c3;
    ok = ok && require(kitrun::LoadKitConfig(&c3, &err) && c3.port == 0, "MCP_PORT=0 accepted");
    unsetenv("MCP_PORT");
    ok = ok && require(!kitrun::ApplyKitConfigJson(R"({"bind_host":"0.0.0.0"})", &c2, &err),
                       "non-loopback bind rejected");
    ok = ok && require(!kitrun::ApplyKitConfigJson(R"({"malformed_budget_scope":"team"})", &c2, &err),
                       "unknown scope rejected");
  }

  {
    // Slot ownership.
    kitrun::SlotTable table;
    kitrun::KitError err;
    ok = ok && require(table.TryAcquire(kitrun::kMainSlot, 1, &err), "session 1 takes main");
    ok = ok && require(table.TryAcquire(kitrun::kMainSlot, 1, &err), "re-acquire by owner is fine");
    ok = ok && require(!table.TryAcquire(kitrun::kMainSlot, 2, &err), "session 2 refused");
    ok = ok && require(!table.Release(kitrun::kMainSlot, 2), "non-owner cannot release");
    ok = ok && require(table.Release(kitrun::kMainSlot, 1), "owner releases");

    {
      kitrun::SlotLease lease;
      ok = ok && require(kitrun::SlotLease::Acquire(&table, "widget", 7, &lease, &err), "lease acquired");
      kitrun::SlotLease moved(std::move(lease));
      ok = ok && require(!lease.held() && moved.held(), "lease moves");
      uint64_t owner = 0;
      ok = ok && require(table.Owner("widget", &owner) && owner == 7, "owner recorded");
    }
    uint64_t owner = 0;
    ok = ok && require(!table.Owner("widget", &owner), "lease released at scope exit");
  }

  if (!ok) return 1;
  std::cout << "[kit_config_test] PASS\n";
  return 0;
}
