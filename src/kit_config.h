#ifndef KITRUN_KIT_CONFIG_H_
#define KITRUN_KIT_CONFIG_H_

#include <cstddef>
#include <cstdint>
#include <string>

#include "kit_protocol.h"

namespace kitrun {

// Scope of the malformed-line budget: each session counts its own garbage
// lines, or every session draws from one process-wide counter.
enum class MalformedBudgetScope : uint8_t {
  Session = 0,
  Global = 1,
};

// Every runtime tunable, with its default, in one place.
struct KitConfig {
  std::string kit_path;
  std::string bind_host = "127.0.0.1";
  uint16_t port = kDefaultMcpPort;  // 0 binds an ephemeral port
  int cancel_grace_ms = kDefaultCancelGraceMs;
  int tool_call_timeout_ms = kDefaultToolCallTimeoutMs;
  int malformed_budget = kDefaultMalformedBudget;
  MalformedBudgetScope malformed_budget_scope = MalformedBudgetScope::Session;
  size_t max_line_bytes = kDefaultMaxLineBytes;
  size_t stderr_tail_lines = kDefaultStderrTailLines;
  std::string audit_log_path;
  std::string catalog_path;
};

// Resolves ~/.scriptkit (or $SCRIPT_KIT_PATH). Empty when HOME is unset.
std::string DefaultKitPath();

// Fills derived paths (audit log, catalog) that are still empty.
void FinalizeKitConfig(KitConfig *config);

// Defaults, then <kit_path>/kitrun.json when present, then environment
// (MCP_PORT, KITRUN_TOOL_TIMEOUT_MS, KITRUN_MALFORMED_BUDGET).
bool LoadKitConfig(KitConfig *config, KitError *error);

// Applies a parsed kitrun.json document on top of `config`.
bool ApplyKitConfigJson(const std::string &text, KitConfig *config, KitError *error);

const char *MalformedBudgetScopeName(MalformedBudgetScope scope);

}  // namespace kitrun

#endif  // KITRUN_KIT_CONFIG_H_
