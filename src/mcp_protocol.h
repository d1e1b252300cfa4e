#ifndef KITRUN_MCP_PROTOCOL_H_
#define KITRUN_MCP_PROTOCOL_H_

#include <string>

#include <nlohmann/json.hpp>

#include "audit_log.h"
#include "kit_protocol.h"
#include "script_catalog.h"
#include "script_executor.h"
#include "slot_table.h"

namespace kitrun {

static constexpr const char kServerName[] = "script-kit";
static constexpr const char kKitStateUri[] = "kit://state";
static constexpr const char kScriptsUri[] = "scripts://";
static constexpr const char kScriptletsUri[] = "scriptlets://";
static constexpr const char kKitStateTool[] = "kit/state";

struct McpContext {
  ScriptCatalog *catalog = nullptr;
  ScriptExecutor *executor = nullptr;
  SlotTable *slots = nullptr;
  AuditLogger *audit = nullptr;  // optional
  int tool_call_timeout_ms = kDefaultToolCallTimeoutMs;
};

struct RpcFault {
  int code = 0;
  std::string message;
};

nlohmann::json MakeRpcResult(const nlohmann::json &id, const nlohmann::json &result);
nlohmann::json MakeRpcError(const nlohmann::json &id, int code, const std::string &message);

// Checks the JSON-RPC envelope. On failure `response` holds the error reply.
bool ParseRpcEnvelope(const std::string &body, nlohmann::json *id, std::string *method, nlohmann::json *params,
                      nlohmann::json *response);

// JSON-RPC method table. Safe to call from several connection threads.
class McpDispatcher {
 public:
  explicit McpDispatcher(const McpContext &context);

  McpDispatcher(const McpDispatcher &) = delete;
  McpDispatcher &operator=(const McpDispatcher &) = delete;

  // Parses, dispatches and audits one request body. Always returns a
  // JSON-RPC response object.
  nlohmann::json HandleBody(const std::string &body);

  nlohmann::json ServerInfo() const;
  nlohmann::json KitState() const;

 private:
  bool Dispatch(const std::string &method, const nlohmann::json &params, nlohmann::json *result, RpcFault *fault,
                std::string *tool);
  nlohmann::json HandleInitialize(const nlohmann::json &params) const;
  nlohmann::json HandleToolsList() const;
  bool HandleToolsCall(const nlohmann::json &params, nlohmann::json *result, RpcFault *fault, std::string *tool);
  nlohmann::json HandleResourcesList() const;
  bool HandleResourcesRead(const nlohmann::json &params, nlohmann::json *result, RpcFault *fault) const;
  void Audit(const std::string &method, const std::string &tool, const nlohmann::json &params, int64_t duration_ms,
             bool success, int error_code, const std::string &reason, const std::string &timestamp);

  McpContext ctx_;
};

}  // namespace kitrun

#endif  // KITRUN_MCP_PROTOCOL_H_
