#include "mcp_protocol.h"

#include <chrono>
#include <string>
#include <utility>

#include "log.h"
#include "script_tools.h"

namespace kitrun {

namespace {

using json = nlohmann::json;

struct ResourceDefinition {
  const char *uri;
  const char *name;
  const char *description;
};

constexpr ResourceDefinition kResources[] = {
    {kKitStateUri, "Kit state", "Running sessions, slot owners and protocol counters."},
    {kScriptsUri, "Scripts", "Every script in the catalog with its tool name, if any."},
    {kScriptletsUri, "Scriptlets", "Scriptlet entries from the catalog."},
};

json kit_state_tool_definition() {
  ToolDefinition tool;
  tool.name = kKitStateTool;
  tool.description = "Report running script sessions and slot ownership";
  tool.input_schema = {{"type", "object"}, {"properties", json::object()}, {"required", json::array()}};
  return ToolDefinitionToJson(tool);
}

json scripts_snapshot(const ScriptCatalog &catalog) {
  json out = json::array();
  for (const Script &s : catalog.Scripts()) {
    json entry = {{"name", s.name}, {"path", s.path}};
    if (!s.description.empty()) entry["description"] = s.description;
    if (!s.kit_name.empty()) entry["kit"] = s.kit_name;
    ToolDefinition tool;
    if (GenerateToolFromScript(s, &tool)) entry["tool"] = tool.name;
    entry["hasSchema"] = s.schema.has_value();
    out.push_back(entry);
  }
  return out;
}

json scriptlets_snapshot(const ScriptCatalog &catalog) {
  json out = json::array();
  for (const Scriptlet &s : catalog.Scriptlets()) {
    json entry = {{"name", s.name}, {"tool", s.tool}, {"command", s.command}};
    if (!s.group.empty()) entry["group"] = s.group;
    if (!s.description.empty()) entry["description"] = s.description;
    out.push_back(entry);
  }
  return out;
}

}  // namespace

json MakeRpcResult(const json &id, const json &result) {
  return json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"result", result}};
}

json MakeRpcError(const json &id, int code, const std::string &message) {
  return json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

bool ParseRpcEnvelope(const std::string &body, json *id, std::string *method, json *params, json *response) {
  const json request = json::parse(body, nullptr, false);
  if (request.is_discarded()) {
    *response = MakeRpcError(nullptr, rpc_error::kParseError, "Parse error: invalid JSON");
    return false;
  }
  if (!request.is_object()) {
    *response = MakeRpcError(nullptr, rpc_error::kInvalidRequest, "Request must be a JSON object");
    return false;
  }
  *id = request.contains("id") ? request["id"] : json();
  auto version = request.find("jsonrpc");
  if (version == request.end() || !version->is_string()) {
    *response = MakeRpcError(*id, rpc_error::kInvalidRequest, "Missing or invalid 'jsonrpc' field");
    return false;
  }
  if (version->get<std::string>() != kJsonRpcVersion) {
    *response = MakeRpcError(*id, rpc_error::kInvalidRequest,
                             "Invalid jsonrpc version: expected '2.0', got '" + version->get<std::string>() + "'");
    return false;
  }
  auto m = request.find("method");
  if (m == request.end() || !m->is_string()) {
    *response = MakeRpcError(*id, rpc_error::kInvalidRequest, "Missing 'method' field");
    return false;
  }
  *method = m->get<std::string>();
  *params = request.contains("params") ? request["params"] : json::object();
  return true;
}

McpDispatcher::McpDispatcher(const McpContext &context) : ctx_(context) {}

json McpDispatcher::HandleBody(const std::string &body) {
  const auto started = std::chrono::steady_clock::now();
  const std::string timestamp = FormatRfc3339Millis(std::chrono::system_clock::now());
  auto elapsed_ms = [&]() {
    return (int64_t)std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started)
        .count();
  };

  json id;
  std::string method;
  json params;
  json response;
  if (!ParseRpcEnvelope(body, &id, &method, &params, &response)) {
    const int code = response["error"]["code"].get<int>();
    const std::string message = response["error"]["message"].get<std::string>();
    log_event("MCP_BAD_REQUEST", 0, message);
    Audit(method.empty() ? "<invalid>" : method, "", json(), elapsed_ms(), false, code, message, timestamp);
    return response;
  }

  log_event("MCP_REQUEST", 0, method);
  json result;
  RpcFault fault;
  std::string tool;
  if (!Dispatch(method, params, &result, &fault, &tool)) {
    Audit(method, tool, params, elapsed_ms(), false, fault.code, fault.message, timestamp);
    return MakeRpcError(id, fault.code, fault.message);
  }

  bool success = true;
  std::string reason;
  if (result.is_object() && result.value("isError", false)) {
    success = false;
    if (result.contains("content") && result["content"].is_array() && !result["content"].empty()) {
      reason = result["content"][0].value("text", "");
    }
  }
  Audit(method, tool, params, elapsed_ms(), success, 0, reason, timestamp);
  return MakeRpcResult(id, result);
}

bool McpDispatcher::Dispatch(const std::string &method, const json &params, json *result, RpcFault *fault,
                             std::string *tool) {
  if (method == "initialize") {
    *result = HandleInitialize(params);
    return true;
  }
  if (method == "tools/list") {
    *result = HandleToolsList();
    return true;
  }
  if (method == "tools/call") return HandleToolsCall(params, result, fault, tool);
  if (method == "resources/list") {
    *result = HandleResourcesList();
    return true;
  }
  if (method == "resources/read") return HandleResourcesRead(params, result, fault);
  fault->code = rpc_error::kMethodNotFound;
  fault->message = "Method not found: " + method;
  return false;
}

json McpDispatcher::ServerInfo() const {
  return json{
      {"name", kServerName},
      {"version", kKitrunVersion},
      {"protocolVersion", kMcpProtocolVersion},
      {"capabilities", json::array({"tools", "resources"})},
  };
}

json McpDispatcher::KitState() const {
  json sessions = json::array();
  if (ctx_.executor) {
    for (const SessionInfo &s : ctx_.executor->ListSessions()) {
      json entry = {
          {"id", s.id},
          {"pid", s.pid},
          {"script", s.script_path},
          {"alive", s.alive},
          {"malformedCount", s.malformed_count},
          {"violationCount", s.violation_count},
      };
      if (!s.pending_prompt_id.empty()) entry["pendingPromptId"] = s.pending_prompt_id;
      sessions.push_back(entry);
    }
  }
  json slots = json::object();
  if (ctx_.slots) {
    for (const auto &kv : ctx_.slots->Snapshot()) slots[kv.first] = kv.second;
  }
  json state = {
      {"version", kKitrunVersion},
      {"sessions", sessions},
      {"slots", slots},
      {"scriptCount", ctx_.catalog ? ctx_.catalog->Scripts().size() : 0},
  };
  if (ctx_.executor) {
    state["globalMalformedCount"] = ctx_.executor->GlobalMalformedCount();
    state["malformedBudget"] = ctx_.executor->config().malformed_budget;
    state["malformedBudgetScope"] = MalformedBudgetScopeName(ctx_.executor->config().malformed_budget_scope);
  }
  return state;
}

json McpDispatcher::HandleInitialize(const json &params) const {
  std::string client = "unknown";
  if (params.is_object() && params.contains("clientInfo") && params["clientInfo"].is_object()) {
    client = params["clientInfo"].value("name", "unknown");
  }
  log_event("MCP_INITIALIZE", 0, "client=" + client);
  return json{
      {"protocolVersion", kMcpProtocolVersion},
      {"serverInfo", {{"name", kServerName}, {"version", kKitrunVersion}}},
      {"capabilities",
       {
           {"tools", {{"listChanged", true}}},
           {"resources", {{"subscribe", false}, {"listChanged", true}}},
       }},
  };
}

json McpDispatcher::HandleToolsList() const {
  json tools = json::array();
  tools.push_back(kit_state_tool_definition());
  if (ctx_.catalog) {
    for (const ToolDefinition &t : GenerateScriptTools(ctx_.catalog->Scripts())) tools.push_back(ToolDefinitionToJson(t));
  }
  return json{{"tools", tools}};
}

bool McpDispatcher::HandleToolsCall(const json &params, json *result, RpcFault *fault, std::string *tool) {
  if (!params.is_object()) {
    fault->code = rpc_error::kInvalidParams;
    fault->message = "Invalid params: expected object";
    return false;
  }
  auto name_it = params.find("name");
  if (name_it == params.end() || !name_it->is_string()) {
    fault->code = rpc_error::kInvalidParams;
    fault->message = "Missing required parameter: name";
    return false;
  }
  const std::string name = name_it->get<std::string>();
  *tool = name;
  const json arguments = params.contains("arguments") ? params["arguments"] : json::object();

  if (name == kKitStateTool) {
    const json state = KitState();
    ToolCallResult r;
    r.text = state.dump();
    r.structured = state;
    r.exit_code = 0;
    *result = ToolCallResultToJson(r);
    return true;
  }

  const std::string prefix = kScriptToolPrefix;
  Script script;
  const bool is_script_tool = name.compare(0, prefix.size(), prefix) == 0;
  if (!is_script_tool || !ctx_.catalog || !ctx_.catalog->FindBySlug(name.substr(prefix.size()), &script) ||
      !GenerateToolFromScript(script, nullptr)) {
    fault->code = rpc_error::kMethodNotFound;
    fault->message = "Tool not found: " + name;
    return false;
  }
  if (!ctx_.executor) {
    fault->code = rpc_error::kInternalError;
    fault->message = "No executor configured";
    return false;
  }

  ToolCallResult r;
  KitError err;
  if (!RunScriptTool(ctx_.executor, script, arguments, ctx_.tool_call_timeout_ms, &r, &err)) {
    fault->code = RpcCodeForToolError(err);
    fault->message = err.message;
    return false;
  }
  *result = ToolCallResultToJson(r);
  return true;
}

json McpDispatcher::HandleResourcesList() const {
  json resources = json::array();
  for (const ResourceDefinition &r : kResources) {
    resources.push_back({{"uri", r.uri}, {"name", r.name}, {"description", r.description}, {"mimeType", "application/json"}});
  }
  return json{{"resources", resources}};
}

bool McpDispatcher::HandleResourcesRead(const json &params, json *result, RpcFault *fault) const {
  if (!params.is_object() || !params.contains("uri") || !params["uri"].is_string()) {
    fault->code = rpc_error::kInvalidParams;
    fault->message = "Missing required parameter: uri";
    return false;
  }
  const std::string uri = params["uri"].get<std::string>();
  json body;
  if (uri == kKitStateUri) {
    body = KitState();
  } else if (uri == kScriptsUri) {
    body = ctx_.catalog ? scripts_snapshot(*ctx_.catalog) : json::array();
  } else if (uri == kScriptletsUri) {
    body = ctx_.catalog ? scriptlets_snapshot(*ctx_.catalog) : json::array();
  } else {
    fault->code = rpc_error::kMethodNotFound;
    fault->message = "Resource not found: " + uri;
    return false;
  }
  *result = json{{"contents", json::array({json{{"uri", uri}, {"mimeType", "application/json"}, {"text", body.dump()}}})}};
  return true;
}

void McpDispatcher::Audit(const std::string &method, const std::string &tool, const json &params, int64_t duration_ms,
                          bool success, int error_code, const std::string &reason, const std::string &timestamp) {
  if (!ctx_.audit) return;
  AuditLogEntry entry;
  entry.timestamp = timestamp;
  entry.method = method;
  entry.tool = tool;
  entry.params_digest = DigestParams(params);
  entry.duration_ms = duration_ms;
  entry.success = success;
  entry.error_code = error_code;
  entry.reason = reason;
  ctx_.audit->Append(entry);
}

}  // namespace kitrun
