#ifndef KITRUN_SCRIPT_TOOLS_H_
#define KITRUN_SCRIPT_TOOLS_H_

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "kit_protocol.h"
#include "script_catalog.h"
#include "script_executor.h"

namespace kitrun {

static constexpr const char kScriptToolPrefix[] = "scripts/";
static constexpr const char kKitToolPrefix[] = "kit/";

struct ToolDefinition {
  std::string name;
  std::string description;
  nlohmann::json input_schema;
};

struct ToolCallResult {
  std::string text;
  nlohmann::json structured;  // null when the script declares no outputs
  bool is_error = false;
  int exit_code = -1;
  std::string reason;
};

nlohmann::json FieldToJsonSchema(const FieldDef &field);
nlohmann::json ToolDefinitionToJson(const ToolDefinition &tool);
nlohmann::json ToolCallResultToJson(const ToolCallResult &result);

// Only scripts with at least one declared input become tools.
bool GenerateToolFromScript(const Script &script, ToolDefinition *out);
std::vector<ToolDefinition> GenerateScriptTools(const std::vector<Script> &scripts);

// Checks presence of required fields and the declared type, enum and range
// of each supplied value.
bool ValidateToolArguments(const Script &script, const nlohmann::json &arguments, KitError *error);

// Runs one tool call on a fresh session. Each prompt consumes the next
// declared input field: the argument, else its default, else the cancel
// sentinel. Fails with Timeout after `timeout_ms`, LaunchError when the
// script cannot start and InvalidArgument for bad arguments.
bool RunScriptTool(ScriptExecutor *executor,
                   const Script &script,
                   const nlohmann::json &arguments,
                   int timeout_ms,
                   ToolCallResult *result,
                   KitError *error);

// JSON-RPC error code for a failed RunScriptTool.
int RpcCodeForToolError(const KitError &error);

}  // namespace kitrun

#endif  // KITRUN_SCRIPT_TOOLS_H_
