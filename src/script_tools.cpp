#include "script_tools.h"

#include <algorithm>
#include <chrono>
#include <string>

#include "log.h"
#include "prompt_session.h"

namespace kitrun {

namespace {

using json = nlohmann::json;
using kitrun_prompt::PromptSessionState;
using kitrun_prompt::PromptState;

bool value_matches_type(const json &value, FieldType type) {
  switch (type) {
    case FieldType::String: return value.is_string();
    case FieldType::Number: return value.is_number();
    case FieldType::Boolean: return value.is_boolean();
    case FieldType::Array: return value.is_array();
    case FieldType::Object: return value.is_object();
    case FieldType::Any: return true;
    default: return true;
  }
}

int64_t ms_until(std::chrono::steady_clock::time_point deadline) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
}

// Next answer for a prompt, consuming one declared field. Null means the
// prompt gets the null sentinel: an omitted optional field without a default
// is skipped, and with no field left (`exhausted`) the script is cancelled.
json next_answer(const Schema &schema, const json &arguments, size_t *next_field, bool *exhausted) {
  *exhausted = *next_field >= schema.input.size();
  if (*exhausted) return json();
  const FieldDef &field = schema.input[(*next_field)++];
  if (arguments.is_object()) {
    auto it = arguments.find(field.name);
    if (it != arguments.end() && !it->is_null()) return *it;
  }
  return field.default_value;
}

std::string build_text(const PromptSessionState &st, const Schema &schema, json *structured) {
  if (!schema.output.empty()) {
    json filtered = json::object();
    for (const FieldDef &f : schema.output) {
      auto it = st.merged_output.find(f.name);
      if (it != st.merged_output.end()) filtered[f.name] = *it;
    }
    *structured = filtered;
    return filtered.dump();
  }
  if (!st.merged_output.empty()) return st.merged_output.dump();
  if (!st.exit_message.empty()) return st.exit_message;
  return st.last_prompt_text;
}

}  // namespace

json FieldToJsonSchema(const FieldDef &field) {
  json prop = json::object();
  if (field.type != FieldType::Any) prop["type"] = FieldTypeName(field.type);
  if (!field.description.empty()) prop["description"] = field.description;
  if (!field.default_value.is_null()) prop["default"] = field.default_value;
  if (!field.enum_values.empty()) prop["enum"] = field.enum_values;
  if (field.minimum) prop["minimum"] = *field.minimum;
  if (field.maximum) prop["maximum"] = *field.maximum;
  if (field.items) {
    json items = json::object();
    if (*field.items != FieldType::Any) items["type"] = FieldTypeName(*field.items);
    prop["items"] = items;
  }
  return prop;
}

json ToolDefinitionToJson(const ToolDefinition &tool) {
  return json{{"name", tool.name}, {"description", tool.description}, {"inputSchema", tool.input_schema}};
}

json ToolCallResultToJson(const ToolCallResult &result) {
  json out = {
      {"content", json::array({json{{"type", "text"}, {"text", result.text}}})},
      {"isError", result.is_error},
  };
  if (!result.structured.is_null()) out["structuredContent"] = result.structured;
  return out;
}

bool GenerateToolFromScript(const Script &script, ToolDefinition *out) {
  if (!script.schema || script.schema->input.empty()) return false;
  ToolDefinition tool;
  tool.name = std::string(kScriptToolPrefix) + SlugifyName(script.name);
  tool.description = script.description.empty() ? "Run the '" + script.name + "' script" : script.description;
  json properties = json::object();
  json required = json::array();
  for (const FieldDef &f : script.schema->input) {
    properties[f.name] = FieldToJsonSchema(f);
    if (f.required) required.push_back(f.name);
  }
  tool.input_schema = {{"type", "object"}, {"properties", properties}, {"required", required}};
  if (out) *out = std::move(tool);
  return true;
}

std::vector<ToolDefinition> GenerateScriptTools(const std::vector<Script> &scripts) {
  std::vector<ToolDefinition> tools;
  for (const Script &s : scripts) {
    ToolDefinition tool;
    if (GenerateToolFromScript(s, &tool)) tools.push_back(std::move(tool));
  }
  return tools;
}

bool ValidateToolArguments(const Script &script, const json &arguments, KitError *error) {
  if (!arguments.is_null() && !arguments.is_object()) {
    return set_err(error, KitErrorCode::InvalidArgument, "'arguments' must be an object");
  }
  if (!script.schema) return true;
  for (const FieldDef &f : script.schema->input) {
    const bool present = arguments.is_object() && arguments.contains(f.name) && !arguments[f.name].is_null();
    if (!present) {
      if (f.required && f.default_value.is_null()) {
        return set_err(error, KitErrorCode::InvalidArgument, "Missing required argument: " + f.name);
      }
      continue;
    }
    const json &v = arguments[f.name];
    if (!value_matches_type(v, f.type)) {
      return set_err(error, KitErrorCode::InvalidArgument,
                     "Argument '" + f.name + "' must be of type " + FieldTypeName(f.type));
    }
    if (!f.enum_values.empty() && std::find(f.enum_values.begin(), f.enum_values.end(), v) == f.enum_values.end()) {
      return set_err(error, KitErrorCode::InvalidArgument, "Argument '" + f.name + "' is not an allowed value");
    }
    if (v.is_number()) {
      const double d = v.get<double>();
      if ((f.minimum && d < *f.minimum) || (f.maximum && d > *f.maximum)) {
        return set_err(error, KitErrorCode::InvalidArgument, "Argument '" + f.name + "' is out of range");
      }
    }
  }
  return true;
}

int RpcCodeForToolError(const KitError &error) {
  switch (error.code) {
    case KitErrorCode::Timeout: return rpc_error::kToolTimeout;
    case KitErrorCode::LaunchError: return rpc_error::kToolLaunchFailed;
    case KitErrorCode::InvalidArgument: return rpc_error::kInvalidParams;
    default: return rpc_error::kInternalError;
  }
}

bool RunScriptTool(ScriptExecutor *executor,
                   const Script &script,
                   const json &arguments,
                   int timeout_ms,
                   ToolCallResult *result,
                   KitError *error) {
  if (!executor || !result) return set_err(error, KitErrorCode::InvalidArgument, "RunScriptTool received null.");
  if (!ValidateToolArguments(script, arguments, error)) return false;
  const Schema schema = script.schema ? *script.schema : Schema();

  LaunchRequest request;
  request.script_path = script.path;
  PromptSessionState st;
  if (!kitrun_prompt::PromptSessionLaunch(&st, executor, request, nullptr, "", error)) return false;
  log_event("TOOL_CALL_STARTED", st.session_id, script.name);

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  size_t next_field = 0;
  bool ran_out_of_inputs = false;
  bool timed_out = false;
  while (st.state != PromptState::Terminated) {
    const int64_t left = ms_until(deadline);
    if (left <= 0) {
      timed_out = true;
      break;
    }
    if (!kitrun_prompt::PromptSessionWait(&st, executor, (int)std::min<int64_t>(left, 100))) continue;
    if (st.state != PromptState::AwaitingPrompt) continue;

    KitError step_err;
    if (!kitrun_prompt::PromptSessionBeginInput(&st, &step_err)) continue;
    bool exhausted = false;
    const json answer = next_answer(schema, arguments, &next_field, &exhausted);
    if (answer.is_null() && exhausted) {
      ran_out_of_inputs = true;
      if (!kitrun_prompt::PromptSessionCancel(&st, executor, &step_err)) {
        log_event("TOOL_CALL_CANCEL_FAILED", st.session_id, step_err.message);
      }
    } else if (answer.is_null()) {
      if (!kitrun_prompt::PromptSessionDismiss(&st, executor, &step_err)) {
        log_event("TOOL_CALL_SUBMIT_FAILED", st.session_id, step_err.message);
      }
    } else if (!kitrun_prompt::PromptSessionSubmit(&st, executor, answer, &step_err)) {
      log_event("TOOL_CALL_SUBMIT_FAILED", st.session_id, step_err.message);
    }
  }

  if (timed_out) {
    KitError cancel_err;
    if (!kitrun_prompt::PromptSessionCancel(&st, executor, &cancel_err)) {
      log_event("TOOL_CALL_CANCEL_FAILED", st.session_id, cancel_err.message);
    }
    log_event("TOOL_CALL_TIMEOUT", st.session_id, "timeout_ms=" + std::to_string(timeout_ms));
    kitrun_prompt::PromptSessionClose(&st, executor);
    return set_err(error, KitErrorCode::Timeout,
                   "Tool call timed out after " + std::to_string(timeout_ms) + " ms");
  }
  kitrun_prompt::PromptSessionClose(&st, executor);

  *result = ToolCallResult();
  const SessionEndInfo end = st.end ? *st.end : SessionEndInfo();
  result->exit_code = end.exit_code;
  result->reason = st.terminate_reason;
  result->text = build_text(st, schema, &result->structured);
  result->is_error = end.exit_code != 0 || end.term_signal != 0 || ran_out_of_inputs;
  if (result->is_error) {
    std::string text = "Script failed: " + result->reason;
    if (ran_out_of_inputs) text = "Script asked for more input than the tool arguments provide: " + result->reason;
    if (!end.stderr_tail.empty()) text += "\n" + end.stderr_tail;
    result->text = text;
  }
  log_event("TOOL_CALL_DONE", st.session_id, result->is_error ? "error: " + result->reason : "ok");
  return true;
}

}  // namespace kitrun
