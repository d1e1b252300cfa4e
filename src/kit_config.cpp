#include "kit_config.h"

#include <sys/stat.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "log.h"

namespace kitrun {

namespace {

using json = nlohmann::json;

bool file_exists(const std::string &path) {
  struct stat st;
  return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

bool parse_int_env(const char *name, long lo, long hi, long *out, KitError *error) {
  const char *raw = std::getenv(name);
  if (!raw || raw[0] == '\0') return true;
  char *end = nullptr;
  errno = 0;
  const long v = std::strtol(raw, &end, 10);
  if (errno != 0 || end == raw || *end != '\0' || v < lo || v > hi) {
    return set_err(error, KitErrorCode::InvalidArgument,
                   std::string("Invalid value for ") + name + ": '" + raw + "'");
  }
  *out = v;
  return true;
}

template <typename T>
bool read_int_field(const json &doc, const char *key, long lo, long hi, T *target, KitError *error) {
  if (!doc.contains(key)) return true;
  const json &v = doc[key];
  if (!v.is_number_integer()) {
    return set_err(error, KitErrorCode::InvalidArgument, std::string("kitrun.json: '") + key + "' must be an integer");
  }
  const long long n = v.get<long long>();
  if (n < lo || n > hi) {
    return set_err(error, KitErrorCode::InvalidArgument,
                   std::string("kitrun.json: '") + key + "' is out of range");
  }
  *target = (T)n;
  return true;
}

bool read_string_field(const json &doc, const char *key, std::string *target, KitError *error) {
  if (!doc.contains(key)) return true;
  if (!doc[key].is_string()) {
    return set_err(error, KitErrorCode::InvalidArgument, std::string("kitrun.json: '") + key + "' must be a string");
  }
  *target = doc[key].get<std::string>();
  return true;
}

}  // namespace

const char *MalformedBudgetScopeName(MalformedBudgetScope scope) {
  switch (scope) {
    case MalformedBudgetScope::Session: return "session";
    case MalformedBudgetScope::Global: return "global";
    default: return "unknown";
  }
}

std::string DefaultKitPath() {
  const char *override_path = std::getenv("SCRIPT_KIT_PATH");
  if (override_path && override_path[0] != '\0') return override_path;
  const char *home = std::getenv("HOME");
  if (!home || home[0] == '\0') return "";
  return std::string(home) + "/.scriptkit";
}

void FinalizeKitConfig(KitConfig *config) {
  if (config->kit_path.empty()) config->kit_path = DefaultKitPath();
  if (config->audit_log_path.empty()) config->audit_log_path = config->kit_path + "/logs/mcp-audit.jsonl";
  if (config->catalog_path.empty()) config->catalog_path = config->kit_path + "/catalog.json";
}

bool ApplyKitConfigJson(const std::string &text, KitConfig *config, KitError *error) {
  json doc;
  try {
    doc = json::parse(text);
  } catch (const json::parse_error &e) {
    return set_err(error, KitErrorCode::InvalidArgument, std::string("kitrun.json is not valid JSON: ") + e.what());
  }
  if (!doc.is_object()) {
    return set_err(error, KitErrorCode::InvalidArgument, "kitrun.json must contain an object");
  }

  if (!read_string_field(doc, "bind_host", &config->bind_host, error)) return false;
  if (!read_int_field(doc, "port", 0, 65535, &config->port, error)) return false;
  if (!read_int_field(doc, "cancel_grace_ms", 0, 600000, &config->cancel_grace_ms, error)) return false;
  if (!read_int_field(doc, "tool_call_timeout_ms", 1, 3600000, &config->tool_call_timeout_ms, error)) return false;
  if (!read_int_field(doc, "malformed_budget", 0, 1000000, &config->malformed_budget, error)) return false;
  if (!read_int_field(doc, "max_line_bytes", 64, 64L * 1024 * 1024, &config->max_line_bytes, error)) return false;
  if (!read_int_field(doc, "stderr_tail_lines", 0, 10000, &config->stderr_tail_lines, error)) return false;
  if (!read_string_field(doc, "audit_log_path", &config->audit_log_path, error)) return false;
  if (!read_string_field(doc, "catalog_path", &config->catalog_path, error)) return false;

  if (doc.contains("malformed_budget_scope")) {
    const json &v = doc["malformed_budget_scope"];
    const std::string scope = v.is_string() ? v.get<std::string>() : "";
    if (scope == "session") {
      config->malformed_budget_scope = MalformedBudgetScope::Session;
    } else if (scope == "global") {
      config->malformed_budget_scope = MalformedBudgetScope::Global;
    } else {
      return set_err(error, KitErrorCode::InvalidArgument,
                     "kitrun.json: 'malformed_budget_scope' must be \"session\" or \"global\"");
    }
  }

  if (config->bind_host != "127.0.0.1" && config->bind_host != "localhost") {
    return set_err(error, KitErrorCode::InvalidArgument, "kitrun.json: 'bind_host' must be a loopback address");
  }
  return true;
}

bool LoadKitConfig(KitConfig *config, KitError *error) {
  if (!config) return set_err(error, KitErrorCode::InvalidArgument, "LoadKitConfig received null config.");
  if (config->kit_path.empty()) config->kit_path = DefaultKitPath();
  if (config->kit_path.empty()) {
    return set_err(error, KitErrorCode::InvalidArgument, "Cannot resolve kit path: HOME is not set.");
  }

  const std::string file = config->kit_path + "/kitrun.json";
  if (file_exists(file)) {
    std::ifstream in(file);
    if (!in) return set_err(error, KitErrorCode::IoError, "Failed to open " + file + ": " + std::strerror(errno));
    std::stringstream ss;
    ss << in.rdbuf();
    if (!ApplyKitConfigJson(ss.str(), config, error)) return false;
    log_event("CONFIG_LOADED", 0, file);
  }

  long v = 0;
  v = config->port;
  if (!parse_int_env("MCP_PORT", 0, 65535, &v, error)) return false;
  config->port = (uint16_t)v;
  v = config->tool_call_timeout_ms;
  if (!parse_int_env("KITRUN_TOOL_TIMEOUT_MS", 1, 3600000, &v, error)) return false;
  config->tool_call_timeout_ms = (int)v;
  v = config->malformed_budget;
  if (!parse_int_env("KITRUN_MALFORMED_BUDGET", 0, 1000000, &v, error)) return false;
  config->malformed_budget = (int)v;

  FinalizeKitConfig(config);
  return true;
}

}  // namespace kitrun
