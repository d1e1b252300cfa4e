#include "script_catalog.h"

#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <utility>

#include "log.h"

namespace kitrun {

namespace {

using ojson = nlohmann::ordered_json;

bool parse_field(const std::string &name, const ojson &field_json, FieldDef *out, KitError *error) {
  out->name = name;
  if (field_json.is_string()) {
    // Shorthand: "name": "string"
    if (!ParseFieldType(field_json.get<std::string>(), &out->type)) {
      return set_err(error, KitErrorCode::InvalidArgument, "field '" + name + "' has unknown type");
    }
    return true;
  }
  if (!field_json.is_object()) {
    return set_err(error, KitErrorCode::InvalidArgument, "field '" + name + "' must be an object");
  }
  auto type = field_json.find("type");
  if (type != field_json.end()) {
    if (!type->is_string() || !ParseFieldType(type->get<std::string>(), &out->type)) {
      return set_err(error, KitErrorCode::InvalidArgument, "field '" + name + "' has unknown type");
    }
  }
  auto required = field_json.find("required");
  if (required != field_json.end() && required->is_boolean()) out->required = required->get<bool>();
  auto desc = field_json.find("description");
  if (desc != field_json.end() && desc->is_string()) out->description = desc->get<std::string>();
  auto def = field_json.find("default");
  if (def != field_json.end()) out->default_value = nlohmann::json::parse(def->dump());
  auto values = field_json.find("enum");
  if (values != field_json.end()) {
    if (!values->is_array()) {
      return set_err(error, KitErrorCode::InvalidArgument, "field '" + name + "': 'enum' must be an array");
    }
    for (const ojson &v : *values) out->enum_values.push_back(nlohmann::json::parse(v.dump()));
  }
  auto minimum = field_json.find("min");
  if (minimum == field_json.end()) minimum = field_json.find("minimum");
  if (minimum != field_json.end() && minimum->is_number()) out->minimum = minimum->get<double>();
  auto maximum = field_json.find("max");
  if (maximum == field_json.end()) maximum = field_json.find("maximum");
  if (maximum != field_json.end() && maximum->is_number()) out->maximum = maximum->get<double>();
  auto items = field_json.find("items");
  if (items != field_json.end()) {
    FieldType item_type = FieldType::Any;
    const std::string item_name =
        items->is_string() ? items->get<std::string>()
                           : (items->is_object() && items->contains("type") && (*items)["type"].is_string()
                                  ? (*items)["type"].get<std::string>()
                                  : std::string());
    if (!ParseFieldType(item_name, &item_type)) {
      return set_err(error, KitErrorCode::InvalidArgument, "field '" + name + "' has unknown item type");
    }
    out->items = item_type;
  }
  return true;
}

bool parse_fields(const ojson &section, std::vector<FieldDef> *out, KitError *error) {
  if (section.is_null()) return true;
  if (!section.is_object()) return set_err(error, KitErrorCode::InvalidArgument, "schema section must be an object");
  for (auto it = section.begin(); it != section.end(); ++it) {
    FieldDef field;
    if (!parse_field(it.key(), it.value(), &field, error)) return false;
    out->push_back(std::move(field));
  }
  return true;
}

std::string string_or_empty(const ojson &obj, const char *key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) return "";
  return it->get<std::string>();
}

}  // namespace

const char *FieldTypeName(FieldType type) {
  switch (type) {
    case FieldType::String: return "string";
    case FieldType::Number: return "number";
    case FieldType::Boolean: return "boolean";
    case FieldType::Array: return "array";
    case FieldType::Object: return "object";
    case FieldType::Any: return "any";
    default: return "any";
  }
}

bool ParseFieldType(const std::string &name, FieldType *out) {
  if (name == "string") *out = FieldType::String;
  else if (name == "number" || name == "integer") *out = FieldType::Number;
  else if (name == "boolean") *out = FieldType::Boolean;
  else if (name == "array") *out = FieldType::Array;
  else if (name == "object") *out = FieldType::Object;
  else if (name == "any") *out = FieldType::Any;
  else return false;
  return true;
}

std::string SlugifyName(const std::string &name) {
  std::string out;
  bool pending_dash = false;
  for (const char ch : name) {
    const unsigned char c = (unsigned char)ch;
    if (std::isalnum(c)) {
      if (pending_dash && !out.empty()) out.push_back('-');
      pending_dash = false;
      out.push_back((char)std::tolower(c));
    } else {
      pending_dash = true;
    }
  }
  return out;
}

void ScriptCatalog::AddScript(Script script) {
  std::lock_guard<std::mutex> lock(mu_);
  scripts_.push_back(std::move(script));
}

void ScriptCatalog::AddScriptlet(Scriptlet scriptlet) {
  std::lock_guard<std::mutex> lock(mu_);
  scriptlets_.push_back(std::move(scriptlet));
}

std::vector<Script> ScriptCatalog::Scripts() const {
  std::lock_guard<std::mutex> lock(mu_);
  return scripts_;
}

std::vector<Scriptlet> ScriptCatalog::Scriptlets() const {
  std::lock_guard<std::mutex> lock(mu_);
  return scriptlets_;
}

void ScriptCatalog::ReplaceFrom(const ScriptCatalog &other) {
  std::vector<Script> scripts = other.Scripts();
  std::vector<Scriptlet> scriptlets = other.Scriptlets();
  std::lock_guard<std::mutex> lock(mu_);
  scripts_ = std::move(scripts);
  scriptlets_ = std::move(scriptlets);
}

bool ScriptCatalog::FindBySlug(const std::string &slug, Script *out) const {
  std::lock_guard<std::mutex> lock(mu_);
  for (const Script &s : scripts_) {
    if (SlugifyName(s.name) == slug) {
      if (out) *out = s;
      return true;
    }
  }
  return false;
}

bool LoadCatalogManifest(const std::string &text, const std::string &base_dir, ScriptCatalog *catalog,
                         KitError *error) {
  if (!catalog) return set_err(error, KitErrorCode::InvalidArgument, "LoadCatalogManifest received null catalog.");
  const ojson doc = ojson::parse(text, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    return set_err(error, KitErrorCode::InvalidArgument, "catalog manifest is not a JSON object");
  }

  auto scripts = doc.find("scripts");
  if (scripts != doc.end()) {
    if (!scripts->is_array()) return set_err(error, KitErrorCode::InvalidArgument, "'scripts' must be an array");
    for (const ojson &entry : *scripts) {
      if (!entry.is_object()) return set_err(error, KitErrorCode::InvalidArgument, "script entry must be an object");
      Script script;
      script.name = string_or_empty(entry, "name");
      script.path = string_or_empty(entry, "path");
      if (script.name.empty() || script.path.empty()) {
        return set_err(error, KitErrorCode::InvalidArgument, "script entry needs 'name' and 'path'");
      }
      if (script.path[0] != '/' && !base_dir.empty()) script.path = base_dir + "/" + script.path;
      script.description = string_or_empty(entry, "description");
      script.kit_name = string_or_empty(entry, "kit");
      auto schema = entry.find("schema");
      if (schema != entry.end() && !schema->is_null()) {
        if (!schema->is_object()) {
          return set_err(error, KitErrorCode::InvalidArgument, "schema of '" + script.name + "' must be an object");
        }
        Schema parsed;
        const ojson none;
        auto in = schema->find("input");
        auto out = schema->find("output");
        if (!parse_fields(in != schema->end() ? *in : none, &parsed.input, error)) return false;
        if (!parse_fields(out != schema->end() ? *out : none, &parsed.output, error)) return false;
        script.schema = std::move(parsed);
      }
      catalog->AddScript(std::move(script));
    }
  }

  auto scriptlets = doc.find("scriptlets");
  if (scriptlets != doc.end()) {
    if (!scriptlets->is_array()) {
      return set_err(error, KitErrorCode::InvalidArgument, "'scriptlets' must be an array");
    }
    for (const ojson &entry : *scriptlets) {
      if (!entry.is_object()) continue;
      Scriptlet s;
      s.name = string_or_empty(entry, "name");
      s.group = string_or_empty(entry, "group");
      s.tool = string_or_empty(entry, "tool");
      s.command = string_or_empty(entry, "command");
      s.description = string_or_empty(entry, "description");
      if (s.name.empty()) return set_err(error, KitErrorCode::InvalidArgument, "scriptlet entry needs 'name'");
      catalog->AddScriptlet(std::move(s));
    }
  }
  return true;
}

bool LoadCatalogFile(const std::string &path, ScriptCatalog *catalog, KitError *error) {
  std::ifstream in(path);
  if (!in) return set_err(error, KitErrorCode::IoError, "Failed to open " + path + ": " + std::strerror(errno));
  std::stringstream ss;
  ss << in.rdbuf();
  const size_t slash = path.find_last_of('/');
  const std::string base_dir = slash == std::string::npos ? "." : path.substr(0, slash);
  if (!LoadCatalogManifest(ss.str(), base_dir, catalog, error)) return false;
  log_event("CATALOG_LOADED", 0,
            path + " scripts=" + std::to_string(catalog->Scripts().size()) +
                " scriptlets=" + std::to_string(catalog->Scriptlets().size()));
  return true;
}

}  // namespace kitrun
