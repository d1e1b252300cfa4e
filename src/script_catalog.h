#ifndef KITRUN_SCRIPT_CATALOG_H_
#define KITRUN_SCRIPT_CATALOG_H_

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "kit_protocol.h"

namespace kitrun {

enum class FieldType : uint8_t {
  String = 0,
  Number = 1,
  Boolean = 2,
  Array = 3,
  Object = 4,
  Any = 5,
};

struct FieldDef {
  std::string name;
  FieldType type = FieldType::String;
  bool required = false;
  std::string description;
  nlohmann::json default_value;
  std::vector<nlohmann::json> enum_values;
  std::optional<double> minimum;
  std::optional<double> maximum;
  std::optional<FieldType> items;
};

// Declared inputs and outputs, in declaration order.
struct Schema {
  std::vector<FieldDef> input;
  std::vector<FieldDef> output;
};

struct Script {
  std::string name;
  std::string path;
  std::string description;
  std::string kit_name;
  std::optional<Schema> schema;
};

struct Scriptlet {
  std::string name;
  std::string group;
  std::string tool;
  std::string command;
  std::string description;
};

const char *FieldTypeName(FieldType type);
bool ParseFieldType(const std::string &name, FieldType *out);

// "Create Note" -> "create-note", "special@chars!" -> "special-chars".
std::string SlugifyName(const std::string &name);

// In-memory script metadata. Loaded once, then read from any thread.
class ScriptCatalog {
 public:
  ScriptCatalog() = default;
  ScriptCatalog(const ScriptCatalog &) = delete;
  ScriptCatalog &operator=(const ScriptCatalog &) = delete;

  void AddScript(Script script);
  void AddScriptlet(Scriptlet scriptlet);
  std::vector<Script> Scripts() const;
  std::vector<Scriptlet> Scriptlets() const;
  bool FindBySlug(const std::string &slug, Script *out) const;
  // Swaps in the contents of a freshly loaded catalog.
  void ReplaceFrom(const ScriptCatalog &other);

 private:
  mutable std::mutex mu_;
  std::vector<Script> scripts_;
  std::vector<Scriptlet> scriptlets_;
};

// Manifest layout:
//   {"scripts":[{"name":"Greet","path":"/abs/greet.ts","description":"...",
//                "schema":{"input":{"name":{"type":"string","required":true}},
//                          "output":{"greeting":{"type":"string"}}}}],
//    "scriptlets":[{"name":"Open Repo","group":"Dev","tool":"bash","command":"..."}]}
// Relative script paths resolve against the manifest's directory.
bool LoadCatalogManifest(const std::string &text, const std::string &base_dir, ScriptCatalog *catalog,
                         KitError *error);
bool LoadCatalogFile(const std::string &path, ScriptCatalog *catalog, KitError *error);

}  // namespace kitrun

#endif  // KITRUN_SCRIPT_CATALOG_H_
