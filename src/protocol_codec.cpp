#include "protocol_codec.h"

#include <cstring>
#include <string>
#include <utility>
#include <vector>

namespace kitrun {

namespace {

using json = nlohmann::json;

struct KindEntry {
  MessageKind kind;
  const char *name;
};

const KindEntry kKindTable[] = {
    {MessageKind::Arg, "arg"},
    {MessageKind::Mini, "mini"},
    {MessageKind::Micro, "micro"},
    {MessageKind::Select, "select"},
    {MessageKind::Div, "div"},
    {MessageKind::Editor, "editor"},
    {MessageKind::Fields, "fields"},
    {MessageKind::Form, "form"},
    {MessageKind::Term, "term"},
    {MessageKind::Path, "path"},
    {MessageKind::Drop, "drop"},
    {MessageKind::Hotkey, "hotkey"},
    {MessageKind::Template, "template"},
    {MessageKind::Env, "env"},
    {MessageKind::Confirm, "confirm"},
    {MessageKind::Chat, "chat"},
    {MessageKind::Widget, "widget"},
    {MessageKind::Webcam, "webcam"},
    {MessageKind::Mic, "mic"},
    {MessageKind::Hello, "hello"},
    {MessageKind::ScriptOutput, "scriptOutput"},
    {MessageKind::SetInput, "setInput"},
    {MessageKind::Exit, "exit"},
};

// Tracks which keys of the incoming object were mapped to typed fields so
// the remainder can be preserved in PromptPayload::extra.
struct ObjectReader {
  const json *obj;
  std::vector<std::string> consumed;
  const char *kind_name;
};

bool malformed(KitError *error, const ObjectReader &r, const std::string &msg) {
  return set_err(error, KitErrorCode::ProtocolError, std::string(r.kind_name) + ": " + msg);
}

bool take_string(ObjectReader *r, const char *key, bool required, std::string *out, KitError *error) {
  r->consumed.push_back(key);
  auto it = r->obj->find(key);
  if (it == r->obj->end() || it->is_null()) {
    if (required) return malformed(error, *r, std::string("missing '") + key + "'");
    return true;
  }
  if (!it->is_string()) return malformed(error, *r, std::string("'") + key + "' must be a string");
  *out = it->get<std::string>();
  return true;
}

bool take_bool(ObjectReader *r, const char *key, bool *out, KitError *error) {
  r->consumed.push_back(key);
  auto it = r->obj->find(key);
  if (it == r->obj->end() || it->is_null()) return true;
  if (!it->is_boolean()) return malformed(error, *r, std::string("'") + key + "' must be a boolean");
  *out = it->get<bool>();
  return true;
}

bool take_choices(ObjectReader *r, bool required, std::vector<Choice> *out, KitError *error) {
  r->consumed.push_back("choices");
  auto it = r->obj->find("choices");
  if (it == r->obj->end() || it->is_null()) {
    if (required) return malformed(error, *r, "missing 'choices'");
    return true;
  }
  if (!it->is_array()) return malformed(error, *r, "'choices' must be an array");
  out->clear();
  for (const json &c : *it) {
    Choice choice;
    if (c.is_string()) {
      choice.name = c.get<std::string>();
      choice.value = choice.name;
      choice.plain = true;
    } else if (c.is_object()) {
      auto name = c.find("name");
      if (name == c.end() || !name->is_string()) return malformed(error, *r, "choice without a string 'name'");
      choice.name = name->get<std::string>();
      auto value = c.find("value");
      if (value != c.end()) choice.value = *value;
      auto desc = c.find("description");
      if (desc != c.end() && desc->is_string()) choice.description = desc->get<std::string>();
    } else {
      return malformed(error, *r, "choice must be a string or an object");
    }
    out->push_back(std::move(choice));
  }
  return true;
}

bool take_fields(ObjectReader *r, std::vector<FieldSpec> *out, KitError *error) {
  r->consumed.push_back("fields");
  auto it = r->obj->find("fields");
  if (it == r->obj->end() || !it->is_array()) return malformed(error, *r, "'fields' must be an array");
  out->clear();
  for (const json &f : *it) {
    if (!f.is_object()) return malformed(error, *r, "field must be an object");
    ObjectReader fr{&f, {}, r->kind_name};
    FieldSpec field;
    if (!take_string(&fr, "name", true, &field.name, error)) return false;
    if (!take_string(&fr, "label", false, &field.label, error)) return false;
    if (!take_string(&fr, "type", false, &field.type, error)) return false;
    if (!take_string(&fr, "placeholder", false, &field.placeholder, error)) return false;
    if (!take_string(&fr, "value", false, &field.value, error)) return false;
    out->push_back(std::move(field));
  }
  return true;
}

void collect_extra(const ObjectReader &r, json *extra) {
  *extra = json::object();
  for (auto it = r.obj->begin(); it != r.obj->end(); ++it) {
    if (it.key() == "type") continue;
    bool seen = false;
    for (const std::string &k : r.consumed) {
      if (k == it.key()) {
        seen = true;
        break;
      }
    }
    if (!seen) (*extra)[it.key()] = it.value();
  }
}

bool decode_prompt(ObjectReader *r, MessageKind kind, PromptPayload *p, KitError *error) {
  if (!take_string(r, "id", true, &p->id, error)) return false;
  switch (kind) {
    case MessageKind::Arg:
    case MessageKind::Mini:
    case MessageKind::Micro:
      if (!take_string(r, "placeholder", true, &p->placeholder, error)) return false;
      if (!take_choices(r, true, &p->choices, error)) return false;
      break;
    case MessageKind::Select:
      if (!take_string(r, "placeholder", true, &p->placeholder, error)) return false;
      if (!take_choices(r, true, &p->choices, error)) return false;
      if (!take_bool(r, "multiple", &p->multiple, error)) return false;
      break;
    case MessageKind::Div:
      if (!take_string(r, "html", true, &p->html, error)) return false;
      if (!take_string(r, "placeholder", false, &p->placeholder, error)) return false;
      if (!take_string(r, "hint", false, &p->hint, error)) return false;
      if (!take_string(r, "footer", false, &p->footer, error)) return false;
      break;
    case MessageKind::Editor:
      if (!take_string(r, "content", false, &p->content, error)) return false;
      if (!take_string(r, "language", false, &p->language, error)) return false;
      if (!take_string(r, "template", false, &p->template_text, error)) return false;
      break;
    case MessageKind::Fields:
      if (!take_fields(r, &p->fields, error)) return false;
      break;
    case MessageKind::Form:
    case MessageKind::Widget:
      if (!take_string(r, "html", true, &p->html, error)) return false;
      break;
    case MessageKind::Webcam:
    case MessageKind::Mic:
      break;
    case MessageKind::Term:
      if (!take_string(r, "command", false, &p->command, error)) return false;
      break;
    case MessageKind::Template:
      if (!take_string(r, "template", true, &p->template_text, error)) return false;
      break;
    case MessageKind::Confirm:
      if (!take_string(r, "message", true, &p->message, error)) return false;
      break;
    case MessageKind::Path:
    case MessageKind::Drop:
    case MessageKind::Hotkey:
    case MessageKind::Env:
    case MessageKind::Chat:
      if (!take_string(r, "placeholder", false, &p->placeholder, error)) return false;
      break;
    default:
      return malformed(error, *r, "not a prompt kind");
  }
  collect_extra(*r, &p->extra);
  return true;
}

json encode_choice(const Choice &c) {
  if (c.plain) return c.name;
  json out = {{"name", c.name}};
  if (!c.value.is_null()) out["value"] = c.value;
  if (!c.description.empty()) out["description"] = c.description;
  return out;
}

void put_if(json *obj, const char *key, const std::string &value) {
  if (!value.empty()) (*obj)[key] = value;
}

}  // namespace

const char *MessageKindName(MessageKind kind) {
  for (const KindEntry &e : kKindTable) {
    if (e.kind == kind) return e.name;
  }
  return "unknown";
}

MessageKind MessageKindFromName(const std::string &name) {
  for (const KindEntry &e : kKindTable) {
    if (name == e.name) return e.kind;
  }
  return MessageKind::Unknown;
}

bool MessageKindNeedsResponse(MessageKind kind) {
  const uint16_t v = (uint16_t)kind;
  return v >= (uint16_t)MessageKind::Arg && v <= (uint16_t)MessageKind::Mic;
}

DecodeStatus DecodeMessage(const std::string &line, size_t max_line_bytes, ProtocolMessage *out,
                           KitError *error) {
  if (!out) {
    set_err(error, KitErrorCode::InvalidArgument, "DecodeMessage received null output.");
    return DecodeStatus::Malformed;
  }
  *out = ProtocolMessage();
  if (line.size() > max_line_bytes) {
    set_err(error, KitErrorCode::ProtocolError,
            "line exceeds " + std::to_string(max_line_bytes) + " bytes");
    return DecodeStatus::Malformed;
  }
  const json doc = json::parse(line, nullptr, false);
  if (doc.is_discarded()) {
    set_err(error, KitErrorCode::ProtocolError, "invalid JSON");
    return DecodeStatus::Malformed;
  }
  if (!doc.is_object()) {
    set_err(error, KitErrorCode::ProtocolError, "message is not a JSON object");
    return DecodeStatus::Malformed;
  }
  auto type_it = doc.find("type");
  if (type_it == doc.end() || !type_it->is_string()) {
    set_err(error, KitErrorCode::ProtocolError, "missing string 'type'");
    return DecodeStatus::Malformed;
  }
  const std::string type = type_it->get<std::string>();
  const MessageKind kind = MessageKindFromName(type);
  if (kind == MessageKind::Unknown) {
    set_err(error, KitErrorCode::ProtocolError, "unknown message type '" + type + "'");
    return DecodeStatus::UnknownType;
  }

  ObjectReader r{&doc, {}, MessageKindName(kind)};
  out->kind = kind;
  bool ok = true;
  if (MessageKindNeedsResponse(kind)) {
    ok = decode_prompt(&r, kind, &out->prompt, error);
  } else if (kind == MessageKind::Hello) {
    auto proto = doc.find("protocol");
    if (proto == doc.end() || !proto->is_number_unsigned()) {
      ok = malformed(error, r, "'protocol' must be a non-negative integer");
    } else {
      out->hello.protocol = proto->get<uint32_t>();
      ok = take_string(&r, "sdkVersion", true, &out->hello.sdk_version, error);
    }
    auto caps = doc.find("capabilities");
    if (ok && caps != doc.end() && !caps->is_null()) {
      if (!caps->is_array()) {
        ok = malformed(error, r, "'capabilities' must be an array");
      } else {
        for (const json &c : *caps) {
          if (!c.is_string()) {
            ok = malformed(error, r, "capability must be a string");
            break;
          }
          out->hello.capabilities.push_back(c.get<std::string>());
        }
      }
    }
  } else if (kind == MessageKind::ScriptOutput) {
    auto data = doc.find("data");
    if (data == doc.end() || !data->is_object()) {
      ok = malformed(error, r, "'data' must be an object");
    } else {
      out->output = *data;
    }
  } else if (kind == MessageKind::SetInput) {
    ok = take_string(&r, "text", true, &out->input_text, error);
  } else if (kind == MessageKind::Exit) {
    auto code = doc.find("code");
    if (code != doc.end() && !code->is_null()) {
      if (!code->is_number_integer()) {
        ok = malformed(error, r, "'code' must be an integer");
      } else {
        out->exit_code = code->get<int>();
      }
    }
    std::string message;
    auto msg = doc.find("message");
    if (ok && msg != doc.end() && !msg->is_null()) {
      ok = take_string(&r, "message", false, &message, error);
      if (ok) out->exit_message = message;
    }
  }
  if (!ok) {
    *out = ProtocolMessage();
    return DecodeStatus::Malformed;
  }
  return DecodeStatus::Ok;
}

std::string EncodeMessage(const ProtocolMessage &msg) {
  json obj = json::object();
  obj["type"] = MessageKindName(msg.kind);
  const MessageKind kind = msg.kind;
  if (MessageKindNeedsResponse(kind)) {
    const PromptPayload &p = msg.prompt;
    for (auto it = p.extra.begin(); it != p.extra.end(); ++it) obj[it.key()] = it.value();
    obj["id"] = p.id;
    switch (kind) {
      case MessageKind::Arg:
      case MessageKind::Mini:
      case MessageKind::Micro:
      case MessageKind::Select: {
        obj["placeholder"] = p.placeholder;
        json choices = json::array();
        for (const Choice &c : p.choices) choices.push_back(encode_choice(c));
        obj["choices"] = choices;
        if (kind == MessageKind::Select && p.multiple) obj["multiple"] = true;
        break;
      }
      case MessageKind::Div:
        obj["html"] = p.html;
        put_if(&obj, "placeholder", p.placeholder);
        put_if(&obj, "hint", p.hint);
        put_if(&obj, "footer", p.footer);
        break;
      case MessageKind::Editor:
        put_if(&obj, "content", p.content);
        put_if(&obj, "language", p.language);
        put_if(&obj, "template", p.template_text);
        break;
      case MessageKind::Fields: {
        json fields = json::array();
        for (const FieldSpec &f : p.fields) {
          json fo = {{"name", f.name}};
          put_if(&fo, "label", f.label);
          put_if(&fo, "type", f.type);
          put_if(&fo, "placeholder", f.placeholder);
          put_if(&fo, "value", f.value);
          fields.push_back(fo);
        }
        obj["fields"] = fields;
        break;
      }
      case MessageKind::Form:
      case MessageKind::Widget:
        obj["html"] = p.html;
        break;
      case MessageKind::Webcam:
      case MessageKind::Mic:
        break;
      case MessageKind::Term:
        put_if(&obj, "command", p.command);
        break;
      case MessageKind::Template:
        obj["template"] = p.template_text;
        break;
      case MessageKind::Confirm:
        obj["message"] = p.message;
        break;
      default:
        put_if(&obj, "placeholder", p.placeholder);
        break;
    }
  } else if (kind == MessageKind::Hello) {
    obj["protocol"] = msg.hello.protocol;
    obj["sdkVersion"] = msg.hello.sdk_version;
    obj["capabilities"] = msg.hello.capabilities;
  } else if (kind == MessageKind::ScriptOutput) {
    obj["data"] = msg.output;
  } else if (kind == MessageKind::SetInput) {
    obj["text"] = msg.input_text;
  } else if (kind == MessageKind::Exit) {
    if (msg.exit_code) obj["code"] = *msg.exit_code;
    if (msg.exit_message) obj["message"] = *msg.exit_message;
  }
  return obj.dump(-1, ' ', false, json::error_handler_t::replace);
}

bool EncodeResponse(const HostResponse &response, std::string *line, KitError *error) {
  if (!line) return set_err(error, KitErrorCode::InvalidArgument, "EncodeResponse received null output.");
  json obj;
  switch (response.kind) {
    case ResponseKind::Answer:
      if (response.value.is_null()) {
        return set_err(error, KitErrorCode::InvalidArgument,
                       "null is reserved for cancellation and cannot be sent as an answer");
      }
      obj = {{"type", "submit"}, {"id", response.prompt_id}, {"value", response.value}};
      break;
    case ResponseKind::Cancel:
      obj = {{"type", "submit"}, {"id", response.prompt_id}, {"value", nullptr}};
      break;
    case ResponseKind::HelloAck:
      obj = {{"type", "helloAck"}, {"protocol", kProtocolVersion}, {"capabilities", response.capabilities}};
      break;
    default:
      return set_err(error, KitErrorCode::InvalidArgument, "unknown response kind");
  }
  *line = obj.dump(-1, ' ', false, json::error_handler_t::replace);
  line->push_back('\n');
  return true;
}

HostResponse MakeAnswer(const std::string &prompt_id, nlohmann::json value) {
  HostResponse r;
  r.kind = ResponseKind::Answer;
  r.prompt_id = prompt_id;
  r.value = std::move(value);
  return r;
}

HostResponse MakeCancel(const std::string &prompt_id) {
  HostResponse r;
  r.kind = ResponseKind::Cancel;
  r.prompt_id = prompt_id;
  return r;
}

HostResponse MakeHelloAck(std::vector<std::string> capabilities) {
  HostResponse r;
  r.kind = ResponseKind::HelloAck;
  r.capabilities = std::move(capabilities);
  return r;
}

}  // namespace kitrun
