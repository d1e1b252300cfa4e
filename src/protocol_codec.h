#ifndef KITRUN_PROTOCOL_CODEC_H_
#define KITRUN_PROTOCOL_CODEC_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "kit_protocol.h"

namespace kitrun {

// Discriminant of a script -> host line. Values past Mic never expect a reply.
enum class MessageKind : uint16_t {
  Unknown = 0,
  Arg = 1,
  Mini = 2,
  Micro = 3,
  Select = 4,
  Div = 5,
  Editor = 6,
  Fields = 7,
  Form = 8,
  Term = 9,
  Path = 10,
  Drop = 11,
  Hotkey = 12,
  Template = 13,
  Env = 14,
  Confirm = 15,
  Chat = 16,
  Widget = 17,
  Webcam = 18,
  Mic = 19,
  Hello = 32,
  ScriptOutput = 33,
  SetInput = 34,
  Exit = 35,
};

struct Choice {
  std::string name;
  nlohmann::json value;
  std::string description;
  bool plain = false;  // sent as a bare string

  bool operator==(const Choice &o) const {
    return name == o.name && value == o.value && description == o.description && plain == o.plain;
  }
};

struct FieldSpec {
  std::string name;
  std::string label;
  std::string type;
  std::string placeholder;
  std::string value;

  bool operator==(const FieldSpec &o) const {
    return name == o.name && label == o.label && type == o.type && placeholder == o.placeholder &&
           value == o.value;
  }
};

// Payload shared by every prompt kind. Kind-specific keys the host does not
// interpret are carried untouched in `extra`.
struct PromptPayload {
  std::string id;
  std::string placeholder;
  std::vector<Choice> choices;
  bool multiple = false;
  std::string html;
  std::string hint;
  std::string footer;
  std::string content;
  std::string language;
  std::string template_text;
  std::vector<FieldSpec> fields;
  std::string command;
  std::string message;
  nlohmann::json extra = nlohmann::json::object();

  bool operator==(const PromptPayload &o) const {
    return id == o.id && placeholder == o.placeholder && choices == o.choices && multiple == o.multiple &&
           html == o.html && hint == o.hint && footer == o.footer && content == o.content &&
           language == o.language && template_text == o.template_text && fields == o.fields &&
           command == o.command && message == o.message && extra == o.extra;
  }
};

struct HelloInfo {
  uint32_t protocol = 0;
  std::string sdk_version;
  std::vector<std::string> capabilities;

  bool operator==(const HelloInfo &o) const {
    return protocol == o.protocol && sdk_version == o.sdk_version && capabilities == o.capabilities;
  }
};

struct ProtocolMessage {
  MessageKind kind = MessageKind::Unknown;
  PromptPayload prompt;
  HelloInfo hello;
  nlohmann::json output = nlohmann::json::object();
  std::string input_text;
  std::optional<int> exit_code;
  std::optional<std::string> exit_message;

  bool operator==(const ProtocolMessage &o) const {
    return kind == o.kind && prompt == o.prompt && hello == o.hello && output == o.output &&
           input_text == o.input_text && exit_code == o.exit_code && exit_message == o.exit_message;
  }
  bool operator!=(const ProtocolMessage &o) const { return !(*this == o); }
};

enum class DecodeStatus : uint8_t {
  Ok = 0,
  Malformed = 1,    // counts against the session's malformed budget
  UnknownType = 2,  // well-formed object, unrecognized "type"; ignored
};

enum class ResponseKind : uint8_t {
  Answer = 0,
  Cancel = 1,
  HelloAck = 2,
};

// Host -> script line. Answer and Cancel share the submit envelope; Cancel
// carries "value":null, which no Answer may use.
struct HostResponse {
  ResponseKind kind = ResponseKind::Answer;
  std::string prompt_id;
  nlohmann::json value;
  std::vector<std::string> capabilities;
};

const char *MessageKindName(MessageKind kind);
MessageKind MessageKindFromName(const std::string &name);
bool MessageKindNeedsResponse(MessageKind kind);

DecodeStatus DecodeMessage(const std::string &line, size_t max_line_bytes, ProtocolMessage *out,
                           KitError *error);
inline DecodeStatus DecodeMessage(const std::string &line, ProtocolMessage *out, KitError *error) {
  return DecodeMessage(line, kDefaultMaxLineBytes, out, error);
}

// Serializes a script -> host message. The result has no trailing newline.
std::string EncodeMessage(const ProtocolMessage &msg);

// Serializes a host -> script line including the trailing newline.
bool EncodeResponse(const HostResponse &response, std::string *line, KitError *error);

HostResponse MakeAnswer(const std::string &prompt_id, nlohmann::json value);
HostResponse MakeCancel(const std::string &prompt_id);
HostResponse MakeHelloAck(std::vector<std::string> capabilities);

}  // namespace kitrun

#endif  // KITRUN_PROTOCOL_CODEC_H_
