#include "protocol_codec.h"

#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

namespace {

using json = nlohmann::json;

bool require(bool cond, const char* msg) {
  if (cond) return true;
  std::cerr << "[protocol_codec_test] FAIL: " << msg << "\n";
  return false;
}

kitrun::DecodeStatus decode(const std::string& line, kitrun::ProtocolMessage* out) {
  kitrun::KitError err;
  return kitrun::DecodeMessage(line, out, &err);
}

}  // namespace

int main() {
  bool ok = true;

  {
    // Arg prompt with mixed plain and rich choices.
    kitrun::ProtocolMessage m;
    ok = ok && require(decode(R"({"type":"arg","id":"1","placeholder":"Name?","choices":["Ada",{"name":"Bob","value":2}]})",
                              &m) == kitrun::DecodeStatus::Ok,
                       "arg decodes");
    ok = ok && require(m.kind == kitrun::MessageKind::Arg, "arg kind");
    ok = ok && require(m.prompt.id == "1" && m.prompt.placeholder == "Name?", "arg id and placeholder");
    ok = ok && require(m.prompt.choices.size() == 2, "arg has two choices");
    ok = ok && require(m.prompt.choices[0].plain && m.prompt.choices[0].value == "Ada", "plain choice value is its name");
    ok = ok && require(!m.prompt.choices[1].plain && m.prompt.choices[1].value == 2, "rich choice keeps value");
    ok = ok && require(kitrun::MessageKindNeedsResponse(m.kind), "arg needs a response");
  }

  {
    // Re-encoding a decoded prompt reproduces the same message, extra keys included.
    const std::string line =
        R"({"type":"select","id":"s1","placeholder":"Pick","choices":["a","b"],"multiple":true,"width":320})";
    kitrun::ProtocolMessage a;
    kitrun::ProtocolMessage b;
    ok = ok && require(decode(line, &a) == kitrun::DecodeStatus::Ok, "select decodes");
    ok = ok && require(a.prompt.multiple, "select multiple flag");
    ok = ok && require(a.prompt.extra.value("width", 0) == 320, "unknown key kept in extra");
    ok = ok && require(decode(kitrun::EncodeMessage(a), &b) == kitrun::DecodeStatus::Ok, "encoded select decodes");
    ok = ok && require(a == b, "select survives encode and decode");
  }

  {
    // Every message family comes back unchanged after encode then decode.
    const char* lines[] = {
        R"({"type":"div","id":"d","html":"<b>hi</b>","hint":"h","footer":"f"})",
        R"({"type":"editor","id":"e","content":"x = 1","language":"py","template":"t"})",
        R"({"type":"fields","id":"f","fields":[{"name":"a","label":"A","type":"number","value":"3"},{"name":"b"}]})",
        R"({"type":"form","id":"fo","html":"<input name=q>"})",
        R"({"type":"term","id":"t","command":"ls -la"})",
        R"({"type":"confirm","id":"c","message":"Sure?"})",
        R"({"type":"template","id":"tp","template":"Hi ${1:name}"})",
        R"({"type":"widget","id":"w","html":"<div/>","options":{"width":200}})",
        R"({"type":"webcam","id":"cam"})",
        R"({"type":"mic","id":"m"})",
        R"({"type":"hello","protocol":1,"sdkVersion":"2.0.0","capabilities":["submitJson"]})",
        R"({"type":"exit","code":0,"message":"done"})",
        R"({"type":"scriptOutput","data":{"n":1,"list":[1,2]}})",
        R"({"type":"setInput","text":"abc"})",
    };
    for (const char* line : lines) {
      kitrun::ProtocolMessage a;
      kitrun::ProtocolMessage b;
      const bool decoded = decode(line, &a) == kitrun::DecodeStatus::Ok;
      const bool again = decoded && decode(kitrun::EncodeMessage(a), &b) == kitrun::DecodeStatus::Ok;
      if (!require(decoded && again && a == b, line)) ok = false;
    }
  }

  {
    // Capture and widget prompts wait for an answer like any other prompt.
    kitrun::ProtocolMessage m;
    ok = ok && require(decode(R"({"type":"mic","id":"1"})", &m) == kitrun::DecodeStatus::Ok &&
                           m.kind == kitrun::MessageKind::Mic && kitrun::MessageKindNeedsResponse(m.kind),
                       "mic is a prompt");
    ok = ok && require(decode(R"({"type":"webcam","id":"2"})", &m) == kitrun::DecodeStatus::Ok &&
                           kitrun::MessageKindNeedsResponse(m.kind),
                       "webcam is a prompt");
    ok = ok && require(decode(R"({"type":"widget","id":"3","html":"<p/>"})", &m) == kitrun::DecodeStatus::Ok &&
                           m.kind == kitrun::MessageKind::Widget && m.prompt.html == "<p/>",
                       "widget carries html");
    ok = ok && require(decode(R"({"type":"widget","id":"4"})", &m) == kitrun::DecodeStatus::Malformed,
                       "widget without html is malformed");
    ok = ok && require(decode(R"({"type":"mic"})", &m) == kitrun::DecodeStatus::Malformed, "mic without id is malformed");
  }

  {
    // Each prompt kind enforces its own required keys.
    kitrun::ProtocolMessage m;
    ok = ok && require(decode(R"({"type":"arg","id":"1","choices":[]})", &m) == kitrun::DecodeStatus::Malformed,
                       "arg without placeholder is malformed");
    ok = ok && require(decode(R"({"type":"div","id":"2"})", &m) == kitrun::DecodeStatus::Malformed,
                       "div without html is malformed");
    ok = ok && require(decode(R"({"type":"confirm","id":"3"})", &m) == kitrun::DecodeStatus::Malformed,
                       "confirm without message is malformed");
    ok = ok && require(decode(R"({"type":"fields","id":"4","fields":[{"label":"x"}]})", &m) ==
                           kitrun::DecodeStatus::Malformed,
                       "field without name is malformed");
    ok = ok && require(decode(R"({"type":"editor","placeholder":"x"})", &m) == kitrun::DecodeStatus::Malformed,
                       "prompt without id is malformed");
    ok = ok && require(decode(R"({"type":"editor","id":"5","language":"ts"})", &m) == kitrun::DecodeStatus::Ok &&
                           m.prompt.language == "ts",
                       "editor needs only an id");
    ok = ok && require(decode(R"({"type":"fields","id":"6","fields":[{"name":"a","label":"A"},{"name":"b"}]})", &m) ==
                               kitrun::DecodeStatus::Ok &&
                           m.prompt.fields.size() == 2 && m.prompt.fields[0].label == "A",
                       "fields decode in order");
  }

  {
    // Garbage and unknown tags are told apart.
    kitrun::ProtocolMessage m;
    ok = ok && require(decode("not json", &m) == kitrun::DecodeStatus::Malformed, "non-json is malformed");
    ok = ok && require(decode("[1,2]", &m) == kitrun::DecodeStatus::Malformed, "array is malformed");
    ok = ok && require(decode(R"({"id":"1"})", &m) == kitrun::DecodeStatus::Malformed, "missing type is malformed");
    ok = ok && require(decode(R"({"type":"sparkle","id":"1"})", &m) == kitrun::DecodeStatus::UnknownType,
                       "unknown type is reported separately");
    kitrun::KitError err;
    const std::string big = R"({"type":"setInput","text":")" + std::string(200, 'x') + "\"}";
    ok = ok && require(kitrun::DecodeMessage(big, 64, &m, &err) == kitrun::DecodeStatus::Malformed,
                       "overlong line is malformed");
  }

  {
    // Non-prompt messages.
    kitrun::ProtocolMessage m;
    ok = ok && require(decode(R"({"type":"hello","protocol":1,"sdkVersion":"1.2.0","capabilities":["submitJson"]})",
                              &m) == kitrun::DecodeStatus::Ok,
                       "hello decodes");
    ok = ok && require(m.hello.protocol == 1 && m.hello.sdk_version == "1.2.0" && m.hello.capabilities.size() == 1,
                       "hello fields");
    ok = ok && require(decode(R"({"type":"hello","protocol":-1,"sdkVersion":"x"})", &m) ==
                           kitrun::DecodeStatus::Malformed,
                       "negative protocol is malformed");
    ok = ok && require(decode(R"({"type":"scriptOutput","data":{"greeting":"Hello Ada"}})", &m) ==
                               kitrun::DecodeStatus::Ok &&
                           m.output["greeting"] == "Hello Ada",
                       "scriptOutput data");
    ok = ok && require(decode(R"({"type":"scriptOutput","data":3})", &m) == kitrun::DecodeStatus::Malformed,
                       "scriptOutput data must be an object");
    ok = ok && require(decode(R"({"type":"exit","code":3,"message":"bye"})", &m) == kitrun::DecodeStatus::Ok &&
                           m.exit_code && *m.exit_code == 3 && m.exit_message && *m.exit_message == "bye",
                       "exit code and message");
    ok = ok && require(decode(R"({"type":"exit"})", &m) == kitrun::DecodeStatus::Ok && !m.exit_code,
                       "bare exit");
    ok = ok && require(!kitrun::MessageKindNeedsResponse(kitrun::MessageKind::Exit), "exit needs no response");
  }

  {
    // Host responses.
    std::string line;
    kitrun::KitError err;
    ok = ok && require(kitrun::EncodeResponse(kitrun::MakeAnswer("1", "Ada"), &line, &err), "answer encodes");
    ok = ok && require(line.back() == '\n', "answer ends with newline");
    const json a = json::parse(line);
    ok = ok && require(a["type"] == "submit" && a["id"] == "1" && a["value"] == "Ada", "answer envelope");

    ok = ok && require(kitrun::EncodeResponse(kitrun::MakeCancel("7"), &line, &err), "cancel encodes");
    const json c = json::parse(line);
    ok = ok && require(c["id"] == "7" && c.contains("value") && c["value"].is_null(), "cancel sends null value");

    ok = ok && require(!kitrun::EncodeResponse(kitrun::MakeAnswer("1", nullptr), &line, &err),
                       "null answer is rejected");
    ok = ok && require(err.code == kitrun::KitErrorCode::InvalidArgument, "null answer error code");

    ok = ok && require(kitrun::EncodeResponse(kitrun::MakeHelloAck({"submitJson"}), &line, &err), "helloAck encodes");
    const json h = json::parse(line);
    ok = ok && require(h["type"] == "helloAck" && h["protocol"] == kitrun::kProtocolVersion &&
                           h["capabilities"].size() == 1,
                       "helloAck envelope");
  }

  if (!ok) return 1;
  std::cout << "[protocol_codec_test] PASS\n";
  return 0;
}
