// run_script.cpp
//
// Runs one script through the prompt session path without a UI and reports
// the result as a JSON line on stdout. Each prompt is answered with the next
// command-line answer; once they run out the prompt is cancelled. Executor
// lifecycle events go to stderr (structured JSON via kitrun::log_event).
//
// Usage:  build/run_script <path/to/script> [answer...]
//
// Answers that parse as JSON are sent as JSON, anything else as a string.
//
// Exit codes:
//   0  script exited with status 0; stdout contains a "pass" JSON line
//   1  script failed or usage error; stdout contains a "fail" JSON line

#include <cstdio>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "kit_config.h"
#include "log.h"
#include "prompt_session.h"
#include "script_executor.h"
#include "slot_table.h"

namespace {

using json = nlohmann::json;

json parse_answer(const char *text) {
  json v = json::parse(text, nullptr, false);
  if (v.is_discarded() || v.is_null()) return json(text);
  return v;
}

int fail(const std::string &script, const std::string &error) {
  json out = {{"result", "fail"}, {"script", script}, {"error", error}};
  std::fprintf(stdout, "%s\n", out.dump().c_str());
  return 1;
}

}  // namespace

int main(int argc, char **argv) {
  if (argc < 2) {
    std::fprintf(stderr, "usage: run_script <script> [answer...]\n");
    std::fprintf(stdout, "{\"result\":\"fail\",\"error\":\"missing script argument\"}\n");
    return 1;
  }
  const std::string script = argv[1];
  std::vector<json> answers;
  for (int i = 2; i < argc; ++i) answers.push_back(parse_answer(argv[i]));

  kitrun::KitConfig config;
  kitrun::KitError err;
  if (!kitrun::LoadKitConfig(&config, &err)) return fail(script, err.message);

  kitrun::ScriptExecutor executor(config);
  kitrun::SlotTable slots;
  kitrun::LaunchRequest request;
  request.script_path = script;

  kitrun_prompt::PromptSessionState st;
  if (!kitrun_prompt::PromptSessionLaunch(&st, &executor, request, &slots, kitrun::kMainSlot, &err)) {
    return fail(script, std::string(kitrun::error_code_name(err.code)) + ": " + err.message);
  }

  size_t next_answer = 0;
  while (st.state != kitrun_prompt::PromptState::Terminated) {
    if (!kitrun_prompt::PromptSessionWait(&st, &executor, 200)) continue;
    if (st.state != kitrun_prompt::PromptState::AwaitingPrompt) continue;
    const kitrun_prompt::PromptSnapshot *prompt = kitrun_prompt::PromptSessionVisiblePrompt(st);
    if (prompt) {
      std::fprintf(stderr, "[%s] %s\n", kitrun::MessageKindName(prompt->kind),
                   kitrun_prompt::PromptDisplayText(prompt->kind, prompt->payload).c_str());
    }
    if (!kitrun_prompt::PromptSessionBeginInput(&st, &err)) continue;
    bool sent = false;
    if (next_answer < answers.size()) {
      sent = kitrun_prompt::PromptSessionSubmit(&st, &executor, answers[next_answer++], &err);
    } else {
      sent = kitrun_prompt::PromptSessionCancel(&st, &executor, &err);
    }
    if (!sent) kitrun::log_event("RUN_SCRIPT_RESPONSE_FAILED", st.session_id, err.message);
  }
  kitrun_prompt::PromptSessionClose(&st, &executor);

  const kitrun::SessionEndInfo end = st.end ? *st.end : kitrun::SessionEndInfo();
  json out = {
      {"result", end.exit_code == 0 ? "pass" : "fail"},
      {"script", script},
      {"exitCode", end.exit_code},
      {"reason", st.terminate_reason},
      {"promptsAnswered", st.prompts_answered},
      {"malformed", executor.GlobalMalformedCount()},
  };
  if (!st.merged_output.empty()) out["output"] = st.merged_output;
  if (!st.exit_message.empty()) out["message"] = st.exit_message;
  if (end.term_signal != 0) out["signal"] = end.term_signal;
  if (end.exit_code != 0 && !end.stderr_tail.empty()) out["stderr"] = end.stderr_tail;
  std::fprintf(stdout, "%s\n", out.dump().c_str());
  return end.exit_code == 0 ? 0 : 1;
}
