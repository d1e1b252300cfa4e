#ifndef KITRUN_PROMPT_SESSION_H_
#define KITRUN_PROMPT_SESSION_H_

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "protocol_codec.h"
#include "script_executor.h"
#include "slot_table.h"

namespace kitrun_prompt {

enum class PromptState : uint8_t {
    Idle = 0,
    AwaitingPrompt = 1,
    AwaitingUserInput = 2,
    Submitting = 3,
    Terminated = 4,
};

// What a renderer shows. The sequence number changes whenever a new prompt
// becomes visible.
struct PromptSnapshot {
    uint64_t sequence = 0;
    kitrun::MessageKind kind = kitrun::MessageKind::Unknown;
    kitrun::PromptPayload payload;
};

struct PromptSessionState {
    kitrun::SessionId session_id = 0;
    std::string script_path;
    PromptState state = PromptState::Idle;
    std::optional<PromptSnapshot> visible;
    uint64_t next_sequence = 1;

    nlohmann::json merged_output = nlohmann::json::object();
    std::string input_text;
    std::optional<int> exit_code_reported;
    std::string exit_message;
    std::string last_prompt_text;
    std::optional<kitrun::HelloInfo> hello;

    int protocol_violations = 0;
    int prompts_answered = 0;
    bool cancel_requested = false;

    std::optional<kitrun::SessionEndInfo> end;
    std::string terminate_reason;
    kitrun::SlotLease slot;
};

const char *PromptStateName(PromptState state);

// Human-readable text of a prompt, used when a run produces no other output.
std::string PromptDisplayText(kitrun::MessageKind kind, const kitrun::PromptPayload &payload);

// Launches the script. With a slot table and a non-empty role, the role is
// held for the lifetime of the session and launch fails if it is taken.
bool PromptSessionLaunch(PromptSessionState *state,
                         kitrun::ScriptExecutor *executor,
                         const kitrun::LaunchRequest &request,
                         kitrun::SlotTable *slots,
                         const std::string &role,
                         kitrun::KitError *error);

void PromptSessionApplyEvent(PromptSessionState *state,
                             kitrun::ScriptExecutor *executor,
                             const kitrun::ExecutorEvent &event);

// Non-blocking drain for the UI thread. Returns the number of events applied.
int PromptSessionPump(PromptSessionState *state, kitrun::ScriptExecutor *executor, int max_events);

// Blocking variant for worker threads. Applies at most one event.
bool PromptSessionWait(PromptSessionState *state, kitrun::ScriptExecutor *executor, int timeout_ms);

// The renderer has shown the visible prompt.
bool PromptSessionBeginInput(PromptSessionState *state, kitrun::KitError *error);

bool PromptSessionSubmit(PromptSessionState *state,
                         kitrun::ScriptExecutor *executor,
                         const nlohmann::json &value,
                         kitrun::KitError *error);

bool PromptSessionCancel(PromptSessionState *state, kitrun::ScriptExecutor *executor, kitrun::KitError *error);

// Skips the visible prompt with a null answer; the script keeps running.
bool PromptSessionDismiss(PromptSessionState *state, kitrun::ScriptExecutor *executor, kitrun::KitError *error);

const PromptSnapshot *PromptSessionVisiblePrompt(const PromptSessionState &state);

// Kills the process if still running, joins its threads and frees the slot.
void PromptSessionClose(PromptSessionState *state, kitrun::ScriptExecutor *executor);

}  // namespace kitrun_prompt

#endif  // KITRUN_PROMPT_SESSION_H_
