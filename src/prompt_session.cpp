#include "prompt_session.h"

#include <utility>

#include "log.h"

namespace kitrun_prompt {

namespace {

using kitrun::ExecutorEvent;
using kitrun::ExecutorEventKind;
using kitrun::KitError;
using kitrun::KitErrorCode;
using kitrun::MessageKind;
using kitrun::ProtocolMessage;

void terminate(PromptSessionState *state, const std::string &reason) {
    state->state = PromptState::Terminated;
    state->visible.reset();
    if (state->terminate_reason.empty()) state->terminate_reason = reason;
    kitrun::log_event("PROMPT_TERMINATED", state->session_id, state->terminate_reason);
}

void apply_message(PromptSessionState *state, kitrun::ScriptExecutor *executor, const ProtocolMessage &msg) {
    if (kitrun::MessageKindNeedsResponse(msg.kind)) {
        if (state->state != PromptState::Idle) {
            // Single flight: the outstanding prompt stays visible.
            ++state->protocol_violations;
            kitrun::log_event("PROMPT_VIOLATION", state->session_id,
                              std::string("dropped ") + kitrun::MessageKindName(msg.kind) + " id=" + msg.prompt.id +
                                  " in state " + PromptStateName(state->state));
            return;
        }
        PromptSnapshot snap;
        snap.sequence = state->next_sequence++;
        snap.kind = msg.kind;
        snap.payload = msg.prompt;
        state->last_prompt_text = PromptDisplayText(msg.kind, msg.prompt);
        state->visible = std::move(snap);
        state->state = PromptState::AwaitingPrompt;
        return;
    }

    switch (msg.kind) {
        case MessageKind::Hello: {
            state->hello = msg.hello;
            KitError err;
            if (!executor || !executor->SendHelloAck(state->session_id, &err)) {
                kitrun::log_event("HELLO_ACK_FAILED", state->session_id, err.message);
            }
            break;
        }
        case MessageKind::ScriptOutput:
            for (auto it = msg.output.begin(); it != msg.output.end(); ++it) {
                state->merged_output[it.key()] = it.value();
            }
            break;
        case MessageKind::SetInput:
            state->input_text = msg.input_text;
            break;
        case MessageKind::Exit:
            if (msg.exit_code) state->exit_code_reported = msg.exit_code;
            if (msg.exit_message) state->exit_message = *msg.exit_message;
            break;
        default:
            break;
    }
}

}  // namespace

const char *PromptStateName(PromptState state) {
    switch (state) {
        case PromptState::Idle: return "idle";
        case PromptState::AwaitingPrompt: return "awaiting_prompt";
        case PromptState::AwaitingUserInput: return "awaiting_user_input";
        case PromptState::Submitting: return "submitting";
        case PromptState::Terminated: return "terminated";
        default: return "unknown";
    }
}

std::string PromptDisplayText(kitrun::MessageKind kind, const kitrun::PromptPayload &payload) {
    switch (kind) {
        case MessageKind::Div:
        case MessageKind::Form:
        case MessageKind::Widget:
            return payload.html;
        case MessageKind::Editor:
            return payload.content;
        case MessageKind::Template:
            return payload.template_text;
        case MessageKind::Confirm:
            return payload.message;
        case MessageKind::Term:
            return payload.command;
        default:
            return payload.placeholder;
    }
}

bool PromptSessionLaunch(PromptSessionState *state,
                         kitrun::ScriptExecutor *executor,
                         const kitrun::LaunchRequest &request,
                         kitrun::SlotTable *slots,
                         const std::string &role,
                         KitError *error) {
    if (!state || !executor) {
        return kitrun::set_err(error, KitErrorCode::InvalidArgument, "PromptSessionLaunch received invalid inputs.");
    }
    const bool use_slot = slots && !role.empty();
    uint64_t owner = 0;
    if (use_slot && slots->Owner(role, &owner)) {
        return kitrun::set_err(error, KitErrorCode::InvalidArgument,
                               "Slot '" + role + "' is owned by session " + std::to_string(owner) + ".");
    }

    kitrun::SessionId id = 0;
    if (!executor->Launch(request, &id, error)) return false;
    if (use_slot && !kitrun::SlotLease::Acquire(slots, role, id, &state->slot, error)) {
        executor->Release(id);
        return false;
    }

    state->session_id = id;
    state->script_path = request.script_path;
    state->state = PromptState::Idle;
    state->visible.reset();
    state->end.reset();
    state->terminate_reason.clear();
    return true;
}

void PromptSessionApplyEvent(PromptSessionState *state,
                             kitrun::ScriptExecutor *executor,
                             const ExecutorEvent &event) {
    if (!state) return;
    if (event.kind == ExecutorEventKind::SessionEnded) {
        state->end = event.ended;
        terminate(state, event.ended.reason);
        return;
    }
    if (state->state == PromptState::Terminated) return;
    apply_message(state, executor, event.message);
}

int PromptSessionPump(PromptSessionState *state, kitrun::ScriptExecutor *executor, int max_events) {
    if (!state || !executor) return 0;
    int applied = 0;
    ExecutorEvent event;
    while (applied < max_events && executor->PollEvent(state->session_id, &event)) {
        PromptSessionApplyEvent(state, executor, event);
        ++applied;
    }
    return applied;
}

bool PromptSessionWait(PromptSessionState *state, kitrun::ScriptExecutor *executor, int timeout_ms) {
    if (!state || !executor) return false;
    ExecutorEvent event;
    if (!executor->WaitEvent(state->session_id, timeout_ms, &event)) return false;
    PromptSessionApplyEvent(state, executor, event);
    return true;
}

bool PromptSessionBeginInput(PromptSessionState *state, KitError *error) {
    if (!state) return kitrun::set_err(error, KitErrorCode::InvalidArgument, "PromptSessionBeginInput received null.");
    if (state->state != PromptState::AwaitingPrompt) {
        return kitrun::set_err(error, KitErrorCode::InvalidArgument,
                               std::string("No prompt to show in state ") + PromptStateName(state->state) + ".");
    }
    state->state = PromptState::AwaitingUserInput;
    return true;
}

bool PromptSessionSubmit(PromptSessionState *state,
                         kitrun::ScriptExecutor *executor,
                         const nlohmann::json &value,
                         KitError *error) {
    if (!state || !executor) {
        return kitrun::set_err(error, KitErrorCode::InvalidArgument, "PromptSessionSubmit received invalid inputs.");
    }
    if (state->state != PromptState::AwaitingUserInput) {
        return kitrun::set_err(error, KitErrorCode::InvalidArgument,
                               std::string("Cannot submit in state ") + PromptStateName(state->state) + ".");
    }
    if (value.is_null()) {
        return kitrun::set_err(error, KitErrorCode::InvalidArgument, "null is reserved for cancellation");
    }
    state->state = PromptState::Submitting;
    if (!executor->SendResponse(state->session_id, value, error)) {
        terminate(state, error ? error->message : "send failed");
        return false;
    }
    ++state->prompts_answered;
    state->visible.reset();
    state->state = PromptState::Idle;
    return true;
}

bool PromptSessionCancel(PromptSessionState *state, kitrun::ScriptExecutor *executor, KitError *error) {
    if (!state || !executor) {
        return kitrun::set_err(error, KitErrorCode::InvalidArgument, "PromptSessionCancel received invalid inputs.");
    }
    if (state->state == PromptState::Terminated) {
        return kitrun::set_err(error, KitErrorCode::SessionClosed, "Session already terminated.");
    }
    state->cancel_requested = true;
    state->state = PromptState::Submitting;
    if (!executor->Cancel(state->session_id, error)) {
        terminate(state, error ? error->message : "cancel failed");
        return false;
    }
    state->visible.reset();
    state->state = PromptState::Idle;
    return true;
}

bool PromptSessionDismiss(PromptSessionState *state, kitrun::ScriptExecutor *executor, KitError *error) {
    if (!state || !executor) {
        return kitrun::set_err(error, KitErrorCode::InvalidArgument, "PromptSessionDismiss received invalid inputs.");
    }
    if (state->state != PromptState::AwaitingUserInput) {
        return kitrun::set_err(error, KitErrorCode::InvalidArgument,
                               std::string("Cannot dismiss in state ") + PromptStateName(state->state) + ".");
    }
    state->state = PromptState::Submitting;
    if (!executor->Dismiss(state->session_id, error)) {
        terminate(state, error ? error->message : "dismiss failed");
        return false;
    }
    state->visible.reset();
    state->state = PromptState::Idle;
    return true;
}

const PromptSnapshot *PromptSessionVisiblePrompt(const PromptSessionState &state) {
    return state.visible ? &*state.visible : nullptr;
}

void PromptSessionClose(PromptSessionState *state, kitrun::ScriptExecutor *executor) {
    if (!state) return;
    if (executor && state->session_id != 0) executor->Release(state->session_id);
    state->slot.Reset();
    if (state->state != PromptState::Terminated) terminate(state, "closed");
}

}  // namespace kitrun_prompt
