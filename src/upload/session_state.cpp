#include "cloudup/upload/session_state.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace cloudup::upload {

const char* to_string(SessionState state) noexcept {
    switch (state) {
        case SessionState::Idle: return "Idle";
        case SessionState::Planning: return "Planning";
        case SessionState::Transferring: return "Transferring";
        case SessionState::Finalizing: return "Finalizing";
        case SessionState::Completed: return "Completed";
        case SessionState::Failed: return "Failed";
        case SessionState::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

namespace {

bool is_progressive(SessionState current, SessionState target) {
    static const std::unordered_map<SessionState, std::vector<SessionState>> transitions {
        {SessionState::Idle, {SessionState::Planning}},
        {SessionState::Planning, {SessionState::Transferring}},
        {SessionState::Transferring, {SessionState::Finalizing}},
        {SessionState::Finalizing, {SessionState::Completed}},
    };

    if (target == SessionState::Failed || target == SessionState::Cancelled) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

} // namespace

SessionStateMachine::SessionStateMachine(std::string session_id, std::string remote_path, std::string backend) {
    info_.session_id = std::move(session_id);
    info_.remote_path = std::move(remote_path);
    info_.backend = std::move(backend);
    info_.state = SessionState::Idle;
    last_transition_ = std::chrono::system_clock::now();
}

Result<void> SessionStateMachine::start(std::uint64_t bytes_total) {
    if (info_.state != SessionState::Idle) {
        return Err<void>(Error::validation("Session already started"));
    }
    info_.started_at = std::chrono::system_clock::now();
    info_.bytes_total = bytes_total;
    return transition_to(SessionState::Planning);
}

Result<void> SessionStateMachine::transition_to(SessionState next_state) {
    if (info_.state == next_state) {
        return Ok();
    }

    if (!can_transition(next_state)) {
        return Err<void>(Error::validation(std::string("Illegal session state transition ") +
                                           to_string(info_.state) + " -> " + to_string(next_state)));
    }

    info_.state = next_state;
    last_transition_ = std::chrono::system_clock::now();
    if (next_state != SessionState::Failed) {
        info_.last_error.reset();
    }
    return Ok();
}

Result<void> SessionStateMachine::mark_failed(Error error) {
    if (is_terminal(info_.state)) {
        return Err<void>(Error::validation("Session already finished"));
    }
    info_.last_error = std::move(error);
    return transition_to(SessionState::Failed);
}

Result<void> SessionStateMachine::mark_cancelled() {
    return transition_to(SessionState::Cancelled);
}

void SessionStateMachine::set_plan(std::uint32_t total_chunks) {
    info_.total_chunks = total_chunks;
}

void SessionStateMachine::set_current_chunk(std::uint32_t index) {
    info_.current_chunk = index;
}

void SessionStateMachine::record_progress(std::uint64_t bytes) {
    info_.bytes_done += bytes;
}

void SessionStateMachine::record_chunk_done() {
    ++info_.chunks_done;
}

bool SessionStateMachine::can_transition(SessionState target) const noexcept {
    if (info_.state == target) {
        return true;
    }

    if (is_terminal(info_.state)) {
        return false;
    }

    return is_progressive(info_.state, target);
}

} // namespace cloudup::upload
