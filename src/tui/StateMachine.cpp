#include "tui/StateMachine.hpp"

#include <ctime>
#include <utility>
#include <notcurses/notcurses.h>

#include "tui/Signal.hpp"

namespace {
const timespec kPollTimeout{0, 100'000'000}; // 100ms
}

StateMachine::StateMachine(ncpp::NotCurses& nc, ncpp::Plane& stdplane)
    : context_{*this, nc, stdplane}, current_state_(nullptr), running_(true) {}

void StateMachine::AddState(const std::string& name, std::shared_ptr<State> state) {
    states_[name] = std::move(state);
}

void StateMachine::TransitionTo(const std::string& name) {
    auto it = states_.find(name);
    if (it == states_.end() || it->second == current_state_) {
        return;
    }

    if (current_state_ != nullptr) {
        current_state_->Exit(context_);
    }
    current_state_ = it->second;
    current_name_ = name;
    current_state_->Enter(context_);
}

void StateMachine::Run() {
    running_ = true;

    while (running_ && current_state_ != nullptr) {
        // Always redraw before polling so the frame stays fresh.
        current_state_->Draw(context_);
        context_.nc.render();

        ncinput details{};
        const uint32_t ch = notcurses_get(context_.nc, &kPollTimeout, &details);

        if (InterruptRequested() || static_cast<int32_t>(ch) == -1) {
            // Interrupt or input error: leave so the terminal gets restored.
            break;
        }

        if (ch == 0) {
            // Timeout: let the state advance timers or pick up worker results.
            current_state_->Update(context_);
            continue;
        }

        if ((ch == 'q' || ch == 'Q') && !current_state_->CapturesText()) {
            break;
        }

        current_state_->HandleInput(context_, ch, details);
        current_state_->Update(context_);
    }
    running_ = false;

    // Give the active state a final chance to clean up.
    if (current_state_ != nullptr) {
        current_state_->Exit(context_);
    }
}
