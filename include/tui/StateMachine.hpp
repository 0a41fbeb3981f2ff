#ifndef TUI_STATEMACHINE_HPP
#define TUI_STATEMACHINE_HPP

#include <memory>
#include <string>
#include <unordered_map>

#include <ncpp/NotCurses.hh>
#include <ncpp/Plane.hh>

#include "tui/State.hpp"

// Owns the named screens and runs the draw/poll/dispatch loop for the active one.
class StateMachine {
public:
    StateMachine(ncpp::NotCurses& nc, ncpp::Plane& stdplane);

    void AddState(const std::string& name, std::shared_ptr<State> state);
    // Unknown names and the active state are ignored.
    void TransitionTo(const std::string& name);
    const std::string& CurrentName() const { return current_name_; }

    void SetRunning(bool running) { running_ = running; }

    // Returns when a screen stops the machine, on q/Q, on input error, or on interrupt.
    void Run();

private:
    ScreenContext context_;
    std::unordered_map<std::string, std::shared_ptr<State>> states_;
    std::shared_ptr<State> current_state_;
    std::string current_name_;
    bool running_;
};

#endif // TUI_STATEMACHINE_HPP
