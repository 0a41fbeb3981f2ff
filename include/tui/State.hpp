#ifndef TUI_STATE_HPP
#define TUI_STATE_HPP

#include <cstdint>

#include <ncpp/NotCurses.hh>
#include <ncpp/Plane.hh>

class StateMachine;

// Everything a screen touches while it is active.
struct ScreenContext {
    StateMachine& machine;
    ncpp::NotCurses& nc;
    ncpp::Plane& stdplane;
};

// A full-terminal screen driven by the state machine.
class State {
public:
    virtual ~State() = default;

    // Called when the state becomes active.
    virtual void Enter(ScreenContext& ctx) = 0;
    // Called when transitioning away from the state, and once when the loop ends.
    virtual void Exit(ScreenContext& ctx) = 0;
    // Paints the current frame onto ctx.stdplane.
    virtual void Draw(ScreenContext& ctx) = 0;
    // Polled on every input timeout and after each handled key.
    virtual void Update(ScreenContext& ctx) = 0;
    virtual void HandleInput(ScreenContext& ctx, uint32_t input, const ncinput& details) = 0;
    // While true the machine forwards every key, including the global quit key.
    virtual bool CapturesText() const { return false; }
};

#endif // TUI_STATE_HPP
