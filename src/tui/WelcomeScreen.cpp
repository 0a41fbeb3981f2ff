#include "tui/WelcomeScreen.hpp"

#include <utility>
#include <notcurses/notcurses.h>

#include "tui/Signal.hpp"
#include "tui/StateMachine.hpp"

WelcomeScreen::WelcomeScreen(std::vector<std::string> summary) : summary_(std::move(summary)) {}

void WelcomeScreen::Enter(ScreenContext&) {
    leave_ = false;
}

void WelcomeScreen::Draw(ScreenContext& ctx) {
    std::vector<std::string> lines{"svxconv - audio to Amiga IFF 8SVX", ""};
    lines.insert(lines.end(), summary_.begin(), summary_.end());
    lines.push_back("");
    lines.push_back("Press C or Enter to open the converter, Q/Ctrl-C to exit.");

    ClearAndCenterLines(ctx.stdplane, lines);
    DrawScreenFrame(ctx.stdplane, "Welcome");
}

void WelcomeScreen::Update(ScreenContext& ctx) {
    if (leave_ || InterruptRequested()) {
        ctx.machine.SetRunning(false);
    }
}

void WelcomeScreen::HandleInput(ScreenContext& ctx, uint32_t input, const ncinput&) {
    switch (input) {
        case 'c':
        case 'C':
        case NCKEY_ENTER:
        case '\n':
        case '\r':
            ctx.machine.TransitionTo("convert");
            break;
        case NCKEY_ESC:
            leave_ = true;
            break;
        default:
            break;
    }
}
