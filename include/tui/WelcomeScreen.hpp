#ifndef TUI_WELCOMESCREEN_HPP
#define TUI_WELCOMESCREEN_HPP

#include <string>
#include <vector>

#include "tui/BaseScreen.hpp"

// Landing screen: target format summary and the way into the converter.
class WelcomeScreen : public BaseScreen {
public:
    explicit WelcomeScreen(std::vector<std::string> summary);

    void Enter(ScreenContext& ctx) override;
    void Draw(ScreenContext& ctx) override;
    void Update(ScreenContext& ctx) override;
    void HandleInput(ScreenContext& ctx, uint32_t input, const ncinput& details) override;

private:
    std::vector<std::string> summary_;
    bool leave_ = false;
};

#endif // TUI_WELCOMESCREEN_HPP
