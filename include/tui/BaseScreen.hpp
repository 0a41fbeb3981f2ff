#ifndef TUI_BASESCREEN_HPP
#define TUI_BASESCREEN_HPP

#include <string>
#include <vector>

#include <ncpp/Plane.hh>

#include "tui/State.hpp"

// Screen with no-op lifecycle hooks and drawing helpers shared by all screens.
class BaseScreen : public State {
public:
    void Enter(ScreenContext&) override {}
    void Exit(ScreenContext&) override {}
    void Update(ScreenContext&) override {}

protected:
    // Clears the plane and writes each line centered vertically around mid-row.
    static void ClearAndCenterLines(ncpp::Plane& plane, const std::vector<std::string>& lines);
    // Rounded border around the whole plane with the title on the top edge.
    static void DrawScreenFrame(ncpp::Plane& plane, const std::string& title);
};

#endif // TUI_BASESCREEN_HPP
