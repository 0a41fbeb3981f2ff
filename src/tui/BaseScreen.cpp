#include "tui/BaseScreen.hpp"

void BaseScreen::ClearAndCenterLines(ncpp::Plane& plane, const std::vector<std::string>& lines) {
    plane.erase();
    const int total_lines = static_cast<int>(lines.size());
    const int first_row = static_cast<int>(plane.get_dim_y()) / 2 - total_lines / 2;

    for (int index = 0; index < total_lines; ++index) {
        plane.putstr(first_row + index, ncpp::NCAlign::Center, lines[static_cast<std::size_t>(index)].c_str());
    }
}

void BaseScreen::DrawScreenFrame(ncpp::Plane& plane, const std::string& title) {
    plane.perimeter_rounded(0, 0, 0);
    plane.putstr(0, ncpp::NCAlign::Center, title.c_str());
}
