#include "tui/Subframe.hpp"

#include <algorithm>

void Subframe::Layout(ncpp::Plane& parent, unsigned parent_rows, unsigned parent_cols) {
    const Geometry next = Place(parent_rows, parent_cols);

    if (next.Empty()) {
        plane_.reset();
        current_ = Geometry{};
        return;
    }

    if (plane_ == nullptr || next.rows != current_.rows || next.cols != current_.cols) {
        plane_ = std::make_unique<ncpp::Plane>(&parent, next.rows, next.cols, next.y, next.x);
    } else if (next.y != current_.y || next.x != current_.x) {
        plane_->move(next.y, next.x);
    }
    current_ = next;
}

void Subframe::Draw() {
    if (plane_ == nullptr) {
        return;
    }
    plane_->erase();
    DrawContents();
}

void Subframe::HandleInput(uint32_t, const ncinput&) {}

void Subframe::DrawFrame(const char* title) {
    uint64_t channels = 0;
    if (focused_) {
        ncchannels_set_fg_rgb8(&channels, 150, 200, 255);
        ncchannels_set_bg_default(&channels);
    }
    plane_->perimeter_rounded(0, channels, 0);
    plane_->putstr(0, ncpp::NCAlign::Center, title);
}

void Subframe::PutListRow(int row, int col, int width, const std::string& text, bool selected) {
    if (width <= 0) {
        return;
    }
    std::string cell = text.substr(0, static_cast<std::size_t>(width));
    if (selected) {
        // Pad so the highlight spans the full row.
        cell.resize(static_cast<std::size_t>(width), ' ');
        plane_->set_bg_rgb8(255, 255, 255);
        plane_->set_fg_rgb8(0, 0, 0);
    }
    plane_->putstr(row, col, cell.c_str());
    plane_->set_bg_default();
    plane_->set_fg_default();
}

void Subframe::DrawScrollThumb(int top, int col, int visible, int total, int first) {
    if (visible <= 0 || total <= visible) {
        return;
    }
    const int thumb = std::max(1, (visible * visible) / total);
    const int start = ((visible - thumb) * first) / (total - visible);
    plane_->set_bg_rgb8(200, 200, 200);
    plane_->set_fg_rgb8(0, 0, 0);
    for (int row = 0; row < thumb; ++row) {
        plane_->putstr(top + start + row, col, " ");
    }
    plane_->set_bg_default();
    plane_->set_fg_default();
}

int Subframe::ScrollToShow(int selected, int scroll, int visible) {
    if (selected < scroll) {
        return selected;
    }
    if (visible > 0 && selected >= scroll + visible) {
        return selected - visible + 1;
    }
    return scroll;
}

std::string Subframe::ShiftedLabel(const std::string& label, int offset, int width) {
    const int max_offset = std::max(0, static_cast<int>(label.size()) - width);
    return label.substr(static_cast<std::size_t>(std::min(std::max(offset, 0), max_offset)));
}

Subframe::ContentArea Subframe::ContentBox(int pad_top, int pad_left, int pad_bottom, int pad_right) const {
    if (plane_ == nullptr) {
        return ContentArea{0, 0, 0, 0};
    }
    const int total_rows = static_cast<int>(plane_->get_dim_y());
    const int total_cols = static_cast<int>(plane_->get_dim_x());
    return ContentArea{std::max(0, pad_top),
                       std::max(0, pad_left),
                       std::max(0, total_rows - pad_top - pad_bottom),
                       std::max(0, total_cols - pad_left - pad_right)};
}
