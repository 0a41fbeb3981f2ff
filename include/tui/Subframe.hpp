#ifndef TUI_SUBFRAME_HPP
#define TUI_SUBFRAME_HPP

#include <memory>
#include <string>

#include <ncpp/Plane.hh>
#include <notcurses/notcurses.h>

// A bordered panel with its own ncplane, placed inside a parent plane.
// Derived panels decide where they sit and what they paint.
class Subframe {
public:
    // Placement in parent cells. Empty when rows or cols is not positive.
    struct Geometry {
        int y = 0;
        int x = 0;
        int rows = 0;
        int cols = 0;

        bool Empty() const { return rows <= 0 || cols <= 0; }
    };

    struct ContentArea {
        int top;
        int left;
        int height;
        int width;
    };

    Subframe() = default;
    virtual ~Subframe() = default;

    // Recreates the plane on size change, otherwise just moves it.
    void Layout(ncpp::Plane& parent, unsigned parent_rows, unsigned parent_cols);
    // Erases and repaints; no-op while the panel has no plane.
    void Draw();

    virtual void HandleInput(uint32_t input, const ncinput& details);

    void SetFocused(bool focused) { focused_ = focused; }

protected:
    virtual Geometry Place(unsigned parent_rows, unsigned parent_cols) const = 0;
    virtual void DrawContents() = 0;

    // Rounded border with a centered title, tinted while focused.
    void DrawFrame(const char* title);
    // One list row cut to width columns, inverted when selected.
    void PutListRow(int row, int col, int width, const std::string& text, bool selected);
    // Grey thumb in column col for a list of total rows, visible of them shown from first.
    void DrawScrollThumb(int top, int col, int visible, int total, int first);
    // Area left inside the plane after padding, never negative.
    ContentArea ContentBox(int pad_top, int pad_left, int pad_bottom, int pad_right) const;

    // New scroll offset that keeps selected inside a window of visible rows.
    static int ScrollToShow(int selected, int scroll, int visible);
    // label shifted left by offset, clamped so the tail stays in view.
    static std::string ShiftedLabel(const std::string& label, int offset, int width);

    std::unique_ptr<ncpp::Plane> plane_;
    bool focused_ = false;

private:
    Geometry current_;
};

#endif // TUI_SUBFRAME_HPP
