#pragma once
#include <cstddef>

/// @brief Cursor over the primary result list with tail -f tracking.
/// selectedIndex stays in [0, length-1], or 0 when the list is empty.
class SelectionModel
{
public:
    int selectedIndex() const { return _selected; }
    bool userHasScrolled() const { return _userHasScrolled; }
    size_t length() const { return _length; }

    // Manual navigation. Clamps, marks the user as scrolled on a real move,
    // returns whether the index changed.
    bool setSelectedIndex(int index);
    bool moveSelection(int delta) { return setSelectedIndex(_selected + delta); }

    // New list contents: tail-follow first, then clamp.
    void refresh(size_t length, bool sortAscending);
    void applyTailFollow(bool sortAscending);
    void clamp();

    // Filter changed: follow the newest entry again.
    void resetScroll() { _userHasScrolled = false; }
    // List dropped (signal switch, drill-down): back to the first row.
    void reset(size_t length = 0);

private:
    int _selected = 0;
    size_t _length = 0;
    bool _userHasScrolled = false;
};
