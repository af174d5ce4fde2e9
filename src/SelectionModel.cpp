#include "SelectionModel.hpp"

bool SelectionModel::setSelectedIndex(int index)
{
    if (_length == 0)
    {
        _selected = 0;
        return false;
    }

    if (index < 0)
        index = 0;
    if (index >= static_cast<int>(_length))
        index = static_cast<int>(_length) - 1;
    if (index == _selected)
        return false;

    _selected = index;
    _userHasScrolled = true;
    return true;
}

void SelectionModel::refresh(size_t length, bool sortAscending)
{
    _length = length;
    applyTailFollow(sortAscending);
    clamp();
}

void SelectionModel::applyTailFollow(bool sortAscending)
{
    if (_userHasScrolled || _length == 0)
        return;
    _selected = sortAscending ? static_cast<int>(_length) - 1 : 0;
}

void SelectionModel::clamp()
{
    if (_length == 0)
    {
        _selected = 0;
        return;
    }
    if (_selected >= static_cast<int>(_length))
        _selected = static_cast<int>(_length) - 1;
    if (_selected < 0)
        _selected = 0;
}

void SelectionModel::reset(size_t length)
{
    _length = length;
    _selected = 0;
}
