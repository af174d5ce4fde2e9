#include "keymap.hpp"

#include <unordered_map>

namespace
{
    const std::unordered_map<std::string_view, Action>& bindings()
    {
        static const std::unordered_map<std::string_view, Action> kBindings = {
            { "up", Action::ScrollUp },       { "k", Action::ScrollUp },
            { "down", Action::ScrollDown },   { "j", Action::ScrollDown },
            { "pgup", Action::PageUp },       { "pgdown", Action::PageDown },
            { "home", Action::GoTop },        { "g", Action::GoTop },
            { "end", Action::GoBottom },      { "G", Action::GoBottom },
            { "left", Action::PrevItem },     { "right", Action::NextItem },

            { "enter", Action::Select },
            { "esc", Action::Back },          { "backspace", Action::Back },
            { "q", Action::Quit },
            { "?", Action::Help },          { "h", Action::Help },
            { "r", Action::Refresh },
            { "/", Action::Search },
            { "l", Action::CycleLookback },
            { "m", Action::CycleSignal },
            { "p", Action::Perspective },
            { "y", Action::Copy },
            { "J", Action::Raw },
            { "K", Action::OpenBrowser },
            { "s", Action::Sort },
            { "f", Action::Fields },
            { "Q", Action::Query },
            { "a", Action::AutoRefresh },
            { "space", Action::Toggle },
            { "S", Action::Spans },
            { "n", Action::NextDoc },
            { "N", Action::PrevDoc },
            { "c", Action::Chat },
            { "C", Action::Credentials },
            { "O", Action::CollectorConfig },
        };
        return kBindings;
    }
}

Action getAction(std::string_view key)
{
    const auto& b = bindings();
    auto it = b.find(key);
    return it == b.end() ? Action::None : it->second;
}

bool isNavAction(Action a)
{
    return a >= Action::ScrollUp && a <= Action::NextItem;
}

bool isListNavAction(Action a)
{
    return a >= Action::ScrollUp && a <= Action::GoBottom;
}

int listNav(int cursor, int listLen, std::string_view key)
{
    switch (getAction(key))
    {
        case Action::ScrollUp:
            return cursor > 0 ? cursor - 1 : cursor;
        case Action::ScrollDown:
            return cursor < listLen - 1 ? cursor + 1 : cursor;
        case Action::GoTop:
            return 0;
        case Action::GoBottom:
            return listLen > 0 ? listLen - 1 : 0;
        case Action::PageUp:
            return cursor - 10 < 0 ? 0 : cursor - 10;
        case Action::PageDown:
        {
            int next = cursor + 10;
            if (listLen > 0 && next >= listLen)
                return listLen - 1;
            return next < 0 ? 0 : next;
        }
        default:
            return -1;
    }
}

bool isNavKey(std::string_view key)
{
    return isListNavAction(getAction(key));
}

std::vector<KeyHintGroup> helpGroups()
{
    return {
        { "Navigation", {
            { "up/k  down/j", "move" },
            { "pgup  pgdown", "page" },
            { "g  G", "top / bottom" },
            { "left  right", "previous / next item" },
            { "enter", "open" },
            { "esc", "back" },
        } },
        { "Data", {
            { "r", "refresh" },
            { "/", "search" },
            { "1 2 3 4  0", "level filter / clear" },
            { "l", "cycle lookback" },
            { "s", "toggle sort" },
            { "a", "auto refresh" },
            { "m", "cycle signal" },
            { "p", "services / resources" },
            { "i", "index pattern" },
            { "d", "dashboard / documents" },
        } },
        { "View", {
            { "f", "fields" },
            { "Q", "query" },
            { "t", "time display" },
            { "J", "raw document" },
            { "S", "spans of trace" },
            { "y", "copy" },
            { "K", "open in browser" },
            { "C", "credentials" },
            { "O", "config watch" },
            { "c", "chat" },
            { "? h", "help" },
            { "q", "quit" },
        } },
    };
}
