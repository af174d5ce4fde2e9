#pragma once
#include <string>
#include <string_view>
#include <vector>

// Key names follow the terminal convention: "up", "pgdown", "enter", "esc",
// "backspace", "space", "ctrl+c", or the printable character itself ("G", "/").
enum class Action
{
    None,

    // list navigation
    ScrollUp,
    ScrollDown,
    PageUp,
    PageDown,
    GoTop,
    GoBottom,
    PrevItem,
    NextItem,

    Select,
    Back,
    Quit,
    Help,
    Refresh,
    Search,
    CycleLookback,
    CycleSignal,
    Perspective,
    Copy,
    Raw,
    OpenBrowser,
    Sort,
    Fields,
    Query,
    AutoRefresh,
    Toggle,
    Spans,
    NextDoc,
    PrevDoc,
    Chat,
    Credentials,
    CollectorConfig,
};

Action getAction(std::string_view key);
bool isNavAction(Action a);
bool isListNavAction(Action a);

// New cursor for a list navigation key, or -1 when `key` does not navigate.
int listNav(int cursor, int listLen, std::string_view key);
bool isNavKey(std::string_view key);

struct KeyHint
{
    std::string keys;
    std::string label;
};

// Help overlay contents, grouped the way the overlay shows them.
struct KeyHintGroup
{
    std::string title;
    std::vector<KeyHint> hints;
};

std::vector<KeyHintGroup> helpGroups();
