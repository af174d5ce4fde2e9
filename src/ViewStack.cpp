#include "ViewStack.hpp"

const char* viewModeName(ViewMode mode)
{
    switch (mode)
    {
        case ViewMode::Entries:                    return "entries";
        case ViewMode::Search:                     return "search";
        case ViewMode::Detail:                     return "detail";
        case ViewMode::DetailRaw:                  return "detail-raw";
        case ViewMode::IndexPicker:                return "index-picker";
        case ViewMode::Query:                      return "query";
        case ViewMode::Fields:                     return "fields";
        case ViewMode::MetricsDashboard:           return "metrics-dashboard";
        case ViewMode::MetricDetail:               return "metric-detail";
        case ViewMode::TransactionNames:           return "transaction-names";
        case ViewMode::PerspectiveList:            return "perspective-list";
        case ViewMode::ErrorModal:                 return "error";
        case ViewMode::QuitConfirm:                return "quit-confirm";
        case ViewMode::Help:                       return "help";
        case ViewMode::Chat:                       return "chat";
        case ViewMode::Credentials:                return "credentials";
        case ViewMode::CollectorConfigExplain:     return "collector-config-explain";
        case ViewMode::CollectorConfigWatch:       return "collector-config-watch";
        case ViewMode::CollectorConfigUnavailable: return "collector-config-unavailable";
    }
    return "unknown";
}

bool isBaseView(ViewMode mode)
{
    switch (mode)
    {
        case ViewMode::Entries:
        case ViewMode::MetricsDashboard:
        case ViewMode::TransactionNames:
        case ViewMode::Chat:
            return true;
        default:
            return false;
    }
}

bool isOverlayView(ViewMode mode)
{
    switch (mode)
    {
        case ViewMode::Search:
        case ViewMode::IndexPicker:
        case ViewMode::ErrorModal:
        case ViewMode::QuitConfirm:
        case ViewMode::Help:
        case ViewMode::Credentials:
        case ViewMode::CollectorConfigExplain:
        case ViewMode::CollectorConfigWatch:
        case ViewMode::CollectorConfigUnavailable:
            return true;
        default:
            return false;
    }
}

bool isTextInputView(ViewMode mode)
{
    return mode == ViewMode::Search || mode == ViewMode::IndexPicker;
}

ViewStack::ViewStack(ViewMode base)
    : _current{ base }
    , _frames{}
{
}

void ViewStack::pushView(ViewMode mode)
{
    _frames.push_back(_current);
    _current = mode;
}

bool ViewStack::popView()
{
    if (_frames.empty())
        return false;
    _current = _frames.back();
    _frames.pop_back();
    return true;
}

ViewMode ViewStack::peek() const
{
    return _frames.empty() ? _current : _frames.back();
}

void ViewStack::clear()
{
    _frames.clear();
}

void ViewStack::setBase(ViewMode mode)
{
    _frames.clear();
    _current = mode;
}
