#include "model.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

const char* signalName(SignalType s)
{
    switch (s)
    {
        case SignalType::Logs:    return "Logs";
        case SignalType::Traces:  return "Traces";
        case SignalType::Metrics: return "Metrics";
    }
    return "Unknown";
}

const char* signalIndexPattern(SignalType s)
{
    switch (s)
    {
        case SignalType::Traces:  return "traces-*";
        case SignalType::Metrics: return "metrics-*";
        default:                  return "logs-*";
    }
}

bool parseSignal(const std::string& s, SignalType& out)
{
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return char(std::tolower(c)); });
    if (v == "logs")    { out = SignalType::Logs; return true; }
    if (v == "traces")  { out = SignalType::Traces; return true; }
    if (v == "metrics") { out = SignalType::Metrics; return true; }
    return false;
}

const char* lookbackName(Lookback l)
{
    switch (l)
    {
        case Lookback::FiveMinutes: return "5m";
        case Lookback::OneHour:     return "1h";
        case Lookback::OneDay:      return "24h";
        case Lookback::OneWeek:     return "1w";
        default:                    return "all";
    }
}

std::chrono::seconds lookbackDuration(Lookback l)
{
    using namespace std::chrono;
    switch (l)
    {
        case Lookback::FiveMinutes: return minutes(5);
        case Lookback::OneHour:     return hours(1);
        case Lookback::OneDay:      return hours(24);
        case Lookback::OneWeek:     return hours(24 * 7);
        default:                    return seconds(0);
    }
}

std::chrono::seconds lookbackBucket(Lookback l)
{
    using namespace std::chrono;
    switch (l)
    {
        case Lookback::FiveMinutes: return seconds(10);
        case Lookback::OneHour:     return minutes(1);
        case Lookback::OneDay:      return minutes(30);
        case Lookback::OneWeek:     return hours(6);
        default:                    return hours(24);
    }
}

const char* lookbackBucketName(Lookback l)
{
    switch (l)
    {
        case Lookback::FiveMinutes: return "10 seconds";
        case Lookback::OneHour:     return "1 minute";
        case Lookback::OneDay:      return "30 minutes";
        case Lookback::OneWeek:     return "6 hours";
        default:                    return "1 day";
    }
}

Lookback nextLookback(Lookback l)
{
    for (size_t i = 0; i < kLookbacks.size(); ++i)
        if (kLookbacks[i] == l)
            return kLookbacks[(i + 1) % kLookbacks.size()];
    return Lookback::OneDay;
}

const char* perspectiveName(PerspectiveType p)
{
    return p == PerspectiveType::Services ? "Services" : "Resources";
}

const std::string& LogEntry::displayMessage() const
{
    if (!body.empty()) return body;
    if (!message.empty()) return message;
    if (!eventName.empty()) return eventName;
    return name;
}

bool LogEntry::isError() const
{
    if (statusCode == "Error" || statusCode == "STATUS_CODE_ERROR" || statusCode == "error")
        return true;
    std::string lv = level;
    std::transform(lv.begin(), lv.end(), lv.begin(), [](unsigned char c) { return char(std::toupper(c)); });
    return lv.rfind("ERR", 0) == 0 || lv == "FATAL";
}

std::vector<DisplayField> defaultFields(SignalType s)
{
    using V = std::vector<std::string>;
    switch (s)
    {
        case SignalType::Traces:
            return {
                { "@timestamp", "TIME", 8, true, std::nullopt },
                { "service.name", "SERVICE", 15, true, V{ "resource.attributes.service.name", "service.name" } },
                { "name", "NAME", 25, true, V{ "name" } },
                { "duration_ms", "DUR(ms)", 9, true, std::nullopt },
                { "status.code", "STATUS", 6, true, V{ "status.code" } },
                { "kind", "KIND", 8, true, V{ "kind" } },
                { "trace_id", "TRACE", 0, true, V{ "trace_id" } },
            };
        case SignalType::Metrics:
            return {
                { "@timestamp", "TIME", 8, true, std::nullopt },
                { "service.name", "SERVICE", 15, true, V{ "resource.attributes.service.name", "service.name", "attributes.service.name" } },
                { "scope.name", "SCOPE", 20, true, V{ "scope.name" } },
                { "attributes.span.name", "SPAN", 25, true, V{ "attributes.span.name" } },
                { "_metrics", "METRICS", 0, true, std::nullopt },
            };
        default:
            return {
                { "@timestamp", "TIME", 8, true, std::nullopt },
                { "severity_text", "LEVEL", 7, true, V{ "severity_text", "log.level" } },
                { "_resource", "RESOURCE", 12, true, V{ "resource.attributes.service.namespace", "resource.attributes.deployment.environment" } },
                { "service.name", "SERVICE", 15, true, V{ "resource.attributes.service.name", "service.name" } },
                { "body.text", "MESSAGE", 0, true, V{ "body.text", "message", "event_name" } },
            };
    }
}

std::vector<std::string> collectSearchFields(const std::vector<DisplayField>& fields)
{
    std::unordered_set<std::string> seen;
    std::vector<std::string> out;
    for (const auto& f : fields)
    {
        if (!f.searchFields)
            continue;
        if (f.searchFields->empty())
        {
            if (seen.insert(f.name).second)
                out.push_back(f.name);
            continue;
        }
        for (const auto& sf : *f.searchFields)
            if (seen.insert(sf).second)
                out.push_back(sf);
    }
    return out;
}

DisplayField makeCustomField(const std::string& name)
{
    DisplayField f;
    f.name = name;
    std::string label = name;
    if (auto dot = name.rfind('.'); dot != std::string::npos)
        label = name.substr(dot + 1);
    std::transform(label.begin(), label.end(), label.begin(), [](unsigned char c) { return char(std::toupper(c)); });
    if (label.size() > 12)
        label.resize(12);
    f.label = label;
    f.width = 15;
    f.selected = true;
    // timestamps are not text-searchable
    if (name.find("time") == std::string::npos)
        f.searchFields = std::vector<std::string>{};
    return f;
}
