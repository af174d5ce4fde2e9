#include "format.hpp"
#include "parser.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <ctime>

using json = nlohmann::json;

std::string fmtDuration(double us)
{
    if (!std::isfinite(us)) us = 0.0;
    if (us < 0.0) us = 0.0;

    char buf[64];

    // < 1 ms -> us
    if (us < 1e3)
    {
        std::snprintf(buf, sizeof(buf), "%.0f us", us);
        return buf;
    }

    // < 1 s -> ms
    if (us < 1e6)
    {
        double ms = us / 1e3;
        if (ms >= 100.0)     std::snprintf(buf, sizeof(buf), "%.0f ms", ms);
        else if (ms >= 10.0) std::snprintf(buf, sizeof(buf), "%.1f ms", ms);
        else                 std::snprintf(buf, sizeof(buf), "%.3f ms", ms);
        return buf;
    }

    // < 60 s -> s
    if (us < 60.0 * 1e6)
    {
        double s = us / 1e6;
        if (s >= 10.0) std::snprintf(buf, sizeof(buf), "%.2f s", s);
        else           std::snprintf(buf, sizeof(buf), "%.3f s", s);
        return buf;
    }

    // < 1 h -> mm:ss.mmm
    if (us < 3600.0 * 1e6)
    {
        uint64_t total_ms = static_cast<uint64_t>(std::llround(us / 1e3));
        std::snprintf(buf, sizeof(buf), "%02llu:%02llu.%03llu",
            (unsigned long long)(total_ms / 60000),
            (unsigned long long)((total_ms / 1000) % 60),
            (unsigned long long)(total_ms % 1000));
        return buf;
    }

    // >= 1 h -> hh:mm:ss
    uint64_t total_s = static_cast<uint64_t>(std::llround(us / 1e6));
    std::snprintf(buf, sizeof(buf), "%02llu:%02llu:%02llu",
        (unsigned long long)(total_s / 3600),
        (unsigned long long)((total_s / 60) % 60),
        (unsigned long long)(total_s % 60));
    return buf;
}

static std::tm toLocal(SysTime ts)
{
    const std::time_t t = std::chrono::system_clock::to_time_t(ts);
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

std::string fmtTimestamp(SysTime ts, TimeDisplayMode mode, SysTime now)
{
    if (ts == SysTime{})
        return "-";

    char buf[64];
    switch (mode)
    {
        case TimeDisplayMode::Relative:
        {
            const auto secs = std::chrono::duration_cast<std::chrono::seconds>(now - ts).count();
            if (secs < 0)          std::snprintf(buf, sizeof(buf), "in %llds", (long long)-secs);
            else if (secs < 60)    std::snprintf(buf, sizeof(buf), "%llds ago", (long long)secs);
            else if (secs < 3600)  std::snprintf(buf, sizeof(buf), "%lldm ago", (long long)(secs / 60));
            else if (secs < 86400) std::snprintf(buf, sizeof(buf), "%lldh ago", (long long)(secs / 3600));
            else                   std::snprintf(buf, sizeof(buf), "%lldd ago", (long long)(secs / 86400));
            return buf;
        }
        case TimeDisplayMode::Full:
        {
            const std::tm tm = toLocal(ts);
            const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count() % 1000;
            std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, int(ms < 0 ? ms + 1000 : ms));
            return buf;
        }
        default:
        {
            const std::tm tm = toLocal(ts);
            std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d", tm.tm_hour, tm.tm_min, tm.tm_sec);
            return buf;
        }
    }
}

std::string fmtIso(SysTime ts)
{
    const std::time_t t = std::chrono::system_clock::to_time_t(ts);
    std::tm tm{};
    gmtime_r(&t, &tm);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count() % 1000;
    if (ms < 0) ms += 1000;
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
        tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, int(ms));
    return buf;
}

TimeDisplayMode nextTimeDisplay(TimeDisplayMode m)
{
    switch (m)
    {
        case TimeDisplayMode::Clock:    return TimeDisplayMode::Relative;
        case TimeDisplayMode::Relative: return TimeDisplayMode::Full;
        default:                        return TimeDisplayMode::Clock;
    }
}

const char* timeDisplayName(TimeDisplayMode m)
{
    switch (m)
    {
        case TimeDisplayMode::Relative: return "relative";
        case TimeDisplayMode::Full:     return "full";
        default:                        return "clock";
    }
}

std::string fmtCompact(double v)
{
    char buf[32];
    const double a = std::fabs(v);
    if (a >= 1e9)       std::snprintf(buf, sizeof(buf), "%.1fG", v / 1e9);
    else if (a >= 1e6)  std::snprintf(buf, sizeof(buf), "%.1fM", v / 1e6);
    else if (a >= 1e3)  std::snprintf(buf, sizeof(buf), "%.1fk", v / 1e3);
    else if (a >= 100 || a == std::floor(a)) std::snprintf(buf, sizeof(buf), "%.0f", v);
    else                std::snprintf(buf, sizeof(buf), "%.2f", v);
    return buf;
}

std::string fieldValue(const LogEntry& e, const DisplayField& field, TimeDisplayMode mode, SysTime now)
{
    const std::string& n = field.name;
    if (n == "@timestamp")
        return fmtTimestamp(e.timestamp, mode, now);
    if (n == "severity_text" || n == "log.level")
        return e.displayLevel();
    if (n == "service.name")
        return e.serviceName;
    if (n == "_resource")
        return e.resource;
    if (n == "body.text" || n == "message")
        return e.displayMessage();
    if (n == "name")
        return e.name;
    if (n == "kind")
        return e.kind;
    if (n == "status.code")
        return e.statusCode;
    if (n == "trace_id")
        return e.traceId;
    if (n == "duration_ms")
    {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.2f", double(e.durationNs) / 1e6);
        return buf;
    }
    if (n == "scope.name")
        return e.scopeName;
    if (n == "_metrics")
    {
        std::string out;
        flatten_fields(e.metrics, [&](const std::string& k, const json& v)
        {
            if (!v.is_number()) return;
            if (!out.empty()) out += "  ";
            out += k + "=" + fmtCompact(v.get<double>());
        });
        return out;
    }
    if (const json* v = lookup_path(e.raw, n))
        return v->is_structured() ? v->dump() : scalar_string(*v);
    return {};
}

std::string prettyJson(const json& doc)
{
    if (doc.is_null())
        return "{}";
    return doc.dump(2, ' ', false, json::error_handler_t::replace);
}

std::string renderEntryDetail(const LogEntry& e, SignalType signal)
{
    std::string b;
    auto line = [&](const char* key, const std::string& value)
    {
        if (value.empty()) return;
        b += key;
        b += ": ";
        b += value;
        b += "\n\n";
    };

    line("Timestamp", fmtIso(e.timestamp));
    line("Service", e.serviceName);

    switch (signal)
    {
        case SignalType::Metrics:
        {
            line("Scope", e.scopeName);
            if (e.metrics.is_object() && !e.metrics.empty())
            {
                b += "Metrics:\n";
                flatten_fields(e.metrics, [&](const std::string& k, const json& v)
                {
                    b += "  " + k + ": " + (v.is_structured() ? v.dump() : scalar_string(v)) + "\n";
                });
                b += "\n";
            }
            break;
        }
        case SignalType::Traces:
        {
            line("Span Name", e.name);
            line("Kind", e.kind);
            if (e.durationNs > 0)
            {
                const double ms = double(e.durationNs) / 1e6;
                char buf[32];
                std::snprintf(buf, sizeof(buf), ms < 1.0 ? "%.3fms" : "%.2fms", ms);
                line("Duration", buf);
            }
            line("Status", e.statusCode);
            line("Trace ID", e.traceId);
            line("Span ID", e.spanId);
            line("Transaction", e.transactionName);
            break;
        }
        default:
        {
            line("Level", e.displayLevel());
            line("Resource", e.resource);
            line("Container", e.containerId);
            line("Trace ID", e.traceId);
            line("Span ID", e.spanId);
            line("Message", e.displayMessage());
            break;
        }
    }

    if (e.attributes.is_object() && !e.attributes.empty())
    {
        b += "Attributes:\n";
        flatten_fields(e.attributes, [&](const std::string& k, const json& v)
        {
            b += "  " + k + ": " + (v.is_structured() ? v.dump() : scalar_string(v)) + "\n";
        });
    }
    return b;
}

const char* queryFormatName(QueryFormat f)
{
    return f == QueryFormat::Curl ? "curl" : "ES|QL";
}

std::string queryText(const std::string& query, QueryFormat format, const std::string& index)
{
    if (query.empty())
        return "No query yet";
    if (format == QueryFormat::Esql)
        return query;

    // single line query inside a JSON body
    std::string oneLine;
    for (char c : query)
        oneLine += c == '\n' ? ' ' : c;
    const json body = { { "query", oneLine } };
    std::string dumped = body.dump();
    // escape single quotes for the shell
    std::string escaped;
    for (char c : dumped)
        escaped += c == '\'' ? std::string("'\\''") : std::string(1, c);
    return "# index: " + index + "\n"
           "curl -X POST 'http://localhost:9200/_query?format=txt' \\\n"
           "  -H 'Content-Type: application/json' \\\n"
           "  -d '" + escaped + "'";
}

std::vector<std::string> wrapLines(const std::string& text, int columns)
{
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= text.size())
    {
        size_t nl = text.find('\n', start);
        std::string line = text.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
        if (columns > 0)
        {
            while (line.size() > size_t(columns))
            {
                out.push_back(line.substr(0, size_t(columns)));
                line.erase(0, size_t(columns));
            }
        }
        out.push_back(std::move(line));
        if (nl == std::string::npos) break;
        start = nl + 1;
    }
    return out;
}

std::string urlEncode(const std::string& s)
{
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s)
    {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
        {
            out += char(c);
            continue;
        }
        out += '%';
        out += hex[c >> 4];
        out += hex[c & 15];
    }
    return out;
}
