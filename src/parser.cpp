#include "parser.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

bool read_file(const std::string& path, std::string& out)
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) return false;
    std::ostringstream oss; oss << ifs.rdbuf();
    out = std::move(oss).str();
    return true;
}

// ---------- lookups ----------
const json* lookup_path(const json& doc, std::string_view path)
{
    if (!doc.is_object() || path.empty())
        return nullptr;

    auto it = doc.find(std::string(path));
    if (it != doc.end())
        return &*it;

    // longest object prefix first: "resource.attributes" before "resource"
    for (size_t pos = path.rfind('.'); pos != std::string_view::npos && pos > 0; pos = path.rfind('.', pos - 1))
    {
        auto head = doc.find(std::string(path.substr(0, pos)));
        if (head != doc.end() && head->is_object())
        {
            if (const json* found = lookup_path(*head, path.substr(pos + 1)))
                return found;
        }
        if (pos == 0) break;
    }
    return nullptr;
}

std::string scalar_string(const json& v)
{
    if (v.is_string()) return v.get<std::string>();
    if (v.is_boolean()) return v.get<bool>() ? "true" : "false";
    if (v.is_number_integer()) return std::to_string(v.get<int64_t>());
    if (v.is_number_unsigned()) return std::to_string(v.get<uint64_t>());
    if (v.is_number_float())
    {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%g", v.get<double>());
        return buf;
    }
    return {};
}

static std::string string_at(const json& doc, std::string_view path)
{
    const json* v = lookup_path(doc, path);
    return (v && v->is_string()) ? v->get<std::string>() : std::string();
}

void flatten_fields(const json& doc, const std::function<void(const std::string&, const json&)>& visit, const std::string& prefix)
{
    if (!doc.is_object())
        return;
    for (auto it = doc.begin(); it != doc.end(); ++it)
    {
        std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();
        if (it->is_object() && !it->empty())
            flatten_fields(*it, visit, key);
        else
            visit(key, *it);
    }
}

// ---------- time ----------
// days since 1970-01-01 for a proleptic Gregorian date
static int64_t days_from_civil(int64_t y, unsigned m, unsigned d)
{
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

static bool parse_iso8601(const std::string& s, SysTime& out)
{
    int Y = 0, M = 0, D = 0, h = 0, m = 0, sec = 0, consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &Y, &M, &D, &h, &m, &sec, &consumed) < 6)
        return false;
    if (M < 1 || M > 12 || D < 1 || D > 31)
        return false;

    size_t i = static_cast<size_t>(consumed);
    int64_t micros = 0;
    if (i < s.size() && (s[i] == '.' || s[i] == ','))
    {
        ++i;
        int digits = 0;
        while (i < s.size() && s[i] >= '0' && s[i] <= '9')
        {
            if (digits < 6) { micros = micros * 10 + (s[i] - '0'); ++digits; }
            ++i;
        }
        while (digits++ < 6) micros *= 10;
    }

    int64_t offsetSec = 0;
    if (i < s.size() && (s[i] == '+' || s[i] == '-'))
    {
        int oh = 0, om = 0;
        const int sign = s[i] == '-' ? -1 : 1;
        const char* fmt = (i + 3 < s.size() && s[i + 3] == ':') ? "%2d:%2d" : "%2d%2d";
        if (std::sscanf(s.c_str() + i + 1, fmt, &oh, &om) < 1)
            return false;
        offsetSec = sign * (oh * 3600 + om * 60);
    }

    const int64_t secs = days_from_civil(Y, static_cast<unsigned>(M), static_cast<unsigned>(D)) * 86400 + h * 3600 + m * 60 + sec - offsetSec;
    out = SysTime(std::chrono::duration_cast<SysTime::duration>(std::chrono::seconds(secs) + std::chrono::microseconds(micros)));
    return true;
}

static SysTime from_epoch_millis(double ms)
{
    auto us = static_cast<int64_t>(ms * 1000.0);
    return SysTime(std::chrono::duration_cast<SysTime::duration>(std::chrono::microseconds(us)));
}

bool parse_timestamp(const json& v, SysTime& out)
{
    if (v.is_number())
    {
        out = from_epoch_millis(v.get<double>());
        return true;
    }
    if (!v.is_string())
        return false;

    const std::string s = v.get<std::string>();
    char* end = nullptr;
    const double f = std::strtod(s.c_str(), &end);
    if (end && *end == '\0' && f > 1e12)
    {
        out = from_epoch_millis(f);
        return true;
    }
    return parse_iso8601(s, out);
}

// ---------- extraction ----------
static std::string level_from_severity_number(double n)
{
    if (n <= 4)  return "TRACE";
    if (n <= 8)  return "DEBUG";
    if (n <= 12) return "INFO";
    if (n <= 16) return "WARN";
    if (n <= 20) return "ERROR";
    return "FATAL";
}

static std::string resource_label(const json& doc)
{
    static const char* kAttrKeys[] = { "service.namespace", "deployment.environment", "host.name", "k8s.namespace.name", "cloud.region" };
    const json* attrs = lookup_path(doc, "resource.attributes");
    if (attrs && attrs->is_object())
    {
        for (const char* k : kAttrKeys)
        {
            std::string v = string_at(*attrs, k);
            if (!v.empty()) return v;
        }
    }
    const json* res = lookup_path(doc, "resource");
    if (res && res->is_object())
    {
        for (const char* k : kAttrKeys)
        {
            std::string v = string_at(*res, k);
            if (!v.empty()) return v;
        }
    }
    return {};
}

LogEntry extract_entry(const json& doc)
{
    LogEntry e;
    e.raw = doc;
    e.timestamp = std::chrono::system_clock::now();

    if (const json* ts = lookup_path(doc, "@timestamp"))
        parse_timestamp(*ts, e.timestamp);
    else if (const json* ts2 = lookup_path(doc, "timestamp"))
        parse_timestamp(*ts2, e.timestamp);

    // body: body.text > body > message > event_name
    e.body = string_at(doc, "body.text");
    if (e.body.empty()) e.body = string_at(doc, "body");
    e.message = string_at(doc, "message");
    e.eventName = string_at(doc, "event_name");
    if (e.body.empty()) e.body = e.message;
    if (e.body.empty()) e.body = e.eventName;

    // level: severity_text > log.level > level > severity_number
    e.level = string_at(doc, "severity_text");
    if (e.level.empty()) e.level = string_at(doc, "log.level");
    if (e.level.empty()) e.level = string_at(doc, "level");
    if (e.level.empty())
        if (const json* sn = lookup_path(doc, "severity_number"); sn && sn->is_number())
            e.level = level_from_severity_number(sn->get<double>());

    e.serviceName = string_at(doc, "resource.attributes.service.name");
    if (e.serviceName.empty()) e.serviceName = string_at(doc, "attributes.service.name");
    if (e.serviceName.empty()) e.serviceName = string_at(doc, "service.name");
    e.resource = resource_label(doc);

    e.containerId = string_at(doc, "container_id");
    if (e.containerId.empty()) e.containerId = string_at(doc, "container.id");

    e.traceId = string_at(doc, "trace_id");
    e.spanId = string_at(doc, "span_id");
    e.name = string_at(doc, "name");
    e.kind = string_at(doc, "kind");
    e.statusCode = string_at(doc, "status.code");
    e.processorEvent = string_at(doc, "attributes.processor.event");
    if (e.processorEvent.empty()) e.processorEvent = string_at(doc, "processor.event");
    e.transactionName = string_at(doc, "attributes.transaction.name");
    if (e.transactionName.empty()) e.transactionName = string_at(doc, "transaction.name");
    if (e.transactionName.empty() && e.processorEvent == "transaction") e.transactionName = e.name;
    e.scopeName = string_at(doc, "scope.name");

    if (const json* d = lookup_path(doc, "duration"); d && d->is_number())
        e.durationNs = static_cast<int64_t>(d->get<double>());

    if (const json* a = lookup_path(doc, "attributes"); a && a->is_object())
        e.attributes = *a;
    if (const json* m = lookup_path(doc, "metrics"); m && m->is_object())
        e.metrics = *m;

    return e;
}

// ---------- API ----------
static void parse_root(const json& root, std::vector<LogEntry>& out)
{
    auto add = [&](const json& d)
    {
        if (!d.is_object()) return;
        // search hit
        if (d.contains("_source") && d["_source"].is_object())
            out.push_back(extract_entry(d["_source"]));
        else
            out.push_back(extract_entry(d));
    };

    if (root.is_array())
    {
        for (const auto& it : root) add(it);
        return;
    }
    if (root.is_object())
    {
        if (root.contains("documents") && root["documents"].is_array())
        {
            for (const auto& it : root["documents"]) add(it);
            return;
        }
        if (root.contains("hits"))
        {
            const json& hits = root["hits"];
            const json* arr = hits.is_array() ? &hits : (hits.is_object() && hits.contains("hits") ? &hits["hits"] : nullptr);
            if (arr && arr->is_array())
            {
                for (const auto& it : *arr) add(it);
                return;
            }
        }
        add(root);
    }
}

bool parse_documents(const std::string& text, std::vector<LogEntry>& out, std::string* outError)
{
    out.clear();

    std::string firstError;
    try
    {
        parse_root(json::parse(text), out);
        return true;
    }
    catch (const json::parse_error& e)
    {
        firstError = e.what();
    }

    // newline delimited
    std::istringstream lines(text);
    std::string line;
    size_t lineNo = 0;
    while (std::getline(lines, line))
    {
        ++lineNo;
        if (line.find_first_not_of(" \t\r") == std::string::npos)
            continue;
        try
        {
            parse_root(json::parse(line), out);
        }
        catch (const json::parse_error& e)
        {
            out.clear();
            if (outError)
                *outError = lineNo == 1 ? firstError : "line " + std::to_string(lineNo) + ": " + e.what();
            return false;
        }
    }
    return true;
}
