#include "JsonStore.hpp"
#include "filter.hpp"
#include "parser.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <unordered_map>

using json = nlohmann::json;

namespace
{
    // how many documents between two cancellation checks
    constexpr size_t kPollEvery = 256;

    bool poll(const RequestContext& ctx, FetchError* outError)
    {
        const ContextError ce = ctx.err();
        if (ce == ContextError::None) return true;
        if (outError) *outError = FetchError::fromContext(ce);
        return false;
    }

    std::string quoted(const std::string& s)
    {
        std::string out = "\"";
        for (char c : s)
        {
            if (c == '"' || c == '\\') out += '\\';
            out += c;
        }
        return out + "\"";
    }

    std::string esqlWindow(Lookback l)
    {
        switch (l)
        {
            case Lookback::FiveMinutes: return "5 minutes";
            case Lookback::OneHour:     return "1 hour";
            case Lookback::OneDay:      return "24 hours";
            case Lookback::OneWeek:     return "7 days";
            default:                    return {};
        }
    }

    std::string signalOfDataset(const std::string& name)
    {
        if (name.rfind("logs", 0) == 0) return "logs";
        if (name.rfind("traces", 0) == 0) return "traces";
        if (name.rfind("metrics", 0) == 0) return "metrics";
        return {};
    }

    std::string fieldType(const json& v)
    {
        if (v.is_string()) return "keyword";
        if (v.is_boolean()) return "boolean";
        if (v.is_number_float()) return "double";
        if (v.is_number()) return "long";
        if (v.is_array()) return "keyword";
        if (v.is_object()) return "object";
        return {};
    }

    std::string metricType(const std::string& name, const json& v)
    {
        if (v.is_object()) return "histogram";
        if (name.size() > 6 && (name.compare(name.size() - 6, 6, ".count") == 0 || name.compare(name.size() - 6, 6, "_total") == 0))
            return "counter";
        return "gauge";
    }
}

JsonStore::JsonStore(std::vector<DatasetSource> sources, bool autoReload, NowFn now)
    : _slots{}
    , _autoReload{ autoReload }
    , _now{ now ? std::move(now) : NowFn([] { return std::chrono::system_clock::now(); }) }
{
    for (auto& s : sources)
    {
        Slot slot;
        slot.watch.reset(s.path);
        slot.source = std::move(s);
        slot.snapshot = std::make_shared<const Dataset>(Dataset{ slot.source.name, {} });
        _slots.push_back(std::move(slot));
    }
}

bool JsonStore::reload(Slot& slot, std::string* outError)
{
    if (slot.source.path.empty())
        return true;

    std::string text;
    if (!read_file(slot.source.path, text))
    {
        if (outError) *outError = slot.source.path + ": failed to open file";
        return false;
    }

    std::vector<LogEntry> docs;
    std::string err;
    if (!parse_documents(text, docs, &err))
    {
        if (outError) *outError = slot.source.path + ": " + (err.empty() ? "failed to parse file" : err);
        return false;
    }

    spdlog::info("dataset {} loaded {} documents from {}", slot.source.name, docs.size(), slot.source.path);
    slot.snapshot = std::make_shared<const Dataset>(Dataset{ slot.source.name, std::move(docs) });
    slot.watch.rearm();
    return true;
}

bool JsonStore::load(std::string* outError)
{
    std::lock_guard<std::mutex> lk(_mtx);
    bool ok = true;
    for (auto& slot : _slots)
    {
        std::string err;
        if (!reload(slot, &err))
        {
            spdlog::error("dataset {}: {}", slot.source.name, err);
            if (ok && outError) *outError = err;
            ok = false;
        }
    }
    return ok;
}

void JsonStore::setDocuments(const std::string& name, std::vector<LogEntry> docs)
{
    std::lock_guard<std::mutex> lk(_mtx);
    for (auto& slot : _slots)
    {
        if (slot.source.name != name) continue;
        slot.snapshot = std::make_shared<const Dataset>(Dataset{ name, std::move(docs) });
        return;
    }
    Slot slot;
    slot.source = DatasetSource{ name, {} };
    slot.snapshot = std::make_shared<const Dataset>(Dataset{ name, std::move(docs) });
    _slots.push_back(std::move(slot));
}

std::vector<std::string> JsonStore::datasetNames() const
{
    std::lock_guard<std::mutex> lk(_mtx);
    std::vector<std::string> out;
    for (const auto& slot : _slots) out.push_back(slot.source.name);
    return out;
}

void JsonStore::refreshIfChanged()
{
    if (!_autoReload) return;
    for (auto& slot : _slots)
    {
        if (!slot.watch.changed()) continue;
        std::string err;
        // keep serving the previous snapshot when the new file is broken
        if (!reload(slot, &err))
            spdlog::warn("dataset {} reload failed: {}", slot.source.name, err);
    }
}

bool JsonStore::select(const std::string& index, std::vector<DatasetPtr>& out, FetchError* outError)
{
    std::lock_guard<std::mutex> lk(_mtx);
    refreshIfChanged();
    out.clear();
    for (const auto& slot : _slots)
        if (index_pattern_match(index, slot.source.name))
            out.push_back(slot.snapshot);
    if (out.empty())
    {
        if (outError) *outError = FetchError::backend("no such index [" + index + "]");
        return false;
    }
    return true;
}

std::vector<JsonStore::DatasetPtr> JsonStore::all()
{
    std::lock_guard<std::mutex> lk(_mtx);
    refreshIfChanged();
    std::vector<DatasetPtr> out;
    for (const auto& slot : _slots) out.push_back(slot.snapshot);
    return out;
}

std::string JsonStore::endpoint() const
{
    std::lock_guard<std::mutex> lk(_mtx);
    std::string out = "json://";
    for (size_t i = 0; i < _slots.size(); ++i)
    {
        if (i) out += ",";
        out += _slots[i].source.name;
    }
    return out;
}

// ---------- filtering ----------
bool JsonStore::passes(const LogEntry& e, const QueryFilters& f, SysTime now) const
{
    if (f.lookback != Lookback::All && e.timestamp < now - lookbackDuration(f.lookback))
        return false;
    if (!f.service.empty() && (e.serviceName == f.service) == f.negateService)
        return false;
    if (!f.resource.empty() && (e.resource == f.resource) == f.negateResource)
        return false;
    if (!f.level.empty() && !starts_with_icase_ascii(e.displayLevel(), f.level))
        return false;
    if (!f.processorEvent.empty() && e.processorEvent != f.processorEvent)
        return false;
    if (!f.transactionName.empty() && e.transactionName != f.transactionName)
        return false;
    if (!f.traceId.empty() && e.traceId != f.traceId)
        return false;
    if (!f.metricField.empty())
    {
        const json* v = lookup_path(e.raw, f.metricField);
        if (!v || v->is_null()) return false;
    }
    return true;
}

bool JsonStore::collect(const RequestContext& ctx, const std::vector<DatasetPtr>& sets, const QueryFilters& f,
                        const std::function<bool(const LogEntry&)>& extra, std::vector<const LogEntry*>& out, FetchError* outError)
{
    if (!poll(ctx, outError)) return false;
    const SysTime now = _now();
    size_t n = 0;
    for (const auto& ds : sets)
    {
        for (const auto& e : ds->entries)
        {
            if (++n % kPollEvery == 0 && !poll(ctx, outError)) return false;
            if (!passes(e, f, now)) continue;
            if (extra && !extra(e)) continue;
            out.push_back(&e);
        }
    }
    return poll(ctx, outError);
}

// ---------- entries ----------
bool JsonStore::rows(const RequestContext& ctx, const TailOptions& opts, const std::function<bool(const LogEntry&)>& extra, SearchResult& out, FetchError* outError)
{
    std::vector<DatasetPtr> sets;
    if (!select(opts.index, sets, outError)) return false;

    std::vector<const LogEntry*> hits;
    if (!collect(ctx, sets, opts, extra, hits, outError)) return false;

    std::stable_sort(hits.begin(), hits.end(), [&](const LogEntry* a, const LogEntry* b)
    {
        return opts.sortAscending ? a->timestamp < b->timestamp : a->timestamp > b->timestamp;
    });

    out.total = static_cast<int64_t>(hits.size());
    out.entries.clear();
    const size_t n = std::min(hits.size(), opts.size);
    out.entries.reserve(n);
    for (size_t i = 0; i < n; ++i) out.entries.push_back(*hits[i]);
    return true;
}

bool JsonStore::tail(const RequestContext& ctx, const TailOptions& opts, SearchResult& out, FetchError* outError)
{
    out.query = esqlFor(opts);
    return rows(ctx, opts, nullptr, out, outError);
}

bool JsonStore::search(const RequestContext& ctx, const std::string& query, const SearchOptions& opts, SearchResult& out, FetchError* outError)
{
    CompiledFilter cf;
    std::string err;
    if (!cf.compile(query, &err))
    {
        if (outError) *outError = FetchError::parse(err);
        return false;
    }

    const std::vector<std::string> fields = opts.searchFields.empty() ? std::vector<std::string>{ "body.text", "body", "message" } : opts.searchFields;
    out.query = esqlFor(opts, query, fields);
    auto matches = [&](const LogEntry& e)
    {
        if (!e.body.empty() && cf.match(e.body)) return true;
        for (const auto& f : fields)
        {
            const json* v = lookup_path(e.raw, f);
            if (v && cf.match(scalar_string(*v))) return true;
        }
        return false;
    };
    return rows(ctx, opts, matches, out, outError);
}

bool JsonStore::count(const RequestContext& ctx, const QueryFilters& filters, int64_t& outTotal, FetchError* outError)
{
    std::vector<DatasetPtr> sets;
    if (!select(filters.index, sets, outError)) return false;
    std::vector<const LogEntry*> hits;
    if (!collect(ctx, sets, filters, nullptr, hits, outError)) return false;
    outTotal = static_cast<int64_t>(hits.size());
    return true;
}

// ---------- metrics ----------
bool JsonStore::aggregateMetrics(const RequestContext& ctx, const QueryFilters& filters, MetricsAggregation& out, FetchError* outError)
{
    std::vector<DatasetPtr> sets;
    if (!select(filters.index, sets, outError)) return false;
    std::vector<const LogEntry*> hits;
    auto hasMetrics = [](const LogEntry& e) { return e.metrics.is_object() && !e.metrics.empty(); };
    if (!collect(ctx, sets, filters, hasMetrics, hits, outError)) return false;

    struct Series
    {
        std::string type;
        std::vector<std::pair<SysTime, double>> points;
    };
    std::map<std::string, Series> series;
    for (const LogEntry* e : hits)
    {
        flatten_fields(e->metrics, [&](const std::string& name, const json& v)
        {
            if (v.is_array())
            {
                // histogram leaf: {"values": [...], "counts": [...]}
                const auto dot = name.rfind('.');
                if (dot == std::string::npos || name.compare(dot + 1, std::string::npos, "values") != 0 || v.empty())
                    return;
                double sum = 0.0;
                for (const auto& x : v)
                    if (x.is_number()) sum += x.get<double>();
                auto& s = series[name.substr(0, dot)];
                s.type = "histogram";
                s.points.emplace_back(e->timestamp, sum / double(v.size()));
                return;
            }
            auto& s = series[name];
            if (s.type.empty()) s.type = metricType(name, v);
            if (v.is_number()) s.points.emplace_back(e->timestamp, v.get<double>());
        }, "metrics");
    }
    if (!poll(ctx, outError)) return false;

    const auto width = std::chrono::duration_cast<SysTime::duration>(lookbackBucket(filters.lookback));
    out.metrics.clear();
    out.bucketSize = lookbackBucketName(filters.lookback);
    for (auto& [name, s] : series)
    {
        AggregatedMetric m;
        m.name = name;
        m.shortName = name.rfind("metrics.", 0) == 0 ? name.substr(8) : name;
        m.type = s.type;
        if (!s.points.empty())
        {
            std::sort(s.points.begin(), s.points.end(), [](const auto& a, const auto& b) { return a.first < b.first; });
            double sum = 0.0;
            m.min = s.points.front().second;
            m.max = m.min;
            std::map<int64_t, MetricBucket> buckets;
            for (const auto& [ts, v] : s.points)
            {
                m.min = std::min(m.min, v);
                m.max = std::max(m.max, v);
                sum += v;
                const int64_t key = ts.time_since_epoch() / width;
                auto& b = buckets[key];
                b.timestamp = SysTime(width * key);
                b.value += v;
                ++b.count;
            }
            m.avg = sum / double(s.points.size());
            m.latest = s.points.back().second;
            for (auto& [key, b] : buckets)
            {
                b.value /= double(b.count);
                m.buckets.push_back(b);
            }
        }
        out.metrics.push_back(std::move(m));
    }

    out.query = "FROM " + filters.index;
    if (const auto w = esqlWindow(filters.lookback); !w.empty())
        out.query += "\n| WHERE @timestamp >= NOW() - " + w;
    out.query += "\n| STATS ";
    for (size_t i = 0; i < out.metrics.size() && i < 4; ++i)
        out.query += (i ? ", " : "") + std::string("AVG(") + out.metrics[i].name + ")";
    out.query += " BY BUCKET(@timestamp, " + out.bucketSize + ")";
    return true;
}

// ---------- traces ----------
bool JsonStore::transactionNames(const RequestContext& ctx, const QueryFilters& filters, std::vector<TransactionNameAgg>& out, FetchError* outError)
{
    std::vector<DatasetPtr> sets;
    if (!select(filters.index, sets, outError)) return false;

    QueryFilters txf = filters;
    txf.processorEvent = "transaction";
    std::vector<const LogEntry*> txs;
    if (!collect(ctx, sets, txf, nullptr, txs, outError)) return false;

    QueryFilters spf = filters;
    spf.processorEvent = "span";
    spf.transactionName.clear();
    std::vector<const LogEntry*> spans;
    if (!collect(ctx, sets, spf, nullptr, spans, outError)) return false;

    std::unordered_map<std::string, int64_t> spansPerTrace;
    for (const LogEntry* s : spans)
        if (!s->traceId.empty()) ++spansPerTrace[s->traceId];

    struct Acc
    {
        TransactionNameAgg agg;
        double sumMs = 0.0;
        int64_t errors = 0;
        std::set<std::string> traces;
    };
    std::map<std::string, Acc> groups;
    for (const LogEntry* t : txs)
    {
        const std::string& name = t->transactionName.empty() ? t->name : t->transactionName;
        auto& a = groups[name];
        const double ms = double(t->durationNs) / 1e6;
        if (a.agg.count == 0)
        {
            a.agg.name = name;
            a.agg.minDurationMs = ms;
            a.agg.maxDurationMs = ms;
        }
        ++a.agg.count;
        a.sumMs += ms;
        a.agg.minDurationMs = std::min(a.agg.minDurationMs, ms);
        a.agg.maxDurationMs = std::max(a.agg.maxDurationMs, ms);
        a.agg.lastSeen = std::max(a.agg.lastSeen, t->timestamp);
        if (t->isError()) ++a.errors;
        if (!t->traceId.empty()) a.traces.insert(t->traceId);
    }

    out.clear();
    for (auto& [name, a] : groups)
    {
        a.agg.avgDurationMs = a.sumMs / double(a.agg.count);
        a.agg.errorRate = double(a.errors) / double(a.agg.count);
        a.agg.traceCount = static_cast<int64_t>(a.traces.size());
        int64_t spanSum = 0;
        for (const auto& id : a.traces)
        {
            auto it = spansPerTrace.find(id);
            if (it != spansPerTrace.end()) spanSum += it->second;
        }
        a.agg.avgSpans = a.traces.empty() ? 0.0 : double(spanSum) / double(a.traces.size());
        out.push_back(std::move(a.agg));
    }
    std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.count > b.count; });
    return true;
}

// ---------- perspectives ----------
bool JsonStore::perspective(const RequestContext& ctx, Lookback lookback, bool byService, std::vector<PerspectiveItem>& out, FetchError* outError)
{
    if (!poll(ctx, outError)) return false;
    const auto sets = all();
    const SysTime now = _now();
    const auto window = lookbackDuration(lookback);

    std::map<std::string, PerspectiveItem> items;
    size_t n = 0;
    for (const auto& ds : sets)
    {
        const std::string signal = signalOfDataset(ds->name);
        for (const auto& e : ds->entries)
        {
            if (++n % kPollEvery == 0 && !poll(ctx, outError)) return false;
            if (lookback != Lookback::All && e.timestamp < now - window) continue;
            const std::string& key = byService ? e.serviceName : e.resource;
            if (key.empty()) continue;
            auto& item = items[key];
            item.name = key;
            if (signal == "traces") ++item.traceCount;
            else if (signal == "metrics") ++item.metricCount;
            else ++item.logCount;
        }
    }
    if (!poll(ctx, outError)) return false;

    out.clear();
    for (auto& [k, v] : items) out.push_back(std::move(v));
    std::stable_sort(out.begin(), out.end(), [](const PerspectiveItem& a, const PerspectiveItem& b)
    {
        return a.logCount + a.traceCount + a.metricCount > b.logCount + b.traceCount + b.metricCount;
    });
    return true;
}

bool JsonStore::services(const RequestContext& ctx, Lookback lookback, std::vector<PerspectiveItem>& out, FetchError* outError)
{
    return perspective(ctx, lookback, true, out, outError);
}

bool JsonStore::resources(const RequestContext& ctx, Lookback lookback, std::vector<PerspectiveItem>& out, FetchError* outError)
{
    return perspective(ctx, lookback, false, out, outError);
}

// ---------- field caps ----------
bool JsonStore::fieldCaps(const RequestContext& ctx, const std::string& index, std::vector<FieldInfo>& out, FetchError* outError)
{
    std::vector<DatasetPtr> sets;
    if (!select(index, sets, outError)) return false;

    std::unordered_map<std::string, FieldInfo> caps;
    size_t n = 0;
    for (const auto& ds : sets)
    {
        for (const auto& e : ds->entries)
        {
            if (++n % kPollEvery == 0 && !poll(ctx, outError)) return false;
            flatten_fields(e.raw, [&](const std::string& name, const json& v)
            {
                const std::string type = fieldType(v);
                if (type.empty()) return;
                auto& fi = caps[name];
                if (fi.name.empty())
                {
                    fi.name = name;
                    fi.type = type;
                    fi.searchable = type == "keyword";
                    fi.aggregatable = type != "object";
                }
                ++fi.docCount;
            });
        }
    }
    if (!poll(ctx, outError)) return false;

    out.clear();
    for (auto& [k, v] : caps) out.push_back(std::move(v));
    std::sort(out.begin(), out.end(), [](const FieldInfo& a, const FieldInfo& b)
    {
        return a.docCount != b.docCount ? a.docCount > b.docCount : a.name < b.name;
    });
    return true;
}

// ---------- query text ----------
std::string JsonStore::esqlFor(const TailOptions& opts, const std::string& searchQuery, const std::vector<std::string>& searchFields)
{
    std::vector<std::string> where;
    if (const auto w = esqlWindow(opts.lookback); !w.empty())
        where.push_back("@timestamp >= NOW() - " + w);
    if (!opts.service.empty())
        where.push_back(std::string("service.name ") + (opts.negateService ? "!= " : "== ") + quoted(opts.service));
    if (!opts.resource.empty())
        where.push_back(std::string("resource ") + (opts.negateResource ? "!= " : "== ") + quoted(opts.resource));
    if (!opts.level.empty())
        where.push_back("severity_text LIKE " + quoted(opts.level + "*"));
    if (!opts.processorEvent.empty())
        where.push_back("processor.event == " + quoted(opts.processorEvent));
    if (!opts.transactionName.empty())
        where.push_back("transaction.name == " + quoted(opts.transactionName));
    if (!opts.traceId.empty())
        where.push_back("trace_id == " + quoted(opts.traceId));
    if (!opts.metricField.empty())
        where.push_back(opts.metricField + " IS NOT NULL");
    if (!searchQuery.empty())
    {
        std::string any;
        for (size_t i = 0; i < searchFields.size(); ++i)
            any += (i ? " OR " : "") + searchFields[i] + " LIKE " + quoted("*" + searchQuery + "*");
        where.push_back("(" + any + ")");
    }

    std::string q = "FROM " + opts.index;
    for (const auto& w : where) q += "\n| WHERE " + w;
    q += std::string("\n| SORT @timestamp ") + (opts.sortAscending ? "ASC" : "DESC");
    q += "\n| LIMIT " + std::to_string(opts.size);
    return q;
}
