#include "AppConfig.hpp"
#include "parser.hpp"

#include <cerrno>
#include <cstdlib>
#include <filesystem>

#include <nlohmann/json.hpp>

namespace
{
    constexpr const char* kDefaultConfigFile = "lookout.json";

    bool parseInt(const std::string& s, int& out)
    {
        if (s.empty()) return false;
        char* end = nullptr;
        errno = 0;
        const long v = std::strtol(s.c_str(), &end, 10);
        if (errno != 0 || *end != '\0' || v < -2147483647L || v > 2147483647L)
            return false;
        out = int(v);
        return true;
    }

    bool parseBool(const std::string& s, bool& out)
    {
        if (s == "1" || s == "true" || s == "yes" || s == "on")  { out = true; return true; }
        if (s == "0" || s == "false" || s == "no" || s == "off") { out = false; return true; }
        return false;
    }

    const char* getEnv(const char* name)
    {
        const char* v = std::getenv(name);
        return (v && *v) ? v : nullptr;
    }

    // value following `key`, nullptr when the flag is absent or has no value
    const char* getArg(int argc, char** argv, const std::string& key)
    {
        for (int i = 1; i < argc - 1; ++i)
        {
            if (argv[i] == key) return argv[i + 1];
        }
        return nullptr;
    }

    bool hasFlag(int argc, char** argv, const std::string& flag)
    {
        for (int i = 1; i < argc; ++i)
        {
            if (argv[i] == flag) return true;
        }
        return false;
    }

    void readInt(const nlohmann::json& o, const char* key, int& field)
    {
        field = o.value(key, field);
    }
}

bool AppConfig::loadText(const std::string& text, std::string* outError)
{
    nlohmann::json doc;
    try
    {
        doc = nlohmann::json::parse(text);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        if (outError) *outError = std::string("invalid configuration: ") + e.what();
        return false;
    }
    if (!doc.is_object())
    {
        if (outError) *outError = "invalid configuration: root must be an object";
        return false;
    }

    try
    {
        if (auto it = doc.find("data"); it != doc.end() && it->is_object())
        {
            data.logs = it->value("logs", data.logs);
            data.traces = it->value("traces", data.traces);
            data.metrics = it->value("metrics", data.metrics);
            data.autoReload = it->value("auto_reload", data.autoReload);
        }
        if (auto it = doc.find("tui"); it != doc.end() && it->is_object())
        {
            readInt(*it, "tick_interval_ms", tui.tickIntervalMs);
            readInt(*it, "logs_timeout_ms", tui.logsTimeoutMs);
            readInt(*it, "metrics_timeout_ms", tui.metricsTimeoutMs);
            readInt(*it, "traces_timeout_ms", tui.tracesTimeoutMs);
            readInt(*it, "field_caps_timeout_ms", tui.fieldCapsTimeoutMs);
            readInt(*it, "auto_detect_timeout_ms", tui.autoDetectTimeoutMs);
            readInt(*it, "chat_timeout_ms", tui.chatTimeoutMs);
            readInt(*it, "status_duration_ms", tui.statusDurationMs);
            readInt(*it, "workers", tui.workers);
        }
        if (auto it = doc.find("log"); it != doc.end() && it->is_object())
        {
            log.file = it->value("file", log.file);
            log.level = it->value("level", log.level);
        }
        if (auto it = doc.find("ui"); it != doc.end() && it->is_object())
        {
            if (it->contains("signal"))
            {
                const std::string s = it->at("signal").get<std::string>();
                if (!parseSignal(s, ui.signal))
                {
                    if (outError) *outError = "invalid configuration: unknown signal '" + s + "'";
                    return false;
                }
            }
            ui.webUrl = it->value("web_url", ui.webUrl);
            ui.webUser = it->value("web_user", ui.webUser);
            ui.webPassword = it->value("web_password", ui.webPassword);
        }
    }
    catch (const nlohmann::json::exception& e)
    {
        // wrong value types
        if (outError) *outError = std::string("invalid configuration: ") + e.what();
        return false;
    }
    return true;
}

bool AppConfig::loadFile(const std::string& file, std::string* outError)
{
    std::string text;
    if (!read_file(file, text))
    {
        if (outError) *outError = "cannot read configuration file " + file;
        return false;
    }
    if (!loadText(text, outError))
    {
        if (outError) *outError = file + ": " + *outError;
        return false;
    }
    path = file;
    return true;
}

bool AppConfig::applyEnvironment(std::string* outError)
{
    if (const char* v = getEnv("LOOKOUT_LOGS"))    data.logs = v;
    if (const char* v = getEnv("LOOKOUT_TRACES"))  data.traces = v;
    if (const char* v = getEnv("LOOKOUT_METRICS")) data.metrics = v;
    if (const char* v = getEnv("LOOKOUT_AUTO_RELOAD"))
    {
        if (!parseBool(v, data.autoReload))
        {
            if (outError) *outError = std::string("LOOKOUT_AUTO_RELOAD: not a boolean: ") + v;
            return false;
        }
    }

    struct IntVar { const char* name; int* field; };
    const IntVar ints[] = {
        { "LOOKOUT_TICK_INTERVAL_MS", &tui.tickIntervalMs },
        { "LOOKOUT_LOGS_TIMEOUT_MS", &tui.logsTimeoutMs },
        { "LOOKOUT_METRICS_TIMEOUT_MS", &tui.metricsTimeoutMs },
        { "LOOKOUT_TRACES_TIMEOUT_MS", &tui.tracesTimeoutMs },
        { "LOOKOUT_FIELD_CAPS_TIMEOUT_MS", &tui.fieldCapsTimeoutMs },
        { "LOOKOUT_AUTO_DETECT_TIMEOUT_MS", &tui.autoDetectTimeoutMs },
        { "LOOKOUT_CHAT_TIMEOUT_MS", &tui.chatTimeoutMs },
        { "LOOKOUT_STATUS_DURATION_MS", &tui.statusDurationMs },
        { "LOOKOUT_WORKERS", &tui.workers },
    };
    for (const auto& iv : ints)
    {
        const char* v = getEnv(iv.name);
        if (!v) continue;
        if (!parseInt(v, *iv.field))
        {
            if (outError) *outError = std::string(iv.name) + ": not an integer: " + v;
            return false;
        }
    }

    if (const char* v = getEnv("LOOKOUT_LOG_FILE"))  log.file = v;
    if (const char* v = getEnv("LOOKOUT_LOG_LEVEL")) log.level = v;
    if (const char* v = getEnv("LOOKOUT_SIGNAL"))
    {
        if (!parseSignal(v, ui.signal))
        {
            if (outError) *outError = std::string("LOOKOUT_SIGNAL: unknown signal ") + v;
            return false;
        }
    }
    if (const char* v = getEnv("LOOKOUT_WEB_URL"))      ui.webUrl = v;
    if (const char* v = getEnv("LOOKOUT_WEB_USER"))     ui.webUser = v;
    if (const char* v = getEnv("LOOKOUT_WEB_PASSWORD")) ui.webPassword = v;
    return true;
}

bool AppConfig::applyArgs(int argc, char** argv, std::string* outError)
{
    if (hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h"))
        showHelp = true;

    if (const char* v = getArg(argc, argv, "--logs"))    data.logs = v;
    if (const char* v = getArg(argc, argv, "--traces"))  data.traces = v;
    if (const char* v = getArg(argc, argv, "--metrics")) data.metrics = v;
    if (hasFlag(argc, argv, "--no-auto-reload"))
        data.autoReload = false;

    if (const char* v = getArg(argc, argv, "--signal"))
    {
        if (!parseSignal(v, ui.signal))
        {
            if (outError) *outError = std::string("--signal: expected logs, traces or metrics, got ") + v;
            return false;
        }
    }
    if (const char* v = getArg(argc, argv, "--tick-ms"))
    {
        if (!parseInt(v, tui.tickIntervalMs))
        {
            if (outError) *outError = std::string("--tick-ms: not an integer: ") + v;
            return false;
        }
    }
    if (const char* v = getArg(argc, argv, "--log-file"))  log.file = v;
    if (const char* v = getArg(argc, argv, "--log-level")) log.level = v;
    return true;
}

bool AppConfig::validate(std::string* outError) const
{
    auto fail = [&](std::string msg) {
        if (outError) *outError = std::move(msg);
        return false;
    };

    if (data.logs.empty() && data.traces.empty() && data.metrics.empty())
        return fail("no data file configured (data.logs, data.traces or data.metrics)");

    struct Positive { const char* name; int value; };
    const Positive values[] = {
        { "tui.tick_interval_ms", tui.tickIntervalMs },
        { "tui.logs_timeout_ms", tui.logsTimeoutMs },
        { "tui.metrics_timeout_ms", tui.metricsTimeoutMs },
        { "tui.traces_timeout_ms", tui.tracesTimeoutMs },
        { "tui.field_caps_timeout_ms", tui.fieldCapsTimeoutMs },
        { "tui.auto_detect_timeout_ms", tui.autoDetectTimeoutMs },
        { "tui.chat_timeout_ms", tui.chatTimeoutMs },
        { "tui.status_duration_ms", tui.statusDurationMs },
    };
    for (const auto& p : values)
    {
        if (p.value <= 0)
            return fail(std::string(p.name) + " must be positive");
    }
    if (tui.workers <= 0)
        return fail("tui.workers must be at least 1");

    static const char* kLevels[] = { "trace", "debug", "info", "warn", "warning", "error", "critical", "off" };
    bool levelOk = false;
    for (const char* l : kLevels)
        levelOk = levelOk || log.level == l;
    if (!levelOk)
        return fail("log.level: unknown level '" + log.level + "'");
    return true;
}

FetchTimeouts AppConfig::timeouts() const
{
    using std::chrono::milliseconds;
    FetchTimeouts t;
    t.logs = milliseconds(tui.logsTimeoutMs);
    t.metrics = milliseconds(tui.metricsTimeoutMs);
    t.traces = milliseconds(tui.tracesTimeoutMs);
    t.fieldCaps = milliseconds(tui.fieldCapsTimeoutMs);
    t.autoDetect = milliseconds(tui.autoDetectTimeoutMs);
    t.chat = milliseconds(tui.chatTimeoutMs);
    return t;
}

bool AppConfig::resolve(int argc, char** argv, AppConfig& out, std::string* outError)
{
    AppConfig cfg;
    if (const char* file = getArg(argc, argv, "--config"))
    {
        if (!cfg.loadFile(file, outError))
            return false;
    }
    else if (const char* env = getEnv("LOOKOUT_CONFIG"))
    {
        if (!cfg.loadFile(env, outError))
            return false;
    }
    else
    {
        std::error_code ec;
        if (std::filesystem::exists(kDefaultConfigFile, ec) && !cfg.loadFile(kDefaultConfigFile, outError))
            return false;
    }

    if (!cfg.applyEnvironment(outError) || !cfg.applyArgs(argc, argv, outError))
        return false;
    if (!cfg.showHelp && !cfg.validate(outError))
        return false;
    out = std::move(cfg);
    return true;
}

const char* AppConfig::usage()
{
    return
        "usage: lookout [options]\n"
        "  --config <file>     JSON configuration (default ./lookout.json when present)\n"
        "  --logs <file>       log documents (JSON array or NDJSON)\n"
        "  --traces <file>     span and transaction documents\n"
        "  --metrics <file>    metric documents\n"
        "  --signal <name>     logs, traces or metrics\n"
        "  --tick-ms <n>       auto refresh interval\n"
        "  --log-file <file>   log destination (default lookout.log)\n"
        "  --log-level <lvl>   trace, debug, info, warn, error\n"
        "  --no-auto-reload    do not re-read data files when they change\n"
        "  --help              this text\n"
        "Environment: LOOKOUT_CONFIG, LOOKOUT_LOGS, LOOKOUT_TRACES, LOOKOUT_METRICS,\n"
        "LOOKOUT_SIGNAL, LOOKOUT_*_TIMEOUT_MS, LOOKOUT_WORKERS, LOOKOUT_LOG_FILE, ...\n";
}
