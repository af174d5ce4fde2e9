#pragma once
#include "FetchPipeline.hpp"
#include "model.hpp"

#include <string>

struct DataConfig
{
    std::string logs;
    std::string traces;
    std::string metrics;
    bool autoReload = true;
};

struct TuiConfig
{
    int tickIntervalMs = 2000;
    int logsTimeoutMs = 10000;
    int metricsTimeoutMs = 30000;
    int tracesTimeoutMs = 30000;
    int fieldCapsTimeoutMs = 10000;
    int autoDetectTimeoutMs = 30000;
    int chatTimeoutMs = 60000;
    int statusDurationMs = 2000;
    int workers = 4;
};

struct LogConfig
{
    std::string file = "lookout.log";
    std::string level = "info";
};

struct UiConfig
{
    SignalType signal = SignalType::Logs;
    std::string webUrl;
    std::string webUser;
    std::string webPassword;
};

/// @brief Program configuration.
/// Layers, last wins: defaults, JSON file, LOOKOUT_* environment, command line.
struct AppConfig
{
    DataConfig data;
    TuiConfig tui;
    LogConfig log;
    UiConfig ui;

    // file the configuration was read from, empty when none
    std::string path;
    bool showHelp = false;

    // Applies a JSON configuration file over the current values.
    bool loadFile(const std::string& file, std::string* outError = nullptr);
    // Same, from JSON text.
    bool loadText(const std::string& text, std::string* outError = nullptr);
    bool applyEnvironment(std::string* outError = nullptr);
    bool applyArgs(int argc, char** argv, std::string* outError = nullptr);
    bool validate(std::string* outError = nullptr) const;

    FetchTimeouts timeouts() const;

    // Full resolution of argv: --config (or ./lookout.json when present),
    // then environment, then flags, then validation.
    static bool resolve(int argc, char** argv, AppConfig& out, std::string* outError = nullptr);
    static const char* usage();
};
