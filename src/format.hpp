#pragma once
#include "model.hpp"

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// duration in microseconds, unit picked from the magnitude ("850 us", "12.5 ms", "01:02.250")
std::string fmtDuration(double us);

// "15:04:05", "12s ago" or "2024-03-01 15:04:05.123"
std::string fmtTimestamp(SysTime ts, TimeDisplayMode mode, SysTime now);
// RFC 3339 with milliseconds, UTC
std::string fmtIso(SysTime ts);
TimeDisplayMode nextTimeDisplay(TimeDisplayMode m);
const char* timeDisplayName(TimeDisplayMode m);

// Cell text of `field` for the entry table.
std::string fieldValue(const LogEntry& e, const DisplayField& field, TimeDisplayMode mode, SysTime now);

std::string prettyJson(const nlohmann::json& doc);
// Human readable detail of one document, signal specific fields first.
std::string renderEntryDetail(const LogEntry& e, SignalType signal);

// Query overlay contents.
std::string queryText(const std::string& query, QueryFormat format, const std::string& index);
const char* queryFormatName(QueryFormat f);

// Splits on '\n' and hard wraps lines longer than `columns` (0 = no wrap).
std::vector<std::string> wrapLines(const std::string& text, int columns);

// percent-encoding for URL query parts
std::string urlEncode(const std::string& s);

// Short numbers for the dashboard: 1.2k, 3.4M
std::string fmtCompact(double v);
