#pragma once
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "model.hpp"

// Parse a document payload into entries. Accepted roots:
// - [ doc, ... ]
// - { "documents": [ ... ] } or an Elasticsearch response { "hits": { "hits": [ { "_source": doc } ] } }
// - a single document
// - newline delimited documents (one JSON object per line, blank lines ignored)
//
// True in success; outError gets a readable message otherwise.
bool parse_documents(const std::string& text, std::vector<LogEntry>& out, std::string* outError = nullptr);
bool read_file(const std::string& path, std::string& out);

LogEntry extract_entry(const nlohmann::json& doc);

// Dotted lookup that works on nested objects, flattened keys or a mix of both
// ("resource.attributes.service.name"). nullptr when absent.
const nlohmann::json* lookup_path(const nlohmann::json& doc, std::string_view path);
// strings as-is, numbers/bools printed, everything else empty
std::string scalar_string(const nlohmann::json& v);
// epoch millis (number or numeric string) or ISO-8601
bool parse_timestamp(const nlohmann::json& v, SysTime& out);

// Visits every leaf (and empty object) with its dotted path.
void flatten_fields(const nlohmann::json& doc, const std::function<void(const std::string&, const nlohmann::json&)>& visit, const std::string& prefix = {});
