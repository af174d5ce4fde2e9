#pragma once
#include "AppConfig.hpp"

#include <string>

// Installs the default spdlog logger: a file truncated at start.
// Before this runs (and in tests) spdlog's stdout logger stays in place.
bool initLogging(const LogConfig& config, std::string* outError = nullptr);
void shutdownLogging();
