#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace tracewatch {

struct AiConfig {
    std::string provider = "gemini";
    std::string apiKey;
    std::string model;
    // Overrides the provider's default endpoint (used for self-hosted gateways).
    std::string endpoint;

    bool isConfigured() const { return !apiKey.empty(); }
};

struct TrackerConfig {
    int pollIntervalMs = 1000;
    double minDurationSeconds = 2.0;
    double resourceRefreshProbability = 0.1;
};

struct SamplerConfig {
    int intervalMs = 30000;
    int topN = 50;
};

struct BrowserSyncConfig {
    bool enabled = true;
    int intervalMs = 300000;
};

struct UserRules {
    std::vector<std::string> productiveProcesses;
    std::vector<std::string> distractionProcesses;
    std::vector<std::string> productiveKeywords;
    std::vector<std::string> distractionKeywords;
};

struct Config {
    AiConfig ai;
    TrackerConfig tracker;
    SamplerConfig sampler;
    BrowserSyncConfig browserSync;
    UserRules rules;
};

// ~/.config/tracewatch/config.json unless TRACEWATCH_CONFIG points elsewhere.
std::filesystem::path configFilePath();

// Missing file or keys fall back to defaults; a malformed file is logged and ignored.
// TRACEWATCH_AI_PROVIDER, TRACEWATCH_AI_KEY and TRACEWATCH_AI_MODEL override the file.
Config loadConfig();
Config loadConfig(const std::filesystem::path &path);

Config configFromJson(const nlohmann::json &j);

} // namespace tracewatch
