#include "common/config.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>

#include "common/logging.hpp"

namespace tracewatch {

namespace {

std::vector<std::string> stringList(const nlohmann::json &section, const char *key)
{
    std::vector<std::string> values;
    if (!section.is_object()) {
        return values;
    }
    auto it = section.find(key);
    if (it == section.end() || !it->is_array()) {
        return values;
    }
    for (const auto &item : *it) {
        if (item.is_string()) {
            values.push_back(item.get<std::string>());
        }
    }
    return values;
}

const nlohmann::json &sectionOrEmpty(const nlohmann::json &j, const char *key)
{
    static const nlohmann::json empty = nlohmann::json::object();
    if (!j.is_object()) {
        return empty;
    }
    auto it = j.find(key);
    if (it == j.end() || !it->is_object()) {
        return empty;
    }
    return *it;
}

void applyEnvOverride(const char *name, std::string &target)
{
    const char *value = std::getenv(name);
    if (value && *value) {
        target = value;
    }
}

} // namespace

std::filesystem::path configFilePath()
{
    const char *overridePath = std::getenv("TRACEWATCH_CONFIG");
    if (overridePath && *overridePath) {
        return overridePath;
    }
    const char *xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        return std::filesystem::path(xdg) / "tracewatch" / "config.json";
    }
    const char *home = std::getenv("HOME");
    std::filesystem::path base = home ? home : ".";
    return base / ".config" / "tracewatch" / "config.json";
}

Config configFromJson(const nlohmann::json &j)
{
    Config config;

    const auto &ai = sectionOrEmpty(j, "ai");
    config.ai.provider = ai.value("provider", config.ai.provider);
    config.ai.apiKey = ai.value("apiKey", config.ai.apiKey);
    config.ai.model = ai.value("model", config.ai.model);
    config.ai.endpoint = ai.value("endpoint", config.ai.endpoint);

    const auto &tracker = sectionOrEmpty(j, "tracker");
    config.tracker.pollIntervalMs =
        std::max(100, tracker.value("pollIntervalMs", config.tracker.pollIntervalMs));
    config.tracker.minDurationSeconds =
        std::max(0.0, tracker.value("minDurationSeconds", config.tracker.minDurationSeconds));
    config.tracker.resourceRefreshProbability = std::clamp(
        tracker.value("resourceRefreshProbability",
                      config.tracker.resourceRefreshProbability),
        0.0, 1.0);

    const auto &sampler = sectionOrEmpty(j, "sampler");
    config.sampler.intervalMs =
        std::max(1000, sampler.value("intervalMs", config.sampler.intervalMs));
    config.sampler.topN = std::max(1, sampler.value("topN", config.sampler.topN));

    const auto &browser = sectionOrEmpty(j, "browserSync");
    config.browserSync.enabled = browser.value("enabled", config.browserSync.enabled);
    config.browserSync.intervalMs =
        std::max(10000, browser.value("intervalMs", config.browserSync.intervalMs));

    const auto &rules = sectionOrEmpty(j, "rules");
    config.rules.productiveProcesses = stringList(rules, "productiveProcesses");
    config.rules.distractionProcesses = stringList(rules, "distractionProcesses");
    config.rules.productiveKeywords = stringList(rules, "productiveKeywords");
    config.rules.distractionKeywords = stringList(rules, "distractionKeywords");

    return config;
}

Config loadConfig()
{
    return loadConfig(configFilePath());
}

Config loadConfig(const std::filesystem::path &path)
{
    Config config;

    std::error_code error;
    if (std::filesystem::exists(path, error)) {
        try {
            std::ifstream in(path);
            nlohmann::json j;
            in >> j;
            config = configFromJson(j);
        } catch (const nlohmann::json::exception &ex) {
            TWLOG_WARN(QStringLiteral("Config"),
                       QStringLiteral("loadConfig"),
                       QStringLiteral("config_parse_failed"),
                       QStringLiteral("malformed_json"),
                       QStringLiteral("defaults_used"),
                       ::tracewatch::logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"path", path.string()}, {"error", ex.what()}}));
        }
    }

    applyEnvOverride("TRACEWATCH_AI_PROVIDER", config.ai.provider);
    applyEnvOverride("TRACEWATCH_AI_KEY", config.ai.apiKey);
    applyEnvOverride("TRACEWATCH_AI_MODEL", config.ai.model);

    return config;
}

} // namespace tracewatch
