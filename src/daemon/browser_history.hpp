#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace tracewatch {

class TraceStore;

struct SearchMatch {
    std::string query;
    std::string source;
};

// "<query> - Google Search", "<query> - Bing" and "<query> - Search" titles of
// browser windows. Returns std::nullopt for non-browser apps.
std::optional<SearchQuery> extractSearchFromTitle(const std::string &windowTitle,
                                                  const std::string &appName,
                                                  std::chrono::system_clock::time_point now);

// Search-engine result URLs (Google, Bing, YouTube, DuckDuckGo, GitHub, Stack Overflow).
std::optional<SearchMatch> parseSearchUrl(const std::string &url);

// Host without a leading "www.", empty when the URL has no host.
std::string domainOfUrl(const std::string &url);

enum class HistoryFormat {
    Chromium,
    Firefox
};

struct HistorySource {
    std::string browser;
    std::filesystem::path databasePath;
    HistoryFormat format = HistoryFormat::Chromium;
};

struct HistorySyncResult {
    int sourcesRead = 0;
    int visitsAdded = 0;
    int searchesAdded = 0;
    std::chrono::system_clock::time_point newestVisit;
};

/**
 * BrowserHistorySync imports URL history and search queries from the
 * profile databases of installed browsers. Each database is copied to a
 * temporary file first because a running browser keeps it locked.
 *
 * The newest imported visit time is kept in the store's meta table so that
 * every visit is read once.
 */
class BrowserHistorySync {
public:
    explicit BrowserHistorySync(TraceStore &store);
    BrowserHistorySync(TraceStore &store, std::vector<HistorySource> sources);

    // Chrome, Chromium, Brave and Edge default profiles under ~/.config and
    // every Firefox profile under ~/.mozilla/firefox.
    static std::vector<HistorySource> discoverSources(const std::filesystem::path &home);

    HistorySyncResult syncOnce(std::chrono::system_clock::time_point now);

    static constexpr const char *kCursorMetaKey = "browser_sync_cursor";

private:
    std::vector<BrowserVisit> readVisits(const HistorySource &source,
                                         std::chrono::system_clock::time_point since) const;

    TraceStore &m_store;
    std::vector<HistorySource> m_sources;
    bool m_discover = false;
};

} // namespace tracewatch
