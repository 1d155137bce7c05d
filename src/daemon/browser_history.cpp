#include "daemon/browser_history.hpp"

#include <algorithm>
#include <cstdlib>
#include <memory>
#include <regex>
#include <stdexcept>
#include <system_error>

#include <QString>
#include <QTemporaryDir>
#include <QUrl>
#include <QUrlQuery>

#include <sqlite3.h>

#include "common/logging.hpp"
#include "daemon/categorizer.hpp"
#include "daemon/tracewatch_store.hpp"

namespace tracewatch {

namespace {

// Chromium stores microseconds since 1601-01-01.
constexpr int64_t kChromiumEpochOffsetMs = 11644473600000LL;
constexpr int kMaxRowsPerSource = 1000;
constexpr auto kFirstSyncLookback = std::chrono::minutes(10);

struct TitlePattern {
    const char *regex;
    const char *source;
};

const TitlePattern kTitlePatterns[] = {
    {R"((.+?) - Google Search)", "Google"},
    {R"((.+?) - Bing)", "Bing"},
    {R"((.+?) - Search)", "Search"},
};

const char *const kSkippedSchemes[] = {
    "chrome://", "chrome-extension://", "edge://", "brave://", "about:", "moz-extension://",
    "view-source:",
};

using Database = std::unique_ptr<sqlite3, decltype(&sqlite3_close)>;
using Query = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

// The copy is private to this process, so it is opened read-write to let
// SQLite replay a copied write-ahead log.
Database openCopy(const std::filesystem::path &path)
{
    sqlite3 *raw = nullptr;
    const int rc = sqlite3_open_v2(path.string().c_str(), &raw, SQLITE_OPEN_READWRITE, nullptr);
    Database db(raw, &sqlite3_close);
    if (rc != SQLITE_OK) {
        throw std::runtime_error(std::string("failed to open history copy: ")
                                 + (raw ? sqlite3_errmsg(raw) : "out of memory"));
    }
    return db;
}

Query prepare(sqlite3 *db, const char *sql)
{
    sqlite3_stmt *raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("history query failed: ") + sqlite3_errmsg(db));
    }
    return Query(raw, &sqlite3_finalize);
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    return text ? reinterpret_cast<const char *>(text) : std::string();
}

int64_t toEpochMillis(std::chrono::system_clock::time_point timestamp)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch())
        .count();
}

std::chrono::system_clock::time_point fromEpochMillis(int64_t value)
{
    return std::chrono::system_clock::time_point{
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::milliseconds{value})};
}

bool isSkippedUrl(const std::string &url)
{
    return std::any_of(std::begin(kSkippedSchemes), std::end(kSkippedSchemes),
                       [&url](const char *scheme) { return url.rfind(scheme, 0) == 0; });
}

std::string queryValue(const QUrl &url, const QString &key)
{
    // Form encoding uses '+' for spaces; QUrlQuery leaves it untouched.
    QString encoded = url.query(QUrl::FullyEncoded);
    encoded.replace(QLatin1Char('+'), QStringLiteral("%20"));
    const QUrlQuery query(encoded);
    if (!query.hasQueryItem(key)) {
        return {};
    }
    return query.queryItemValue(key, QUrl::FullyDecoded).trimmed().toStdString();
}

void copyIfExists(const std::filesystem::path &from, const std::filesystem::path &to)
{
    std::error_code ec;
    if (std::filesystem::exists(from, ec)) {
        std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing,
                                   ec);
    }
}

} // namespace

std::optional<SearchQuery> extractSearchFromTitle(const std::string &windowTitle,
                                                  const std::string &appName,
                                                  std::chrono::system_clock::time_point now)
{
    if (!Categorizer::isBrowser(appName)) {
        return std::nullopt;
    }

    for (const auto &pattern : kTitlePatterns) {
        const std::regex re(pattern.regex, std::regex::ECMAScript | std::regex::icase);
        std::smatch match;
        if (!std::regex_search(windowTitle, match, re)) {
            continue;
        }
        std::string query = match[1].str();
        const auto first = query.find_first_not_of(" \t");
        const auto last = query.find_last_not_of(" \t");
        if (first == std::string::npos) {
            continue;
        }
        query = query.substr(first, last - first + 1);

        SearchQuery search;
        search.timestamp = now;
        search.browser = Categorizer::normalizeProcessName(appName);
        search.query = query;
        search.source = pattern.source;
        return search;
    }
    return std::nullopt;
}

std::optional<SearchMatch> parseSearchUrl(const std::string &url)
{
    const QUrl parsed(QString::fromStdString(url));
    if (!parsed.isValid()) {
        return std::nullopt;
    }
    const QString host = parsed.host().toLower();
    const QString path = parsed.path();

    SearchMatch match;
    if (host.contains(QStringLiteral("google."))) {
        match = {queryValue(parsed, QStringLiteral("q")), "Google"};
    } else if (host.endsWith(QStringLiteral("bing.com"))) {
        match = {queryValue(parsed, QStringLiteral("q")), "Bing"};
    } else if (host.endsWith(QStringLiteral("youtube.com"))
               && path.startsWith(QStringLiteral("/results"))) {
        match = {queryValue(parsed, QStringLiteral("search_query")), "YouTube"};
    } else if (host.endsWith(QStringLiteral("duckduckgo.com"))) {
        match = {queryValue(parsed, QStringLiteral("q")), "DuckDuckGo"};
    } else if (host.endsWith(QStringLiteral("github.com"))
               && path.startsWith(QStringLiteral("/search"))) {
        match = {queryValue(parsed, QStringLiteral("q")), "GitHub"};
    } else if (host.endsWith(QStringLiteral("stackoverflow.com"))
               && path.startsWith(QStringLiteral("/search"))) {
        match = {queryValue(parsed, QStringLiteral("q")), "StackOverflow"};
    }

    if (match.query.empty()) {
        return std::nullopt;
    }
    return match;
}

std::string domainOfUrl(const std::string &url)
{
    QString host = QUrl(QString::fromStdString(url)).host();
    if (host.startsWith(QStringLiteral("www."))) {
        host.remove(0, 4);
    }
    return host.toStdString();
}

BrowserHistorySync::BrowserHistorySync(TraceStore &store)
    : m_store(store)
    , m_discover(true)
{
}

BrowserHistorySync::BrowserHistorySync(TraceStore &store, std::vector<HistorySource> sources)
    : m_store(store)
    , m_sources(std::move(sources))
{
}

std::vector<HistorySource> BrowserHistorySync::discoverSources(const std::filesystem::path &home)
{
    const std::filesystem::path config = home / ".config";
    const std::vector<HistorySource> chromium = {
        {"Chrome", config / "google-chrome" / "Default" / "History", HistoryFormat::Chromium},
        {"Chromium", config / "chromium" / "Default" / "History", HistoryFormat::Chromium},
        {"Brave", config / "BraveSoftware" / "Brave-Browser" / "Default" / "History",
         HistoryFormat::Chromium},
        {"Edge", config / "microsoft-edge" / "Default" / "History", HistoryFormat::Chromium},
    };

    std::vector<HistorySource> sources;
    std::error_code ec;
    for (const auto &source : chromium) {
        if (std::filesystem::is_regular_file(source.databasePath, ec)) {
            sources.push_back(source);
        }
    }

    const std::filesystem::path firefoxRoot = home / ".mozilla" / "firefox";
    if (std::filesystem::is_directory(firefoxRoot, ec)) {
        for (const auto &profile : std::filesystem::directory_iterator(firefoxRoot, ec)) {
            const auto places = profile.path() / "places.sqlite";
            if (std::filesystem::is_regular_file(places, ec)) {
                sources.push_back({"Firefox", places, HistoryFormat::Firefox});
            }
        }
    }
    return sources;
}

std::vector<BrowserVisit> BrowserHistorySync::readVisits(
    const HistorySource &source, std::chrono::system_clock::time_point since) const
{
    QTemporaryDir tempDir;
    if (!tempDir.isValid()) {
        throw std::runtime_error("unable to create temporary directory for history copy");
    }

    const std::filesystem::path copy =
        std::filesystem::path(tempDir.path().toStdString()) / "history.sqlite";
    std::filesystem::copy_file(source.databasePath, copy);
    // Recent visits may still sit in the write-ahead log.
    copyIfExists(source.databasePath.string() + "-wal", copy.string() + "-wal");

    Database db = openCopy(copy);

    const int64_t sinceMs = toEpochMillis(since);
    Query query(nullptr, &sqlite3_finalize);
    if (source.format == HistoryFormat::Chromium) {
        query = prepare(db.get(),
                        "SELECT u.url, u.title, v.visit_time, v.visit_duration "
                        "FROM visits v JOIN urls u ON u.id = v.url "
                        "WHERE v.visit_time > ? ORDER BY v.visit_time ASC LIMIT ?;");
        sqlite3_bind_int64(query.get(), 1, (sinceMs + kChromiumEpochOffsetMs) * 1000);
    } else {
        query = prepare(db.get(),
                        "SELECT p.url, p.title, v.visit_date, 0 "
                        "FROM moz_historyvisits v JOIN moz_places p ON p.id = v.place_id "
                        "WHERE v.visit_date > ? ORDER BY v.visit_date ASC LIMIT ?;");
        sqlite3_bind_int64(query.get(), 1, sinceMs * 1000);
    }
    sqlite3_bind_int(query.get(), 2, kMaxRowsPerSource);

    std::vector<BrowserVisit> visits;
    while (sqlite3_step(query.get()) == SQLITE_ROW) {
        BrowserVisit visit;
        visit.url = columnText(query.get(), 0);
        if (visit.url.empty() || isSkippedUrl(visit.url)) {
            continue;
        }
        visit.title = columnText(query.get(), 1);
        const int64_t rawTime = sqlite3_column_int64(query.get(), 2);
        const int64_t millis = source.format == HistoryFormat::Chromium
            ? rawTime / 1000 - kChromiumEpochOffsetMs
            : rawTime / 1000;
        visit.timestamp = fromEpochMillis(millis);
        visit.visitDurationSeconds =
            static_cast<double>(sqlite3_column_int64(query.get(), 3)) / 1000000.0;
        visit.browser = source.browser;
        visit.domain = domainOfUrl(visit.url);
        visits.push_back(std::move(visit));
    }
    return visits;
}

HistorySyncResult BrowserHistorySync::syncOnce(std::chrono::system_clock::time_point now)
{
    HistorySyncResult result;

    std::chrono::system_clock::time_point since = now - kFirstSyncLookback;
    if (const auto cursor = m_store.getMeta(kCursorMetaKey)) {
        try {
            since = fromEpochMillis(std::stoll(*cursor));
        } catch (const std::exception &) {
            TWLOG_WARN(QStringLiteral("BrowserHistorySync"),
                       QStringLiteral("syncOnce"),
                       QStringLiteral("cursor_invalid"),
                       QStringLiteral("meta value is not a timestamp"),
                       QStringLiteral("reset_to_lookback"),
                       ::tracewatch::logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"cursor", *cursor}}));
        }
    }
    result.newestVisit = since;

    if (m_discover) {
        const char *home = std::getenv("HOME");
        m_sources = discoverSources(home ? home : ".");
    }

    for (const auto &source : m_sources) {
        std::vector<BrowserVisit> visits;
        try {
            visits = readVisits(source, since);
        } catch (const std::exception &ex) {
            TWLOG_WARN(QStringLiteral("BrowserHistorySync"),
                       QStringLiteral("syncOnce"),
                       QStringLiteral("history_read_failed"),
                       QString::fromStdString(ex.what()),
                       QStringLiteral("source_skipped"),
                       ::tracewatch::logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"browser", source.browser},
                                       {"path", source.databasePath.string()}}));
            continue;
        }
        ++result.sourcesRead;

        for (const auto &visit : visits) {
            if (!m_store.addBrowserVisit(visit)) {
                continue;
            }
            ++result.visitsAdded;
            result.newestVisit = std::max(result.newestVisit, visit.timestamp);

            if (const auto match = parseSearchUrl(visit.url)) {
                SearchQuery search;
                search.timestamp = visit.timestamp;
                search.browser = visit.browser;
                search.query = match->query;
                search.url = visit.url;
                search.source = match->source;
                m_store.addSearch(search);
                ++result.searchesAdded;
            }
        }
    }

    m_store.setMeta(kCursorMetaKey, std::to_string(toEpochMillis(result.newestVisit)));

    TWLOG_DEBUG(QStringLiteral("BrowserHistorySync"),
                QStringLiteral("syncOnce"),
                QStringLiteral("sync_complete"),
                QStringLiteral("periodic"),
                QStringLiteral("history_copy"),
                ::tracewatch::logging::defaultWho(),
                QString(),
                (nlohmann::json{{"sources", result.sourcesRead},
                                {"visits", result.visitsAdded},
                                {"searches", result.searchesAdded}}));
    return result;
}

} // namespace tracewatch
