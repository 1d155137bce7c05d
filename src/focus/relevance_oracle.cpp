#include "focus/relevance_oracle.hpp"

#include <algorithm>
#include <cctype>

#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>

#include "common/logging.hpp"

namespace tracewatch {

namespace {

constexpr int kTransferTimeoutMs = 15000;

std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

nlohmann::json userMessage(const std::string &prompt)
{
    return nlohmann::json::array({{{"role", "user"}, {"content", prompt}}});
}

} // namespace

void PermissiveRelevanceOracle::checkRelevance(const std::string &, const std::string &,
                                               Callback done)
{
    if (done) {
        done(true);
    }
}

LlmRelevanceOracle::LlmRelevanceOracle(AiConfig config, QObject *parent)
    : QObject(parent)
    , m_config(std::move(config))
    , m_network(new QNetworkAccessManager(this))
{
}

LlmRelevanceOracle::~LlmRelevanceOracle() = default;

std::string LlmRelevanceOracle::buildPrompt(const std::string &goal, const std::string &title)
{
    return "Task Goal: \"" + goal + "\"\n"
        + "Window/Tab Title: \"" + title + "\"\n\n"
        + "Is this window/tab title likely relevant or necessary for the task goal?\n"
        + "Consider broad categories (researching for the goal is relevant).\n"
        + "Return ONLY \"YES\" or \"NO\".";
}

std::optional<LlmRequest> LlmRelevanceOracle::buildRequest(const AiConfig &config,
                                                           const std::string &prompt)
{
    const std::string provider = toLower(config.provider);
    LlmRequest request;
    request.headers.emplace_back("Content-Type", "application/json");

    if (provider == "gemini") {
        const std::string model = config.model.empty() ? "gemini-1.5-flash" : config.model;
        const std::string base = config.endpoint.empty()
            ? "https://generativelanguage.googleapis.com/v1beta/models/" + model
                + ":generateContent"
            : config.endpoint;
        request.url = QUrl(QString::fromStdString(base + "?key=" + config.apiKey));
        request.body = {{"contents", nlohmann::json::array(
                                         {{{"parts", nlohmann::json::array({{{"text", prompt}}})}}})}};
        return request;
    }

    if (provider == "openai") {
        request.url = QUrl(QString::fromStdString(
            config.endpoint.empty() ? "https://api.openai.com/v1/chat/completions"
                                    : config.endpoint));
        request.headers.emplace_back("Authorization",
                                     QByteArray::fromStdString("Bearer " + config.apiKey));
        request.body = {{"model", config.model.empty() ? "gpt-4o-mini" : config.model},
                        {"messages", userMessage(prompt)},
                        {"temperature", 0}};
        return request;
    }

    if (provider == "claude") {
        request.url = QUrl(QString::fromStdString(
            config.endpoint.empty() ? "https://api.anthropic.com/v1/messages" : config.endpoint));
        request.headers.emplace_back("x-api-key", QByteArray::fromStdString(config.apiKey));
        request.headers.emplace_back("anthropic-version", "2023-06-01");
        request.body = {{"model", config.model.empty() ? "claude-3-haiku-20240307" : config.model},
                        {"max_tokens", 1024},
                        {"messages", userMessage(prompt)}};
        return request;
    }

    return std::nullopt;
}

std::optional<std::string> LlmRelevanceOracle::extractReplyText(const std::string &provider,
                                                                const nlohmann::json &reply)
{
    try {
        const std::string name = toLower(provider);
        if (name == "gemini") {
            return reply.at("candidates").at(0).at("content").at("parts").at(0).at("text")
                .get<std::string>();
        }
        if (name == "openai") {
            return reply.at("choices").at(0).at("message").at("content").get<std::string>();
        }
        if (name == "claude") {
            return reply.at("content").at(0).at("text").get<std::string>();
        }
    } catch (const nlohmann::json::exception &) {
        return std::nullopt;
    }
    return std::nullopt;
}

bool LlmRelevanceOracle::parseVerdict(const std::string &text)
{
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return upper.find("YES") != std::string::npos;
}

void LlmRelevanceOracle::checkRelevance(const std::string &goal,
                                        const std::string &title,
                                        Callback done)
{
    if (!m_config.isConfigured()) {
        done(true);
        return;
    }

    const auto request = buildRequest(m_config, buildPrompt(goal, title));
    if (!request) {
        TWLOG_WARN(QStringLiteral("LlmRelevanceOracle"),
                   QStringLiteral("checkRelevance"),
                   QStringLiteral("unknown_provider"),
                   QString::fromStdString(m_config.provider),
                   QStringLiteral("assume_relevant"),
                   ::tracewatch::logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
        done(true);
        return;
    }

    QNetworkRequest networkRequest(request->url);
    for (const auto &[name, value] : request->headers) {
        networkRequest.setRawHeader(name, value);
    }
    networkRequest.setTransferTimeout(kTransferTimeoutMs);

    QNetworkReply *reply =
        m_network->post(networkRequest, QByteArray::fromStdString(request->body.dump(
            -1, ' ', false, nlohmann::json::error_handler_t::replace)));
    const std::string provider = m_config.provider;
    connect(reply, &QNetworkReply::finished, this, [reply, provider, title, done]() {
        reply->deleteLater();

        if (reply->error() != QNetworkReply::NoError) {
            TWLOG_WARN(QStringLiteral("LlmRelevanceOracle"),
                       QStringLiteral("checkRelevance"),
                       QStringLiteral("request_failed"),
                       reply->errorString(),
                       QStringLiteral("assume_relevant"),
                       ::tracewatch::logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"provider", provider},
                                       {"status", reply->attribute(
                                                      QNetworkRequest::HttpStatusCodeAttribute)
                                                      .toInt()}}));
            done(true);
            return;
        }

        const QByteArray payload = reply->readAll();
        const auto json = nlohmann::json::parse(payload.constData(),
                                                payload.constData() + payload.size(),
                                                nullptr, false);
        const auto text = json.is_discarded() ? std::nullopt : extractReplyText(provider, json);
        if (!text) {
            TWLOG_WARN(QStringLiteral("LlmRelevanceOracle"),
                       QStringLiteral("checkRelevance"),
                       QStringLiteral("reply_unparsed"),
                       QStringLiteral("unexpected_payload"),
                       QStringLiteral("assume_relevant"),
                       ::tracewatch::logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"provider", provider}}));
            done(true);
            return;
        }

        const bool relevant = parseVerdict(*text);
        TWLOG_DEBUG(QStringLiteral("LlmRelevanceOracle"),
                    QStringLiteral("checkRelevance"),
                    QStringLiteral("verdict"),
                    QStringLiteral("llm_reply"),
                    QString::fromStdString(provider),
                    ::tracewatch::logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"title", title}, {"relevant", relevant}}));
        done(relevant);
    });
}

} // namespace tracewatch
