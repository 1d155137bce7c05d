#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <QByteArray>
#include <QObject>
#include <QUrl>

#include <nlohmann/json.hpp>

#include "common/config.hpp"

class QNetworkAccessManager;

namespace tracewatch {

// Judges whether a window title still serves a declared goal. Answers are
// delivered through the callback, possibly after checkRelevance() returns.
// Implementations answer "relevant" when they cannot decide.
class RelevanceOracle
{
public:
    using Callback = std::function<void(bool relevant)>;

    virtual ~RelevanceOracle() = default;

    virtual void checkRelevance(const std::string &goal,
                                const std::string &title,
                                Callback done) = 0;
};

// Used when no AI provider is configured.
class PermissiveRelevanceOracle : public RelevanceOracle
{
public:
    void checkRelevance(const std::string &goal,
                        const std::string &title,
                        Callback done) override;
};

struct LlmRequest {
    QUrl url;
    std::vector<std::pair<QByteArray, QByteArray>> headers;
    nlohmann::json body;
};

/**
 * Asks a hosted LLM (gemini, openai or claude) for a YES/NO verdict over
 * QNetworkAccessManager. Requests are asynchronous; the callback runs on the
 * event loop when the reply finishes. Network or API errors are logged and
 * answered as "relevant".
 */
class LlmRelevanceOracle : public QObject, public RelevanceOracle
{
    Q_OBJECT
public:
    explicit LlmRelevanceOracle(AiConfig config, QObject *parent = nullptr);
    ~LlmRelevanceOracle() override;

    void checkRelevance(const std::string &goal,
                        const std::string &title,
                        Callback done) override;

    static std::string buildPrompt(const std::string &goal, const std::string &title);
    // std::nullopt for an unknown provider.
    static std::optional<LlmRequest> buildRequest(const AiConfig &config,
                                                  const std::string &prompt);
    static std::optional<std::string> extractReplyText(const std::string &provider,
                                                       const nlohmann::json &reply);
    static bool parseVerdict(const std::string &text);

private:
    AiConfig m_config;
    QNetworkAccessManager *m_network = nullptr;
};

} // namespace tracewatch
