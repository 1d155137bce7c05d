#include "common/cli_args.hpp"

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace tracewatch {

CliArgs::CliArgs(int argc, char *argv[])
    : m_debugTrace(qEnvironmentVariableIntValue("TRACEWATCH_DEBUG_TRACE") == 1)
{
    m_storage.reserve(static_cast<size_t>(argc));
    for (int i = 0; i < argc; ++i) {
        if (i > 0 && qstrcmp(argv[i], "--debug-trace") == 0) {
            m_debugTrace = true;
            continue;
        }
        m_storage.emplace_back(argv[i]);
    }
    m_argv.reserve(m_storage.size() + 1);
    for (QByteArray &arg : m_storage) {
        m_argv.push_back(arg.data());
    }
    m_argv.push_back(nullptr);
}

void startCliLogging(const QString &processName, const CliArgs &args)
{
    logging::initLogging(processName, args.debugTrace());
    logging::installQtMessageBridge();
    TWLOG_INFO(QStringLiteral("main"),
               QStringLiteral("startCliLogging"),
               QStringLiteral("cli_start"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"args", args.argc() - 1}, {"debugTrace", args.debugTrace()}}));
}

} // namespace tracewatch
