#pragma once

#include <QByteArray>
#include <QString>

#include <vector>

namespace tracewatch {

// argv with the process-wide flags removed. argv() stays null-terminated and
// points into storage owned by this object.
class CliArgs
{
public:
    CliArgs(int argc, char *argv[]);

    CliArgs(const CliArgs &) = delete;
    CliArgs &operator=(const CliArgs &) = delete;

    bool debugTrace() const { return m_debugTrace; }
    int argc() const { return static_cast<int>(m_argv.size()) - 1; }
    char **argv() { return m_argv.data(); }

private:
    bool m_debugTrace = false;
    std::vector<QByteArray> m_storage;
    std::vector<char *> m_argv;
};

// Sets up logging for a CLI process and logs its start.
void startCliLogging(const QString &processName, const CliArgs &args);

} // namespace tracewatch
