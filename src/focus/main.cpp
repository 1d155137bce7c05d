#include <QCoreApplication>

#include "common/cli_args.hpp"
#include "focus/FocusCli.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("tracewatch-focus"));

    tracewatch::CliArgs args(argc, argv);
    tracewatch::startCliLogging(QStringLiteral("tracewatch-focus"), args);

    tracewatch::FocusCli cli;
    return cli.run(args.argc(), args.argv());
}
