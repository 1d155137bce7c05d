#include <QCoreApplication>

#include "common/cli_args.hpp"
#include "report/ReportCli.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("tracewatch-report"));

    tracewatch::CliArgs args(argc, argv);
    tracewatch::startCliLogging(QStringLiteral("tracewatch-report"), args);

    tracewatch::ReportCli cli;
    return cli.run(args.argc(), args.argv());
}
