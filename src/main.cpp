#include <QCoreApplication>
#include <QString>
#include <QTextStream>

#include "version.h"

#include "routine/cli/CommandRunner.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Routine Planner"));
    QCoreApplication::setOrganizationDomain(QStringLiteral("routine-planner.local"));
    QCoreApplication::setApplicationName(QStringLiteral("Routine Planner"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kRoutinePlannerVersion));

    QCoreApplication app(argc, argv);

    QTextStream out(stdout);
    QTextStream err(stderr);
    routine::cli::CommandRunner runner(out, err);
    return runner.run(QCoreApplication::arguments());
}
