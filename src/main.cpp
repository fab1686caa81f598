#include <QCoreApplication>
#include <QString>
#include <QTextStream>

#include "version.h"

#include "taskbook/cli/CommandLine.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("taskbook"));
    QCoreApplication::setApplicationName(QStringLiteral("taskbook"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kTaskbookVersion));

    QCoreApplication app(argc, argv);

    QTextStream out(stdout);
    QTextStream err(stderr);
    QTextStream in(stdin);

    taskbook::cli::CommandLine commandLine(out, err, in);
    return commandLine.run(QCoreApplication::arguments());
}
