#pragma once

#include <QString>
#include <QStringList>

#include <optional>

#include "taskbook/core/AppConfig.hpp"

class QCommandLineParser;
class QTextStream;

namespace taskbook {
namespace data {
class TaskManager;
}

namespace cli {

// Command dispatcher for the taskbook executable.
// run() returns the process exit code and never calls exit().
class CommandLine
{
public:
    CommandLine(QTextStream &out, QTextStream &err, QTextStream &in);

    int run(const QStringList &arguments);

private:
    int runAdd(const QStringList &args);
    int runList(const QStringList &args);
    int runUpdate(const QStringList &args);
    int runComplete(const QStringList &args);
    int runPending(const QStringList &args);
    int runCancel(const QStringList &args);
    int runDelete(const QStringList &args);
    int runShow(const QStringList &args);
    int runExport(const QStringList &args);
    int runImport(const QStringList &args);
    int runMerge(const QStringList &args);
    int runStats(const QStringList &args);
    int runConfig(const QStringList &args);

    using MarkFunction = bool (data::TaskManager::*)(const QString &);
    int runStatusChange(const QStringList &args, MarkFunction mark, const QString &stateLabel);

    // Parses a sub-command; returns an exit code when the command must stop.
    std::optional<int> parseCommand(QCommandLineParser &parser,
                                    const QStringList &args,
                                    int positionalCount);
    data::TaskManager loadManager() const;
    bool save(const data::TaskManager &manager);
    int printError(const QString &message);

    QTextStream &m_out;
    QTextStream &m_err;
    QTextStream &m_in;
    core::AppConfig m_config;
};

} // namespace cli
} // namespace taskbook
