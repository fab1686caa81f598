#include "taskbook/core/AppConfig.hpp"

#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QStandardPaths>
#include <QtGlobal>

namespace taskbook {
namespace core {

namespace {
const QString TaskFileKey = QStringLiteral("storage/taskFile");
constexpr auto TaskFileEnv = "TASKBOOK_FILE";

QString environmentTaskFile()
{
    return qEnvironmentVariable(TaskFileEnv);
}

QString settingsTaskFile()
{
    QSettings settings;
    return settings.value(TaskFileKey).toString();
}
} // namespace

AppConfig::AppConfig() = default;

QString AppConfig::taskFile() const
{
    switch (taskFileSource()) {
    case Source::Override:
        return m_override;
    case Source::Environment:
        return environmentTaskFile();
    case Source::Settings:
        return settingsTaskFile();
    case Source::Default:
        break;
    }
    return defaultTaskFile();
}

AppConfig::Source AppConfig::taskFileSource() const
{
    if (!m_override.isEmpty()) {
        return Source::Override;
    }
    if (!environmentTaskFile().isEmpty()) {
        return Source::Environment;
    }
    if (!settingsTaskFile().isEmpty()) {
        return Source::Settings;
    }
    return Source::Default;
}

void AppConfig::setTaskFileOverride(const QString &path)
{
    m_override = path;
}

void AppConfig::setTaskFile(const QString &path)
{
    QSettings settings;
    settings.setValue(TaskFileKey, QFileInfo(path).absoluteFilePath());
}

void AppConfig::resetTaskFile()
{
    QSettings settings;
    settings.remove(TaskFileKey);
}

QString AppConfig::defaultTaskFile()
{
    QString storageFolder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (storageFolder.isEmpty()) {
        storageFolder = QDir::homePath() + QStringLiteral("/.local/share/taskbook");
    }
    return QDir(storageFolder).filePath(QStringLiteral("tasks.json"));
}

QString AppConfig::sourceName(Source source)
{
    switch (source) {
    case Source::Override:
        return QStringLiteral("command line");
    case Source::Environment:
        return QStringLiteral("environment");
    case Source::Settings:
        return QStringLiteral("settings");
    case Source::Default:
    default:
        return QStringLiteral("default");
    }
}

} // namespace core
} // namespace taskbook
