#pragma once

#include <QString>

namespace taskbook {
namespace core {

// Resolves which JSON task file the front end works on.
class AppConfig
{
public:
    enum class Source
    {
        Override,
        Environment,
        Settings,
        Default,
    };

    AppConfig();

    // Precedence: override, $TASKBOOK_FILE, QSettings "storage/taskFile", default.
    QString taskFile() const;
    Source taskFileSource() const;

    void setTaskFileOverride(const QString &path);

    void setTaskFile(const QString &path);
    void resetTaskFile();

    static QString defaultTaskFile();
    static QString sourceName(Source source);

private:
    QString m_override;
};

} // namespace core
} // namespace taskbook
