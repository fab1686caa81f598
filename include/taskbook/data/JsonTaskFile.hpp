#pragma once

#include <QJsonObject>
#include <QString>

#include <vector>

#include "taskbook/data/TaskRecord.hpp"

namespace taskbook {
namespace data {

// A JSON task file: {"tasks": [record, ...]}.
class JsonTaskFile
{
public:
    explicit JsonTaskFile(QString filePath);

    const QString &filePath() const;

    // Throws core::NotFoundError, core::IoError, core::ParseError or core::SchemaError.
    std::vector<TaskRecord> read() const;
    // Creates missing parent directories. Failures are logged and reported as false.
    bool write(const std::vector<TaskRecord> &records) const;

    static QJsonObject recordToJson(const TaskRecord &record);
    static TaskRecord recordFromJson(const QJsonObject &object);

private:
    QString m_filePath;
};

} // namespace data
} // namespace taskbook
