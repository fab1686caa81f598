#pragma once

#include <QHash>
#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

#include "taskbook/data/TaskRecord.hpp"

namespace taskbook {
namespace data {

// Column name to cell text. Columns missing from a short row are absent.
using CsvRow = QHash<QString, QString>;

// RFC 4180 CSV file with one task per row and a fixed header.
class CsvTaskFile
{
public:
    explicit CsvTaskFile(QString filePath);

    const QString &filePath() const;

    bool write(const std::vector<TaskRecord> &records) const;
    // std::nullopt when the file cannot be opened. Blank lines are dropped.
    std::optional<std::vector<CsvRow>> readRows() const;

    static const QStringList &columns();
    static TaskRecord recordFromRow(const CsvRow &row);

    static QString encodeField(const QString &value);
    static std::vector<QStringList> parse(const QString &content);

private:
    QString m_filePath;
};

} // namespace data
} // namespace taskbook
