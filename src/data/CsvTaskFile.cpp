#include "taskbook/data/CsvTaskFile.hpp"

#include "taskbook/core/Logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QTextStream>

#include <algorithm>

namespace taskbook {
namespace data {

namespace {
constexpr auto LINE_END = "\r\n";

QStringList recordFields(const TaskRecord &record)
{
    return {
        record.taskId,
        record.title,
        record.description,
        record.dueDate.value_or(QString()),
        record.priority,
        record.category,
        record.createdAt,
        record.status,
    };
}

bool isBlankRow(const QStringList &fields)
{
    return fields.size() == 1 && fields.front().isEmpty();
}
} // namespace

CsvTaskFile::CsvTaskFile(QString filePath)
    : m_filePath(std::move(filePath))
{
}

const QString &CsvTaskFile::filePath() const
{
    return m_filePath;
}

const QStringList &CsvTaskFile::columns()
{
    static const QStringList names = {
        QStringLiteral("task_id"),
        QStringLiteral("title"),
        QStringLiteral("description"),
        QStringLiteral("due_date"),
        QStringLiteral("priority"),
        QStringLiteral("category"),
        QStringLiteral("created_at"),
        QStringLiteral("status"),
    };
    return names;
}

bool CsvTaskFile::write(const std::vector<TaskRecord> &records) const
{
    if (m_filePath.isEmpty()) {
        qCWarning(lcTaskStorage) << "Cannot export tasks: empty file path";
        return false;
    }

    const QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        qCWarning(lcTaskStorage) << "Error exporting tasks to CSV" << m_filePath << ": cannot create" << dir.path();
        return false;
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qCWarning(lcTaskStorage) << "Error exporting tasks to CSV" << m_filePath << ":" << file.errorString();
        return false;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");

    auto writeRow = [&stream](const QStringList &fields) {
        QStringList encoded;
        encoded.reserve(fields.size());
        for (const QString &field : fields) {
            encoded << encodeField(field);
        }
        stream << encoded.join(QLatin1Char(',')) << LINE_END;
    };

    writeRow(columns());
    for (const TaskRecord &record : records) {
        writeRow(recordFields(record));
    }

    stream.flush();
    if (stream.status() != QTextStream::Ok || !file.commit()) {
        qCWarning(lcTaskStorage) << "Error exporting tasks to CSV" << m_filePath << ":" << file.errorString();
        return false;
    }
    qCDebug(lcTaskStorage) << "Exported" << records.size() << "tasks to" << m_filePath;
    return true;
}

std::optional<std::vector<CsvRow>> CsvTaskFile::readRows() const
{
    QFile file(m_filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lcTaskStorage) << "Error importing tasks from CSV" << m_filePath << ":" << file.errorString();
        return std::nullopt;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");
    const auto lines = parse(stream.readAll());

    std::vector<CsvRow> rows;
    if (lines.empty()) {
        return rows;
    }

    const QStringList &header = lines.front();
    rows.reserve(lines.size() - 1);
    for (auto it = lines.begin() + 1; it != lines.end(); ++it) {
        const QStringList &fields = *it;
        CsvRow row;
        const int count = std::min(header.size(), fields.size());
        for (int i = 0; i < count; ++i) {
            row.insert(header.at(i), fields.at(i));
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

TaskRecord CsvTaskFile::recordFromRow(const CsvRow &row)
{
    TaskRecord record;
    record.taskId = row.value(QStringLiteral("task_id"));
    record.title = row.value(QStringLiteral("title"));
    record.description = row.value(QStringLiteral("description"));
    const QString dueDate = row.value(QStringLiteral("due_date"));
    if (!dueDate.isEmpty()) {
        record.dueDate = dueDate;
    }
    record.priority = row.value(QStringLiteral("priority"), QStringLiteral("medium"));
    record.category = row.value(QStringLiteral("category"));
    record.createdAt = row.value(QStringLiteral("created_at"));
    record.status = row.value(QStringLiteral("status"), QStringLiteral("pending"));
    return record;
}

QString CsvTaskFile::encodeField(const QString &value)
{
    const bool needsQuotes = value.contains(QLatin1Char(',')) || value.contains(QLatin1Char('"'))
        || value.contains(QLatin1Char('\n')) || value.contains(QLatin1Char('\r'));
    if (!needsQuotes) {
        return value;
    }
    QString escaped = value;
    escaped.replace(QLatin1Char('"'), QStringLiteral("\"\""));
    return QStringLiteral("\"%1\"").arg(escaped);
}

std::vector<QStringList> CsvTaskFile::parse(const QString &content)
{
    std::vector<QStringList> rows;
    QStringList fields;
    QString field;
    bool inQuotes = false;
    bool quoted = false;

    auto endField = [&]() {
        fields << field;
        field.clear();
        quoted = false;
    };
    auto endRow = [&]() {
        endField();
        if (!isBlankRow(fields)) {
            rows.push_back(fields);
        }
        fields.clear();
    };

    const int length = content.size();
    for (int i = 0; i < length; ++i) {
        const QChar c = content.at(i);
        if (inQuotes) {
            if (c == QLatin1Char('"')) {
                if (i + 1 < length && content.at(i + 1) == QLatin1Char('"')) {
                    field += QLatin1Char('"');
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }

        if (c == QLatin1Char('"') && field.isEmpty() && !quoted) {
            inQuotes = true;
            quoted = true;
        } else if (c == QLatin1Char(',')) {
            endField();
        } else if (c == QLatin1Char('\r')) {
            if (i + 1 < length && content.at(i + 1) == QLatin1Char('\n')) {
                ++i;
            }
            endRow();
        } else if (c == QLatin1Char('\n')) {
            endRow();
        } else {
            field += c;
        }
    }
    if (!field.isEmpty() || !fields.isEmpty() || quoted) {
        endRow();
    }
    return rows;
}

} // namespace data
} // namespace taskbook
