#include "taskbook/data/JsonTaskFile.hpp"

#include "taskbook/core/Errors.hpp"
#include "taskbook/core/Logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <QSaveFile>

namespace taskbook {
namespace data {

namespace {
const QString TasksKey = QStringLiteral("tasks");
const QString IdKey = QStringLiteral("task_id");
const QString TitleKey = QStringLiteral("title");
const QString DescriptionKey = QStringLiteral("description");
const QString DueDateKey = QStringLiteral("due_date");
const QString PriorityKey = QStringLiteral("priority");
const QString CategoryKey = QStringLiteral("category");
const QString CreatedAtKey = QStringLiteral("created_at");
const QString StatusKey = QStringLiteral("status");

std::optional<QString> stringField(const QJsonObject &object, const QString &key)
{
    const QJsonValue value = object.value(key);
    if (value.isUndefined() || value.isNull()) {
        return std::nullopt;
    }
    if (!value.isString()) {
        throw core::SchemaError(QStringLiteral("Task field '%1' must be a string").arg(key));
    }
    return value.toString();
}
} // namespace

JsonTaskFile::JsonTaskFile(QString filePath)
    : m_filePath(std::move(filePath))
{
}

const QString &JsonTaskFile::filePath() const
{
    return m_filePath;
}

std::vector<TaskRecord> JsonTaskFile::read() const
{
    QFile file(m_filePath);
    if (!file.exists()) {
        throw core::NotFoundError(QStringLiteral("No such file or directory: '%1'").arg(m_filePath));
    }
    if (!file.open(QIODevice::ReadOnly)) {
        throw core::IoError(QStringLiteral("Cannot open %1: %2").arg(m_filePath, file.errorString()));
    }
    const QByteArray content = file.readAll();

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(content, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        throw core::ParseError(QStringLiteral("Invalid JSON in %1 at offset %2: %3")
                                   .arg(m_filePath, QString::number(parseError.offset), parseError.errorString()));
    }
    if (!document.isObject()) {
        throw core::SchemaError(QStringLiteral("Invalid task file: %1. Expected a JSON object.").arg(m_filePath));
    }

    const QJsonObject root = document.object();
    if (!root.contains(TasksKey)) {
        throw core::SchemaError(QStringLiteral("Invalid task file: %1. Missing 'tasks' key.").arg(m_filePath));
    }
    const QJsonValue tasksValue = root.value(TasksKey);
    if (!tasksValue.isArray()) {
        throw core::SchemaError(QStringLiteral("Invalid task file: %1. 'tasks' must be an array.").arg(m_filePath));
    }

    const QJsonArray tasks = tasksValue.toArray();
    std::vector<TaskRecord> records;
    records.reserve(static_cast<size_t>(tasks.size()));
    for (const QJsonValue &value : tasks) {
        if (!value.isObject()) {
            throw core::SchemaError(QStringLiteral("Invalid task file: %1. Task entries must be objects.").arg(m_filePath));
        }
        records.push_back(recordFromJson(value.toObject()));
    }
    qCDebug(lcTaskStorage) << "Read" << records.size() << "task records from" << m_filePath;
    return records;
}

bool JsonTaskFile::write(const std::vector<TaskRecord> &records) const
{
    if (m_filePath.isEmpty()) {
        qCWarning(lcTaskStorage) << "Cannot save tasks: empty file path";
        return false;
    }

    const QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        qCWarning(lcTaskStorage) << "Error saving tasks to" << m_filePath << ": cannot create" << dir.path();
        return false;
    }

    QJsonArray tasks;
    for (const TaskRecord &record : records) {
        tasks.append(recordToJson(record));
    }
    QJsonObject root;
    root.insert(TasksKey, tasks);

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qCWarning(lcTaskStorage) << "Error saving tasks to" << m_filePath << ":" << file.errorString();
        return false;
    }
    const QByteArray payload = QJsonDocument(root).toJson(QJsonDocument::Indented);
    if (file.write(payload) != payload.size() || !file.commit()) {
        qCWarning(lcTaskStorage) << "Error saving tasks to" << m_filePath << ":" << file.errorString();
        return false;
    }
    qCDebug(lcTaskStorage) << "Saved" << records.size() << "tasks to" << m_filePath;
    return true;
}

QJsonObject JsonTaskFile::recordToJson(const TaskRecord &record)
{
    QJsonObject object;
    object.insert(IdKey, record.taskId);
    object.insert(TitleKey, record.title);
    object.insert(DescriptionKey, record.description);
    object.insert(DueDateKey, record.dueDate.has_value() ? QJsonValue(*record.dueDate) : QJsonValue(QJsonValue::Null));
    object.insert(PriorityKey, record.priority);
    object.insert(CategoryKey, record.category);
    object.insert(CreatedAtKey, record.createdAt);
    object.insert(StatusKey, record.status);
    return object;
}

TaskRecord JsonTaskFile::recordFromJson(const QJsonObject &object)
{
    const auto title = stringField(object, TitleKey);
    if (!title.has_value()) {
        throw core::SchemaError(QStringLiteral("Task record is missing 'title'"));
    }

    TaskRecord record;
    record.title = *title;
    record.taskId = stringField(object, IdKey).value_or(QString());
    record.description = stringField(object, DescriptionKey).value_or(QString());
    record.dueDate = stringField(object, DueDateKey);
    record.priority = stringField(object, PriorityKey).value_or(QStringLiteral("medium"));
    record.category = stringField(object, CategoryKey).value_or(QString());
    record.createdAt = stringField(object, CreatedAtKey).value_or(QString());
    record.status = stringField(object, StatusKey).value_or(QStringLiteral("pending"));
    return record;
}

} // namespace data
} // namespace taskbook
