#include "taskbook/data/Task.hpp"

#include "taskbook/core/Errors.hpp"
#include "taskbook/core/TaskUtils.hpp"
#include "taskbook/data/JsonTaskFile.hpp"

#include <QDateTime>
#include <QDebug>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QUuid>

namespace taskbook {
namespace data {

namespace {
constexpr auto DATE_FORMAT = "yyyy-MM-dd";

QString validatedTitle(const QString &title)
{
    const QString trimmed = title.trimmed();
    if (trimmed.isEmpty()) {
        throw core::ValidationError(QStringLiteral("Task title cannot be empty"));
    }
    return trimmed;
}

QDate parseDueDate(const QString &value)
{
    try {
        const auto date = core::convertToDate(value);
        return date.value_or(QDate());
    } catch (const core::ValidationError &) {
        throw core::ValidationError(QStringLiteral("Due date must be in ISO format (YYYY-MM-DD)"));
    }
}
} // namespace

TaskPriority priorityFromString(const QString &value)
{
    const QString normalized = core::normalizePriority(value);
    if (normalized == QLatin1String("low")) {
        return TaskPriority::Low;
    }
    if (normalized == QLatin1String("high")) {
        return TaskPriority::High;
    }
    return TaskPriority::Medium;
}

QString priorityToString(TaskPriority priority)
{
    switch (priority) {
    case TaskPriority::Low:
        return QStringLiteral("low");
    case TaskPriority::High:
        return QStringLiteral("high");
    case TaskPriority::Medium:
    default:
        return QStringLiteral("medium");
    }
}

std::optional<TaskStatus> statusFromString(const QString &value)
{
    const QString normalized = value.toLower();
    if (normalized == QLatin1String("pending")) {
        return TaskStatus::Pending;
    }
    if (normalized == QLatin1String("completed")) {
        return TaskStatus::Completed;
    }
    if (normalized == QLatin1String("cancelled")) {
        return TaskStatus::Cancelled;
    }
    return std::nullopt;
}

QString statusToString(TaskStatus status)
{
    switch (status) {
    case TaskStatus::Completed:
        return QStringLiteral("completed");
    case TaskStatus::Cancelled:
        return QStringLiteral("cancelled");
    case TaskStatus::Pending:
    default:
        return QStringLiteral("pending");
    }
}

Task::Task(const QString &title,
           const QString &description,
           const QString &dueDate,
           const QString &priority,
           const QString &category,
           const QString &id,
           const QString &createdAt,
           TaskStatus status)
    : m_id(id)
    , m_title(validatedTitle(title))
    , m_description(description)
    , m_priority(priorityFromString(priority))
    , m_category(category)
    , m_createdAt(createdAt)
    , m_status(status)
{
    if (m_id.isEmpty()) {
        m_id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    }
    if (m_createdAt.isEmpty()) {
        m_createdAt = QDateTime::currentDateTime().toString(Qt::ISODateWithMs);
    }
    if (!dueDate.isEmpty()) {
        m_dueDate = parseDueDate(dueDate);
    }
}

const QString &Task::id() const
{
    return m_id;
}

const QString &Task::createdAt() const
{
    return m_createdAt;
}

const QString &Task::title() const
{
    return m_title;
}

void Task::setTitle(const QString &title)
{
    m_title = validatedTitle(title);
}

const QString &Task::description() const
{
    return m_description;
}

void Task::setDescription(const QString &description)
{
    m_description = description;
}

bool Task::hasDueDate() const
{
    return m_dueDate.isValid();
}

QDate Task::dueDate() const
{
    return m_dueDate;
}

std::optional<QString> Task::dueDateString() const
{
    if (!m_dueDate.isValid()) {
        return std::nullopt;
    }
    return m_dueDate.toString(QLatin1String(DATE_FORMAT));
}

void Task::setDueDate(const std::optional<QString> &dueDate)
{
    if (!dueDate.has_value()) {
        m_dueDate = QDate();
        return;
    }
    m_dueDate = parseDueDate(*dueDate);
}

TaskPriority Task::priority() const
{
    return m_priority;
}

void Task::setPriority(TaskPriority priority)
{
    m_priority = priority;
}

void Task::setPriority(const QString &priority)
{
    m_priority = priorityFromString(priority);
}

const QString &Task::category() const
{
    return m_category;
}

void Task::setCategory(const QString &category)
{
    m_category = category;
}

TaskStatus Task::status() const
{
    return m_status;
}

void Task::setStatus(TaskStatus status)
{
    m_status = status;
}

void Task::markCompleted()
{
    m_status = TaskStatus::Completed;
}

void Task::markPending()
{
    m_status = TaskStatus::Pending;
}

void Task::markCancelled()
{
    m_status = TaskStatus::Cancelled;
}

bool Task::isCompleted() const
{
    return m_status == TaskStatus::Completed;
}

bool Task::isOverdue(const QDate &today) const
{
    if (!m_dueDate.isValid() || isCompleted()) {
        return false;
    }
    return m_dueDate < today;
}

TaskRecord Task::toRecord() const
{
    TaskRecord record;
    record.taskId = m_id;
    record.title = m_title;
    record.description = m_description;
    record.dueDate = dueDateString();
    record.priority = priorityToString(m_priority);
    record.category = m_category;
    record.createdAt = m_createdAt;
    record.status = statusToString(m_status);
    return record;
}

Task Task::fromRecord(const TaskRecord &record)
{
    // Unknown status text falls back to pending; unknown priority text throws.
    const TaskStatus status = statusFromString(record.status).value_or(TaskStatus::Pending);
    return Task(record.title,
                record.description,
                record.dueDate.value_or(QString()),
                record.priority,
                record.category,
                record.taskId,
                record.createdAt,
                status);
}

QString Task::toJson() const
{
    const QJsonDocument document(JsonTaskFile::recordToJson(toRecord()));
    return QString::fromUtf8(document.toJson(QJsonDocument::Compact));
}

Task Task::fromJson(const QString &json)
{
    QJsonParseError error;
    const QJsonDocument document = QJsonDocument::fromJson(json.toUtf8(), &error);
    if (error.error != QJsonParseError::NoError) {
        throw core::ParseError(QStringLiteral("Invalid task JSON at offset %1: %2")
                                   .arg(QString::number(error.offset), error.errorString()));
    }
    if (!document.isObject()) {
        throw core::SchemaError(QStringLiteral("Task JSON must be an object"));
    }
    return fromRecord(JsonTaskFile::recordFromJson(document.object()));
}

QString Task::displayText() const
{
    const QString statusMarker = isCompleted() ? QStringLiteral("✓") : QStringLiteral(" ");
    QString priorityMarker;
    switch (m_priority) {
    case TaskPriority::Low:
        priorityMarker = QStringLiteral("⭘");
        break;
    case TaskPriority::Medium:
        priorityMarker = QStringLiteral("⬤");
        break;
    case TaskPriority::High:
        priorityMarker = QStringLiteral("‼️");
        break;
    }

    QString text = QStringLiteral("[%1] %2 %3").arg(statusMarker, priorityMarker, m_title);
    if (hasDueDate()) {
        text += QStringLiteral(" (Due: %1)").arg(*dueDateString());
    }
    return text;
}

bool operator==(const Task &lhs, const Task &rhs)
{
    return lhs.toRecord() == rhs.toRecord();
}

bool operator!=(const Task &lhs, const Task &rhs)
{
    return !(lhs == rhs);
}

QDebug operator<<(QDebug debug, const Task &task)
{
    QDebugStateSaver saver(debug);
    debug.nospace() << "Task(id=" << task.id() << ", title=" << task.title()
                    << ", priority=" << priorityToString(task.priority()).toUpper()
                    << ", status=" << statusToString(task.status()).toUpper() << ')';
    return debug;
}

} // namespace data
} // namespace taskbook
