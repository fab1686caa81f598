#pragma once

#include <QDate>
#include <QString>

#include <optional>

#include "taskbook/data/TaskRecord.hpp"

class QDebug;

namespace taskbook {
namespace data {

enum class TaskPriority
{
    Low,
    Medium,
    High,
};

enum class TaskStatus
{
    Pending,
    Completed,
    Cancelled,
};

// Accepts low/l, medium/med/m, high/h in any case; empty means Medium.
// Throws core::ValidationError for anything else.
TaskPriority priorityFromString(const QString &value);
QString priorityToString(TaskPriority priority);

// Returns std::nullopt for unknown names instead of throwing.
std::optional<TaskStatus> statusFromString(const QString &value);
QString statusToString(TaskStatus status);

class Task
{
public:
    explicit Task(const QString &title,
                  const QString &description = QString(),
                  const QString &dueDate = QString(),
                  const QString &priority = QString(),
                  const QString &category = QString(),
                  const QString &id = QString(),
                  const QString &createdAt = QString(),
                  TaskStatus status = TaskStatus::Pending);

    const QString &id() const;
    const QString &createdAt() const;

    const QString &title() const;
    void setTitle(const QString &title);

    const QString &description() const;
    void setDescription(const QString &description);

    bool hasDueDate() const;
    QDate dueDate() const;
    std::optional<QString> dueDateString() const;
    // std::nullopt clears the due date, an empty string is rejected.
    void setDueDate(const std::optional<QString> &dueDate);

    TaskPriority priority() const;
    void setPriority(TaskPriority priority);
    void setPriority(const QString &priority);

    const QString &category() const;
    void setCategory(const QString &category);

    TaskStatus status() const;
    void setStatus(TaskStatus status);
    void markCompleted();
    void markPending();
    void markCancelled();

    bool isCompleted() const;
    bool isOverdue(const QDate &today = QDate::currentDate()) const;

    TaskRecord toRecord() const;
    static Task fromRecord(const TaskRecord &record);

    QString toJson() const;
    static Task fromJson(const QString &json);

    QString displayText() const;

private:
    QString m_id;
    QString m_title;
    QString m_description;
    QDate m_dueDate;
    TaskPriority m_priority = TaskPriority::Medium;
    QString m_category;
    QString m_createdAt;
    TaskStatus m_status = TaskStatus::Pending;
};

bool operator==(const Task &lhs, const Task &rhs);
bool operator!=(const Task &lhs, const Task &rhs);

QDebug operator<<(QDebug debug, const Task &task);

} // namespace data
} // namespace taskbook
