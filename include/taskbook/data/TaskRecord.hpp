#pragma once

#include <QString>

#include <optional>

namespace taskbook {
namespace data {

// Flat, string-typed view of a task as it appears in JSON and CSV files.
struct TaskRecord
{
    QString taskId;
    QString title;
    QString description;
    std::optional<QString> dueDate;
    QString priority = QStringLiteral("medium");
    QString category;
    QString createdAt;
    QString status = QStringLiteral("pending");
};

inline bool operator==(const TaskRecord &lhs, const TaskRecord &rhs)
{
    return lhs.taskId == rhs.taskId && lhs.title == rhs.title && lhs.description == rhs.description
        && lhs.dueDate == rhs.dueDate && lhs.priority == rhs.priority && lhs.category == rhs.category
        && lhs.createdAt == rhs.createdAt && lhs.status == rhs.status;
}

inline bool operator!=(const TaskRecord &lhs, const TaskRecord &rhs)
{
    return !(lhs == rhs);
}

} // namespace data
} // namespace taskbook
