#pragma once

#include <QDate>
#include <QMap>
#include <QString>

#include <functional>
#include <optional>
#include <vector>

#include "taskbook/data/Task.hpp"

namespace taskbook {
namespace data {

// Fields left as std::nullopt are not touched by TaskManager::updateTask.
struct TaskChanges
{
    std::optional<QString> title;
    std::optional<QString> description;
    std::optional<QString> dueDate;
    std::optional<QString> priority;
    std::optional<QString> category;
    // Removes the due date. Ignored when dueDate is set.
    bool clearDueDate = false;

    bool isEmpty() const
    {
        return !title && !description && !dueDate && !priority && !category && !clearDueDate;
    }
};

struct TaskStats
{
    int total = 0;
    int completed = 0;
    int pending = 0;
    int cancelled = 0;
    int overdue = 0;
    double completionRate = 0.0;
    QMap<QString, int> categories;
    QMap<TaskPriority, int> priorities;
};

enum class SortKey
{
    DueDate,
    Priority,
    Title,
    CreatedAt,
    Category,
};

// Accepts due_date, priority, title, created_at and category.
// Throws core::ValidationError for any other key.
SortKey sortKeyFromString(const QString &key);

class TaskManager
{
public:
    using TaskPredicate = std::function<bool(const Task &)>;
    using const_iterator = std::vector<Task>::const_iterator;

    TaskManager();
    // Loads the JSON file at filePath. Malformed or mis-shaped content is logged
    // and leaves the manager empty; a missing file throws core::NotFoundError.
    explicit TaskManager(const QString &filePath);
    ~TaskManager();

    Task addTask(const QString &title,
                 const QString &description = QString(),
                 const QString &dueDate = QString(),
                 const QString &priority = QStringLiteral("medium"),
                 const QString &category = QString());
    std::optional<Task> findById(const QString &id) const;
    // All-or-nothing: an invalid field leaves the stored task untouched.
    std::optional<Task> updateTask(const QString &id, const TaskChanges &changes);
    bool removeTask(const QString &id);

    bool markCompleted(const QString &id);
    bool markPending(const QString &id);
    bool markCancelled(const QString &id);

    std::vector<Task> allTasks() const;
    std::vector<Task> tasksByStatus(TaskStatus status) const;
    std::vector<Task> tasksByStatus(const QString &status) const;
    std::vector<Task> completedTasks() const;
    std::vector<Task> pendingTasks() const;
    std::vector<Task> cancelledTasks() const;
    std::vector<Task> tasksByPriority(TaskPriority priority) const;
    std::vector<Task> tasksByPriority(const QString &priority) const;
    std::vector<Task> tasksByCategory(const QString &category) const;
    std::vector<Task> tasksDueOn(const QString &date) const;
    std::vector<Task> tasksDueBefore(const QString &date) const;
    std::vector<Task> tasksDueAfter(const QString &date) const;
    std::vector<Task> overdueTasks(const QDate &today = QDate::currentDate()) const;
    std::vector<Task> search(const QString &query) const;
    std::vector<Task> filter(const TaskPredicate &predicate) const;

    std::vector<Task> sorted(SortKey key, bool reverse = false) const;
    std::vector<Task> sorted(const QString &key, bool reverse = false) const;

    TaskStats stats(const QDate &today = QDate::currentDate()) const;

    bool saveToFile(const QString &filePath) const;
    void loadFromFile(const QString &filePath);
    bool exportToCsv(const QString &filePath) const;
    bool importFromCsv(const QString &filePath);
    int mergeFromFile(const QString &filePath);

    int size() const;
    bool isEmpty() const;
    // Throws std::out_of_range for an invalid index.
    const Task &at(int index) const;
    const_iterator begin() const;
    const_iterator end() const;

private:
    std::vector<Task>::iterator findTask(const QString &id);
    std::vector<Task>::const_iterator findTask(const QString &id) const;

    std::vector<Task> m_tasks;
};

} // namespace data
} // namespace taskbook
