#include "taskbook/data/TaskManager.hpp"

#include "taskbook/core/Errors.hpp"
#include "taskbook/core/Logging.hpp"
#include "taskbook/core/TaskUtils.hpp"
#include "taskbook/data/CsvTaskFile.hpp"
#include "taskbook/data/JsonTaskFile.hpp"

#include <QSet>

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace taskbook {
namespace data {

namespace {
QDate requireDate(const QString &date)
{
    if (!core::validateDateFormat(date)) {
        throw core::ValidationError(QStringLiteral("Invalid date format: %1. Expected: YYYY-MM-DD").arg(date));
    }
    return core::convertToDate(date).value_or(QDate());
}

bool lessByKey(SortKey key, const Task &lhs, const Task &rhs)
{
    switch (key) {
    case SortKey::DueDate:
        // Tasks without a due date sort after every dated task.
        if (!lhs.hasDueDate()) {
            return false;
        }
        if (!rhs.hasDueDate()) {
            return true;
        }
        return lhs.dueDate() < rhs.dueDate();
    case SortKey::Priority:
        return static_cast<int>(lhs.priority()) < static_cast<int>(rhs.priority());
    case SortKey::Title:
        return lhs.title().toLower() < rhs.title().toLower();
    case SortKey::CreatedAt:
        return lhs.createdAt() < rhs.createdAt();
    case SortKey::Category:
        return lhs.category().toLower() < rhs.category().toLower();
    }
    return false;
}
} // namespace

SortKey sortKeyFromString(const QString &key)
{
    if (key == QLatin1String("due_date")) {
        return SortKey::DueDate;
    }
    if (key == QLatin1String("priority")) {
        return SortKey::Priority;
    }
    if (key == QLatin1String("title")) {
        return SortKey::Title;
    }
    if (key == QLatin1String("created_at")) {
        return SortKey::CreatedAt;
    }
    if (key == QLatin1String("category")) {
        return SortKey::Category;
    }
    throw core::ValidationError(
        QStringLiteral("Invalid sort key: %1. Must be one of: due_date, priority, title, created_at, category").arg(key));
}

TaskManager::TaskManager() = default;

TaskManager::TaskManager(const QString &filePath)
{
    if (filePath.isEmpty()) {
        return;
    }
    try {
        loadFromFile(filePath);
    } catch (const core::ParseError &error) {
        qCWarning(lcTaskManager) << "Error loading tasks from" << filePath << ":" << error.message();
        qCWarning(lcTaskManager) << "Starting with an empty task list.";
    } catch (const core::SchemaError &error) {
        qCWarning(lcTaskManager) << "Error loading tasks from" << filePath << ":" << error.message();
        qCWarning(lcTaskManager) << "Starting with an empty task list.";
    }
}

TaskManager::~TaskManager() = default;

Task TaskManager::addTask(const QString &title,
                          const QString &description,
                          const QString &dueDate,
                          const QString &priority,
                          const QString &category)
{
    Task task(title, description, dueDate, priority, category);
    m_tasks.push_back(task);
    qCDebug(lcTaskManager) << "Added" << task;
    return task;
}

std::optional<Task> TaskManager::findById(const QString &id) const
{
    const auto it = findTask(id);
    if (it == m_tasks.end()) {
        return std::nullopt;
    }
    return *it;
}

std::optional<Task> TaskManager::updateTask(const QString &id, const TaskChanges &changes)
{
    const auto it = findTask(id);
    if (it == m_tasks.end()) {
        return std::nullopt;
    }

    Task updated = *it;
    if (changes.title) {
        updated.setTitle(*changes.title);
    }
    if (changes.description) {
        updated.setDescription(*changes.description);
    }
    if (changes.dueDate) {
        updated.setDueDate(*changes.dueDate);
    } else if (changes.clearDueDate) {
        updated.setDueDate(std::nullopt);
    }
    if (changes.priority) {
        updated.setPriority(*changes.priority);
    }
    if (changes.category) {
        updated.setCategory(*changes.category);
    }

    *it = updated;
    qCDebug(lcTaskManager) << "Updated" << updated;
    return updated;
}

bool TaskManager::removeTask(const QString &id)
{
    const auto it = findTask(id);
    if (it == m_tasks.end()) {
        return false;
    }
    qCDebug(lcTaskManager) << "Removed" << *it;
    m_tasks.erase(it);
    return true;
}

bool TaskManager::markCompleted(const QString &id)
{
    const auto it = findTask(id);
    if (it == m_tasks.end()) {
        return false;
    }
    it->markCompleted();
    return true;
}

bool TaskManager::markPending(const QString &id)
{
    const auto it = findTask(id);
    if (it == m_tasks.end()) {
        return false;
    }
    it->markPending();
    return true;
}

bool TaskManager::markCancelled(const QString &id)
{
    const auto it = findTask(id);
    if (it == m_tasks.end()) {
        return false;
    }
    it->markCancelled();
    return true;
}

std::vector<Task> TaskManager::allTasks() const
{
    return m_tasks;
}

std::vector<Task> TaskManager::tasksByStatus(TaskStatus status) const
{
    return filter([status](const Task &task) { return task.status() == status; });
}

std::vector<Task> TaskManager::tasksByStatus(const QString &status) const
{
    const auto parsed = statusFromString(status);
    if (!parsed) {
        throw core::ValidationError(
            QStringLiteral("Invalid status: %1. Must be one of: pending, completed, cancelled").arg(status));
    }
    return tasksByStatus(*parsed);
}

std::vector<Task> TaskManager::completedTasks() const
{
    return tasksByStatus(TaskStatus::Completed);
}

std::vector<Task> TaskManager::pendingTasks() const
{
    return tasksByStatus(TaskStatus::Pending);
}

std::vector<Task> TaskManager::cancelledTasks() const
{
    return tasksByStatus(TaskStatus::Cancelled);
}

std::vector<Task> TaskManager::tasksByPriority(TaskPriority priority) const
{
    return filter([priority](const Task &task) { return task.priority() == priority; });
}

std::vector<Task> TaskManager::tasksByPriority(const QString &priority) const
{
    return tasksByPriority(priorityFromString(priority));
}

std::vector<Task> TaskManager::tasksByCategory(const QString &category) const
{
    const QString wanted = category.toLower();
    return filter([&wanted](const Task &task) { return task.category().toLower() == wanted; });
}

std::vector<Task> TaskManager::tasksDueOn(const QString &date) const
{
    const QDate target = requireDate(date);
    return filter([&target](const Task &task) { return task.hasDueDate() && task.dueDate() == target; });
}

std::vector<Task> TaskManager::tasksDueBefore(const QString &date) const
{
    const QDate target = requireDate(date);
    return filter([&target](const Task &task) { return task.hasDueDate() && task.dueDate() < target; });
}

std::vector<Task> TaskManager::tasksDueAfter(const QString &date) const
{
    const QDate target = requireDate(date);
    return filter([&target](const Task &task) { return task.hasDueDate() && task.dueDate() > target; });
}

std::vector<Task> TaskManager::overdueTasks(const QDate &today) const
{
    return filter([&today](const Task &task) { return task.isOverdue(today); });
}

std::vector<Task> TaskManager::search(const QString &query) const
{
    const QString needle = query.toLower();
    return filter([&needle](const Task &task) {
        return task.title().toLower().contains(needle) || task.description().toLower().contains(needle);
    });
}

std::vector<Task> TaskManager::filter(const TaskPredicate &predicate) const
{
    std::vector<Task> result;
    std::copy_if(m_tasks.begin(), m_tasks.end(), std::back_inserter(result), predicate);
    return result;
}

std::vector<Task> TaskManager::sorted(SortKey key, bool reverse) const
{
    std::vector<Task> result = m_tasks;
    std::stable_sort(result.begin(), result.end(), [key, reverse](const Task &lhs, const Task &rhs) {
        return reverse ? lessByKey(key, rhs, lhs) : lessByKey(key, lhs, rhs);
    });
    return result;
}

std::vector<Task> TaskManager::sorted(const QString &key, bool reverse) const
{
    return sorted(sortKeyFromString(key), reverse);
}

TaskStats TaskManager::stats(const QDate &today) const
{
    TaskStats stats;
    stats.priorities.insert(TaskPriority::Low, 0);
    stats.priorities.insert(TaskPriority::Medium, 0);
    stats.priorities.insert(TaskPriority::High, 0);

    stats.total = size();
    for (const Task &task : m_tasks) {
        switch (task.status()) {
        case TaskStatus::Completed:
            ++stats.completed;
            break;
        case TaskStatus::Pending:
            ++stats.pending;
            break;
        case TaskStatus::Cancelled:
            ++stats.cancelled;
            break;
        }
        if (task.isOverdue(today)) {
            ++stats.overdue;
        }
        const QString category = task.category().isEmpty() ? QStringLiteral("Uncategorized") : task.category();
        ++stats.categories[category];
        ++stats.priorities[task.priority()];
    }
    stats.completionRate = core::completionRate(stats.completed, stats.total);
    return stats;
}

bool TaskManager::saveToFile(const QString &filePath) const
{
    std::vector<TaskRecord> records;
    records.reserve(m_tasks.size());
    for (const Task &task : m_tasks) {
        records.push_back(task.toRecord());
    }
    return JsonTaskFile(filePath).write(records);
}

void TaskManager::loadFromFile(const QString &filePath)
{
    const auto records = JsonTaskFile(filePath).read();

    std::vector<Task> loaded;
    loaded.reserve(records.size());
    for (const TaskRecord &record : records) {
        loaded.push_back(Task::fromRecord(record));
    }
    m_tasks = std::move(loaded);
    qCInfo(lcTaskManager) << "Loaded" << m_tasks.size() << "tasks from" << filePath;
}

bool TaskManager::exportToCsv(const QString &filePath) const
{
    std::vector<TaskRecord> records;
    records.reserve(m_tasks.size());
    for (const Task &task : m_tasks) {
        records.push_back(task.toRecord());
    }
    return CsvTaskFile(filePath).write(records);
}

bool TaskManager::importFromCsv(const QString &filePath)
{
    const auto rows = CsvTaskFile(filePath).readRows();
    if (!rows) {
        return false;
    }

    m_tasks.clear();
    for (const CsvRow &row : *rows) {
        if (!row.contains(QStringLiteral("title"))) {
            qCWarning(lcTaskStorage) << "Skipping row missing title:" << row;
            continue;
        }
        try {
            m_tasks.push_back(Task::fromRecord(CsvTaskFile::recordFromRow(row)));
        } catch (const core::ValidationError &error) {
            qCWarning(lcTaskStorage) << "Skipping row due to error:" << error.message();
        }
    }
    qCInfo(lcTaskManager) << "Imported" << m_tasks.size() << "tasks from" << filePath;
    return true;
}

int TaskManager::mergeFromFile(const QString &filePath)
{
    const auto records = JsonTaskFile(filePath).read();

    QSet<QString> knownIds;
    for (const Task &task : m_tasks) {
        knownIds.insert(task.id());
    }

    std::vector<Task> added;
    for (const TaskRecord &record : records) {
        if (!record.taskId.isEmpty() && knownIds.contains(record.taskId)) {
            continue;
        }
        Task task = Task::fromRecord(record);
        knownIds.insert(task.id());
        added.push_back(std::move(task));
    }

    std::move(added.begin(), added.end(), std::back_inserter(m_tasks));
    qCInfo(lcTaskManager) << "Merged" << added.size() << "tasks from" << filePath;
    return static_cast<int>(added.size());
}

int TaskManager::size() const
{
    return static_cast<int>(m_tasks.size());
}

bool TaskManager::isEmpty() const
{
    return m_tasks.empty();
}

const Task &TaskManager::at(int index) const
{
    if (index < 0 || index >= size()) {
        throw std::out_of_range("Task index out of range");
    }
    return m_tasks[static_cast<size_t>(index)];
}

TaskManager::const_iterator TaskManager::begin() const
{
    return m_tasks.begin();
}

TaskManager::const_iterator TaskManager::end() const
{
    return m_tasks.end();
}

std::vector<Task>::iterator TaskManager::findTask(const QString &id)
{
    return std::find_if(m_tasks.begin(), m_tasks.end(), [&id](const Task &task) { return task.id() == id; });
}

std::vector<Task>::const_iterator TaskManager::findTask(const QString &id) const
{
    return std::find_if(m_tasks.begin(), m_tasks.end(), [&id](const Task &task) { return task.id() == id; });
}

} // namespace data
} // namespace taskbook
