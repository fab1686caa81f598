#include "taskbook/core/TaskUtils.hpp"

#include "taskbook/core/Errors.hpp"

#include <QRegularExpression>
#include <QStringList>

#include <cmath>

namespace taskbook {
namespace core {

namespace {
constexpr auto DATE_FORMAT = "yyyy-MM-dd";
constexpr int ShortIdLength = 8;

const QRegularExpression &datePattern()
{
    static const QRegularExpression pattern(QStringLiteral("^\\d{4}-\\d{2}-\\d{2}$"));
    return pattern;
}

QDate parseStrictDate(const QString &value)
{
    if (!datePattern().match(value).hasMatch()) {
        return QDate();
    }
    return QDate::fromString(value, QLatin1String(DATE_FORMAT));
}

QString statusMarker(const QString &status)
{
    if (status == QLatin1String("completed")) {
        return QStringLiteral("✓");
    }
    if (status == QLatin1String("cancelled")) {
        return QStringLiteral("✗");
    }
    return QStringLiteral("□");
}

QString priorityMarker(const QString &priority)
{
    if (priority == QLatin1String("low")) {
        return QStringLiteral("⭘");
    }
    if (priority == QLatin1String("high")) {
        return QStringLiteral("‼️");
    }
    return QStringLiteral("⬤");
}
} // namespace

bool validateDateFormat(const std::optional<QString> &date)
{
    if (!date.has_value()) {
        return true;
    }
    return parseStrictDate(*date).isValid();
}

std::optional<QDate> convertToDate(const std::optional<QString> &date)
{
    if (!date.has_value()) {
        return std::nullopt;
    }
    const QString datePart = date->section(QLatin1Char('T'), 0, 0);
    const QDate parsed = parseStrictDate(datePart);
    if (!parsed.isValid()) {
        throw ValidationError(QStringLiteral("Invalid date format: %1. Expected format: YYYY-MM-DD").arg(*date));
    }
    return parsed;
}

bool validatePriority(const QString &priority)
{
    if (priority.isEmpty()) {
        return true;
    }
    static const QStringList valid = {
        QStringLiteral("low"), QStringLiteral("l"),
        QStringLiteral("medium"), QStringLiteral("med"), QStringLiteral("m"),
        QStringLiteral("high"), QStringLiteral("h"),
    };
    return valid.contains(priority.trimmed().toLower());
}

QString normalizePriority(const QString &priority)
{
    if (priority.isEmpty()) {
        return QStringLiteral("medium");
    }
    const QString lowered = priority.trimmed().toLower();
    if (lowered == QLatin1String("low") || lowered == QLatin1String("l")) {
        return QStringLiteral("low");
    }
    if (lowered == QLatin1String("medium") || lowered == QLatin1String("med") || lowered == QLatin1String("m")) {
        return QStringLiteral("medium");
    }
    if (lowered == QLatin1String("high") || lowered == QLatin1String("h")) {
        return QStringLiteral("high");
    }
    throw ValidationError(QStringLiteral("Invalid priority: %1. Must be one of: low, medium, high").arg(priority));
}

bool isTaskOverdue(const std::optional<QString> &dueDate, bool completed, const QDate &today)
{
    if (!dueDate.has_value() || dueDate->isEmpty() || completed) {
        return false;
    }
    try {
        const auto date = convertToDate(dueDate);
        return date.has_value() && *date < today;
    } catch (const ValidationError &) {
        // An unparseable date cannot be judged overdue.
        return false;
    }
}

double completionRate(int completed, int total)
{
    if (total <= 0) {
        return 0.0;
    }
    const double percent = static_cast<double>(completed) / static_cast<double>(total) * 100.0;
    // Ties go to the even digit.
    return std::nearbyint(percent * 10.0) / 10.0;
}

QString formatTaskDisplay(const data::TaskRecord &task, bool showId, bool showDescription)
{
    const QString status = task.status.toLower();
    const QString title = task.title.isEmpty() ? QStringLiteral("Untitled") : task.title;

    QString line = QStringLiteral("[%1] %2 %3").arg(statusMarker(status), priorityMarker(task.priority.toLower()), title);

    if (task.dueDate.has_value() && !task.dueDate->isEmpty()) {
        const bool overdue = isTaskOverdue(task.dueDate, status == QLatin1String("completed"));
        const QString label = overdue ? QStringLiteral("OVERDUE") : QStringLiteral("Due");
        line += QStringLiteral(" (%1: %2)").arg(label, *task.dueDate);
    }
    if (!task.category.isEmpty()) {
        line += QStringLiteral(" #%1").arg(task.category);
    }
    if (showId && !task.taskId.isEmpty()) {
        line += QStringLiteral(" [ID: %1]").arg(task.taskId.left(ShortIdLength));
    }
    if (showDescription && !task.description.isEmpty()) {
        line += QStringLiteral("\n    %1").arg(task.description);
    }
    return line;
}

QString formatTaskList(const std::vector<data::TaskRecord> &tasks, bool showIds, bool showDescription)
{
    if (tasks.empty()) {
        return QStringLiteral("No tasks found.");
    }
    QStringList lines;
    lines.reserve(static_cast<int>(tasks.size()));
    for (const auto &task : tasks) {
        lines << formatTaskDisplay(task, showIds, showDescription);
    }
    return lines.join(QLatin1Char('\n'));
}

TaskReport generateTaskReport(const std::vector<data::TaskRecord> &tasks, ReportFilter filter)
{
    TaskReport report;
    report.total = static_cast<int>(tasks.size());

    std::vector<data::TaskRecord> completed;
    std::vector<data::TaskRecord> pending;
    std::vector<data::TaskRecord> overdue;
    for (const auto &task : tasks) {
        if (task.status == QLatin1String("completed")) {
            completed.push_back(task);
        } else if (task.status == QLatin1String("pending")) {
            pending.push_back(task);
        }
        if (isTaskOverdue(task.dueDate, task.status == QLatin1String("completed"))) {
            overdue.push_back(task);
        }
    }

    report.completed = static_cast<int>(completed.size());
    report.pending = static_cast<int>(pending.size());
    report.overdue = static_cast<int>(overdue.size());
    report.completionRate = completionRate(report.completed, report.total);

    switch (filter) {
    case ReportFilter::CompletedOnly:
        report.tasks = std::move(completed);
        break;
    case ReportFilter::PendingOnly:
        report.tasks = std::move(pending);
        break;
    case ReportFilter::OverdueOnly:
        report.tasks = std::move(overdue);
        break;
    case ReportFilter::All:
        report.tasks = tasks;
        break;
    }
    return report;
}

} // namespace core
} // namespace taskbook
