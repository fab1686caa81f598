#pragma once

#include <QDate>
#include <QString>

#include <optional>
#include <vector>

#include "taskbook/data/TaskRecord.hpp"

namespace taskbook {
namespace core {

// True for std::nullopt and for strict YYYY-MM-DD strings naming a real date.
bool validateDateFormat(const std::optional<QString> &date);

// Parses YYYY-MM-DD, ignoring an optional "T..." time suffix.
// Throws ValidationError when the text is not a valid date.
std::optional<QDate> convertToDate(const std::optional<QString> &date);

bool validatePriority(const QString &priority);

// Returns "low", "medium" or "high". Throws ValidationError otherwise.
QString normalizePriority(const QString &priority);

bool isTaskOverdue(const std::optional<QString> &dueDate,
                   bool completed = false,
                   const QDate &today = QDate::currentDate());

double completionRate(int completed, int total);

QString formatTaskDisplay(const data::TaskRecord &task, bool showId = false, bool showDescription = false);
QString formatTaskList(const std::vector<data::TaskRecord> &tasks,
                       bool showIds = false,
                       bool showDescription = false);

enum class ReportFilter
{
    All,
    CompletedOnly,
    PendingOnly,
    OverdueOnly,
};

struct TaskReport
{
    int total = 0;
    int completed = 0;
    int pending = 0;
    int overdue = 0;
    double completionRate = 0.0;
    std::vector<data::TaskRecord> tasks;
};

TaskReport generateTaskReport(const std::vector<data::TaskRecord> &tasks,
                              ReportFilter filter = ReportFilter::All);

} // namespace core
} // namespace taskbook
