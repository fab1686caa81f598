#include "taskbook/cli/CommandLine.hpp"

#include "version.h"

#include "taskbook/core/Errors.hpp"
#include "taskbook/core/Logging.hpp"
#include "taskbook/core/TaskUtils.hpp"
#include "taskbook/data/TaskManager.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QDate>
#include <QDir>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QSet>
#include <QTemporaryFile>
#include <QTextStream>

#include <algorithm>
#include <functional>
#include <iterator>
#include <map>

namespace taskbook {
namespace cli {

namespace {
constexpr auto NoneValue = "none";

std::vector<data::TaskRecord> toRecords(const std::vector<data::Task> &tasks)
{
    std::vector<data::TaskRecord> records;
    records.reserve(tasks.size());
    for (const auto &task : tasks) {
        records.push_back(task.toRecord());
    }
    return records;
}

// Keeps the entries of tasks whose id also appears in subset, in tasks order.
std::vector<data::Task> intersect(const std::vector<data::Task> &tasks, const std::vector<data::Task> &subset)
{
    QSet<QString> ids;
    for (const auto &task : subset) {
        ids.insert(task.id());
    }
    std::vector<data::Task> result;
    std::copy_if(tasks.begin(), tasks.end(), std::back_inserter(result),
                 [&ids](const data::Task &task) { return ids.contains(task.id()); });
    return result;
}

QString capitalized(const QString &value)
{
    if (value.isEmpty()) {
        return value;
    }
    return value.left(1).toUpper() + value.mid(1);
}

QString display(const data::Task &task)
{
    return core::formatTaskDisplay(task.toRecord());
}
} // namespace

CommandLine::CommandLine(QTextStream &out, QTextStream &err, QTextStream &in)
    : m_out(out)
    , m_err(err)
    , m_in(in)
{
}

int CommandLine::run(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Personal task tracking from the command line."));
    parser.setOptionsAfterPositionalArgumentsMode(QCommandLineParser::ParseAsPositionalArguments);

    const QCommandLineOption fileOption({QStringLiteral("f"), QStringLiteral("file")},
                                        QStringLiteral("Path to the task file (JSON)."),
                                        QStringLiteral("path"));
    const QCommandLineOption verboseOption(QStringLiteral("verbose"), QStringLiteral("Enable debug logging."));
    const QCommandLineOption versionOption(QStringLiteral("version"), QStringLiteral("Show version information."));
    parser.addOption(fileOption);
    parser.addOption(verboseOption);
    parser.addOption(versionOption);
    parser.addHelpOption();
    parser.addPositionalArgument(
        QStringLiteral("command"),
        QStringLiteral("add, list, update, complete, pending, cancel, delete, show, export, import, merge, stats, config"),
        QStringLiteral("<command> [<args>]"));

    if (!parser.parse(arguments)) {
        return printError(parser.errorText());
    }
    if (parser.isSet(QStringLiteral("help"))) {
        m_out << parser.helpText();
        m_out.flush();
        return 0;
    }
    if (parser.isSet(versionOption)) {
        m_out << "taskbook " << kTaskbookVersion << '\n';
        m_out.flush();
        return 0;
    }
    if (parser.isSet(verboseOption)) {
        QLoggingCategory::setFilterRules(QStringLiteral("taskbook.*.debug=true"));
    }
    if (parser.isSet(fileOption)) {
        m_config.setTaskFileOverride(parser.value(fileOption));
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        printError(QStringLiteral("No command given."));
        m_err << parser.helpText();
        m_err.flush();
        return 1;
    }

    const QString command = positional.first();
    const QString program = arguments.isEmpty() ? QStringLiteral("taskbook") : arguments.first();
    const QStringList commandArgs = QStringList{program + QLatin1Char(' ') + command} + positional.mid(1);

    using Handler = std::function<int(CommandLine *, const QStringList &)>;
    static const std::map<QString, Handler> handlers = {
        {QStringLiteral("add"), &CommandLine::runAdd},
        {QStringLiteral("list"), &CommandLine::runList},
        {QStringLiteral("update"), &CommandLine::runUpdate},
        {QStringLiteral("complete"), &CommandLine::runComplete},
        {QStringLiteral("pending"), &CommandLine::runPending},
        {QStringLiteral("cancel"), &CommandLine::runCancel},
        {QStringLiteral("delete"), &CommandLine::runDelete},
        {QStringLiteral("show"), &CommandLine::runShow},
        {QStringLiteral("export"), &CommandLine::runExport},
        {QStringLiteral("import"), &CommandLine::runImport},
        {QStringLiteral("merge"), &CommandLine::runMerge},
        {QStringLiteral("stats"), &CommandLine::runStats},
        {QStringLiteral("config"), &CommandLine::runConfig},
    };

    const auto handler = handlers.find(command);
    if (handler == handlers.end()) {
        return printError(QStringLiteral("Unknown command: %1").arg(command));
    }

    qCDebug(lcTaskCli) << "Running" << command << "against" << m_config.taskFile();
    try {
        return handler->second(this, commandArgs);
    } catch (const core::TaskbookError &error) {
        return printError(error.message());
    }
}

int CommandLine::runAdd(const QStringList &args)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Add a new task."));
    parser.addPositionalArgument(QStringLiteral("title"), QStringLiteral("Task title."));
    const QCommandLineOption descriptionOption({QStringLiteral("d"), QStringLiteral("description")},
                                               QStringLiteral("Task description."), QStringLiteral("text"));
    const QCommandLineOption dueOption({QStringLiteral("due"), QStringLiteral("due-date")},
                                       QStringLiteral("Due date (YYYY-MM-DD)."), QStringLiteral("date"));
    const QCommandLineOption priorityOption({QStringLiteral("p"), QStringLiteral("priority")},
                                            QStringLiteral("Priority (high, medium, low)."), QStringLiteral("priority"),
                                            QStringLiteral("medium"));
    const QCommandLineOption categoryOption({QStringLiteral("c"), QStringLiteral("category")},
                                            QStringLiteral("Task category or tag."), QStringLiteral("category"));
    parser.addOptions({descriptionOption, dueOption, priorityOption, categoryOption});
    if (const auto exitCode = parseCommand(parser, args, 1)) {
        return *exitCode;
    }

    const QString dueDate = parser.value(dueOption);
    if (!dueDate.isEmpty() && !core::validateDateFormat(dueDate)) {
        return printError(QStringLiteral("Invalid due date format: %1\nDue date should be in the format YYYY-MM-DD")
                              .arg(dueDate));
    }
    const QString priority = parser.value(priorityOption);
    if (!core::validatePriority(priority)) {
        return printError(QStringLiteral("Invalid priority: %1. Must be one of: low, medium, high").arg(priority));
    }

    data::TaskManager manager = loadManager();
    const data::Task task = manager.addTask(parser.positionalArguments().first(),
                                            parser.value(descriptionOption),
                                            dueDate,
                                            priority,
                                            parser.value(categoryOption));
    if (!save(manager)) {
        return 1;
    }
    m_out << "Task added: " << display(task) << '\n';
    m_out << "Task ID: " << task.id() << '\n';
    m_out.flush();
    return 0;
}

int CommandLine::runList(const QStringList &args)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("List tasks."));
    const QCommandLineOption allOption({QStringLiteral("a"), QStringLiteral("all")},
                                       QStringLiteral("Show all tasks (including completed)."));
    const QCommandLineOption completedOption(QStringLiteral("completed"), QStringLiteral("Show only completed tasks."));
    const QCommandLineOption pendingOption(QStringLiteral("pending"), QStringLiteral("Show only pending tasks."));
    const QCommandLineOption cancelledOption(QStringLiteral("cancelled"), QStringLiteral("Show only cancelled tasks."));
    const QCommandLineOption priorityOption({QStringLiteral("p"), QStringLiteral("priority")},
                                            QStringLiteral("Filter by priority."), QStringLiteral("priority"));
    const QCommandLineOption categoryOption({QStringLiteral("c"), QStringLiteral("category")},
                                            QStringLiteral("Filter by category."), QStringLiteral("category"));
    const QCommandLineOption dueTodayOption(QStringLiteral("due-today"), QStringLiteral("Show tasks due today."));
    const QCommandLineOption dueBeforeOption(QStringLiteral("due-before"),
                                             QStringLiteral("Show tasks due before a date (YYYY-MM-DD)."),
                                             QStringLiteral("date"));
    const QCommandLineOption dueAfterOption(QStringLiteral("due-after"),
                                            QStringLiteral("Show tasks due after a date (YYYY-MM-DD)."),
                                            QStringLiteral("date"));
    const QCommandLineOption overdueOption(QStringLiteral("overdue"), QStringLiteral("Show overdue tasks."));
    const QCommandLineOption searchOption({QStringLiteral("s"), QStringLiteral("search")},
                                          QStringLiteral("Search in task title and description."),
                                          QStringLiteral("query"));
    const QCommandLineOption sortOption(QStringLiteral("sort-by"),
                                        QStringLiteral("Sort by due_date, priority, title, created_at or category."),
                                        QStringLiteral("key"), QStringLiteral("due_date"));
    const QCommandLineOption reverseOption(QStringLiteral("reverse"), QStringLiteral("Reverse the sort order."));
    const QCommandLineOption showIdOption(QStringLiteral("show-id"), QStringLiteral("Show task IDs."));
    const QCommandLineOption showDescriptionOption(QStringLiteral("show-description"),
                                                   QStringLiteral("Show task descriptions."));
    parser.addOptions({allOption, completedOption, pendingOption, cancelledOption, priorityOption, categoryOption,
                       dueTodayOption, dueBeforeOption, dueAfterOption, overdueOption, searchOption, sortOption,
                       reverseOption, showIdOption, showDescriptionOption});
    if (const auto exitCode = parseCommand(parser, args, 0)) {
        return *exitCode;
    }

    for (const auto &option : {dueBeforeOption, dueAfterOption}) {
        if (parser.isSet(option) && !core::validateDateFormat(parser.value(option))) {
            return printError(QStringLiteral("Invalid date format: %1").arg(parser.value(option)));
        }
    }

    const data::TaskManager manager = loadManager();

    std::vector<data::Task> tasks;
    if (parser.isSet(completedOption)) {
        tasks = manager.completedTasks();
    } else if (parser.isSet(pendingOption)) {
        tasks = manager.pendingTasks();
    } else if (parser.isSet(cancelledOption)) {
        tasks = manager.cancelledTasks();
    } else if (parser.isSet(allOption)) {
        tasks = manager.allTasks();
    } else {
        tasks = manager.pendingTasks();
    }

    if (parser.isSet(priorityOption)) {
        tasks = intersect(tasks, manager.tasksByPriority(parser.value(priorityOption)));
    }
    if (parser.isSet(categoryOption)) {
        tasks = intersect(tasks, manager.tasksByCategory(parser.value(categoryOption)));
    }
    if (parser.isSet(dueTodayOption)) {
        tasks = intersect(tasks, manager.tasksDueOn(QDate::currentDate().toString(Qt::ISODate)));
    }
    if (parser.isSet(dueBeforeOption)) {
        tasks = intersect(tasks, manager.tasksDueBefore(parser.value(dueBeforeOption)));
    }
    if (parser.isSet(dueAfterOption)) {
        tasks = intersect(tasks, manager.tasksDueAfter(parser.value(dueAfterOption)));
    }
    if (parser.isSet(overdueOption)) {
        tasks = intersect(tasks, manager.overdueTasks());
    }
    if (parser.isSet(searchOption)) {
        tasks = intersect(tasks, manager.search(parser.value(searchOption)));
    }

    const auto ordered = intersect(manager.sorted(parser.value(sortOption), parser.isSet(reverseOption)), tasks);
    if (ordered.empty()) {
        m_out << "No tasks found matching the criteria.\n";
        m_out.flush();
        return 0;
    }

    m_out << core::formatTaskList(toRecords(ordered), parser.isSet(showIdOption), parser.isSet(showDescriptionOption))
          << '\n';
    m_out << "\nTotal: " << ordered.size() << " task(s)\n";
    m_out.flush();
    return 0;
}

int CommandLine::runUpdate(const QStringList &args)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Update an existing task."));
    parser.addPositionalArgument(QStringLiteral("task_id"), QStringLiteral("ID of the task to update."));
    const QCommandLineOption titleOption({QStringLiteral("t"), QStringLiteral("title")},
                                         QStringLiteral("New task title."), QStringLiteral("title"));
    const QCommandLineOption descriptionOption({QStringLiteral("d"), QStringLiteral("description")},
                                               QStringLiteral("New task description."), QStringLiteral("text"));
    const QCommandLineOption dueOption({QStringLiteral("due"), QStringLiteral("due-date")},
                                       QStringLiteral("New due date (YYYY-MM-DD or 'none' to clear)."),
                                       QStringLiteral("date"));
    const QCommandLineOption priorityOption({QStringLiteral("p"), QStringLiteral("priority")},
                                            QStringLiteral("New priority (high, medium, low)."),
                                            QStringLiteral("priority"));
    const QCommandLineOption categoryOption({QStringLiteral("c"), QStringLiteral("category")},
                                            QStringLiteral("New task category (or 'none' to clear)."),
                                            QStringLiteral("category"));
    parser.addOptions({titleOption, descriptionOption, dueOption, priorityOption, categoryOption});
    if (const auto exitCode = parseCommand(parser, args, 1)) {
        return *exitCode;
    }

    data::TaskChanges changes;
    if (parser.isSet(titleOption)) {
        changes.title = parser.value(titleOption);
    }
    if (parser.isSet(descriptionOption)) {
        changes.description = parser.value(descriptionOption);
    }
    if (parser.isSet(dueOption)) {
        const QString dueDate = parser.value(dueOption);
        if (dueDate == QLatin1String(NoneValue)) {
            changes.clearDueDate = true;
        } else if (!core::validateDateFormat(dueDate)) {
            return printError(QStringLiteral("Invalid due date format: %1\nDue date should be in the format YYYY-MM-DD")
                                  .arg(dueDate));
        } else {
            changes.dueDate = dueDate;
        }
    }
    if (parser.isSet(priorityOption)) {
        const QString priority = parser.value(priorityOption);
        if (!core::validatePriority(priority)) {
            return printError(QStringLiteral("Invalid priority: %1. Must be one of: low, medium, high").arg(priority));
        }
        changes.priority = priority;
    }
    if (parser.isSet(categoryOption)) {
        const QString category = parser.value(categoryOption);
        changes.category = category == QLatin1String(NoneValue) ? QString() : category;
    }
    if (changes.isEmpty()) {
        return printError(QStringLiteral("No fields specified for update.\nUse --help to see available fields."));
    }

    const QString taskId = parser.positionalArguments().first();
    data::TaskManager manager = loadManager();
    const auto task = manager.updateTask(taskId, changes);
    if (!task) {
        return printError(QStringLiteral("No task found with ID: %1").arg(taskId));
    }
    if (!save(manager)) {
        return 1;
    }
    m_out << "Task updated: " << display(*task) << '\n';
    m_out.flush();
    return 0;
}

int CommandLine::runComplete(const QStringList &args)
{
    return runStatusChange(args, &data::TaskManager::markCompleted, QStringLiteral("complete"));
}

int CommandLine::runPending(const QStringList &args)
{
    return runStatusChange(args, &data::TaskManager::markPending, QStringLiteral("pending"));
}

int CommandLine::runCancel(const QStringList &args)
{
    return runStatusChange(args, &data::TaskManager::markCancelled, QStringLiteral("cancelled"));
}

int CommandLine::runStatusChange(const QStringList &args, MarkFunction mark, const QString &stateLabel)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Mark a task as %1.").arg(stateLabel));
    parser.addPositionalArgument(QStringLiteral("task_id"), QStringLiteral("ID of the task."));
    if (const auto exitCode = parseCommand(parser, args, 1)) {
        return *exitCode;
    }

    const QString taskId = parser.positionalArguments().first();
    data::TaskManager manager = loadManager();
    if (!(manager.*mark)(taskId)) {
        return printError(QStringLiteral("No task found with ID: %1").arg(taskId));
    }
    if (!save(manager)) {
        return 1;
    }
    m_out << "Task marked as " << stateLabel << ": " << display(*manager.findById(taskId)) << '\n';
    m_out.flush();
    return 0;
}

int CommandLine::runDelete(const QStringList &args)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Delete a task."));
    parser.addPositionalArgument(QStringLiteral("task_id"), QStringLiteral("ID of the task to delete."));
    const QCommandLineOption forceOption({QStringLiteral("f"), QStringLiteral("force")},
                                         QStringLiteral("Delete without confirmation."));
    parser.addOption(forceOption);
    if (const auto exitCode = parseCommand(parser, args, 1)) {
        return *exitCode;
    }

    const QString taskId = parser.positionalArguments().first();
    data::TaskManager manager = loadManager();
    const auto task = manager.findById(taskId);
    if (!task) {
        return printError(QStringLiteral("No task found with ID: %1").arg(taskId));
    }

    if (!parser.isSet(forceOption)) {
        m_out << "Delete task: " << display(*task) << "? (y/N) ";
        m_out.flush();
        const QString answer = m_in.readLine().trimmed().toLower();
        if (answer != QLatin1String("y") && answer != QLatin1String("yes")) {
            m_out << "Delete operation canceled.\n";
            m_out.flush();
            return 0;
        }
    }

    manager.removeTask(taskId);
    if (!save(manager)) {
        return 1;
    }
    m_out << "Task deleted: " << task->title() << '\n';
    m_out.flush();
    return 0;
}

int CommandLine::runShow(const QStringList &args)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Show details of a single task."));
    parser.addPositionalArgument(QStringLiteral("task_id"), QStringLiteral("ID of the task to show."));
    if (const auto exitCode = parseCommand(parser, args, 1)) {
        return *exitCode;
    }

    const QString taskId = parser.positionalArguments().first();
    const data::TaskManager manager = loadManager();
    const auto task = manager.findById(taskId);
    if (!task) {
        return printError(QStringLiteral("No task found with ID: %1").arg(taskId));
    }

    const data::TaskRecord record = task->toRecord();
    m_out << "ID: " << record.taskId << '\n';
    m_out << "Title: " << record.title << '\n';
    m_out << "Status: " << capitalized(record.status) << '\n';
    m_out << "Priority: " << capitalized(record.priority) << '\n';
    if (!record.category.isEmpty()) {
        m_out << "Category: " << record.category << '\n';
    }
    if (record.dueDate) {
        m_out << "Due date: " << (task->isOverdue() ? QStringLiteral("OVERDUE: ") : QString()) << *record.dueDate
              << '\n';
    }
    m_out << "Created: " << record.createdAt << '\n';
    if (!record.description.isEmpty()) {
        m_out << "\nDescription:\n" << record.description << '\n';
    }
    m_out.flush();
    return 0;
}

int CommandLine::runExport(const QStringList &args)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Export tasks to a CSV file."));
    parser.addPositionalArgument(QStringLiteral("csv_file"), QStringLiteral("Path to the CSV file to export to."));
    if (const auto exitCode = parseCommand(parser, args, 1)) {
        return *exitCode;
    }

    const QString csvFile = parser.positionalArguments().first();
    const data::TaskManager manager = loadManager();
    if (!manager.exportToCsv(csvFile)) {
        return printError(QStringLiteral("Failed to export tasks to CSV file: %1").arg(csvFile));
    }
    m_out << "Tasks exported to CSV file: " << csvFile << '\n';
    m_out << "Exported " << manager.size() << " task(s)\n";
    m_out.flush();
    return 0;
}

int CommandLine::runImport(const QStringList &args)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Import tasks from a CSV file."));
    parser.addPositionalArgument(QStringLiteral("csv_file"), QStringLiteral("Path to the CSV file to import from."));
    const QCommandLineOption mergeOption(QStringLiteral("merge"),
                                         QStringLiteral("Merge imported tasks with existing tasks."));
    parser.addOption(mergeOption);
    if (const auto exitCode = parseCommand(parser, args, 1)) {
        return *exitCode;
    }

    const QString csvFile = parser.positionalArguments().first();
    data::TaskManager manager = loadManager();

    if (!parser.isSet(mergeOption)) {
        if (!manager.importFromCsv(csvFile)) {
            return printError(QStringLiteral("Failed to import tasks from CSV file: %1").arg(csvFile));
        }
        if (!save(manager)) {
            return 1;
        }
        m_out << "Imported " << manager.size() << " task(s) from CSV file: " << csvFile << '\n';
        m_out.flush();
        return 0;
    }

    data::TaskManager imported;
    if (!imported.importFromCsv(csvFile)) {
        return printError(QStringLiteral("Failed to import tasks from CSV file: %1").arg(csvFile));
    }

    // Route the CSV rows through the JSON merge so ids already present are skipped.
    QTemporaryFile staging(QDir::temp().filePath(QStringLiteral("taskbook-import-XXXXXX.json")));
    if (!staging.open()) {
        return printError(QStringLiteral("Cannot create temporary file: %1").arg(staging.errorString()));
    }
    staging.close();
    if (!imported.saveToFile(staging.fileName())) {
        return printError(QStringLiteral("Cannot write temporary file: %1").arg(staging.fileName()));
    }

    const int added = manager.mergeFromFile(staging.fileName());
    if (!save(manager)) {
        return 1;
    }
    m_out << "Imported and merged " << added << " task(s) from CSV file: " << csvFile << '\n';
    m_out << "Total tasks: " << manager.size() << '\n';
    m_out.flush();
    return 0;
}

int CommandLine::runMerge(const QStringList &args)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Merge tasks from another task file."));
    parser.addPositionalArgument(QStringLiteral("merge_file"), QStringLiteral("Path to the task file to merge from."));
    if (const auto exitCode = parseCommand(parser, args, 1)) {
        return *exitCode;
    }

    const QString mergeFile = parser.positionalArguments().first();
    data::TaskManager manager = loadManager();
    const int added = manager.mergeFromFile(mergeFile);
    if (!save(manager)) {
        return 1;
    }
    m_out << "Merged " << added << " task(s) from file: " << mergeFile << '\n';
    m_out << "Total tasks: " << manager.size() << '\n';
    m_out.flush();
    return 0;
}

int CommandLine::runStats(const QStringList &args)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Show task statistics."));
    if (const auto exitCode = parseCommand(parser, args, 0)) {
        return *exitCode;
    }

    const data::TaskStats stats = loadManager().stats();
    m_out << "Task Statistics\n";
    m_out << "===============\n";
    m_out << "Total tasks: " << stats.total << '\n';
    m_out << "Completed: " << stats.completed << " (" << QString::number(stats.completionRate, 'f', 1) << "%)\n";
    m_out << "Pending: " << stats.pending << '\n';
    m_out << "Cancelled: " << stats.cancelled << '\n';
    m_out << "Overdue: " << stats.overdue << '\n';

    if (!stats.categories.isEmpty()) {
        m_out << "\nCategories\n";
        m_out << "----------\n";
        for (auto it = stats.categories.constBegin(); it != stats.categories.constEnd(); ++it) {
            m_out << it.key() << ": " << it.value() << " task(s)\n";
        }
    }

    m_out << "\nPriorities\n";
    m_out << "----------\n";
    m_out << "High: " << stats.priorities.value(data::TaskPriority::High) << " task(s)\n";
    m_out << "Medium: " << stats.priorities.value(data::TaskPriority::Medium) << " task(s)\n";
    m_out << "Low: " << stats.priorities.value(data::TaskPriority::Low) << " task(s)\n";
    m_out.flush();
    return 0;
}

int CommandLine::runConfig(const QStringList &args)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Show or change the default task file."));
    const QCommandLineOption setFileOption(QStringLiteral("set-file"),
                                           QStringLiteral("Store a new default task file."), QStringLiteral("path"));
    const QCommandLineOption resetOption(QStringLiteral("reset"), QStringLiteral("Forget the stored task file."));
    parser.addOptions({setFileOption, resetOption});
    if (const auto exitCode = parseCommand(parser, args, 0)) {
        return *exitCode;
    }

    if (parser.isSet(setFileOption)) {
        m_config.setTaskFile(parser.value(setFileOption));
    } else if (parser.isSet(resetOption)) {
        m_config.resetTaskFile();
    }

    m_out << "Task file: " << m_config.taskFile() << " (" << core::AppConfig::sourceName(m_config.taskFileSource())
          << ")\n";
    m_out.flush();
    return 0;
}

std::optional<int> CommandLine::parseCommand(QCommandLineParser &parser, const QStringList &args, int positionalCount)
{
    parser.addHelpOption();
    if (!parser.parse(args)) {
        return printError(parser.errorText());
    }
    if (parser.isSet(QStringLiteral("help"))) {
        m_out << parser.helpText();
        m_out.flush();
        return 0;
    }
    if (parser.positionalArguments().size() != positionalCount) {
        printError(QStringLiteral("Expected %1 argument(s), got %2.")
                       .arg(positionalCount)
                       .arg(parser.positionalArguments().size()));
        m_err << parser.helpText();
        m_err.flush();
        return 1;
    }
    return std::nullopt;
}

data::TaskManager CommandLine::loadManager() const
{
    const QString path = m_config.taskFile();
    if (!QFileInfo::exists(path)) {
        qCDebug(lcTaskCli) << "No task file at" << path << "- starting empty";
        return data::TaskManager();
    }
    return data::TaskManager(path);
}

bool CommandLine::save(const data::TaskManager &manager)
{
    const QString path = m_config.taskFile();
    if (!manager.saveToFile(path)) {
        printError(QStringLiteral("Failed to save tasks to %1").arg(path));
        return false;
    }
    return true;
}

int CommandLine::printError(const QString &message)
{
    m_err << "Error: " << message << '\n';
    m_err.flush();
    return 1;
}

} // namespace cli
} // namespace taskbook
