#include <QtTest/QtTest>

#include "taskbook/core/Errors.hpp"
#include "taskbook/data/CsvTaskFile.hpp"
#include "taskbook/data/JsonTaskFile.hpp"
#include "taskbook/data/TaskManager.hpp"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

using namespace taskbook;
using data::CsvTaskFile;
using data::JsonTaskFile;
using data::Task;
using data::TaskManager;

namespace {
void writeFile(const QString &path, const QByteArray &content)
{
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(content);
}

QByteArray readFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return QByteArray();
    }
    return file.readAll();
}

void populate(TaskManager &manager)
{
    manager.addTask(QStringLiteral("Plain"));
    manager.addTask(QStringLiteral("Quoted, \"tricky\""),
                    QStringLiteral("line one\nline two, with comma"),
                    QStringLiteral("2025-02-28"),
                    QStringLiteral("high"),
                    QStringLiteral("errands"));
    const Task done = manager.addTask(QStringLiteral("Done"), QString(), QStringLiteral("2024-12-31"),
                                      QStringLiteral("low"));
    manager.markCompleted(done.id());
    const Task dropped = manager.addTask(QStringLiteral("Dropped"));
    manager.markCancelled(dropped.id());
}
} // namespace

class TaskPersistenceTest : public QObject
{
    Q_OBJECT

private slots:
    void init();

    void jsonRoundTrip();
    void saveCreatesParentDirectories();
    void saveWritesTasksObject();
    void saveFailsWhenParentIsFile();
    void loadMissingFileThrows();
    void loadInvalidJsonThrows();
    void loadWrongShapeThrows_data();
    void loadWrongShapeThrows();
    void failedLoadKeepsCollection();
    void parseErrorNamesOddPath();
    void mergeInvalidJsonThrows();
    void mergeWrongShapeThrows_data();
    void mergeWrongShapeThrows();
    void mergeBadRecordKeepsCollection();
    void constructorToleratesBadContent();
    void constructorPropagatesMissingFile();
    void loadFillsDefaults();

    void csvRoundTrip();
    void csvHeader();
    void csvImportSkipsBadRows();
    void csvImportMissingFile();
    void csvImportEmptyFile();
    void csvParse();

    void mergeSkipsKnownIds();
    void mergeAddsNewTasks();

private:
    QString path(const QString &name) const;

    QScopedPointer<QTemporaryDir> m_dir;
};

void TaskPersistenceTest::init()
{
    m_dir.reset(new QTemporaryDir);
    QVERIFY(m_dir->isValid());
}

QString TaskPersistenceTest::path(const QString &name) const
{
    return m_dir->filePath(name);
}

void TaskPersistenceTest::jsonRoundTrip()
{
    TaskManager original;
    populate(original);
    const QString file = path(QStringLiteral("tasks.json"));
    QVERIFY(original.saveToFile(file));

    TaskManager loaded(file);
    QCOMPARE(loaded.size(), original.size());
    for (int i = 0; i < original.size(); ++i) {
        QVERIFY(loaded.at(i) == original.at(i));
    }
}

void TaskPersistenceTest::saveCreatesParentDirectories()
{
    TaskManager manager;
    manager.addTask(QStringLiteral("Nested"));
    const QString file = path(QStringLiteral("a/b/c/tasks.json"));
    QVERIFY(manager.saveToFile(file));
    QVERIFY(QFile::exists(file));
}

void TaskPersistenceTest::saveWritesTasksObject()
{
    TaskManager manager;
    manager.addTask(QStringLiteral("Undated"));
    const QString file = path(QStringLiteral("tasks.json"));
    QVERIFY(manager.saveToFile(file));

    const QJsonDocument document = QJsonDocument::fromJson(readFile(file));
    QVERIFY(document.isObject());
    const QJsonArray tasks = document.object().value(QStringLiteral("tasks")).toArray();
    QCOMPARE(tasks.size(), 1);
    const QJsonObject task = tasks.at(0).toObject();
    QCOMPARE(task.value(QStringLiteral("title")).toString(), QStringLiteral("Undated"));
    QVERIFY(task.value(QStringLiteral("due_date")).isNull());
    QCOMPARE(task.value(QStringLiteral("priority")).toString(), QStringLiteral("medium"));
    QCOMPARE(task.value(QStringLiteral("status")).toString(), QStringLiteral("pending"));
}

void TaskPersistenceTest::saveFailsWhenParentIsFile()
{
    const QString blocker = path(QStringLiteral("blocker"));
    writeFile(blocker, "not a directory");

    TaskManager manager;
    manager.addTask(QStringLiteral("Task"));
    QVERIFY(!manager.saveToFile(blocker + QStringLiteral("/tasks.json")));
    QVERIFY(!manager.exportToCsv(blocker + QStringLiteral("/tasks.csv")));
}

void TaskPersistenceTest::loadMissingFileThrows()
{
    TaskManager manager;
    QVERIFY_EXCEPTION_THROWN(manager.loadFromFile(path(QStringLiteral("absent.json"))), core::NotFoundError);
    QVERIFY_EXCEPTION_THROWN(manager.mergeFromFile(path(QStringLiteral("absent.json"))), core::NotFoundError);
}

void TaskPersistenceTest::loadInvalidJsonThrows()
{
    const QString file = path(QStringLiteral("broken.json"));
    writeFile(file, "{\"tasks\": [");

    TaskManager manager;
    QVERIFY_EXCEPTION_THROWN(manager.loadFromFile(file), core::ParseError);
}

void TaskPersistenceTest::loadWrongShapeThrows_data()
{
    QTest::addColumn<QByteArray>("content");

    QTest::newRow("array at top") << QByteArray("[]");
    QTest::newRow("missing tasks key") << QByteArray("{\"items\": []}");
    QTest::newRow("tasks not array") << QByteArray("{\"tasks\": {}}");
    QTest::newRow("entry not object") << QByteArray("{\"tasks\": [42]}");
    QTest::newRow("entry without title") << QByteArray("{\"tasks\": [{\"description\": \"x\"}]}");
    QTest::newRow("non-string field") << QByteArray("{\"tasks\": [{\"title\": \"x\", \"priority\": 3}]}");
}

void TaskPersistenceTest::loadWrongShapeThrows()
{
    QFETCH(QByteArray, content);
    const QString file = path(QStringLiteral("shape.json"));
    writeFile(file, content);

    TaskManager manager;
    QVERIFY_EXCEPTION_THROWN(manager.loadFromFile(file), core::SchemaError);
}

void TaskPersistenceTest::failedLoadKeepsCollection()
{
    const QString file = path(QStringLiteral("bad-priority.json"));
    writeFile(file, "{\"tasks\": [{\"title\": \"fine\"}, {\"title\": \"bad\", \"priority\": \"urgent\"}]}");

    TaskManager manager;
    manager.addTask(QStringLiteral("Existing"));
    QVERIFY_EXCEPTION_THROWN(manager.loadFromFile(file), core::ValidationError);
    QCOMPARE(manager.size(), 1);
    QCOMPARE(manager.at(0).title(), QStringLiteral("Existing"));
}

void TaskPersistenceTest::parseErrorNamesOddPath()
{
    const QString file = path(QStringLiteral("odd%2name.json"));
    writeFile(file, "{\"tasks\": [");

    TaskManager manager;
    try {
        manager.loadFromFile(file);
        QFAIL("loadFromFile accepted truncated JSON");
    } catch (const core::ParseError &error) {
        QVERIFY(error.message().contains(file));
        QVERIFY(error.message().contains(QStringLiteral("at offset")));
    }
}

void TaskPersistenceTest::mergeInvalidJsonThrows()
{
    const QString file = path(QStringLiteral("broken.json"));
    writeFile(file, "{\"tasks\": [");

    TaskManager manager;
    manager.addTask(QStringLiteral("Existing"));
    QVERIFY_EXCEPTION_THROWN(manager.mergeFromFile(file), core::ParseError);
    QCOMPARE(manager.size(), 1);
}

void TaskPersistenceTest::mergeWrongShapeThrows_data()
{
    loadWrongShapeThrows_data();
}

void TaskPersistenceTest::mergeWrongShapeThrows()
{
    QFETCH(QByteArray, content);
    const QString file = path(QStringLiteral("shape.json"));
    writeFile(file, content);

    TaskManager manager;
    manager.addTask(QStringLiteral("Existing"));
    QVERIFY_EXCEPTION_THROWN(manager.mergeFromFile(file), core::SchemaError);
    QCOMPARE(manager.size(), 1);
    QCOMPARE(manager.at(0).title(), QStringLiteral("Existing"));
}

void TaskPersistenceTest::mergeBadRecordKeepsCollection()
{
    const QString file = path(QStringLiteral("partly-bad.json"));
    writeFile(file, "{\"tasks\": [{\"task_id\": \"n1\", \"title\": \"New\"},"
                    " {\"task_id\": \"n2\", \"title\": \"Bad\", \"due_date\": \"soon\"}]}");

    TaskManager manager;
    manager.addTask(QStringLiteral("Existing"));
    QVERIFY_EXCEPTION_THROWN(manager.mergeFromFile(file), core::ValidationError);
    QCOMPARE(manager.size(), 1);
    QVERIFY(!manager.findById(QStringLiteral("n1")).has_value());
}

void TaskPersistenceTest::constructorToleratesBadContent()
{
    const QString broken = path(QStringLiteral("broken.json"));
    writeFile(broken, "not json at all");
    const TaskManager fromBroken(broken);
    QVERIFY(fromBroken.isEmpty());

    const QString shapeless = path(QStringLiteral("shapeless.json"));
    writeFile(shapeless, "{\"other\": 1}");
    const TaskManager fromShapeless(shapeless);
    QVERIFY(fromShapeless.isEmpty());
}

void TaskPersistenceTest::constructorPropagatesMissingFile()
{
    QVERIFY_EXCEPTION_THROWN(TaskManager{path(QStringLiteral("absent.json"))}, core::NotFoundError);
    const TaskManager unnamed{QString()};
    QVERIFY(unnamed.isEmpty());
}

void TaskPersistenceTest::loadFillsDefaults()
{
    const QString file = path(QStringLiteral("minimal.json"));
    writeFile(file,
              "{\"tasks\": [{\"task_id\": \"abc\", \"title\": \"Minimal\", \"due_date\": null,"
              " \"status\": \"archived\"}]}");

    TaskManager manager;
    manager.loadFromFile(file);
    QCOMPARE(manager.size(), 1);
    const Task &task = manager.at(0);
    QCOMPARE(task.id(), QStringLiteral("abc"));
    QCOMPARE(task.priority(), data::TaskPriority::Medium);
    QCOMPARE(task.status(), data::TaskStatus::Pending);
    QVERIFY(!task.hasDueDate());
    QVERIFY(!task.createdAt().isEmpty());
}

void TaskPersistenceTest::csvRoundTrip()
{
    TaskManager original;
    populate(original);
    const QString file = path(QStringLiteral("export/tasks.csv"));
    QVERIFY(original.exportToCsv(file));

    TaskManager imported;
    imported.addTask(QStringLiteral("Replaced"));
    QVERIFY(imported.importFromCsv(file));
    QCOMPARE(imported.size(), original.size());
    for (int i = 0; i < original.size(); ++i) {
        QVERIFY(imported.at(i) == original.at(i));
    }
    QCOMPARE(imported.at(1).description(), QStringLiteral("line one\nline two, with comma"));
}

void TaskPersistenceTest::csvHeader()
{
    TaskManager manager;
    const QString file = path(QStringLiteral("empty.csv"));
    QVERIFY(manager.exportToCsv(file));
    QCOMPARE(readFile(file), QByteArray("task_id,title,description,due_date,priority,category,created_at,status\r\n"));
}

void TaskPersistenceTest::csvImportSkipsBadRows()
{
    const QString file = path(QStringLiteral("mixed.csv"));
    writeFile(file,
              "task_id,title,description,due_date,priority,category,created_at,status\r\n"
              "1,Good,,2025-01-01,high,home,2025-01-01T09:00:00,pending\r\n"
              "2,,,,,,,\r\n"
              "3,Bad date,,01/02/2025,low,,,pending\r\n"
              "4,Bad priority,,,urgent,,,pending\r\n"
              "5\r\n"
              "\r\n"
              "6,Also good,\"multi\nline\",,,,,completed\r\n");

    TaskManager manager;
    QVERIFY(manager.importFromCsv(file));
    QCOMPARE(manager.size(), 2);
    QCOMPARE(manager.at(0).id(), QStringLiteral("1"));
    QCOMPARE(manager.at(0).priority(), data::TaskPriority::High);
    QCOMPARE(manager.at(1).title(), QStringLiteral("Also good"));
    QCOMPARE(manager.at(1).description(), QStringLiteral("multi\nline"));
    QCOMPARE(manager.at(1).status(), data::TaskStatus::Completed);
    QCOMPARE(manager.at(1).priority(), data::TaskPriority::Medium);
}

void TaskPersistenceTest::csvImportMissingFile()
{
    TaskManager manager;
    manager.addTask(QStringLiteral("Kept"));
    QVERIFY(!manager.importFromCsv(path(QStringLiteral("absent.csv"))));
    QCOMPARE(manager.size(), 1);
}

void TaskPersistenceTest::csvImportEmptyFile()
{
    const QString file = path(QStringLiteral("blank.csv"));
    writeFile(file, QByteArray());

    TaskManager manager;
    manager.addTask(QStringLiteral("Cleared"));
    QVERIFY(manager.importFromCsv(file));
    QVERIFY(manager.isEmpty());
}

void TaskPersistenceTest::csvParse()
{
    const auto rows = CsvTaskFile::parse(QStringLiteral("a,\"b,c\",\"say \"\"hi\"\"\"\n\nx,,\"1\r\n2\"\r\nlast"));
    QCOMPARE(static_cast<int>(rows.size()), 3);
    QCOMPARE(rows.at(0), (QStringList{QStringLiteral("a"), QStringLiteral("b,c"), QStringLiteral("say \"hi\"")}));
    QCOMPARE(rows.at(1), (QStringList{QStringLiteral("x"), QString(), QStringLiteral("1\r\n2")}));
    QCOMPARE(rows.at(2), QStringList{QStringLiteral("last")});

    QCOMPARE(CsvTaskFile::encodeField(QStringLiteral("plain")), QStringLiteral("plain"));
    QCOMPARE(CsvTaskFile::encodeField(QStringLiteral("a,b")), QStringLiteral("\"a,b\""));
    QCOMPARE(CsvTaskFile::encodeField(QStringLiteral("say \"hi\"")), QStringLiteral("\"say \"\"hi\"\"\""));
    QCOMPARE(CsvTaskFile::encodeField(QStringLiteral("two\nlines")), QStringLiteral("\"two\nlines\""));
}

void TaskPersistenceTest::mergeSkipsKnownIds()
{
    TaskManager manager;
    populate(manager);
    const QString file = path(QStringLiteral("same.json"));
    QVERIFY(manager.saveToFile(file));

    QCOMPARE(manager.mergeFromFile(file), 0);
    QCOMPARE(manager.size(), 4);
}

void TaskPersistenceTest::mergeAddsNewTasks()
{
    TaskManager other;
    const Task shared = other.addTask(QStringLiteral("Shared"));
    other.addTask(QStringLiteral("Fresh"), QString(), QString(), QStringLiteral("high"));
    const QString file = path(QStringLiteral("other.json"));
    QVERIFY(other.saveToFile(file));

    TaskManager manager;
    manager.loadFromFile(file);
    manager.removeTask(manager.at(1).id());
    manager.addTask(QStringLiteral("Local"));

    QCOMPARE(manager.mergeFromFile(file), 1);
    QCOMPARE(manager.size(), 3);
    QCOMPARE(manager.at(0).id(), shared.id());
    QCOMPARE(manager.at(2).title(), QStringLiteral("Fresh"));

    const QString duplicated = path(QStringLiteral("dup.json"));
    writeFile(duplicated,
              "{\"tasks\": [{\"task_id\": \"x1\", \"title\": \"One\"}, {\"task_id\": \"x1\", \"title\": \"Again\"}]}");
    QCOMPARE(manager.mergeFromFile(duplicated), 1);
    QCOMPARE(manager.findById(QStringLiteral("x1"))->title(), QStringLiteral("One"));
}

QTEST_GUILESS_MAIN(TaskPersistenceTest)
#include "TaskPersistenceTest.moc"
