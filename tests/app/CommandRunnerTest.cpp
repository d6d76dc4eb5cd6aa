#include <QtTest/QtTest>

#include <QDir>
#include <QProcessEnvironment>
#include <limits>

#include "todo/app/CommandRunner.hpp"
#include "todo/app/Config.hpp"
#include "todo/core/Clock.hpp"
#include "todo/core/TaskManager.hpp"
#include "todo/data/InMemoryTaskStore.hpp"

using namespace todo;

namespace {

class FixedClock : public core::Clock
{
public:
    QDateTime now() const override { return QDateTime(QDate(2024, 7, 1), QTime(8, 5)); }
};

struct Harness
{
    data::InMemoryTaskStore store;
    FixedClock clock;
    core::TaskManager manager{store, clock};
    QString outText;
    QString errText;

    int run(const QStringList &arguments)
    {
        outText.clear();
        errText.clear();
        QTextStream out(&outText);
        QTextStream err(&errText);
        app::CommandRunner runner(manager, QStringLiteral("/tmp/todos.json"), out, err);
        const int code = runner.run(arguments);
        out.flush();
        err.flush();
        return code;
    }
};

} // namespace

class CommandRunnerTest : public QObject
{
    Q_OBJECT

private slots:
    void addJoinsWords();
    void addBlankIsUserError();
    void listGroupsByStatus();
    void listEmpty();
    void completeAndRemoveValidateIds();
    void clearReportsCount();
    void saveFailureIsStorageError();
    void exhaustedIdsIsUserError();
    void unknownCommandIsUsageError();
    void storagePathPrecedence();
};

void CommandRunnerTest::addJoinsWords()
{
    Harness h;
    QCOMPARE(h.run({QStringLiteral("add"), QStringLiteral("Buy"), QStringLiteral("milk")}), int(app::ExitOk));
    QVERIFY(h.outText.contains(QStringLiteral("Task added: Buy milk (#1)")));
    QCOMPARE(h.manager.list().front().description, QStringLiteral("Buy milk"));
}

void CommandRunnerTest::addBlankIsUserError()
{
    Harness h;
    QCOMPARE(h.run({QStringLiteral("add"), QStringLiteral("   ")}), int(app::ExitUserError));
    QVERIFY(h.errText.contains(QStringLiteral("cannot be empty")));
    QVERIFY(h.manager.list().empty());
}

void CommandRunnerTest::listGroupsByStatus()
{
    Harness h;
    h.run({QStringLiteral("add"), QStringLiteral("Buy milk")});
    h.run({QStringLiteral("add"), QStringLiteral("Read book")});
    h.run({QStringLiteral("complete"), QStringLiteral("1")});

    QCOMPARE(h.run({QStringLiteral("list")}), int(app::ExitOk));
    const QString expected = QStringLiteral("Pending tasks:\n"
                                            "  2. [ ] Read book (2024-07-01 08:05)\n"
                                            "Completed tasks:\n"
                                            "  1. [x] Buy milk (2024-07-01 08:05)\n"
                                            "Summary: 2 total, 1 completed, 1 pending\n");
    QCOMPARE(h.outText, expected);
}

void CommandRunnerTest::listEmpty()
{
    Harness h;
    QCOMPARE(h.run({QStringLiteral("list")}), int(app::ExitOk));
    QCOMPARE(h.outText, QStringLiteral("Your todo list is empty.\n"));
}

void CommandRunnerTest::completeAndRemoveValidateIds()
{
    Harness h;
    h.run({QStringLiteral("add"), QStringLiteral("Only")});

    QCOMPARE(h.run({QStringLiteral("complete"), QStringLiteral("abc")}), int(app::ExitUserError));
    QVERIFY(h.errText.contains(QStringLiteral("Invalid task id: abc")));

    QCOMPARE(h.run({QStringLiteral("remove"), QStringLiteral("5")}), int(app::ExitUserError));
    QVERIFY(h.errText.contains(QStringLiteral("Invalid task id: 5")));

    QCOMPARE(h.run({QStringLiteral("remove"), QStringLiteral("-1")}), int(app::ExitUserError));

    QCOMPARE(h.run({QStringLiteral("remove"), QStringLiteral("1")}), int(app::ExitOk));
    QVERIFY(h.outText.contains(QStringLiteral("Task 1 removed: Only")));
    QVERIFY(h.manager.list().empty());
}

void CommandRunnerTest::clearReportsCount()
{
    Harness h;
    QCOMPARE(h.run({QStringLiteral("clear")}), int(app::ExitOk));
    QVERIFY(h.outText.contains(QStringLiteral("No completed tasks")));

    h.run({QStringLiteral("add"), QStringLiteral("One")});
    h.run({QStringLiteral("complete"), QStringLiteral("1")});
    QCOMPARE(h.run({QStringLiteral("clear")}), int(app::ExitOk));
    QVERIFY(h.outText.contains(QStringLiteral("Cleared 1 completed task(s)")));
}

void CommandRunnerTest::saveFailureIsStorageError()
{
    Harness h;
    h.store.setFailSaves(true);
    QCOMPARE(h.run({QStringLiteral("add"), QStringLiteral("Lost")}), int(app::ExitStorageError));
    QVERIFY(h.errText.contains(QStringLiteral("Could not save tasks to /tmp/todos.json")));
}

void CommandRunnerTest::exhaustedIdsIsUserError()
{
    data::Task top;
    top.id = std::numeric_limits<int>::max();
    top.description = QStringLiteral("Top");
    top.createdAt = QDateTime(QDate(2024, 7, 1), QTime(8, 0));

    data::InMemoryTaskStore store({top});
    FixedClock clock;
    core::TaskManager manager(store, clock);
    QString outText;
    QString errText;
    QTextStream out(&outText);
    QTextStream err(&errText);
    app::CommandRunner runner(manager, QStringLiteral("/tmp/todos.json"), out, err);

    QCOMPARE(runner.run({QStringLiteral("add"), QStringLiteral("More")}), int(app::ExitUserError));
    err.flush();
    QVERIFY(errText.contains(QStringLiteral("No task id left")));
    QCOMPARE(manager.list().size(), size_t(1));
    QCOMPARE(store.saveCount(), 0);
}

void CommandRunnerTest::unknownCommandIsUsageError()
{
    Harness h;
    QCOMPARE(h.run({}), int(app::ExitUsage));
    QCOMPARE(h.run({QStringLiteral("frobnicate")}), int(app::ExitUsage));
    QCOMPARE(h.run({QStringLiteral("complete")}), int(app::ExitUsage));
    QCOMPARE(h.run({QStringLiteral("list"), QStringLiteral("extra")}), int(app::ExitUsage));
}

void CommandRunnerTest::storagePathPrecedence()
{
    QProcessEnvironment env;
    QCOMPARE(app::resolveStoragePath(QString(), env), QDir::current().filePath(QStringLiteral("todos.json")));

    env.insert(QStringLiteral("TODO_FILE"), QStringLiteral("/data/env.json"));
    QCOMPARE(app::resolveStoragePath(QString(), env), QStringLiteral("/data/env.json"));
    QCOMPARE(app::resolveStoragePath(QStringLiteral("/data/cli.json"), env), QStringLiteral("/data/cli.json"));
}

QTEST_GUILESS_MAIN(CommandRunnerTest)
#include "CommandRunnerTest.moc"
