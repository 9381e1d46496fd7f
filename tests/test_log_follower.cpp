#include <QtTest/QtTest>

#include <QFile>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "daemon/log_follower.hpp"

class LogFollowerTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();

    void testMissingFileWaits();
    void testPartialLineHeldBack();
    void testBlankLinesAndCarriageReturns();
    void testTruncationRestartsFromStart();
    void testRotationSwitchesFile();
    void testEmptyPathIsFatal();
    void testSignalsDriveLines();

private:
    QTemporaryDir m_tempDir;

    QString pathFor(const char *name) const;
    static void append(const QString &path, const QByteArray &data);
    static QString nextLine(apwatch::LogFollower &follower);
};

void LogFollowerTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
}

QString LogFollowerTests::pathFor(const char *name) const
{
    return m_tempDir.path() + QLatin1Char('/') + QLatin1String(name);
}

void LogFollowerTests::append(const QString &path, const QByteArray &data)
{
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Append));
    QCOMPARE(file.write(data), static_cast<qint64>(data.size()));
}

QString LogFollowerTests::nextLine(apwatch::LogFollower &follower)
{
    QString line;
    const auto status = follower.readLine(&line);
    return status == apwatch::LogFollower::ReadStatus::Line ? line : QString();
}

void LogFollowerTests::testMissingFileWaits()
{
    const QString path = pathFor("missing.log");
    apwatch::LogFollower follower;
    follower.setPath(path);

    QString line;
    QCOMPARE(follower.readLine(&line), apwatch::LogFollower::ReadStatus::NoLine);
    QCOMPARE(follower.readLine(&line), apwatch::LogFollower::ReadStatus::NoLine);

    append(path, "first\n");
    QCOMPARE(follower.readLine(&line), apwatch::LogFollower::ReadStatus::Line);
    QCOMPARE(line, QStringLiteral("first"));
    QCOMPARE(follower.readLine(&line), apwatch::LogFollower::ReadStatus::NoLine);
}

void LogFollowerTests::testPartialLineHeldBack()
{
    const QString path = pathFor("partial.log");
    append(path, "one\n{\"host\":");

    apwatch::LogFollower follower;
    follower.setPath(path);
    QCOMPARE(nextLine(follower), QStringLiteral("one"));

    QString line;
    QCOMPARE(follower.readLine(&line), apwatch::LogFollower::ReadStatus::NoLine);

    append(path, "\"den-ap\"}\n");
    QCOMPARE(nextLine(follower), QStringLiteral("{\"host\":\"den-ap\"}"));
}

void LogFollowerTests::testBlankLinesAndCarriageReturns()
{
    const QString path = pathFor("blank.log");
    append(path, "\n   \nalpha\r\n\r\nbeta\n");

    apwatch::LogFollower follower;
    follower.setPath(path);
    QCOMPARE(nextLine(follower), QStringLiteral("alpha"));
    QCOMPARE(nextLine(follower), QStringLiteral("beta"));
    QCOMPARE(nextLine(follower), QString());
}

void LogFollowerTests::testTruncationRestartsFromStart()
{
    const QString path = pathFor("truncate.log");
    append(path, "line-1 with some padding\nline-2 with some padding\n");

    apwatch::LogFollower follower;
    follower.setPath(path);
    QCOMPARE(nextLine(follower), QStringLiteral("line-1 with some padding"));
    QCOMPARE(nextLine(follower), QStringLiteral("line-2 with some padding"));

    {
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
        file.write("fresh\n");
    }

    QCOMPARE(nextLine(follower), QStringLiteral("fresh"));
}

void LogFollowerTests::testRotationSwitchesFile()
{
    const QString path = pathFor("rotate.log");
    append(path, "old-1\nold-tail");

    apwatch::LogFollower follower;
    follower.setPath(path);
    QCOMPARE(nextLine(follower), QStringLiteral("old-1"));
    QCOMPARE(nextLine(follower), QString());

    QVERIFY(QFile::rename(path, path + QStringLiteral(".1")));
    append(path, "new-1\n");

    QCOMPARE(nextLine(follower), QStringLiteral("old-tail"));
    QCOMPARE(nextLine(follower), QStringLiteral("new-1"));
    QCOMPARE(nextLine(follower), QString());

    append(path, "new-2\n");
    QCOMPARE(nextLine(follower), QStringLiteral("new-2"));
}

void LogFollowerTests::testEmptyPathIsFatal()
{
    apwatch::LogFollower follower;
    QString line;
    QCOMPARE(follower.readLine(&line), apwatch::LogFollower::ReadStatus::Fatal);
    QVERIFY(!follower.errorString().isEmpty());

    QSignalSpy fatalSpy(&follower, &apwatch::LogFollower::fatalError);
    follower.start(10);
    QCOMPARE(fatalSpy.count(), 1);
}

void LogFollowerTests::testSignalsDriveLines()
{
    const QString path = pathFor("signals.log");
    append(path, "a\n");

    apwatch::LogFollower follower;
    follower.setPath(path);
    QSignalSpy lineSpy(&follower, &apwatch::LogFollower::lineRead);

    follower.start(10);
    QCOMPARE(lineSpy.count(), 1);

    append(path, "b\nc\n");
    QTRY_COMPARE(lineSpy.count(), 3);
    QCOMPARE(lineSpy.at(2).at(0).toString(), QStringLiteral("c"));

    follower.stop();
}

QTEST_MAIN(LogFollowerTests)
#include "test_log_follower.moc"
