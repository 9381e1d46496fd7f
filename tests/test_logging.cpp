#include <QtTest/QtTest>

#include <QTemporaryDir>
#include <QFile>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

class LoggingTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void testLogEventWrites();
    void testDebugFiltered();
    void testCorrelationScope();
    void testInvalidUtf8Context();

private:
    QTemporaryDir m_tempDir;

    QString logPath() const;
    QList<nlohmann::json> readRecords() const;
    void resetLog(bool debugEnabled);
};

void LoggingTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
}

QString LoggingTests::logPath() const
{
    return m_tempDir.path() + "/apwatch-test.log";
}

QList<nlohmann::json> LoggingTests::readRecords() const
{
    QList<nlohmann::json> records;
    QFile file(logPath());
    if (!file.open(QIODevice::ReadOnly)) {
        return records;
    }
    while (!file.atEnd()) {
        const QByteArray line = file.readLine().trimmed();
        if (!line.isEmpty()) {
            records.append(nlohmann::json::parse(line.toStdString()));
        }
    }
    return records;
}

void LoggingTests::resetLog(bool debugEnabled)
{
    QFile::remove(logPath());
    apwatch::logging::LogOptions options;
    options.jsonFormat = true;
    options.debugEnabled = debugEnabled;
    options.logDirectory = m_tempDir.path();
    apwatch::logging::initLogging(QStringLiteral("apwatch-test"), options);
}

void LoggingTests::testLogEventWrites()
{
    resetLog(false);

    apwatch::logging::logEvent(apwatch::logging::LogLevel::Info,
                               QStringLiteral("apwatch-test"),
                               QStringLiteral("Test"),
                               QStringLiteral("testLogEventWrites"),
                               QStringLiteral("test_log"),
                               QStringLiteral("unit_test"),
                               QStringLiteral("direct_call"),
                               apwatch::logging::defaultWho(),
                               QStringLiteral("corr-1"),
                               nlohmann::json{{"key", "value"}});

    const auto records = readRecords();
    QCOMPARE(records.size(), static_cast<qsizetype>(1));
    const auto &parsed = records.first();
    QCOMPARE(QString::fromStdString(parsed.value("what", "")), QStringLiteral("test_log"));
    QCOMPARE(QString::fromStdString(parsed.value("corr", "")), QStringLiteral("corr-1"));
    QCOMPARE(QString::fromStdString(parsed.value("level", "")), QStringLiteral("INFO"));
    QCOMPARE(QString::fromStdString(parsed.value("process", "")), QStringLiteral("apwatch-test"));
    QCOMPARE(QString::fromStdString(parsed["context"].value("key", "")), QStringLiteral("value"));
}

void LoggingTests::testDebugFiltered()
{
    resetLog(false);
    APWLOG_DEBUG(QStringLiteral("Test"), QStringLiteral("testDebugFiltered"),
                 QStringLiteral("hidden"), QString(), QString(), QString(), QString(),
                 nlohmann::json::object());
    APWLOG_WARN(QStringLiteral("Test"), QStringLiteral("testDebugFiltered"),
                QStringLiteral("shown"), QString(), QString(), QString(), QString(),
                nlohmann::json::object());
    QVERIFY(!apwatch::logging::isDebugEnabled());

    auto records = readRecords();
    QCOMPARE(records.size(), static_cast<qsizetype>(1));
    QCOMPARE(QString::fromStdString(records.first().value("what", "")), QStringLiteral("shown"));

    resetLog(true);
    APWLOG_DEBUG(QStringLiteral("Test"), QStringLiteral("testDebugFiltered"),
                 QStringLiteral("visible"), QString(), QString(), QString(), QString(),
                 nlohmann::json::object());
    records = readRecords();
    QCOMPARE(records.size(), static_cast<qsizetype>(1));
    QCOMPARE(QString::fromStdString(records.first().value("level", "")), QStringLiteral("DEBUG"));
}

void LoggingTests::testCorrelationScope()
{
    resetLog(false);
    QVERIFY(apwatch::logging::currentCorrelationId().isEmpty());
    {
        apwatch::logging::CorrelationScope scope(QStringLiteral("req-42"));
        APWLOG_INFO(QStringLiteral("Test"), QStringLiteral("testCorrelationScope"),
                    QStringLiteral("scoped"), QString(), QString(), QString(), QString(),
                    nlohmann::json::object());
    }
    QVERIFY(apwatch::logging::currentCorrelationId().isEmpty());

    const auto records = readRecords();
    QCOMPARE(records.size(), static_cast<qsizetype>(1));
    QCOMPARE(QString::fromStdString(records.first().value("corr", "")), QStringLiteral("req-42"));
}

void LoggingTests::testInvalidUtf8Context()
{
    resetLog(false);
    APWLOG_ERROR(QStringLiteral("Test"), QStringLiteral("testInvalidUtf8Context"),
                 QStringLiteral("bad_bytes"), QString(), QString(), QString(), QString(),
                 (nlohmann::json{{"line", std::string("\xff\xfe{", 3)}}));

    const auto records = readRecords();
    QCOMPARE(records.size(), static_cast<qsizetype>(1));
    QCOMPARE(QString::fromStdString(records.first().value("what", "")), QStringLiteral("bad_bytes"));
}

QTEST_MAIN(LoggingTests)
#include "test_logging.moc"
