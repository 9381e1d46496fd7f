#include <QtTest/QtTest>

#include <string>

#include "daemon/message_grammar.hpp"

Q_DECLARE_METATYPE(apwatch::StationAction)

class MessageGrammarTests : public QObject
{
    Q_OBJECT
private slots:
    void testActions_data();
    void testActions();
    void testAddressCanonicalised();
    void testAccountingNoticeIsNoEvent();
    void testMalformedAddress();
    void testUnknownAction();
    void testMissingStructure();
    void testTrailingTextAfterLiteral();
    void testParseIsPure();
    void testParseHardwareAddress();
};

void MessageGrammarTests::testActions_data()
{
    QTest::addColumn<QString>("message");
    QTest::addColumn<apwatch::StationAction>("action");

    QTest::newRow("associated")
        << QStringLiteral("wl1.1: STA 32:42:fd:88:86:0c IEEE 802.11: associated")
        << apwatch::StationAction::Associated;
    QTest::newRow("disassociated")
        << QStringLiteral("wl1.1: STA 32:42:fd:88:86:0c IEEE 802.11: disassociated")
        << apwatch::StationAction::Disassociated;
    QTest::newRow("pairwise")
        << QStringLiteral("wl1.1: STA 32:42:fd:88:86:0c WPA: pairwise key handshake completed (RSN)")
        << apwatch::StationAction::Observed;
    QTest::newRow("group")
        << QStringLiteral("wl1.1: STA 32:42:fd:88:86:0c WPA: group key handshake completed (RSN)")
        << apwatch::StationAction::Observed;
}

void MessageGrammarTests::testActions()
{
    QFETCH(QString, message);
    QFETCH(apwatch::StationAction, action);

    const auto result = apwatch::parseStationMessage(message.toStdString());
    QCOMPARE(result.status, apwatch::GrammarStatus::Event);
    QCOMPARE(result.action, action);
    QCOMPARE(QString::fromStdString(result.interfaceName), QStringLiteral("wl1.1"));
    QCOMPARE(QString::fromStdString(result.hardwareAddress),
             QStringLiteral("32:42:fd:88:86:0c"));
}

void MessageGrammarTests::testAddressCanonicalised()
{
    const auto upper = apwatch::parseStationMessage(
        "wlan0: STA AA:BB:CC:DD:EE:FF IEEE 802.11: associated");
    const auto lower = apwatch::parseStationMessage(
        "wlan0: STA aa:bb:cc:dd:ee:ff IEEE 802.11: associated");
    const auto mixed = apwatch::parseStationMessage(
        "wlan0: STA Aa:bB:cC:Dd:eE:Ff IEEE 802.11: associated");

    QCOMPARE(upper.status, apwatch::GrammarStatus::Event);
    QCOMPARE(QString::fromStdString(upper.hardwareAddress),
             QStringLiteral("aa:bb:cc:dd:ee:ff"));
    QCOMPARE(QString::fromStdString(lower.hardwareAddress),
             QString::fromStdString(upper.hardwareAddress));
    QCOMPARE(QString::fromStdString(mixed.hardwareAddress),
             QString::fromStdString(upper.hardwareAddress));
}

void MessageGrammarTests::testAccountingNoticeIsNoEvent()
{
    const auto result = apwatch::parseStationMessage(
        "eth10: STA 04:17:b6:37:96:dc RADIUS: starting accounting session 5F3F4F6F");
    QCOMPARE(result.status, apwatch::GrammarStatus::NoEvent);
    QVERIFY(result.error.empty());
    QVERIFY(result.hardwareAddress.empty());
}

void MessageGrammarTests::testMalformedAddress()
{
    const auto result = apwatch::parseStationMessage(
        "wl1.1: STA zz:bad:ad:dr:es:sx IEEE 802.11: associated");
    QCOMPARE(result.status, apwatch::GrammarStatus::Error);
    QVERIFY(!result.error.empty());

    // Wrong group count, group width or separator.
    for (const char *message : {"wl0: STA 32:42:fd:88:86 IEEE 802.11: associated",
                                "wl0: STA 3:42:fd:88:86:0c IEEE 802.11: associated",
                                "wl0: STA 32-42-fd-88-86-0c IEEE 802.11: associated",
                                "wl0: STA 32:42:fd:88:86:0c:11 IEEE 802.11: associated"}) {
        QCOMPARE(apwatch::parseStationMessage(message).status,
                 apwatch::GrammarStatus::Error);
    }
}

void MessageGrammarTests::testUnknownAction()
{
    const auto result = apwatch::parseStationMessage(
        "wl1.1: STA 32:42:fd:88:86:0c IEEE 802.11: authenticated");
    QCOMPARE(result.status, apwatch::GrammarStatus::Error);
    QVERIFY(!result.error.empty());
}

void MessageGrammarTests::testMissingStructure()
{
    QCOMPARE(apwatch::parseStationMessage("").status, apwatch::GrammarStatus::Error);
    QCOMPARE(apwatch::parseStationMessage("interface wl1.1 enabled").status,
             apwatch::GrammarStatus::Error);
    QCOMPARE(apwatch::parseStationMessage("wl1.1: AP-ENABLED").status,
             apwatch::GrammarStatus::Error);
    // No blank between address and action text.
    QCOMPARE(apwatch::parseStationMessage(
                 "wl1.1: STA 32:42:fd:88:86:0cIEEE 802.11: associated").status,
             apwatch::GrammarStatus::Error);
    QCOMPARE(apwatch::parseStationMessage("wl1.1: STA 32:42:fd:88:86:0c").status,
             apwatch::GrammarStatus::Error);
}

void MessageGrammarTests::testTrailingTextAfterLiteral()
{
    const auto result = apwatch::parseStationMessage(
        "wl0.2: STA 32:42:fd:88:86:0c  IEEE 802.11: associated (aid 3)");
    QCOMPARE(result.status, apwatch::GrammarStatus::Event);
    QCOMPARE(result.action, apwatch::StationAction::Associated);
    QCOMPARE(QString::fromStdString(result.interfaceName), QStringLiteral("wl0.2"));
}

void MessageGrammarTests::testParseIsPure()
{
    const std::string message = "wl1.1: STA 32:42:FD:88:86:0C IEEE 802.11: disassociated";
    const auto first = apwatch::parseStationMessage(message);
    const auto second = apwatch::parseStationMessage(message);

    QCOMPARE(first.status, second.status);
    QCOMPARE(first.action, second.action);
    QCOMPARE(QString::fromStdString(first.interfaceName),
             QString::fromStdString(second.interfaceName));
    QCOMPARE(QString::fromStdString(first.hardwareAddress),
             QString::fromStdString(second.hardwareAddress));
}

void MessageGrammarTests::testParseHardwareAddress()
{
    const auto parsed = apwatch::parseHardwareAddress("04:17:B6:37:96:DC");
    QVERIFY(parsed.has_value());
    QCOMPARE(QString::fromStdString(*parsed), QStringLiteral("04:17:b6:37:96:dc"));

    QVERIFY(!apwatch::parseHardwareAddress("").has_value());
    QVERIFY(!apwatch::parseHardwareAddress("04:17:b6:37:96:dc ").has_value());
    QVERIFY(!apwatch::parseHardwareAddress("04:17:b6:37:96").has_value());
    QVERIFY(!apwatch::parseHardwareAddress("g4:17:b6:37:96:dc").has_value());
}

QTEST_MAIN(MessageGrammarTests)
#include "test_message_grammar.moc"
