#include <QtTest/QtTest>

#include "common/version.hpp"

class VersionTests : public QObject
{
    Q_OBJECT
private slots:
    void testAppVersion();
    void testCompareVersions_data();
    void testCompareVersions();
};

void VersionTests::testAppVersion()
{
    QCOMPARE(streamshell::appVersion(), QStringLiteral(STREAMSHELL_VERSION));
    QVERIFY(!streamshell::appVersion().isEmpty());
}

void VersionTests::testCompareVersions_data()
{
    QTest::addColumn<QString>("a");
    QTest::addColumn<QString>("b");
    QTest::addColumn<int>("expected");

    QTest::newRow("newer major") << "2.0.0" << "1.0.0" << 1;
    QTest::newRow("same") << "1.0.0" << "1.0.0" << 0;
    QTest::newRow("older minor") << "1.2.0" << "1.10.0" << -1;
    QTest::newRow("missing parts are zero") << "1.0" << "1.0.0" << 0;
    QTest::newRow("longer wins") << "1.0.1" << "1.0" << 1;
    QTest::newRow("leading v") << "v1.4.0" << "1.3.9" << 1;
    QTest::newRow("prerelease suffix") << "1.0.0-beta" << "1.0.0" << 0;
}

void VersionTests::testCompareVersions()
{
    QFETCH(QString, a);
    QFETCH(QString, b);
    QFETCH(int, expected);

    QCOMPARE(streamshell::compareVersions(a, b), expected);
    QCOMPARE(streamshell::compareVersions(b, a), -expected);
}

QTEST_MAIN(VersionTests)
#include "test_version.moc"
