#include <QtTest/QtTest>

#include "geometry/Handle.h"

using RotoRect::Handle;

class tst_Handle : public QObject
{
    Q_OBJECT

private slots:
    void testAllHandlesOrder();
    void testHandleNameRoundTrip();
    void testHandleFromName_Variants_data();
    void testHandleFromName_Variants();
    void testHandleFromName_Unknown();
    void testHandleFromIndex();
    void testIsCornerHandle();
    void testHandleName_OutOfEnumValue();
};

void tst_Handle::testAllHandlesOrder()
{
    const auto handles = RotoRect::allHandles();
    QCOMPARE(handles.size(), std::size_t(8));
    for (std::size_t i = 0; i < handles.size(); ++i) {
        QCOMPARE(static_cast<int>(handles[i]), static_cast<int>(i));
    }
    QCOMPARE(static_cast<int>(Handle::TopRight), 0);
    QCOMPARE(static_cast<int>(Handle::BottomMiddle), 7);
}

void tst_Handle::testHandleNameRoundTrip()
{
    for (Handle handle : RotoRect::allHandles()) {
        const QString name = RotoRect::handleName(handle);
        QVERIFY(!name.isEmpty());
        const auto parsed = RotoRect::handleFromName(name);
        QVERIFY(parsed.has_value());
        QCOMPARE(*parsed, handle);
    }
}

void tst_Handle::testHandleFromName_Variants_data()
{
    QTest::addColumn<QString>("name");
    QTest::addColumn<int>("expected");

    QTest::newRow("kebab") << "middle-left" << static_cast<int>(Handle::MiddleLeft);
    QTest::newRow("snake") << "bottom_right" << static_cast<int>(Handle::BottomRight);
    QTest::newRow("upper snake") << "TOP_MIDDLE" << static_cast<int>(Handle::TopMiddle);
    QTest::newRow("camel") << "TopLeft" << static_cast<int>(Handle::TopLeft);
    QTest::newRow("padded") << "  bottom-left " << static_cast<int>(Handle::BottomLeft);
}

void tst_Handle::testHandleFromName_Variants()
{
    QFETCH(QString, name);
    QFETCH(int, expected);

    const auto parsed = RotoRect::handleFromName(name);
    QVERIFY(parsed.has_value());
    QCOMPARE(static_cast<int>(*parsed), expected);
}

void tst_Handle::testHandleFromName_Unknown()
{
    QVERIFY(!RotoRect::handleFromName("center").has_value());
    QVERIFY(!RotoRect::handleFromName("").has_value());
    QVERIFY(!RotoRect::handleFromName("-").has_value());
}

void tst_Handle::testHandleFromIndex()
{
    QCOMPARE(*RotoRect::handleFromIndex(0), Handle::TopRight);
    QCOMPARE(*RotoRect::handleFromIndex(4), Handle::MiddleLeft);
    QCOMPARE(*RotoRect::handleFromIndex(7), Handle::BottomMiddle);
    QVERIFY(!RotoRect::handleFromIndex(8).has_value());
    QVERIFY(!RotoRect::handleFromIndex(-1).has_value());
}

void tst_Handle::testIsCornerHandle()
{
    QVERIFY(RotoRect::isCornerHandle(Handle::TopRight));
    QVERIFY(RotoRect::isCornerHandle(Handle::BottomLeft));
    QVERIFY(!RotoRect::isCornerHandle(Handle::MiddleRight));
    QVERIFY(!RotoRect::isCornerHandle(Handle::TopMiddle));
}

void tst_Handle::testHandleName_OutOfEnumValue()
{
    QVERIFY(RotoRect::handleName(static_cast<Handle>(42)).isEmpty());
}

QTEST_MAIN(tst_Handle)
#include "tst_Handle.moc"
