#include <QtTest>

#include "cli/GeometryArguments.h"

using RotoRect::Handle;
using RotoRect::Point;
using RotoRect::Rectangle;
using RotoRect::CLI::CLIResult;

class tst_GeometryArguments : public QObject
{
    Q_OBJECT

private slots:
    void parsePoint_acceptsSignedAndFractionalValues();
    void parsePoint_rejectsMalformedText_data();
    void parsePoint_rejectsMalformedText();
    void parseRectangle_keepsNegativeExtent();
    void parseRectangle_rejectsWrongComponentCount();
    void requirePoint_reportsMissingOption();
    void requireHandle_reportsUnknownName();
    void optionalAngle_defaultsToZero();
};

void tst_GeometryArguments::parsePoint_acceptsSignedAndFractionalValues()
{
    const auto point = RotoRect::CLI::parsePoint("-3.5, 1e2");
    QVERIFY(point.has_value());
    QCOMPARE(*point, Point(-3.5, 100.0));
}

void tst_GeometryArguments::parsePoint_rejectsMalformedText_data()
{
    QTest::addColumn<QString>("text");

    QTest::newRow("empty") << "";
    QTest::newRow("single") << "4";
    QTest::newRow("three") << "1,2,3";
    QTest::newRow("letters") << "a,b";
    QTest::newRow("trailing comma") << "1,";
}

void tst_GeometryArguments::parsePoint_rejectsMalformedText()
{
    QFETCH(QString, text);
    QVERIFY(!RotoRect::CLI::parsePoint(text).has_value());
}

void tst_GeometryArguments::parseRectangle_keepsNegativeExtent()
{
    const auto rect = RotoRect::CLI::parseRectangle("0,3,3,-1");
    QVERIFY(rect.has_value());
    QCOMPARE(*rect, Rectangle(0, 3, 3, -1));
}

void tst_GeometryArguments::parseRectangle_rejectsWrongComponentCount()
{
    QVERIFY(!RotoRect::CLI::parseRectangle("0,0,10").has_value());
    QVERIFY(!RotoRect::CLI::parseRectangle("0,0,10,10,5").has_value());
}

void tst_GeometryArguments::requirePoint_reportsMissingOption()
{
    QCommandLineParser parser;
    parser.addOption({"target", "Target", "point"});
    QVERIFY(parser.parse({"rotorect"}));

    Point point;
    const CLIResult result = RotoRect::CLI::requirePoint(parser, "target", &point);
    QCOMPARE(result.code, CLIResult::Code::InvalidArguments);
    QVERIFY(result.message.contains("--target"));
}

void tst_GeometryArguments::requireHandle_reportsUnknownName()
{
    QCommandLineParser parser;
    parser.addOption({"handle", "Handle", "name"});
    QVERIFY(parser.parse({"rotorect", "--handle", "center"}));

    Handle handle = Handle::TopRight;
    const CLIResult result = RotoRect::CLI::requireHandle(parser, "handle", &handle);
    QCOMPARE(result.code, CLIResult::Code::InvalidArguments);
    QVERIFY(result.message.contains("Unknown handle: center"));
    QVERIFY(result.message.contains("bottom-middle"));
}

void tst_GeometryArguments::optionalAngle_defaultsToZero()
{
    QCommandLineParser parser;
    parser.addOption({"angle", "Angle", "degrees"});
    QVERIFY(parser.parse({"rotorect"}));

    qreal angle = 99.0;
    QVERIFY(RotoRect::CLI::optionalAngle(parser, "angle", &angle).isSuccess());
    QCOMPARE(angle, 0.0);

    QCommandLineParser invalidParser;
    invalidParser.addOption({"angle", "Angle", "degrees"});
    QVERIFY(invalidParser.parse({"rotorect", "--angle", "abc"}));
    const CLIResult result = RotoRect::CLI::optionalAngle(invalidParser, "angle", &angle);
    QCOMPARE(result.code, CLIResult::Code::InvalidArguments);
    QVERIFY(result.message.contains("Invalid angle value: abc"));
}

QTEST_MAIN(tst_GeometryArguments)
#include "tst_GeometryArguments.moc"
