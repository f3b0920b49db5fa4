#include <QtTest>

#include "cli/CLIHandler.h"
#include "settings/GeometrySettingsManager.h"
#include "settings/Settings.h"

using RotoRect::CLI::CLIHandler;
using RotoRect::CLI::CLIResult;

class tst_ConfigCommand : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void list_showsEffectiveDefaults();
    void setThenGet_precision();
    void set_booleanAffectsGeometryOutput();
    void set_rejectsInvalidValues_data();
    void set_rejectsInvalidValues();
    void get_rejectsUnknownKey();
    void reset_restoresDefaults();
    void noAction_isRejected();

private:
    void clearSettings();
};

void tst_ConfigCommand::init()
{
    clearSettings();
}

void tst_ConfigCommand::cleanup()
{
    clearSettings();
}

void tst_ConfigCommand::clearSettings()
{
    auto settings = RotoRect::getSettings();
    for (const QString& key : RotoRect::knownSettingsKeys()) {
        settings.remove(key);
    }
    settings.sync();
}

void tst_ConfigCommand::list_showsEffectiveDefaults()
{
    CLIHandler handler;
    const CLIResult result = handler.process({"rotorect", "config", "--list"});
    QVERIFY(result.isSuccess());
    QVERIFY(result.message.contains("output/precision = 6"));
    QVERIFY(result.message.contains("output/json = false"));
    QVERIFY(result.message.contains("output/normalizeRectangles = false"));
}

void tst_ConfigCommand::setThenGet_precision()
{
    CLIHandler handler;
    const CLIResult set = handler.process({"rotorect", "config", "--set", "output/precision", "3"});
    QVERIFY2(set.isSuccess(), qPrintable(set.message));
    QCOMPARE(set.message, QString("Set output/precision = 3"));

    const CLIResult get = handler.process({"rotorect", "config", "--get", "output/precision"});
    QVERIFY(get.isSuccess());
    QCOMPARE(get.message, QString("3"));
    QCOMPARE(GeometrySettingsManager::instance().loadOutputPrecision(), 3);
}

void tst_ConfigCommand::set_booleanAffectsGeometryOutput()
{
    CLIHandler handler;
    QVERIFY(handler.process({"rotorect", "config", "--set", "output/normalizeRectangles", "yes"})
                .isSuccess());
    QCOMPARE(GeometrySettingsManager::instance().loadNormalizeRectangles(), true);

    const CLIResult result = handler.process(
        {"rotorect", "torect", "--fixed", "0,2", "--moving", "3,3", "--handle", "bottom-right"});
    QVERIFY2(result.isSuccess(), qPrintable(result.message));
    QCOMPARE(result.message, QString("0,2,3,1"));
}

void tst_ConfigCommand::set_rejectsInvalidValues_data()
{
    QTest::addColumn<QString>("key");
    QTest::addColumn<QString>("value");
    QTest::addColumn<QString>("expectedMessage");

    QTest::newRow("precision text") << "output/precision" << "many" << "Invalid precision value";
    QTest::newRow("precision range") << "output/precision" << "16" << "Invalid precision value";
    QTest::newRow("json flag") << "output/json" << "maybe" << "Invalid boolean value";
    QTest::newRow("unknown key") << "output/colour" << "red" << "Setting not found";
}

void tst_ConfigCommand::set_rejectsInvalidValues()
{
    QFETCH(QString, key);
    QFETCH(QString, value);
    QFETCH(QString, expectedMessage);

    CLIHandler handler;
    const CLIResult result = handler.process({"rotorect", "config", "--set", key, value});
    QCOMPARE(result.code, CLIResult::Code::InvalidArguments);
    QVERIFY2(result.message.contains(expectedMessage), qPrintable(result.message));
}

void tst_ConfigCommand::get_rejectsUnknownKey()
{
    CLIHandler handler;
    const CLIResult result = handler.process({"rotorect", "config", "--get", "hotkey"});
    QCOMPARE(result.code, CLIResult::Code::InvalidArguments);
    QVERIFY(result.message.contains("Setting not found: hotkey"));
}

void tst_ConfigCommand::reset_restoresDefaults()
{
    GeometrySettingsManager& manager = GeometrySettingsManager::instance();
    manager.saveOutputPrecision(2);
    manager.saveJsonOutput(true);

    CLIHandler handler;
    const CLIResult result = handler.process({"rotorect", "config", "--reset"});
    QVERIFY2(result.isSuccess(), qPrintable(result.message));

    QCOMPARE(manager.loadOutputPrecision(), GeometrySettingsManager::kDefaultOutputPrecision);
    QCOMPARE(manager.loadJsonOutput(), GeometrySettingsManager::kDefaultJsonOutput);
}

void tst_ConfigCommand::noAction_isRejected()
{
    CLIHandler handler;
    const CLIResult result = handler.process({"rotorect", "config"});
    QCOMPARE(result.code, CLIResult::Code::InvalidArguments);
}

QTEST_MAIN(tst_ConfigCommand)
#include "tst_ConfigCommand.moc"
