#include <QtTest/QtTest>
#include <QTemporaryDir>

#include "core/shared/settings_manager.h"

class TestSettingsManager : public QObject {
    Q_OBJECT

private slots:
    void testDefaults();
    void testSaveAndLoadRoundTrip();
    void testMissingKeysKeepDefaults();
    void testOutOfRangeValuesKeepDefaults();
    void testMissingFileReturnsNullopt();
    void testCorruptFileReturnsNullopt();
    void testDataDirOverride();
};

void TestSettingsManager::testDefaults()
{
    const rw::Settings settings;
    QCOMPARE(settings.defaults.topK, 3);
    QCOMPARE(settings.defaults.minScoreThreshold, 0.3);
    QCOMPARE(settings.defaults.roadType, QStringLiteral("urban"));
    QCOMPARE(settings.weights.roadTypeBoost, 0.15);
    QCOMPARE(settings.weights.environmentBoostCap, 0.25);
    QVERIFY(settings.kbPath.isEmpty());
}

void TestSettingsManager::testSaveAndLoadRoundTrip()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.path() + "/nested/settings.json";

    rw::Settings settings;
    settings.kbPath = QStringLiteral("/srv/roadwise/interventions.csv");
    settings.defaults.topK = 5;
    settings.defaults.minScoreThreshold = 0.45;
    settings.defaults.roadType = QStringLiteral("rural");
    settings.weights.environmentBoostCap = 0.2;
    settings.weights.fuzzyMatchFloor = 0.8;

    QVERIFY(rw::SettingsManager::saveToFile(settings, path));
    QVERIFY(QFile::exists(path));

    const std::optional<rw::Settings> loaded = rw::SettingsManager::loadFromFile(path);
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->kbPath, settings.kbPath);
    QCOMPARE(loaded->defaults.topK, 5);
    QCOMPARE(loaded->defaults.minScoreThreshold, 0.45);
    QCOMPARE(loaded->defaults.roadType, QStringLiteral("rural"));
    QCOMPARE(loaded->weights.environmentBoostCap, 0.2);
    QCOMPARE(loaded->weights.fuzzyMatchFloor, 0.8);
    QCOMPARE(loaded->weights.highPriorityWeight, 0.03);
}

void TestSettingsManager::testMissingKeysKeepDefaults()
{
    QJsonObject json;
    json.insert(QStringLiteral("defaultTopK"), 7);
    QJsonObject weights;
    weights.insert(QStringLiteral("lowPriorityWeight"), 0.001);
    json.insert(QStringLiteral("weights"), weights);

    const rw::Settings settings = rw::SettingsManager::fromJson(json);
    QCOMPARE(settings.defaults.topK, 7);
    QCOMPARE(settings.defaults.minScoreThreshold, 0.3);
    QCOMPARE(settings.defaults.roadType, QStringLiteral("urban"));
    QCOMPARE(settings.weights.lowPriorityWeight, 0.001);
    QCOMPARE(settings.weights.roadTypeBoost, 0.15);
}

void TestSettingsManager::testOutOfRangeValuesKeepDefaults()
{
    QJsonObject json;
    json.insert(QStringLiteral("defaultTopK"), 0);
    json.insert(QStringLiteral("minScoreThreshold"), 1.5);
    QJsonObject weights;
    weights.insert(QStringLiteral("fuzzyMatchFloor"), 0.0);
    weights.insert(QStringLiteral("keywordAlignmentShare"), 2.0);
    weights.insert(QStringLiteral("roadTypeBoost"), -0.1);
    weights.insert(QStringLiteral("environmentBoostCap"), QStringLiteral("0.4"));
    weights.insert(QStringLiteral("highPriorityWeight"), 0.05);
    json.insert(QStringLiteral("weights"), weights);

    const rw::Settings settings = rw::SettingsManager::fromJson(json);
    QCOMPARE(settings.defaults.topK, 3);
    QCOMPARE(settings.defaults.minScoreThreshold, 0.3);
    QCOMPARE(settings.weights.fuzzyMatchFloor, 0.75);
    QCOMPARE(settings.weights.keywordAlignmentShare, 0.5);
    QCOMPARE(settings.weights.roadTypeBoost, 0.15);
    QCOMPARE(settings.weights.environmentBoostCap, 0.25);
    QCOMPARE(settings.weights.highPriorityWeight, 0.05);

    // A floor of 1.0 would reject even identical words.
    QJsonObject strictFloor;
    strictFloor.insert(QStringLiteral("fuzzyMatchFloor"), 1.0);
    QJsonObject strictJson;
    strictJson.insert(QStringLiteral("weights"), strictFloor);
    QCOMPARE(rw::SettingsManager::fromJson(strictJson).weights.fuzzyMatchFloor, 0.75);
}

void TestSettingsManager::testMissingFileReturnsNullopt()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QVERIFY(!rw::SettingsManager::loadFromFile(dir.path() + "/absent.json").has_value());
}

void TestSettingsManager::testCorruptFileReturnsNullopt()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.path() + "/settings.json";
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("{ not json");
    file.close();

    QVERIFY(!rw::SettingsManager::loadFromFile(path).has_value());
}

void TestSettingsManager::testDataDirOverride()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    qputenv("ROADWISE_DATA_DIR", dir.path().toUtf8());

    QCOMPARE(rw::SettingsManager::settingsFilePath(), dir.path() + "/settings.json");

    rw::Settings settings;
    settings.defaults.topK = 4;
    QVERIFY(rw::SettingsManager::save(settings));
    const std::optional<rw::Settings> loaded = rw::SettingsManager::load();
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->defaults.topK, 4);

    qunsetenv("ROADWISE_DATA_DIR");
    QVERIFY(rw::SettingsManager::settingsFilePath().endsWith(
        QStringLiteral("/roadwise/settings.json")));
}

QTEST_MAIN(TestSettingsManager)
#include "test_settings_manager.moc"
