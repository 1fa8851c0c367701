#include <QtTest/QtTest>
#include <QSettings>
#include "scenario/ProbeOptions.h"
#include "settings/ProbeSettingsManager.h"
#include "settings/Settings.h"

using PressHold::KeyInjectorBackend;
using PressHold::ProbeOptions;
using PressHold::ProbeSettingsManager;

/**
 * @brief Unit tests for ProbeSettingsManager singleton class.
 *
 * Tests settings persistence including:
 * - Singleton pattern
 * - Pause and auto delay settings
 * - Hold repeat count settings
 * - Minimum OS version settings
 * - Injector backend settings and parsing
 * - Value clamping/validation
 */
class tst_ProbeSettingsManager : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // Singleton tests
    void testSingletonInstance();

    // Pause tests
    void testLoadPauseMs_DefaultValue();
    void testSaveLoadPauseMs_Roundtrip();
    void testLoadPauseMs_ClampMin();
    void testLoadPauseMs_ClampMax();

    // Auto delay tests
    void testLoadAutoDelayMs_DefaultValue();
    void testSaveLoadAutoDelayMs_Roundtrip();
    void testLoadAutoDelayMs_ClampMax();

    // Hold repeat count tests
    void testLoadHoldRepeatCount_DefaultValue();
    void testLoadHoldRepeatCount_ClampMin();
    void testLoadHoldRepeatCount_ClampMax();

    // Minimum OS version tests
    void testLoadMinimumOsVersion_DefaultValue();
    void testSaveLoadMinimumOsVersion_Roundtrip();
    void testLoadMinimumOsVersion_InvalidFallsBack();

    // Backend tests
    void testLoadInjectorBackend_DefaultValue();
    void testSaveLoadInjectorBackend_Roundtrip();
    void testLoadInjectorBackend_UnknownFallsBack();
    void testBackendFromString_data();
    void testBackendFromString();

    // Aggregate
    void testLoadOptions_ReflectsStoredValues();

    // Constants tests
    void testConstants_DefaultValues();

private:
    void clearAllTestSettings();
};

void tst_ProbeSettingsManager::init()
{
    clearAllTestSettings();
}

void tst_ProbeSettingsManager::cleanup()
{
    clearAllTestSettings();
}

void tst_ProbeSettingsManager::clearAllTestSettings()
{
    auto settings = PressHold::getSettings();
    settings.remove(ProbeSettingsManager::kSettingsKeyPauseMs);
    settings.remove(ProbeSettingsManager::kSettingsKeyAutoDelayMs);
    settings.remove(ProbeSettingsManager::kSettingsKeyHoldRepeatCount);
    settings.remove(ProbeSettingsManager::kSettingsKeyMinimumOsVersion);
    settings.remove(ProbeSettingsManager::kSettingsKeyInjectorBackend);
    settings.sync();
}

// ============================================================================
// Singleton Tests
// ============================================================================

void tst_ProbeSettingsManager::testSingletonInstance()
{
    ProbeSettingsManager& instance1 = ProbeSettingsManager::instance();
    ProbeSettingsManager& instance2 = ProbeSettingsManager::instance();

    QCOMPARE(&instance1, &instance2);
}

// ============================================================================
// Pause Tests
// ============================================================================

void tst_ProbeSettingsManager::testLoadPauseMs_DefaultValue()
{
    QCOMPARE(ProbeSettingsManager::instance().loadPauseMs(), 2000);
}

void tst_ProbeSettingsManager::testSaveLoadPauseMs_Roundtrip()
{
    ProbeSettingsManager& manager = ProbeSettingsManager::instance();

    manager.savePauseMs(500);
    QCOMPARE(manager.loadPauseMs(), 500);

    manager.savePauseMs(0);
    QCOMPARE(manager.loadPauseMs(), 0);
}

void tst_ProbeSettingsManager::testLoadPauseMs_ClampMin()
{
    auto settings = PressHold::getSettings();
    settings.setValue(ProbeSettingsManager::kSettingsKeyPauseMs, -10);
    settings.sync();

    QCOMPARE(ProbeSettingsManager::instance().loadPauseMs(), 0);
}

void tst_ProbeSettingsManager::testLoadPauseMs_ClampMax()
{
    auto settings = PressHold::getSettings();
    settings.setValue(ProbeSettingsManager::kSettingsKeyPauseMs, 120000);
    settings.sync();

    QCOMPARE(ProbeSettingsManager::instance().loadPauseMs(), ProbeSettingsManager::kMaxPauseMs);
}

// ============================================================================
// Auto Delay Tests
// ============================================================================

void tst_ProbeSettingsManager::testLoadAutoDelayMs_DefaultValue()
{
    QCOMPARE(ProbeSettingsManager::instance().loadAutoDelayMs(), 50);
}

void tst_ProbeSettingsManager::testSaveLoadAutoDelayMs_Roundtrip()
{
    ProbeSettingsManager& manager = ProbeSettingsManager::instance();

    manager.saveAutoDelayMs(5);
    QCOMPARE(manager.loadAutoDelayMs(), 5);
}

void tst_ProbeSettingsManager::testLoadAutoDelayMs_ClampMax()
{
    auto settings = PressHold::getSettings();
    settings.setValue(ProbeSettingsManager::kSettingsKeyAutoDelayMs, 5000);
    settings.sync();

    QCOMPARE(ProbeSettingsManager::instance().loadAutoDelayMs(), ProbeSettingsManager::kMaxAutoDelayMs);
}

// ============================================================================
// Hold Repeat Count Tests
// ============================================================================

void tst_ProbeSettingsManager::testLoadHoldRepeatCount_DefaultValue()
{
    QCOMPARE(ProbeSettingsManager::instance().loadHoldRepeatCount(), 10);
}

void tst_ProbeSettingsManager::testLoadHoldRepeatCount_ClampMin()
{
    auto settings = PressHold::getSettings();
    settings.setValue(ProbeSettingsManager::kSettingsKeyHoldRepeatCount, 0);
    settings.sync();

    QCOMPARE(ProbeSettingsManager::instance().loadHoldRepeatCount(), 1);
}

void tst_ProbeSettingsManager::testLoadHoldRepeatCount_ClampMax()
{
    auto settings = PressHold::getSettings();
    settings.setValue(ProbeSettingsManager::kSettingsKeyHoldRepeatCount, 1000);
    settings.sync();

    QCOMPARE(ProbeSettingsManager::instance().loadHoldRepeatCount(),
             ProbeSettingsManager::kMaxHoldRepeatCount);
}

// ============================================================================
// Minimum OS Version Tests
// ============================================================================

void tst_ProbeSettingsManager::testLoadMinimumOsVersion_DefaultValue()
{
    QCOMPARE(ProbeSettingsManager::instance().loadMinimumOsVersion(), 107);
}

void tst_ProbeSettingsManager::testSaveLoadMinimumOsVersion_Roundtrip()
{
    ProbeSettingsManager& manager = ProbeSettingsManager::instance();

    manager.saveMinimumOsVersion(1014);
    QCOMPARE(manager.loadMinimumOsVersion(), 1014);
}

void tst_ProbeSettingsManager::testLoadMinimumOsVersion_InvalidFallsBack()
{
    auto settings = PressHold::getSettings();
    settings.setValue(ProbeSettingsManager::kSettingsKeyMinimumOsVersion, QStringLiteral("lion"));
    settings.sync();

    QCOMPARE(ProbeSettingsManager::instance().loadMinimumOsVersion(),
             ProbeSettingsManager::kDefaultMinimumOsVersion);

    settings.setValue(ProbeSettingsManager::kSettingsKeyMinimumOsVersion, -1);
    settings.sync();

    QCOMPARE(ProbeSettingsManager::instance().loadMinimumOsVersion(),
             ProbeSettingsManager::kDefaultMinimumOsVersion);
}

// ============================================================================
// Backend Tests
// ============================================================================

void tst_ProbeSettingsManager::testLoadInjectorBackend_DefaultValue()
{
    QCOMPARE(ProbeSettingsManager::instance().loadInjectorBackend(), KeyInjectorBackend::Native);
}

void tst_ProbeSettingsManager::testSaveLoadInjectorBackend_Roundtrip()
{
    ProbeSettingsManager& manager = ProbeSettingsManager::instance();

    manager.saveInjectorBackend(KeyInjectorBackend::Synthetic);
    QCOMPARE(manager.loadInjectorBackend(), KeyInjectorBackend::Synthetic);

    auto settings = PressHold::getSettings();
    QCOMPARE(settings.value(ProbeSettingsManager::kSettingsKeyInjectorBackend).toString(),
             QStringLiteral("synthetic"));
}

void tst_ProbeSettingsManager::testLoadInjectorBackend_UnknownFallsBack()
{
    auto settings = PressHold::getSettings();
    settings.setValue(ProbeSettingsManager::kSettingsKeyInjectorBackend, QStringLiteral("xdotool"));
    settings.sync();

    QCOMPARE(ProbeSettingsManager::instance().loadInjectorBackend(),
             ProbeSettingsManager::kDefaultInjectorBackend);
}

void tst_ProbeSettingsManager::testBackendFromString_data()
{
    QTest::addColumn<QString>("name");
    QTest::addColumn<bool>("valid");
    QTest::addColumn<int>("backend");

    QTest::newRow("native") << "native" << true << int(KeyInjectorBackend::Native);
    QTest::newRow("synthetic") << "synthetic" << true << int(KeyInjectorBackend::Synthetic);
    QTest::newRow("mixed case") << " Synthetic " << true << int(KeyInjectorBackend::Synthetic);
    QTest::newRow("empty") << "" << false << int(KeyInjectorBackend::Native);
    QTest::newRow("unknown") << "cgevent" << false << int(KeyInjectorBackend::Native);
}

void tst_ProbeSettingsManager::testBackendFromString()
{
    QFETCH(QString, name);
    QFETCH(bool, valid);
    QFETCH(int, backend);

    KeyInjectorBackend parsed = KeyInjectorBackend::Native;
    QCOMPARE(ProbeSettingsManager::backendFromString(name, &parsed), valid);
    QCOMPARE(int(parsed), backend);
}

// ============================================================================
// Aggregate Tests
// ============================================================================

void tst_ProbeSettingsManager::testLoadOptions_ReflectsStoredValues()
{
    ProbeSettingsManager& manager = ProbeSettingsManager::instance();
    manager.savePauseMs(300);
    manager.saveAutoDelayMs(10);
    manager.saveHoldRepeatCount(12);
    manager.saveMinimumOsVersion(1100);
    manager.saveInjectorBackend(KeyInjectorBackend::Synthetic);

    const ProbeOptions options = manager.loadOptions();
    QCOMPARE(options.pauseMs, 300);
    QCOMPARE(options.autoDelayMs, 10);
    QCOMPARE(options.holdRepeatCount, 12);
    QCOMPARE(options.minimumOsVersion, 1100);
    QCOMPARE(options.backend, KeyInjectorBackend::Synthetic);
}

// ============================================================================
// Constants Tests
// ============================================================================

void tst_ProbeSettingsManager::testConstants_DefaultValues()
{
    QCOMPARE(ProbeSettingsManager::kDefaultPauseMs, 2000);
    QCOMPARE(ProbeSettingsManager::kDefaultAutoDelayMs, 50);
    QCOMPARE(ProbeSettingsManager::kDefaultHoldRepeatCount, 10);
    QCOMPARE(ProbeSettingsManager::kDefaultMinimumOsVersion, 107);
    QCOMPARE(ProbeSettingsManager::kDefaultInjectorBackend, KeyInjectorBackend::Native);
}

QTEST_MAIN(tst_ProbeSettingsManager)
#include "tst_ProbeSettingsManager.moc"
