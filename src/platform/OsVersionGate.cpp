#include "platform/OsVersionGate.h"

#include <QDebug>
#include <QGuiApplication>
#include <QScreen>
#include <QStringList>
#include <QSysInfo>
#include <QtGlobal>

#ifdef Q_OS_MACOS
#include <ApplicationServices/ApplicationServices.h>
#endif

namespace PressHold {

namespace {

bool isHeadlessPlatform(const QString& platformName)
{
    return platformName == QLatin1String("offscreen")
        || platformName == QLatin1String("minimal");
}

// "offscreen:fontengine=freetype" names the offscreen plugin
QString pluginName(const QString& qpaPlatform)
{
    return qpaPlatform.section(QLatin1Char(':'), 0, 0).trimmed();
}

} // namespace

int OsVersionGate::parseVersionSignature(const QString& version)
{
    if (version.isEmpty()) {
        return 0;
    }

    const QStringList components = version.split(QLatin1Char('.'));
    QString majorMinor = components.first();
    if (components.size() > 1) {
        majorMinor += components.at(1);
    }

    bool ok = false;
    const int signature = majorMinor.toInt(&ok);
    return ok ? signature : 0;
}

bool OsVersionGate::isMacOs(const QString& productType)
{
    return productType == QLatin1String("macos") || productType == QLatin1String("osx");
}

OsVersionGate::Decision OsVersionGate::evaluate(const Environment& environment, int minimumSignature)
{
    Decision decision;

    if (!environment.hasDisplay || isHeadlessPlatform(environment.platformName)) {
        decision.verdict = Verdict::EnvironmentError;
        decision.message = headlessMessage();
        return decision;
    }

    if (!isMacOs(environment.productType)) {
        decision.verdict = Verdict::Skip;
        decision.message = QStringLiteral("TEST SKIPPED: No Press&Hold feature on %1")
                               .arg(environment.productType.isEmpty()
                                        ? QStringLiteral("this platform")
                                        : environment.productType);
        return decision;
    }

    decision.signature = parseVersionSignature(environment.productVersion);
    if (decision.signature == 0) {
        decision.verdict = Verdict::EnvironmentError;
        decision.message = QStringLiteral("ERROR: Cannot determine MacOS version");
        return decision;
    }

    if (decision.signature < minimumSignature) {
        decision.verdict = Verdict::Skip;
        decision.message = QStringLiteral(
            "TEST SKIPPED: No Press&Hold feature for Snow Leopard or lower MacOS version");
        return decision;
    }

    decision.verdict = Verdict::Run;
    return decision;
}

QString OsVersionGate::headlessMessage()
{
    return QStringLiteral("ERROR: Cannot execute the test in headless environment");
}

bool OsVersionGate::canReachDisplay(const DisplayHints& hints)
{
    const QString plugin = pluginName(hints.qpaPlatform);

    // Starts without a server; evaluate() reports it as headless later
    if (isHeadlessPlatform(plugin)) {
        return true;
    }
    if (plugin == QLatin1String("xcb")) {
        return !hints.x11Display.isEmpty();
    }
    if (plugin.startsWith(QLatin1String("wayland"))) {
        return !hints.waylandDisplay.isEmpty();
    }
    if (!plugin.isEmpty()) {
        // eglfs, linuxfb, vnc and similar draw without a display server
        return true;
    }
    return !hints.x11Display.isEmpty() || !hints.waylandDisplay.isEmpty();
}

bool OsVersionGate::displayServerAvailable(const QString& platformArgument)
{
    DisplayHints hints;
    hints.qpaPlatform = platformArgument.isEmpty()
        ? qEnvironmentVariable("QT_QPA_PLATFORM")
        : platformArgument;
    hints.x11Display = qEnvironmentVariable("DISPLAY");
    hints.waylandDisplay = qEnvironmentVariable("WAYLAND_DISPLAY");

#if defined(Q_OS_MACOS)
    if (isHeadlessPlatform(pluginName(hints.qpaPlatform))) {
        return true;
    }
    // No dictionary without a window server login session, e.g. over SSH
    CFDictionaryRef session = CGSessionCopyCurrentDictionary();
    if (!session) {
        qWarning() << "OsVersionGate: No window server session";
        return false;
    }
    CFRelease(session);
    return true;
#elif defined(Q_OS_WIN)
    Q_UNUSED(hints);
    return true;
#else
    const bool reachable = canReachDisplay(hints);
    if (!reachable) {
        qWarning() << "OsVersionGate: No display server for platform" << hints.qpaPlatform;
    }
    return reachable;
#endif
}

OsVersionGate::Environment OsVersionGate::currentEnvironment()
{
    Environment environment;
    environment.platformName = QGuiApplication::platformName();
    environment.hasDisplay = !QGuiApplication::screens().isEmpty();
    environment.productType = QSysInfo::productType();
    environment.productVersion = QSysInfo::productVersion();

    qDebug() << "OsVersionGate: Platform" << environment.platformName
             << "product" << environment.productType << environment.productVersion
             << "screens" << QGuiApplication::screens().size();
    return environment;
}

} // namespace PressHold
