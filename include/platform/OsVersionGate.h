#ifndef OSVERSIONGATE_H
#define OSVERSIONGATE_H

#include <QString>

namespace PressHold {

/**
 * @brief Decides whether the Press and Hold probe can run on this host.
 *
 * The decision is made once at startup from the display state and the
 * operating system version. Nothing is shown or injected before it.
 */
class OsVersionGate
{
public:
    struct Environment {
        bool hasDisplay = false;
        QString productType;      // QSysInfo::productType(), e.g. "macos"
        QString productVersion;   // QSysInfo::productVersion(), e.g. "14.4"
        QString platformName;     // QGuiApplication::platformName()
    };

    // What Qt's platform plugin uses to reach a display server
    struct DisplayHints {
        QString qpaPlatform;      // QT_QPA_PLATFORM or -platform, e.g. "xcb"
        QString x11Display;       // DISPLAY
        QString waylandDisplay;   // WAYLAND_DISPLAY
    };

    enum class Verdict {
        Run,
        Skip,
        EnvironmentError
    };

    struct Decision {
        Verdict verdict = Verdict::EnvironmentError;
        int signature = 0;
        QString message;

        bool shouldRun() const { return verdict == Verdict::Run; }
    };

    OsVersionGate() = delete;

    /**
     * @brief Concatenates the major and minor version components.
     *
     * "10.14.6" gives 1014, "10.6" gives 106, "11.2" gives 112 and a bare
     * "12" gives 12. Returns 0 when the string is empty or the components
     * do not form a decimal integer.
     */
    static int parseVersionSignature(const QString& version);

    static Decision evaluate(const Environment& environment, int minimumSignature);

    // Reads the running application's display and OS version.
    static Environment currentEnvironment();

    static bool isMacOs(const QString& productType);

    /**
     * @brief Whether a GUI application can be created on this host.
     *
     * Needs no QCoreApplication. A false result means constructing
     * QApplication would abort inside the platform plugin.
     * @param platformArgument Value of a -platform argument, overrides QT_QPA_PLATFORM
     */
    static bool displayServerAvailable(const QString& platformArgument = QString());

    // X11 and Wayland rule used on Unix hosts other than macOS
    static bool canReachDisplay(const DisplayHints& hints);

    static QString headlessMessage();
};

} // namespace PressHold

#endif // OSVERSIONGATE_H
