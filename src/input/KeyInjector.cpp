#include "input/KeyInjector.h"
#include "input/SyntheticKeyInjector.h"

#include "Constants.h"

#include <QCoreApplication>
#include <QDebug>
#include <QEventLoop>
#include <QThread>
#include <QTimer>

namespace PressHold {

KeyInjector* createNativeKeyInjector(QObject *uiContext, QString *errorMessage, QObject *parent);

namespace {

bool isOnThreadOf(const QObject *object)
{
    return object && QThread::currentThread() == object->thread();
}

} // namespace

KeyInjector::KeyInjector(QObject *uiContext, QObject *parent)
    : QObject(parent)
    , m_uiContext(uiContext)
{
}

void KeyInjector::setAutoDelay(int ms)
{
    m_autoDelayMs = qMax(0, ms);
}

void KeyInjector::delay(int ms)
{
    if (ms <= 0) {
        return;
    }

    // Sleeping on the UI thread would stall the events being waited for
    if (isOnThreadOf(m_uiContext.data())) {
        QEventLoop loop;
        QTimer::singleShot(ms, &loop, &QEventLoop::quit);
        loop.exec();
        return;
    }

    QThread::msleep(static_cast<unsigned long>(ms));
}

void KeyInjector::applyAutoDelay()
{
    delay(m_autoDelayMs);
}

void KeyInjector::waitForIdle()
{
    QObject *context = m_uiContext.data();
    if (!context) {
        qWarning() << "KeyInjector: No UI context, cannot wait for idle";
        return;
    }

    auto flush = [] {
        QCoreApplication::processEvents(QEventLoop::AllEvents, Timer::kIdleFlush);
    };

    if (isOnThreadOf(context)) {
        flush();
        flush();
        return;
    }

    // First round drains what was queued before the call, second round
    // picks up events those handlers posted in turn.
    for (int round = 0; round < 2; ++round) {
        QMetaObject::invokeMethod(context, flush, Qt::BlockingQueuedConnection);
    }
}

void KeyInjector::holdKey(int key, int repeatCount)
{
    waitForIdle();
    for (int i = 0; i < repeatCount; ++i) {
        keyPress(key);
    }
    keyRelease(key);
}

void KeyInjector::typeText(const QString &text)
{
    for (const QChar ch : text) {
        const int key = keyCodeForChar(ch);
        if (key == Qt::Key_unknown) {
            qWarning() << "KeyInjector: No key code for character" << ch;
            continue;
        }
        keyPress(key);
        keyRelease(key);
    }
}

int KeyInjector::keyCodeForChar(QChar ch)
{
    if (ch.isNull() || !ch.isPrint()) {
        return Qt::Key_unknown;
    }

    const ushort code = ch.toUpper().unicode();
    if (code >= 'A' && code <= 'Z') {
        return Qt::Key_A + (code - 'A');
    }
    if (code >= '0' && code <= '9') {
        return Qt::Key_0 + (code - '0');
    }

    // Qt key codes of printable Latin-1 and Unicode keys equal their code point
    return code;
}

KeyInjector* KeyInjector::create(KeyInjectorBackend backend, QObject *uiContext,
                                 QString *errorMessage, QObject *parent)
{
    if (!uiContext) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("No UI context to deliver events to");
        }
        return nullptr;
    }

    KeyInjector *injector = nullptr;
    switch (backend) {
    case KeyInjectorBackend::Native:
        injector = createNativeKeyInjector(uiContext, errorMessage, parent);
        break;
    case KeyInjectorBackend::Synthetic:
        injector = new SyntheticKeyInjector(uiContext, parent);
        break;
    }

    if (injector) {
        qDebug() << "KeyInjector: Created" << injector->backendName() << "injector";
    }
    return injector;
}

} // namespace PressHold
