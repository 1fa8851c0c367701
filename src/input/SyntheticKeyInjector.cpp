#include "input/SyntheticKeyInjector.h"

#include <QApplication>
#include <QDebug>
#include <QKeyEvent>
#include <QWidget>

namespace PressHold {

SyntheticKeyInjector::SyntheticKeyInjector(QObject *uiContext, QObject *parent)
    : KeyInjector(uiContext, parent)
{
}

void SyntheticKeyInjector::keyPress(int key)
{
    const bool autoRepeat = m_pressedKeys.contains(key);
    m_pressedKeys.insert(key);
    postKeyEvent(QEvent::KeyPress, key, textForKey(key), autoRepeat);
    applyAutoDelay();
}

void SyntheticKeyInjector::keyRelease(int key)
{
    m_pressedKeys.remove(key);
    postKeyEvent(QEvent::KeyRelease, key, textForKey(key), false);
    applyAutoDelay();
}

QString SyntheticKeyInjector::textForKey(int key)
{
    switch (key) {
    case Qt::Key_Space:
        return QStringLiteral(" ");
    case Qt::Key_Tab:
        return QStringLiteral("\t");
    case Qt::Key_Return:
    case Qt::Key_Enter:
        return QStringLiteral("\r");
    default:
        break;
    }

    // Printable keys carry their upper case code point
    if (key > 0x20 && key <= 0xffff) {
        const QChar ch(static_cast<char16_t>(key));
        if (ch.isPrint()) {
            return QString(ch.toLower());
        }
    }
    return QString();
}

void SyntheticKeyInjector::postKeyEvent(QEvent::Type type, int key, const QString &text, bool autoRepeat)
{
    QObject *context = uiContext();
    if (!context) {
        qWarning() << "SyntheticKeyInjector: UI context gone, dropping key" << key;
        return;
    }

    QMetaObject::invokeMethod(context, [type, key, text, autoRepeat]() {
        QWidget *target = QApplication::focusWidget();
        if (!target) {
            qWarning() << "SyntheticKeyInjector: No focus widget for key" << key;
            return;
        }
        QKeyEvent event(type, key, Qt::NoModifier, text, autoRepeat);
        QCoreApplication::sendEvent(target, &event);
    }, Qt::QueuedConnection);
}

} // namespace PressHold
