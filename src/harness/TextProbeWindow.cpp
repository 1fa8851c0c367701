#include "harness/TextProbeWindow.h"

#include "Constants.h"

#include <QCoreApplication>
#include <QDebug>
#include <QEvent>
#include <QPlainTextEdit>
#include <QTextDocument>
#include <QVBoxLayout>

namespace PressHold {

TextProbeWindow::TextProbeWindow(QWidget *parent)
    : QWidget(parent)
    , m_editor(new QPlainTextEdit(this))
{
    setWindowTitle(QCoreApplication::applicationName());
    setAttribute(Qt::WA_DeleteOnClose, false);

    auto *layout = new QVBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->addWidget(m_editor);

    setGeometry(UI::ProbeWindow::kX, UI::ProbeWindow::kY,
                UI::ProbeWindow::kWidth, UI::ProbeWindow::kHeight);

    connect(m_editor->document(), &QTextDocument::contentsChange,
            this, &TextProbeWindow::onContentsChange);
}

TextProbeWindow::~TextProbeWindow()
{
    clearHandlers();
}

void TextProbeWindow::setFocusGainedHandler(FocusGainedHandler handler)
{
    m_focusGainedHandler = std::move(handler);
}

void TextProbeWindow::setTextChangedHandler(TextChangedHandler handler)
{
    m_textChangedHandler = std::move(handler);
}

void TextProbeWindow::clearHandlers()
{
    m_focusGainedHandler = nullptr;
    m_textChangedHandler = nullptr;
}

bool TextProbeWindow::hasHandlers() const
{
    return m_focusGainedHandler || m_textChangedHandler;
}

QString TextProbeWindow::text() const
{
    return m_editor->toPlainText();
}

void TextProbeWindow::clearText()
{
    m_editor->clear();
}

void TextProbeWindow::present()
{
    show();
    raise();
    activateWindow();
    m_editor->setFocus(Qt::OtherFocusReason);

    // Activation may already have happened synchronously during show()
    if (isActiveWindow() && m_focusGainedHandler) {
        m_focusGainedHandler();
    }
}

void TextProbeWindow::changeEvent(QEvent *event)
{
    QWidget::changeEvent(event);

    if (event->type() == QEvent::ActivationChange && isActiveWindow()) {
        qDebug() << "TextProbeWindow: Gained focus";
        if (m_focusGainedHandler) {
            m_focusGainedHandler();
        }
    }
}

void TextProbeWindow::onContentsChange(int position, int charsRemoved, int charsAdded)
{
    Q_UNUSED(position);

    if (charsRemoved == 0 && charsAdded == 0) {
        return;
    }

    const QString current = m_editor->toPlainText();

    // Formatting changes report equal counts over unchanged text
    if (charsRemoved == charsAdded && current == m_lastText) {
        return;
    }

    m_lastText = current;
    if (m_textChangedHandler) {
        m_textChangedHandler(current);
    }
}

} // namespace PressHold
