#ifndef TEXTPROBEWINDOW_H
#define TEXTPROBEWINDOW_H

#include <QString>
#include <QWidget>
#include <functional>

class QPlainTextEdit;

namespace PressHold {

/**
 * @brief Top-level window with a single plain text entry field.
 *
 * Listeners are plain callbacks registered per capability. All methods
 * must be called on the UI thread.
 */
class TextProbeWindow : public QWidget
{
    Q_OBJECT

public:
    using FocusGainedHandler = std::function<void()>;
    using TextChangedHandler = std::function<void(const QString&)>;

    explicit TextProbeWindow(QWidget *parent = nullptr);
    ~TextProbeWindow() override;

    void setFocusGainedHandler(FocusGainedHandler handler);
    void setTextChangedHandler(TextChangedHandler handler);
    void clearHandlers();

    bool hasHandlers() const;

    QString text() const;
    void clearText();

    QPlainTextEdit* editor() const { return m_editor; }

    /**
     * @brief Show, raise and request activation with the editor focused.
     */
    void present();

protected:
    void changeEvent(QEvent *event) override;

private slots:
    void onContentsChange(int position, int charsRemoved, int charsAdded);

private:
    QPlainTextEdit *m_editor = nullptr;
    FocusGainedHandler m_focusGainedHandler;
    TextChangedHandler m_textChangedHandler;
    QString m_lastText;
};

} // namespace PressHold

#endif // TEXTPROBEWINDOW_H
