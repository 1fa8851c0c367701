#include "scenario/Scenario.h"

#include "Constants.h"

namespace PressHold {

QString ScenarioOutcome::mismatchLine() const
{
    return QStringLiteral("Bad sample: expected \"%1\", but received \"%2\"").arg(expected, received);
}

namespace Scenarios {

int sampleKey()
{
    return Qt::Key_E;
}

QString samplePhrase()
{
    return QString::fromUtf8(Sample::kPhrase);
}

QString sampleBody()
{
    return samplePhrase().mid(1);
}

QString pressAndHoldDisabled()
{
    return QString::fromLatin1(Sample::kPressAndHoldDisabled);
}

QVector<Scenario> all()
{
    return {
        {QStringLiteral("accent"), Qt::Key_2, samplePhrase()},
        {QStringLiteral("backspace"), Qt::Key_Backspace, QString::fromLatin1(Sample::kBackspace)},
        {QStringLiteral("no-accent"), Qt::Key_Escape, QString::fromLatin1(Sample::kNoAccent)},
        {QStringLiteral("misprint"), Qt::Key_0, QString::fromLatin1(Sample::kMisprint)},
    };
}

}  // namespace Scenarios

} // namespace PressHold
