#ifndef SCENARIO_H
#define SCENARIO_H

#include <QString>
#include <QVector>

namespace PressHold {

/**
 * @brief One way of leaving the accent popup and the text it must leave behind.
 */
struct Scenario {
    QString name;
    int followUpKey = 0;      // Qt::Key pressed while the popup is open
    QString expected;
};

struct ScenarioOutcome {
    QString name;
    QString expected;
    QString received;
    QString textBefore;       // Observed text right before the scenario started

    bool passed() const { return expected == received; }
    QString mismatchLine() const;
};

namespace Scenarios {

int sampleKey();
QString samplePhrase();

// Sample phrase without its first character, typed after the popup
QString sampleBody();

QString pressAndHoldDisabled();

// Accept accent, backspace, escape, mistyped digit
QVector<Scenario> all();

}  // namespace Scenarios

} // namespace PressHold

#endif // SCENARIO_H
