#include "scenario/ScenarioThread.h"

#include <QDebug>
#include <QMutexLocker>

namespace PressHold {

ScenarioThread::ScenarioThread(QObject *parent)
    : QThread(parent)
{
    setObjectName(QStringLiteral("ScenarioThread"));
}

ScenarioThread::~ScenarioThread()
{
    wait();
}

void ScenarioThread::initialize(ScenarioRunner *runner)
{
    m_runner = runner;
}

RunReport ScenarioThread::report() const
{
    QMutexLocker locker(&m_mutex);
    return m_report;
}

void ScenarioThread::run()
{
    if (!m_runner) {
        qWarning() << "ScenarioThread: Started without a runner";
        return;
    }

    qDebug() << "ScenarioThread: Running scenarios";
    const RunReport result = m_runner->run();

    QMutexLocker locker(&m_mutex);
    m_report = result;
}

} // namespace PressHold
