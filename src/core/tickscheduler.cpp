// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "tickscheduler.h"
#include "workqueue.h"
#include "connectionregistry.h"
#include "interfaces.h"
#include "constants.h"
#include "logging.h"

namespace VirtDeck {

TickScheduler::TickScheduler(WorkQueue* queue, ConnectionRegistry* registry, QObject* parent)
    : QObject(parent)
    , m_queue(queue)
    , m_registry(registry)
    , m_intervalSeconds(Defaults::PollIntervalSeconds)
{
    Q_ASSERT(queue);
    Q_ASSERT(registry);

    m_timer.setTimerType(Qt::CoarseTimer);
    m_timer.setInterval(m_intervalSeconds * 1000);
    connect(&m_timer, &QTimer::timeout, this, &TickScheduler::tick);
}

TickScheduler::~TickScheduler() = default;

void TickScheduler::setIntervalSeconds(int seconds)
{
    seconds = qBound(Defaults::MinPollIntervalSeconds, seconds, Defaults::MaxPollIntervalSeconds);
    if (seconds == m_intervalSeconds) {
        return;
    }

    m_intervalSeconds = seconds;
    m_timer.setInterval(seconds * 1000);
    // QTimer::setInterval restarts a running timer with the new period
    qCInfo(lcScheduler) << "Poll interval changed to" << seconds << "s";
}

void TickScheduler::start()
{
    m_timer.start();
    qCDebug(lcScheduler) << "Tick timer armed interval=" << m_intervalSeconds << "s";
}

void TickScheduler::stop()
{
    m_timer.stop();
}

int TickScheduler::tick()
{
    int accepted = 0;
    const PollRequest request = PollRequest::periodic();

    const QStringList uris = m_registry->uris();
    for (const QString& uri : uris) {
        if (m_queue->enqueue(PollPriority::Low, m_registry->sharedConnection(uri), request)) {
            ++accepted;
        }
    }

    Q_EMIT ticked(accepted);
    return accepted;
}

bool TickScheduler::schedulePriorityTick(const QSharedPointer<IConnection>& connection, const PollRequest& request)
{
    if (!connection) {
        return false;
    }
    qCDebug(lcScheduler) << "Priority poll requested uri=" << connection->uri();
    return m_queue->enqueue(PollPriority::High, connection, request);
}

} // namespace VirtDeck
