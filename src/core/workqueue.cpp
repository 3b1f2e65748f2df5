// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "workqueue.h"
#include "interfaces.h"
#include "logging.h"
#include <QMutexLocker>

namespace VirtDeck {

WorkQueue::WorkQueue(int capacity)
    : m_capacity(qMax(1, capacity))
{
}

WorkQueue::~WorkQueue()
{
    shutdown();
}

bool WorkQueue::enqueue(PollPriority priority, const QSharedPointer<IConnection>& connection,
                        const PollRequest& request)
{
    QMutexLocker locker(&m_mutex);

    if (m_shutdown) {
        return false;
    }

    if (m_items.size() >= m_capacity) {
        if (!m_degraded) {
            m_degraded = true;
            qCWarning(lcScheduler) << "Poll queue full at" << m_capacity
                                   << "items, dropping poll requests until it drains"
                                   << "uri=" << (connection ? connection->uri() : QString());
        }
        return false;
    }

    WorkItem item;
    item.priority = priority;
    item.sequence = m_nextSequence++;
    item.connection = connection;
    item.request = request;
    m_items.insert(Key(static_cast<int>(priority), item.sequence), item);

    m_notEmpty.wakeOne();
    return true;
}

std::optional<WorkItem> WorkQueue::dequeue()
{
    QMutexLocker locker(&m_mutex);

    while (m_items.isEmpty() && !m_shutdown) {
        m_notEmpty.wait(&m_mutex);
    }

    if (m_shutdown) {
        return std::nullopt;
    }

    WorkItem item = m_items.take(m_items.firstKey());

    if (m_degraded && m_items.size() < m_capacity) {
        m_degraded = false;
        qCInfo(lcScheduler) << "Poll queue drained, accepting requests again size=" << m_items.size();
    }

    return item;
}

void WorkQueue::shutdown()
{
    QMutexLocker locker(&m_mutex);
    if (m_shutdown) {
        return;
    }
    m_shutdown = true;
    if (!m_items.isEmpty()) {
        qCDebug(lcScheduler) << "Discarding" << m_items.size() << "pending poll requests on shutdown";
    }
    m_items.clear();
    m_notEmpty.wakeAll();
}

int WorkQueue::size() const
{
    QMutexLocker locker(&m_mutex);
    return m_items.size();
}

bool WorkQueue::isFull() const
{
    QMutexLocker locker(&m_mutex);
    return m_items.size() >= m_capacity;
}

bool WorkQueue::isDegraded() const
{
    QMutexLocker locker(&m_mutex);
    return m_degraded;
}

bool WorkQueue::isShutdown() const
{
    QMutexLocker locker(&m_mutex);
    return m_shutdown;
}

} // namespace VirtDeck
