// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "virtdeck_export.h"
#include "types.h"
#include <QObject>
#include <QSharedPointer>
#include <QTimer>

namespace VirtDeck {

class WorkQueue;
class ConnectionRegistry;
class IConnection;

/**
 * @brief Foreground timer feeding periodic polls into the work queue
 *
 * Each tick enqueues one LOW priority PollRequest::periodic() per registered
 * connection. Connections can additionally ask for a single HIGH priority
 * poll through schedulePriorityTick().
 */
class VIRTDECK_EXPORT TickScheduler : public QObject
{
    Q_OBJECT

public:
    TickScheduler(WorkQueue* queue, ConnectionRegistry* registry, QObject* parent = nullptr);
    ~TickScheduler() override;

    int intervalSeconds() const
    {
        return m_intervalSeconds;
    }

    /**
     * @brief Change the period, re-arming the timer if it is running
     */
    void setIntervalSeconds(int seconds);

    void start();
    void stop();
    bool isActive() const
    {
        return m_timer.isActive();
    }

    /**
     * @brief Enqueue a periodic poll for every registered connection now
     * @return Number of requests the queue accepted
     */
    int tick();

    /**
     * @brief Enqueue a single HIGH priority poll for one connection
     */
    bool schedulePriorityTick(const QSharedPointer<IConnection>& connection, const PollRequest& request);

Q_SIGNALS:
    void ticked(int accepted);

private:
    WorkQueue* m_queue;
    ConnectionRegistry* m_registry;
    QTimer m_timer;
    int m_intervalSeconds;
};

} // namespace VirtDeck
