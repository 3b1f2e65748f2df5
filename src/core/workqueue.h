// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "virtdeck_export.h"
#include "types.h"
#include "constants.h"
#include <QMap>
#include <QMutex>
#include <QSharedPointer>
#include <QWaitCondition>
#include <optional>
#include <utility>

namespace VirtDeck {

class IConnection;

/**
 * @brief One pending poll of one connection
 */
struct VIRTDECK_EXPORT WorkItem
{
    PollPriority priority = PollPriority::Low;
    quint64 sequence = 0;
    QSharedPointer<IConnection> connection;
    PollRequest request;
};

/**
 * @brief Bounded priority queue shared by the foreground and the poll worker
 *
 * Items are ordered by (priority, insertion sequence): every HIGH item is
 * taken before any LOW item, FIFO within a priority. The foreground side
 * never blocks; a full queue drops the new item. dequeue() blocks until an
 * item is available or the queue is shut down.
 *
 * Thread-safe.
 */
class VIRTDECK_EXPORT WorkQueue
{
public:
    explicit WorkQueue(int capacity = Defaults::PollQueueCapacity);
    ~WorkQueue();

    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    /**
     * @brief Add an item without blocking
     * @return false if the queue is full or shut down (item dropped)
     *
     * The first drop of a saturation episode logs a warning; further drops
     * stay silent until the queue has drained below capacity again.
     */
    bool enqueue(PollPriority priority, const QSharedPointer<IConnection>& connection,
                 const PollRequest& request);

    /**
     * @brief Take the highest-priority item, blocking while empty
     * @return The item, or std::nullopt once the queue is shut down
     */
    std::optional<WorkItem> dequeue();

    /**
     * @brief Wake all waiters and discard pending items
     *
     * After shutdown enqueue() fails and dequeue() returns std::nullopt.
     */
    void shutdown();

    int size() const;
    int capacity() const
    {
        return m_capacity;
    }
    bool isFull() const;
    bool isDegraded() const;
    bool isShutdown() const;

private:
    using Key = std::pair<int, quint64>;

    const int m_capacity;
    mutable QMutex m_mutex;
    QWaitCondition m_notEmpty;
    QMap<Key, WorkItem> m_items;
    quint64 m_nextSequence = 0;
    bool m_degraded = false;
    bool m_shutdown = false;
};

} // namespace VirtDeck
