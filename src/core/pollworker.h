// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "virtdeck_export.h"
#include <QThread>

namespace VirtDeck {

class WorkQueue;

/**
 * @brief Dedicated background thread draining the poll queue
 *
 * Takes one item at a time and calls IConnection::tickFromEngine() on it.
 * A failing or throwing poll is reported through pollFailed() and never
 * stops the loop. Signals are emitted from the worker thread, so receivers
 * living on the foreground thread get them queued.
 */
class VIRTDECK_EXPORT PollWorker : public QThread
{
    Q_OBJECT

public:
    explicit PollWorker(WorkQueue* queue, QObject* parent = nullptr);
    ~PollWorker() override;

    /**
     * @brief Shut the queue down and wait for the loop to return
     * @return false if the thread did not finish within the timeout
     */
    bool stop(int timeoutMs);

    int processedCount() const
    {
        return m_processed.loadRelaxed();
    }

Q_SIGNALS:
    void pollFailed(const QString& uri, const QString& message, const QString& details);
    void pollCompleted(const QString& uri);

protected:
    void run() override;

private:
    WorkQueue* m_queue;
    QAtomicInt m_processed = 0;
};

} // namespace VirtDeck
