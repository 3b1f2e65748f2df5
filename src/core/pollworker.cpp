// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "pollworker.h"
#include "workqueue.h"
#include "interfaces.h"
#include "constants.h"
#include "logging.h"
#include <KLocalizedString>
#include <exception>

namespace VirtDeck {

PollWorker::PollWorker(WorkQueue* queue, QObject* parent)
    : QThread(parent)
    , m_queue(queue)
{
    Q_ASSERT(queue);
    setObjectName(QStringLiteral("virtdeck-poll"));
}

PollWorker::~PollWorker()
{
    if (stop(Defaults::PollWorkerStopTimeoutMs)) {
        return;
    }
    // QThread must not be destroyed while run() is still inside a backend call
    qCWarning(lcScheduler) << "Waiting for the poll in progress to return";
    wait();
}

bool PollWorker::stop(int timeoutMs)
{
    m_queue->shutdown();
    if (!isRunning()) {
        return true;
    }
    if (!wait(timeoutMs)) {
        qCWarning(lcScheduler) << "Poll worker did not stop within" << timeoutMs << "ms";
        return false;
    }
    return true;
}

void PollWorker::run()
{
    qCDebug(lcScheduler) << "Poll worker started";

    while (true) {
        std::optional<WorkItem> item = m_queue->dequeue();
        if (!item) {
            break;
        }

        const QString uri = item->connection ? item->connection->uri() : QString();
        PollResult result;

        if (!item->connection) {
            result = PollResult::failure(QStringLiteral("Connection released before poll"));
        } else {
            try {
                result = item->connection->tickFromEngine(item->request);
            } catch (const std::exception& e) {
                result = PollResult::failure(QString::fromLocal8Bit(e.what()),
                                             QStringLiteral("Exception thrown from poll of %1").arg(uri));
            }
        }

        // Drop our reference before blocking on the next item
        item.reset();

        if (!result.success) {
            const QString message = i18n("Error polling connection '%1': %2", uri, result.errorMessage);
            qCWarning(lcScheduler) << "Poll failed uri=" << uri << "error=" << result.errorMessage
                                   << "details=" << result.details;
            Q_EMIT pollFailed(uri, message, result.details);
        }

        m_processed.fetchAndAddRelaxed(1);
        Q_EMIT pollCompleted(uri);
    }

    qCDebug(lcScheduler) << "Poll worker stopped";
}

} // namespace VirtDeck
