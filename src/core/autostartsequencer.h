// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "virtdeck_export.h"
#include <QObject>
#include <QStringList>

namespace VirtDeck {

class ConnectionRegistry;
class IConnection;

/**
 * @brief Opens autoconnect connections one at a time
 *
 * Each open is requested only after the previous connection settled
 * (became Active, fell back to Disconnected after Connecting, or was
 * removed), so credential prompts for several hosts never stack up.
 */
class VIRTDECK_EXPORT AutostartSequencer : public QObject
{
    Q_OBJECT

public:
    explicit AutostartSequencer(ConnectionRegistry* registry, QObject* parent = nullptr);
    ~AutostartSequencer() override;

    /// Sequence every registered connection flagged autoconnect
    void start();

    /// Sequence an explicit URI list
    void start(const QStringList& uris);

    bool isRunning() const
    {
        return !m_current.isEmpty();
    }
    QString currentUri() const
    {
        return m_current;
    }
    QStringList remaining() const
    {
        return m_remaining;
    }

Q_SIGNALS:
    void openRequested(const QString& uri);
    void finished();

private:
    void advance();
    void onStateChanged();
    void detach();

    ConnectionRegistry* m_registry;
    QStringList m_remaining;
    QString m_current;
    IConnection* m_currentConnection = nullptr;
    bool m_sawConnecting = false;
    QMetaObject::Connection m_stateHandler;
};

} // namespace VirtDeck
