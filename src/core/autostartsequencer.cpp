// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "autostartsequencer.h"
#include "connectionregistry.h"
#include "interfaces.h"
#include "logging.h"

namespace VirtDeck {

AutostartSequencer::AutostartSequencer(ConnectionRegistry* registry, QObject* parent)
    : QObject(parent)
    , m_registry(registry)
{
    Q_ASSERT(registry);

    connect(m_registry, &ConnectionRegistry::connectionRemoved, this, [this](const QString& uri) {
        if (uri == m_current) {
            qCDebug(lcConnection) << "Autostart target removed uri=" << uri;
            detach();
            advance();
        }
    });
}

AutostartSequencer::~AutostartSequencer()
{
    detach();
}

void AutostartSequencer::start()
{
    QStringList uris;
    const QStringList registered = m_registry->uris();
    for (const QString& uri : registered) {
        IConnection* connection = m_registry->connection(uri);
        if (connection && connection->autoconnect()) {
            uris.append(uri);
        }
    }
    start(uris);
}

void AutostartSequencer::start(const QStringList& uris)
{
    if (isRunning()) {
        // Extend the running sequence instead of starting a parallel one
        for (const QString& uri : uris) {
            if (uri != m_current && !m_remaining.contains(uri)) {
                m_remaining.append(uri);
            }
        }
        return;
    }

    m_remaining = uris;
    qCInfo(lcConnection) << "Autostarting" << uris.size() << "connections";
    advance();
}

void AutostartSequencer::advance()
{
    while (!m_remaining.isEmpty()) {
        const QString uri = m_remaining.takeFirst();
        IConnection* connection = m_registry->connection(uri);
        if (!connection) {
            qCDebug(lcConnection) << "Autostart skipping unregistered uri=" << uri;
            continue;
        }
        if (connection->isActive()) {
            continue;
        }

        m_current = uri;
        m_currentConnection = connection;
        m_sawConnecting = connection->isConnecting();
        m_stateHandler = connect(connection, &IConnection::stateChanged, this, &AutostartSequencer::onStateChanged);

        qCDebug(lcConnection) << "Autostart opening uri=" << uri;
        Q_EMIT openRequested(uri);
        return;
    }

    Q_EMIT finished();
}

void AutostartSequencer::onStateChanged()
{
    if (!m_currentConnection) {
        return;
    }

    if (m_currentConnection->isConnecting()) {
        m_sawConnecting = true;
        return;
    }

    const bool settled = m_currentConnection->isActive() || (m_sawConnecting && m_currentConnection->isDisconnected());
    if (!settled) {
        return;
    }

    qCDebug(lcConnection) << "Autostart uri=" << m_current
                          << (m_currentConnection->isActive() ? "connected" : "failed");
    detach();
    advance();
}

void AutostartSequencer::detach()
{
    if (m_stateHandler) {
        disconnect(m_stateHandler);
    }
    m_stateHandler = {};
    m_current.clear();
    m_currentConnection = nullptr;
    m_sawConnecting = false;
}

} // namespace VirtDeck
