// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "connectionregistry.h"
#include "interfaces.h"
#include "logging.h"
#include <utility>

namespace VirtDeck {

ConnectionRegistry::ConnectionRegistry(IConnectionFactory* factory, QObject* parent)
    : QObject(parent)
    , m_factory(factory)
{
    Q_ASSERT(factory);
}

ConnectionRegistry::~ConnectionRegistry()
{
    clear();
}

IConnection* ConnectionRegistry::addConnection(const QString& uri, bool probe)
{
    auto it = m_entries.find(uri);
    if (it != m_entries.end()) {
        return it->connection.data();
    }

    IConnection* raw = m_factory->createConnection(uri);
    if (!raw) {
        qCWarning(lcConnection) << "No connection could be created for uri=" << uri;
        return nullptr;
    }

    Entry entry;
    entry.connection = QSharedPointer<IConnection>(raw, &QObject::deleteLater);
    entry.ui.probe = probe;
    m_entries.insert(uri, entry);
    m_uris.append(uri);

    qCInfo(lcConnection) << "Registered connection uri=" << uri << "probe=" << probe;
    Q_EMIT connectionAdded(uri, raw);
    return raw;
}

bool ConnectionRegistry::removeConnection(const QString& uri)
{
    if (!m_entries.contains(uri)) {
        return false;
    }

    cleanupUiState(uri);

    // Take the entry out before closing so re-entrant lookups see it gone
    Entry entry = m_entries.take(uri);
    m_uris.removeAll(uri);

    // Nothing should react to a connection that is no longer registered
    entry.connection->disconnect();
    entry.connection->close();

    qCInfo(lcConnection) << "Removed connection uri=" << uri;
    Q_EMIT connectionRemoved(uri);
    return true;
}

void ConnectionRegistry::clear()
{
    const QStringList uris = m_uris;
    for (const QString& uri : uris) {
        removeConnection(uri);
    }
}

IConnection* ConnectionRegistry::connection(const QString& uri) const
{
    auto it = m_entries.constFind(uri);
    return it == m_entries.constEnd() ? nullptr : it->connection.data();
}

QSharedPointer<IConnection> ConnectionRegistry::sharedConnection(const QString& uri) const
{
    return m_entries.value(uri).connection;
}

QList<IConnection*> ConnectionRegistry::connections() const
{
    QList<IConnection*> result;
    result.reserve(m_uris.size());
    for (const QString& uri : m_uris) {
        result.append(m_entries.value(uri).connection.data());
    }
    return result;
}

bool ConnectionRegistry::isProbe(const QString& uri) const
{
    auto it = m_entries.constFind(uri);
    return it != m_entries.constEnd() && it->ui.probe;
}

void ConnectionRegistry::setProbe(const QString& uri, bool probe)
{
    auto it = m_entries.find(uri);
    if (it != m_entries.end()) {
        it->ui.probe = probe;
    }
}

ConnectionUiState* ConnectionRegistry::uiState(const QString& uri)
{
    auto it = m_entries.find(uri);
    return it == m_entries.end() ? nullptr : &it->ui;
}

IDetailsWindow* ConnectionRegistry::detailsWindow(const QString& uri, const QString& connectionKey) const
{
    auto it = m_entries.constFind(uri);
    if (it == m_entries.constEnd()) {
        return nullptr;
    }
    return it->ui.detailsWindows.value(connectionKey).data();
}

void ConnectionRegistry::setDetailsWindow(const QString& uri, const QString& connectionKey, IDetailsWindow* window)
{
    auto it = m_entries.find(uri);
    if (it != m_entries.end()) {
        it->ui.detailsWindows.insert(connectionKey, window);
    }
}

bool ConnectionRegistry::renameDetailsWindow(const QString& uri, const QString& oldKey, const QString& newKey)
{
    auto it = m_entries.find(uri);
    if (it == m_entries.end() || !it->ui.detailsWindows.contains(oldKey)) {
        return false;
    }

    QPointer<IDetailsWindow> window = it->ui.detailsWindows.take(oldKey);
    if (window) {
        it->ui.detailsWindows.insert(newKey, window);
    }
    qCDebug(lcConnection) << "Details window moved uri=" << uri << oldKey << "->" << newKey;
    return true;
}

void ConnectionRegistry::removeDetailsWindow(const QString& uri, const QString& connectionKey)
{
    auto it = m_entries.find(uri);
    if (it == m_entries.end()) {
        return;
    }
    QPointer<IDetailsWindow> window = it->ui.detailsWindows.take(connectionKey);
    disposeWindow(window.data());
}

void ConnectionRegistry::cleanupDetailsWindows(const QString& uri)
{
    auto it = m_entries.find(uri);
    if (it == m_entries.end()) {
        return;
    }
    const auto windows = std::exchange(it->ui.detailsWindows, {});
    for (const QPointer<IDetailsWindow>& window : windows) {
        disposeWindow(window.data());
    }
}

void ConnectionRegistry::cleanupUiState(const QString& uri)
{
    auto it = m_entries.find(uri);
    if (it == m_entries.end()) {
        return;
    }

    cleanupDetailsWindows(uri);

    disposeWindow(std::exchange(it->ui.hostWindow, nullptr).data());
    disposeWindow(std::exchange(it->ui.cloneWindow, nullptr).data());
}

void ConnectionRegistry::disposeWindow(IWindow* window)
{
    if (!window) {
        return;
    }
    window->cleanup();
    window->deleteLater();
}

} // namespace VirtDeck
