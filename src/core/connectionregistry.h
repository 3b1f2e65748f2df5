// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "virtdeck_export.h"
#include <QHash>
#include <QObject>
#include <QPointer>
#include <QSharedPointer>
#include <QStringList>

namespace VirtDeck {

class IConnection;
class IConnectionFactory;
class IWindow;
class IVmDialog;
class IDetailsWindow;

/**
 * @brief Windows owned by one connection
 *
 * Windows are created lazily by the launcher. Details windows are keyed by
 * VmInfo::connectionKey(); a rename moves the entry explicitly.
 */
struct VIRTDECK_EXPORT ConnectionUiState
{
    bool probe = false;
    QPointer<IWindow> hostWindow;
    QPointer<IVmDialog> cloneWindow;
    QHash<QString, QPointer<IDetailsWindow>> detailsWindows;
};

/**
 * @brief Known connections by URI and their per-connection UI state
 *
 * Foreground thread only. Connections are held through QSharedPointer so a
 * poll already dequeued by the worker keeps its target alive after removal;
 * the last reference deletes the object on its own thread via deleteLater().
 */
class VIRTDECK_EXPORT ConnectionRegistry : public QObject
{
    Q_OBJECT

public:
    explicit ConnectionRegistry(IConnectionFactory* factory, QObject* parent = nullptr);
    ~ConnectionRegistry() override;

    /**
     * @brief Register a URI, creating its connection on first use
     * @return The connection, existing or new; nullptr if the factory refused the URI
     *
     * Idempotent: registering a known URI returns the existing connection
     * and leaves its probe flag untouched.
     */
    IConnection* addConnection(const QString& uri, bool probe = false);

    /**
     * @brief Tear down the URI's windows, close its connection and forget it
     * @return false if the URI was not registered
     */
    bool removeConnection(const QString& uri);

    /// Remove every connection (shutdown path)
    void clear();

    bool contains(const QString& uri) const
    {
        return m_entries.contains(uri);
    }
    bool isEmpty() const
    {
        return m_uris.isEmpty();
    }
    int count() const
    {
        return m_uris.size();
    }

    IConnection* connection(const QString& uri) const;
    QSharedPointer<IConnection> sharedConnection(const QString& uri) const;

    /// Registered URIs in registration order
    QStringList uris() const
    {
        return m_uris;
    }
    QList<IConnection*> connections() const;

    bool isProbe(const QString& uri) const;
    void setProbe(const QString& uri, bool probe);

    // UI state
    ConnectionUiState* uiState(const QString& uri);
    IDetailsWindow* detailsWindow(const QString& uri, const QString& connectionKey) const;
    void setDetailsWindow(const QString& uri, const QString& connectionKey, IDetailsWindow* window);

    /**
     * @brief Move a details window to a new key
     * @return false if nothing was stored under oldKey
     */
    bool renameDetailsWindow(const QString& uri, const QString& oldKey, const QString& newKey);

    /// Clean up and forget one details window
    void removeDetailsWindow(const QString& uri, const QString& connectionKey);

    /// Clean up and forget every details window of a connection
    void cleanupDetailsWindows(const QString& uri);

    /// Clean up every window owned by a connection
    void cleanupUiState(const QString& uri);

Q_SIGNALS:
    void connectionAdded(const QString& uri, VirtDeck::IConnection* connection);
    void connectionRemoved(const QString& uri);

private:
    struct Entry
    {
        QSharedPointer<IConnection> connection;
        ConnectionUiState ui;
    };

    static void disposeWindow(IWindow* window);

    IConnectionFactory* m_factory;
    QStringList m_uris;
    QHash<QString, Entry> m_entries;
};

} // namespace VirtDeck
