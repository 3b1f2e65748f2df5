// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "virtdeck_export.h"
#include "types.h"
#include <QHash>
#include <QObject>
#include <optional>

namespace VirtDeck {

class ConnectionRegistry;
class LifecycleController;
class WindowLauncher;

/**
 * @brief Routes command line and D-Bus commands to windows
 *
 * A command names a URI, a window kind and an optional domain. When the
 * target connection is not active yet, opening is requested through
 * openConnectionRequested() and the window launch waits for the
 * connection's next decisive state: Active launches, Disconnected reports
 * the failure. After every launch attempt the exit check runs again, so a
 * failed command never leaves a process without windows behind.
 */
class VIRTDECK_EXPORT CommandDispatcher : public QObject
{
    Q_OBJECT

public:
    CommandDispatcher(ConnectionRegistry* registry, WindowLauncher* launcher, LifecycleController* lifecycle,
                      QObject* parent = nullptr);
    ~CommandDispatcher() override;

    void handleCommand(const CliCommand& command);

    /**
     * @brief Open the requested window for an active connection
     * @return false if the window kind or domain is unknown, or the launch failed
     */
    bool launchCliWindow(const QString& uri, const QString& showWindow, const QString& domain);

    /**
     * @brief Resolve a domain given as numeric id, name or UUID (tried in that order)
     */
    std::optional<VmInfo> findVmByCliString(const QString& uri, const QString& cliString) const;

    /// Commands waiting for their connection to become active
    int pendingCount() const;

Q_SIGNALS:
    void openConnectionRequested(const QString& uri);
    void commandFailed(const QString& uri, const QString& message);

private:
    void deferUntilConnected(const QString& uri, const QString& showWindow, const QString& domain);
    bool showDomain(const QString& uri, const QString& domain, DetailsPage page);
    void fail(const QString& uri, const QString& message, bool modal);

    ConnectionRegistry* m_registry;
    WindowLauncher* m_launcher;
    LifecycleController* m_lifecycle;
    QHash<QString, int> m_pending;
};

} // namespace VirtDeck
