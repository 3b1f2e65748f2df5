// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "virtdeck_export.h"
#include "types.h"
#include <QObject>
#include <QPointer>

namespace VirtDeck {

class ConnectionRegistry;
class LifecycleController;
class IUiFactory;
class IWindow;
class IManagerWindow;
class IConnectDialog;
class ICreateDialog;
class IVmDialog;
class IDetailsWindow;

/**
 * @brief Creates, reuses and raises the application's windows
 *
 * Windows are built on first request through IUiFactory and kept for reuse.
 * Manager, host, details and create windows feed the LifecycleController
 * counter through their opened/closed signals. Launch failures are reported
 * through the factory's error reporter and the launcher returns false.
 */
class VIRTDECK_EXPORT WindowLauncher : public QObject
{
    Q_OBJECT

public:
    WindowLauncher(IUiFactory* uiFactory, ConnectionRegistry* registry, LifecycleController* lifecycle,
                   QObject* parent = nullptr);
    ~WindowLauncher() override;

    /// Manager window, created on first use; nullptr if it cannot be built
    IManagerWindow* manager();

    bool showManager();
    void toggleManager();

    bool showHost(const QString& uri);
    bool showConnect(bool resetState = true);

    /**
     * @brief Reopen the connect dialog with its previous input, then drop the URI
     */
    void editConnection(const QString& uri);

    bool showCreate(const QString& uri);
    bool showDetails(const QString& uri, const QString& connectionKey, DetailsPage page = DetailsPage::Default,
                     bool forcePage = false);
    bool showMigrate(const QString& uri, const QString& connectionKey);
    bool showClone(const QString& uri, const QString& connectionKey);

    /// Close the create dialog if it is bound to this URI
    void closeCreateDialogFor(const QString& uri);

    /// Show an error through the shared reporter
    void reportError(const QString& message, const QString& details = QString(), bool modal = false);

    /// Clean up the windows not owned by a connection
    void cleanup();

Q_SIGNALS:
    void connectRequested(const QString& uri, bool autoconnect);
    void removeConnectionRequested(const QString& uri);
    void exitRequested(const QString& source);

private:
    void trackWindow(IWindow* window, const QString& name);
    IDetailsWindow* detailsWindow(const QString& uri, const QString& connectionKey);

    IUiFactory* m_uiFactory;
    ConnectionRegistry* m_registry;
    LifecycleController* m_lifecycle;

    QPointer<IManagerWindow> m_manager;
    QPointer<IConnectDialog> m_connect;
    QPointer<ICreateDialog> m_create;
    QPointer<IVmDialog> m_migrate;
};

} // namespace VirtDeck
