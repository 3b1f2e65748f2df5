// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/interfaces.h"
#include <QMenu>
#include <QSystemTrayIcon>

namespace VirtDeck {

class ConnectionRegistry;

/**
 * @brief System tray icon keeping the application reachable without windows
 *
 * Left click toggles the manager. The context menu lists running domains of
 * active connections for quick access.
 */
class TrayIndicator : public IPresenceIndicator
{
    Q_OBJECT

public:
    explicit TrayIndicator(ConnectionRegistry* registry, QObject* parent = nullptr);
    ~TrayIndicator() override;

    void setEnabled(bool enabled) override;
    bool isVisible() const override;
    void cleanup() override;

private:
    void rebuildMenu();
    void onActivated(QSystemTrayIcon::ActivationReason reason);

    ConnectionRegistry* m_registry;
    QSystemTrayIcon m_trayIcon;
    QMenu m_menu;
};

} // namespace VirtDeck
