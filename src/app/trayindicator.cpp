// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "trayindicator.h"
#include "../core/connectionregistry.h"
#include "../core/logging.h"
#include <KLocalizedString>
#include <QIcon>

namespace VirtDeck {

TrayIndicator::TrayIndicator(ConnectionRegistry* registry, QObject* parent)
    : IPresenceIndicator(parent)
    , m_registry(registry)
{
    m_trayIcon.setIcon(QIcon::fromTheme(QStringLiteral("virt-manager"),
                                        QIcon::fromTheme(QStringLiteral("computer"))));
    m_trayIcon.setToolTip(i18n("VirtDeck"));
    m_trayIcon.setContextMenu(&m_menu);

    connect(&m_trayIcon, &QSystemTrayIcon::activated, this, &TrayIndicator::onActivated);
    connect(&m_menu, &QMenu::aboutToShow, this, &TrayIndicator::rebuildMenu);
    rebuildMenu();
}

TrayIndicator::~TrayIndicator() = default;

void TrayIndicator::setEnabled(bool enabled)
{
    if (enabled && !QSystemTrayIcon::isSystemTrayAvailable()) {
        qCWarning(lcApp) << "System tray requested but no tray is available";
    }
    m_trayIcon.setVisible(enabled);
}

bool TrayIndicator::isVisible() const
{
    return m_trayIcon.isVisible();
}

void TrayIndicator::cleanup()
{
    m_trayIcon.hide();
    m_menu.clear();
}

void TrayIndicator::onActivated(QSystemTrayIcon::ActivationReason reason)
{
    if (reason == QSystemTrayIcon::Trigger) {
        Q_EMIT toggleManagerRequested();
    }
}

void TrayIndicator::rebuildMenu()
{
    m_menu.clear();

    m_menu.addAction(i18n("Show/Hide Manager"), this, [this]() {
        Q_EMIT toggleManagerRequested();
    });
    m_menu.addSeparator();

    const QStringList uris = m_registry->uris();
    for (const QString& uri : uris) {
        IConnection* connection = m_registry->connection(uri);
        if (!connection || !connection->isActive()) {
            continue;
        }
        QMenu* submenu = m_menu.addMenu(uri);
        const QVector<VmInfo> vms = connection->listVms();
        for (const VmInfo& vm : vms) {
            QMenu* vmMenu = submenu->addMenu(vm.name);
            const QString key = vm.connectionKey();
            vmMenu->addAction(i18n("Open"), this, [this, uri, key]() {
                Q_EMIT showDomainRequested(uri, key);
            });
            vmMenu->addAction(i18n("Clone…"), this, [this, uri, key]() {
                Q_EMIT cloneRequested(uri, key);
            });
            vmMenu->addAction(i18n("Migrate…"), this, [this, uri, key]() {
                Q_EMIT migrateRequested(uri, key);
            });
        }
        if (vms.isEmpty()) {
            submenu->addAction(i18n("No virtual machines"))->setEnabled(false);
        }
    }

    m_menu.addSeparator();
    m_menu.addAction(i18n("Quit"), this, [this]() {
        Q_EMIT exitRequested();
    });
}

} // namespace VirtDeck
