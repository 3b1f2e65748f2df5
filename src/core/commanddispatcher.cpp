// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "commanddispatcher.h"
#include "connectionregistry.h"
#include "lifecyclecontroller.h"
#include "windowlauncher.h"
#include "interfaces.h"
#include "logging.h"
#include <KLocalizedString>
#include <QTimer>
#include <memory>

namespace VirtDeck {

CommandDispatcher::CommandDispatcher(ConnectionRegistry* registry, WindowLauncher* launcher,
                                     LifecycleController* lifecycle, QObject* parent)
    : QObject(parent)
    , m_registry(registry)
    , m_launcher(launcher)
    , m_lifecycle(lifecycle)
{
    Q_ASSERT(registry);
    Q_ASSERT(launcher);
    Q_ASSERT(lifecycle);

    // The registry disconnects a removed connection's signals, which drops its waiting handlers
    connect(m_registry, &ConnectionRegistry::connectionRemoved, this, [this](const QString& uri) {
        const int dropped = m_pending.take(uri);
        if (dropped > 0) {
            qCDebug(lcCommand) << "Dropped" << dropped << "pending commands for removed uri=" << uri;
        }
    });
}

CommandDispatcher::~CommandDispatcher() = default;

int CommandDispatcher::pendingCount() const
{
    int count = 0;
    for (int pending : m_pending) {
        count += pending;
    }
    return count;
}

void CommandDispatcher::handleCommand(const CliCommand& command)
{
    qCDebug(lcCommand) << "processing command uri=" << command.uri << "window=" << command.showWindow
                       << "domain=" << command.domain;

    if (command.uri.isEmpty()) {
        qCDebug(lcCommand) << "No command uri, launching default window";
        if (!m_launcher->showManager()) {
            m_lifecycle->scheduleExitCheck();
        }
        return;
    }

    IConnection* connection = m_registry->addConnection(command.uri, false);
    if (!connection) {
        fail(command.uri, i18n("Unable to use connection URI %1", command.uri), true);
        m_lifecycle->scheduleExitCheck();
        return;
    }

    if (connection->isDisconnected()) {
        Q_EMIT openConnectionRequested(command.uri);
    }

    // The manager does not need the connection, so it is never deferred
    if (command.showWindow.isEmpty() || command.showWindow == QLatin1String(WindowKindName::Manager)) {
        if (IManagerWindow* manager = m_launcher->manager()) {
            manager->setInitialSelection(command.uri);
        }
        if (!m_launcher->showManager()) {
            m_lifecycle->scheduleExitCheck();
        }
        return;
    }

    if (connection->isActive()) {
        const QString uri = command.uri;
        const QString showWindow = command.showWindow;
        const QString domain = command.domain;
        QTimer::singleShot(0, this, [this, uri, showWindow, domain]() {
            launchCliWindow(uri, showWindow, domain);
        });
    } else {
        deferUntilConnected(command.uri, command.showWindow, command.domain);
    }
}

void CommandDispatcher::deferUntilConnected(const QString& uri, const QString& showWindow, const QString& domain)
{
    IConnection* connection = m_registry->connection(uri);
    auto handler = std::make_shared<QMetaObject::Connection>();

    *handler = connect(connection, &IConnection::stateChanged, this,
                       [this, connection, handler, uri, showWindow, domain]() {
        if (!connection->isActive() && !connection->isDisconnected()) {
            return;
        }

        disconnect(*handler);
        auto it = m_pending.find(uri);
        if (it != m_pending.end() && --(*it) <= 0) {
            m_pending.erase(it);
        }

        if (connection->isActive()) {
            launchCliWindow(uri, showWindow, domain);
            return;
        }

        fail(uri, i18n("Failed to connect to %1, cannot show the requested window", uri), false);
        m_lifecycle->scheduleExitCheck();
    });

    ++m_pending[uri];
    qCDebug(lcCommand) << "Deferring" << showWindow << "until uri=" << uri << "is connected";
}

bool CommandDispatcher::launchCliWindow(const QString& uri, const QString& showWindow, const QString& domain)
{
    qCDebug(lcCommand) << "Launching requested window" << showWindow;

    bool launched = false;
    const std::optional<WindowKind> kind = windowKindFromString(showWindow);

    if (!kind) {
        fail(uri, i18n("Unknown window '%1' requested", showWindow), true);
    } else {
        switch (*kind) {
        case WindowKind::Manager:
            if (IManagerWindow* manager = m_launcher->manager()) {
                manager->setInitialSelection(uri);
            }
            launched = m_launcher->showManager();
            break;
        case WindowKind::Creator:
            launched = m_launcher->showCreate(uri);
            break;
        case WindowKind::Editor:
            launched = showDomain(uri, domain, DetailsPage::Config);
            break;
        case WindowKind::Performance:
            launched = showDomain(uri, domain, DetailsPage::Performance);
            break;
        case WindowKind::Console:
            launched = showDomain(uri, domain, DetailsPage::Console);
            break;
        case WindowKind::Summary:
            launched = m_launcher->showHost(uri);
            break;
        }
    }

    // A failed command may leave nothing open
    m_lifecycle->scheduleExitCheck();
    return launched;
}

bool CommandDispatcher::showDomain(const QString& uri, const QString& domain, DetailsPage page)
{
    const std::optional<VmInfo> vm = findVmByCliString(uri, domain);
    if (!vm) {
        fail(uri, i18n("%1 does not have VM '%2'", uri, domain), true);
        return false;
    }
    return m_launcher->showDetails(uri, vm->connectionKey(), page, true);
}

std::optional<VmInfo> CommandDispatcher::findVmByCliString(const QString& uri, const QString& cliString) const
{
    IConnection* connection = m_registry->connection(uri);
    if (!connection || cliString.isEmpty()) {
        return std::nullopt;
    }

    const QVector<VmInfo> vms = connection->listVms();

    bool isNumber = false;
    const int id = cliString.toInt(&isNumber);
    if (isNumber) {
        for (const VmInfo& vm : vms) {
            if (vm.id == id) {
                return vm;
            }
        }
    }
    for (const VmInfo& vm : vms) {
        if (vm.name == cliString) {
            return vm;
        }
    }
    for (const VmInfo& vm : vms) {
        if (vm.uuid == cliString) {
            return vm;
        }
    }
    return std::nullopt;
}

void CommandDispatcher::fail(const QString& uri, const QString& message, bool modal)
{
    qCWarning(lcCommand) << "Command failed uri=" << uri << message;
    m_launcher->reportError(message, QString(), modal);
    Q_EMIT commandFailed(uri, message);
}

} // namespace VirtDeck
