// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "windowlauncher.h"
#include "connectionregistry.h"
#include "lifecyclecontroller.h"
#include "interfaces.h"
#include "logging.h"
#include <KLocalizedString>

namespace VirtDeck {

namespace {
void disposeWindow(IWindow* window)
{
    if (window) {
        window->cleanup();
        window->deleteLater();
    }
}
} // namespace

WindowLauncher::WindowLauncher(IUiFactory* uiFactory, ConnectionRegistry* registry, LifecycleController* lifecycle,
                               QObject* parent)
    : QObject(parent)
    , m_uiFactory(uiFactory)
    , m_registry(registry)
    , m_lifecycle(lifecycle)
{
    Q_ASSERT(uiFactory);
    Q_ASSERT(registry);
    Q_ASSERT(lifecycle);
}

WindowLauncher::~WindowLauncher() = default;

void WindowLauncher::trackWindow(IWindow* window, const QString& name)
{
    connect(window, &IWindow::opened, m_lifecycle, [this, name]() {
        m_lifecycle->increment(name);
    });
    connect(window, &IWindow::closed, m_lifecycle, [this, name]() {
        m_lifecycle->decrement(name);
    });
    connect(window, &IWindow::managerRequested, this, &WindowLauncher::showManager);
    connect(window, &IWindow::exitRequested, this, [this, name]() {
        Q_EMIT exitRequested(name);
    });
}

void WindowLauncher::reportError(const QString& message, const QString& details, bool modal)
{
    qCWarning(lcCore) << message << details;
    IErrorReporter* reporter = m_uiFactory->errorReporter();
    if (!reporter) {
        return;
    }
    ErrorReport report;
    report.title = i18n("VirtDeck Error");
    report.message = message;
    report.details = details;
    report.modal = modal;
    reporter->showError(report);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Manager
// ═══════════════════════════════════════════════════════════════════════════════

IManagerWindow* WindowLauncher::manager()
{
    if (m_manager) {
        return m_manager;
    }

    IManagerWindow* window = m_uiFactory->createManagerWindow();
    if (!window) {
        return nullptr;
    }

    trackWindow(window, QStringLiteral("manager"));
    connect(window, &IManagerWindow::showDomainRequested, this, [this](const QString& uri, const QString& key) {
        showDetails(uri, key);
    });
    connect(window, &IManagerWindow::showCreateRequested, this, &WindowLauncher::showCreate);
    connect(window, &IManagerWindow::showHostRequested, this, &WindowLauncher::showHost);
    connect(window, &IManagerWindow::showConnectRequested, this, [this]() {
        showConnect(true);
    });
    connect(window, &IManagerWindow::migrateRequested, this, &WindowLauncher::showMigrate);
    connect(window, &IManagerWindow::cloneRequested, this, &WindowLauncher::showClone);
    connect(window, &IManagerWindow::removeConnectionRequested, this, &WindowLauncher::removeConnectionRequested);

    m_manager = window;
    return window;
}

bool WindowLauncher::showManager()
{
    IManagerWindow* window = manager();
    if (!window) {
        reportError(i18n("Error launching manager: the window could not be created"));
        return false;
    }
    window->show();
    return true;
}

void WindowLauncher::toggleManager()
{
    IManagerWindow* window = manager();
    if (!window) {
        reportError(i18n("Error launching manager: the window could not be created"));
        return;
    }
    if (window->isVisible()) {
        window->close();
    } else {
        window->show();
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Per-connection windows
// ═══════════════════════════════════════════════════════════════════════════════

bool WindowLauncher::showHost(const QString& uri)
{
    ConnectionUiState* state = m_registry->uiState(uri);
    IConnection* connection = m_registry->connection(uri);
    if (!state || !connection) {
        reportError(i18n("Error launching host dialog: unknown connection %1", uri));
        return false;
    }

    if (!state->hostWindow) {
        IWindow* window = m_uiFactory->createHostWindow(connection);
        if (!window) {
            reportError(i18n("Error launching host dialog: the window could not be created"));
            return false;
        }
        trackWindow(window, QStringLiteral("host"));
        state->hostWindow = window;
    }

    state->hostWindow->show();
    return true;
}

IDetailsWindow* WindowLauncher::detailsWindow(const QString& uri, const QString& connectionKey)
{
    if (IDetailsWindow* existing = m_registry->detailsWindow(uri, connectionKey)) {
        return existing;
    }

    IConnection* connection = m_registry->connection(uri);
    if (!connection) {
        return nullptr;
    }
    const std::optional<VmInfo> vm = connection->vm(connectionKey);
    if (!vm) {
        return nullptr;
    }

    IDetailsWindow* window = m_uiFactory->createDetailsWindow(connection, *vm);
    if (!window) {
        return nullptr;
    }

    trackWindow(window, QStringLiteral("details"));
    connect(window, &IDetailsWindow::migrateRequested, this, &WindowLauncher::showMigrate);
    connect(window, &IDetailsWindow::cloneRequested, this, &WindowLauncher::showClone);

    m_registry->setDetailsWindow(uri, connectionKey, window);
    return window;
}

bool WindowLauncher::showDetails(const QString& uri, const QString& connectionKey, DetailsPage page, bool forcePage)
{
    IDetailsWindow* window = detailsWindow(uri, connectionKey);
    if (!window) {
        reportError(i18n("Error launching details: %1 has no VM '%2'", uri, connectionKey));
        return false;
    }

    if (forcePage || !window->isVisible()) {
        window->activatePage(page);
    }
    window->show();
    return true;
}

bool WindowLauncher::showClone(const QString& uri, const QString& connectionKey)
{
    ConnectionUiState* state = m_registry->uiState(uri);
    IConnection* connection = m_registry->connection(uri);
    const std::optional<VmInfo> vm = connection ? connection->vm(connectionKey) : std::nullopt;
    if (!state || !vm) {
        reportError(i18n("Error setting clone parameters: %1 has no VM '%2'", uri, connectionKey));
        return false;
    }

    if (!state->cloneWindow) {
        IVmDialog* window = m_uiFactory->createCloneDialog();
        if (!window) {
            reportError(i18n("Error setting clone parameters: the dialog could not be created"));
            return false;
        }
        state->cloneWindow = window;
    }

    state->cloneWindow->setSourceVm(uri, *vm);
    state->cloneWindow->show();
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Shared dialogs
// ═══════════════════════════════════════════════════════════════════════════════

bool WindowLauncher::showConnect(bool resetState)
{
    if (!m_connect) {
        IConnectDialog* dialog = m_uiFactory->createConnectDialog();
        if (!dialog) {
            reportError(i18n("Error launching connect dialog: the dialog could not be created"));
            return false;
        }

        connect(dialog, &IConnectDialog::completed, this, [this](const QString& uri, bool autoconnect) {
            Q_EMIT connectRequested(uri, autoconnect);
        });
        connect(dialog, &IConnectDialog::cancelled, this, [this]() {
            if (m_registry->isEmpty()) {
                Q_EMIT exitRequested(QStringLiteral("connect dialog"));
            }
        });
        m_connect = dialog;
    }

    if (resetState) {
        m_connect->reset();
    }
    m_connect->show();
    return true;
}

void WindowLauncher::editConnection(const QString& uri)
{
    showConnect(false);
    Q_EMIT removeConnectionRequested(uri);
}

bool WindowLauncher::showCreate(const QString& uri)
{
    if (!m_create) {
        ICreateDialog* dialog = m_uiFactory->createCreateDialog();
        if (!dialog) {
            reportError(i18n("Error launching create dialog: the dialog could not be created"));
            return false;
        }
        trackWindow(dialog, QStringLiteral("create"));
        connect(dialog, &ICreateDialog::showDomainRequested, this, [this](const QString& uri, const QString& key) {
            showDetails(uri, key);
        });
        m_create = dialog;
    }

    m_create->setConnectionUri(uri);
    m_create->show();
    return true;
}

void WindowLauncher::closeCreateDialogFor(const QString& uri)
{
    if (m_create && m_create->isVisible() && m_create->connectionUri() == uri) {
        qCDebug(lcCore) << "Closing create dialog for disconnected uri=" << uri;
        m_create->close();
    }
}

bool WindowLauncher::showMigrate(const QString& uri, const QString& connectionKey)
{
    IConnection* connection = m_registry->connection(uri);
    const std::optional<VmInfo> vm = connection ? connection->vm(connectionKey) : std::nullopt;
    if (!vm) {
        reportError(i18n("Error launching migrate dialog: %1 has no VM '%2'", uri, connectionKey));
        return false;
    }

    if (!m_migrate) {
        m_migrate = m_uiFactory->createMigrateDialog();
        if (!m_migrate) {
            reportError(i18n("Error launching migrate dialog: the dialog could not be created"));
            return false;
        }
    }

    m_migrate->setSourceVm(uri, *vm);
    m_migrate->show();
    return true;
}

void WindowLauncher::cleanup()
{
    disposeWindow(m_manager.data());
    disposeWindow(m_connect.data());
    disposeWindow(m_create.data());
    disposeWindow(m_migrate.data());
    m_manager.clear();
    m_connect.clear();
    m_create.clear();
    m_migrate.clear();
}

} // namespace VirtDeck
