// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "engine.h"
#include "autostartsequencer.h"
#include "commanddispatcher.h"
#include "connecterror.h"
#include "connectionregistry.h"
#include "constants.h"
#include "interfaces.h"
#include "lifecyclecontroller.h"
#include "logging.h"
#include "pollworker.h"
#include "tickscheduler.h"
#include "utils.h"
#include "windowlauncher.h"
#include "workqueue.h"
#include "../config/settings.h"
#include <KLocalizedString>
#include <QFileInfo>
#include <QTimer>

namespace VirtDeck {

Engine::Engine(const EngineContext& context, QObject* parent)
    : QObject(parent)
    , m_context(context)
    , m_queue(std::make_unique<WorkQueue>(Defaults::PollQueueCapacity))
{
    Q_ASSERT(context.settings);
    Q_ASSERT(context.connectionFactory);
    Q_ASSERT(context.uiFactory);

    m_registry = std::make_unique<ConnectionRegistry>(m_context.connectionFactory);
    m_lifecycle = std::make_unique<LifecycleController>();
    m_scheduler = std::make_unique<TickScheduler>(m_queue.get(), m_registry.get());
    m_worker = std::make_unique<PollWorker>(m_queue.get());
    m_launcher = std::make_unique<WindowLauncher>(m_context.uiFactory, m_registry.get(), m_lifecycle.get());
    m_dispatcher = std::make_unique<CommandDispatcher>(m_registry.get(), m_launcher.get(), m_lifecycle.get());
    m_autostart = std::make_unique<AutostartSequencer>(m_registry.get());

    connect(m_registry.get(), &ConnectionRegistry::connectionAdded, this, &Engine::onConnectionAdded);

    // Worker signals arrive from the poll thread
    connect(m_worker.get(), &PollWorker::pollFailed, this, &Engine::onPollFailed, Qt::QueuedConnection);

    connect(m_lifecycle.get(), &LifecycleController::exitRequested, this, &Engine::shutdown);

    connect(m_launcher.get(), &WindowLauncher::connectRequested, this, [this](const QString& uri, bool autoconnect) {
        connectToUri(uri, autoconnect, true);
    });
    connect(m_launcher.get(), &WindowLauncher::removeConnectionRequested, this, &Engine::removeConnection);
    connect(m_launcher.get(), &WindowLauncher::exitRequested, this, &Engine::exitApp);

    // Opening is deferred to the next event loop pass
    connect(m_dispatcher.get(), &CommandDispatcher::openConnectionRequested, this,
            [this](const QString& uri) {
                connectToUri(uri);
            },
            Qt::QueuedConnection);
    connect(m_autostart.get(), &AutostartSequencer::openRequested, this,
            [this](const QString& uri) {
                connectToUri(uri);
            },
            Qt::QueuedConnection);

    Settings* settings = m_context.settings;
    connect(settings, &Settings::pollIntervalSecondsChanged, this, [this]() {
        m_scheduler->setIntervalSeconds(m_context.settings->pollIntervalSeconds());
    });
    connect(settings, &Settings::systemTrayEnabledChanged, this, &Engine::onPresenceModeChanged);
}

Engine::~Engine()
{
    if (!m_shutdown) {
        m_scheduler->stop();
        m_worker->stop(Defaults::PollWorkerStopTimeoutMs);
        m_launcher->cleanup();
        m_registry->clear();
        if (m_indicator) {
            m_indicator->cleanup();
        }
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Startup
// ═══════════════════════════════════════════════════════════════════════════════

bool Engine::init()
{
    if (m_initialized) {
        return true;
    }

    const QStringList storedUris = m_context.settings->connectionUris();
    for (const QString& uri : storedUris) {
        if (!m_registry->addConnection(uri, false)) {
            qCWarning(lcCore) << "Ignoring unusable stored connection uri=" << uri;
        }
    }

    m_scheduler->setIntervalSeconds(m_context.settings->pollIntervalSeconds());
    m_scheduler->start();
    m_worker->start();
    m_scheduler->tick();

    m_initialized = true;
    qCInfo(lcCore) << "Engine initialized connections=" << m_registry->count()
                   << "interval=" << m_scheduler->intervalSeconds() << "s";
    return true;
}

void Engine::start(bool skipAutostart, const QString& cliUri)
{
    initPresenceIndicator();

    const QStringList uris = m_registry->uris();
    if (uris.isEmpty()) {
        qCDebug(lcCore) << "No stored URIs found";
    } else {
        qCDebug(lcCore) << "Loading stored URIs:" << uris;
    }

    if (!skipAutostart) {
        QTimer::singleShot(0, m_autostart.get(), [this]() {
            m_autostart->start();
        });
    }

    if (m_context.settings->connectionUris().isEmpty() && cliUri.isEmpty()) {
        // Only add a default if no connections are known
        QTimer::singleShot(Defaults::DefaultConnectionDelayMs, this, &Engine::addDefaultConnection);
    }
}

void Engine::initPresenceIndicator()
{
    if (m_indicator) {
        return;
    }

    IPresenceIndicator* indicator = m_context.uiFactory->createPresenceIndicator();
    if (!indicator) {
        qCInfo(lcCore) << "No presence indicator available";
        return;
    }
    indicator->setParent(this);
    m_indicator = indicator;

    connect(indicator, &IPresenceIndicator::toggleManagerRequested, m_launcher.get(),
            &WindowLauncher::toggleManager);
    connect(indicator, &IPresenceIndicator::showDomainRequested, m_launcher.get(),
            [this](const QString& uri, const QString& key) {
                m_launcher->showDetails(uri, key);
            });
    connect(indicator, &IPresenceIndicator::migrateRequested, m_launcher.get(), &WindowLauncher::showMigrate);
    connect(indicator, &IPresenceIndicator::cloneRequested, m_launcher.get(), &WindowLauncher::showClone);
    connect(indicator, &IPresenceIndicator::exitRequested, this, [this]() {
        exitApp(QStringLiteral("presence indicator"));
    });

    indicator->setEnabled(m_context.settings->systemTrayEnabled());
    m_lifecycle->setPresenceIndicator(indicator);
}

void Engine::onPresenceModeChanged()
{
    const bool enabled = m_context.settings->systemTrayEnabled();
    if (m_indicator) {
        m_indicator->setEnabled(enabled);
    }
    if (m_lifecycle->windowCount() == 0 && !enabled) {
        // Keep a way to control the application
        m_launcher->showManager();
    }
}

QString Engine::defaultHypervisorUri(const PathProbe& exists)
{
    PathProbe probe = exists;
    if (!probe) {
        probe = [](const QString& path) {
            return QFileInfo::exists(path);
        };
    }

    if (probe(DefaultUri::XenProcPath)) {
        return DefaultUri::Xen;
    }
    if (probe(DefaultUri::KvmDevicePath) || probe(DefaultUri::LibvirtSocketPath)) {
        return DefaultUri::QemuSystem;
    }
    return QString();
}

void Engine::addDefaultConnection()
{
    if (m_shutdown) {
        return;
    }

    qCDebug(lcCore) << "Determining default libvirt URI";
    const QString uri = defaultHypervisorUri(m_pathProbe);

    if (uri.isEmpty()) {
        const QString message = i18n("Could not detect a default hypervisor. Make sure the appropriate "
                                     "virtualization packages containing kvm, qemu, libvirt, etc. are "
                                     "installed, and that libvirtd is running.\n\n"
                                     "A hypervisor connection can be manually added via File->Add Connection");
        qCWarning(lcCore) << "No default hypervisor detected";
        if (IManagerWindow* manager = m_launcher->manager()) {
            manager->setStartupError(message);
        }
        return;
    }

    qCInfo(lcCore) << "Connecting to default uri=" << uri;
    connectToUri(uri, true);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Connections
// ═══════════════════════════════════════════════════════════════════════════════

void Engine::onConnectionAdded(const QString& uri, IConnection* connection)
{
    // Restore the stored flag before listening so it is not written back
    connection->setAutoconnect(m_context.settings->isAutoconnect(uri));

    if (!m_registry->isProbe(uri)) {
        persistConnection(uri);
    }

    connect(connection, &IConnection::stateChanged, this, [this, uri]() {
        onConnectionStateChanged(uri);
    });
    connect(connection, &IConnection::vmRemoved, this, [this, uri](const QString& key) {
        m_registry->removeDetailsWindow(uri, key);
    });
    connect(connection, &IConnection::vmRenamed, this, [this, uri](const QString& oldKey, const QString& newKey) {
        m_registry->renameDetailsWindow(uri, oldKey, newKey);
    });
    connect(connection, &IConnection::connectError, this,
            [this, uri](const QString& message, const QString& details, bool warnConsole) {
                onConnectError(uri, message, details, warnConsole);
            });
    connect(connection, &IConnection::priorityPollRequested, this, [this, uri](const PollRequest& request) {
        m_scheduler->schedulePriorityTick(m_registry->sharedConnection(uri), request);
    });
    connect(connection, &IConnection::autoconnectChanged, this, [this, uri](bool enabled) {
        if (m_registry->isProbe(uri)) {
            return;
        }
        m_context.settings->setAutoconnect(uri, enabled);
        m_context.settings->save();
    });
}

void Engine::persistConnection(const QString& uri)
{
    Settings* settings = m_context.settings;
    const bool known = settings->connectionUris().contains(uri);
    IConnection* connection = m_registry->connection(uri);
    const bool autoconnect = connection && connection->autoconnect();

    if (known && settings->isAutoconnect(uri) == autoconnect) {
        return;
    }
    settings->addConnectionUri(uri);
    settings->setAutoconnect(uri, autoconnect);
    settings->save();
}

bool Engine::connectToUri(const QString& uri, std::optional<bool> autoconnect, bool probe)
{
    if (m_shutdown) {
        return false;
    }

    IConnection* connection = m_registry->addConnection(uri, probe);
    if (!connection) {
        m_launcher->reportError(i18n("Unable to use connection URI %1", uri));
        return false;
    }

    if (autoconnect) {
        connection->setAutoconnect(*autoconnect);
    }

    if (connection->isDisconnected()) {
        qCInfo(lcConnection) << "Opening connection uri=" << uri;
        connection->open();
    }
    return true;
}

void Engine::removeConnection(const QString& uri)
{
    if (!m_registry->removeConnection(uri)) {
        return;
    }
    m_context.settings->removeConnectionUri(uri);
    m_context.settings->save();
}

void Engine::onConnectionStateChanged(const QString& uri)
{
    IConnection* connection = m_registry->connection(uri);
    if (!connection) {
        return;
    }

    if (connection->isActive()) {
        if (m_registry->isProbe(uri)) {
            // A probe that connects is worth remembering
            m_registry->setProbe(uri, false);
            persistConnection(uri);
        }
        return;
    }
    if (connection->isConnecting()) {
        return;
    }

    m_registry->cleanupDetailsWindows(uri);
    m_launcher->closeCreateDialogFor(uri);
}

void Engine::onConnectError(const QString& uri, const QString& message, const QString& details, bool warnConsole)
{
    IConnection* connection = m_registry->connection(uri);
    if (!connection) {
        return;
    }

    ConnectFailure failure;
    failure.uri = uri;
    failure.transport = connection->transportKind();
    failure.transportName = Utils::uriTransport(uri);
    failure.errorMessage = message;
    failure.details = details;
    failure.warnConsole = warnConsole;
    failure.probe = m_registry->isProbe(uri);
    failure.askpassPackage = m_context.settings->askpassPackage();

    const ConnectErrorText text = describeConnectFailure(failure);
    qCWarning(lcConnection) << "Connection failed uri=" << uri << "error=" << message << "details=" << details;

    ErrorReport report;
    report.title = text.title;
    report.message = text.message;
    report.details = text.details;

    IErrorReporter* reporter = m_context.uiFactory->errorReporter();

    if (failure.probe) {
        report.modal = true;
        const bool remember = reporter && reporter->askQuestion(report);
        if (remember) {
            m_registry->setProbe(uri, false);
            persistConnection(uri);
        } else {
            QTimer::singleShot(0, m_launcher.get(), [this, uri]() {
                m_launcher->editConnection(uri);
            });
        }
        return;
    }

    if (m_lifecycle->canExit()) {
        report.modal = true;
        if (reporter) {
            reporter->showError(report);
        }
        m_lifecycle->checkExit();
        return;
    }

    if (reporter) {
        reporter->showError(report);
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Polling and commands
// ═══════════════════════════════════════════════════════════════════════════════

void Engine::onPollFailed(const QString& uri, const QString& message, const QString& details)
{
    if (m_shutdown) {
        return;
    }

    // Without a window there is no owner for a dialog
    if (m_lifecycle->windowCount() <= 0) {
        qCDebug(lcCore) << "Suppressed poll error dialog uri=" << uri << message;
        return;
    }
    m_launcher->reportError(message, details, false);
}

void Engine::handleCommand(const CliCommand& command)
{
    if (m_shutdown) {
        return;
    }
    m_dispatcher->handleCommand(command);
}

void Engine::exitApp(const QString& source)
{
    m_lifecycle->requestExit(source);
}

void Engine::shutdown()
{
    if (m_shutdown) {
        return;
    }
    m_shutdown = true;
    qCInfo(lcLifecycle) << "Shutting down";

    m_scheduler->stop();
    m_worker->stop(Defaults::PollWorkerStopTimeoutMs);

    m_launcher->cleanup();
    m_registry->clear();

    if (m_indicator) {
        m_lifecycle->setPresenceIndicator(nullptr);
        m_indicator->cleanup();
        m_indicator->deleteLater();
        m_indicator.clear();
    }

    Q_EMIT quitRequested();
}

} // namespace VirtDeck
