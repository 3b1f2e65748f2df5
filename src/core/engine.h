// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "virtdeck_export.h"
#include "types.h"
#include <QObject>
#include <QPointer>
#include <functional>
#include <memory>
#include <optional>

namespace VirtDeck {

class Settings;
class IConnection;
class IConnectionFactory;
class IUiFactory;
class IPresenceIndicator;
class WorkQueue;
class PollWorker;
class TickScheduler;
class ConnectionRegistry;
class LifecycleController;
class WindowLauncher;
class CommandDispatcher;
class AutostartSequencer;

/**
 * @brief Collaborators shared by every engine component
 *
 * Built once in main(), outlives the Engine.
 */
struct VIRTDECK_EXPORT EngineContext
{
    Settings* settings = nullptr;
    IConnectionFactory* connectionFactory = nullptr;
    IUiFactory* uiFactory = nullptr;
};

/**
 * @brief Orchestration engine
 *
 * Owns the polling pipeline (queue, worker thread, tick timer), the
 * connection registry, the window launcher, the command dispatcher, the
 * autostart sequencer and the lifecycle controller, and wires them
 * together. All members live on the foreground thread except the work the
 * PollWorker performs.
 *
 * Note: This class does NOT use the singleton pattern. Create instances
 * where needed and pass via dependency injection.
 */
class VIRTDECK_EXPORT Engine : public QObject
{
    Q_OBJECT

public:
    using PathProbe = std::function<bool(const QString&)>;

    explicit Engine(const EngineContext& context, QObject* parent = nullptr);
    ~Engine() override;

    /**
     * @brief Register stored connections and start polling
     */
    bool init();

    /**
     * @brief Default startup: presence indicator, autostart, default connection
     * @param skipAutostart Do not open autoconnect connections
     * @param cliUri URI given on the command line, suppresses default discovery
     */
    void start(bool skipAutostart, const QString& cliUri);

    /**
     * @brief Register (if needed) and open a connection
     * @param autoconnect Update the connection's autoconnect flag when set
     * @param probe Mark a newly registered connection as a probe
     */
    bool connectToUri(const QString& uri, std::optional<bool> autoconnect = std::nullopt, bool probe = false);

    /// Forget a connection, its windows and its stored settings
    void removeConnection(const QString& uri);

    void handleCommand(const CliCommand& command);

    void exitApp(const QString& source);

    /**
     * @brief Pick the default URI for this host
     * @return "xen:///" with /proc/xen, "qemu:///system" with KVM or a libvirt
     *         socket, empty when no hypervisor is detected
     */
    static QString defaultHypervisorUri(const PathProbe& exists = PathProbe());

    void setPathProbe(const PathProbe& probe)
    {
        m_pathProbe = probe;
    }

    // Component access
    WorkQueue* workQueue() const
    {
        return m_queue.get();
    }
    PollWorker* pollWorker() const
    {
        return m_worker.get();
    }
    TickScheduler* tickScheduler() const
    {
        return m_scheduler.get();
    }
    ConnectionRegistry* registry() const
    {
        return m_registry.get();
    }
    LifecycleController* lifecycle() const
    {
        return m_lifecycle.get();
    }
    WindowLauncher* launcher() const
    {
        return m_launcher.get();
    }
    CommandDispatcher* dispatcher() const
    {
        return m_dispatcher.get();
    }
    AutostartSequencer* autostart() const
    {
        return m_autostart.get();
    }
    IPresenceIndicator* presenceIndicator() const
    {
        return m_indicator;
    }

Q_SIGNALS:
    /// Teardown finished; the event loop may quit
    void quitRequested();

private Q_SLOTS:
    void onConnectionAdded(const QString& uri, VirtDeck::IConnection* connection);
    void onConnectionStateChanged(const QString& uri);
    void onConnectError(const QString& uri, const QString& message, const QString& details, bool warnConsole);
    void onPollFailed(const QString& uri, const QString& message, const QString& details);
    void onPresenceModeChanged();
    void addDefaultConnection();
    void shutdown();

private:
    void initPresenceIndicator();
    void persistConnection(const QString& uri);

    EngineContext m_context;
    PathProbe m_pathProbe;

    // Declaration order matters: the queue must outlive the worker
    std::unique_ptr<WorkQueue> m_queue;
    std::unique_ptr<ConnectionRegistry> m_registry;
    std::unique_ptr<LifecycleController> m_lifecycle;
    std::unique_ptr<TickScheduler> m_scheduler;
    std::unique_ptr<PollWorker> m_worker;
    std::unique_ptr<WindowLauncher> m_launcher;
    std::unique_ptr<CommandDispatcher> m_dispatcher;
    std::unique_ptr<AutostartSequencer> m_autostart;
    QPointer<IPresenceIndicator> m_indicator;

    bool m_initialized = false;
    bool m_shutdown = false;
};

} // namespace VirtDeck
