// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file fakes.h
 * @brief In-memory connections, windows and factories for engine tests
 *
 * Nothing here talks to a hypervisor or opens a real window. Windows emit
 * opened/closed exactly like a toolkit window would, so the lifecycle
 * counter sees realistic traffic.
 */

#pragma once

#include "core/interfaces.h"
#include <QAtomicInt>
#include <QHash>
#include <QList>
#include <QMutex>
#include <QMutexLocker>
#include <QPointer>
#include <QSet>
#include <QThread>
#include <QVector>
#include <stdexcept>

namespace VirtDeck {
namespace Test {

// ═══════════════════════════════════════════════════════════════════════════════
// Connections
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Connection whose state is driven by the test
 *
 * open() only moves to Connecting; the test decides how the attempt ends
 * with setState() or fail().
 */
class FakeConnection : public IConnection
{
public:
    enum class PollBehavior {
        Succeed,
        Fail,
        Throw,
        Block ///< Sleep for blockMs before succeeding
    };

    explicit FakeConnection(const QString& uri, QObject* parent = nullptr)
        : IConnection(parent)
        , m_uri(uri)
    {
    }

    QString uri() const override
    {
        return m_uri;
    }
    ConnectionState state() const override
    {
        return m_state;
    }
    TransportKind transportKind() const override
    {
        return m_transport;
    }

    bool autoconnect() const override
    {
        return m_autoconnect;
    }
    void setAutoconnect(bool enabled) override
    {
        if (m_autoconnect != enabled) {
            m_autoconnect = enabled;
            Q_EMIT autoconnectChanged(enabled);
        }
    }

    void open() override
    {
        ++openCount;
        setState(ConnectionState::Connecting);
    }
    void close() override
    {
        ++closeCount;
        setState(ConnectionState::Disconnected);
    }

    PollResult tickFromEngine(const PollRequest& request) override
    {
        {
            QMutexLocker locker(&m_pollMutex);
            m_requests.append(request);
        }
        pollCount.fetchAndAddOrdered(1);

        switch (PollBehavior(m_pollBehavior.loadAcquire())) {
        case PollBehavior::Fail:
            return PollResult::failure(QStringLiteral("poll failed"), QStringLiteral("backend said no"));
        case PollBehavior::Throw:
            throw std::runtime_error("backend exploded");
        case PollBehavior::Block:
            QThread::msleep(blockMs.loadAcquire());
            break;
        case PollBehavior::Succeed:
            break;
        }
        return PollResult::ok();
    }

    QVector<VmInfo> listVms() const override
    {
        return m_vms;
    }
    std::optional<VmInfo> vm(const QString& connectionKey) const override
    {
        for (const VmInfo& vm : m_vms) {
            if (vm.connectionKey() == connectionKey) {
                return vm;
            }
        }
        return std::nullopt;
    }

    // Test controls

    void setState(ConnectionState state)
    {
        if (m_state != state) {
            m_state = state;
            Q_EMIT stateChanged();
        }
    }

    /// End a connection attempt the way a backend failure does
    void fail(const QString& message, const QString& details = QString(), bool warnConsole = false)
    {
        Q_EMIT connectError(message, details, warnConsole);
        setState(ConnectionState::Disconnected);
    }

    void setTransportKind(TransportKind kind)
    {
        m_transport = kind;
    }

    void setPollBehavior(PollBehavior behavior)
    {
        m_pollBehavior.storeRelease(int(behavior));
    }

    void addVm(const VmInfo& vm)
    {
        m_vms.append(vm);
        Q_EMIT vmAdded(vm.connectionKey());
    }
    void removeVm(const QString& connectionKey)
    {
        for (int i = 0; i < m_vms.size(); ++i) {
            if (m_vms.at(i).connectionKey() == connectionKey) {
                m_vms.removeAt(i);
                Q_EMIT vmRemoved(connectionKey);
                return;
            }
        }
    }
    void renameVm(const QString& oldKey, const QString& newName)
    {
        for (VmInfo& vm : m_vms) {
            if (vm.connectionKey() == oldKey) {
                vm.name = newName;
                Q_EMIT vmRenamed(oldKey, vm.connectionKey());
                return;
            }
        }
    }

    QList<PollRequest> requests() const
    {
        QMutexLocker locker(&m_pollMutex);
        return m_requests;
    }

    int openCount = 0;
    int closeCount = 0;
    QAtomicInt pollCount = 0;
    QAtomicInt blockMs = 0;

private:
    const QString m_uri;
    ConnectionState m_state = ConnectionState::Disconnected;
    TransportKind m_transport = TransportKind::Local;
    bool m_autoconnect = false;
    QVector<VmInfo> m_vms;
    QAtomicInt m_pollBehavior = int(PollBehavior::Succeed);
    mutable QMutex m_pollMutex;
    QList<PollRequest> m_requests;
};

class FakeConnectionFactory : public IConnectionFactory
{
public:
    IConnection* createConnection(const QString& uri) override
    {
        if (uri.isEmpty() || rejected.contains(uri)) {
            return nullptr;
        }
        auto* connection = new FakeConnection(uri);
        created.insert(uri, connection);
        return connection;
    }

    FakeConnection* get(const QString& uri) const
    {
        return created.value(uri).data();
    }

    QSet<QString> rejected;
    QHash<QString, QPointer<FakeConnection>> created;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Windows
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Visibility bookkeeping shared by every fake window
 */
template<typename Interface>
class FakeWindow : public Interface
{
public:
    void show() override
    {
        ++showCount;
        if (!m_visible) {
            m_visible = true;
            Q_EMIT this->opened();
        }
    }
    void close() override
    {
        if (m_visible) {
            m_visible = false;
            Q_EMIT this->closed();
        }
    }
    void cleanup() override
    {
        ++cleanupCount;
        close();
    }
    bool isVisible() const override
    {
        return m_visible;
    }

    int showCount = 0;
    int cleanupCount = 0;

private:
    bool m_visible = false;
};

class FakeManagerWindow : public FakeWindow<IManagerWindow>
{
public:
    void setInitialSelection(const QString& uri) override
    {
        initialSelection = uri;
    }
    void setStartupError(const QString& message) override
    {
        startupError = message;
    }

    QString initialSelection;
    QString startupError;
};

class FakeHostWindow : public FakeWindow<IWindow>
{
public:
    explicit FakeHostWindow(IConnection* connection)
        : connection(connection)
    {
    }

    IConnection* connection;
};

class FakeDetailsWindow : public FakeWindow<IDetailsWindow>
{
public:
    explicit FakeDetailsWindow(const VmInfo& vm)
        : vm(vm)
    {
    }

    void activatePage(DetailsPage page) override
    {
        pages.append(page);
    }

    VmInfo vm;
    QList<DetailsPage> pages;
};

class FakeConnectDialog : public FakeWindow<IConnectDialog>
{
public:
    void reset() override
    {
        ++resetCount;
    }

    void accept(const QString& uri, bool autoconnect)
    {
        Q_EMIT completed(uri, autoconnect);
        close();
    }
    void cancel()
    {
        close();
        Q_EMIT cancelled();
    }

    int resetCount = 0;
};

class FakeCreateDialog : public FakeWindow<ICreateDialog>
{
public:
    void setConnectionUri(const QString& uri) override
    {
        m_uri = uri;
    }
    QString connectionUri() const override
    {
        return m_uri;
    }

private:
    QString m_uri;
};

class FakeVmDialog : public FakeWindow<IVmDialog>
{
public:
    void setSourceVm(const QString& uri, const VmInfo& vm) override
    {
        sourceUri = uri;
        sourceVm = vm;
    }

    QString sourceUri;
    VmInfo sourceVm;
};

class FakePresenceIndicator : public IPresenceIndicator
{
public:
    void setEnabled(bool enabled) override
    {
        m_visible = enabled;
    }
    bool isVisible() const override
    {
        return m_visible;
    }
    void cleanup() override
    {
        ++cleanupCount;
        m_visible = false;
    }

    int cleanupCount = 0;

private:
    bool m_visible = false;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Factories
// ═══════════════════════════════════════════════════════════════════════════════

class FakeErrorReporter : public IErrorReporter
{
public:
    void showError(const ErrorReport& report) override
    {
        errors.append(report);
    }
    bool askQuestion(const ErrorReport& report) override
    {
        questions.append(report);
        return answer;
    }

    QList<ErrorReport> errors;
    QList<ErrorReport> questions;
    bool answer = false;
};

/**
 * @brief Builds fake windows and remembers the last one of each kind
 *
 * Windows are owned by whoever asked for them (the launcher or registry),
 * so every pointer kept here is guarded.
 */
class FakeUiFactory : public IUiFactory
{
public:
    IManagerWindow* createManagerWindow() override
    {
        if (failManager) {
            return nullptr;
        }
        ++managerCreated;
        manager = new FakeManagerWindow;
        return manager;
    }
    IWindow* createHostWindow(IConnection* connection) override
    {
        ++hostCreated;
        host = new FakeHostWindow(connection);
        return host;
    }
    IConnectDialog* createConnectDialog() override
    {
        connectDialog = new FakeConnectDialog;
        return connectDialog;
    }
    ICreateDialog* createCreateDialog() override
    {
        createDialog = new FakeCreateDialog;
        return createDialog;
    }
    IDetailsWindow* createDetailsWindow(IConnection* connection, const VmInfo& vm) override
    {
        Q_UNUSED(connection)
        ++detailsCreated;
        auto* window = new FakeDetailsWindow(vm);
        details.append(window);
        return window;
    }
    IVmDialog* createCloneDialog() override
    {
        cloneDialog = new FakeVmDialog;
        return cloneDialog;
    }
    IVmDialog* createMigrateDialog() override
    {
        migrateDialog = new FakeVmDialog;
        return migrateDialog;
    }
    IPresenceIndicator* createPresenceIndicator() override
    {
        if (!withIndicator) {
            return nullptr;
        }
        indicator = new FakePresenceIndicator;
        return indicator;
    }
    IErrorReporter* errorReporter() override
    {
        return &reporter;
    }

    FakeDetailsWindow* lastDetails() const
    {
        return details.isEmpty() ? nullptr : details.last().data();
    }

    bool failManager = false;
    bool withIndicator = true;
    int managerCreated = 0;
    int hostCreated = 0;
    int detailsCreated = 0;

    QPointer<FakeManagerWindow> manager;
    QPointer<FakeHostWindow> host;
    QPointer<FakeConnectDialog> connectDialog;
    QPointer<FakeCreateDialog> createDialog;
    QPointer<FakeVmDialog> cloneDialog;
    QPointer<FakeVmDialog> migrateDialog;
    QPointer<FakePresenceIndicator> indicator;
    QList<QPointer<FakeDetailsWindow>> details;
    FakeErrorReporter reporter;
};

inline VmInfo makeVm(int id, const QString& name, const QString& uuid, const QString& state = QString())
{
    VmInfo vm;
    vm.id = id;
    vm.name = name;
    vm.uuid = uuid;
    vm.state = state.isEmpty() ? (id >= 0 ? QStringLiteral("running") : QStringLiteral("shut off")) : state;
    return vm;
}

} // namespace Test
} // namespace VirtDeck
