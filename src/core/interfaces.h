// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "virtdeck_export.h"
#include "types.h"
#include <QObject>
#include <QString>
#include <QVector>
#include <optional>

namespace VirtDeck {

// ═══════════════════════════════════════════════════════════════════════════════
// Connections
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief A hypervisor connection identified by its URI
 *
 * Lives on the foreground thread. All signals are emitted there.
 * tickFromEngine() is the one exception: the poll worker calls it on its
 * own thread, so implementations must not touch foreground state from it
 * directly and must post results back (e.g. QMetaObject::invokeMethod with
 * Qt::QueuedConnection).
 */
class VIRTDECK_EXPORT IConnection : public QObject
{
    Q_OBJECT

public:
    explicit IConnection(QObject* parent = nullptr)
        : QObject(parent)
    {
    }
    ~IConnection() override;

    virtual QString uri() const = 0;
    virtual ConnectionState state() const = 0;
    virtual TransportKind transportKind() const = 0;

    bool isActive() const
    {
        return state() == ConnectionState::Active;
    }
    bool isConnecting() const
    {
        return state() == ConnectionState::Connecting;
    }
    bool isDisconnected() const
    {
        return state() == ConnectionState::Disconnected;
    }

    virtual bool autoconnect() const = 0;
    virtual void setAutoconnect(bool enabled) = 0;

    /**
     * @brief Start opening the connection asynchronously
     *
     * Emits stateChanged (Connecting) and later stateChanged (Active) or
     * connectError followed by stateChanged (Disconnected).
     */
    virtual void open() = 0;
    virtual void close() = 0;

    /**
     * @brief Perform one poll of the backend
     *
     * Called on the poll worker thread, never concurrently with itself.
     */
    virtual PollResult tickFromEngine(const PollRequest& request) = 0;

    virtual QVector<VmInfo> listVms() const = 0;
    virtual std::optional<VmInfo> vm(const QString& connectionKey) const = 0;

Q_SIGNALS:
    void stateChanged();
    void vmAdded(const QString& connectionKey);
    void vmRemoved(const QString& connectionKey);
    void vmRenamed(const QString& oldKey, const QString& newKey);
    void connectError(const QString& message, const QString& details, bool warnConsole);
    void priorityPollRequested(const VirtDeck::PollRequest& request);
    void autoconnectChanged(bool enabled);
};

/**
 * @brief Creates connection objects for URIs
 */
class VIRTDECK_EXPORT IConnectionFactory
{
public:
    virtual ~IConnectionFactory();

    /**
     * @return New connection (caller owns it), or nullptr if the URI is unusable
     */
    virtual IConnection* createConnection(const QString& uri) = 0;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Windows
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief A top-level window managed by the engine
 *
 * opened/closed feed the window counter. cleanup() releases everything the
 * window holds; the owner deletes the object afterwards.
 */
class VIRTDECK_EXPORT IWindow : public QObject
{
    Q_OBJECT

public:
    explicit IWindow(QObject* parent = nullptr)
        : QObject(parent)
    {
    }
    ~IWindow() override;

    virtual void show() = 0;
    virtual void close() = 0;
    virtual void cleanup() = 0;
    virtual bool isVisible() const = 0;

Q_SIGNALS:
    void opened();
    void closed();
    void managerRequested();
    void exitRequested();
};

class VIRTDECK_EXPORT IManagerWindow : public IWindow
{
    Q_OBJECT

public:
    using IWindow::IWindow;

    virtual void setInitialSelection(const QString& uri) = 0;
    virtual void setStartupError(const QString& message) = 0;

Q_SIGNALS:
    void showDomainRequested(const QString& uri, const QString& connectionKey);
    void showCreateRequested(const QString& uri);
    void showHostRequested(const QString& uri);
    void showConnectRequested();
    void migrateRequested(const QString& uri, const QString& connectionKey);
    void cloneRequested(const QString& uri, const QString& connectionKey);
    void removeConnectionRequested(const QString& uri);
};

class VIRTDECK_EXPORT IDetailsWindow : public IWindow
{
    Q_OBJECT

public:
    using IWindow::IWindow;

    virtual void activatePage(DetailsPage page) = 0;

Q_SIGNALS:
    void migrateRequested(const QString& uri, const QString& connectionKey);
    void cloneRequested(const QString& uri, const QString& connectionKey);
};

class VIRTDECK_EXPORT IConnectDialog : public IWindow
{
    Q_OBJECT

public:
    using IWindow::IWindow;

    /// Clear any previously entered URI before the next show()
    virtual void reset() = 0;

Q_SIGNALS:
    void completed(const QString& uri, bool autoconnect);
    void cancelled();
};

class VIRTDECK_EXPORT ICreateDialog : public IWindow
{
    Q_OBJECT

public:
    using IWindow::IWindow;

    virtual void setConnectionUri(const QString& uri) = 0;
    virtual QString connectionUri() const = 0;

Q_SIGNALS:
    void showDomainRequested(const QString& uri, const QString& connectionKey);
};

/**
 * @brief Dialog operating on one source VM (clone, migrate)
 */
class VIRTDECK_EXPORT IVmDialog : public IWindow
{
    Q_OBJECT

public:
    using IWindow::IWindow;

    virtual void setSourceVm(const QString& uri, const VmInfo& vm) = 0;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Background presence and error surface
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Persistent indicator that keeps the application reachable with no
 *        windows open (system tray icon)
 */
class VIRTDECK_EXPORT IPresenceIndicator : public QObject
{
    Q_OBJECT

public:
    explicit IPresenceIndicator(QObject* parent = nullptr)
        : QObject(parent)
    {
    }
    ~IPresenceIndicator() override;

    virtual void setEnabled(bool enabled) = 0;
    virtual bool isVisible() const = 0;
    virtual void cleanup() = 0;

Q_SIGNALS:
    void toggleManagerRequested();
    void showDomainRequested(const QString& uri, const QString& connectionKey);
    void migrateRequested(const QString& uri, const QString& connectionKey);
    void cloneRequested(const QString& uri, const QString& connectionKey);
    void exitRequested();
};

/**
 * @brief A user-facing error message
 */
struct VIRTDECK_EXPORT ErrorReport
{
    QString title;
    QString message;
    QString details;
    bool modal = false;
};

/**
 * @brief Presents errors and yes/no questions to the user
 */
class VIRTDECK_EXPORT IErrorReporter
{
public:
    virtual ~IErrorReporter();

    virtual void showError(const ErrorReport& report) = 0;

    /**
     * @brief Ask a blocking yes/no question
     * @return true if the user accepted
     */
    virtual bool askQuestion(const ErrorReport& report) = 0;
};

/**
 * @brief Creates the windows the engine launches
 *
 * Returned windows are owned by the caller. Factories may return nullptr when
 * a window cannot be built; the engine reports that as a launch error.
 */
class VIRTDECK_EXPORT IUiFactory
{
public:
    virtual ~IUiFactory();

    virtual IManagerWindow* createManagerWindow() = 0;
    virtual IWindow* createHostWindow(IConnection* connection) = 0;
    virtual IConnectDialog* createConnectDialog() = 0;
    virtual ICreateDialog* createCreateDialog() = 0;
    virtual IDetailsWindow* createDetailsWindow(IConnection* connection, const VmInfo& vm) = 0;
    virtual IVmDialog* createCloneDialog() = 0;
    virtual IVmDialog* createMigrateDialog() = 0;
    virtual IPresenceIndicator* createPresenceIndicator() = 0;

    /// Error surface shared by all launched windows; owned by the factory
    virtual IErrorReporter* errorReporter() = 0;
};

} // namespace VirtDeck
