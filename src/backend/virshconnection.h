// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/interfaces.h"
#include <QAtomicInt>
#include <QHash>
#include <QPair>
#include <QPointer>
#include <QProcess>

namespace VirtDeck {

/**
 * @brief Parsed output of a single virsh invocation
 */
struct VirshOutput
{
    bool ok = false;
    QString stdOut;
    QString stdErr;
};

/**
 * @brief Difference between two domain lists of one connection
 *
 * A name that disappears while another with the same non-empty UUID
 * appears is reported as a rename instead of a remove/add pair.
 */
struct DomainDiff
{
    QStringList removed;
    QList<QPair<QString, QString>> renamed; ///< (old name, new name)
    QStringList added;
};

/**
 * @brief IConnection backed by the virsh command line client
 *
 * open() checks the URI with an asynchronous "virsh uri", then requests a
 * priority poll. The connection stays Connecting until that first domain
 * list has been applied, so listeners of the Active transition always see
 * the VMs. Polls run virsh synchronously on the poll worker thread and hand
 * the parsed VM list back to the foreground thread, where vmAdded/vmRemoved/
 * vmRenamed are emitted.
 */
class VirshConnection : public IConnection
{
    Q_OBJECT

public:
    explicit VirshConnection(const QString& uri, QObject* parent = nullptr);
    ~VirshConnection() override;

    static bool isAvailable();

    QString uri() const override
    {
        return m_uri;
    }
    ConnectionState state() const override;
    TransportKind transportKind() const override;

    bool autoconnect() const override
    {
        return m_autoconnect;
    }
    void setAutoconnect(bool enabled) override;

    void open() override;
    void close() override;

    PollResult tickFromEngine(const PollRequest& request) override;

    QVector<VmInfo> listVms() const override
    {
        return m_vms;
    }
    std::optional<VmInfo> vm(const QString& connectionKey) const override;

    /// Last statistics reported by "virsh domstats" for a VM, keyed by field
    QHash<QString, QString> domainStats(const QString& connectionKey) const
    {
        return m_stats.value(connectionKey);
    }

    // Parsers, exposed for tests
    static QVector<VmInfo> parseDomainList(const QString& output);
    static QHash<QString, QHash<QString, QString>> parseDomainStats(const QString& output);
    static DomainDiff diffDomains(const QVector<VmInfo>& previous, const QVector<VmInfo>& current);

private:
    void setState(ConnectionState state);
    void onOpenFinished(int exitCode, QProcess::ExitStatus exitStatus);
    void onOpenError(QProcess::ProcessError error);
    void applyPoll(const QVector<VmInfo>& vms, const QHash<QString, QHash<QString, QString>>& stats);
    PollResult failInitialList(const QString& message, const QString& details);
    VirshOutput runVirsh(const QStringList& arguments) const;
    bool detectConsoleSession() const;

    const QString m_uri;
    QAtomicInt m_state = static_cast<int>(ConnectionState::Disconnected);
    // Set once "virsh uri" succeeded, cleared when the first list is applied
    QAtomicInt m_awaitingInitialList = 0;
    bool m_autoconnect = false;
    QPointer<QProcess> m_openProcess;
    QVector<VmInfo> m_vms;
    QHash<QString, QHash<QString, QString>> m_stats;

    // Worker thread only
    QHash<QString, QString> m_uuidByName;
};

/**
 * @brief Creates VirshConnection objects for well-formed libvirt URIs
 */
class VirshConnectionFactory : public IConnectionFactory
{
public:
    IConnection* createConnection(const QString& uri) override;
};

} // namespace VirtDeck
