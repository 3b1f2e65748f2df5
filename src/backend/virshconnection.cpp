// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "virshconnection.h"
#include "../core/constants.h"
#include "../core/logging.h"
#include "../core/utils.h"
#include <KLocalizedString>
#include <QRegularExpression>
#include <QSet>
#include <QStandardPaths>
#include <QUrl>
#include <utility>

namespace VirtDeck {

namespace {
const QString VirshProgram = QStringLiteral("virsh");
} // namespace

VirshConnection::VirshConnection(const QString& uri, QObject* parent)
    : IConnection(parent)
    , m_uri(uri)
{
}

VirshConnection::~VirshConnection()
{
    if (m_openProcess && m_openProcess->state() != QProcess::NotRunning) {
        m_openProcess->kill();
        m_openProcess->waitForFinished(500);
    }
}

bool VirshConnection::isAvailable()
{
    return !QStandardPaths::findExecutable(VirshProgram).isEmpty();
}

ConnectionState VirshConnection::state() const
{
    return static_cast<ConnectionState>(m_state.loadAcquire());
}

TransportKind VirshConnection::transportKind() const
{
    return Utils::transportKindForUri(m_uri);
}

void VirshConnection::setState(ConnectionState state)
{
    if (this->state() == state) {
        return;
    }
    m_state.storeRelease(static_cast<int>(state));
    qCDebug(lcBackend) << "uri=" << m_uri << "state=" << static_cast<int>(state);
    Q_EMIT stateChanged();
}

void VirshConnection::setAutoconnect(bool enabled)
{
    if (m_autoconnect != enabled) {
        m_autoconnect = enabled;
        Q_EMIT autoconnectChanged(enabled);
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Open / close
// ═══════════════════════════════════════════════════════════════════════════════

void VirshConnection::open()
{
    if (state() != ConnectionState::Disconnected) {
        return;
    }

    m_awaitingInitialList.storeRelease(0);
    setState(ConnectionState::Connecting);

    if (!m_openProcess) {
        m_openProcess = new QProcess(this);
        connect(m_openProcess, &QProcess::finished, this, &VirshConnection::onOpenFinished);
        connect(m_openProcess, &QProcess::errorOccurred, this, &VirshConnection::onOpenError);
    }

    // Async start: failures arrive through errorOccurred or a non-zero exit code
    m_openProcess->start(VirshProgram, QStringList{QStringLiteral("-c"), m_uri, QStringLiteral("uri")});
}

void VirshConnection::onOpenFinished(int exitCode, QProcess::ExitStatus exitStatus)
{
    if (state() != ConnectionState::Connecting) {
        return;
    }

    if (exitStatus == QProcess::NormalExit && exitCode == 0) {
        qCDebug(lcBackend) << "virsh reached uri=" << m_uri << ", loading domains";
        // Becomes Active in applyPoll() once the first list is in
        m_awaitingInitialList.storeRelease(1);
        Q_EMIT priorityPollRequested(PollRequest{false, true, true});
        return;
    }

    const QString stdErr = QString::fromLocal8Bit(m_openProcess->readAllStandardError());
    const QString firstLine = stdErr.section(QLatin1Char('\n'), 0, 0).trimmed();
    Q_EMIT connectError(firstLine.isEmpty() ? i18n("virsh exited with code %1", exitCode) : firstLine, stdErr,
                        detectConsoleSession());
    setState(ConnectionState::Disconnected);
}

void VirshConnection::onOpenError(QProcess::ProcessError error)
{
    // Crashes and non-zero exits are reported by onOpenFinished
    if (error != QProcess::FailedToStart || state() != ConnectionState::Connecting) {
        return;
    }

    const QString message = m_openProcess ? m_openProcess->errorString() : QString();
    qCWarning(lcBackend) << "virsh could not be started:" << message;
    Q_EMIT connectError(i18n("The virsh client could not be started: %1", message),
                        i18n("Install the libvirt client tools and make sure 'virsh' is in PATH."), false);
    setState(ConnectionState::Disconnected);
}

bool VirshConnection::detectConsoleSession() const
{
    // A session URI without a user session bus cannot reach the per-user daemon
    return QUrl(m_uri).path() == QLatin1String("/session") && qEnvironmentVariableIsEmpty("XDG_RUNTIME_DIR");
}

void VirshConnection::close()
{
    if (m_openProcess && m_openProcess->state() != QProcess::NotRunning) {
        m_openProcess->kill();
    }
    m_awaitingInitialList.storeRelease(0);

    const QVector<VmInfo> vms = std::exchange(m_vms, {});
    m_stats.clear();
    setState(ConnectionState::Disconnected);
    for (const VmInfo& vm : vms) {
        Q_EMIT vmRemoved(vm.connectionKey());
    }
}

std::optional<VmInfo> VirshConnection::vm(const QString& connectionKey) const
{
    for (const VmInfo& info : m_vms) {
        if (info.connectionKey() == connectionKey) {
            return info;
        }
    }
    return std::nullopt;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Polling (worker thread)
// ═══════════════════════════════════════════════════════════════════════════════

VirshOutput VirshConnection::runVirsh(const QStringList& arguments) const
{
    QProcess process;
    process.start(VirshProgram, QStringList{QStringLiteral("-q"), QStringLiteral("-c"), m_uri} + arguments);

    VirshOutput output;
    if (!process.waitForStarted()) {
        output.stdErr = process.errorString();
        return output;
    }
    if (!process.waitForFinished(Defaults::BackendCallTimeoutMs)) {
        process.kill();
        process.waitForFinished(500);
        output.stdErr = i18n("virsh %1 timed out", arguments.join(QLatin1Char(' ')));
        return output;
    }

    output.stdOut = QString::fromLocal8Bit(process.readAllStandardOutput());
    output.stdErr = QString::fromLocal8Bit(process.readAllStandardError());
    output.ok = process.exitStatus() == QProcess::NormalExit && process.exitCode() == 0;
    return output;
}

PollResult VirshConnection::tickFromEngine(const PollRequest& request)
{
    const bool initial = state() == ConnectionState::Connecting && m_awaitingInitialList.loadAcquire();
    if (state() != ConnectionState::Active && !initial) {
        return PollResult::ok();
    }
    if (!initial && !request.pollVms && !request.statsUpdate && !request.force) {
        return PollResult::ok();
    }

    const VirshOutput list = runVirsh(QStringList{QStringLiteral("list"), QStringLiteral("--all")});
    if (!list.ok) {
        if (initial) {
            return failInitialList(i18n("Listing domains failed"), list.stdErr);
        }
        return PollResult::failure(i18n("Listing domains failed"), list.stdErr);
    }

    QVector<VmInfo> vms = parseDomainList(list.stdOut);

    QSet<QString> seen;
    for (VmInfo& vm : vms) {
        seen.insert(vm.name);
        auto it = m_uuidByName.constFind(vm.name);
        if (it != m_uuidByName.constEnd()) {
            vm.uuid = *it;
            continue;
        }
        const VirshOutput uuid = runVirsh(QStringList{QStringLiteral("domuuid"), vm.name});
        if (uuid.ok) {
            vm.uuid = uuid.stdOut.trimmed();
            m_uuidByName.insert(vm.name, vm.uuid);
        } else {
            qCDebug(lcBackend) << "domuuid failed for" << vm.name << uuid.stdErr;
        }
    }
    for (auto it = m_uuidByName.begin(); it != m_uuidByName.end();) {
        it = seen.contains(it.key()) ? std::next(it) : m_uuidByName.erase(it);
    }

    QHash<QString, QHash<QString, QString>> stats;
    if (request.statsUpdate && !vms.isEmpty()) {
        const VirshOutput domstats = runVirsh(QStringList{QStringLiteral("domstats"), QStringLiteral("--raw"),
                                                          QStringLiteral("--state"), QStringLiteral("--cpu-total"),
                                                          QStringLiteral("--balloon")});
        if (!domstats.ok) {
            if (initial) {
                return failInitialList(i18n("Reading domain statistics failed"), domstats.stdErr);
            }
            return PollResult::failure(i18n("Reading domain statistics failed"), domstats.stdErr);
        }
        stats = parseDomainStats(domstats.stdOut);
    }

    // Hand the results to the foreground thread
    QMetaObject::invokeMethod(
        this,
        [this, vms, stats]() {
            applyPoll(vms, stats);
        },
        Qt::QueuedConnection);

    return PollResult::ok();
}

PollResult VirshConnection::failInitialList(const QString& message, const QString& details)
{
    // A connection that cannot list its domains never became usable
    QMetaObject::invokeMethod(
        this,
        [this, message, details]() {
            if (state() != ConnectionState::Connecting || !m_awaitingInitialList.testAndSetOrdered(1, 0)) {
                return;
            }
            qCWarning(lcBackend) << "Initial domain list failed uri=" << m_uri << message;
            Q_EMIT connectError(message, details, detectConsoleSession());
            setState(ConnectionState::Disconnected);
        },
        Qt::QueuedConnection);

    // Reported through connectError, not as a poll error
    return PollResult::ok();
}

void VirshConnection::applyPoll(const QVector<VmInfo>& vms, const QHash<QString, QHash<QString, QString>>& stats)
{
    if (state() == ConnectionState::Connecting && m_awaitingInitialList.testAndSetOrdered(1, 0)) {
        m_vms = vms;
        m_stats = stats;
        for (const VmInfo& vm : vms) {
            Q_EMIT vmAdded(vm.connectionKey());
        }
        qCInfo(lcBackend) << "Connected uri=" << m_uri << "domains=" << vms.size();
        setState(ConnectionState::Active);
        return;
    }
    if (state() != ConnectionState::Active) {
        return;
    }

    const DomainDiff diff = diffDomains(m_vms, vms);

    m_vms = vms;
    if (!stats.isEmpty()) {
        m_stats = stats;
    }

    for (const QString& name : diff.removed) {
        m_stats.remove(name);
        Q_EMIT vmRemoved(name);
    }
    for (const auto& pair : diff.renamed) {
        qCInfo(lcBackend) << "Domain renamed" << pair.first << "->" << pair.second;
        Q_EMIT vmRenamed(pair.first, pair.second);
    }
    for (const QString& name : diff.added) {
        Q_EMIT vmAdded(name);
    }
}

DomainDiff VirshConnection::diffDomains(const QVector<VmInfo>& previous, const QVector<VmInfo>& current)
{
    QHash<QString, QString> previousUuids;
    for (const VmInfo& vm : previous) {
        previousUuids.insert(vm.name, vm.uuid);
    }
    QHash<QString, QString> currentUuids;
    for (const VmInfo& vm : current) {
        currentUuids.insert(vm.name, vm.uuid);
    }

    DomainDiff diff;
    for (const VmInfo& vm : previous) {
        if (!currentUuids.contains(vm.name)) {
            diff.removed.append(vm.name);
        }
    }
    for (const VmInfo& vm : current) {
        if (!previousUuids.contains(vm.name)) {
            diff.added.append(vm.name);
        }
    }

    for (const QString& newName : std::as_const(diff.added)) {
        const QString uuid = currentUuids.value(newName);
        if (uuid.isEmpty()) {
            continue;
        }
        for (const QString& oldName : std::as_const(diff.removed)) {
            if (previousUuids.value(oldName) == uuid) {
                diff.renamed.append(qMakePair(oldName, newName));
                break;
            }
        }
    }
    for (const auto& pair : std::as_const(diff.renamed)) {
        diff.removed.removeAll(pair.first);
        diff.added.removeAll(pair.second);
    }
    return diff;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Parsers
// ═══════════════════════════════════════════════════════════════════════════════

QVector<VmInfo> VirshConnection::parseDomainList(const QString& output)
{
    // " 3    web01      running" / " -    db02       shut off"
    static const QRegularExpression row(QStringLiteral("^\\s*(\\d+|-)\\s+(\\S+)\\s+(.+?)\\s*$"));

    QVector<VmInfo> vms;
    const QStringList lines = output.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    for (const QString& line : lines) {
        const QRegularExpressionMatch match = row.match(line);
        if (!match.hasMatch()) {
            continue;
        }
        VmInfo vm;
        const QString id = match.captured(1);
        vm.id = id == QLatin1String("-") ? -1 : id.toInt();
        vm.name = match.captured(2);
        vm.state = match.captured(3);
        vms.append(vm);
    }
    return vms;
}

QHash<QString, QHash<QString, QString>> VirshConnection::parseDomainStats(const QString& output)
{
    // Domain: 'web01'
    //   state.state=1
    static const QRegularExpression header(QStringLiteral("^Domain: '(.+)'$"));

    QHash<QString, QHash<QString, QString>> stats;
    QString current;
    const QStringList lines = output.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    for (const QString& rawLine : lines) {
        const QString line = rawLine.trimmed();
        const QRegularExpressionMatch match = header.match(line);
        if (match.hasMatch()) {
            current = match.captured(1);
            stats.insert(current, {});
            continue;
        }
        const int eq = line.indexOf(QLatin1Char('='));
        if (current.isEmpty() || eq <= 0) {
            continue;
        }
        stats[current].insert(line.left(eq), line.mid(eq + 1));
    }
    return stats;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Factory
// ═══════════════════════════════════════════════════════════════════════════════

IConnection* VirshConnectionFactory::createConnection(const QString& uri)
{
    const QUrl url(uri);
    if (!url.isValid() || url.scheme().isEmpty()) {
        qCWarning(lcBackend) << "Rejecting malformed connection uri=" << uri;
        return nullptr;
    }
    return new VirshConnection(uri);
}

} // namespace VirtDeck
