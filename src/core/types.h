// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "virtdeck_export.h"
#include <QMetaType>
#include <QString>
#include <optional>

namespace VirtDeck {

// ═══════════════════════════════════════════════════════════════════════════════
// Connection state
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Liveness of a hypervisor connection
 */
enum class ConnectionState {
    Disconnected = 0, ///< Not connected (initial state, or after close/failure)
    Connecting = 1,   ///< open() in progress
    Active = 2        ///< Connected and pollable
};

/**
 * @brief How a connection reaches its hypervisor
 *
 * Used to pick a tailored hint when a connection attempt fails.
 */
enum class TransportKind {
    Local = 0,  ///< Local libvirt daemon (qemu:///system, qemu:///session, ...)
    Ssh = 1,    ///< Remote host tunnelled over ssh (qemu+ssh://host/system)
    Remote = 2, ///< Remote host over tls/tcp/libssh
    Xen = 3     ///< Local Xen host (xen:///)
};

// ═══════════════════════════════════════════════════════════════════════════════
// Polling
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Work queue priority classes
 *
 * Lower value sorts first: HIGH requests always run before LOW ones.
 */
enum class PollPriority {
    High = 1,
    Low = 2
};

/**
 * @brief Parameters for a single poll of a connection
 */
struct VIRTDECK_EXPORT PollRequest
{
    bool statsUpdate = false; ///< Refresh per-VM statistics
    bool pollVms = false;     ///< Refresh the VM list
    bool force = false;       ///< Poll even if the backend thinks nothing changed

    bool operator==(const PollRequest& other) const
    {
        return statsUpdate == other.statsUpdate && pollVms == other.pollVms && force == other.force;
    }

    /**
     * @brief Request issued by the periodic tick for every connection
     */
    static PollRequest periodic()
    {
        return PollRequest{true, true, false};
    }
};

/**
 * @brief Outcome of IConnection::tickFromEngine()
 */
struct VIRTDECK_EXPORT PollResult
{
    bool success = true;
    QString errorMessage; ///< Human readable reason
    QString details;      ///< Diagnostic detail (command output, backend error dump)

    static PollResult ok()
    {
        return PollResult{};
    }

    static PollResult failure(const QString& message, const QString& details = QString())
    {
        return PollResult{false, message, details};
    }
};

// ═══════════════════════════════════════════════════════════════════════════════
// Virtual machines
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Snapshot of a domain as reported by a connection
 */
struct VIRTDECK_EXPORT VmInfo
{
    int id = -1;      ///< Hypervisor domain id, -1 while the domain is shut off
    QString name;
    QString uuid;
    QString state;    ///< Backend state string ("running", "shut off", ...)

    /**
     * @brief Key identifying this VM within its connection
     *
     * Keys are names, so they change when a domain is renamed. Windows keyed
     * by it are moved explicitly on vmRenamed.
     */
    QString connectionKey() const
    {
        return name;
    }

    bool isRunning() const
    {
        return id >= 0;
    }

    bool operator==(const VmInfo& other) const
    {
        return id == other.id && name == other.name && uuid == other.uuid && state == other.state;
    }
};

// ═══════════════════════════════════════════════════════════════════════════════
// Windows and commands
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Windows that can be requested from the command line
 */
enum class WindowKind {
    Manager = 0,
    Creator = 1,
    Editor = 2,
    Performance = 3,
    Console = 4,
    Summary = 5
};

/**
 * @brief String names of WindowKind on the command channel
 */
namespace WindowKindName {
inline constexpr const char Manager[] = "manager";
inline constexpr const char Creator[] = "creator";
inline constexpr const char Editor[] = "editor";
inline constexpr const char Performance[] = "performance";
inline constexpr const char Console[] = "console";
inline constexpr const char Summary[] = "summary";
} // namespace WindowKindName

inline std::optional<WindowKind> windowKindFromString(const QString& name)
{
    if (name == QLatin1String(WindowKindName::Manager))
        return WindowKind::Manager;
    if (name == QLatin1String(WindowKindName::Creator))
        return WindowKind::Creator;
    if (name == QLatin1String(WindowKindName::Editor))
        return WindowKind::Editor;
    if (name == QLatin1String(WindowKindName::Performance))
        return WindowKind::Performance;
    if (name == QLatin1String(WindowKindName::Console))
        return WindowKind::Console;
    if (name == QLatin1String(WindowKindName::Summary))
        return WindowKind::Summary;
    return std::nullopt;
}

inline QString windowKindToString(WindowKind kind)
{
    switch (kind) {
    case WindowKind::Manager:
        return QLatin1String(WindowKindName::Manager);
    case WindowKind::Creator:
        return QLatin1String(WindowKindName::Creator);
    case WindowKind::Editor:
        return QLatin1String(WindowKindName::Editor);
    case WindowKind::Performance:
        return QLatin1String(WindowKindName::Performance);
    case WindowKind::Console:
        return QLatin1String(WindowKindName::Console);
    case WindowKind::Summary:
        return QLatin1String(WindowKindName::Summary);
    }
    return QString();
}

/**
 * @brief Page shown when a details window is raised
 */
enum class DetailsPage {
    Default = 0,
    Performance = 1,
    Config = 2,
    Console = 3
};

/**
 * @brief A command delivered by the command line or D-Bus
 *
 * All fields may be empty. The window name is kept as a string so an
 * unknown name can be reported instead of being dropped at parse time.
 */
struct VIRTDECK_EXPORT CliCommand
{
    QString uri;
    QString showWindow;
    QString domain;

    bool operator==(const CliCommand& other) const
    {
        return uri == other.uri && showWindow == other.showWindow && domain == other.domain;
    }
};

} // namespace VirtDeck

Q_DECLARE_METATYPE(VirtDeck::PollRequest)
Q_DECLARE_METATYPE(VirtDeck::VmInfo)
Q_DECLARE_METATYPE(VirtDeck::CliCommand)
