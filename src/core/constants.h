// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QLatin1String>

namespace VirtDeck {

/**
 * @brief Default values and core module constants
 *
 * These defaults are used by core module files that can't depend on config.
 * For user-configurable settings, see ConfigDefaults and virtdeck.kcfg.
 */
namespace Defaults {
// Maximum number of poll requests waiting for the worker. Enqueue beyond this
// is rejected so slow backends cannot grow memory without bound.
constexpr int PollQueueCapacity = 100;

// Poll interval bounds in seconds (configurable via Settings)
constexpr int PollIntervalSeconds = 1;
constexpr int MinPollIntervalSeconds = 1;
constexpr int MaxPollIntervalSeconds = 60;

// Delay before probing for a default hypervisor when nothing is stored
constexpr int DefaultConnectionDelayMs = 1000;

// Upper bound for a single blocking backend call made from the poll worker
constexpr int BackendCallTimeoutMs = 30000;

// Shutdown waits for an in-flight poll; must outlast one backend call
constexpr int PollWorkerStopTimeoutMs = BackendCallTimeoutMs + 5000;
}

/**
 * @brief Well-known URIs and host paths used for default connection discovery
 */
namespace DefaultUri {
inline constexpr QLatin1String QemuSystem{"qemu:///system"};
inline constexpr QLatin1String Xen{"xen:///"};

inline constexpr QLatin1String XenProcPath{"/proc/xen"};
inline constexpr QLatin1String KvmDevicePath{"/dev/kvm"};
inline constexpr QLatin1String LibvirtSocketPath{"/var/run/libvirt/libvirt-sock"};
}

/**
 * @brief D-Bus names exported by the application
 */
namespace DBus {
inline constexpr QLatin1String ServiceName{"org.virtdeck.virtdeck"};
inline constexpr QLatin1String ObjectPath{"/Engine"};
inline constexpr QLatin1String EngineInterface{"org.virtdeck.Engine"};
}

} // namespace VirtDeck
