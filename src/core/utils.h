// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "types.h"
#include <QString>
#include <QUrl>

namespace VirtDeck {
namespace Utils {

/**
 * @brief Transport component of a libvirt URI scheme
 *
 * "qemu+ssh://host/system" -> "ssh", "qemu:///system" -> empty.
 */
inline QString uriTransport(const QString& uri)
{
    const QString scheme = QUrl(uri).scheme();
    const int plus = scheme.indexOf(QLatin1Char('+'));
    if (plus < 0) {
        return QString();
    }
    return scheme.mid(plus + 1).toLower();
}

/**
 * @brief Hypervisor driver component of a libvirt URI scheme ("qemu", "xen", ...)
 */
inline QString uriDriver(const QString& uri)
{
    const QString scheme = QUrl(uri).scheme();
    const int plus = scheme.indexOf(QLatin1Char('+'));
    return (plus < 0 ? scheme : scheme.left(plus)).toLower();
}

/**
 * @brief Whether the URI names a remote host
 *
 * A hostname makes a URI remote unless it is an explicit local name.
 */
inline bool isRemoteUri(const QString& uri)
{
    const QString host = QUrl(uri).host();
    if (host.isEmpty()) {
        return false;
    }
    return host != QLatin1String("localhost") || !uriTransport(uri).isEmpty();
}

/**
 * @brief Classify a URI for connect-error hints
 */
inline TransportKind transportKindForUri(const QString& uri)
{
    if (isRemoteUri(uri)) {
        return uriTransport(uri) == QLatin1String("ssh") ? TransportKind::Ssh : TransportKind::Remote;
    }
    if (uriDriver(uri).startsWith(QLatin1String("xen"))) {
        return TransportKind::Xen;
    }
    return TransportKind::Local;
}

} // namespace Utils
} // namespace VirtDeck
