// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "virtdeck_export.h"
#include "types.h"
#include <QString>

namespace VirtDeck {

/**
 * @brief What is known about a failed connection attempt
 */
struct VIRTDECK_EXPORT ConnectFailure
{
    QString uri;
    TransportKind transport = TransportKind::Local;
    QString transportName;  ///< URI scheme transport ("ssh", "tls", ...), may be empty
    QString errorMessage;
    QString details;        ///< Backend diagnostic dump
    bool warnConsole = false; ///< No local session could be detected
    bool probe = false;
    QString askpassPackage;
};

/**
 * @brief User-facing text for a failed connection attempt
 */
struct VIRTDECK_EXPORT ConnectErrorText
{
    QString title;
    QString message;
    QString details;
    QString hint;
    bool askToRemember = false; ///< Message ends with a yes/no question
};

/**
 * @brief Build the error text for a connect failure, with a hint chosen by transport
 *
 * Remote: netcat without -U support, missing ssh-askpass, or libvirtd on the
 * remote host. Xen: host kernel and service. Local: missing session or a
 * missing libvirtd socket. Some hints replace the raw backend message.
 */
VIRTDECK_EXPORT ConnectErrorText describeConnectFailure(const ConnectFailure& failure);

} // namespace VirtDeck
