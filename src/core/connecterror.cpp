// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "connecterror.h"
#include "logging.h"
#include <KLocalizedString>
#include <QRegularExpression>

namespace VirtDeck {

namespace {
const QString DefaultAskpassPackage = QStringLiteral("openssh-askpass");

QString trimmed(const QString& text)
{
    QString result = text;
    while (!result.isEmpty() && (result.front() == QLatin1Char(' ') || result.front() == QLatin1Char('\n'))) {
        result.remove(0, 1);
    }
    while (!result.isEmpty() && (result.back() == QLatin1Char(' ') || result.back() == QLatin1Char('\n'))) {
        result.chop(1);
    }
    return result;
}
} // namespace

ConnectErrorText describeConnectFailure(const ConnectFailure& failure)
{
    const QString errorMessage = trimmed(failure.errorMessage);
    const QString details = trimmed(failure.details);

    QString hint;
    bool showErrorMessage = true;

    switch (failure.transport) {
    case TransportKind::Ssh:
    case TransportKind::Remote: {
        qCDebug(lcConnection) << "connect error transport=" << failure.transportName;
        static const QRegularExpression netcatNoUnixSocket(QStringLiteral("nc: .* -- 'U'"));
        if (netcatNoUnixSocket.match(details).hasMatch()) {
            hint = i18n("The remote host requires a version of netcat/nc which supports the -U option.");
            showErrorMessage = false;
        } else if (failure.transport == TransportKind::Ssh
                   && details.contains(QLatin1String("ssh-askpass"))) {
            const QString askpass =
                failure.askpassPackage.isEmpty() ? DefaultAskpassPackage : failure.askpassPackage;
            hint = i18n("You need to install %1 or similar to connect to this host.", askpass);
            showErrorMessage = false;
        } else {
            hint = i18n("Verify that the 'libvirtd' daemon is running on the remote host.");
        }
        break;
    }
    case TransportKind::Xen:
        hint = i18n("Verify that:\n"
                    " - A Xen host kernel was booted\n"
                    " - The Xen service has been started");
        break;
    case TransportKind::Local:
        if (failure.warnConsole) {
            hint = i18n("Could not detect a local session: if you are running VirtDeck over ssh -X or VNC, "
                        "you may not be able to connect to libvirt as a regular user. Try running as root.");
            showErrorMessage = false;
        } else if (details.contains(QLatin1String("libvirt-sock"))) {
            hint = i18n("Verify that the 'libvirtd' daemon is running.");
            showErrorMessage = false;
        }
        break;
    }

    QString message = i18n("Unable to connect to libvirt %1.", failure.uri);
    if (showErrorMessage && !errorMessage.isEmpty()) {
        message += QLatin1String("\n\n") + errorMessage;
    }
    if (!hint.isEmpty()) {
        message += QLatin1String("\n\n") + hint;
    }

    ConnectErrorText text;
    text.title = i18n("VirtDeck Connection Failure");
    text.hint = hint;
    text.details = message + QLatin1String("\n\n") + i18n("Libvirt URI is: %1", failure.uri)
        + QLatin1String("\n\n") + details;

    if (failure.probe) {
        message += QLatin1String("\n\n") + i18n("Would you still like to remember this connection?");
        text.askToRemember = true;
    }
    text.message = message;

    return text;
}

} // namespace VirtDeck
