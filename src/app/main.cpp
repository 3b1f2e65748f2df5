// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "widgetuifactory.h"
#include "../backend/virshconnection.h"
#include "../config/settings.h"
#include "../core/commandline.h"
#include "../core/constants.h"
#include "../core/engine.h"
#include "../core/logging.h"
#include "../dbus/engineadaptor.h"
#include <QApplication>
#include <QCommandLineParser>
#include <QDBusConnection>
#include <QTimer>
#include <KAboutData>
#include <KDBusService>
#include <KLocalizedString>
#include <signal.h>
#include <cstdio>

using namespace VirtDeck;

void signalHandler(int /*signal*/)
{
    QCoreApplication::quit();
}

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);

    // Lifetime follows the window counter and the tray, not Qt's last-window rule
    app.setQuitOnLastWindowClosed(false);

    // Set translation domain BEFORE any i18n() calls
    KLocalizedString::setApplicationDomain("virtdeck");

    KAboutData aboutData(QStringLiteral("virtdeck"), i18n("VirtDeck"), QStringLiteral("1.0.0"),
                         i18n("Desktop manager for libvirt virtual machines"), KAboutLicense::GPL_V3,
                         i18n("© 2026 fuddlesworth"));
    aboutData.addAuthor(i18n("fuddlesworth"));
    aboutData.setOrganizationDomain(QByteArrayLiteral("virtdeck.org"));
    aboutData.setDesktopFileName(QStringLiteral("org.virtdeck.virtdeck"));

    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);

    CommandLineOptions options;
    options.addTo(parser);

    parser.process(app);
    aboutData.processCommandLine(&parser);

    QString error;
    const std::optional<CliCommand> command = options.command(parser, &error);
    if (!command) {
        qCCritical(lcApp) << error;
        std::fprintf(stderr, "%s\n", qPrintable(error));
        return 1;
    }

    // A second invocation hands its arguments to the running instance and exits here
    KDBusService service(KDBusService::Unique);

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    if (!VirshConnection::isAvailable()) {
        qCWarning(lcApp) << "virsh not found in PATH, connections will fail to open";
    }

    Settings settings;
    VirshConnectionFactory connectionFactory;
    WidgetUiFactory uiFactory;

    EngineContext context;
    context.settings = &settings;
    context.connectionFactory = &connectionFactory;
    context.uiFactory = &uiFactory;

    Engine engine(context);
    uiFactory.setRegistry(engine.registry());

    new EngineAdaptor(&engine);
    if (!QDBusConnection::sessionBus().registerObject(QString(DBus::ObjectPath), &engine)) {
        qCWarning(lcDbus) << "Failed to register D-Bus object at" << QString(DBus::ObjectPath);
    }

    QObject::connect(&engine, &Engine::quitRequested, &app, &QCoreApplication::quit, Qt::QueuedConnection);

    QObject::connect(&service, &KDBusService::activateRequested, &engine,
                     [&engine, &options](const QStringList& arguments, const QString& /*workingDirectory*/) {
                         QString activationError;
                         const std::optional<CliCommand> forwarded = options.parseArguments(arguments, &activationError);
                         if (!forwarded) {
                             qCWarning(lcApp) << "Ignoring activation:" << activationError;
                             return;
                         }
                         engine.handleCommand(*forwarded);
                     });

    if (!engine.init()) {
        qCCritical(lcApp) << "Failed to initialize engine";
        return 1;
    }

    const CliCommand startupCommand = *command;
    QTimer::singleShot(0, &engine, [&engine, startupCommand]() {
        engine.handleCommand(startupCommand);
    });
    engine.start(options.skipAutostart(parser), command->uri);

    qCInfo(lcApp) << "Started successfully";
    return app.exec();
}
