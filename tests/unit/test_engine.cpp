// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QSignalSpy>
#include <QFile>
#include <QStandardPaths>

#include "config/settings.h"
#include "core/connectionregistry.h"
#include "core/constants.h"
#include "core/engine.h"
#include "core/lifecyclecontroller.h"
#include "core/pollworker.h"
#include "core/tickscheduler.h"
#include "core/windowlauncher.h"
#include "fakes.h"

using namespace VirtDeck;
using namespace VirtDeck::Test;

namespace {
const QString Local = QStringLiteral("qemu:///system");
const QString Remote = QStringLiteral("qemu+ssh://root@host/system");

QString configPath()
{
    return QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation) + QStringLiteral("/virtdeckrc");
}
} // namespace

/**
 * @brief Engine wiring tests
 *
 * Runs the real queue, worker thread, scheduler, registry, launcher,
 * dispatcher and lifecycle controller against fake connections and
 * windows. Settings are written to the QStandardPaths test location.
 */
class TestEngine : public QObject
{
    Q_OBJECT

private:
    struct Fixture
    {
        Fixture()
            : engine(EngineContext{&settings, &connections, &ui})
        {
        }

        FakeConnection* connection(const QString& uri) const
        {
            return connections.get(uri);
        }

        Settings settings;
        FakeConnectionFactory connections;
        FakeUiFactory ui;
        Engine engine;
    };

private Q_SLOTS:
    void initTestCase()
    {
        QStandardPaths::setTestModeEnabled(true);
    }

    void init()
    {
        QFile::remove(configPath());
    }

    void cleanupTestCase()
    {
        QFile::remove(configPath());
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Startup
    // ─────────────────────────────────────────────────────────────────────────

    void testInitRegistersStoredConnectionsAndPolls()
    {
        Fixture f;
        f.settings.setConnectionUris(QStringList{Local, Remote});

        QVERIFY(f.engine.init());
        QCOMPARE(f.engine.registry()->uris(), (QStringList{Local, Remote}));
        QVERIFY(f.engine.tickScheduler()->isActive());
        QVERIFY(f.engine.pollWorker()->isRunning());

        // init() ticks once straight away
        QTRY_VERIFY(f.connection(Local)->pollCount.loadAcquire() >= 1);
        QTRY_VERIFY(f.connection(Remote)->pollCount.loadAcquire() >= 1);
        QVERIFY(f.connection(Local)->requests().first() == PollRequest::periodic());

        // Nothing opens without autostart
        QCOMPARE(f.connection(Local)->openCount, 0);
    }

    void testIntervalFollowsSettings()
    {
        Fixture f;
        f.settings.setPollIntervalSeconds(5);
        f.engine.init();
        QCOMPARE(f.engine.tickScheduler()->intervalSeconds(), 5);

        f.settings.setPollIntervalSeconds(12);
        QCOMPARE(f.engine.tickScheduler()->intervalSeconds(), 12);
    }

    void testAutostartIsSerialized()
    {
        Fixture f;
        f.settings.setConnectionUris(QStringList{Local, Remote});
        f.settings.setAutoconnectUris(QStringList{Local, Remote});
        f.engine.init();
        f.engine.start(false, QString());

        QTRY_COMPARE(f.connection(Local)->openCount, 1);
        QTest::qWait(20);
        QCOMPARE(f.connection(Remote)->openCount, 0);

        f.connection(Local)->setState(ConnectionState::Active);
        QTRY_COMPARE(f.connection(Remote)->openCount, 1);
    }

    void testSkipAutostart()
    {
        Fixture f;
        f.settings.setConnectionUris(QStringList{Local});
        f.settings.setAutoconnectUris(QStringList{Local});
        f.engine.init();
        f.engine.start(true, QString());

        QTest::qWait(50);
        QCOMPARE(f.connection(Local)->openCount, 0);
    }

    void testDefaultConnectionIsAddedOnFirstRun()
    {
        Fixture f;
        f.engine.setPathProbe([](const QString& path) {
            return path == DefaultUri::KvmDevicePath;
        });
        f.engine.init();
        f.engine.start(true, QString());

        QTRY_VERIFY_WITH_TIMEOUT(f.engine.registry()->contains(Local), Defaults::DefaultConnectionDelayMs * 3);
        QCOMPARE(f.connection(Local)->openCount, 1);
        QVERIFY(f.settings.connectionUris().contains(Local));
        QVERIFY(f.settings.isAutoconnect(Local));
    }

    void testNoHypervisorSetsStartupError()
    {
        Fixture f;
        f.engine.setPathProbe([](const QString&) {
            return false;
        });
        f.engine.init();
        f.engine.start(true, QString());

        QTRY_VERIFY_WITH_TIMEOUT(f.ui.manager && !f.ui.manager->startupError.isEmpty(),
                                 Defaults::DefaultConnectionDelayMs * 3);
        QVERIFY(f.engine.registry()->isEmpty());
    }

    void testCommandLineUriSuppressesDefault()
    {
        Fixture f;
        f.engine.setPathProbe([](const QString&) {
            return true;
        });
        f.engine.init();
        f.engine.start(true, Remote);

        QTest::qWait(Defaults::DefaultConnectionDelayMs + 300);
        QVERIFY(!f.engine.registry()->contains(Local));
    }

    void testDefaultHypervisorUri()
    {
        QCOMPARE(Engine::defaultHypervisorUri([](const QString& path) {
                     return path == DefaultUri::XenProcPath || path == DefaultUri::KvmDevicePath;
                 }),
                 QString(DefaultUri::Xen));
        QCOMPARE(Engine::defaultHypervisorUri([](const QString& path) {
                     return path == DefaultUri::LibvirtSocketPath;
                 }),
                 QString(DefaultUri::QemuSystem));
        QVERIFY(Engine::defaultHypervisorUri([](const QString&) {
                    return false;
                }).isEmpty());
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Connect dialog and probes
    // ─────────────────────────────────────────────────────────────────────────

    void testProbeIsRememberedOnceConnected()
    {
        Fixture f;
        f.engine.init();
        f.engine.launcher()->showConnect();
        f.ui.connectDialog->accept(Remote, true);

        FakeConnection* connection = f.connection(Remote);
        QVERIFY(connection);
        QVERIFY(connection->isConnecting());
        QVERIFY(f.engine.registry()->isProbe(Remote));
        QVERIFY(!f.settings.connectionUris().contains(Remote));

        connection->setState(ConnectionState::Active);
        QVERIFY(!f.engine.registry()->isProbe(Remote));
        QVERIFY(f.settings.connectionUris().contains(Remote));
        QVERIFY(f.settings.isAutoconnect(Remote));
    }

    void testProbeFailureKeptWhenUserAgrees()
    {
        Fixture f;
        f.ui.reporter.answer = true;
        f.engine.init();
        f.engine.launcher()->showConnect();
        f.ui.connectDialog->accept(Remote, false);

        f.connection(Remote)->setTransportKind(TransportKind::Ssh);
        f.connection(Remote)->fail(QStringLiteral("Host key verification failed."));

        QCOMPARE(f.ui.reporter.questions.size(), 1);
        QVERIFY(f.ui.reporter.questions.first().message.contains(QStringLiteral("remember")));
        QVERIFY(f.engine.registry()->contains(Remote));
        QVERIFY(!f.engine.registry()->isProbe(Remote));
        QVERIFY(f.settings.connectionUris().contains(Remote));
    }

    void testProbeFailureReopensConnectDialog()
    {
        Fixture f;
        f.ui.reporter.answer = false;
        f.engine.init();
        f.engine.launcher()->showConnect();
        f.ui.connectDialog->accept(Remote, false);
        const int resets = f.ui.connectDialog->resetCount;

        f.connection(Remote)->fail(QStringLiteral("Connection refused"));
        QCOMPARE(f.ui.reporter.questions.size(), 1);

        QTRY_VERIFY(!f.engine.registry()->contains(Remote));
        QVERIFY(f.ui.connectDialog->isVisible());
        // The previous input is kept for editing
        QCOMPARE(f.ui.connectDialog->resetCount, resets);
        QVERIFY(!f.settings.connectionUris().contains(Remote));
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Connection errors and exit
    // ─────────────────────────────────────────────────────────────────────────

    void testStoredFailureWithoutWindowsExits()
    {
        Fixture f;
        f.settings.setConnectionUris(QStringList{Local});
        f.engine.init();
        QSignalSpy quitSpy(&f.engine, &Engine::quitRequested);

        f.engine.connectToUri(Local);
        f.connection(Local)->fail(QStringLiteral("Failed to connect socket"),
                                  QStringLiteral("/var/run/libvirt/libvirt-sock: No such file"));

        QCOMPARE(f.ui.reporter.errors.size(), 1);
        QVERIFY(f.ui.reporter.errors.first().modal);
        QCOMPARE(quitSpy.count(), 1);
        QVERIFY(!f.engine.pollWorker()->isRunning());
    }

    void testStoredFailureWithWindowIsNonModal()
    {
        Fixture f;
        f.settings.setConnectionUris(QStringList{Local});
        f.engine.init();
        f.engine.launcher()->showManager();
        QSignalSpy quitSpy(&f.engine, &Engine::quitRequested);

        f.engine.connectToUri(Local);
        f.connection(Local)->fail(QStringLiteral("Failed to connect socket"));

        QCOMPARE(f.ui.reporter.errors.size(), 1);
        QVERIFY(!f.ui.reporter.errors.first().modal);
        QTest::qWait(20);
        QCOMPARE(quitSpy.count(), 0);
    }

    void testPollErrorsNeedAWindow()
    {
        Fixture f;
        f.settings.setConnectionUris(QStringList{Local});
        f.engine.init();
        f.connection(Local)->setPollBehavior(FakeConnection::PollBehavior::Fail);

        f.engine.tickScheduler()->tick();
        QTRY_VERIFY(f.engine.pollWorker()->processedCount() >= 1);
        QTest::qWait(50);
        QVERIFY(f.ui.reporter.errors.isEmpty());

        f.engine.launcher()->showManager();
        f.engine.tickScheduler()->tick();
        QTRY_VERIFY(!f.ui.reporter.errors.isEmpty());
        QVERIFY(!f.ui.reporter.errors.first().modal);
        QVERIFY(f.ui.reporter.errors.first().message.contains(Local));
    }

    void testExitIsIdempotent()
    {
        Fixture f;
        f.engine.init();
        f.engine.start(true, Local);
        QPointer<FakePresenceIndicator> indicator = f.ui.indicator.data();
        QVERIFY(indicator);
        QSignalSpy quitSpy(&f.engine, &Engine::quitRequested);

        f.engine.exitApp(QStringLiteral("test"));
        f.engine.exitApp(QStringLiteral("test again"));

        QCOMPARE(quitSpy.count(), 1);
        QVERIFY(!f.engine.tickScheduler()->isActive());
        QVERIFY(f.engine.pollWorker()->isFinished());
        QCOMPARE(indicator->cleanupCount, 1);
        QTRY_VERIFY(!indicator);
    }

    void testEngineOwnsIndicator()
    {
        QPointer<FakePresenceIndicator> indicator;
        {
            Fixture f;
            f.engine.init();
            f.engine.start(true, Local);
            indicator = f.ui.indicator.data();
            QVERIFY(indicator);
            QVERIFY(indicator->parent() == &f.engine);
        }
        // Destroyed with the engine even when exitApp() never ran
        QVERIFY(!indicator);
    }

    void testLastWindowCloseExits()
    {
        Fixture f;
        f.engine.init();
        QSignalSpy quitSpy(&f.engine, &Engine::quitRequested);

        f.engine.launcher()->showManager();
        f.ui.manager->close();
        QVERIFY(quitSpy.wait(1000));
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Connection events
    // ─────────────────────────────────────────────────────────────────────────

    void testDisconnectClosesDependentWindows()
    {
        Fixture f;
        f.settings.setConnectionUris(QStringList{Local});
        f.engine.init();
        FakeConnection* connection = f.connection(Local);
        connection->setState(ConnectionState::Active);
        connection->addVm(makeVm(1, QStringLiteral("web01"), QStringLiteral("uuid-1")));

        f.engine.launcher()->showManager();
        QVERIFY(f.engine.launcher()->showDetails(Local, QStringLiteral("web01")));
        QVERIFY(f.engine.launcher()->showCreate(Local));
        QPointer<FakeDetailsWindow> details = f.ui.lastDetails();

        connection->setState(ConnectionState::Disconnected);
        QCOMPARE(details->cleanupCount, 1);
        QVERIFY(!f.ui.createDialog->isVisible());
        QVERIFY(f.ui.manager->isVisible());
        QCOMPARE(f.engine.lifecycle()->windowCount(), 1);
    }

    void testVmRemovalAndRename()
    {
        Fixture f;
        f.settings.setConnectionUris(QStringList{Local});
        f.engine.init();
        FakeConnection* connection = f.connection(Local);
        connection->setState(ConnectionState::Active);
        connection->addVm(makeVm(1, QStringLiteral("web01"), QStringLiteral("uuid-1")));
        connection->addVm(makeVm(2, QStringLiteral("db01"), QStringLiteral("uuid-2")));

        f.engine.launcher()->showDetails(Local, QStringLiteral("web01"));
        f.engine.launcher()->showDetails(Local, QStringLiteral("db01"));
        QPointer<FakeDetailsWindow> web = f.ui.details.at(0).data();
        QPointer<FakeDetailsWindow> db = f.ui.details.at(1).data();

        connection->renameVm(QStringLiteral("web01"), QStringLiteral("web02"));
        QVERIFY(f.engine.registry()->detailsWindow(Local, QStringLiteral("web02")) == web.data());
        QVERIFY(!f.engine.registry()->detailsWindow(Local, QStringLiteral("web01")));
        QCOMPARE(web->cleanupCount, 0);

        // Reopening under the new key reuses the window
        f.engine.launcher()->showDetails(Local, QStringLiteral("web02"));
        QCOMPARE(f.ui.detailsCreated, 2);

        connection->removeVm(QStringLiteral("db01"));
        QCOMPARE(db->cleanupCount, 1);
        QVERIFY(!f.engine.registry()->detailsWindow(Local, QStringLiteral("db01")));
    }

    void testPriorityPollReachesWorker()
    {
        Fixture f;
        f.settings.setConnectionUris(QStringList{Local});
        f.settings.setPollIntervalSeconds(Defaults::MaxPollIntervalSeconds);
        f.engine.init();
        FakeConnection* connection = f.connection(Local);
        QTRY_COMPARE(connection->pollCount.loadAcquire(), 1);

        const PollRequest refresh{false, true, true};
        Q_EMIT connection->priorityPollRequested(refresh);

        QTRY_COMPARE(connection->pollCount.loadAcquire(), 2);
        QVERIFY(connection->requests().last() == refresh);
    }

    void testAutoconnectChangesArePersisted()
    {
        Fixture f;
        f.settings.setConnectionUris(QStringList{Local});
        f.engine.init();

        f.connection(Local)->setAutoconnect(true);
        QVERIFY(f.settings.isAutoconnect(Local));

        // Stored on disk, not just in memory
        Settings reloaded;
        QVERIFY(reloaded.isAutoconnect(Local));

        f.connection(Local)->setAutoconnect(false);
        QVERIFY(!f.settings.isAutoconnect(Local));
    }

    void testRemoveConnectionForgetsIt()
    {
        Fixture f;
        f.settings.setConnectionUris(QStringList{Local, Remote});
        f.settings.setAutoconnectUris(QStringList{Remote});
        f.engine.init();

        f.engine.removeConnection(Remote);
        QVERIFY(!f.engine.registry()->contains(Remote));
        QCOMPARE(f.settings.connectionUris(), QStringList{Local});
        QVERIFY(!f.settings.isAutoconnect(Remote));
    }

    void testCommandsAreRouted()
    {
        Fixture f;
        f.engine.init();

        CliCommand command;
        command.uri = Local;
        command.showWindow = QStringLiteral("console");
        command.domain = QStringLiteral("42");
        f.engine.handleCommand(command);

        // Opening is requested on the next pass
        FakeConnection* connection = f.connection(Local);
        QVERIFY(connection);
        QTRY_COMPARE(connection->openCount, 1);

        connection->addVm(makeVm(42, QStringLiteral("web01"), QStringLiteral("uuid-42")));
        connection->setState(ConnectionState::Active);
        QCOMPARE(f.ui.detailsCreated, 1);
        QVERIFY(f.ui.lastDetails()->pages.last() == DetailsPage::Console);
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Presence indicator
    // ─────────────────────────────────────────────────────────────────────────

    void testPresenceIndicatorKeepsAppAlive()
    {
        Fixture f;
        f.settings.setSystemTrayEnabled(true);
        f.engine.init();
        f.engine.start(true, Local);
        QVERIFY(f.ui.indicator->isVisible());
        QSignalSpy quitSpy(&f.engine, &Engine::quitRequested);

        f.engine.launcher()->showManager();
        f.ui.manager->close();
        QTest::qWait(50);
        QCOMPARE(quitSpy.count(), 0);

        // Turning the indicator off with nothing open brings the manager back
        f.settings.setSystemTrayEnabled(false);
        QVERIFY(!f.ui.indicator->isVisible());
        QVERIFY(f.ui.manager->isVisible());

        Q_EMIT f.ui.indicator->toggleManagerRequested();
        QVERIFY(!f.ui.manager->isVisible());
        QVERIFY(quitSpy.wait(1000));
    }
};

QTEST_MAIN(TestEngine)
#include "test_engine.moc"
