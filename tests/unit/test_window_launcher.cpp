// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QSignalSpy>

#include "core/connectionregistry.h"
#include "core/lifecyclecontroller.h"
#include "core/windowlauncher.h"
#include "fakes.h"

using namespace VirtDeck;
using namespace VirtDeck::Test;

namespace {
const QString Uri = QStringLiteral("qemu:///system");
}

/**
 * @brief Unit tests for WindowLauncher
 *
 * Tests cover:
 * 1. Lazy creation and reuse of every window kind
 * 2. Which windows feed the lifecycle counter
 * 3. Details page activation rules
 * 4. Connect dialog outcomes
 * 5. Error reporting when a window cannot be built
 */
class TestWindowLauncher : public QObject
{
    Q_OBJECT

private:
    struct Fixture
    {
        FakeConnectionFactory connections;
        FakeUiFactory ui;
        ConnectionRegistry registry{&connections};
        LifecycleController lifecycle;
        WindowLauncher launcher{&ui, &registry, &lifecycle};

        FakeConnection* addActive(const QString& uri)
        {
            registry.addConnection(uri);
            FakeConnection* connection = connections.get(uri);
            connection->setState(ConnectionState::Active);
            return connection;
        }
    };

private Q_SLOTS:
    void testManagerIsCreatedOnceAndCounted()
    {
        Fixture f;

        QVERIFY(f.launcher.showManager());
        QVERIFY(f.launcher.showManager());
        QCOMPARE(f.ui.managerCreated, 1);
        QCOMPARE(f.ui.manager->showCount, 2);
        QCOMPARE(f.lifecycle.windowCount(), 1);

        f.ui.manager->close();
        QCOMPARE(f.lifecycle.windowCount(), 0);
    }

    void testManagerCreationFailureIsReported()
    {
        Fixture f;
        f.ui.failManager = true;

        QVERIFY(!f.launcher.manager());
        QVERIFY(!f.launcher.showManager());
        QCOMPARE(f.ui.reporter.errors.size(), 1);
        QVERIFY(f.ui.reporter.errors.first().message.contains(QStringLiteral("manager")));
        QVERIFY(!f.ui.reporter.errors.first().modal);
        QCOMPARE(f.lifecycle.windowCount(), 0);
    }

    void testToggleManager()
    {
        Fixture f;

        f.launcher.toggleManager();
        QVERIFY(f.ui.manager->isVisible());
        f.launcher.toggleManager();
        QVERIFY(!f.ui.manager->isVisible());
        QCOMPARE(f.lifecycle.windowCount(), 0);
    }

    void testHostWindowPerConnection()
    {
        Fixture f;
        FakeConnection* connection = f.addActive(Uri);

        QVERIFY(f.launcher.showHost(Uri));
        QVERIFY(f.launcher.showHost(Uri));
        QCOMPARE(f.ui.hostCreated, 1);
        QVERIFY(f.ui.host->connection == connection);
        QVERIFY(f.registry.uiState(Uri)->hostWindow == f.ui.host.data());
        QCOMPARE(f.lifecycle.windowCount(), 1);

        QVERIFY(!f.launcher.showHost(QStringLiteral("test:///unknown")));
        QCOMPARE(f.ui.reporter.errors.size(), 1);
    }

    void testDetailsPageRules()
    {
        Fixture f;
        FakeConnection* connection = f.addActive(Uri);
        connection->addVm(makeVm(42, QStringLiteral("web01"), QStringLiteral("uuid-1")));

        QVERIFY(f.launcher.showDetails(Uri, QStringLiteral("web01"), DetailsPage::Console));
        FakeDetailsWindow* window = f.ui.lastDetails();
        QVERIFY(window);
        QVERIFY(f.registry.detailsWindow(Uri, QStringLiteral("web01")) == window);
        QCOMPARE(window->pages.size(), 1);
        QVERIFY(window->pages.first() == DetailsPage::Console);

        // Already visible: the page only changes when forced
        QVERIFY(f.launcher.showDetails(Uri, QStringLiteral("web01"), DetailsPage::Performance));
        QCOMPARE(window->pages.size(), 1);
        QVERIFY(f.launcher.showDetails(Uri, QStringLiteral("web01"), DetailsPage::Config, true));
        QCOMPARE(window->pages.size(), 2);
        QVERIFY(window->pages.last() == DetailsPage::Config);

        QCOMPARE(f.ui.detailsCreated, 1);
        QCOMPARE(f.lifecycle.windowCount(), 1);
    }

    void testDetailsForUnknownVmFails()
    {
        Fixture f;
        f.addActive(Uri);

        QVERIFY(!f.launcher.showDetails(Uri, QStringLiteral("nope")));
        QCOMPARE(f.ui.detailsCreated, 0);
        QCOMPARE(f.ui.reporter.errors.size(), 1);
    }

    void testCloneAndMigrateAreNotCounted()
    {
        Fixture f;
        FakeConnection* connection = f.addActive(Uri);
        const VmInfo vm = makeVm(3, QStringLiteral("db"), QStringLiteral("uuid-db"));
        connection->addVm(vm);

        QVERIFY(f.launcher.showClone(Uri, QStringLiteral("db")));
        QVERIFY(f.launcher.showMigrate(Uri, QStringLiteral("db")));

        QCOMPARE(f.ui.cloneDialog->sourceUri, Uri);
        QCOMPARE(f.ui.cloneDialog->sourceVm.uuid, vm.uuid);
        QCOMPARE(f.ui.migrateDialog->sourceVm.name, vm.name);
        QVERIFY(f.registry.uiState(Uri)->cloneWindow == f.ui.cloneDialog.data());
        QCOMPARE(f.lifecycle.windowCount(), 0);
    }

    void testConnectDialogOutcomes()
    {
        Fixture f;
        QSignalSpy connectSpy(&f.launcher, &WindowLauncher::connectRequested);
        QSignalSpy exitSpy(&f.launcher, &WindowLauncher::exitRequested);

        QVERIFY(f.launcher.showConnect());
        QCOMPARE(f.ui.connectDialog->resetCount, 1);
        // The connect dialog does not keep the application alive on its own
        QCOMPARE(f.lifecycle.windowCount(), 0);

        f.ui.connectDialog->accept(QStringLiteral("qemu+ssh://host/system"), true);
        QCOMPARE(connectSpy.count(), 1);
        QCOMPARE(connectSpy.first().at(0).toString(), QStringLiteral("qemu+ssh://host/system"));
        QCOMPARE(connectSpy.first().at(1).toBool(), true);

        // Cancelling with nothing registered means there is nothing to manage
        f.launcher.showConnect();
        f.ui.connectDialog->cancel();
        QCOMPARE(exitSpy.count(), 1);

        f.registry.addConnection(Uri);
        f.launcher.showConnect();
        f.ui.connectDialog->cancel();
        QCOMPARE(exitSpy.count(), 1);
    }

    void testEditConnectionKeepsInput()
    {
        Fixture f;
        f.registry.addConnection(Uri);
        QSignalSpy removeSpy(&f.launcher, &WindowLauncher::removeConnectionRequested);

        f.launcher.editConnection(Uri);
        QCOMPARE(f.ui.connectDialog->resetCount, 0);
        QVERIFY(f.ui.connectDialog->isVisible());
        QCOMPARE(removeSpy.count(), 1);
        QCOMPARE(removeSpy.first().first().toString(), Uri);
    }

    void testCloseCreateDialogForMatchingUri()
    {
        Fixture f;
        QVERIFY(f.launcher.showCreate(Uri));
        QCOMPARE(f.ui.createDialog->connectionUri(), Uri);
        QCOMPARE(f.lifecycle.windowCount(), 1);

        f.launcher.closeCreateDialogFor(QStringLiteral("test:///other"));
        QVERIFY(f.ui.createDialog->isVisible());

        f.launcher.closeCreateDialogFor(Uri);
        QVERIFY(!f.ui.createDialog->isVisible());
        QCOMPARE(f.lifecycle.windowCount(), 0);
    }

    void testManagerRequestsAreRouted()
    {
        Fixture f;
        FakeConnection* connection = f.addActive(Uri);
        connection->addVm(makeVm(1, QStringLiteral("web01"), QStringLiteral("uuid-1")));
        QSignalSpy removeSpy(&f.launcher, &WindowLauncher::removeConnectionRequested);

        IManagerWindow* manager = f.launcher.manager();
        QVERIFY(manager);

        Q_EMIT manager->showDomainRequested(Uri, QStringLiteral("web01"));
        QCOMPARE(f.ui.detailsCreated, 1);

        Q_EMIT manager->showHostRequested(Uri);
        QCOMPARE(f.ui.hostCreated, 1);

        Q_EMIT manager->showConnectRequested();
        QVERIFY(f.ui.connectDialog);

        Q_EMIT manager->removeConnectionRequested(Uri);
        QCOMPARE(removeSpy.count(), 1);

        // Any window can bring the manager back
        f.ui.host->close();
        Q_EMIT f.ui.host->managerRequested();
        QVERIFY(f.ui.manager->isVisible());
    }

    void testCleanupDisposesSharedWindows()
    {
        Fixture f;
        f.launcher.showManager();
        f.launcher.showConnect();
        QPointer<FakeManagerWindow> manager = f.ui.manager.data();
        QPointer<FakeConnectDialog> dialog = f.ui.connectDialog.data();

        f.launcher.cleanup();
        QCOMPARE(manager->cleanupCount, 1);
        QCOMPARE(dialog->cleanupCount, 1);
        QCOMPARE(f.lifecycle.windowCount(), 0);
        QTRY_VERIFY(!manager && !dialog);
    }

    void testReportErrorUsesSharedReporter()
    {
        Fixture f;
        f.launcher.reportError(QStringLiteral("boom"), QStringLiteral("trace"), true);

        QCOMPARE(f.ui.reporter.errors.size(), 1);
        const ErrorReport report = f.ui.reporter.errors.first();
        QCOMPARE(report.message, QStringLiteral("boom"));
        QCOMPARE(report.details, QStringLiteral("trace"));
        QVERIFY(report.modal);
        QVERIFY(!report.title.isEmpty());
    }
};

QTEST_MAIN(TestWindowLauncher)
#include "test_window_launcher.moc"
