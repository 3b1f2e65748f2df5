// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "widgetwindows.h"
#include "../backend/virshconnection.h"
#include "../core/connectionregistry.h"
#include "../core/logging.h"
#include <KLocalizedString>
#include <algorithm>
#include <QCheckBox>
#include <QDialogButtonBox>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QHideEvent>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QShowEvent>
#include <QTabWidget>
#include <QTreeWidget>
#include <QVBoxLayout>

namespace VirtDeck {

namespace {
constexpr int UriRole = Qt::UserRole + 1;
constexpr int VmKeyRole = Qt::UserRole + 2;

QString stateText(ConnectionState state)
{
    switch (state) {
    case ConnectionState::Disconnected:
        return i18n("Not Connected");
    case ConnectionState::Connecting:
        return i18n("Connecting");
    case ConnectionState::Active:
        return i18n("Connected");
    }
    return QString();
}
} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// FrameWidget
// ═══════════════════════════════════════════════════════════════════════════════

FrameWidget::FrameWidget(QWidget* parent)
    : QWidget(parent, Qt::Window)
{
}

void FrameWidget::showEvent(QShowEvent* event)
{
    QWidget::showEvent(event);
    if (!m_open) {
        m_open = true;
        Q_EMIT opened();
    }
}

void FrameWidget::hideEvent(QHideEvent* event)
{
    QWidget::hideEvent(event);
    if (m_open && !event->spontaneous()) {
        m_open = false;
        Q_EMIT closed();
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// ManagerWindow
// ═══════════════════════════════════════════════════════════════════════════════

ManagerWindow::ManagerWindow(ConnectionRegistry* registry)
    : WidgetWindow(i18n("VirtDeck"))
    , m_registry(registry)
{
    auto* layout = new QVBoxLayout(frame());

    m_startupError = new QLabel(frame());
    m_startupError->setWordWrap(true);
    m_startupError->hide();
    layout->addWidget(m_startupError);

    m_tree = new QTreeWidget(frame());
    m_tree->setHeaderLabels({i18n("Name"), i18n("State")});
    m_tree->header()->setStretchLastSection(true);
    layout->addWidget(m_tree);

    auto* buttons = new QHBoxLayout();
    auto addButton = [&](const QString& text, auto handler) {
        auto* button = new QPushButton(text, frame());
        QObject::connect(button, &QPushButton::clicked, this, handler);
        buttons->addWidget(button);
    };
    addButton(i18n("Add Connection…"), [this]() {
        Q_EMIT showConnectRequested();
    });
    addButton(i18n("New VM"), [this]() {
        if (!selectedUri().isEmpty()) {
            Q_EMIT showCreateRequested(selectedUri());
        }
    });
    addButton(i18n("Open"), [this]() {
        if (!selectedVmKey().isEmpty()) {
            Q_EMIT showDomainRequested(selectedUri(), selectedVmKey());
        } else if (!selectedUri().isEmpty()) {
            Q_EMIT showHostRequested(selectedUri());
        }
    });
    addButton(i18n("Clone…"), [this]() {
        if (!selectedVmKey().isEmpty()) {
            Q_EMIT cloneRequested(selectedUri(), selectedVmKey());
        }
    });
    addButton(i18n("Migrate…"), [this]() {
        if (!selectedVmKey().isEmpty()) {
            Q_EMIT migrateRequested(selectedUri(), selectedVmKey());
        }
    });
    addButton(i18n("Remove Connection"), [this]() {
        if (!selectedUri().isEmpty() && selectedVmKey().isEmpty()) {
            Q_EMIT removeConnectionRequested(selectedUri());
        }
    });
    buttons->addStretch();
    addButton(i18n("Quit"), [this]() {
        Q_EMIT exitRequested();
    });
    layout->addLayout(buttons);

    QObject::connect(m_tree, &QTreeWidget::itemActivated, this, [this](QTreeWidgetItem* item) {
        const QString uri = item->data(0, UriRole).toString();
        const QString key = item->data(0, VmKeyRole).toString();
        if (key.isEmpty()) {
            Q_EMIT showHostRequested(uri);
        } else {
            Q_EMIT showDomainRequested(uri, key);
        }
    });

    QObject::connect(m_registry, &ConnectionRegistry::connectionAdded, this,
                     [this](const QString&, IConnection* connection) {
                         watchConnection(connection);
                         rebuild();
                     });
    QObject::connect(m_registry, &ConnectionRegistry::connectionRemoved, this, [this]() {
        rebuild();
    });
    const QList<IConnection*> connections = m_registry->connections();
    for (IConnection* connection : connections) {
        watchConnection(connection);
    }

    frame()->resize(560, 420);
    rebuild();
}

void ManagerWindow::watchConnection(IConnection* connection)
{
    QObject::connect(connection, &IConnection::stateChanged, this, [this]() {
        rebuild();
    });
    QObject::connect(connection, &IConnection::vmAdded, this, [this]() {
        rebuild();
    });
    QObject::connect(connection, &IConnection::vmRemoved, this, [this]() {
        rebuild();
    });
    QObject::connect(connection, &IConnection::vmRenamed, this, [this]() {
        rebuild();
    });
}

void ManagerWindow::rebuild()
{
    const QString keepUri = m_initialSelection.isEmpty() ? selectedUri() : m_initialSelection;
    const QString keepKey = selectedVmKey();
    m_tree->clear();

    const QStringList uris = m_registry->uris();
    for (const QString& uri : uris) {
        IConnection* connection = m_registry->connection(uri);
        auto* top = new QTreeWidgetItem(m_tree, {uri, stateText(connection->state())});
        top->setData(0, UriRole, uri);

        const QVector<VmInfo> vms = connection->listVms();
        for (const VmInfo& vm : vms) {
            auto* child = new QTreeWidgetItem(top, {vm.name, vm.state});
            child->setData(0, UriRole, uri);
            child->setData(0, VmKeyRole, vm.connectionKey());
            if (uri == keepUri && vm.connectionKey() == keepKey) {
                m_tree->setCurrentItem(child);
            }
        }
        top->setExpanded(true);
        if (uri == keepUri && keepKey.isEmpty()) {
            m_tree->setCurrentItem(top);
        }
    }

    if (!m_initialSelection.isEmpty() && m_registry->contains(m_initialSelection)) {
        m_initialSelection.clear();
    }
}

void ManagerWindow::setInitialSelection(const QString& uri)
{
    m_initialSelection = uri;
    rebuild();
}

void ManagerWindow::setStartupError(const QString& message)
{
    m_startupError->setText(message);
    m_startupError->setVisible(!message.isEmpty());
}

QString ManagerWindow::selectedUri() const
{
    const QTreeWidgetItem* item = m_tree ? m_tree->currentItem() : nullptr;
    return item ? item->data(0, UriRole).toString() : QString();
}

QString ManagerWindow::selectedVmKey() const
{
    const QTreeWidgetItem* item = m_tree ? m_tree->currentItem() : nullptr;
    return item ? item->data(0, VmKeyRole).toString() : QString();
}

// ═══════════════════════════════════════════════════════════════════════════════
// HostWindow
// ═══════════════════════════════════════════════════════════════════════════════

HostWindow::HostWindow(IConnection* connection)
    : WidgetWindow(i18n("%1 - Connection Details", connection->uri()))
    , m_connection(connection)
{
    auto* layout = new QVBoxLayout(frame());
    m_summary = new QLabel(frame());
    m_summary->setTextInteractionFlags(Qt::TextSelectableByMouse);
    layout->addWidget(m_summary);
    layout->addStretch();

    QObject::connect(connection, &IConnection::stateChanged, this, [this]() {
        refresh();
    });
    QObject::connect(connection, &IConnection::vmAdded, this, [this]() {
        refresh();
    });
    QObject::connect(connection, &IConnection::vmRemoved, this, [this]() {
        refresh();
    });
    refresh();
}

void HostWindow::refresh()
{
    if (!m_connection) {
        return;
    }
    const QVector<VmInfo> vms = m_connection->listVms();
    const int running = std::count_if(vms.cbegin(), vms.cend(), [](const VmInfo& vm) {
        return vm.isRunning();
    });
    m_summary->setText(i18n("URI: %1\nState: %2\nAutoconnect: %3\nDomains: %4 (%5 running)", m_connection->uri(),
                            stateText(m_connection->state()),
                            m_connection->autoconnect() ? i18n("yes") : i18n("no"), vms.size(), running));
}

// ═══════════════════════════════════════════════════════════════════════════════
// DetailsWindow
// ═══════════════════════════════════════════════════════════════════════════════

DetailsWindow::DetailsWindow(IConnection* connection, const VmInfo& vm)
    : WidgetWindow(i18n("%1 on %2", vm.name, connection->uri()))
    , m_connection(connection)
    , m_key(vm.connectionKey())
{
    auto* layout = new QVBoxLayout(frame());
    m_tabs = new QTabWidget(frame());
    layout->addWidget(m_tabs);

    m_overview = new QLabel(m_tabs);
    m_performance = new QLabel(m_tabs);
    m_config = new QLabel(m_tabs);
    auto* console = new QLabel(i18n("Graphical console is provided by an external viewer."), m_tabs);
    for (QLabel* label : {m_overview, m_performance, m_config, console}) {
        label->setAlignment(Qt::AlignTop | Qt::AlignLeft);
        label->setTextInteractionFlags(Qt::TextSelectableByMouse);
    }

    m_tabs->addTab(m_overview, i18n("Overview"));
    m_tabs->addTab(m_performance, i18n("Performance"));
    m_tabs->addTab(m_config, i18n("Details"));
    m_tabs->addTab(console, i18n("Console"));

    QObject::connect(connection, &IConnection::vmRenamed, this, [this](const QString& oldKey, const QString& newKey) {
        if (oldKey == m_key) {
            m_key = newKey;
            frame()->setWindowTitle(i18n("%1 on %2", newKey, m_connection->uri()));
            refresh();
        }
    });
    QObject::connect(connection, &IConnection::stateChanged, this, [this]() {
        refresh();
    });
    QObject::connect(connection, &IConnection::vmAdded, this, [this]() {
        refresh();
    });

    frame()->resize(520, 380);
    refresh();
}

void DetailsWindow::activatePage(DetailsPage page)
{
    switch (page) {
    case DetailsPage::Default:
        m_tabs->setCurrentIndex(0);
        break;
    case DetailsPage::Performance:
        m_tabs->setCurrentIndex(1);
        break;
    case DetailsPage::Config:
        m_tabs->setCurrentIndex(2);
        break;
    case DetailsPage::Console:
        m_tabs->setCurrentIndex(3);
        break;
    }
}

void DetailsWindow::refresh()
{
    const std::optional<VmInfo> vm = m_connection ? m_connection->vm(m_key) : std::nullopt;
    if (!vm) {
        m_overview->setText(i18n("Domain %1 is not available.", m_key));
        return;
    }

    m_overview->setText(i18n("Name: %1\nState: %2\nID: %3", vm->name, vm->state,
                             vm->isRunning() ? QString::number(vm->id) : QStringLiteral("-")));
    m_config->setText(i18n("UUID: %1\nConnection: %2", vm->uuid, m_connection->uri()));

    // Statistics are a backend extra
    QStringList lines;
    if (auto* virsh = qobject_cast<VirshConnection*>(m_connection.data())) {
        const QHash<QString, QString> stats = virsh->domainStats(m_key);
        QStringList keys = stats.keys();
        keys.sort();
        for (const QString& key : std::as_const(keys)) {
            lines.append(QStringLiteral("%1 = %2").arg(key, stats.value(key)));
        }
    }
    m_performance->setText(lines.isEmpty() ? i18n("No statistics collected yet.") : lines.join(QLatin1Char('\n')));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Dialogs
// ═══════════════════════════════════════════════════════════════════════════════

ConnectDialog::ConnectDialog()
    : WidgetWindow(i18n("Add Connection"))
{
    auto* layout = new QFormLayout(frame());
    m_uri = new QLineEdit(frame());
    m_uri->setPlaceholderText(QStringLiteral("qemu+ssh://user@host/system"));
    m_autoconnect = new QCheckBox(i18n("Connect automatically at startup"), frame());
    layout->addRow(i18n("URI:"), m_uri);
    layout->addRow(m_autoconnect);

    auto* box = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, frame());
    layout->addRow(box);

    QObject::connect(box, &QDialogButtonBox::accepted, this, [this]() {
        const QString uri = m_uri->text().trimmed();
        if (uri.isEmpty()) {
            return;
        }
        m_accepted = true;
        close();
        Q_EMIT completed(uri, m_autoconnect->isChecked());
    });
    QObject::connect(box, &QDialogButtonBox::rejected, this, [this]() {
        close();
    });
    QObject::connect(frame(), &FrameWidget::opened, this, [this]() {
        m_accepted = false;
    });
    QObject::connect(frame(), &FrameWidget::closed, this, [this]() {
        if (!m_accepted) {
            Q_EMIT cancelled();
        }
    });
}

void ConnectDialog::reset()
{
    m_uri->clear();
    m_autoconnect->setChecked(true);
}

CreateDialog::CreateDialog()
    : WidgetWindow(i18n("New VM"))
{
    auto* layout = new QVBoxLayout(frame());
    m_target = new QLabel(frame());
    m_target->setWordWrap(true);
    layout->addWidget(m_target);

    auto* box = new QDialogButtonBox(QDialogButtonBox::Close, frame());
    QObject::connect(box, &QDialogButtonBox::rejected, this, [this]() {
        close();
    });
    layout->addWidget(box);
}

void CreateDialog::setConnectionUri(const QString& uri)
{
    m_uri = uri;
    m_target->setText(i18n("Create a virtual machine on %1 with virt-install or import an existing disk image.",
                           uri));
}

VmDialog::VmDialog(const QString& title, const QString& action)
    : WidgetWindow(title)
    , m_action(action)
{
    auto* layout = new QVBoxLayout(frame());
    m_source = new QLabel(frame());
    m_source->setWordWrap(true);
    layout->addWidget(m_source);

    auto* box = new QDialogButtonBox(QDialogButtonBox::Close, frame());
    QObject::connect(box, &QDialogButtonBox::rejected, this, [this]() {
        close();
    });
    layout->addWidget(box);
}

void VmDialog::setSourceVm(const QString& uri, const VmInfo& vm)
{
    m_source->setText(i18n("%1 '%2' on %3 (UUID %4)", m_action, vm.name, uri, vm.uuid));
    qCDebug(lcApp) << m_action << "dialog source" << uri << vm.name;
}

} // namespace VirtDeck
