// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/interfaces.h"
#include <QPointer>
#include <QWidget>
#include <memory>

class QCheckBox;
class QLabel;
class QLineEdit;
class QTabWidget;
class QTreeWidget;

namespace VirtDeck {

class ConnectionRegistry;

/**
 * @brief Top-level widget reporting its own open/close transitions
 *
 * opened() on the first show, closed() on the matching non-spontaneous hide
 * (close() or hide()). Minimizing does not count as closing.
 */
class FrameWidget : public QWidget
{
    Q_OBJECT

public:
    explicit FrameWidget(QWidget* parent = nullptr);

Q_SIGNALS:
    void opened();
    void closed();

protected:
    void showEvent(QShowEvent* event) override;
    void hideEvent(QHideEvent* event) override;

private:
    bool m_open = false;
};

/**
 * @brief IWindow implementation over a FrameWidget
 */
template<typename Iface>
class WidgetWindow : public Iface
{
public:
    explicit WidgetWindow(const QString& title)
        : m_frame(std::make_unique<FrameWidget>())
    {
        m_frame->setWindowTitle(title);
        QObject::connect(m_frame.get(), &FrameWidget::opened, this, &IWindow::opened);
        QObject::connect(m_frame.get(), &FrameWidget::closed, this, &IWindow::closed);
    }

    void show() override
    {
        m_frame->show();
        m_frame->raise();
        m_frame->activateWindow();
    }
    void close() override
    {
        m_frame->close();
    }
    void cleanup() override
    {
        if (m_frame->isVisible()) {
            m_frame->close();
        }
    }
    bool isVisible() const override
    {
        return m_frame->isVisible();
    }

protected:
    FrameWidget* frame() const
    {
        return m_frame.get();
    }

private:
    std::unique_ptr<FrameWidget> m_frame;
};

/**
 * @brief Connection and VM overview
 */
class ManagerWindow : public WidgetWindow<IManagerWindow>
{
public:
    explicit ManagerWindow(ConnectionRegistry* registry);

    void setInitialSelection(const QString& uri) override;
    void setStartupError(const QString& message) override;

private:
    void rebuild();
    void watchConnection(IConnection* connection);
    QString selectedUri() const;
    QString selectedVmKey() const;

    ConnectionRegistry* m_registry;
    QTreeWidget* m_tree = nullptr;
    QLabel* m_startupError = nullptr;
    QString m_initialSelection;
};

/**
 * @brief Connection summary
 */
class HostWindow : public WidgetWindow<IWindow>
{
public:
    explicit HostWindow(IConnection* connection);

private:
    void refresh();

    QPointer<IConnection> m_connection;
    QLabel* m_summary = nullptr;
};

/**
 * @brief Per-VM details with overview, performance, configuration and console pages
 */
class DetailsWindow : public WidgetWindow<IDetailsWindow>
{
public:
    DetailsWindow(IConnection* connection, const VmInfo& vm);

    void activatePage(DetailsPage page) override;

private:
    void refresh();

    QPointer<IConnection> m_connection;
    QString m_key;
    QTabWidget* m_tabs = nullptr;
    QLabel* m_overview = nullptr;
    QLabel* m_performance = nullptr;
    QLabel* m_config = nullptr;
};

class ConnectDialog : public WidgetWindow<IConnectDialog>
{
public:
    ConnectDialog();

    void reset() override;

private:
    QLineEdit* m_uri = nullptr;
    QCheckBox* m_autoconnect = nullptr;
    bool m_accepted = false;
};

class CreateDialog : public WidgetWindow<ICreateDialog>
{
public:
    CreateDialog();

    void setConnectionUri(const QString& uri) override;
    QString connectionUri() const override
    {
        return m_uri;
    }

private:
    QString m_uri;
    QLabel* m_target = nullptr;
};

/**
 * @brief Clone or migrate dialog for one source VM
 */
class VmDialog : public WidgetWindow<IVmDialog>
{
public:
    VmDialog(const QString& title, const QString& action);

    void setSourceVm(const QString& uri, const VmInfo& vm) override;

private:
    QString m_action;
    QLabel* m_source = nullptr;
};

} // namespace VirtDeck
