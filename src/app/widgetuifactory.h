// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "messageboxreporter.h"
#include "../core/interfaces.h"

namespace VirtDeck {

class ConnectionRegistry;

/**
 * @brief IUiFactory building the QtWidgets front end
 *
 * The registry is attached after the engine exists, before any window is
 * requested.
 */
class WidgetUiFactory : public IUiFactory
{
public:
    void setRegistry(ConnectionRegistry* registry)
    {
        m_registry = registry;
    }

    IManagerWindow* createManagerWindow() override;
    IWindow* createHostWindow(IConnection* connection) override;
    IConnectDialog* createConnectDialog() override;
    ICreateDialog* createCreateDialog() override;
    IDetailsWindow* createDetailsWindow(IConnection* connection, const VmInfo& vm) override;
    IVmDialog* createCloneDialog() override;
    IVmDialog* createMigrateDialog() override;
    IPresenceIndicator* createPresenceIndicator() override;

    IErrorReporter* errorReporter() override
    {
        return &m_reporter;
    }

private:
    ConnectionRegistry* m_registry = nullptr;
    MessageBoxReporter m_reporter;
};

} // namespace VirtDeck
