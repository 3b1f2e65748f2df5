// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "widgetuifactory.h"
#include "trayindicator.h"
#include "widgetwindows.h"
#include "../core/logging.h"
#include <KLocalizedString>

namespace VirtDeck {

IManagerWindow* WidgetUiFactory::createManagerWindow()
{
    if (!m_registry) {
        qCWarning(lcApp) << "Manager window requested before the registry was attached";
        return nullptr;
    }
    return new ManagerWindow(m_registry);
}

IWindow* WidgetUiFactory::createHostWindow(IConnection* connection)
{
    return new HostWindow(connection);
}

IConnectDialog* WidgetUiFactory::createConnectDialog()
{
    return new ConnectDialog();
}

ICreateDialog* WidgetUiFactory::createCreateDialog()
{
    return new CreateDialog();
}

IDetailsWindow* WidgetUiFactory::createDetailsWindow(IConnection* connection, const VmInfo& vm)
{
    return new DetailsWindow(connection, vm);
}

IVmDialog* WidgetUiFactory::createCloneDialog()
{
    return new VmDialog(i18n("Clone Virtual Machine"), i18n("Clone"));
}

IVmDialog* WidgetUiFactory::createMigrateDialog()
{
    return new VmDialog(i18n("Migrate Virtual Machine"), i18n("Migrate"));
}

IPresenceIndicator* WidgetUiFactory::createPresenceIndicator()
{
    if (!m_registry) {
        return nullptr;
    }
    return new TrayIndicator(m_registry);
}

} // namespace VirtDeck
