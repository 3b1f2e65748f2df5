// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "engineadaptor.h"
#include "../core/connectionregistry.h"
#include "../core/engine.h"
#include "../core/logging.h"
#include <QTimer>

namespace VirtDeck {

EngineAdaptor::EngineAdaptor(Engine* engine)
    : QDBusAbstractAdaptor(engine)
    , m_engine(engine)
{
    Q_ASSERT(engine);

    connect(m_engine->registry(), &ConnectionRegistry::connectionAdded, this, &EngineAdaptor::ConnectionsChanged);
    connect(m_engine->registry(), &ConnectionRegistry::connectionRemoved, this, &EngineAdaptor::ConnectionsChanged);
}

void EngineAdaptor::ShowWindow(const QString& uri, const QString& window, const QString& domain)
{
    qCDebug(lcDbus) << "ShowWindow uri=" << uri << "window=" << window << "domain=" << domain;

    const CliCommand command{uri, window, domain};

    // Return to the caller before any window or dialog runs
    QTimer::singleShot(0, m_engine, [engine = m_engine, command]() {
        engine->handleCommand(command);
    });
}

QStringList EngineAdaptor::ConnectionUris()
{
    return m_engine->registry()->uris();
}

void EngineAdaptor::Quit()
{
    qCInfo(lcDbus) << "Quit requested over D-Bus";
    QTimer::singleShot(0, m_engine, [engine = m_engine]() {
        engine->exitApp(QStringLiteral("dbus"));
    });
}

} // namespace VirtDeck
