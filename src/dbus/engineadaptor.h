// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "virtdeck_export.h"
#include <QDBusAbstractAdaptor>
#include <QObject>
#include <QString>
#include <QStringList>

namespace VirtDeck {

class Engine;

/**
 * @brief D-Bus adaptor for the engine
 *
 * Provides D-Bus interface: org.virtdeck.Engine
 *  Command delivery (same tuple as the command line), connection listing, quit
 */
class VIRTDECK_EXPORT EngineAdaptor : public QDBusAbstractAdaptor
{
    Q_OBJECT
    Q_CLASSINFO("D-Bus Interface", "org.virtdeck.Engine")

public:
    explicit EngineAdaptor(Engine* engine);
    ~EngineAdaptor() override = default;

public Q_SLOTS:
    /**
     * @brief Deliver a command
     * @param uri Connection URI, empty for the manager window
     * @param window manager, creator, editor, performance, console or summary
     * @param domain Domain id, name or UUID for the details windows
     */
    void ShowWindow(const QString& uri, const QString& window, const QString& domain);

    QStringList ConnectionUris();

    void Quit();

Q_SIGNALS:
    void ConnectionsChanged();

private:
    Engine* m_engine;
};

} // namespace VirtDeck
