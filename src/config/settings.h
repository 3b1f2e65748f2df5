// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "virtdeck_export.h"
#include "../core/constants.h"
#include <QObject>
#include <QStringList>

class KConfigGroup;

namespace VirtDeck {

/**
 * @brief Persistent application settings (virtdeckrc)
 *
 * Loads and saves through KSharedConfig. Defaults come from virtdeck.kcfg
 * via ConfigDefaults. Every setter emits its specific signal and
 * settingsChanged() only when the value actually changes.
 *
 * Note: This class does NOT use the singleton pattern. Create instances
 * where needed and pass via dependency injection.
 */
class VIRTDECK_EXPORT Settings : public QObject
{
    Q_OBJECT

    Q_PROPERTY(int pollIntervalSeconds READ pollIntervalSeconds WRITE setPollIntervalSeconds NOTIFY
                   pollIntervalSecondsChanged)
    Q_PROPERTY(bool systemTrayEnabled READ systemTrayEnabled WRITE setSystemTrayEnabled NOTIFY
                   systemTrayEnabledChanged)
    Q_PROPERTY(QString askpassPackage READ askpassPackage WRITE setAskpassPackage NOTIFY askpassPackageChanged)
    Q_PROPERTY(QStringList connectionUris READ connectionUris WRITE setConnectionUris NOTIFY connectionUrisChanged)
    Q_PROPERTY(QStringList autoconnectUris READ autoconnectUris WRITE setAutoconnectUris NOTIFY
                   autoconnectUrisChanged)

public:
    explicit Settings(QObject* parent = nullptr);
    ~Settings() override = default;

    // Polling
    int pollIntervalSeconds() const
    {
        return m_pollIntervalSeconds;
    }
    void setPollIntervalSeconds(int seconds);

    // General
    bool systemTrayEnabled() const
    {
        return m_systemTrayEnabled;
    }
    void setSystemTrayEnabled(bool enabled);

    QString askpassPackage() const
    {
        return m_askpassPackage;
    }
    void setAskpassPackage(const QString& package);

    // Connections
    QStringList connectionUris() const
    {
        return m_connectionUris;
    }
    void setConnectionUris(const QStringList& uris);
    void addConnectionUri(const QString& uri);

    /// Remove the URI from both the stored and the autoconnect lists
    void removeConnectionUri(const QString& uri);

    QStringList autoconnectUris() const
    {
        return m_autoconnectUris;
    }
    void setAutoconnectUris(const QStringList& uris);
    bool isAutoconnect(const QString& uri) const
    {
        return m_autoconnectUris.contains(uri);
    }
    void setAutoconnect(const QString& uri, bool enabled);

    /**
     * @brief Re-read virtdeckrc, emitting change signals for values that differ
     */
    void load();
    void save();
    void reset();

Q_SIGNALS:
    void settingsChanged();
    void pollIntervalSecondsChanged();
    void systemTrayEnabledChanged();
    void askpassPackageChanged();
    void connectionUrisChanged();
    void autoconnectUrisChanged();

private:
    static int readValidatedInt(const KConfigGroup& group, const char* key, int defaultValue, int min, int max,
                                const char* settingName);

    int m_pollIntervalSeconds = Defaults::PollIntervalSeconds;
    bool m_systemTrayEnabled = false;
    QString m_askpassPackage;
    QStringList m_connectionUris;
    QStringList m_autoconnectUris;
};

} // namespace VirtDeck
