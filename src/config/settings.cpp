// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "settings.h"
#include "configdefaults.h"
#include "../core/logging.h"
#include <KConfigGroup>
#include <KSharedConfig>

namespace VirtDeck {

// ═══════════════════════════════════════════════════════════════════════════════
// Macros for setter patterns
// ═══════════════════════════════════════════════════════════════════════════════

// Simple setter: if changed, update member, emit specific signal, emit settingsChanged
#define SETTINGS_SETTER(Type, name, member, signal) \
    void Settings::set##name(Type value) \
    { \
        if (member != value) { \
            member = value; \
            Q_EMIT signal(); \
            Q_EMIT settingsChanged(); \
        } \
    }

namespace {
const QString ConfigName = QStringLiteral("virtdeckrc");

// Drop empties and duplicates, keeping first occurrence order
QStringList normalizedUriList(const QStringList& uris)
{
    QStringList result;
    for (const QString& uri : uris) {
        const QString trimmed = uri.trimmed();
        if (!trimmed.isEmpty() && !result.contains(trimmed)) {
            result.append(trimmed);
        }
    }
    return result;
}
} // namespace

Settings::Settings(QObject* parent)
    : QObject(parent)
    , m_pollIntervalSeconds(ConfigDefaults::statsUpdateInterval())
    , m_systemTrayEnabled(ConfigDefaults::systemTray())
    , m_askpassPackage(ConfigDefaults::askpassPackage())
{
    load();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Setters
// ═══════════════════════════════════════════════════════════════════════════════

void Settings::setPollIntervalSeconds(int seconds)
{
    const int clamped =
        qBound(ConfigDefaults::statsUpdateIntervalMin(), seconds, ConfigDefaults::statsUpdateIntervalMax());
    if (clamped != seconds) {
        qCWarning(lcConfig) << "Poll interval" << seconds << "out of range, clamped to" << clamped;
    }
    if (m_pollIntervalSeconds != clamped) {
        m_pollIntervalSeconds = clamped;
        Q_EMIT pollIntervalSecondsChanged();
        Q_EMIT settingsChanged();
    }
}

SETTINGS_SETTER(bool, SystemTrayEnabled, m_systemTrayEnabled, systemTrayEnabledChanged)

void Settings::setAskpassPackage(const QString& package)
{
    const QString value = package.trimmed().isEmpty() ? ConfigDefaults::askpassPackage() : package.trimmed();
    if (m_askpassPackage != value) {
        m_askpassPackage = value;
        Q_EMIT askpassPackageChanged();
        Q_EMIT settingsChanged();
    }
}

void Settings::setConnectionUris(const QStringList& uris)
{
    const QStringList value = normalizedUriList(uris);
    if (m_connectionUris != value) {
        m_connectionUris = value;
        Q_EMIT connectionUrisChanged();
        Q_EMIT settingsChanged();
    }
}

void Settings::setAutoconnectUris(const QStringList& uris)
{
    const QStringList value = normalizedUriList(uris);
    if (m_autoconnectUris != value) {
        m_autoconnectUris = value;
        Q_EMIT autoconnectUrisChanged();
        Q_EMIT settingsChanged();
    }
}

void Settings::addConnectionUri(const QString& uri)
{
    setConnectionUris(m_connectionUris + QStringList{uri});
}

void Settings::removeConnectionUri(const QString& uri)
{
    QStringList uris = m_connectionUris;
    uris.removeAll(uri);
    setConnectionUris(uris);
    setAutoconnect(uri, false);
}

void Settings::setAutoconnect(const QString& uri, bool enabled)
{
    QStringList uris = m_autoconnectUris;
    if (enabled) {
        uris.append(uri);
    } else {
        uris.removeAll(uri);
    }
    setAutoconnectUris(uris);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Persistence
// ═══════════════════════════════════════════════════════════════════════════════

int Settings::readValidatedInt(const KConfigGroup& group, const char* key, int defaultValue, int min, int max,
                               const char* settingName)
{
    int value = group.readEntry(QLatin1String(key), defaultValue);
    if (value < min || value > max) {
        qCWarning(lcConfig) << "Invalid" << settingName << ":" << value << "using default (must be" << min << "-"
                            << max << ")";
        value = defaultValue;
    }
    return value;
}

void Settings::load()
{
    auto config = KSharedConfig::openConfig(ConfigName);

    // KSharedConfig caches in memory; pick up edits made by other processes
    config->reparseConfiguration();

    KConfigGroup polling = config->group(QStringLiteral("Polling"));
    KConfigGroup general = config->group(QStringLiteral("General"));
    KConfigGroup connections = config->group(QStringLiteral("Connections"));

    // Setters emit the change notifications for values that differ from memory
    setPollIntervalSeconds(readValidatedInt(polling, "StatsUpdateInterval", ConfigDefaults::statsUpdateInterval(),
                                            ConfigDefaults::statsUpdateIntervalMin(),
                                            ConfigDefaults::statsUpdateIntervalMax(), "poll interval"));
    setSystemTrayEnabled(general.readEntry(QLatin1String("SystemTray"), ConfigDefaults::systemTray()));
    setAskpassPackage(general.readEntry(QLatin1String("AskpassPackage"), ConfigDefaults::askpassPackage()));
    setConnectionUris(connections.readEntry(QLatin1String("Uris"), ConfigDefaults::connectionUris()));
    setAutoconnectUris(connections.readEntry(QLatin1String("Autoconnect"), ConfigDefaults::autoconnectUris()));

    qCDebug(lcConfig) << "Settings loaded interval=" << m_pollIntervalSeconds << "s tray=" << m_systemTrayEnabled
                      << "uris=" << m_connectionUris.size();
}

void Settings::save()
{
    auto config = KSharedConfig::openConfig(ConfigName);
    KConfigGroup polling = config->group(QStringLiteral("Polling"));
    KConfigGroup general = config->group(QStringLiteral("General"));
    KConfigGroup connections = config->group(QStringLiteral("Connections"));

    polling.writeEntry(QLatin1String("StatsUpdateInterval"), m_pollIntervalSeconds);
    general.writeEntry(QLatin1String("SystemTray"), m_systemTrayEnabled);
    general.writeEntry(QLatin1String("AskpassPackage"), m_askpassPackage);
    connections.writeEntry(QLatin1String("Uris"), m_connectionUris);
    connections.writeEntry(QLatin1String("Autoconnect"), m_autoconnectUris);

    if (!config->sync()) {
        qCWarning(lcConfig) << "Failed to write" << ConfigName;
    }
}

void Settings::reset()
{
    setPollIntervalSeconds(ConfigDefaults::statsUpdateInterval());
    setSystemTrayEnabled(ConfigDefaults::systemTray());
    setAskpassPackage(ConfigDefaults::askpassPackage());
    setConnectionUris(ConfigDefaults::connectionUris());
    setAutoconnectUris(ConfigDefaults::autoconnectUris());
    save();
}

} // namespace VirtDeck
