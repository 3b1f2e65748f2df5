// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "virtdeckconfig.h"  // Generated from virtdeck.kcfg via KConfigXT
#include "../core/constants.h"

#include <QString>
#include <QStringList>

namespace VirtDeck {

/**
 * @brief Static access to the defaults declared in virtdeck.kcfg
 *
 * Wraps the KConfigXT-generated VirtDeckConfig class. The .kcfg file is the
 * single source of truth for defaults and ranges.
 *
 * Usage:
 *   int seconds = ConfigDefaults::statsUpdateInterval();  // 1 (from .kcfg)
 */
class ConfigDefaults
{
public:
    // Polling
    static int statsUpdateInterval() { return instance().defaultStatsUpdateIntervalValue(); }
    static int statsUpdateIntervalMin() { return Defaults::MinPollIntervalSeconds; }
    static int statsUpdateIntervalMax() { return Defaults::MaxPollIntervalSeconds; }

    // General
    static bool systemTray() { return instance().defaultSystemTrayValue(); }
    static QString askpassPackage() { return instance().defaultAskpassPackageValue(); }

    // Connections
    static QStringList connectionUris() { return instance().defaultUrisValue(); }
    static QStringList autoconnectUris() { return instance().defaultAutoconnectValue(); }

private:
    // Lazily-initialized singleton instance
    static VirtDeckConfig& instance()
    {
        static VirtDeckConfig config;
        return config;
    }

    // Non-instantiable
    ConfigDefaults() = delete;
};

} // namespace VirtDeck
