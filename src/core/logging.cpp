// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging.h"

namespace VirtDeck {

// Core module categories
Q_LOGGING_CATEGORY(lcCore, "virtdeck.core", QtInfoMsg)
Q_LOGGING_CATEGORY(lcScheduler, "virtdeck.core.scheduler", QtInfoMsg)
Q_LOGGING_CATEGORY(lcConnection, "virtdeck.core.connection", QtInfoMsg)
Q_LOGGING_CATEGORY(lcLifecycle, "virtdeck.core.lifecycle", QtInfoMsg)
Q_LOGGING_CATEGORY(lcCommand, "virtdeck.core.command", QtInfoMsg)

// Backend module categories
Q_LOGGING_CATEGORY(lcBackend, "virtdeck.backend", QtInfoMsg)

// Configuration module categories
Q_LOGGING_CATEGORY(lcConfig, "virtdeck.config", QtInfoMsg)

// D-Bus module categories
Q_LOGGING_CATEGORY(lcDbus, "virtdeck.dbus", QtInfoMsg)

// Application shell categories
Q_LOGGING_CATEGORY(lcApp, "virtdeck.app", QtInfoMsg)

} // namespace VirtDeck
