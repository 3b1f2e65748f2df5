// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "virtdeck_export.h"
#include <QLoggingCategory>

/**
 * @file logging.h
 * @brief Centralized logging categories for VirtDeck
 *
 * This file defines Qt logging categories that enable runtime filtering
 * of log messages. Use these categories instead of plain qDebug/qWarning.
 *
 * Usage:
 *   #include "logging.h"
 *   qCDebug(lcScheduler) << "Debug message";
 *   qCInfo(lcLifecycle) << "Info message";
 *   qCWarning(lcConnection) << "Warning message";
 *   qCCritical(lcApp) << "Critical message";
 *
 * Runtime filtering via environment variable:
 *   QT_LOGGING_RULES="virtdeck.*=true"                    # Enable all
 *   QT_LOGGING_RULES="virtdeck.*.debug=false"             # Disable debug only
 *   QT_LOGGING_RULES="virtdeck.core.scheduler=true"       # Enable polling only
 *
 * Severity Guidelines:
 *   qCDebug    - Development tracing, disabled in release builds
 *   qCInfo     - Significant operational events (startup, shutdown, connection opened)
 *   qCWarning  - Recoverable errors (poll failures, connect failures, bad CLI input)
 *   qCCritical - System failures preventing normal operation
 */

namespace VirtDeck {

// Core module - engine, polling, registry, lifecycle, command dispatch
VIRTDECK_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcCore)
VIRTDECK_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcScheduler)
VIRTDECK_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcConnection)
VIRTDECK_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcLifecycle)
VIRTDECK_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcCommand)

// Backend module - virsh-based connections
VIRTDECK_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcBackend)

// Configuration module - settings loading/saving
VIRTDECK_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcConfig)

// D-Bus module - engine adaptor
VIRTDECK_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcDbus)

// Application shell - windows, tray, startup
VIRTDECK_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcApp)

} // namespace VirtDeck
