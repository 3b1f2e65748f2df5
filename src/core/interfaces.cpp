// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "interfaces.h"

namespace VirtDeck {

// Key functions for interface classes to anchor vtables to this translation unit
// This prevents ODR violations when interfaces are used across shared library boundaries

IConnection::~IConnection() = default;

IConnectionFactory::~IConnectionFactory() = default;

IWindow::~IWindow() = default;

IPresenceIndicator::~IPresenceIndicator() = default;

IErrorReporter::~IErrorReporter() = default;

IUiFactory::~IUiFactory() = default;

} // namespace VirtDeck
