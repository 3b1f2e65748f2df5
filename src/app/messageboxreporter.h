// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/interfaces.h"

namespace VirtDeck {

/**
 * @brief IErrorReporter showing QMessageBox dialogs
 *
 * Modal reports block in exec(); non-modal ones delete themselves on close.
 */
class MessageBoxReporter : public IErrorReporter
{
public:
    void showError(const ErrorReport& report) override;
    bool askQuestion(const ErrorReport& report) override;
};

} // namespace VirtDeck
