// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "messageboxreporter.h"
#include <KLocalizedString>
#include <QMessageBox>

namespace VirtDeck {

namespace {
QMessageBox* buildBox(const ErrorReport& report, QMessageBox::Icon icon)
{
    auto* box = new QMessageBox(icon, report.title.isEmpty() ? i18n("VirtDeck Error") : report.title,
                                report.message);
    if (!report.details.isEmpty()) {
        box->setDetailedText(report.details);
    }
    return box;
}
} // namespace

void MessageBoxReporter::showError(const ErrorReport& report)
{
    QMessageBox* box = buildBox(report, QMessageBox::Critical);
    box->setAttribute(Qt::WA_DeleteOnClose);
    box->setStandardButtons(QMessageBox::Close);
    if (report.modal) {
        box->exec();
    } else {
        box->setModal(false);
        box->show();
    }
}

bool MessageBoxReporter::askQuestion(const ErrorReport& report)
{
    QMessageBox* box = buildBox(report, QMessageBox::Question);
    box->setStandardButtons(QMessageBox::Yes | QMessageBox::No);
    box->setDefaultButton(QMessageBox::Yes);
    const bool accepted = box->exec() == QMessageBox::Yes;
    delete box;
    return accepted;
}

} // namespace VirtDeck
