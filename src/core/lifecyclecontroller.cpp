// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "lifecyclecontroller.h"
#include "interfaces.h"
#include "logging.h"
#include <QTimer>

namespace VirtDeck {

LifecycleController::LifecycleController(QObject* parent)
    : QObject(parent)
{
}

LifecycleController::~LifecycleController() = default;

void LifecycleController::setPresenceIndicator(IPresenceIndicator* indicator)
{
    m_indicator = indicator;
}

void LifecycleController::increment(const QString& source)
{
    ++m_windowCount;
    qCDebug(lcLifecycle) << "window counter incremented by" << source << "count=" << m_windowCount;
    Q_EMIT windowCountChanged(m_windowCount);
}

void LifecycleController::decrement(const QString& source)
{
    if (m_windowCount <= 0) {
        qCWarning(lcLifecycle) << "Unpaired window close from" << source << "ignored";
        return;
    }

    --m_windowCount;
    qCDebug(lcLifecycle) << "window counter decremented by" << source << "count=" << m_windowCount;
    Q_EMIT windowCountChanged(m_windowCount);

    scheduleExitCheck();
}

void LifecycleController::scheduleExitCheck()
{
    QTimer::singleShot(0, this, &LifecycleController::checkExit);
}

bool LifecycleController::canExit() const
{
    return m_windowCount <= 0 && !(m_indicator && m_indicator->isVisible());
}

bool LifecycleController::checkExit()
{
    if (!canExit()) {
        return false;
    }
    requestExit(QStringLiteral("window counter"));
    return true;
}

void LifecycleController::requestExit(const QString& source)
{
    if (m_exiting) {
        return;
    }
    m_exiting = true;
    qCInfo(lcLifecycle) << "Exit requested by" << source;
    Q_EMIT exitRequested(source);
}

} // namespace VirtDeck
