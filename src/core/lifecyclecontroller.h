// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "virtdeck_export.h"
#include <QObject>
#include <QPointer>

namespace VirtDeck {

class IPresenceIndicator;

/**
 * @brief Process-wide open window counter and exit policy
 *
 * Every window open is paired with exactly one close. When the count drops
 * to zero and the presence indicator is not showing, exitRequested() is
 * emitted. The check runs on the next event loop pass because the closing
 * window is usually still inside its own close handling.
 */
class VIRTDECK_EXPORT LifecycleController : public QObject
{
    Q_OBJECT

public:
    explicit LifecycleController(QObject* parent = nullptr);
    ~LifecycleController() override;

    int windowCount() const
    {
        return m_windowCount;
    }

    void setPresenceIndicator(IPresenceIndicator* indicator);

    void increment(const QString& source);

    /**
     * @brief Record a window close and schedule an exit check
     *
     * A decrement with the count already at zero is an unpaired close; it is
     * logged and ignored.
     */
    void decrement(const QString& source);

    /// Post checkExit() to the next event loop pass
    void scheduleExitCheck();

    /// No windows open and no visible presence indicator
    bool canExit() const;

    /**
     * @brief Exit if nothing keeps the application alive
     * @return true if exit was requested
     */
    bool checkExit();

    /**
     * @brief Start shutdown; only the first call emits exitRequested()
     */
    void requestExit(const QString& source);

    bool isExiting() const
    {
        return m_exiting;
    }

Q_SIGNALS:
    void windowCountChanged(int count);
    void exitRequested(const QString& source);

private:
    int m_windowCount = 0;
    bool m_exiting = false;
    QPointer<IPresenceIndicator> m_indicator;
};

} // namespace VirtDeck
