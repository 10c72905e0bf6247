// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/interfaces.h"
#include <QObject>
#include <QPoint>
#include <QPointer>
#include <QTimer>
#include <QVector>

namespace PlasmaBaskets {

class BasketController;
class BasketRegistry;
class BasketSwitcherController;

/**
 * @brief Level-triggered auto-hide evaluator
 *
 * Hover-exit notifications from the compositor are not reliable, so the
 * scheduler re-derives on every tick whether each visible, non-empty basket
 * should hide. It is the only component that commits the Visible to
 * AutoHidden transition; hover hints merely set or clear deadlines.
 *
 * Per basket and tick:
 * 1. Not visible, auto-hide disabled or empty: clear the deadline
 * 2. Pointer inside the basket: clear the deadline
 * 3. Pointer over a sibling basket, or the chooser is shown: clear the deadline
 * 4. No deadline yet: set it to now + delay
 * 5. Deadline reached and no guard active: commit the auto-hide
 *
 * The tick timer runs only while at least one basket is visible.
 */
class PLASMABASKETS_EXPORT AutoHideScheduler : public QObject
{
    Q_OBJECT

public:
    AutoHideScheduler(BasketRegistry* registry, BasketSwitcherController* switcher,
                      const BasketEnvironment& environment, QObject* parent = nullptr);
    ~AutoHideScheduler() override;

    /**
     * @brief Run one evaluation pass at @p nowMs
     * @return Number of baskets that were auto-hidden
     */
    int evaluate(qint64 nowMs);

    bool isRunning() const
    {
        return m_tickTimer.isActive();
    }
    int interval() const
    {
        return m_tickTimer.interval();
    }

Q_SIGNALS:
    void basketAutoHidden(const QString& basketId);

public Q_SLOTS:
    /**
     * @brief Start or stop ticking depending on whether any basket is visible
     */
    void syncRunning();

private Q_SLOTS:
    void onTick();
    void onPollIntervalChanged();

private:
    bool evaluateBasket(BasketController* basket, const QVector<BasketController*>& baskets, const QPoint& pointer,
                        bool switcherShown, qint64 nowMs);

    QPointer<BasketRegistry> m_registry;
    QPointer<BasketSwitcherController> m_switcher;
    BasketEnvironment m_env;
    QTimer m_tickTimer;
};

} // namespace PlasmaBaskets
