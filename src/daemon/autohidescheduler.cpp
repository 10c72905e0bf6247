// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "autohidescheduler.h"
#include "basketcontroller.h"
#include "basketregistry.h"
#include "basketswitchercontroller.h"
#include "../core/logging.h"

namespace PlasmaBaskets {

AutoHideScheduler::AutoHideScheduler(BasketRegistry* registry, BasketSwitcherController* switcher,
                                     const BasketEnvironment& environment, QObject* parent)
    : QObject(parent)
    , m_registry(registry)
    , m_switcher(switcher)
    , m_env(environment)
{
    Q_ASSERT(registry);
    Q_ASSERT(m_env.isComplete());

    m_tickTimer.setInterval(m_env.settings->autoHidePollIntervalMs());
    connect(&m_tickTimer, &QTimer::timeout, this, &AutoHideScheduler::onTick);

    connect(m_registry, &BasketRegistry::basketVisibilityChanged, this, &AutoHideScheduler::syncRunning);
    connect(m_registry, &BasketRegistry::basketRemoved, this, &AutoHideScheduler::syncRunning);
    connect(m_env.settings, &ISettings::autoHidePollIntervalMsChanged, this,
            &AutoHideScheduler::onPollIntervalChanged);
}

AutoHideScheduler::~AutoHideScheduler()
{
    m_tickTimer.stop();
}

void AutoHideScheduler::syncRunning()
{
    if (!m_registry) {
        m_tickTimer.stop();
        return;
    }

    const bool anyVisible = !m_registry->visibleBaskets().isEmpty();
    if (anyVisible && !m_tickTimer.isActive()) {
        m_tickTimer.start();
        qCDebug(lcAutoHide) << "Auto-hide ticks started every" << m_tickTimer.interval() << "ms";
    } else if (!anyVisible && m_tickTimer.isActive()) {
        m_tickTimer.stop();
        qCDebug(lcAutoHide) << "Auto-hide ticks stopped, no visible basket";
    }
}

void AutoHideScheduler::onTick()
{
    evaluate(BasketController::currentTimeMs());
}

void AutoHideScheduler::onPollIntervalChanged()
{
    m_tickTimer.setInterval(m_env.settings->autoHidePollIntervalMs());
}

int AutoHideScheduler::evaluate(qint64 nowMs)
{
    if (!m_registry) {
        return 0;
    }

    const QVector<BasketController*> baskets = m_registry->allBaskets();
    const QPoint pointer = m_env.pointer->pointerPosition();
    const bool switcherShown = m_switcher && m_switcher->isVisible();

    int committed = 0;
    for (BasketController* basket : baskets) {
        if (evaluateBasket(basket, baskets, pointer, switcherShown, nowMs)) {
            ++committed;
            Q_EMIT basketAutoHidden(basket->basketId());
        }
    }
    return committed;
}

bool AutoHideScheduler::evaluateBasket(BasketController* basket, const QVector<BasketController*>& baskets,
                                       const QPoint& pointer, bool switcherShown, qint64 nowMs)
{
    // 1. Nothing to hide
    if (!basket->isVisible() || !m_env.settings->isAutoHideEnabled() || basket->isEmpty()) {
        basket->cancelHideTimer();
        return false;
    }

    // 2. Pointer is over this basket
    if (basket->containsPoint(pointer)) {
        basket->cancelHideTimer();
        return false;
    }

    // 3. Arbitration: never fight a sibling or the chooser
    if (switcherShown) {
        basket->cancelHideTimer();
        return false;
    }
    for (BasketController* sibling : baskets) {
        if (sibling != basket && sibling->containsPoint(pointer)) {
            basket->cancelHideTimer();
            return false;
        }
    }

    // 4. Arm the deadline even if no hover-exit was ever delivered
    if (!basket->hideDeadline()) {
        const qint64 delayMs = qRound64(m_env.settings->autoHideDelaySeconds() * 1000.0);
        basket->setHideDeadline(nowMs + delayMs);
        qCDebug(lcAutoHide) << "Armed hide deadline for" << basket->basketId();
    }

    // 5. Commit once due and unguarded
    if (nowMs < *basket->hideDeadline()) {
        return false;
    }
    if (!basket->canAutoHideNow()) {
        qCDebug(lcAutoHide) << "Auto-hide deferred, basket busy:" << basket->basketId();
        return false;
    }
    return basket->commitAutoHide();
}

} // namespace PlasmaBaskets
