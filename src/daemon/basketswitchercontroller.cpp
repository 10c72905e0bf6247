// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "basketswitchercontroller.h"
#include "basketcontroller.h"
#include "basketregistry.h"
#include "../core/constants.h"
#include "../core/logging.h"

namespace PlasmaBaskets {

BasketSwitcherController::BasketSwitcherController(BasketRegistry* registry, const BasketEnvironment& environment,
                                                   QObject* parent)
    : QObject(parent)
    , m_registry(registry)
    , m_env(environment)
{
    Q_ASSERT(registry);
    Q_ASSERT(m_env.isComplete());

    connect(m_registry, &BasketRegistry::switcherDismissRequested, this, &BasketSwitcherController::hide);
}

BasketSwitcherController::~BasketSwitcherController() = default;

bool BasketSwitcherController::show(const QVector<BasketController*>& baskets, PickCallback onPick)
{
    if (baskets.size() < 2) {
        qCDebug(lcPresentation) << "Chooser needs at least two baskets, got" << baskets.size();
        return false;
    }

    if (m_visible) {
        restoreFadedBaskets();
    }

    m_listed.clear();
    for (BasketController* basket : baskets) {
        m_listed.append(basket);
        if (IBasketSurface* surface = basket->surface()) {
            surface->fadeTo(0.0, Motion::SwitcherFadeDurationMs);
        }
    }

    m_onPick = std::move(onPick);
    if (!presentListed()) {
        // No chooser on screen: never leave the baskets faded or auto-hide suppressed
        qCWarning(lcPresentation) << "Chooser window did not appear";
        restoreFadedBaskets();
        m_listed.clear();
        m_onPick = nullptr;
        if (m_visible) {
            m_visible = false;
            Q_EMIT visibilityChanged(false);
        }
        return false;
    }

    const bool wasVisible = m_visible;
    m_visible = true;
    if (!wasVisible) {
        Q_EMIT visibilityChanged(true);
    }
    qCInfo(lcPresentation) << "Chooser shown with" << m_listed.size() << "baskets";
    return true;
}

bool BasketSwitcherController::presentListed()
{
    QVector<SwitcherEntry> entries;
    for (const QPointer<BasketController>& basket : std::as_const(m_listed)) {
        if (!basket) {
            continue;
        }
        SwitcherEntry entry;
        entry.basketId = basket->basketId();
        entry.accent = basket->accent();
        entry.itemCount = basket->state()->count();
        entries.append(entry);
    }

    m_env.presentation->showSwitcher(entries, m_env.pointer->pointerPosition(), this);
    return m_env.presentation->isSwitcherShown();
}

void BasketSwitcherController::hide()
{
    if (!m_visible) {
        return;
    }

    // The window may already be gone (closed by the compositor)
    if (m_env.presentation->isSwitcherShown()) {
        m_env.presentation->hideSwitcher();
    }
    restoreFadedBaskets();
    m_listed.clear();
    m_visible = false;
    Q_EMIT visibilityChanged(false);
}

QStringList BasketSwitcherController::listedBasketIds() const
{
    QStringList ids;
    for (const QPointer<BasketController>& basket : m_listed) {
        if (basket) {
            ids.append(basket->basketId());
        }
    }
    return ids;
}

void BasketSwitcherController::restoreFadedBaskets()
{
    for (const QPointer<BasketController>& basket : std::as_const(m_listed)) {
        if (basket && basket->surface()) {
            basket->surface()->fadeTo(1.0, Motion::SwitcherFadeDurationMs);
        }
    }
}

void BasketSwitcherController::onSwitcherPicked(const QString& basketId)
{
    BasketController* basket = m_registry ? m_registry->basketById(basketId) : nullptr;
    // Keep the callback alive past hide()
    const PickCallback onPick = std::move(m_onPick);
    m_onPick = nullptr;
    hide();

    if (!basket) {
        qCWarning(lcPresentation) << "Chooser picked unknown basket" << basketId;
        return;
    }

    Q_EMIT basketPicked(basketId);
    if (onPick) {
        onPick(basket);
    }
}

void BasketSwitcherController::onSwitcherDroppedOnNewBasket(const QList<QUrl>& urls)
{
    m_onPick = nullptr;
    hide();

    if (!m_registry) {
        return;
    }

    BasketController* basket = m_registry->spawn(m_env.pointer->pointerPosition());
    const int added = basket->state()->addItems(urls);
    qCInfo(lcPresentation) << "Dropped" << added << "items on a new basket" << basket->basketId();
}

void BasketSwitcherController::onSwitcherDismissed()
{
    m_onPick = nullptr;
    hide();
}

void BasketSwitcherController::onSwitcherHideRequested(const QString& basketId)
{
    BasketController* basket = m_registry ? m_registry->basketById(basketId) : nullptr;
    if (!basket) {
        qCWarning(lcPresentation) << "Chooser asked to hide unknown basket" << basketId;
        return;
    }

    m_listed.removeAll(QPointer<BasketController>(basket));
    basket->hidePreservingState();
    qCInfo(lcPresentation) << "Basket" << basketId << "put away from the chooser";

    int remaining = 0;
    for (const QPointer<BasketController>& listed : std::as_const(m_listed)) {
        remaining += listed ? 1 : 0;
    }
    if (remaining < 2) {
        m_onPick = nullptr;
        hide();
        return;
    }
    if (!presentListed()) {
        m_onPick = nullptr;
        hide();
    }
}

} // namespace PlasmaBaskets
