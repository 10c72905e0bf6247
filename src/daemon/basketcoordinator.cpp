// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "basketcoordinator.h"
#include "basketcontroller.h"
#include "basketregistry.h"
#include "basketswitchercontroller.h"
#include "../core/constants.h"
#include "../core/logging.h"

namespace PlasmaBaskets {

BasketCoordinator::BasketCoordinator(BasketRegistry* registry, BasketSwitcherController* switcher,
                                     const BasketEnvironment& environment, QObject* parent)
    : QObject(parent)
    , m_registry(registry)
    , m_switcher(switcher)
    , m_env(environment)
{
    Q_ASSERT(registry);
    Q_ASSERT(switcher);
    Q_ASSERT(m_env.isComplete());

    m_dragEndedTimer.setSingleShot(true);
    m_dragEndedTimer.setInterval(Defaults::DragEndedSettleDelayMs);
    connect(&m_dragEndedTimer, &QTimer::timeout, this, &BasketCoordinator::onDragEndedSettled);

    m_switcherAfterRevealTimer.setSingleShot(true);
    m_switcherAfterRevealTimer.setInterval(Defaults::SwitcherAfterRevealDelayMs);
    connect(&m_switcherAfterRevealTimer, &QTimer::timeout, this, &BasketCoordinator::onRevealSettled);
}

BasketCoordinator::~BasketCoordinator() = default;

// ═══════════════════════════════════════════════════════════════════════════════
// Drag / gesture source
// ═══════════════════════════════════════════════════════════════════════════════

void BasketCoordinator::onDragStarted()
{
    m_isDragInProgress = true;
    m_dragEndedTimer.stop();
}

void BasketCoordinator::onDragEnded()
{
    m_isDragInProgress = false;
    m_switcherAfterRevealTimer.stop();

    if (!canHideEmptyBaskets()) {
        return;
    }
    m_dragEndedTimer.start();
}

bool BasketCoordinator::canHideEmptyBaskets() const
{
    if (!m_env.settings->isAutoHideEnabled() || m_env.guards->isBlockingHide()) {
        return false;
    }
    if (m_switcher && m_switcher->isVisible()) {
        return false;
    }
    return !m_isDragInProgress;
}

void BasketCoordinator::onDragEndedSettled()
{
    // Conditions may have changed while the drop settled
    if (!m_registry || !canHideEmptyBaskets()) {
        return;
    }

    // A basket still animating would drop its hide; try again once it settles
    if (m_registry->isTransitionInFlight()) {
        qCDebug(lcRouting) << "Drag-end cleanup deferred, transition in flight";
        m_dragEndedTimer.start();
        return;
    }

    for (BasketController* basket : m_registry->allBaskets()) {
        if (basket->isVisible() && basket->isEmpty()) {
            basket->hide();
        }
    }
}

void BasketCoordinator::onJiggleDetected()
{
    if (!m_isDragInProgress) {
        qCDebug(lcRouting) << "Jiggle ignored, no drag in progress";
        return;
    }

    execute(decide(RouteTrigger::JiggleDetected));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Item ingestion
// ═══════════════════════════════════════════════════════════════════════════════

BasketController* BasketCoordinator::addItemsFromExternalSource(const QList<QUrl>& urls, bool revealAtLastPosition)
{
    if (urls.isEmpty()) {
        qCWarning(lcRouting) << "Inbound items request without any locator";
        return nullptr;
    }
    BasketController* target = inboundTarget();
    if (!target) {
        return nullptr;
    }

    const int added = target->state()->addItems(urls);
    target->show(std::nullopt, revealAtLastPosition);

    qCInfo(lcRouting) << "Delivered" << added << "of" << urls.size() << "inbound items to" << target->basketId();
    return target;
}

BasketController* BasketCoordinator::addItemFromExternalSource(const DroppedItem& item, bool revealAtLastPosition)
{
    if (!item.isValid()) {
        qCWarning(lcRouting) << "Inbound item request with an invalid item";
        return nullptr;
    }

    BasketController* target = inboundTarget();
    if (!target) {
        return nullptr;
    }

    if (!target->state()->addItem(item)) {
        qCDebug(lcRouting) << "Inbound item already held:" << item.url();
    }
    target->show(std::nullopt, revealAtLastPosition);

    qCInfo(lcRouting) << "Delivered item" << item.url() << "to" << target->basketId()
                      << "temporary:" << item.isTemporary();
    return target;
}

BasketController* BasketCoordinator::inboundTarget()
{
    if (!m_registry) {
        return nullptr;
    }

    const RouteDecision decision = decide(RouteTrigger::InboundItems);
    BasketController* target = m_registry->basketById(decision.targetId);
    return target ? target : m_registry->primary();
}

void BasketCoordinator::closeAllBaskets()
{
    m_switcherAfterRevealTimer.stop();
    if (m_registry) {
        m_registry->closeAll(true);
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Decisions
// ═══════════════════════════════════════════════════════════════════════════════

RouteDecision BasketCoordinator::decide(RouteTrigger trigger)
{
    const QPoint pointer = m_env.pointer->pointerPosition();
    const bool switcherShown = m_switcher && m_switcher->isVisible();

    RouteDecision decision =
        BasketRouter::route(trigger, m_registry->snapshot(m_isDragInProgress, switcherShown), pointer);

    if (decision.mergeFirst) {
        m_registry->enforceSingleMode();
        decision = BasketRouter::route(trigger, m_registry->snapshot(m_isDragInProgress, switcherShown), pointer);
    }
    return decision;
}

void BasketCoordinator::execute(const RouteDecision& decision)
{
    switch (decision.action) {
    case RouteDecision::Action::None:
        return;

    case RouteDecision::Action::Reuse:
        if (BasketController* basket = m_registry->basketById(decision.targetId)) {
            basket->show();
        }
        return;

    case RouteDecision::Action::Reveal:
        for (int i = 0; i < decision.revealIds.size(); ++i) {
            BasketController* basket = m_registry->basketById(decision.revealIds.at(i));
            if (basket) {
                basket->show(decision.revealCenters.value(i, m_env.pointer->pointerPosition()));
            }
        }
        qCInfo(lcRouting) << "Revealed" << decision.revealIds.size() << "baskets";
        if (decision.openChooserAfterReveal) {
            m_switcherAfterRevealTimer.start();
        }
        return;

    case RouteDecision::Action::Spawn:
        m_registry->spawn(decision.spawnAt);
        return;

    case RouteDecision::Action::Chooser: {
        QVector<BasketController*> baskets;
        for (const QString& basketId : decision.chooserIds) {
            if (BasketController* basket = m_registry->basketById(basketId)) {
                baskets.append(basket);
            }
        }
        openSwitcher(baskets);
        return;
    }
    }
}

void BasketCoordinator::onRevealSettled()
{
    if (!m_registry) {
        return;
    }

    const QVector<BasketController*> visible = m_registry->visibleBaskets();
    if (visible.size() >= 2) {
        openSwitcher(visible);
    }
}

bool BasketCoordinator::openSwitcher(const QVector<BasketController*>& baskets)
{
    if (!m_switcher) {
        return false;
    }

    QPointer<BasketCoordinator> self(this);
    return m_switcher->show(baskets, [self](BasketController* basket) {
        if (!self) {
            return;
        }
        basket->show();
        Q_EMIT self->basketChosen(basket->basketId());
    });
}

} // namespace PlasmaBaskets
