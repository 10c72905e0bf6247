// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "basketrouter.h"
#include "../core/geometryutils.h"
#include "../core/logging.h"

namespace PlasmaBaskets {

int RegistrySnapshot::spawnedCount() const
{
    int count = 0;
    for (const BasketSnapshot& basket : baskets) {
        if (!basket.isPrimary) {
            ++count;
        }
    }
    return count;
}

namespace BasketRouter {

namespace {

const BasketSnapshot* primaryOf(const RegistrySnapshot& snapshot)
{
    for (const BasketSnapshot& basket : snapshot.baskets) {
        if (basket.isPrimary) {
            return &basket;
        }
    }
    return nullptr;
}

const BasketSnapshot* frontmostVisible(const RegistrySnapshot& snapshot)
{
    const BasketSnapshot* frontmost = nullptr;
    for (const BasketSnapshot& basket : snapshot.baskets) {
        if (basket.isVisible() && basket.stackingOrder >= 0
            && (!frontmost || basket.stackingOrder > frontmost->stackingOrder)) {
            frontmost = &basket;
        }
    }
    if (frontmost) {
        return frontmost;
    }

    for (const BasketSnapshot& basket : snapshot.baskets) {
        if (basket.isVisible() && basket.isActive) {
            return &basket;
        }
    }

    for (const BasketSnapshot& basket : snapshot.baskets) {
        if (basket.isVisible()) {
            return &basket;
        }
    }
    return nullptr;
}

RouteDecision routeJiggle(const RegistrySnapshot& snapshot, const QPoint& pointer)
{
    RouteDecision decision;

    if (!snapshot.isDragInProgress || snapshot.isSwitcherShown) {
        return decision;
    }

    // A basket mid-transition would have its show/hide dropped anyway
    for (const BasketSnapshot& basket : snapshot.baskets) {
        if (basket.isShowingOrHiding) {
            return decision;
        }
    }

    QStringList visible;
    QStringList hiddenWithItems;
    for (const BasketSnapshot& basket : snapshot.baskets) {
        if (basket.isVisible()) {
            visible.append(basket.basketId);
        } else if (!basket.isEmpty) {
            hiddenWithItems.append(basket.basketId);
        }
    }

    if (visible.isEmpty()) {
        decision.action = RouteDecision::Action::Reveal;
        if (!hiddenWithItems.isEmpty()) {
            decision.revealIds = hiddenWithItems;
            decision.revealCenters = GeometryUtils::revealSlotCenters(pointer, hiddenWithItems.size());
        } else if (const BasketSnapshot* primary = primaryOf(snapshot)) {
            decision.revealIds = {primary->basketId};
            decision.revealCenters = {pointer};
        } else {
            decision.action = RouteDecision::Action::None;
        }
        return decision;
    }

    if (snapshot.mode == BasketMode::Single) {
        // Spawning is disabled and the one basket is already on screen
        return decision;
    }

    if (!hiddenWithItems.isEmpty()) {
        decision.action = RouteDecision::Action::Reveal;
        decision.revealIds = hiddenWithItems;
        decision.revealCenters = GeometryUtils::revealSlotCenters(pointer, hiddenWithItems.size());
        decision.openChooserAfterReveal = true;
        return decision;
    }

    if (visible.size() >= 2) {
        decision.action = RouteDecision::Action::Chooser;
        decision.chooserIds = visible;
        return decision;
    }

    decision.action = RouteDecision::Action::Spawn;
    decision.spawnAt = pointer;
    return decision;
}

} // anonymous namespace

QString inboundTarget(const RegistrySnapshot& snapshot)
{
    if (const BasketSnapshot* frontmost = frontmostVisible(snapshot)) {
        return frontmost->basketId;
    }

    const bool multi = snapshot.mode == BasketMode::Multi;
    if (multi) {
        for (const BasketSnapshot& basket : snapshot.baskets) {
            if (!basket.isPrimary && !basket.isVisible() && !basket.isEmpty) {
                return basket.basketId;
            }
        }
    }

    const BasketSnapshot* primary = primaryOf(snapshot);
    if (!primary) {
        return QString();
    }
    // Multi mode prefers a non-empty primary; every other case falls back to it too
    return primary->basketId;
}

RouteDecision route(RouteTrigger trigger, const RegistrySnapshot& snapshot, const QPoint& pointer)
{
    RouteDecision decision;

    if (snapshot.mode == BasketMode::Single && snapshot.spawnedCount() > 0) {
        decision.mergeFirst = true;
        return decision;
    }

    switch (trigger) {
    case RouteTrigger::JiggleDetected:
        decision = routeJiggle(snapshot, pointer);
        break;
    case RouteTrigger::InboundItems:
        decision.targetId = inboundTarget(snapshot);
        if (!decision.targetId.isEmpty()) {
            decision.action = RouteDecision::Action::Reuse;
        }
        break;
    }

    qCDebug(lcRouting) << "Routed" << (trigger == RouteTrigger::JiggleDetected ? "jiggle" : "inbound items")
                       << "to" << actionToString(decision.action);
    return decision;
}

QString actionToString(RouteDecision::Action action)
{
    switch (action) {
    case RouteDecision::Action::None:
        return QStringLiteral("none");
    case RouteDecision::Action::Reuse:
        return QStringLiteral("reuse");
    case RouteDecision::Action::Reveal:
        return QStringLiteral("reveal");
    case RouteDecision::Action::Spawn:
        return QStringLiteral("spawn");
    case RouteDecision::Action::Chooser:
        return QStringLiteral("chooser");
    }
    return QStringLiteral("none");
}

} // namespace BasketRouter

} // namespace PlasmaBaskets
