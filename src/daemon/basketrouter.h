// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/types.h"
#include "plasmabaskets_export.h"
#include <QPoint>
#include <QString>
#include <QStringList>
#include <QVector>

namespace PlasmaBaskets {

/**
 * @brief What the router sees of one basket
 */
struct PLASMABASKETS_EXPORT BasketSnapshot
{
    QString basketId;
    bool isPrimary = false;
    BasketVisibility visibility = BasketVisibility::Hidden;
    bool isEmpty = true;
    bool isShowingOrHiding = false;
    int stackingOrder = -1; ///< -1 when the basket has no surface
    bool isActive = false;

    bool isVisible() const
    {
        return visibility == BasketVisibility::Visible;
    }
};

/**
 * @brief What the router sees of the registry
 *
 * baskets holds the primary first, then spawned baskets in creation order.
 */
struct PLASMABASKETS_EXPORT RegistrySnapshot
{
    BasketMode mode = BasketMode::Multi;
    QVector<BasketSnapshot> baskets;
    bool isDragInProgress = false;
    bool isSwitcherShown = false;

    int spawnedCount() const;
};

/**
 * @brief Events that need a routing decision
 */
enum class RouteTrigger {
    JiggleDetected, ///< Drag gesture heuristic fired
    InboundItems    ///< Items arrived from paste, deep link or watched folder
};

/**
 * @brief Outcome of BasketRouter::route()
 */
struct PLASMABASKETS_EXPORT RouteDecision
{
    enum class Action {
        None,    ///< Nothing to do (guard or Single mode with a visible basket)
        Reuse,   ///< Deliver to an existing basket (targetId) and reveal it
        Reveal,  ///< Show revealIds at the matching revealCenters
        Spawn,   ///< Create a new basket at the pointer
        Chooser  ///< Present the chooser listing chooserIds
    };

    Action action = Action::None;

    /**
     * @brief Single mode with spawned baskets: merge before acting, then route again
     */
    bool mergeFirst = false;

    QString targetId;
    QStringList revealIds;
    QVector<QPoint> revealCenters;
    QStringList chooserIds;

    /**
     * @brief Open the chooser once the revealed baskets have materialized
     */
    bool openChooserAfterReveal = false;

    QPoint spawnAt;
};

/**
 * @brief Pure routing decisions for inbound items and drag gestures
 *
 * No side effects and no live surfaces: the coordinator snapshots the
 * registry, asks for a decision and carries it out.
 */
namespace BasketRouter {

PLASMABASKETS_EXPORT RouteDecision route(RouteTrigger trigger, const RegistrySnapshot& snapshot, const QPoint& pointer);

/**
 * @brief Receiving basket for items from a non-drag source
 *
 * Priority: frontmost visible basket (z-order, then focus, then first
 * visible); in Multi mode a hidden spawned basket with items; in Multi
 * mode a non-empty primary; otherwise the primary.
 */
PLASMABASKETS_EXPORT QString inboundTarget(const RegistrySnapshot& snapshot);

PLASMABASKETS_EXPORT QString actionToString(RouteDecision::Action action);

} // namespace BasketRouter

} // namespace PlasmaBaskets
