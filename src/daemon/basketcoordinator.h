// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/droppeditem.h"
#include "../core/interfaces.h"
#include "basketrouter.h"
#include <QList>
#include <QObject>
#include <QPointer>
#include <QTimer>
#include <QUrl>

namespace PlasmaBaskets {

class BasketController;
class BasketRegistry;
class BasketSwitcherController;

/**
 * @brief Entry point for every external trigger
 *
 * Drag notifications, gesture triggers and inbound items arrive here. The
 * coordinator snapshots the registry, asks BasketRouter for a decision and
 * carries it out through the registry, the baskets and the chooser.
 *
 * The configured mode is the single source of truth: whenever it says
 * Single and spawned baskets still exist, they are merged before routing.
 */
class PLASMABASKETS_EXPORT BasketCoordinator : public QObject
{
    Q_OBJECT

public:
    BasketCoordinator(BasketRegistry* registry, BasketSwitcherController* switcher,
                      const BasketEnvironment& environment, QObject* parent = nullptr);
    ~BasketCoordinator() override;

    // ═══════════════════════════════════════════════════════════════════════
    // Drag / gesture source
    // ═══════════════════════════════════════════════════════════════════════

    void onDragStarted();

    /**
     * @brief The drag finished; empty baskets hide once the drop has settled
     */
    void onDragEnded();

    /**
     * @brief The jiggle heuristic fired during a drag
     */
    void onJiggleDetected();

    bool isDragInProgress() const
    {
        return m_isDragInProgress;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Item ingestion
    // ═══════════════════════════════════════════════════════════════════════

    /**
     * @brief Deliver items from a paste, deep link or watched folder
     * @param urls Locators to add
     * @param revealAtLastPosition Reveal at the remembered frame instead of the pointer
     * @return The receiving basket, or nullptr if @p urls is empty
     */
    BasketController* addItemsFromExternalSource(const QList<QUrl>& urls, bool revealAtLastPosition);

    /**
     * @brief Deliver one pre-built item, keeping its metadata
     *
     * Used for files created on the basket's behalf (conversion output,
     * archives) which are flagged temporary and deleted once removed.
     *
     * @return The receiving basket, or nullptr if @p item is invalid
     */
    BasketController* addItemFromExternalSource(const DroppedItem& item, bool revealAtLastPosition);

    /**
     * @brief Hide every basket and the chooser, bypassing busy guards
     */
    void closeAllBaskets();

Q_SIGNALS:
    /**
     * @brief The user picked a basket in the chooser
     */
    void basketChosen(const QString& basketId);

private Q_SLOTS:
    void onDragEndedSettled();
    void onRevealSettled();

private:
    BasketController* inboundTarget();
    RouteDecision decide(RouteTrigger trigger);
    void execute(const RouteDecision& decision);
    bool openSwitcher(const QVector<BasketController*>& baskets);
    bool canHideEmptyBaskets() const;

    QPointer<BasketRegistry> m_registry;
    QPointer<BasketSwitcherController> m_switcher;
    BasketEnvironment m_env;

    bool m_isDragInProgress = false;

    QTimer m_dragEndedTimer; // Drop settle delay before hiding empty baskets
    QTimer m_switcherAfterRevealTimer; // Chooser opens once revealed baskets are up
};

} // namespace PlasmaBaskets
