// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/interfaces.h"
#include "../core/types.h"
#include "basketrouter.h"
#include <QObject>
#include <QPoint>
#include <QString>
#include <QUrl>
#include <QVector>

namespace PlasmaBaskets {

class BasketController;

/**
 * @brief Owner of every basket: the primary plus the spawned ones
 *
 * The primary basket exists for the registry's whole lifetime and is only
 * ever hidden or emptied. Spawned baskets exist only in Multi mode; they are
 * destroyed by a merge into the primary (enforceSingleMode) or by an
 * explicit close.
 *
 * The mode is read from the settings on every query. Turning Multi mode off
 * in the settings merges immediately, so spawned() is empty whenever the
 * configured mode is Single.
 *
 * All mutations happen on the main thread. A merge runs to completion before
 * returning, so no basket can be spawned while one is in progress.
 */
class PLASMABASKETS_EXPORT BasketRegistry : public QObject
{
    Q_OBJECT

public:
    static inline const QString PrimaryBasketId = QStringLiteral("primary");

    explicit BasketRegistry(const BasketEnvironment& environment, QObject* parent = nullptr);
    ~BasketRegistry() override;

    // ═══════════════════════════════════════════════════════════════════════
    // Queries
    // ═══════════════════════════════════════════════════════════════════════

    BasketController* primary() const
    {
        return m_primary;
    }
    QVector<BasketController*> spawned() const
    {
        return m_spawned;
    }

    /**
     * @brief Primary first, then spawned baskets in creation order
     */
    QVector<BasketController*> allBaskets() const;
    QVector<BasketController*> visibleBaskets() const;
    BasketController* basketById(const QString& basketId) const;

    int count() const
    {
        return 1 + m_spawned.size();
    }

    BasketMode mode() const;
    bool isMultiMode() const
    {
        return mode() == BasketMode::Multi;
    }

    /**
     * @brief Accent colors are only shown while two or more baskets are visible
     */
    bool shouldShowAccentColors() const;

    /**
     * @brief Whether any basket is between a show and its completion
     */
    bool isTransitionInFlight() const;

    RegistrySnapshot snapshot(bool isDragInProgress, bool isSwitcherShown) const;

    // ═══════════════════════════════════════════════════════════════════════
    // Lifecycle
    // ═══════════════════════════════════════════════════════════════════════

    /**
     * @brief Create a basket and reveal it at @p at
     *
     * Multi mode: cancels every pending hide deadline first, assigns the
     * accent nextColor(count()), registers and shows the new basket.
     * Single mode: returns the primary unchanged.
     */
    BasketController* spawn(const QPoint& at);

    /**
     * @brief Merge every spawned basket into the primary and destroy them
     *
     * Items are deduplicated by locator; pin flags are OR'd. When any spawned
     * basket had been visible and the primary now holds items, the primary is
     * revealed at its last frame.
     *
     * @return Number of items appended to the primary
     */
    int enforceSingleMode();

    /**
     * @brief Hide every basket and the chooser; collections are kept
     */
    void closeAll(bool force = true);

    /**
     * @brief Close one basket
     *
     * A spawned basket is unregistered once its hide animation completes;
     * the primary is only hidden.
     *
     * @return false if @p basketId is unknown or the hide was dropped
     */
    bool closeBasket(const QString& basketId);

    /**
     * @brief Move the item with locator @p url from one basket to another
     *
     * The item keeps its identity, pin and temporary flags; its backing file
     * is left alone.
     *
     * @return false if either basket is unknown, they are the same basket,
     *         the source does not hold @p url or the target already does
     */
    bool moveItem(const QUrl& url, const QString& fromBasketId, const QString& toBasketId);

public Q_SLOTS:
    /**
     * @brief Re-resolve every basket's display after outputs were added, removed or moved
     */
    void onDisplayTopologyChanged();

Q_SIGNALS:
    void basketAdded(const QString& basketId);
    void basketRemoved(const QString& basketId);
    void basketVisibilityChanged(const QString& basketId, bool visible);

    /**
     * @brief The chooser must go away (close-all or merge in progress)
     */
    void switcherDismissRequested();

private Q_SLOTS:
    void onMultiBasketEnabledChanged();
    void onPowerFoldersEnabledChanged();

private:
    BasketController* createBasket(const QString& basketId, BasketAccentColor accent, bool isPrimary);
    void unregisterBasket(const QString& basketId);
    void handleHoverExit(BasketController* basket);
    void updateAccentVisibility();

    BasketEnvironment m_env;
    BasketController* m_primary = nullptr; // owned (QObject child)
    QVector<BasketController*> m_spawned;  // owned (QObject children)
};

} // namespace PlasmaBaskets
