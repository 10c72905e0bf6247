// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/interfaces.h"
#include <QList>
#include <QObject>
#include <QPointer>
#include <QStringList>
#include <QUrl>
#include <QVector>
#include <functional>

namespace PlasmaBaskets {

class BasketController;
class BasketRegistry;

/**
 * @brief Modal chooser listing the visible baskets
 *
 * While shown, the listed baskets fade out so the chooser is the only
 * target; they are restored when it hides. Picking an entry hides the
 * chooser and invokes the caller's callback with the picked basket.
 * Dropping on the "new basket" entry spawns a basket holding the dropped
 * items. An entry's "hide" action puts that basket away with its items kept;
 * the chooser closes once fewer than two baskets are left in it.
 */
class PLASMABASKETS_EXPORT BasketSwitcherController : public QObject, public ISwitcherEvents
{
    Q_OBJECT

    Q_PROPERTY(bool visible READ isVisible NOTIFY visibilityChanged)

public:
    using PickCallback = std::function<void(BasketController*)>;

    BasketSwitcherController(BasketRegistry* registry, const BasketEnvironment& environment,
                             QObject* parent = nullptr);
    ~BasketSwitcherController() override;

    /**
     * @brief Present the chooser for @p baskets at the pointer
     * @return false if fewer than two baskets were given or the chooser
     *         window could not be shown
     */
    bool show(const QVector<BasketController*>& baskets, PickCallback onPick);

    void hide();

    bool isVisible() const
    {
        return m_visible;
    }
    QStringList listedBasketIds() const;

    // ISwitcherEvents
    void onSwitcherPicked(const QString& basketId) override;
    void onSwitcherDroppedOnNewBasket(const QList<QUrl>& urls) override;
    void onSwitcherDismissed() override;
    void onSwitcherHideRequested(const QString& basketId) override;

Q_SIGNALS:
    void visibilityChanged(bool visible);
    void basketPicked(const QString& basketId);

private:
    bool presentListed();
    void restoreFadedBaskets();

    QPointer<BasketRegistry> m_registry;
    BasketEnvironment m_env;
    bool m_visible = false;
    QVector<QPointer<BasketController>> m_listed;
    PickCallback m_onPick;
};

} // namespace PlasmaBaskets
