// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "basketregistry.h"
#include "basketcontroller.h"
#include "../core/logging.h"
#include <QUuid>

namespace PlasmaBaskets {

BasketRegistry::BasketRegistry(const BasketEnvironment& environment, QObject* parent)
    : QObject(parent)
    , m_env(environment)
{
    Q_ASSERT(m_env.isComplete());

    m_primary = createBasket(PrimaryBasketId, AccentPalette::nextColor(0), true);

    connect(m_env.settings, &ISettings::multiBasketEnabledChanged, this,
            &BasketRegistry::onMultiBasketEnabledChanged);
    connect(m_env.settings, &ISettings::powerFoldersEnabledChanged, this,
            &BasketRegistry::onPowerFoldersEnabledChanged);
}

BasketRegistry::~BasketRegistry() = default;

// ═══════════════════════════════════════════════════════════════════════════════
// Queries
// ═══════════════════════════════════════════════════════════════════════════════

QVector<BasketController*> BasketRegistry::allBaskets() const
{
    QVector<BasketController*> baskets;
    baskets.reserve(count());
    baskets.append(m_primary);
    baskets.append(m_spawned);
    return baskets;
}

QVector<BasketController*> BasketRegistry::visibleBaskets() const
{
    QVector<BasketController*> visible;
    for (BasketController* basket : allBaskets()) {
        if (basket->isVisible()) {
            visible.append(basket);
        }
    }
    return visible;
}

BasketController* BasketRegistry::basketById(const QString& basketId) const
{
    for (BasketController* basket : allBaskets()) {
        if (basket->basketId() == basketId) {
            return basket;
        }
    }
    return nullptr;
}

BasketMode BasketRegistry::mode() const
{
    return m_env.settings->isMultiBasketEnabled() ? BasketMode::Multi : BasketMode::Single;
}

bool BasketRegistry::shouldShowAccentColors() const
{
    return visibleBaskets().size() >= 2;
}

bool BasketRegistry::isTransitionInFlight() const
{
    for (BasketController* basket : allBaskets()) {
        if (basket->isShowingOrHiding()) {
            return true;
        }
    }
    return false;
}

RegistrySnapshot BasketRegistry::snapshot(bool isDragInProgress, bool isSwitcherShown) const
{
    RegistrySnapshot snapshot;
    snapshot.mode = mode();
    snapshot.isDragInProgress = isDragInProgress;
    snapshot.isSwitcherShown = isSwitcherShown;

    for (BasketController* basket : allBaskets()) {
        BasketSnapshot entry;
        entry.basketId = basket->basketId();
        entry.isPrimary = basket->isPrimary();
        entry.visibility = basket->visibility();
        entry.isEmpty = basket->isEmpty();
        entry.isShowingOrHiding = basket->isShowingOrHiding();
        if (IBasketSurface* surface = basket->surface()) {
            entry.stackingOrder = surface->stackingOrder();
            entry.isActive = surface->isActive();
        }
        snapshot.baskets.append(entry);
    }
    return snapshot;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════════

BasketController* BasketRegistry::createBasket(const QString& basketId, BasketAccentColor accent, bool isPrimary)
{
    auto* basket = new BasketController(basketId, accent, isPrimary, m_env, this);

    connect(basket, &BasketController::visibilityChanged, this, [this, basket](BasketVisibility visibility) {
        Q_EMIT basketVisibilityChanged(basket->basketId(), visibility == BasketVisibility::Visible);
        updateAccentVisibility();
    });
    connect(basket, &BasketController::hoverExited, this, [this, basket]() {
        handleHoverExit(basket);
    });
    connect(basket, &BasketController::closeRequested, this, [this, basket]() {
        closeBasket(basket->basketId());
    });

    return basket;
}

BasketController* BasketRegistry::spawn(const QPoint& at)
{
    if (!isMultiMode()) {
        qCDebug(lcRegistry) << "Spawn suppressed in single basket mode";
        return m_primary;
    }

    // An existing basket must not auto-hide while the new one materializes
    for (BasketController* basket : allBaskets()) {
        basket->cancelHideTimer();
    }

    const BasketAccentColor accent = AccentPalette::nextColor(count());
    const QString basketId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    BasketController* basket = createBasket(basketId, accent, false);
    m_spawned.append(basket);
    Q_EMIT basketAdded(basketId);

    qCInfo(lcRegistry) << "Spawned basket" << basketId << "accent" << AccentPalette::name(accent) << "total"
                       << count();

    basket->show(at);
    return basket;
}

int BasketRegistry::enforceSingleMode()
{
    if (m_spawned.isEmpty()) {
        return 0;
    }

    Q_EMIT switcherDismissRequested();

    const QVector<BasketController*> drained = m_spawned;
    bool anySpawnedVisible = false;
    int appended = 0;

    for (BasketController* basket : drained) {
        anySpawnedVisible = anySpawnedVisible || basket->isVisible();
        appended += m_primary->state()->mergeFrom(*basket->state());
        basket->teardown();
    }

    m_spawned.clear();
    for (BasketController* basket : drained) {
        disconnect(basket, nullptr, this, nullptr);
        Q_EMIT basketRemoved(basket->basketId());
        basket->deleteLater();
    }

    qCInfo(lcRegistry) << "Merged" << drained.size() << "baskets into primary," << appended << "items appended";

    if (anySpawnedVisible && !m_primary->isEmpty()) {
        m_primary->show(std::nullopt, true);
    }
    updateAccentVisibility();
    return appended;
}

void BasketRegistry::closeAll(bool force)
{
    Q_EMIT switcherDismissRequested();

    for (BasketController* basket : allBaskets()) {
        if (!basket->hide(force)) {
            qCDebug(lcRegistry) << "Close skipped for" << basket->basketId();
        }
    }
    qCInfo(lcRegistry) << "Closed all baskets";
}

bool BasketRegistry::closeBasket(const QString& basketId)
{
    BasketController* basket = basketById(basketId);
    if (!basket) {
        qCWarning(lcRegistry) << "Close requested for unknown basket" << basketId;
        return false;
    }

    if (!basket->hide(true)) {
        return false;
    }
    if (basket->isPrimary()) {
        return true;
    }

    if (basket->isShowingOrHiding()) {
        connect(
            basket, &BasketController::transitionFinished, this,
            [this, basketId]() {
                unregisterBasket(basketId);
            },
            Qt::SingleShotConnection);
    } else {
        unregisterBasket(basketId);
    }
    return true;
}

void BasketRegistry::unregisterBasket(const QString& basketId)
{
    for (int i = 0; i < m_spawned.size(); ++i) {
        BasketController* basket = m_spawned.at(i);
        if (basket->basketId() != basketId) {
            continue;
        }

        m_spawned.removeAt(i);
        basket->teardown();
        disconnect(basket, nullptr, this, nullptr);
        basket->deleteLater();

        qCInfo(lcRegistry) << "Closed basket" << basketId << "remaining" << count();
        Q_EMIT basketRemoved(basketId);
        updateAccentVisibility();
        return;
    }
}

bool BasketRegistry::moveItem(const QUrl& url, const QString& fromBasketId, const QString& toBasketId)
{
    BasketController* source = basketById(fromBasketId);
    BasketController* target = basketById(toBasketId);
    if (!source || !target) {
        qCWarning(lcRegistry) << "Move requested between unknown baskets" << fromBasketId << toBasketId;
        return false;
    }
    if (source == target) {
        return false;
    }

    const std::optional<DroppedItem> item = source->state()->itemByUrl(url);
    if (!item || target->state()->containsUrl(url)) {
        qCDebug(lcRegistry) << "Nothing to move for" << url << "from" << fromBasketId << "to" << toBasketId;
        return false;
    }

    source->state()->removeItemForTransfer(item->id());
    target->state()->addItem(*item);
    qCInfo(lcRegistry) << "Moved" << url << "from" << fromBasketId << "to" << toBasketId;
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Reactions
// ═══════════════════════════════════════════════════════════════════════════════

void BasketRegistry::onDisplayTopologyChanged()
{
    for (BasketController* basket : allBaskets()) {
        // A basket never shown has no display to lose
        if (basket->lastFrame().isValid()) {
            basket->updateDisplayAffinity();
        }
    }
}

void BasketRegistry::handleHoverExit(BasketController* basket)
{
    const QPoint pointer = m_env.pointer->pointerPosition();
    for (BasketController* sibling : allBaskets()) {
        if (sibling != basket && sibling->containsPoint(pointer)) {
            return;
        }
    }
    basket->requestHideTimer();
}

void BasketRegistry::updateAccentVisibility()
{
    const bool shown = shouldShowAccentColors();
    for (BasketController* basket : allBaskets()) {
        basket->setAccentShown(shown);
    }
}

void BasketRegistry::onMultiBasketEnabledChanged()
{
    if (!m_env.settings->isMultiBasketEnabled()) {
        qCInfo(lcRegistry) << "Multi basket mode disabled, merging";
        enforceSingleMode();
    }
}

void BasketRegistry::onPowerFoldersEnabledChanged()
{
    const bool enabled = m_env.settings->isPowerFoldersEnabled();
    for (BasketController* basket : allBaskets()) {
        basket->state()->setPowerFoldersEnabled(enabled);
    }
}

} // namespace PlasmaBaskets
