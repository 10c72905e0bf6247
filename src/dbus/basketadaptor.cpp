// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "basketadaptor.h"
#include "dbushelpers.h"
#include "../core/basketstate.h"
#include "../core/droppeditem.h"
#include "../core/logging.h"
#include "../daemon/basketcontroller.h"
#include "../daemon/basketcoordinator.h"
#include "../daemon/basketregistry.h"
#include "../daemon/operationguards.h"
#include "../daemon/pointertracker.h"

namespace PlasmaBaskets {

BasketAdaptor::BasketAdaptor(BasketCoordinator* coordinator, BasketRegistry* registry, PointerTracker* pointer,
                             OperationGuards* guards, QObject* parent)
    : QDBusAbstractAdaptor(parent)
    , m_coordinator(coordinator)
    , m_registry(registry)
    , m_pointer(pointer)
    , m_guards(guards)
{
    Q_ASSERT(coordinator);
    Q_ASSERT(registry);
    Q_ASSERT(pointer);
    Q_ASSERT(guards);

    connect(m_registry, &BasketRegistry::basketVisibilityChanged, this, &BasketAdaptor::basketVisibilityChanged);
    connect(m_registry, &BasketRegistry::basketAdded, this, &BasketAdaptor::basketAdded);
    connect(m_registry, &BasketRegistry::basketRemoved, this, &BasketAdaptor::basketRemoved);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Items
// ═══════════════════════════════════════════════════════════════════════════════

QString BasketAdaptor::addItems(const QStringList& locators, bool atLastPosition)
{
    const auto urls = DbusHelpers::parseLocators(locators, QStringLiteral("addItems"));
    if (!urls) {
        return QString();
    }

    BasketController* basket = m_coordinator->addItemsFromExternalSource(*urls, atLastPosition);
    return basket ? basket->basketId() : QString();
}

QString BasketAdaptor::addTemporaryItem(const QString& locator, bool atLastPosition)
{
    const auto url = DbusHelpers::parseLocator(locator, QStringLiteral("addTemporaryItem"));
    if (!url) {
        return QString();
    }

    BasketController* basket = m_coordinator->addItemFromExternalSource(DroppedItem(*url, true), atLastPosition);
    return basket ? basket->basketId() : QString();
}

bool BasketAdaptor::removeItem(const QString& basketId, const QString& locator)
{
    BasketController* basket = basketFor(basketId, "removeItem");
    const auto url = DbusHelpers::parseLocator(locator, QStringLiteral("removeItem"));
    if (!basket || !url) {
        return false;
    }

    const std::optional<DroppedItem> item = basket->state()->itemByUrl(*url);
    if (!item) {
        qCDebug(lcDbus) << "removeItem: basket" << basketId << "does not hold" << *url;
        return false;
    }
    return basket->state()->removeItem(item->id());
}

bool BasketAdaptor::clearBasket(const QString& basketId)
{
    BasketController* basket = basketFor(basketId, "clearBasket");
    if (!basket) {
        return false;
    }
    basket->state()->clearAll();
    return true;
}

bool BasketAdaptor::replaceItem(const QString& basketId, const QString& oldLocator, const QString& newLocator,
                                bool temporary)
{
    BasketController* basket = basketFor(basketId, "replaceItem");
    const auto oldUrl = DbusHelpers::parseLocator(oldLocator, QStringLiteral("replaceItem"));
    const auto newUrl = DbusHelpers::parseLocator(newLocator, QStringLiteral("replaceItem"));
    if (!basket || !oldUrl || !newUrl) {
        return false;
    }

    const std::optional<DroppedItem> old = basket->state()->itemByUrl(*oldUrl);
    if (!old) {
        qCDebug(lcDbus) << "replaceItem: basket" << basketId << "does not hold" << *oldUrl;
        return false;
    }
    // Locators stay unique within a basket
    if (*newUrl != *oldUrl && basket->state()->containsUrl(*newUrl)) {
        qCWarning(lcDbus) << "Cannot replaceItem - basket" << basketId << "already holds" << *newUrl;
        return false;
    }
    return basket->state()->replaceItem(old->id(), DroppedItem(*newUrl, temporary));
}

bool BasketAdaptor::replaceItems(const QString& basketId, const QStringList& oldLocators, const QString& newLocator,
                                 bool temporary)
{
    BasketController* basket = basketFor(basketId, "replaceItems");
    const auto oldUrls = DbusHelpers::parseLocators(oldLocators, QStringLiteral("replaceItems"));
    const auto newUrl = DbusHelpers::parseLocator(newLocator, QStringLiteral("replaceItems"));
    if (!basket || !oldUrls || !newUrl) {
        return false;
    }

    QList<QUuid> oldIds;
    for (const QUrl& url : *oldUrls) {
        if (const std::optional<DroppedItem> item = basket->state()->itemByUrl(url)) {
            oldIds.append(item->id());
        }
    }
    if (oldIds.isEmpty()) {
        qCWarning(lcDbus) << "Cannot replaceItems - basket" << basketId << "holds none of" << oldLocators;
        return false;
    }
    return basket->state()->replaceItems(oldIds, DroppedItem(*newUrl, temporary));
}

bool BasketAdaptor::moveItem(const QString& locator, const QString& fromBasketId, const QString& toBasketId)
{
    const auto url = DbusHelpers::parseLocator(locator, QStringLiteral("moveItem"));
    if (!url) {
        return false;
    }
    return m_registry->moveItem(*url, fromBasketId, toBasketId);
}

BasketController* BasketAdaptor::basketFor(const QString& basketId, const char* operation) const
{
    if (basketId.isEmpty()) {
        qCWarning(lcDbus) << "Cannot" << operation << "- empty basket ID";
        return nullptr;
    }
    BasketController* basket = m_registry->basketById(basketId);
    if (!basket) {
        qCWarning(lcDbus) << "Cannot" << operation << "- unknown basket" << basketId;
    }
    return basket;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Drag session
// ═══════════════════════════════════════════════════════════════════════════════

void BasketAdaptor::dragStarted()
{
    qCDebug(lcDbus) << "Drag started";
    m_coordinator->onDragStarted();
}

void BasketAdaptor::dragEnded()
{
    qCDebug(lcDbus) << "Drag ended";
    m_coordinator->onDragEnded();
}

void BasketAdaptor::jiggleDetected()
{
    m_coordinator->onJiggleDetected();
}

void BasketAdaptor::cursorMoved(int x, int y)
{
    m_pointer->updatePosition(QPoint(x, y));
}

void BasketAdaptor::closeAll()
{
    m_coordinator->closeAllBaskets();
}

bool BasketAdaptor::closeBasket(const QString& basketId)
{
    if (basketId.isEmpty()) {
        qCWarning(lcDbus) << "Cannot closeBasket - empty ID";
        return false;
    }
    return m_registry->closeBasket(basketId);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Operation guards
// ═══════════════════════════════════════════════════════════════════════════════

void BasketAdaptor::beginFileOperation()
{
    m_guards->beginFileOperation();
}

void BasketAdaptor::endFileOperation()
{
    m_guards->endFileOperation();
}

void BasketAdaptor::setSharingInProgress(bool sharing)
{
    m_guards->setSharingInProgress(sharing);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Queries
// ═══════════════════════════════════════════════════════════════════════════════

int BasketAdaptor::basketCount()
{
    return m_registry->count();
}

QStringList BasketAdaptor::basketIds()
{
    QStringList ids;
    for (BasketController* basket : m_registry->allBaskets()) {
        ids.append(basket->basketId());
    }
    return ids;
}

QStringList BasketAdaptor::visibleBasketIds()
{
    QStringList ids;
    for (BasketController* basket : m_registry->visibleBaskets()) {
        ids.append(basket->basketId());
    }
    return ids;
}

int BasketAdaptor::itemCount(const QString& basketId)
{
    BasketController* basket = m_registry->basketById(basketId);
    if (!basket) {
        qCWarning(lcDbus) << "Cannot itemCount - unknown basket" << basketId;
        return -1;
    }
    return basket->state()->count();
}

} // namespace PlasmaBaskets
