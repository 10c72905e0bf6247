// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "plasmabaskets_export.h"
#include <QDBusAbstractAdaptor>
#include <QObject>
#include <QString>
#include <QStringList>

namespace PlasmaBaskets {

class BasketController;
class BasketCoordinator;
class BasketRegistry;
class OperationGuards;
class PointerTracker;

/**
 * @brief D-Bus adaptor for basket lifecycle
 *
 * Provides D-Bus interface: org.plasmabaskets.Basket
 *
 * Receives drag and gesture events from the compositor script, item
 * deliveries from file managers and other clients, and the operation guards
 * that keep a basket on screen while its contents are being used.
 */
class PLASMABASKETS_EXPORT BasketAdaptor : public QDBusAbstractAdaptor
{
    Q_OBJECT
    Q_CLASSINFO("D-Bus Interface", "org.plasmabaskets.Basket")

public:
    explicit BasketAdaptor(BasketCoordinator* coordinator, BasketRegistry* registry, PointerTracker* pointer,
                           OperationGuards* guards, QObject* parent = nullptr);
    ~BasketAdaptor() override = default;

public Q_SLOTS:
    /**
     * Deliver items to the basket the router picks
     * @param locators File URLs, remote URLs or absolute local paths
     * @param atLastPosition Reveal the basket where it was last shown instead of at the pointer
     * @return Id of the basket that received the items, empty on rejection
     */
    QString addItems(const QStringList& locators, bool atLastPosition);

    /**
     * Deliver a file created for the basket (conversion output, archive).
     * The file is deleted when the item is removed from the basket, provided
     * it lives under the daemon's temporary storage directory.
     * @return Id of the basket that received the item, empty on rejection
     */
    QString addTemporaryItem(const QString& locator, bool atLastPosition);

    bool removeItem(const QString& basketId, const QString& locator);

    /**
     * Remove every item except pinned folders
     */
    bool clearBasket(const QString& basketId);

    /**
     * Swap one item for a converted copy, keeping its place and selection
     * @param temporary Whether the new file was created for the basket
     */
    bool replaceItem(const QString& basketId, const QString& oldLocator, const QString& newLocator,
                     bool temporary);

    /**
     * Swap several items for one new item (e.g. an archive of them)
     */
    bool replaceItems(const QString& basketId, const QStringList& oldLocators, const QString& newLocator,
                      bool temporary);

    bool moveItem(const QString& locator, const QString& fromBasketId, const QString& toBasketId);

    // Drag session from the compositor
    void dragStarted();
    void dragEnded();
    void jiggleDetected();

    /**
     * Pointer position in global coordinates
     * @note int32 to match the compositor's QPoint
     */
    void cursorMoved(int x, int y);

    void closeAll();

    /**
     * Close one basket. Spawned baskets are unregistered once hidden,
     * the primary basket is only hidden.
     */
    bool closeBasket(const QString& basketId);

    // Operation guards
    void beginFileOperation();
    void endFileOperation();
    void setSharingInProgress(bool sharing);

    // Queries
    int basketCount();
    QStringList basketIds();
    QStringList visibleBasketIds();
    int itemCount(const QString& basketId);

Q_SIGNALS:
    void basketVisibilityChanged(const QString& basketId, bool visible);
    void basketAdded(const QString& basketId);
    void basketRemoved(const QString& basketId);

private:
    BasketController* basketFor(const QString& basketId, const char* operation) const;

    BasketCoordinator* m_coordinator;
    BasketRegistry* m_registry;
    PointerTracker* m_pointer;
    OperationGuards* m_guards;
};

} // namespace PlasmaBaskets
