// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QSignalSpy>

#include "daemon/basketcontroller.h"
#include "daemon/basketregistry.h"
#include "fakes.h"

using namespace PlasmaBaskets;

/**
 * @brief Unit tests for BasketRegistry
 *
 * Tests cover:
 * - The primary basket exists from construction and is never removed
 * - Spawn accents, ids and signals; spawn suppressed in Single mode
 * - Accent colors shown only while two or more baskets are visible
 * - closeBasket() unregistering after the hide transition finishes
 * - closeAll() honoring the force flag
 * - Hover-exit deferring to a sibling under the pointer
 * - Snapshot contents and power folder setting propagation
 * - Moving an item between baskets
 * - Display affinity refreshed on topology changes
 */
class TestBasketRegistry : public QObject
{
    Q_OBJECT

private:
    static QUrl remote(const QString& name)
    {
        return QUrl(QStringLiteral("https://example.org/") + name);
    }

private Q_SLOTS:
    // ═══════════════════════════════════════════════════════════════════════════
    // Construction and spawn
    // ═══════════════════════════════════════════════════════════════════════════

    void testPrimary_existsFromStart()
    {
        FakeEnvironment fakes;
        BasketRegistry registry(fakes.environment());

        QVERIFY(registry.primary());
        QCOMPARE(registry.primary()->basketId(), BasketRegistry::PrimaryBasketId);
        QCOMPARE(registry.primary()->accent(), BasketAccentColor::Teal);
        QVERIFY(registry.primary()->isPrimary());
        QCOMPARE(registry.count(), 1);
        QVERIFY(!registry.primary()->isVisible());
    }

    void testSpawn_assignsNextAccentAndShows()
    {
        FakeEnvironment fakes;
        BasketRegistry registry(fakes.environment());
        QSignalSpy added(&registry, &BasketRegistry::basketAdded);

        BasketController* first = registry.spawn(QPoint(600, 500));
        fakes.presentation.completeAll();
        BasketController* second = registry.spawn(QPoint(1200, 500));
        fakes.presentation.completeAll();

        QCOMPARE(first->accent(), BasketAccentColor::Coral);
        QCOMPARE(second->accent(), BasketAccentColor::Indigo);
        QVERIFY(!first->isPrimary());
        QVERIFY(first->basketId() != second->basketId());
        QCOMPARE(registry.count(), 3);
        QCOMPARE(added.count(), 2);
        QVERIFY(first->isVisible());
        QCOMPARE(registry.basketById(second->basketId()), second);
    }

    void testSpawn_cancelsSiblingDeadlines()
    {
        FakeEnvironment fakes;
        fakes.settings.setAutoHideEnabled(true);
        BasketRegistry registry(fakes.environment());
        registry.primary()->show();
        fakes.presentation.completeAll();
        registry.primary()->state()->addItems({remote(QStringLiteral("a"))});
        registry.primary()->requestHideTimer(0);
        QVERIFY(registry.primary()->hideDeadline().has_value());

        registry.spawn(QPoint(1500, 500));
        QVERIFY(!registry.primary()->hideDeadline().has_value());
    }

    void testSpawn_suppressedInSingleMode()
    {
        FakeEnvironment fakes;
        fakes.settings.setMultiBasketEnabled(false);
        BasketRegistry registry(fakes.environment());

        QCOMPARE(registry.spawn(QPoint(600, 500)), registry.primary());
        QCOMPARE(registry.count(), 1);
        QCOMPARE(registry.mode(), BasketMode::Single);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Accent visibility
    // ═══════════════════════════════════════════════════════════════════════════

    void testAccent_shownWithTwoVisible()
    {
        FakeEnvironment fakes;
        BasketRegistry registry(fakes.environment());

        registry.primary()->show(QPoint(400, 500));
        fakes.presentation.completeAll();
        QVERIFY(!registry.shouldShowAccentColors());
        QVERIFY(!registry.primary()->isAccentShown());

        BasketController* spawned = registry.spawn(QPoint(1400, 500));
        fakes.presentation.completeAll();
        QVERIFY(registry.shouldShowAccentColors());
        QVERIFY(registry.primary()->isAccentShown());
        QVERIFY(spawned->isAccentShown());
        QVERIFY(static_cast<FakeSurface*>(spawned->surface())->accentShown);

        spawned->hide(true);
        QVERIFY(!registry.primary()->isAccentShown());
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Closing
    // ═══════════════════════════════════════════════════════════════════════════

    void testCloseBasket_unregistersAfterTransition()
    {
        FakeEnvironment fakes;
        BasketRegistry registry(fakes.environment());
        BasketController* spawned = registry.spawn(QPoint(1400, 500));
        fakes.presentation.completeAll();
        spawned->state()->addItems({remote(QStringLiteral("a"))});
        const QString id = spawned->basketId();

        QSignalSpy removed(&registry, &BasketRegistry::basketRemoved);
        QVERIFY(registry.closeBasket(id));

        // Still registered while the hide animation runs
        QCOMPARE(registry.count(), 2);
        QCOMPARE(removed.count(), 0);

        fakes.presentation.completeAll();
        QCOMPARE(registry.count(), 1);
        QCOMPARE(removed.count(), 1);
        QVERIFY(!registry.basketById(id));
    }

    void testCloseBasket_hiddenSpawnUnregistersImmediately()
    {
        FakeEnvironment fakes;
        BasketRegistry registry(fakes.environment());
        BasketController* spawned = registry.spawn(QPoint(1400, 500));
        fakes.presentation.completeAll();
        spawned->hide(true);
        fakes.presentation.completeAll();

        QVERIFY(registry.closeBasket(spawned->basketId()));
        QCOMPARE(registry.count(), 1);
    }

    void testCloseBasket_primaryOnlyHides()
    {
        FakeEnvironment fakes;
        BasketRegistry registry(fakes.environment());
        registry.primary()->show();
        fakes.presentation.completeAll();

        QVERIFY(registry.closeBasket(BasketRegistry::PrimaryBasketId));
        fakes.presentation.completeAll();
        QCOMPARE(registry.count(), 1);
        QVERIFY(!registry.primary()->isVisible());
    }

    void testCloseBasket_unknownId()
    {
        FakeEnvironment fakes;
        BasketRegistry registry(fakes.environment());
        QVERIFY(!registry.closeBasket(QStringLiteral("nope")));
    }

    void testCloseRequested_fromSurface()
    {
        FakeEnvironment fakes;
        BasketRegistry registry(fakes.environment());
        BasketController* spawned = registry.spawn(QPoint(1400, 500));
        fakes.presentation.completeAll();

        static_cast<FakeSurface*>(spawned->surface())->events()->handleCloseRequested();
        fakes.presentation.completeAll();
        QCOMPARE(registry.count(), 1);
    }

    void testCloseAll_forceAndGuards()
    {
        FakeEnvironment fakes;
        BasketRegistry registry(fakes.environment());
        registry.primary()->show(QPoint(400, 500));
        fakes.presentation.completeAll();
        registry.primary()->state()->addItems({remote(QStringLiteral("a"))});
        BasketController* spawned = registry.spawn(QPoint(1400, 500));
        fakes.presentation.completeAll();
        fakes.guards.sharing = true;

        QSignalSpy dismiss(&registry, &BasketRegistry::switcherDismissRequested);
        registry.closeAll(false);
        fakes.presentation.completeAll();

        // Empty spawned basket hides, the guarded primary stays
        QVERIFY(registry.primary()->isVisible());
        QVERIFY(!spawned->isVisible());
        QCOMPARE(dismiss.count(), 1);

        registry.closeAll(true);
        fakes.presentation.completeAll();
        QVERIFY(registry.visibleBaskets().isEmpty());
        // Closing hides; spawned baskets remain registered with their items
        QCOMPARE(registry.count(), 2);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Hover exit
    // ═══════════════════════════════════════════════════════════════════════════

    void testHoverExit_siblingUnderPointerSkipsTimer()
    {
        FakeEnvironment fakes;
        fakes.settings.setAutoHideEnabled(true);
        BasketRegistry registry(fakes.environment());
        registry.primary()->show(QPoint(400, 500));
        fakes.presentation.completeAll();
        registry.primary()->state()->addItems({remote(QStringLiteral("a"))});
        BasketController* spawned = registry.spawn(QPoint(1400, 500));
        fakes.presentation.completeAll();

        // Pointer moved straight into the sibling
        fakes.pointer.position = QPoint(1400, 500);
        registry.primary()->onHoverExit();
        QVERIFY(!registry.primary()->hideDeadline().has_value());
        QVERIFY(spawned->containsPoint(fakes.pointer.position));

        // Pointer left for empty desktop
        fakes.pointer.position = QPoint(50, 1050);
        registry.primary()->onHoverExit();
        QVERIFY(registry.primary()->hideDeadline().has_value());
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Snapshot and settings
    // ═══════════════════════════════════════════════════════════════════════════

    void testSnapshot_reflectsBaskets()
    {
        FakeEnvironment fakes;
        BasketRegistry registry(fakes.environment());
        registry.primary()->show();
        BasketController* spawned = registry.spawn(QPoint(1400, 500));
        spawned->state()->addItems({remote(QStringLiteral("a"))});

        const RegistrySnapshot snapshot = registry.snapshot(true, false);
        QCOMPARE(snapshot.baskets.size(), 2);
        QVERIFY(snapshot.baskets.at(0).isPrimary);
        QVERIFY(snapshot.baskets.at(0).isShowingOrHiding);
        QVERIFY(!snapshot.baskets.at(1).isEmpty);
        QVERIFY(snapshot.baskets.at(1).stackingOrder > snapshot.baskets.at(0).stackingOrder);
        QVERIFY(snapshot.isDragInProgress);
        QCOMPARE(snapshot.spawnedCount(), 1);
        QVERIFY(registry.isTransitionInFlight());

        fakes.presentation.completeAll();
        QVERIFY(!registry.isTransitionInFlight());
    }

    void testPowerFolderSetting_propagates()
    {
        FakeEnvironment fakes;
        BasketRegistry registry(fakes.environment());
        BasketController* spawned = registry.spawn(QPoint(1400, 500));

        fakes.settings.setPowerFoldersEnabled(false);
        QVERIFY(!registry.primary()->state()->isPowerFoldersEnabled());
        QVERIFY(!spawned->state()->isPowerFoldersEnabled());
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Moving items and display topology
    // ═══════════════════════════════════════════════════════════════════════════

    void testMoveItem_keepsIdentityAndFlags()
    {
        FakeEnvironment fakes;
        BasketRegistry registry(fakes.environment());
        BasketController* spawned = registry.spawn(QPoint(1400, 500));
        BasketState* source = registry.primary()->state();

        DroppedItem item(remote(QStringLiteral("report.pdf")), false, true);
        item.setPinned(true);
        QVERIFY(source->addItem(item));

        QVERIFY(registry.moveItem(item.url(), BasketRegistry::PrimaryBasketId, spawned->basketId()));
        QVERIFY(source->isEmpty());

        const std::optional<DroppedItem> moved = spawned->state()->itemByUrl(item.url());
        QVERIFY(moved.has_value());
        QCOMPARE(moved->id(), item.id());
        QVERIFY(moved->isPinned());
        QVERIFY(moved->isTemporary());
    }

    void testMoveItem_rejected()
    {
        FakeEnvironment fakes;
        BasketRegistry registry(fakes.environment());
        BasketController* spawned = registry.spawn(QPoint(1400, 500));
        registry.primary()->state()->addItems({remote(QStringLiteral("a"))});
        spawned->state()->addItems({remote(QStringLiteral("a"))});

        // Target already holds the locator
        QVERIFY(!registry.moveItem(remote(QStringLiteral("a")), BasketRegistry::PrimaryBasketId, spawned->basketId()));
        QCOMPARE(registry.primary()->state()->count(), 1);

        // Source does not hold it, same basket, unknown basket
        QVERIFY(!registry.moveItem(remote(QStringLiteral("b")), BasketRegistry::PrimaryBasketId, spawned->basketId()));
        QVERIFY(!registry.moveItem(remote(QStringLiteral("a")), BasketRegistry::PrimaryBasketId,
                                   BasketRegistry::PrimaryBasketId));
        QVERIFY(!registry.moveItem(remote(QStringLiteral("a")), QStringLiteral("nope"), spawned->basketId()));
    }

    void testDisplayTopologyChanged_reresolvesShownBaskets()
    {
        FakeEnvironment fakes;
        fakes.displays.displays.append(DisplayDescriptor{QStringLiteral("HDMI-1"), QRect(1920, 0, 1920, 1080)});
        BasketRegistry registry(fakes.environment());
        BasketController* spawned = registry.spawn(QPoint(2800, 500));
        fakes.presentation.completeAll();
        QCOMPARE(spawned->displayId(), QStringLiteral("HDMI-1"));
        QVERIFY(registry.primary()->displayId().isEmpty());

        fakes.displays.displays.removeLast();
        fakes.pointer.position = QPoint(300, 300);
        registry.onDisplayTopologyChanged();

        QCOMPARE(spawned->displayId(), QStringLiteral("DP-1"));
        // Never shown, so nothing to re-resolve
        QVERIFY(registry.primary()->displayId().isEmpty());
    }
};

QTEST_MAIN(TestBasketRegistry)
#include "test_basket_registry.moc"
