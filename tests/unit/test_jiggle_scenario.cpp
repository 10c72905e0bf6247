// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QSignalSpy>

#include "daemon/basketcontroller.h"
#include "daemon/basketcoordinator.h"
#include "daemon/basketregistry.h"
#include "daemon/basketswitchercontroller.h"
#include "core/geometryutils.h"
#include "fakes.h"

using namespace PlasmaBaskets;

/**
 * @brief End-to-end drag gesture scenarios through BasketCoordinator
 *
 * Tests cover:
 * - First jiggle reveals the primary, second spawns, third opens the chooser
 * - Picking and dropping on "new basket" in the chooser
 * - Chooser window failures and the per-entry hide action
 * - Reveal of hidden baskets with items followed by the chooser
 * - Drag end hiding empty baskets after the settle delay, deferred while a
 *   basket is still animating
 * - Inbound items routing, including single temporary items
 * - Closing everything
 */
class TestJiggleScenario : public QObject
{
    Q_OBJECT

private:
    static QUrl remote(const QString& name)
    {
        return QUrl(QStringLiteral("https://example.org/") + name);
    }

    struct Fixture
    {
        FakeEnvironment fakes;
        BasketRegistry registry{fakes.environment()};
        BasketSwitcherController switcher{&registry, fakes.environment()};
        BasketCoordinator coordinator{&registry, &switcher, fakes.environment()};

        void jiggle()
        {
            coordinator.onJiggleDetected();
            fakes.presentation.completeAll();
        }
    };

private Q_SLOTS:
    // ═══════════════════════════════════════════════════════════════════════════
    // Reveal, spawn, chooser
    // ═══════════════════════════════════════════════════════════════════════════

    void testThreeJiggles_revealSpawnChooser()
    {
        Fixture f;
        f.coordinator.onDragStarted();

        f.jiggle();
        QVERIFY(f.registry.primary()->isVisible());
        QCOMPARE(f.registry.primary()->frame(), GeometryUtils::basketFrameAt(QPoint(500, 500)));
        QCOMPARE(f.registry.count(), 1);

        f.jiggle();
        QCOMPARE(f.registry.count(), 2);
        BasketController* spawned = f.registry.spawned().first();
        QCOMPARE(spawned->accent(), BasketAccentColor::Coral);
        QVERIFY(spawned->isVisible());
        QVERIFY(spawned->surface()->stackingOrder() > f.registry.primary()->surface()->stackingOrder());

        f.jiggle();
        QVERIFY(f.switcher.isVisible());
        QCOMPARE(f.fakes.presentation.switcherEntries.size(), 2);
        QCOMPARE(f.fakes.presentation.switcherEntries.at(0).basketId, BasketRegistry::PrimaryBasketId);
        QCOMPARE(f.fakes.presentation.switcherEntries.at(1).accent, BasketAccentColor::Coral);
        QCOMPARE(f.registry.count(), 2);

        // Listed baskets fade out while the chooser is up
        QCOMPARE(static_cast<FakeSurface*>(spawned->surface())->opacity, 0.0);

        // Further jiggles are ignored while the chooser is shown
        f.jiggle();
        QCOMPARE(f.fakes.presentation.switcherShowCount, 1);
        QCOMPARE(f.registry.count(), 2);
    }

    void testJiggle_ignoredWithoutDrag()
    {
        Fixture f;
        f.jiggle();
        QVERIFY(!f.registry.primary()->isVisible());
        QCOMPARE(f.fakes.presentation.animateInCount, 0);
    }

    void testJiggle_duringTransitionDropped()
    {
        Fixture f;
        f.coordinator.onDragStarted();
        f.coordinator.onJiggleDetected();
        f.coordinator.onJiggleDetected();
        f.fakes.presentation.completeAll();

        QCOMPARE(f.registry.count(), 1);
        QCOMPARE(f.fakes.presentation.animateInCount, 1);
    }

    void testChooser_pickRaisesBasket()
    {
        Fixture f;
        QSignalSpy chosen(&f.coordinator, &BasketCoordinator::basketChosen);
        f.coordinator.onDragStarted();
        f.jiggle();
        f.jiggle();
        f.jiggle();

        const int orderBefore = f.registry.primary()->surface()->stackingOrder();
        f.fakes.presentation.switcherEvents->onSwitcherPicked(BasketRegistry::PrimaryBasketId);

        QVERIFY(!f.switcher.isVisible());
        QCOMPARE(chosen.count(), 1);
        QVERIFY(f.registry.primary()->surface()->stackingOrder() > orderBefore);
        QCOMPARE(static_cast<FakeSurface*>(f.registry.primary()->surface())->opacity, 1.0);
    }

    void testChooser_dropOnNewBasket()
    {
        Fixture f;
        f.coordinator.onDragStarted();
        f.jiggle();
        f.jiggle();
        f.jiggle();

        f.fakes.presentation.switcherEvents->onSwitcherDroppedOnNewBasket(
            {remote(QStringLiteral("x")), remote(QStringLiteral("y"))});

        QVERIFY(!f.switcher.isVisible());
        QCOMPARE(f.registry.count(), 3);
        BasketController* created = f.registry.spawned().last();
        QCOMPARE(created->state()->count(), 2);
        QCOMPARE(created->accent(), BasketAccentColor::Indigo);
    }

    void testChooser_dismissed()
    {
        Fixture f;
        f.coordinator.onDragStarted();
        f.jiggle();
        f.jiggle();
        f.jiggle();

        f.fakes.presentation.switcherEvents->onSwitcherDismissed();
        QVERIFY(!f.switcher.isVisible());
        QVERIFY(!f.fakes.presentation.isSwitcherShown());
        QCOMPARE(f.registry.visibleBaskets().size(), 2);
    }

    void testChooser_windowFailureRestoresBaskets()
    {
        Fixture f;
        f.registry.primary()->show(QPoint(400, 400));
        BasketController* spawned = f.registry.spawn(QPoint(1200, 400));
        f.fakes.presentation.completeAll();
        f.fakes.presentation.failSwitcherWindow = true;

        QVERIFY(!f.switcher.show({f.registry.primary(), spawned}, nullptr));
        QVERIFY(!f.switcher.isVisible());
        QVERIFY(f.switcher.listedBasketIds().isEmpty());
        QCOMPARE(static_cast<FakeSurface*>(spawned->surface())->opacity, 1.0);
        QCOMPARE(static_cast<FakeSurface*>(f.registry.primary()->surface())->opacity, 1.0);
    }

    void testChooser_windowAlreadyGoneOnHide()
    {
        Fixture f;
        f.coordinator.onDragStarted();
        f.jiggle();
        f.jiggle();
        f.jiggle();
        QVERIFY(f.switcher.isVisible());

        // The compositor closed the window behind our back
        f.fakes.presentation.hideSwitcher();
        QCOMPARE(f.fakes.presentation.switcherHideCount, 1);

        f.switcher.hide();
        QVERIFY(!f.switcher.isVisible());
        QCOMPARE(f.fakes.presentation.switcherHideCount, 1);
    }

    void testChooser_hideActionKeepsBasketState()
    {
        Fixture f;
        f.coordinator.onDragStarted();
        f.jiggle();
        f.jiggle();
        f.jiggle();
        BasketController* primary = f.registry.primary();
        primary->state()->addItems({remote(QStringLiteral("a"))});

        f.fakes.presentation.switcherEvents->onSwitcherHideRequested(BasketRegistry::PrimaryBasketId);
        f.fakes.presentation.completeAll();

        QVERIFY(!primary->isVisible());
        QVERIFY(primary->hasSurface());
        QCOMPARE(primary->state()->count(), 1);

        // One basket left: nothing to choose between
        QVERIFY(!f.switcher.isVisible());
        QVERIFY(!f.fakes.presentation.isSwitcherShown());
        QCOMPARE(static_cast<FakeSurface*>(f.registry.spawned().first()->surface())->opacity, 1.0);
    }

    void testChooser_hideActionRepresentsRemaining()
    {
        Fixture f;
        f.registry.primary()->show(QPoint(400, 400));
        BasketController* first = f.registry.spawn(QPoint(1000, 400));
        BasketController* second = f.registry.spawn(QPoint(1500, 400));
        f.fakes.presentation.completeAll();
        QVERIFY(f.switcher.show({f.registry.primary(), first, second}, nullptr));
        QCOMPARE(f.fakes.presentation.switcherEntries.size(), 3);

        f.fakes.presentation.switcherEvents->onSwitcherHideRequested(first->basketId());
        f.fakes.presentation.completeAll();

        QVERIFY(!first->isVisible());
        QVERIFY(f.switcher.isVisible());
        QCOMPARE(f.fakes.presentation.switcherShowCount, 2);
        QCOMPARE(f.fakes.presentation.switcherEntries.size(), 2);
        QCOMPARE(f.switcher.listedBasketIds(),
                 QStringList({BasketRegistry::PrimaryBasketId, second->basketId()}));
    }

    void testChooser_hideActionUnknownBasketIgnored()
    {
        Fixture f;
        f.coordinator.onDragStarted();
        f.jiggle();
        f.jiggle();
        f.jiggle();

        f.fakes.presentation.switcherEvents->onSwitcherHideRequested(QStringLiteral("nope"));
        QVERIFY(f.switcher.isVisible());
        QCOMPARE(f.switcher.listedBasketIds().size(), 2);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Hidden baskets with items
    // ═══════════════════════════════════════════════════════════════════════════

    void testJiggle_revealsHiddenBasketsSideBySide()
    {
        Fixture f;
        f.coordinator.onDragStarted();
        f.jiggle();
        f.jiggle();
        BasketController* spawned = f.registry.spawned().first();
        f.registry.primary()->state()->addItems({remote(QStringLiteral("a"))});
        spawned->state()->addItems({remote(QStringLiteral("b"))});

        f.coordinator.closeAllBaskets();
        f.fakes.presentation.completeAll();
        QVERIFY(f.registry.visibleBaskets().isEmpty());

        f.fakes.pointer.position = QPoint(900, 500);
        f.jiggle();

        const QVector<QPoint> slots = GeometryUtils::revealSlotCenters(QPoint(900, 500), 2);
        QVERIFY(f.registry.primary()->isVisible());
        QVERIFY(spawned->isVisible());
        QCOMPARE(f.registry.primary()->frame(), GeometryUtils::basketFrameAt(slots.at(0)));
        QCOMPARE(spawned->frame(), GeometryUtils::basketFrameAt(slots.at(1)));
        QVERIFY(!f.switcher.isVisible());
    }

    void testJiggle_revealThenChooserAfterDelay()
    {
        Fixture f;
        f.coordinator.onDragStarted();
        f.jiggle();
        f.jiggle();
        BasketController* spawned = f.registry.spawned().first();
        spawned->state()->addItems({remote(QStringLiteral("b"))});
        spawned->hide(true);
        f.fakes.presentation.completeAll();
        QCOMPARE(f.registry.visibleBaskets().size(), 1);

        f.jiggle();
        QVERIFY(spawned->isVisible());
        QVERIFY(!f.switcher.isVisible());
        QTRY_VERIFY(f.switcher.isVisible());
        QCOMPARE(f.fakes.presentation.switcherEntries.size(), 2);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Drag end, inbound items, close all
    // ═══════════════════════════════════════════════════════════════════════════

    void testDragEnded_hidesEmptyBasketsAfterSettle()
    {
        Fixture f;
        f.fakes.settings.setAutoHideEnabled(true);
        f.coordinator.onDragStarted();
        f.jiggle();
        f.jiggle();
        f.registry.primary()->state()->addItems({remote(QStringLiteral("a"))});

        f.coordinator.onDragEnded();
        QVERIFY(!f.coordinator.isDragInProgress());
        QVERIFY(f.registry.spawned().first()->isVisible());

        QTRY_VERIFY(!f.registry.spawned().first()->isVisible());
        QVERIFY(f.registry.primary()->isVisible());
    }

    void testDragEnded_newDragCancelsCleanup()
    {
        Fixture f;
        f.fakes.settings.setAutoHideEnabled(true);
        f.coordinator.onDragStarted();
        f.jiggle();

        f.coordinator.onDragEnded();
        f.coordinator.onDragStarted();
        QTest::qWait(Defaults::DragEndedSettleDelayMs + 100);
        QVERIFY(f.registry.primary()->isVisible());
    }

    void testDragEnded_cleanupWaitsForTransition()
    {
        Fixture f;
        f.fakes.settings.setAutoHideEnabled(true);
        f.coordinator.onDragStarted();
        f.jiggle();

        // Spawn animation left running
        f.coordinator.onJiggleDetected();
        QCOMPARE(f.registry.count(), 2);
        f.coordinator.onDragEnded();

        QTest::qWait(Defaults::DragEndedSettleDelayMs + 100);
        QVERIFY(f.registry.primary()->isVisible());

        f.fakes.presentation.completeAll();
        QTRY_VERIFY(!f.registry.primary()->isVisible());
    }

    void testInboundItems_goToFrontmostVisible()
    {
        Fixture f;
        f.coordinator.onDragStarted();
        f.jiggle();
        f.jiggle();
        f.coordinator.onDragEnded();
        BasketController* spawned = f.registry.spawned().first();

        BasketController* target =
            f.coordinator.addItemsFromExternalSource({remote(QStringLiteral("pasted"))}, false);
        QCOMPARE(target, spawned);
        QCOMPARE(spawned->state()->count(), 1);
    }

    void testInboundItems_hiddenPrimaryRevealedAtLastPosition()
    {
        Fixture f;
        f.registry.primary()->show(QPoint(300, 300));
        f.fakes.presentation.completeAll();
        f.registry.primary()->hide(true);
        f.fakes.presentation.completeAll();

        f.fakes.pointer.position = QPoint(1500, 800);
        BasketController* target = f.coordinator.addItemsFromExternalSource({remote(QStringLiteral("a"))}, true);
        QCOMPARE(target, f.registry.primary());
        QVERIFY(target->isVisible());
        QCOMPARE(target->frame(), GeometryUtils::basketFrameAt(QPoint(300, 300)));
    }

    void testInboundItem_temporaryKeepsMetadata()
    {
        Fixture f;
        const DroppedItem item(remote(QStringLiteral("converted.png")), true);

        BasketController* target = f.coordinator.addItemFromExternalSource(item, false);
        QCOMPARE(target, f.registry.primary());
        QVERIFY(target->isVisible());

        const std::optional<DroppedItem> held = target->state()->itemByUrl(item.url());
        QVERIFY(held.has_value());
        QVERIFY(held->isTemporary());
        QCOMPARE(held->id(), item.id());
    }

    void testInboundItem_invalidRejected()
    {
        Fixture f;
        QVERIFY(!f.coordinator.addItemFromExternalSource(DroppedItem(), false));
        QVERIFY(!f.registry.primary()->isVisible());
    }

    void testInboundItems_emptyRejected()
    {
        Fixture f;
        QVERIFY(!f.coordinator.addItemsFromExternalSource({}, false));
    }

    void testCloseAll_dismissesChooser()
    {
        Fixture f;
        f.coordinator.onDragStarted();
        f.jiggle();
        f.jiggle();
        f.jiggle();
        QVERIFY(f.switcher.isVisible());

        f.coordinator.closeAllBaskets();
        f.fakes.presentation.completeAll();
        QVERIFY(!f.switcher.isVisible());
        QVERIFY(f.registry.visibleBaskets().isEmpty());
    }
};

QTEST_MAIN(TestJiggleScenario)
#include "test_jiggle_scenario.moc"
