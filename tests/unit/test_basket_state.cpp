// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QSignalSpy>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "core/basketstate.h"
#include "core/droppeditem.h"

using namespace PlasmaBaskets;

/**
 * @brief Unit tests for BasketState
 *
 * Tests cover:
 * - Adding items with locator deduplication
 * - Power folder routing (enabled and disabled)
 * - Removal pruning the selection and anchor
 * - clearAll() keeping pinned power folders
 * - In-place and many-to-one replacement
 * - Pruning of items whose local file vanished
 * - Range selection with anchor fallback
 * - Pin toggling signals
 * - QML entry maps
 */
class TestBasketState : public QObject
{
    Q_OBJECT

private:
    static QUrl remote(const QString& name)
    {
        return QUrl(QStringLiteral("https://example.org/files/") + name);
    }

    static DroppedItem folder(const QString& name)
    {
        return DroppedItem(QUrl(QStringLiteral("file:///srv/shared/") + name), true, false);
    }

    static QList<QUuid> idsOf(const DroppedItemList& items)
    {
        QList<QUuid> ids;
        for (const DroppedItem& item : items) {
            ids.append(item.id());
        }
        return ids;
    }

private Q_SLOTS:
    // ═══════════════════════════════════════════════════════════════════════════
    // addItem / addItems
    // ═══════════════════════════════════════════════════════════════════════════

    void testAddItems_deduplicatesByLocator()
    {
        BasketState state;
        QSignalSpy spy(&state, &BasketState::itemsChanged);

        QCOMPARE(state.addItems({remote(QStringLiteral("a.png")), remote(QStringLiteral("b.png"))}), 2);
        QCOMPARE(state.addItems({remote(QStringLiteral("a.png"))}), 0);
        QCOMPARE(state.count(), 2);

        // Nothing added, no notification
        QCOMPARE(spy.count(), 1);
    }

    void testAddItem_rejectsInvalid()
    {
        BasketState state;
        QVERIFY(!state.addItem(DroppedItem()));
        QVERIFY(state.isEmpty());
    }

    void testAddItem_keepsTemporaryFlag()
    {
        BasketState state;
        QVERIFY(state.addItem(DroppedItem(remote(QStringLiteral("clip.txt")), false, true)));
        const auto held = state.itemByUrl(remote(QStringLiteral("clip.txt")));
        QVERIFY(held.has_value());
        QVERIFY(held->isTemporary());
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Power folders
    // ═══════════════════════════════════════════════════════════════════════════

    void testPowerFolders_directoriesRouted()
    {
        BasketState state;
        state.addItems({remote(QStringLiteral("a.png"))});
        QVERIFY(state.addItem(folder(QStringLiteral("Projects"))));

        QCOMPARE(state.itemsList().size(), 1);
        QCOMPARE(state.powerFolders().size(), 1);

        // Power folders come first visually, last in items()
        QCOMPARE(state.visualOrder().first().name(), QStringLiteral("Projects"));
        QCOMPARE(state.items().last().name(), QStringLiteral("Projects"));
    }

    void testPowerFolders_disabledKeepsDirectoriesInline()
    {
        BasketState state;
        state.setPowerFoldersEnabled(false);
        QVERIFY(state.addItem(folder(QStringLiteral("Projects"))));

        QVERIFY(state.powerFolders().isEmpty());
        QCOMPARE(state.itemsList().size(), 1);
    }

    void testPowerFolders_realDirectoryDetected()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());

        BasketState state;
        QCOMPARE(state.addItems({QUrl::fromLocalFile(dir.path())}), 1);
        QCOMPARE(state.powerFolders().size(), 1);
        QVERIFY(state.powerFolders().first().isDirectory());
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Removal
    // ═══════════════════════════════════════════════════════════════════════════

    void testRemoveItem_prunesSelection()
    {
        BasketState state;
        state.addItems({remote(QStringLiteral("a")), remote(QStringLiteral("b"))});
        const QUuid first = state.itemsList().at(0).id();
        const QUuid second = state.itemsList().at(1).id();
        state.select(first);
        state.toggleSelection(second);
        QCOMPARE(state.selectionAnchor(), second);

        QSignalSpy selectionSpy(&state, &BasketState::selectionChanged);
        QVERIFY(state.removeItem(second));

        QCOMPARE(state.count(), 1);
        QVERIFY(!state.isSelected(second));
        QVERIFY(state.selectionAnchor().isNull());
        QCOMPARE(selectionSpy.count(), 1);
    }

    void testRemoveItem_unknownId()
    {
        BasketState state;
        state.addItems({remote(QStringLiteral("a"))});
        QVERIFY(!state.removeItem(QUuid::createUuid()));
        QCOMPARE(state.count(), 1);
    }

    void testRemoveItem_deletesTemporaryBacking()
    {
        QDir().mkpath(DroppedItem::temporaryStorageDirectory());
        const QString path = DroppedItem::temporaryStorageDirectory() + QStringLiteral("/test-clip.txt");
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("clip");
        file.close();

        BasketState state;
        QVERIFY(state.addItem(DroppedItem(QUrl::fromLocalFile(path), false, true)));
        QVERIFY(state.removeItem(state.items().first().id()));
        QVERIFY(!QFile::exists(path));
    }

    void testRemoveItemForTransfer_keepsBacking()
    {
        QDir().mkpath(DroppedItem::temporaryStorageDirectory());
        const QString path = DroppedItem::temporaryStorageDirectory() + QStringLiteral("/test-moved.txt");
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.close();

        BasketState state;
        QVERIFY(state.addItem(DroppedItem(QUrl::fromLocalFile(path), false, true)));
        QVERIFY(state.removeItemForTransfer(state.items().first().id()));
        QVERIFY(QFile::exists(path));
        QFile::remove(path);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // clearAll
    // ═══════════════════════════════════════════════════════════════════════════

    void testClearAll_keepsPinnedPowerFolders()
    {
        BasketState state;
        state.addItems({remote(QStringLiteral("a"))});
        state.addItem(folder(QStringLiteral("Pinned")));
        state.addItem(folder(QStringLiteral("Loose")));
        const QUuid pinnedId = state.powerFolders().first().id();
        QVERIFY(state.togglePin(pinnedId));
        state.selectAll();

        state.clearAll();

        QCOMPARE(state.count(), 1);
        QCOMPARE(state.powerFolders().first().id(), pinnedId);
        QCOMPARE(state.selectedCount(), 0);
    }

    void testClearAll_pinnedPlainItemsAreCleared()
    {
        BasketState state;
        state.addItems({remote(QStringLiteral("a"))});
        state.togglePin(state.items().first().id());
        state.clearAll();
        QVERIFY(state.isEmpty());
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Replacement
    // ═══════════════════════════════════════════════════════════════════════════

    void testReplaceItem_keepsPositionAndSelection()
    {
        BasketState state;
        state.addItems({remote(QStringLiteral("a")), remote(QStringLiteral("b")), remote(QStringLiteral("c"))});
        const QUuid middle = state.itemsList().at(1).id();
        state.select(middle);

        const DroppedItem converted(remote(QStringLiteral("b.pdf")), false, false);
        QVERIFY(state.replaceItem(middle, converted));

        QCOMPARE(state.itemsList().at(1).id(), converted.id());
        QVERIFY(state.isSelected(converted.id()));
        QCOMPARE(state.selectionAnchor(), converted.id());
        QVERIFY(!state.containsId(middle));
    }

    void testReplaceItems_appendsAndSelectsResult()
    {
        BasketState state;
        state.addItems({remote(QStringLiteral("a")), remote(QStringLiteral("b")), remote(QStringLiteral("c"))});
        const QList<QUuid> archived = {state.itemsList().at(0).id(), state.itemsList().at(2).id()};

        const DroppedItem archive(remote(QStringLiteral("bundle.zip")), false, false);
        QVERIFY(state.replaceItems(archived, archive));

        QCOMPARE(state.count(), 2);
        QCOMPARE(state.itemsList().last().id(), archive.id());
        QCOMPARE(state.selectedCount(), 1);
        QVERIFY(state.isSelected(archive.id()));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // validateItems
    // ═══════════════════════════════════════════════════════════════════════════

    void testValidateItems_removesVanishedFiles()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString kept = dir.filePath(QStringLiteral("kept.txt"));
        const QString gone = dir.filePath(QStringLiteral("gone.txt"));
        for (const QString& path : {kept, gone}) {
            QFile file(path);
            QVERIFY(file.open(QIODevice::WriteOnly));
        }

        BasketState state;
        state.addItems({QUrl::fromLocalFile(kept), QUrl::fromLocalFile(gone), remote(QStringLiteral("r"))});
        QVERIFY(QFile::remove(gone));

        QCOMPARE(state.validateItems(), 1);
        QCOMPARE(state.count(), 2);
        QVERIFY(!state.containsUrl(QUrl::fromLocalFile(gone)));
        QVERIFY(state.containsUrl(remote(QStringLiteral("r"))));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Selection
    // ═══════════════════════════════════════════════════════════════════════════

    void testSelectRange_fromAnchor()
    {
        BasketState state;
        state.addItems({remote(QStringLiteral("a")), remote(QStringLiteral("b")), remote(QStringLiteral("c")),
                        remote(QStringLiteral("d"))});
        const QList<QUuid> ids = idsOf(state.visualOrder());

        state.select(ids.at(1));
        state.selectRange(ids.at(3));

        QCOMPARE(state.selectedCount(), 3);
        QVERIFY(!state.isSelected(ids.at(0)));
        QCOMPARE(state.selectionAnchor(), ids.at(1));
    }

    void testSelectRange_additiveKeepsExisting()
    {
        BasketState state;
        state.addItems({remote(QStringLiteral("a")), remote(QStringLiteral("b")), remote(QStringLiteral("c")),
                        remote(QStringLiteral("d"))});
        const QList<QUuid> ids = idsOf(state.visualOrder());

        state.select(ids.at(3));
        state.toggleSelection(ids.at(0));
        // Anchor is now ids[0]; extend to ids[1] without dropping ids[3]
        state.selectRange(ids.at(1), true);

        QCOMPARE(state.selectedCount(), 3);
        QVERIFY(state.isSelected(ids.at(3)));
    }

    void testSelectRange_staleAnchorFallsBackToFirstSelected()
    {
        BasketState state;
        state.addItems({remote(QStringLiteral("a")), remote(QStringLiteral("b")), remote(QStringLiteral("c")),
                        remote(QStringLiteral("d"))});
        const QList<QUuid> ids = idsOf(state.visualOrder());

        state.select(ids.at(1));
        state.toggleSelection(ids.at(0));
        state.toggleSelection(ids.at(0)); // anchor stays on ids[0], now unselected
        state.removeItemForTransfer(ids.at(0)); // clears the anchor

        state.selectRange(ids.at(3));
        QCOMPARE(state.selectionAnchor(), ids.at(1));
        QCOMPARE(state.selectedCount(), 3);
    }

    void testSelectRange_noSelectionActsAsSelect()
    {
        BasketState state;
        state.addItems({remote(QStringLiteral("a")), remote(QStringLiteral("b"))});
        const QList<QUuid> ids = idsOf(state.visualOrder());

        state.selectRange(ids.at(1));
        QCOMPARE(state.selectedCount(), 1);
        QVERIFY(state.isSelected(ids.at(1)));
    }

    void testSelectAll_deselectAll()
    {
        BasketState state;
        state.addItems({remote(QStringLiteral("a")), remote(QStringLiteral("b"))});
        state.addItem(folder(QStringLiteral("F")));

        state.selectAll();
        QCOMPARE(state.selectedCount(), 3);
        QCOMPARE(state.selectionAnchor(), state.visualOrder().first().id());

        QSignalSpy spy(&state, &BasketState::selectionChanged);
        state.deselectAll();
        state.deselectAll();
        QCOMPARE(state.selectedCount(), 0);
        QCOMPARE(spy.count(), 1);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Pinning and QML access
    // ═══════════════════════════════════════════════════════════════════════════

    void testTogglePin_signals()
    {
        BasketState state;
        state.addItem(folder(QStringLiteral("F")));
        const QUuid id = state.items().first().id();

        QSignalSpy pinSpy(&state, &BasketState::pinChanged);
        QSignalSpy entriesSpy(&state, &BasketState::entriesChanged);
        QVERIFY(state.togglePin(id));

        QCOMPARE(pinSpy.count(), 1);
        QCOMPARE(pinSpy.first().at(1).toBool(), true);
        QVERIFY(entriesSpy.count() >= 1);
        QVERIFY(!state.togglePin(QUuid::createUuid()));
    }

    void testEntries_visualOrderWithFlags()
    {
        BasketState state;
        state.addItems({remote(QStringLiteral("a.png"))});
        state.addItem(folder(QStringLiteral("F")));
        state.selectOnly(state.itemsList().first().id().toString());

        const QVariantList entries = state.entries();
        QCOMPARE(entries.size(), 2);

        const QVariantMap first = entries.at(0).toMap();
        QCOMPARE(first.value(QStringLiteral("name")).toString(), QStringLiteral("F"));
        QVERIFY(first.value(QStringLiteral("isPowerFolder")).toBool());
        QVERIFY(!first.value(QStringLiteral("selected")).toBool());

        const QVariantMap second = entries.at(1).toMap();
        QCOMPARE(second.value(QStringLiteral("name")).toString(), QStringLiteral("a.png"));
        QVERIFY(second.value(QStringLiteral("selected")).toBool());
    }

    void testRemoveEntry_byStringId()
    {
        BasketState state;
        state.addItems({remote(QStringLiteral("a"))});
        state.removeEntry(state.items().first().id().toString());
        QVERIFY(state.isEmpty());

        // Unknown id is ignored
        state.removeEntry(QUuid::createUuid().toString());
    }
};

QTEST_MAIN(TestBasketState)
#include "test_basket_state.moc"
